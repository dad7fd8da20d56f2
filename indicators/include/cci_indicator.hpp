#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Commodity Channel Index: (typical - SMA(typical)) / (0.015 * mean deviation)
class CciIndicator : public IIndicator {
public:
    explicit CciIndicator(int period);

    virtual ~CciIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
