#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Wilder Directional Movement Index: +DI, -DI and ADX over `period` bars.
// Fewer than period+1 bars leave every line entirely NaN.
class DmiIndicator : public IIndicator {
public:
    explicit DmiIndicator(int period);

    virtual ~DmiIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;        // Lookback of the DI lines
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override; // ADX

    const core::TimeSeries<double>& getPlusDI() const;
    const core::TimeSeries<double>& getMinusDI() const;

    // Minimum number of bars before anything is produced
    int minimumBars() const { return period_ + 1; }

private:
    const int period_;
    std::string name_;
    core::TimeSeries<double> adx_;
    core::TimeSeries<double> plus_di_;
    core::TimeSeries<double> minus_di_;
};

} // namespace indicators
