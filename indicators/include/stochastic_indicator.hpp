#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Slow stochastic oscillator. Raw %K over `window` bars is smoothed by an SMA
// of `k_smooth` into %K, and %K by an SMA of `d_smooth` into %D. A flat
// high/low range makes raw %K undefined (NaN) instead of raising.
class StochasticIndicator : public IIndicator {
public:
    StochasticIndicator(int window, int k_smooth, int d_smooth);

    virtual ~StochasticIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;            // Lookback of %D
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override; // %K

    const core::TimeSeries<double>& getSignalLine() const;       // %D

private:
    const int window_;
    const int k_smooth_;
    const int d_smooth_;
    std::string name_;
    core::TimeSeries<double> k_;
    core::TimeSeries<double> d_;
};

} // namespace indicators
