#pragma once

#include "datatypes.hpp"
#include "config.hpp"
#include <optional>
#include <utility>

namespace indicators {

    // Indicator lines aligned bar-for-bar with the input series
    struct IndicatorFrame {
        core::TimeSeries<double> stoch_k;
        core::TimeSeries<double> stoch_d;
        core::TimeSeries<double> cci;
        core::TimeSeries<double> plus_di;
        core::TimeSeries<double> minus_di;
        core::TimeSeries<double> adx;

        std::size_t size() const { return stoch_k.size(); }
    };

    // Computes every indicator the classifier needs for one (symbol, timeframe).
    // Pure: no state survives between calls.
    class IndicatorEngine {
    public:
        explicit IndicatorEngine(core::IndicatorParams params);

        IndicatorFrame compute(const core::TimeSeries<core::Candle>& bars) const;

        // Snapshot of the last bar where %K, %D and CCI are all defined.
        // Slopes cover the valid %K/%D values up to and including that bar;
        // DMI values may still be NaN. nullopt means insufficient history.
        std::optional<core::IndicatorSnapshot> latestSnapshot(const core::TimeSeries<core::Candle>& bars,
                                                              const IndicatorFrame& frame) const;

        // Last bar where both %K and %D are defined, as (K, D)
        std::optional<std::pair<double, double>> latestOscillator(const IndicatorFrame& frame) const;

        const core::IndicatorParams& params() const { return params_; }

    private:
        core::IndicatorParams params_;
    };

} // namespace indicators
