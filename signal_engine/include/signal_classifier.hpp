#pragma once

#include "datatypes.hpp"
#include "config.hpp"
#include <optional>

namespace signal_engine {

    // Stateless mapping from the latest indicator snapshot to a signal state.
    //
    //   K > D and CCI < -100  ->  Buy+  if DMI bullish and both slopes strong
    //                             Buy   if DMI not bearish
    //   K < D and CCI > 100   ->  Sell+ if DMI bearish and both slopes strong
    //                             Sell  if DMI not bullish
    //
    // DMI is bullish when +DI > -DI and ADX exceeds the threshold (bearish
    // mirrors it). Anything else, including a NaN in K, D, CCI, ADX, +DI or
    // -DI, is Neutral and returned as nullopt so it can never be persisted.
    class SignalClassifier {
    public:
        explicit SignalClassifier(core::ClassifierThresholds thresholds = {});

        std::optional<core::SignalState> classify(const core::IndicatorSnapshot& snapshot) const;

        const core::ClassifierThresholds& thresholds() const { return thresholds_; }

    private:
        core::ClassifierThresholds thresholds_;
    };

} // namespace signal_engine
