#include "signal_classifier.hpp"
#include "logging.hpp"
#include <cmath>

namespace signal_engine {

    SignalClassifier::SignalClassifier(core::ClassifierThresholds thresholds)
        : thresholds_(thresholds)
    {
        core::logging::getLogger()->debug("SignalClassifier: ADX threshold {}, slope threshold {}",
                                          thresholds_.adx_threshold, thresholds_.slope_threshold);
    }

    std::optional<core::SignalState> SignalClassifier::classify(const core::IndicatorSnapshot& s) const {
        if (std::isnan(s.stoch_k) || std::isnan(s.stoch_d) || std::isnan(s.cci) ||
            std::isnan(s.adx) || std::isnan(s.plus_di) || std::isnan(s.minus_di)) {
            return std::nullopt;
        }

        const bool k_above_d = s.stoch_k > s.stoch_d;
        const bool k_below_d = s.stoch_k < s.stoch_d;
        const bool cci_bullish = s.cci < -100.0;
        const bool cci_bearish = s.cci > 100.0;
        const bool trending = s.adx > thresholds_.adx_threshold;
        const bool dmi_bullish = (s.plus_di > s.minus_di) && trending;
        const bool dmi_bearish = (s.minus_di > s.plus_di) && trending;
        // NaN slopes compare false and never count as strong
        const bool strong_slopes = std::fabs(s.slope_k) > thresholds_.slope_threshold &&
                                   std::fabs(s.slope_d) > thresholds_.slope_threshold;

        if (k_above_d && cci_bullish) {
            if (dmi_bullish && strong_slopes) return core::SignalState::BuyPlus;
            if (!dmi_bearish) return core::SignalState::Buy;
            return std::nullopt;
        }
        if (k_below_d && cci_bearish) {
            if (dmi_bearish && strong_slopes) return core::SignalState::SellPlus;
            if (!dmi_bullish) return core::SignalState::Sell;
            return std::nullopt;
        }
        return std::nullopt;
    }

} // namespace signal_engine
