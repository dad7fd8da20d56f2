#include "indicator_engine.hpp"
#include "stochastic_indicator.hpp"
#include "cci_indicator.hpp"
#include "dmi_indicator.hpp"
#include "series_math.hpp"
#include "logging.hpp"
#include <cmath>
#include <stdexcept>

namespace indicators {

    IndicatorEngine::IndicatorEngine(core::IndicatorParams params) : params_(params) {
        if (params_.stoch_window <= 0 || params_.k_smooth <= 0 || params_.d_smooth <= 0 ||
            params_.cci_period <= 0 || params_.dmi_period <= 0 || params_.slope_period <= 0) {
            throw std::invalid_argument("Indicator windows must be positive.");
        }
        core::logging::getLogger()->debug(
            "IndicatorEngine: STOCH({},{},{}), CCI({}), DMI({}), slope window {}",
            params_.stoch_window, params_.k_smooth, params_.d_smooth,
            params_.cci_period, params_.dmi_period, params_.slope_period);
    }

    IndicatorFrame IndicatorEngine::compute(const core::TimeSeries<core::Candle>& bars) const {
        StochasticIndicator stoch(params_.stoch_window, params_.k_smooth, params_.d_smooth);
        CciIndicator cci(params_.cci_period);
        DmiIndicator dmi(params_.dmi_period);

        stoch.calculate(bars);
        cci.calculate(bars);
        dmi.calculate(bars);

        IndicatorFrame frame;
        frame.stoch_k = stoch.getResult();
        frame.stoch_d = stoch.getSignalLine();
        frame.cci = cci.getResult();
        frame.plus_di = dmi.getPlusDI();
        frame.minus_di = dmi.getMinusDI();
        frame.adx = dmi.getResult();
        return frame;
    }

    std::optional<core::IndicatorSnapshot> IndicatorEngine::latestSnapshot(
        const core::TimeSeries<core::Candle>& bars, const IndicatorFrame& frame) const
    {
        if (bars.size() != frame.size()) {
            throw std::invalid_argument("Indicator frame is not aligned with the bar series.");
        }

        for (std::size_t i = frame.size(); i-- > 0;) {
            if (std::isnan(frame.stoch_k[i]) || std::isnan(frame.stoch_d[i]) || std::isnan(frame.cci[i])) {
                continue;
            }
            core::IndicatorSnapshot snap;
            snap.timestamp = bars[i].timestamp;
            snap.close = bars[i].close;
            snap.stoch_k = frame.stoch_k[i];
            snap.stoch_d = frame.stoch_d[i];
            snap.cci = frame.cci[i];
            snap.plus_di = frame.plus_di[i];
            snap.minus_di = frame.minus_di[i];
            snap.adx = frame.adx[i];
            snap.slope_k = linearRegressionSlope(frame.stoch_k, params_.slope_period, i + 1);
            snap.slope_d = linearRegressionSlope(frame.stoch_d, params_.slope_period, i + 1);
            return snap;
        }
        return std::nullopt;
    }

    std::optional<std::pair<double, double>> IndicatorEngine::latestOscillator(const IndicatorFrame& frame) const {
        for (std::size_t i = frame.size(); i-- > 0;) {
            if (!std::isnan(frame.stoch_k[i]) && !std::isnan(frame.stoch_d[i])) {
                return std::make_pair(frame.stoch_k[i], frame.stoch_d[i]);
            }
        }
        return std::nullopt;
    }

} // namespace indicators
