#include "stochastic_indicator.hpp"
#include "series_math.hpp"
#include "logging.hpp"
#include "ta_libc.h"  // TA-Lib C API header
#include <stdexcept>
#include <vector>

namespace indicators {

namespace {

    // Rolling extreme of one price line through TA_MIN / TA_MAX, aligned to the input
    core::TimeSeries<double> rollingExtreme(const std::vector<double>& prices, int window, bool lowest,
                                            const std::string& owner)
    {
        const int lookback = lowest ? TA_MIN_Lookback(window) : TA_MAX_Lookback(window);
        if (lookback < 0 || prices.size() <= static_cast<std::size_t>(lookback)) {
            return nanSeries(prices.size());
        }

        std::vector<double> buffer(prices.size() - static_cast<std::size_t>(lookback));
        int out_begin_idx = 0;
        int out_nb_element = 0;
        const int end_idx = static_cast<int>(prices.size()) - 1;
        TA_RetCode ret_code = lowest
            ? TA_MIN(0, end_idx, prices.data(), window, &out_begin_idx, &out_nb_element, buffer.data())
            : TA_MAX(0, end_idx, prices.data(), window, &out_begin_idx, &out_nb_element, buffer.data());

        if (ret_code != TA_SUCCESS) {
            core::logging::getLogger()->error("TA-Lib {} failed for {} with error code: {}",
                                              lowest ? "TA_MIN" : "TA_MAX", owner, static_cast<int>(ret_code));
            return nanSeries(prices.size());
        }
        return alignToInput(prices.size(), out_begin_idx, out_nb_element, buffer);
    }

} // namespace

StochasticIndicator::StochasticIndicator(int window, int k_smooth, int d_smooth)
    : window_(window), k_smooth_(k_smooth), d_smooth_(d_smooth)
{
    if (window_ <= 0 || k_smooth_ <= 0 || d_smooth_ <= 0) {
        throw std::invalid_argument("Stochastic window and smoothing lengths must be positive.");
    }
    name_ = fmt::format("STOCH({},{},{})", window_, k_smooth_, d_smooth_);
    core::logging::getLogger()->trace("StochasticIndicator created: Name='{}', Lookback={}", name_, getLookback());
}

std::string StochasticIndicator::getName() const {
    return name_;
}

int StochasticIndicator::getLookback() const {
    return (window_ - 1) + (k_smooth_ - 1) + (d_smooth_ - 1);
}

const core::TimeSeries<double>& StochasticIndicator::getResult() const {
    return k_;
}

const core::TimeSeries<double>& StochasticIndicator::getSignalLine() const {
    return d_;
}

void StochasticIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);

    const std::size_t n = input.size();
    k_ = nanSeries(n);
    d_ = nanSeries(n);

    if (n < static_cast<std::size_t>(window_)) {
        logger->debug("Input size ({}) is shorter than the %K window ({}) for {}. All values NaN.",
                      n, window_, name_);
        return;
    }

    std::vector<double> lows;
    std::vector<double> highs;
    lows.reserve(n);
    highs.reserve(n);
    for (const auto& candle : input) {
        lows.push_back(candle.low);
        highs.push_back(candle.high);
    }

    const auto lowest = rollingExtreme(lows, window_, true, name_);
    const auto highest = rollingExtreme(highs, window_, false, name_);

    core::TimeSeries<double> raw_k = nanSeries(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double range = highest[i] - lowest[i];
        // NaN bounds propagate; a zero range leaves raw %K undefined
        if (range > 0.0) {
            raw_k[i] = 100.0 * (input[i].close - lowest[i]) / range;
        }
    }

    k_ = rollingMean(raw_k, k_smooth_);
    d_ = rollingMean(k_, d_smooth_);
    logger->trace("Successfully calculated {} over {} bars", name_, n);
}

} // namespace indicators
