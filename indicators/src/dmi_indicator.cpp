#include "dmi_indicator.hpp"
#include "series_math.hpp"
#include "logging.hpp"
#include "ta_libc.h"  // TA-Lib C API header
#include <stdexcept>
#include <vector>

namespace indicators {

namespace {

    using HlcFunction = TA_RetCode (*)(int, int, const double[], const double[], const double[],
                                       int, int*, int*, double[]);

    // Runs one of TA-Lib's high/low/close -> single line functions and aligns the output
    core::TimeSeries<double> runHlc(HlcFunction fn, int lookback, const char* fn_name,
                                    const std::vector<double>& high, const std::vector<double>& low,
                                    const std::vector<double>& close, int period)
    {
        const std::size_t n = close.size();
        if (lookback < 0 || n <= static_cast<std::size_t>(lookback)) {
            return nanSeries(n);
        }

        std::vector<double> buffer(n - static_cast<std::size_t>(lookback));
        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = fn(0, static_cast<int>(n) - 1, high.data(), low.data(), close.data(),
                                 period, &out_begin_idx, &out_nb_element, buffer.data());
        if (ret_code != TA_SUCCESS) {
            core::logging::getLogger()->error("TA-Lib {} failed for period {} with error code: {}",
                                              fn_name, period, static_cast<int>(ret_code));
            return nanSeries(n);
        }
        return alignToInput(n, out_begin_idx, out_nb_element, buffer);
    }

} // namespace

DmiIndicator::DmiIndicator(int period) : period_(period) {
    if (period_ <= 0) {
        throw std::invalid_argument("DMI period must be positive.");
    }
    name_ = fmt::format("DMI({})", period_);
    core::logging::getLogger()->trace("DmiIndicator created: Name='{}', Period={}", name_, period_);
}

std::string DmiIndicator::getName() const {
    return name_;
}

int DmiIndicator::getLookback() const {
    return TA_PLUS_DI_Lookback(period_);
}

const core::TimeSeries<double>& DmiIndicator::getResult() const {
    return adx_;
}

const core::TimeSeries<double>& DmiIndicator::getPlusDI() const {
    return plus_di_;
}

const core::TimeSeries<double>& DmiIndicator::getMinusDI() const {
    return minus_di_;
}

void DmiIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);

    const std::size_t n = input.size();
    adx_ = nanSeries(n);
    plus_di_ = nanSeries(n);
    minus_di_ = nanSeries(n);

    if (n < static_cast<std::size_t>(minimumBars())) {
        logger->debug("Input size ({}) is below the {} bars {} needs. All values NaN.", n, minimumBars(), name_);
        return;
    }

    std::vector<double> high, low, close;
    high.reserve(n);
    low.reserve(n);
    close.reserve(n);
    for (const auto& candle : input) {
        high.push_back(candle.high);
        low.push_back(candle.low);
        close.push_back(candle.close);
    }

    plus_di_ = runHlc(TA_PLUS_DI, TA_PLUS_DI_Lookback(period_), "TA_PLUS_DI", high, low, close, period_);
    minus_di_ = runHlc(TA_MINUS_DI, TA_MINUS_DI_Lookback(period_), "TA_MINUS_DI", high, low, close, period_);
    adx_ = runHlc(TA_ADX, TA_ADX_Lookback(period_), "TA_ADX", high, low, close, period_);
    logger->trace("Successfully calculated {} over {} bars", name_, n);
}

} // namespace indicators
