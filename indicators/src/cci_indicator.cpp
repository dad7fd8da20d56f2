#include "cci_indicator.hpp"
#include "series_math.hpp"
#include "logging.hpp"
#include "ta_libc.h"  // TA-Lib C API header
#include <stdexcept>
#include <vector>

namespace indicators {

CciIndicator::CciIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("CCI period must be positive.");
    }

    lookback_ = TA_CCI_Lookback(period_);
    if (lookback_ < 0) {
        // TA-Lib rejects periods below 2; such a CCI is never defined
        core::logging::getLogger()->warn("TA_CCI_Lookback rejected period {}. CCI will be NaN.", period_);
    }

    name_ = fmt::format("CCI({})", period_);
    core::logging::getLogger()->trace("CciIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string CciIndicator::getName() const {
    return name_;
}

int CciIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& CciIndicator::getResult() const {
    return results_;
}

void CciIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_ = nanSeries(input.size());

    if (lookback_ < 0 || input.size() <= static_cast<std::size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. All values NaN.",
                      input.size(), lookback_, name_);
        return;
    }

    std::vector<double> high, low, close;
    high.reserve(input.size());
    low.reserve(input.size());
    close.reserve(input.size());
    for (const auto& candle : input) {
        high.push_back(candle.high);
        low.push_back(candle.low);
        close.push_back(candle.close);
    }

    std::vector<double> buffer(input.size() - static_cast<std::size_t>(lookback_));
    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_CCI(
        0,                                      // startIdx
        static_cast<int>(input.size()) - 1,     // endIdx
        high.data(),
        low.data(),
        close.data(),
        period_,                                // optInTimePeriod
        &out_begin_idx,
        &out_nb_element,
        buffer.data()
    );

    if (ret_code != TA_SUCCESS) {
        logger->error("TA-Lib TA_CCI calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code));
        return;
    }
    if (out_begin_idx != lookback_) {
        logger->warn("TA_CCI out_begin_idx ({}) does not match calculated lookback ({}) for {}.",
                     out_begin_idx, lookback_, name_);
    }

    results_ = alignToInput(input.size(), out_begin_idx, out_nb_element, buffer);
    logger->trace("Successfully calculated {} results for {}", out_nb_element, name_);
}

} // namespace indicators
