#pragma once

#include <string>
#include "data_interfaces.hpp"

namespace data {

// Bars from the Yahoo Finance v8 chart endpoint
class YahooFinanceClient : public IBarProvider {
public:
    explicit YahooFinanceClient(std::string base_url = "https://query1.finance.yahoo.com",
                                int timeout_ms = 15000);

    // Requests [now - timeframe.period, now] at timeframe.interval.
    // Throws core::ApiRequestException on transport, HTTP or payload errors.
    core::TimeSeries<core::Candle> fetchBars(const std::string& symbol,
                                             const core::TimeframeConfig& timeframe) override;

    // Parses a chart response body. Timestamps are shifted by the exchange
    // gmtoffset to naive local time; bars with a missing price are skipped;
    // result is ascending with duplicate timestamps removed (last one wins).
    static core::TimeSeries<core::Candle> parseChartResponse(const std::string& body);

private:
    std::string base_url_;
    int timeout_ms_;
};

} // namespace data
