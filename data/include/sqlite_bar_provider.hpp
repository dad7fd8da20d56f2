#pragma once

#include "data_interfaces.hpp"
#include <string>

namespace data {

// Bars from a local historical_candles table (see DatabaseManager), for offline
// runs. The requested period is measured back from the newest stored bar of
// the (symbol, interval) pair rather than from the wall clock.
class SqliteBarProvider : public IBarProvider {
public:
    explicit SqliteBarProvider(std::string db_path);

    // Throws core::DataUnavailableException if the database cannot be opened
    // or holds no bars for the pair.
    core::TimeSeries<core::Candle> fetchBars(const std::string& symbol,
                                             const core::TimeframeConfig& timeframe) override;

private:
    std::string db_path_;
};

} // namespace data
