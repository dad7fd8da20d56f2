#pragma once

#include "data_interfaces.hpp"
#include <string>

namespace data {

// Passes requests to another provider and stores every series it returns in
// the historical_candles table of a local database, keyed by symbol and
// interval, so that SqliteBarProvider can later replay it offline.
class CachingBarProvider : public IBarProvider {
public:
    CachingBarProvider(IBarProvider& upstream, std::string cache_path);

    // Upstream errors propagate unchanged. A failed cache write is logged and
    // the fetched bars are still returned.
    core::TimeSeries<core::Candle> fetchBars(const std::string& symbol,
                                             const core::TimeframeConfig& timeframe) override;

private:
    IBarProvider& upstream_;
    std::string cache_path_;
};

} // namespace data
