#include "caching_bar_provider.hpp"
#include "database_manager.hpp"
#include "logging.hpp"

namespace data {

CachingBarProvider::CachingBarProvider(IBarProvider& upstream, std::string cache_path)
    : upstream_(upstream), cache_path_(std::move(cache_path))
{
    core::logging::getLogger()->debug("CachingBarProvider writing bars to '{}'", cache_path_);
}

core::TimeSeries<core::Candle> CachingBarProvider::fetchBars(const std::string& symbol,
                                                             const core::TimeframeConfig& timeframe)
{
    core::TimeSeries<core::Candle> candles = upstream_.fetchBars(symbol, timeframe);
    if (candles.empty()) {
        return candles;
    }

    auto logger = core::logging::getLogger();
    DatabaseManager db(cache_path_);
    if (!db.connect()) {
        logger->error("Cannot open bar cache '{}'; {} ({}) not cached.", cache_path_, symbol, timeframe.interval);
        return candles;
    }
    if (!db.initializeSchema()) {
        logger->error("Bar cache '{}' schema check failed; {} ({}) not cached.", cache_path_, symbol, timeframe.interval);
        return candles;
    }
    if (db.saveCandles(candles, symbol, timeframe.interval)) {
        logger->debug("Cached {} bar(s) for {} ({}).", candles.size(), symbol, timeframe.interval);
    } else {
        logger->error("Failed to cache bars for {} ({}).", symbol, timeframe.interval);
    }
    return candles;
}

} // namespace data
