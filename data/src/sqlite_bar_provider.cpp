#include "sqlite_bar_provider.hpp"
#include "database_manager.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <stdexcept>

namespace data {

SqliteBarProvider::SqliteBarProvider(std::string db_path) : db_path_(std::move(db_path))
{
    core::logging::getLogger()->debug("SqliteBarProvider reading '{}'", db_path_);
}

core::TimeSeries<core::Candle> SqliteBarProvider::fetchBars(const std::string& symbol,
                                                            const core::TimeframeConfig& timeframe)
{
    DatabaseManager db(db_path_, true);
    if (!db.connect()) {
        throw core::DataUnavailableException("Cannot open candle database '" + db_path_ + "'.");
    }

    std::optional<core::Timestamp> latest;
    try {
        if (!db.tableExists("historical_candles")) {
            throw core::DataUnavailableException("Candle database '" + db_path_ + "' has no historical_candles table.");
        }
        latest = db.latestCandleTime(symbol, timeframe.interval);
    } catch (const core::DataUnavailableException&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw core::DataUnavailableException(e.what());
    }

    if (!latest) {
        throw core::DataUnavailableException("No stored " + timeframe.interval + " bars for " + symbol + ".");
    }

    core::Timestamp start;
    try {
        start = *latest - core::utils::parsePeriod(timeframe.period);
    } catch (const std::invalid_argument& e) {
        throw core::DataUnavailableException("Bad period for timeframe '" + timeframe.name + "': " + e.what());
    }

    return db.queryCandles(symbol, timeframe.interval, start, *latest);
}

} // namespace data
