#include "database_manager.hpp"
#include "logging.hpp"
#include "utils.hpp" // For timestampToString/stringToTimestamp
#include <stdexcept>

namespace data
{

    DatabaseManager::DatabaseManager(const std::string &db_path, bool read_only)
        : database_path_(db_path), read_only_(read_only), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->trace("DatabaseManager (SQLite) created for path: {} ({})",
                                          db_path, read_only ? "read-only" : "read-write");
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect(); // Ensure disconnection
    }

    bool DatabaseManager::connect()
    {
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->debug("Connecting to SQLite database: {}", database_path_);

        const int flags = read_only_ ? SQLITE_OPEN_READONLY
                                     : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        int rc = sqlite3_open_v2(database_path_.c_str(), &db_, flags | SQLITE_OPEN_NOMUTEX, nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_,
                                              db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        sqlite3_busy_timeout(db_, 5000);
        connected_ = true;
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        core::logging::getLogger()->trace("Disconnecting from SQLite database: {}", database_path_);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // Usually an unfinalized statement
            core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error on '{}': {}", database_path_, error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }

        const std::string create_candles_sql = R"(
        CREATE TABLE IF NOT EXISTS historical_candles (
            instrument_key TEXT,
            interval TEXT,
            timestamp TEXT, -- naive "YYYY-MM-DD HH:MM:SS"
            open REAL,
            high REAL,
            low REAL,
            close REAL,
            volume INTEGER,
            PRIMARY KEY (instrument_key, interval, timestamp)
        );
    )";

        const std::string create_symbols_sql = R"(
        CREATE TABLE IF NOT EXISTS symbols (
            "Symbols" TEXT
        );
    )";

        bool success = true;
        success &= executeSQL(create_candles_sql);
        success &= executeSQL(create_symbols_sql);

        if (!success)
        {
            core::logging::getLogger()->error("SQLite schema initialization failed for one or more statements.");
        }
        return success;
    }

    bool DatabaseManager::tableExists(const std::string &table_name)
    {
        if (!isConnected())
        {
            throw std::runtime_error("Cannot inspect tables: Not connected to database " + database_path_);
        }

        const char *sql = "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw std::runtime_error("Failed to query table catalogue of '" + database_path_ + "': " + message);
        }
        sqlite3_bind_text(stmt, 1, table_name.c_str(), -1, SQLITE_TRANSIENT);
        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw std::runtime_error("Failed to read table catalogue of '" + database_path_ + "': " + sqlite3_errstr(rc));
    }

    core::TimeSeries<core::Candle> DatabaseManager::queryCandles(
        const std::string& instrument_key,
        const std::string& interval,
        core::Timestamp start_time,
        core::Timestamp end_time)
    {
        core::TimeSeries<core::Candle> candles;
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            logger->error("Cannot query candles: Not connected to database.");
            return candles;
        }

        // Naive timestamps compare correctly as TEXT
        std::string start_str = core::utils::timestampToString(start_time);
        std::string end_str = core::utils::timestampToString(end_time);

        logger->debug("Querying candles for {} ({}) between '{}' and '{}'",
                      instrument_key, interval, start_str, end_str);

        const char* sql = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM historical_candles
            WHERE instrument_key = ?
              AND interval = ?
              AND timestamp >= ?
              AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            logger->error("Failed to prepare candle query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return candles;
        }

        // Index is 1-based
        sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, start_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, end_str.c_str(), -1, SQLITE_TRANSIENT);

        int row_count = 0;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            row_count++;
            try {
                core::Candle candle;
                const unsigned char *ts_text = sqlite3_column_text(stmt, 0);
                if (!ts_text) {
                    logger->warn("NULL timestamp found in query result (row {}), skipping row.", row_count);
                    continue;
                }
                candle.timestamp = core::utils::stringToTimestamp(reinterpret_cast<const char*>(ts_text));
                candle.open = sqlite3_column_double(stmt, 1);
                candle.high = sqlite3_column_double(stmt, 2);
                candle.low = sqlite3_column_double(stmt, 3);
                candle.close = sqlite3_column_double(stmt, 4);
                candle.volume = sqlite3_column_int64(stmt, 5);
                candles.push_back(candle);
            } catch (const std::exception& e) {
                logger->error("Error processing candle row {}: {}", row_count, e.what());
            }
        }

        if (rc != SQLITE_DONE) {
            logger->error("Error stepping through candle query results [{}]: {}", rc, sqlite3_errmsg(db_));
        } else {
            logger->debug("Parsed {} candles for {} ({}).", candles.size(), instrument_key, interval);
        }

        sqlite3_finalize(stmt);
        return candles;
    }

    std::optional<core::Timestamp> DatabaseManager::latestCandleTime(const std::string& instrument_key,
                                                                      const std::string& interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            logger->error("Cannot query candles: Not connected to database.");
            return std::nullopt;
        }

        const char* sql = "SELECT MAX(timestamp) FROM historical_candles WHERE instrument_key = ? AND interval = ?;";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            logger->error("Failed to prepare latest-candle query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return std::nullopt;
        }
        sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);

        std::optional<core::Timestamp> latest;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const unsigned char *ts_text = sqlite3_column_text(stmt, 0);
            if (ts_text) {
                try {
                    latest = core::utils::stringToTimestamp(reinterpret_cast<const char*>(ts_text));
                } catch (const std::exception& e) {
                    logger->error("Unparseable latest timestamp for {} ({}): {}", instrument_key, interval, e.what());
                }
            }
        }
        sqlite3_finalize(stmt);
        return latest;
    }

    bool DatabaseManager::saveCandles(const core::TimeSeries<core::Candle> &candles,
                                      const std::string &instrument_key,
                                      const std::string &interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save candles: Not connected to database.");
            return false;
        }
        if (candles.empty())
        {
            return true; // Nothing to do
        }

        // A bar already stored for (instrument_key, interval, timestamp) is
        // overwritten: the newest bar may still have been forming last time
        const char *sql = R"(
INSERT OR REPLACE INTO historical_candles
(instrument_key, interval, timestamp, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            sqlite3_finalize(stmt);
            return false;
        }

        bool success = true;
        int saved_count = 0;
        for (const auto &candle : candles)
        {
            std::string timestamp_str = core::utils::timestampToString(candle.timestamp);
            sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 4, candle.open);
            sqlite3_bind_double(stmt, 5, candle.high);
            sqlite3_bind_double(stmt, 6, candle.low);
            sqlite3_bind_double(stmt, 7, candle.close);
            sqlite3_bind_int64(stmt, 8, candle.volume);

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            if (sqlite3_changes(db_) > 0)
            {
                saved_count++;
            }
            sqlite3_reset(stmt);
        }

        sqlite3_finalize(stmt);

        if (!executeSQL(success ? "COMMIT;" : "ROLLBACK;"))
        {
            logger->error("Failed to {} transaction for saving candles.", success ? "COMMIT" : "ROLLBACK");
            if (success && !executeSQL("ROLLBACK;"))
            {
                logger->error("ROLLBACK after failed COMMIT also failed for {} ({}).", instrument_key, interval);
            }
            return false;
        }
        if (success)
        {
            logger->debug("Saved {} candle(s) for {} ({}).", saved_count, instrument_key, interval);
        }
        return success;
    }

    std::string DatabaseManager::quoteIdentifier(const std::string &name)
    {
        std::string quoted = "\"";
        for (char c : name)
        {
            if (c == '"') quoted += '"';
            quoted += c;
        }
        quoted += '"';
        return quoted;
    }

} // namespace data
