#pragma once

#include <string>
#include <vector>
#include <optional>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp"

namespace data {

class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path, bool read_only = false);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    // historical_candles and symbols tables
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // Throws std::runtime_error if the catalogue itself cannot be queried
    bool tableExists(const std::string& table_name);

    bool saveCandles(const core::TimeSeries<core::Candle>& candles,
                     const std::string& instrument_key,
                     const std::string& interval);

    core::TimeSeries<core::Candle> queryCandles(
        const std::string& instrument_key,
        const std::string& interval,
        core::Timestamp start_time,
        core::Timestamp end_time);

    std::optional<core::Timestamp> latestCandleTime(const std::string& instrument_key,
                                                    const std::string& interval);

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return database_path_; }

    // "name" with embedded quotes doubled
    static std::string quoteIdentifier(const std::string& name);

private:
    std::string database_path_;
    bool read_only_ = false;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
};

} // namespace data
