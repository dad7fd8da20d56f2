#include "sqlite_signal_store.hpp"
#include "database_manager.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <cmath>
#include <filesystem>
#include <map>
#include <set>

namespace data {

namespace {

    using ColumnIndex = std::map<std::string, int>;

    // Removes the temporary store unless the write completed
    class TempFileGuard {
    public:
        explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
        ~TempFileGuard() {
            if (armed_) {
                std::error_code ec;
                std::filesystem::remove(path_, ec);
                if (ec) {
                    core::logging::getLogger()->warn("Could not remove temporary store '{}': {}",
                                                     path_.string(), ec.message());
                }
            }
        }
        void dismiss() { armed_ = false; }

    private:
        std::filesystem::path path_;
        bool armed_ = true;
    };

    std::optional<std::string> textAt(sqlite3_stmt* stmt, const ColumnIndex& cols, const std::string& name) {
        auto it = cols.find(name);
        if (it == cols.end() || sqlite3_column_type(stmt, it->second) == SQLITE_NULL) {
            return std::nullopt;
        }
        const unsigned char* text = sqlite3_column_text(stmt, it->second);
        return text ? std::optional<std::string>(reinterpret_cast<const char*>(text)) : std::nullopt;
    }

    // REAL/INTEGER as-is, TEXT parsed (older tables carry "+25.3" style ADX), else nullopt
    std::optional<double> numberAt(sqlite3_stmt* stmt, const ColumnIndex& cols, const std::string& name) {
        auto it = cols.find(name);
        if (it == cols.end()) return std::nullopt;
        switch (sqlite3_column_type(stmt, it->second)) {
            case SQLITE_INTEGER:
            case SQLITE_FLOAT:
                return sqlite3_column_double(stmt, it->second);
            case SQLITE_TEXT: {
                const std::string text = core::utils::trim(
                    reinterpret_cast<const char*>(sqlite3_column_text(stmt, it->second)));
                if (text.empty()) return std::nullopt;
                try {
                    std::size_t used = 0;
                    double value = std::stod(text, &used);
                    if (used == text.size()) return value;
                } catch (const std::exception&) {
                    // Not a number: treated as missing below
                }
                return std::nullopt;
            }
            default:
                return std::nullopt;
        }
    }

    double numberOrNaN(sqlite3_stmt* stmt, const ColumnIndex& cols, const std::string& name) {
        return numberAt(stmt, cols, name).value_or(core::kNaN);
    }

    void bindReal(sqlite3_stmt* stmt, int index, double value) {
        if (std::isfinite(value)) {
            sqlite3_bind_double(stmt, index, value);
        } else {
            sqlite3_bind_null(stmt, index);
        }
    }

    void bindReal(sqlite3_stmt* stmt, int index, const std::optional<double>& value) {
        bindReal(stmt, index, value.value_or(core::kNaN));
    }

    void bindText(sqlite3_stmt* stmt, int index, const std::string& value) {
        sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bindText(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
        if (value) {
            bindText(stmt, index, *value);
        } else {
            sqlite3_bind_null(stmt, index);
        }
    }

    bool isTextColumn(const std::string& column) {
        namespace c = core::columns;
        if (column == c::kDatetime || column == c::kSignal || column == c::kNotes ||
            column == c::kToken || column == c::kTradeType) {
            return true;
        }
        const std::string suffix = "_trend";
        return column.size() > suffix.size() &&
               column.compare(column.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    void bindRecord(sqlite3_stmt* stmt, const core::SignalSchema& schema, const core::SignalRecord& r) {
        namespace c = core::columns;
        int index = 1;
        for (const auto& column : schema.columns()) {
            if (column == c::kDatetime) {
                if (r.unparsed) bindText(stmt, index, r.unparsed->datetime);
                else bindText(stmt, index, core::utils::timestampToString(r.timestamp));
            }
            else if (column == c::kSignal) {
                if (r.unparsed) bindText(stmt, index, r.unparsed->signal);
                else bindText(stmt, index, core::utils::signalStateToString(r.state));
            }
            else if (column == c::kNotes) bindText(stmt, index, r.notes);
            else if (column == c::kToken) bindText(stmt, index, r.symbol);
            else if (column == c::kClose) bindReal(stmt, index, r.close);
            else if (column == c::kCci) bindReal(stmt, index, r.cci);
            else if (column == c::kStochK) bindReal(stmt, index, r.stoch_k);
            else if (column == c::kStochD) bindReal(stmt, index, r.stoch_d);
            else if (column == c::kSlopeK) bindReal(stmt, index, r.slope_k);
            else if (column == c::kSlopeD) bindReal(stmt, index, r.slope_d);
            else if (column == c::kPlusDi) bindReal(stmt, index, r.plus_di);
            else if (column == c::kMinusDi) bindReal(stmt, index, r.minus_di);
            else if (column == c::kAdx) bindReal(stmt, index, r.signedAdx());
            else if (column == c::kTradeType) bindText(stmt, index, r.journal.trade_type);
            else if (column == c::kEntryPrice) bindReal(stmt, index, r.journal.entry_price);
            else if (column == c::kTargetExitPrice) bindReal(stmt, index, r.journal.target_exit_price);
            else if (column == c::kExitPrice) bindReal(stmt, index, r.journal.exit_price);
            else if (column == c::kPnl) bindReal(stmt, index, r.journal.pnl);
            else if (column == c::kPnlPct) bindReal(stmt, index, r.journal.pnl_pct);
            else {
                // Trend column: look the sibling up by name
                bool bound = false;
                for (const auto& sibling : schema.siblings()) {
                    if (core::SignalSchema::trendColumn(sibling) == column) {
                        auto it = r.trends.find(sibling);
                        bindText(stmt, index, it != r.trends.end() ? it->second : "");
                        bound = true;
                        break;
                    }
                }
                if (!bound) sqlite3_bind_null(stmt, index);
            }
            ++index;
        }
    }

    void writeTable(DatabaseManager& db, const core::SignalTable& table) {
        const auto& schema = table.schema;
        const std::string name = DatabaseManager::quoteIdentifier(schema.timeframe());

        std::string create_sql = "CREATE TABLE " + name + " (";
        std::string insert_sql = "INSERT INTO " + name + " VALUES (";
        for (std::size_t i = 0; i < schema.columns().size(); ++i) {
            const auto& column = schema.columns()[i];
            if (i > 0) {
                create_sql += ", ";
                insert_sql += ", ";
            }
            create_sql += DatabaseManager::quoteIdentifier(column) + (isTextColumn(column) ? " TEXT" : " REAL");
            insert_sql += "?";
        }
        create_sql += ");";
        insert_sql += ");";

        if (!db.executeSQL("DROP TABLE IF EXISTS " + name + ";") || !db.executeSQL(create_sql)) {
            throw core::StoreWriteException("Failed to recreate table '" + schema.timeframe() + "'.");
        }

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db.handle(), insert_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            std::string message = sqlite3_errmsg(db.handle());
            sqlite3_finalize(stmt);
            throw core::StoreWriteException("Failed to prepare insert for '" + schema.timeframe() + "': " + message);
        }

        for (const auto& record : table.rows) {
            bindRecord(stmt, schema, record);
            int rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE) {
                std::string message = sqlite3_errmsg(db.handle());
                sqlite3_finalize(stmt);
                throw core::StoreWriteException("Failed to insert into '" + schema.timeframe() + "': " + message);
            }
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
        }
        sqlite3_finalize(stmt);
        core::logging::getLogger()->debug("Wrote {} row(s) to table '{}'.", table.rows.size(), schema.timeframe());
    }

    // Copies the whole current store into the temporary database
    void copyStore(const std::string& source_path, DatabaseManager& target) {
        DatabaseManager source(source_path, true);
        if (!source.connect()) {
            throw core::StoreWriteException("Cannot open existing store '" + source_path + "' for copying.");
        }
        sqlite3_backup* backup = sqlite3_backup_init(target.handle(), "main", source.handle(), "main");
        if (!backup) {
            throw core::StoreWriteException("Failed to start store copy: " + std::string(sqlite3_errmsg(target.handle())));
        }
        int rc = sqlite3_backup_step(backup, -1);
        sqlite3_backup_finish(backup);
        if (rc != SQLITE_DONE) {
            throw core::StoreWriteException("Failed to copy existing store '" + source_path + "': " +
                                            std::string(sqlite3_errstr(rc)));
        }
    }

} // namespace

SqliteSignalStore::SqliteSignalStore(std::string path, std::string symbols_table)
    : path_(std::move(path)), symbols_table_(std::move(symbols_table))
{
    core::logging::getLogger()->debug("SqliteSignalStore using '{}'", path_);
}

std::optional<core::SignalTable> SqliteSignalStore::readTable(const core::SignalSchema& schema) {
    auto logger = core::logging::getLogger();
    const std::string& timeframe = schema.timeframe();

    if (!std::filesystem::exists(path_)) {
        logger->debug("Store '{}' does not exist yet; no previous '{}' table.", path_, timeframe);
        return std::nullopt;
    }

    DatabaseManager db(path_, true);
    if (!db.connect()) {
        throw core::StoreReadException("Cannot open store '" + path_ + "'.");
    }

    try {
        if (!db.tableExists(timeframe)) {
            logger->debug("Store has no '{}' table yet.", timeframe);
            return std::nullopt;
        }
    } catch (const std::runtime_error& e) {
        throw core::StoreReadException(e.what());
    }

    const std::string sql = "SELECT * FROM " + DatabaseManager::quoteIdentifier(timeframe) + ";";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db.handle(), sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::string message = sqlite3_errmsg(db.handle());
        sqlite3_finalize(stmt);
        throw core::StoreReadException("Failed to read table '" + timeframe + "': " + message);
    }

    ColumnIndex cols;
    for (int i = 0; i < sqlite3_column_count(stmt); ++i) {
        cols.emplace(sqlite3_column_name(stmt, i), i);
    }

    namespace c = core::columns;
    core::SignalTable table{schema, {}};
    int rc = SQLITE_OK;
    std::size_t row_number = 0;
    std::size_t unparsed = 0;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        ++row_number;
        const auto datetime = textAt(stmt, cols, c::kDatetime);
        const auto signal = textAt(stmt, cols, c::kSignal);

        core::SignalRecord record;
        const auto state = signal ? core::utils::stringToSignalState(*signal) : std::nullopt;
        std::string problem;
        if (!datetime || !state) {
            problem = "missing or unknown datetime/signal";
        } else {
            try {
                record.timestamp = core::utils::stringToTimestamp(*datetime);
                record.state = *state;
            } catch (const std::runtime_error& e) {
                problem = e.what();
            }
        }
        if (!problem.empty()) {
            // Kept verbatim so the next write does not lose the row
            logger->warn("Row {} of '{}' cannot be parsed ({}); it is retained as stored.",
                         row_number, timeframe, problem);
            record.unparsed = core::UnparsedIdentity{datetime, signal};
            ++unparsed;
        }
        record.symbol = core::utils::trim(textAt(stmt, cols, c::kToken).value_or(""));
        record.notes = textAt(stmt, cols, c::kNotes).value_or("");
        record.close = numberOrNaN(stmt, cols, c::kClose);
        record.cci = numberOrNaN(stmt, cols, c::kCci);
        record.stoch_k = numberOrNaN(stmt, cols, c::kStochK);
        record.stoch_d = numberOrNaN(stmt, cols, c::kStochD);
        record.slope_k = numberOrNaN(stmt, cols, c::kSlopeK);
        record.slope_d = numberOrNaN(stmt, cols, c::kSlopeD);
        record.plus_di = numberOrNaN(stmt, cols, c::kPlusDi);
        record.minus_di = numberOrNaN(stmt, cols, c::kMinusDi);
        // With both DIs the sign is re-derived on write; otherwise the stored sign is all there is
        record.adx = numberOrNaN(stmt, cols, c::kAdx);
        if (std::isfinite(record.plus_di) && std::isfinite(record.minus_di)) {
            record.adx = std::fabs(record.adx);
        }

        for (const auto& sibling : schema.siblings()) {
            record.trends[sibling] = textAt(stmt, cols, core::SignalSchema::trendColumn(sibling)).value_or("");
        }

        record.journal.trade_type = textAt(stmt, cols, c::kTradeType).value_or("");
        record.journal.entry_price = numberAt(stmt, cols, c::kEntryPrice);
        record.journal.target_exit_price = numberAt(stmt, cols, c::kTargetExitPrice);
        record.journal.exit_price = numberAt(stmt, cols, c::kExitPrice);
        record.journal.pnl = numberAt(stmt, cols, c::kPnl);
        record.journal.pnl_pct = numberAt(stmt, cols, c::kPnlPct);

        table.rows.push_back(std::move(record));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw core::StoreReadException("Error while reading table '" + timeframe + "': " + sqlite3_errstr(rc));
    }

    logger->debug("Read {} row(s) from '{}' ({} unparsed).", table.rows.size(), timeframe, unparsed);
    return table;
}

void SqliteSignalStore::writeTables(const std::vector<core::SignalTable>& tables) {
    auto logger = core::logging::getLogger();
    const std::filesystem::path target(path_);
    const std::filesystem::path temp(path_ + ".tmp");

    std::error_code ec;
    std::filesystem::remove(temp, ec); // Leftover from an interrupted run
    TempFileGuard guard(temp);

    try {
        {
            DatabaseManager db(temp.string());
            if (!db.connect()) {
                throw core::StoreWriteException("Cannot create temporary store '" + temp.string() + "'.");
            }
            if (std::filesystem::exists(target)) {
                copyStore(path_, db);
            }

            if (!db.executeSQL("BEGIN TRANSACTION;")) {
                throw core::StoreWriteException("Failed to begin store transaction.");
            }
            try {
                for (const auto& table : tables) {
                    writeTable(db, table);
                }
            } catch (const core::StoreWriteException&) {
                if (!db.executeSQL("ROLLBACK;")) {
                    logger->error("ROLLBACK of temporary store failed.");
                }
                throw;
            }
            if (!db.executeSQL("COMMIT;")) {
                throw core::StoreWriteException("Failed to commit temporary store.");
            }
            db.disconnect();
        }

        std::filesystem::rename(temp, target);
        guard.dismiss();
    } catch (const std::filesystem::filesystem_error& e) {
        logger->error("Store replace failed: {}", e.what());
        throw core::StoreWriteException(std::string("Failed to replace store: ") + e.what());
    }

    logger->info("Persisted {} table(s) to '{}'.", tables.size(), path_);
}

std::vector<std::string> SqliteSignalStore::symbols() {
    auto logger = core::logging::getLogger();
    std::vector<std::string> result;

    if (!std::filesystem::exists(path_)) {
        logger->warn("Store '{}' does not exist; symbol universe is empty.", path_);
        return result;
    }

    DatabaseManager db(path_, true);
    if (!db.connect()) {
        logger->error("Cannot open store '{}' to read symbols.", path_);
        return result;
    }

    try {
        if (!db.tableExists(symbols_table_)) {
            logger->warn("Store '{}' has no '{}' table; symbol universe is empty.", path_, symbols_table_);
            return result;
        }
    } catch (const std::runtime_error& e) {
        logger->error("Cannot read symbols: {}", e.what());
        return result;
    }

    const std::string sql = "SELECT * FROM " + DatabaseManager::quoteIdentifier(symbols_table_) + ";";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db.handle(), sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        logger->error("Failed to read '{}': {}", symbols_table_, sqlite3_errmsg(db.handle()));
        sqlite3_finalize(stmt);
        return result;
    }

    int column = 0;
    for (int i = 0; i < sqlite3_column_count(stmt); ++i) {
        if (std::string(sqlite3_column_name(stmt, i)) == "Symbols") {
            column = i;
            break;
        }
    }

    std::set<std::string> seen;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt, column);
        if (!text) continue;
        std::string symbol = core::utils::trim(reinterpret_cast<const char*>(text));
        if (!symbol.empty() && seen.insert(symbol).second) {
            result.push_back(symbol);
        }
    }
    sqlite3_finalize(stmt);

    logger->info("Loaded {} symbol(s) from '{}'.", result.size(), symbols_table_);
    return result;
}

} // namespace data
