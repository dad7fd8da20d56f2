#pragma once

#include "datatypes.hpp"
#include <string>
#include <vector>

namespace core {

    // Persisted column names
    namespace columns {
        inline const std::string kDatetime = "datetime";
        inline const std::string kSignal = "signal";
        inline const std::string kNotes = "notes";
        inline const std::string kToken = "token";
        inline const std::string kClose = "close price";
        inline const std::string kCci = "CCI";
        inline const std::string kStochK = "stoch K";
        inline const std::string kStochD = "stoch D";
        inline const std::string kSlopeK = "slope K";
        inline const std::string kSlopeD = "slope D";
        inline const std::string kPlusDi = "+DI";
        inline const std::string kMinusDi = "-DI";
        inline const std::string kAdx = "ADX";
        inline const std::string kTradeType = "Trade Type";
        inline const std::string kEntryPrice = "Entry Price";
        inline const std::string kTargetExitPrice = "Target Exit Price";
        inline const std::string kExitPrice = "Exit Price";
        inline const std::string kPnl = "PNL";
        inline const std::string kPnlPct = "PNL %";
    } // namespace columns

    // Exact column set of one timeframe's table, derived from the static
    // timeframe configuration before any data is touched.
    class SignalSchema {
    public:
        static SignalSchema forTimeframe(const std::string& timeframe,
                                         const std::vector<std::string>& all_timeframes);

        const std::string& timeframe() const { return timeframe_; }

        // Every other configured timeframe, sorted lexicographically
        const std::vector<std::string>& siblings() const { return siblings_; }

        // datetime, signal, notes, indicator columns, trend columns, journal columns
        const std::vector<std::string>& columns() const { return columns_; }

        static std::string trendColumn(const std::string& sibling_timeframe);

        // Indicator columns rounded to 2 decimals before persistence
        static const std::vector<std::string>& numericIndicatorColumns();
        static const std::vector<std::string>& journalColumns();

    private:
        SignalSchema(std::string timeframe, std::vector<std::string> siblings);

        std::string timeframe_;
        std::vector<std::string> siblings_;
        std::vector<std::string> columns_;
    };

    // All persisted records of one timeframe, unique per identity key
    struct SignalTable {
        SignalSchema schema;
        std::vector<SignalRecord> rows;

        const std::string& timeframe() const { return schema.timeframe(); }
    };

} // namespace core
