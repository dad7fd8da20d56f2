#include "signal_schema.hpp"
#include <algorithm>
#include <stdexcept>

namespace core {

    SignalSchema::SignalSchema(std::string timeframe, std::vector<std::string> siblings)
        : timeframe_(std::move(timeframe)), siblings_(std::move(siblings))
    {
        columns_ = {columns::kDatetime, columns::kSignal, columns::kNotes, columns::kToken};
        const auto& numeric = numericIndicatorColumns();
        columns_.insert(columns_.end(), numeric.begin(), numeric.end());
        for (const auto& sibling : siblings_) {
            columns_.push_back(trendColumn(sibling));
        }
        const auto& journal = journalColumns();
        columns_.insert(columns_.end(), journal.begin(), journal.end());
    }

    SignalSchema SignalSchema::forTimeframe(const std::string& timeframe,
                                            const std::vector<std::string>& all_timeframes)
    {
        if (std::find(all_timeframes.begin(), all_timeframes.end(), timeframe) == all_timeframes.end()) {
            throw std::invalid_argument("Timeframe '" + timeframe + "' is not part of the configured set.");
        }
        std::vector<std::string> siblings;
        for (const auto& tf : all_timeframes) {
            if (tf != timeframe) siblings.push_back(tf);
        }
        std::sort(siblings.begin(), siblings.end());
        siblings.erase(std::unique(siblings.begin(), siblings.end()), siblings.end());
        return SignalSchema(timeframe, std::move(siblings));
    }

    std::string SignalSchema::trendColumn(const std::string& sibling_timeframe) {
        return sibling_timeframe + "_trend";
    }

    const std::vector<std::string>& SignalSchema::numericIndicatorColumns() {
        static const std::vector<std::string> cols = {
            columns::kClose, columns::kCci, columns::kStochK, columns::kStochD,
            columns::kSlopeK, columns::kSlopeD, columns::kPlusDi, columns::kMinusDi, columns::kAdx
        };
        return cols;
    }

    const std::vector<std::string>& SignalSchema::journalColumns() {
        static const std::vector<std::string> cols = {
            columns::kTradeType, columns::kEntryPrice, columns::kTargetExitPrice,
            columns::kExitPrice, columns::kPnl, columns::kPnlPct
        };
        return cols;
    }

} // namespace core
