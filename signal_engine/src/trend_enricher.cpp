#include "trend_enricher.hpp"
#include "logging.hpp"

namespace signal_engine {

    TrendEnricher::TrendEnricher(std::vector<std::string> timeframes, const TrendLookup& lookup)
        : timeframes_(std::move(timeframes)), lookup_(lookup) {}

    void TrendEnricher::enrich(std::vector<core::SignalRecord>& records, const std::string& own_timeframe) const {
        for (auto& record : records) {
            for (const auto& sibling : timeframes_) {
                if (sibling == own_timeframe) continue;
                record.trends[sibling] = lookup_.trendOf(record.symbol, sibling);
            }
        }
        core::logging::getLogger()->debug("Enriched {} '{}' record(s) with sibling trends.",
                                          records.size(), own_timeframe);
    }

} // namespace signal_engine
