#include "reconciliation_engine.hpp"
#include "trade_journal.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <map>
#include <set>

namespace signal_engine {

    ReconciliationEngine::ReconciliationEngine(core::SignalSchema schema)
        : schema_(std::move(schema)) {}

    void ReconciliationEngine::normalize(core::SignalRecord& record) const {
        std::map<std::string, std::string> trends;
        for (const auto& sibling : schema_.siblings()) {
            auto it = record.trends.find(sibling);
            trends[sibling] = (it != record.trends.end()) ? it->second : "";
        }
        record.trends = std::move(trends);
    }

    void ReconciliationEngine::roundValues(core::SignalRecord& record) {
        using core::utils::roundTo;
        record.close = roundTo(record.close);
        record.cci = roundTo(record.cci);
        record.stoch_k = roundTo(record.stoch_k);
        record.stoch_d = roundTo(record.stoch_d);
        record.slope_k = roundTo(record.slope_k);
        record.slope_d = roundTo(record.slope_d);
        record.plus_di = roundTo(record.plus_di);
        record.minus_di = roundTo(record.minus_di);
        record.adx = roundTo(record.adx);

        auto& journal = record.journal;
        journal.entry_price = roundTo(journal.entry_price);
        journal.target_exit_price = roundTo(journal.target_exit_price);
        journal.exit_price = roundTo(journal.exit_price);
    }

    ReconciliationResult ReconciliationEngine::reconcile(std::vector<core::SignalRecord> fresh,
                                                         const std::optional<core::SignalTable>& previous) const
    {
        auto logger = core::logging::getLogger();
        ReconciliationResult result{core::SignalTable{schema_, {}}, {}};
        auto& out = result.table.rows;
        auto& stats = result.stats;

        // Previous records by identity key; the first occurrence wins
        std::map<core::SignalKey, const core::SignalRecord*> previous_by_key;
        if (previous) {
            if (previous->timeframe() != schema_.timeframe()) {
                logger->warn("Previous table is for '{}', reconciling '{}'.",
                             previous->timeframe(), schema_.timeframe());
            }
            for (const auto& row : previous->rows) {
                if (!row.unparsed) previous_by_key.emplace(core::identityKey(row), &row);
            }
        }

        std::set<core::SignalKey> emitted;
        out.reserve(fresh.size() + (previous ? previous->rows.size() : 0));

        for (auto& record : fresh) {
            const core::SignalKey key = core::identityKey(record);
            if (!emitted.insert(key).second) {
                ++stats.duplicates;
                continue;
            }
            normalize(record);
            auto it = previous_by_key.find(key);
            if (it != previous_by_key.end()) {
                // Computed values come from this run, user-owned fields from the store
                record.notes = it->second->notes;
                record.journal = it->second->journal;
                ++stats.merged;
            } else {
                ++stats.fresh;
            }
            out.push_back(std::move(record));
        }

        if (previous) {
            for (const auto& row : previous->rows) {
                // No usable identity: nothing can match it, so it is carried over as-is
                if (!row.unparsed && !emitted.insert(core::identityKey(row)).second) {
                    // Either refreshed above or a stale duplicate inside the old table
                    if (previous_by_key.at(core::identityKey(row)) != &row) ++stats.duplicates;
                    continue;
                }
                core::SignalRecord kept = row;
                normalize(kept);
                out.push_back(std::move(kept));
                ++stats.retained;
            }
        }

        for (auto& record : out) {
            roundValues(record);
            refreshPnl(record.journal);
            record.journal.pnl = core::utils::roundTo(record.journal.pnl);
            record.journal.pnl_pct = core::utils::roundTo(record.journal.pnl_pct);
        }

        logger->debug("Reconciled '{}': {} fresh, {} merged, {} retained, {} duplicate(s) dropped, {} total.",
                      schema_.timeframe(), stats.fresh, stats.merged, stats.retained, stats.duplicates, out.size());
        return result;
    }

} // namespace signal_engine
