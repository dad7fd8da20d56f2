#pragma once

#include "datatypes.hpp"
#include "signal_schema.hpp"
#include <optional>
#include <vector>

namespace signal_engine {

    struct ReconciliationStats {
        std::size_t fresh = 0;       // new records with no previous counterpart
        std::size_t merged = 0;      // new records that inherited user fields
        std::size_t retained = 0;    // previous records kept as history
        std::size_t duplicates = 0;  // records dropped by identity-key dedup
    };

    struct ReconciliationResult {
        core::SignalTable table;
        ReconciliationStats stats;
    };

    // Upserts freshly computed records into the previously persisted table of
    // one timeframe, keyed by (timestamp, symbol, signal state).
    class ReconciliationEngine {
    public:
        explicit ReconciliationEngine(core::SignalSchema schema);

        // 1. normalise both sides to the schema
        // 2. copy notes and trade journal from a previous record with the same key
        // 3. append previous records whose key was not regenerated, unchanged
        // 4. drop later duplicates of a key (new records come first)
        // 5. round indicator and journal prices to 2 decimals, refresh PNL
        ReconciliationResult reconcile(std::vector<core::SignalRecord> fresh,
                                       const std::optional<core::SignalTable>& previous) const;

        // Exactly one trend entry per schema sibling, "" when absent
        void normalize(core::SignalRecord& record) const;

        static void roundValues(core::SignalRecord& record);

        const core::SignalSchema& schema() const { return schema_; }

    private:
        core::SignalSchema schema_;
    };

} // namespace signal_engine
