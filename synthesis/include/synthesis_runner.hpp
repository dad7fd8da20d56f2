#pragma once

#include "config.hpp"
#include "data_interfaces.hpp"
#include "indicator_engine.hpp"
#include "signal_classifier.hpp"
#include "trend_lookup.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace synthesis {

    struct TimeframeSummary {
        std::string timeframe;
        std::size_t emitted = 0;     // signals classified this run
        std::size_t fresh = 0;
        std::size_t merged = 0;
        std::size_t retained = 0;
        std::size_t duplicates = 0;
        std::size_t total = 0;       // rows persisted
        bool previous_unreadable = false;
    };

    struct RunSummary {
        std::size_t symbols = 0;
        std::size_t pairs_processed = 0;
        std::size_t pairs_skipped = 0;   // fetch failed, no bars, or insufficient history
        std::vector<TimeframeSummary> timeframes;
    };

    // One full synthesis + reconciliation run over every (symbol, timeframe):
    //
    //   1. fetch bars, compute indicators, classify; the latest oscillator of
    //      every pair goes into the trend lookup, signal or not
    //   2. enrich every record with sibling-timeframe trends
    //   3. reconcile against the previously persisted table of each timeframe
    //   4. persist all tables in one atomic write
    //
    // Per-pair failures are logged and skipped. Only core::StoreWriteException
    // escapes run(), in which case the previous store is intact.
    class SynthesisRunner {
    public:
        SynthesisRunner(core::SynthesisConfig config,
                        data::IBarProvider& bars,
                        data::ISymbolUniverse& universe,
                        data::ISignalStore& store);

        RunSummary run();

        const core::SynthesisConfig& config() const { return config_; }

    private:
        // Fetch, compute and classify one pair. Returns false when skipped.
        bool processPair(const std::string& symbol,
                         const core::TimeframeConfig& timeframe,
                         signal_engine::TrendLookup::Builder& trends,
                         std::vector<core::SignalRecord>& out);

        core::SynthesisConfig config_;
        data::IBarProvider& bars_;
        data::ISymbolUniverse& universe_;
        data::ISignalStore& store_;
        indicators::IndicatorEngine engine_;
        signal_engine::SignalClassifier classifier_;
    };

} // namespace synthesis
