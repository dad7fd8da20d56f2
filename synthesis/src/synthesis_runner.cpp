#include "synthesis_runner.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "reconciliation_engine.hpp"
#include "signal_schema.hpp"
#include "trend_enricher.hpp"
#include "utils.hpp"

namespace synthesis {

    SynthesisRunner::SynthesisRunner(core::SynthesisConfig config,
                                     data::IBarProvider& bars,
                                     data::ISymbolUniverse& universe,
                                     data::ISignalStore& store)
        : config_(std::move(config)),
          bars_(bars),
          universe_(universe),
          store_(store),
          engine_(config_.indicators),
          classifier_(config_.thresholds)
    {
        if (config_.timeframes.empty()) {
            throw core::ConfigException("SynthesisRunner needs at least one timeframe.");
        }
        core::logging::getLogger()->debug("SynthesisRunner initialized with {} timeframe(s).", config_.timeframes.size());
    }

    bool SynthesisRunner::processPair(const std::string& symbol,
                                      const core::TimeframeConfig& timeframe,
                                      signal_engine::TrendLookup::Builder& trends,
                                      std::vector<core::SignalRecord>& out)
    {
        auto logger = core::logging::getLogger();

        core::TimeSeries<core::Candle> candles = bars_.fetchBars(symbol, timeframe);
        if (candles.empty()) {
            throw core::DataUnavailableException("No bars returned for " + symbol + " (" + timeframe.name + ").");
        }

        const indicators::IndicatorFrame frame = engine_.compute(candles);

        // Neutral pairs still feed the trend lookup
        if (auto oscillator = engine_.latestOscillator(frame)) {
            trends.record(symbol, timeframe.name, oscillator->first, oscillator->second);
        }

        auto snapshot = engine_.latestSnapshot(candles, frame);
        if (!snapshot) {
            logger->warn("Insufficient history for {} ({}): {} bar(s).", symbol, timeframe.name, candles.size());
            return false;
        }

        auto state = classifier_.classify(*snapshot);
        if (!state) {
            logger->debug("{} ({}) is neutral at {}.", symbol, timeframe.name,
                          core::utils::timestampToString(snapshot->timestamp));
            return true;
        }

        core::SignalRecord record;
        record.timestamp = snapshot->timestamp;
        record.state = *state;
        record.symbol = symbol;
        record.close = snapshot->close;
        record.cci = snapshot->cci;
        record.stoch_k = snapshot->stoch_k;
        record.stoch_d = snapshot->stoch_d;
        record.slope_k = snapshot->slope_k;
        record.slope_d = snapshot->slope_d;
        record.plus_di = snapshot->plus_di;
        record.minus_di = snapshot->minus_di;
        record.adx = snapshot->adx;

        logger->info("{} ({}): {} at {} (close {:.2f})", symbol, timeframe.name,
                     core::utils::signalStateToString(record.state),
                     core::utils::timestampToString(record.timestamp), record.close);
        out.push_back(std::move(record));
        return true;
    }

    RunSummary SynthesisRunner::run() {
        auto logger = core::logging::getLogger();
        logger->info("========================================================");
        logger->info("Starting Signal Synthesis Run");
        logger->info("========================================================");

        RunSummary summary;
        const std::vector<std::string> timeframe_names = config_.timeframeNames();

        std::vector<std::string> symbols = universe_.symbols();
        summary.symbols = symbols.size();
        if (symbols.empty()) {
            logger->warn("Symbol universe is empty; only previously persisted rows will be rewritten.");
        }
        logger->info("Processing {} symbol(s) across {} timeframe(s).", symbols.size(), timeframe_names.size());

        // Phase 1: compute and classify every pair, building the trend lookup
        std::map<std::string, std::vector<core::SignalRecord>> records_by_timeframe;
        signal_engine::TrendLookup::Builder trend_builder;

        for (const auto& symbol : symbols) {
            for (const auto& timeframe : config_.timeframes) {
                auto& records = records_by_timeframe[timeframe.name];
                bool processed = false;
                try {
                    processed = processPair(symbol, timeframe, trend_builder, records);
                } catch (const core::DataUnavailableException& e) {
                    logger->warn("Skipping {} ({}): {}", symbol, timeframe.name, e.what());
                } catch (const core::ApiRequestException& e) {
                    logger->warn("Skipping {} ({}): fetch failed: {}", symbol, timeframe.name, e.what());
                } catch (const std::exception& e) {
                    logger->error("Skipping {} ({}): unexpected error: {}", symbol, timeframe.name, e.what());
                }
                if (processed) {
                    ++summary.pairs_processed;
                } else {
                    ++summary.pairs_skipped;
                }
            }
        }

        // Phase 2: the lookup is frozen before any record is enriched
        const signal_engine::TrendLookup trends = trend_builder.build();
        const signal_engine::TrendEnricher enricher(timeframe_names, trends);
        for (auto& entry : records_by_timeframe) {
            enricher.enrich(entry.second, entry.first);
        }

        // Phase 3: reconcile each timeframe against what was persisted before
        std::vector<core::SignalTable> tables;
        tables.reserve(config_.timeframes.size());
        for (const auto& name : timeframe_names) {
            auto schema = core::SignalSchema::forTimeframe(name, timeframe_names);
            TimeframeSummary tf_summary;
            tf_summary.timeframe = name;
            tf_summary.emitted = records_by_timeframe[name].size();

            std::optional<core::SignalTable> previous;
            try {
                previous = store_.readTable(schema);
            } catch (const core::StoreReadException& e) {
                logger->warn("Previous '{}' table is unreadable, starting from empty: {}", name, e.what());
                tf_summary.previous_unreadable = true;
            }

            signal_engine::ReconciliationEngine reconciler(schema);
            auto result = reconciler.reconcile(std::move(records_by_timeframe[name]), previous);

            tf_summary.fresh = result.stats.fresh;
            tf_summary.merged = result.stats.merged;
            tf_summary.retained = result.stats.retained;
            tf_summary.duplicates = result.stats.duplicates;
            tf_summary.total = result.table.rows.size();
            summary.timeframes.push_back(tf_summary);
            tables.push_back(std::move(result.table));
        }

        // Phase 4: one atomic write; StoreWriteException propagates
        try {
            store_.writeTables(tables);
        } catch (const core::StoreWriteException& e) {
            logger->critical("Persisting signal tables failed, previous store kept: {}", e.what());
            throw;
        }

        for (const auto& tf : summary.timeframes) {
            logger->info("[{}] {} signal(s): {} new, {} merged, {} retained, {} total row(s).",
                         tf.timeframe, tf.emitted, tf.fresh, tf.merged, tf.retained, tf.total);
        }
        logger->info("Run complete: {} pair(s) processed, {} skipped.", summary.pairs_processed, summary.pairs_skipped);
        return summary;
    }

} // namespace synthesis
