#include <gtest/gtest.h>

#include "synthesis_runner.hpp"
#include "sqlite_signal_store.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <map>

using core::SignalState;

namespace {

    // Same bars for every timeframe of a symbol; unknown symbols fail the fetch
    class FakeBarProvider : public data::IBarProvider {
    public:
        std::map<std::string, core::TimeSeries<core::Candle>> bars;
        std::vector<std::string> requests;

        core::TimeSeries<core::Candle> fetchBars(const std::string& symbol,
                                                 const core::TimeframeConfig& timeframe) override {
            requests.push_back(symbol + "/" + timeframe.name);
            auto it = bars.find(symbol);
            if (it == bars.end()) {
                throw core::ApiRequestException("no route to " + symbol);
            }
            return it->second;
        }
    };

    class FakeSignalStore : public data::ISignalStore {
    public:
        std::map<std::string, core::SignalTable> tables;
        bool fail_reads = false;
        bool fail_writes = false;
        int writes = 0;

        std::optional<core::SignalTable> readTable(const core::SignalSchema& schema) override {
            if (fail_reads) throw core::StoreReadException("corrupt");
            auto it = tables.find(schema.timeframe());
            if (it == tables.end()) return std::nullopt;
            return it->second;
        }

        void writeTables(const std::vector<core::SignalTable>& written) override {
            if (fail_writes) throw core::StoreWriteException("disk full");
            ++writes;
            for (const auto& t : written) {
                tables.erase(t.timeframe());
                tables.emplace(t.timeframe(), t);
            }
        }
    };

    core::SynthesisConfig testConfig() {
        core::SynthesisConfig cfg;
        cfg.timeframes = {{"daily", "1d", "1y"}, {"weekly", "1wk", "3y"}};
        cfg.indicators.stoch_window = 5;
        cfg.indicators.k_smooth = 1;
        cfg.indicators.d_smooth = 3;
        cfg.indicators.cci_period = 5;
        cfg.indicators.dmi_period = 3;
        cfg.indicators.slope_period = 3;
        // Never "trending", so the setups classify as plain Buy / Sell
        cfg.thresholds.adx_threshold = 100.0;
        return cfg;
    }

    std::vector<double> steadyRise(int n) {
        std::vector<double> closes;
        for (int i = 0; i < n; ++i) closes.push_back(50.0 + 2.0 * i);
        return closes;
    }

} // namespace

class SynthesisRunnerTest : public ::testing::Test {
protected:
    SynthesisRunnerTest() {
        bars.bars["BUYER"] = test_helpers::buySetupBars();
        bars.bars["SELLER"] = test_helpers::sellSetupBars();
        bars.bars["FLAT"] = test_helpers::barsFromCloses(steadyRise(21));
        bars.bars["SHORT"] = test_helpers::barsFromCloses(steadyRise(3));
        bars.bars["EMPTY"] = {};
    }

    FakeBarProvider bars;
    FakeSignalStore store;
};

TEST_F(SynthesisRunnerTest, ClassifiesEnrichesAndPersists) {
    data::StaticSymbolUniverse universe({"BUYER", "SELLER", "FLAT"});
    synthesis::SynthesisRunner runner(testConfig(), bars, universe, store);
    const auto summary = runner.run();

    EXPECT_EQ(summary.symbols, 3u);
    EXPECT_EQ(summary.pairs_processed, 6u);
    EXPECT_EQ(summary.pairs_skipped, 0u);
    EXPECT_EQ(store.writes, 1);

    ASSERT_EQ(store.tables.count("daily"), 1u);
    const auto& daily = store.tables.at("daily");
    ASSERT_EQ(daily.rows.size(), 2u);

    const auto& buy = daily.rows[0];
    EXPECT_EQ(buy.symbol, "BUYER");
    EXPECT_EQ(buy.state, SignalState::Buy);
    EXPECT_EQ(buy.timestamp, test_helpers::buySetupBars().back().timestamp);
    EXPECT_DOUBLE_EQ(buy.close, 57.0);
    EXPECT_DOUBLE_EQ(buy.stoch_k, 36.84);
    EXPECT_EQ(buy.trends.at("weekly"), "up");
    EXPECT_EQ(buy.trends.count("daily"), 0u);

    const auto& sell = daily.rows[1];
    EXPECT_EQ(sell.symbol, "SELLER");
    EXPECT_EQ(sell.state, SignalState::Sell);
    EXPECT_EQ(sell.trends.at("weekly"), "down");

    const auto& weekly = store.tables.at("weekly");
    ASSERT_EQ(weekly.rows.size(), 2u);
    EXPECT_EQ(weekly.rows[0].trends.at("daily"), "up");

    ASSERT_EQ(summary.timeframes.size(), 2u);
    EXPECT_EQ(summary.timeframes[0].timeframe, "daily");
    EXPECT_EQ(summary.timeframes[0].emitted, 2u);
    EXPECT_EQ(summary.timeframes[0].fresh, 2u);
    EXPECT_EQ(summary.timeframes[0].total, 2u);
}

TEST_F(SynthesisRunnerTest, FailingPairsAreSkippedWithoutAbortingTheRun) {
    data::StaticSymbolUniverse universe({"BROKEN", "EMPTY", "SHORT", "BUYER"});
    synthesis::SynthesisRunner runner(testConfig(), bars, universe, store);
    const auto summary = runner.run();

    EXPECT_EQ(summary.pairs_skipped, 6u);
    EXPECT_EQ(summary.pairs_processed, 2u);
    EXPECT_EQ(bars.requests.size(), 8u);
    ASSERT_EQ(store.tables.at("daily").rows.size(), 1u);
    EXPECT_EQ(store.tables.at("daily").rows[0].symbol, "BUYER");
}

TEST_F(SynthesisRunnerTest, HistoryAndNotesSurviveLaterRuns) {
    auto old_signal = test_helpers::makeRecord("GONE", "2023-06-01", SignalState::Sell, 12.0);
    old_signal.notes = "exited";
    const auto daily_schema = core::SignalSchema::forTimeframe("daily", {"daily", "weekly"});
    store.tables.emplace("daily", core::SignalTable{daily_schema, {old_signal}});

    data::StaticSymbolUniverse universe({"BUYER"});
    synthesis::SynthesisRunner runner(testConfig(), bars, universe, store);
    runner.run();

    auto& daily = store.tables.at("daily");
    ASSERT_EQ(daily.rows.size(), 2u);
    EXPECT_EQ(daily.rows[1].symbol, "GONE");
    EXPECT_EQ(daily.rows[1].notes, "exited");

    daily.rows[0].notes = "entered on open";
    const auto summary = runner.run();

    const auto& again = store.tables.at("daily");
    ASSERT_EQ(again.rows.size(), 2u);
    EXPECT_EQ(again.rows[0].symbol, "BUYER");
    EXPECT_EQ(again.rows[0].notes, "entered on open");
    EXPECT_EQ(summary.timeframes[0].merged, 1u);
    EXPECT_EQ(summary.timeframes[0].retained, 1u);
}

TEST_F(SynthesisRunnerTest, UnreadablePreviousTableStartsEmpty) {
    store.fail_reads = true;
    data::StaticSymbolUniverse universe({"BUYER"});
    synthesis::SynthesisRunner runner(testConfig(), bars, universe, store);
    const auto summary = runner.run();

    EXPECT_TRUE(summary.timeframes[0].previous_unreadable);
    EXPECT_EQ(store.writes, 1);
    EXPECT_EQ(store.tables.at("daily").rows.size(), 1u);
}

TEST_F(SynthesisRunnerTest, WriteFailureIsReported) {
    store.fail_writes = true;
    data::StaticSymbolUniverse universe({"BUYER"});
    synthesis::SynthesisRunner runner(testConfig(), bars, universe, store);
    EXPECT_THROW(runner.run(), core::StoreWriteException);
}

TEST_F(SynthesisRunnerTest, EmptyTimeframeSetIsAConfigError) {
    auto cfg = testConfig();
    cfg.timeframes.clear();
    data::StaticSymbolUniverse universe({"BUYER"});
    auto construct = [&] { synthesis::SynthesisRunner runner(cfg, bars, universe, store); };
    EXPECT_THROW(construct(), core::ConfigException);
}

TEST(SynthesisRunnerStoreTest, RepeatedRunsAgainstSqliteAreIdempotent) {
    test_helpers::TempDir dir;
    const std::string path = dir.file("signals.db");

    FakeBarProvider bars;
    bars.bars["BUYER"] = test_helpers::buySetupBars();
    bars.bars["SELLER"] = test_helpers::sellSetupBars();

    data::SqliteSignalStore store(path);
    data::StaticSymbolUniverse universe({"BUYER", "SELLER"});
    synthesis::SynthesisRunner runner(testConfig(), bars, universe, store);
    runner.run();

    // A user annotates a row between runs
    const auto schema = core::SignalSchema::forTimeframe("daily", {"daily", "weekly"});
    auto table = store.readTable(schema);
    ASSERT_TRUE(table.has_value());
    ASSERT_EQ(table->rows.size(), 2u);
    table->rows[1].notes = "short here";
    table->rows[1].journal.trade_type = "Sell";
    table->rows[1].journal.entry_price = 143.0;
    table->rows[1].journal.exit_price = 140.0;
    store.writeTables({*table});

    runner.run();
    runner.run();

    const auto final_table = store.readTable(schema);
    ASSERT_TRUE(final_table.has_value());
    ASSERT_EQ(final_table->rows.size(), 2u);
    const auto& sell = final_table->rows[1];
    EXPECT_EQ(sell.symbol, "SELLER");
    EXPECT_EQ(sell.notes, "short here");
    EXPECT_DOUBLE_EQ(*sell.journal.pnl, 3.0);
    EXPECT_DOUBLE_EQ(*sell.journal.pnl_pct, 2.1);
    EXPECT_EQ(sell.trends.at("weekly"), "down");
}
