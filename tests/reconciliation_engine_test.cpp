#include <gtest/gtest.h>

#include "reconciliation_engine.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <set>

using core::SignalState;
using signal_engine::ReconciliationEngine;
using test_helpers::makeRecord;

class ReconciliationEngineTest : public ::testing::Test {
protected:
    ReconciliationEngineTest()
        : schema(core::SignalSchema::forTimeframe("daily", {"weekly", "daily", "4h"})),
          engine(schema) {}

    core::SignalTable previousTable(std::vector<core::SignalRecord> rows) const {
        return core::SignalTable{schema, std::move(rows)};
    }

    static std::set<core::SignalKey> keysOf(const core::SignalTable& table) {
        std::set<core::SignalKey> keys;
        for (const auto& r : table.rows) keys.insert(core::identityKey(r));
        return keys;
    }

    core::SignalSchema schema;
    ReconciliationEngine engine;
};

TEST_F(ReconciliationEngineTest, NoPreviousTableKeepsFreshRecords) {
    auto result = engine.reconcile({makeRecord("AAA", "2024-05-01", SignalState::Buy),
                                    makeRecord("BBB", "2024-05-01", SignalState::Sell)},
                                   std::nullopt);
    ASSERT_EQ(result.table.rows.size(), 2u);
    EXPECT_EQ(result.table.timeframe(), "daily");
    EXPECT_EQ(result.stats.fresh, 2u);
    EXPECT_EQ(result.stats.merged, 0u);
    EXPECT_EQ(result.table.rows[0].symbol, "AAA");
    EXPECT_EQ(result.table.rows[1].symbol, "BBB");
}

TEST_F(ReconciliationEngineTest, NotesAndJournalSurviveResynthesis) {
    auto old_row = makeRecord("AAA", "2024-05-01", SignalState::Buy, 100.0);
    old_row.notes = "watch the gap";
    old_row.journal.trade_type = "Buy";
    old_row.journal.entry_price = 100.0;
    old_row.journal.exit_price = 104.0;

    auto fresh = makeRecord("AAA", "2024-05-01", SignalState::Buy, 101.5);
    fresh.stoch_k = 65.0;

    auto result = engine.reconcile({fresh}, previousTable({old_row}));
    ASSERT_EQ(result.table.rows.size(), 1u);
    const auto& row = result.table.rows[0];
    EXPECT_EQ(row.notes, "watch the gap");
    EXPECT_EQ(row.journal.trade_type, "Buy");
    EXPECT_DOUBLE_EQ(*row.journal.entry_price, 100.0);
    // Computed values come from the new run
    EXPECT_DOUBLE_EQ(row.close, 101.5);
    EXPECT_DOUBLE_EQ(row.stoch_k, 65.0);
    // PNL derived from the preserved journal
    EXPECT_DOUBLE_EQ(*row.journal.pnl, 4.0);
    EXPECT_DOUBLE_EQ(*row.journal.pnl_pct, 4.0);
    EXPECT_EQ(result.stats.merged, 1u);
    EXPECT_EQ(result.stats.fresh, 0u);
}

TEST_F(ReconciliationEngineTest, DifferentStateIsADifferentRecord) {
    auto old_row = makeRecord("AAA", "2024-05-01", SignalState::Buy);
    old_row.notes = "old buy";
    auto result = engine.reconcile({makeRecord("AAA", "2024-05-01", SignalState::BuyPlus)},
                                   previousTable({old_row}));
    ASSERT_EQ(result.table.rows.size(), 2u);
    EXPECT_EQ(result.table.rows[0].state, SignalState::BuyPlus);
    EXPECT_EQ(result.table.rows[0].notes, "");
    EXPECT_EQ(result.table.rows[1].notes, "old buy");
}

TEST_F(ReconciliationEngineTest, UnmatchedHistoryIsRetainedUnchanged) {
    auto history = makeRecord("OLD", "2023-11-20", SignalState::Sell, 55.55);
    history.notes = "closed";
    history.trends = {{"4h", "down"}, {"weekly", "up"}};

    auto result = engine.reconcile({makeRecord("NEW", "2024-05-01", SignalState::Buy)},
                                   previousTable({history}));
    ASSERT_EQ(result.table.rows.size(), 2u);
    EXPECT_EQ(result.table.rows[0].symbol, "NEW");
    const auto& kept = result.table.rows[1];
    EXPECT_EQ(kept.symbol, "OLD");
    EXPECT_EQ(kept.notes, "closed");
    EXPECT_DOUBLE_EQ(kept.close, 55.55);
    EXPECT_EQ(kept.trends.at("weekly"), "up");
    EXPECT_EQ(result.stats.retained, 1u);
}

TEST_F(ReconciliationEngineTest, UnparsedHistoryIsNeverMatchedOrDropped) {
    auto matched = makeRecord("AAA", "2024-05-01", SignalState::Buy);
    matched.notes = "keep";
    // Same symbol and default identity fields, but the stored identity text was unreadable
    auto unparsed = makeRecord("AAA", "2024-05-01", SignalState::Buy);
    unparsed.unparsed = core::UnparsedIdentity{std::string("01/05/2024"), std::string("Buy")};
    unparsed.notes = "my trade";
    auto second = unparsed;
    second.notes = "another";

    auto result = engine.reconcile({makeRecord("AAA", "2024-05-01", SignalState::Buy)},
                                   previousTable({unparsed, matched, second}));
    ASSERT_EQ(result.table.rows.size(), 3u);
    EXPECT_EQ(result.table.rows[0].notes, "keep");
    EXPECT_FALSE(result.table.rows[0].unparsed.has_value());
    EXPECT_EQ(result.table.rows[1].notes, "my trade");
    ASSERT_TRUE(result.table.rows[1].unparsed.has_value());
    EXPECT_EQ(result.table.rows[1].unparsed->datetime, std::optional<std::string>("01/05/2024"));
    EXPECT_EQ(result.table.rows[2].notes, "another");
    EXPECT_EQ(result.stats.merged, 1u);
    EXPECT_EQ(result.stats.retained, 2u);
    EXPECT_EQ(result.stats.duplicates, 0u);
}

TEST_F(ReconciliationEngineTest, ReconcilingTheSameBatchIsIdempotent) {
    std::vector<core::SignalRecord> batch = {makeRecord("AAA", "2024-05-01", SignalState::Buy, 10.123),
                                             makeRecord("BBB", "2024-05-02", SignalState::SellPlus, 20.456)};
    batch[0].trends = {{"4h", "up"}, {"weekly", "down"}};
    batch[1].trends = {{"4h", ""}, {"weekly", "up"}};

    auto first = engine.reconcile(batch, std::nullopt);
    first.table.rows[0].notes = "user note";

    auto second = engine.reconcile(batch, first.table);
    ASSERT_EQ(second.table.rows.size(), first.table.rows.size());
    EXPECT_EQ(keysOf(second.table), keysOf(first.table));
    for (std::size_t i = 0; i < first.table.rows.size(); ++i) {
        const auto& a = first.table.rows[i];
        const auto& b = second.table.rows[i];
        EXPECT_EQ(core::identityKey(a), core::identityKey(b));
        EXPECT_EQ(a.notes, b.notes);
        EXPECT_DOUBLE_EQ(a.close, b.close);
        EXPECT_EQ(a.trends, b.trends);
    }
    EXPECT_EQ(second.stats.merged, 2u);
    EXPECT_EQ(second.stats.retained, 0u);

    auto third = engine.reconcile(batch, second.table);
    EXPECT_EQ(third.table.rows.size(), 2u);
    EXPECT_EQ(third.table.rows[0].notes, "user note");
}

TEST_F(ReconciliationEngineTest, DuplicateKeysKeepFirstOccurrence) {
    auto first = makeRecord("AAA", "2024-05-01", SignalState::Buy, 1.0);
    auto dup = makeRecord("AAA", "2024-05-01", SignalState::Buy, 2.0);

    auto stale_a = makeRecord("OLD", "2024-01-01", SignalState::Sell, 3.0);
    stale_a.notes = "first";
    auto stale_b = makeRecord("OLD", "2024-01-01", SignalState::Sell, 4.0);
    stale_b.notes = "second";

    auto result = engine.reconcile({first, dup}, previousTable({stale_a, stale_b}));
    ASSERT_EQ(result.table.rows.size(), 2u);
    EXPECT_DOUBLE_EQ(result.table.rows[0].close, 1.0);
    EXPECT_EQ(result.table.rows[1].notes, "first");
    EXPECT_EQ(result.stats.duplicates, 2u);
    EXPECT_EQ(keysOf(result.table).size(), result.table.rows.size());
}

TEST_F(ReconciliationEngineTest, DuplicateInPreviousTableDoesNotLeakIntoMerge) {
    auto stale_a = makeRecord("AAA", "2024-05-01", SignalState::Buy);
    stale_a.notes = "keep me";
    auto stale_b = makeRecord("AAA", "2024-05-01", SignalState::Buy);
    stale_b.notes = "shadowed";

    auto result = engine.reconcile({makeRecord("AAA", "2024-05-01", SignalState::Buy)},
                                   previousTable({stale_a, stale_b}));
    ASSERT_EQ(result.table.rows.size(), 1u);
    EXPECT_EQ(result.table.rows[0].notes, "keep me");
}

TEST_F(ReconciliationEngineTest, NumericColumnsRoundedToTwoDecimals) {
    auto record = makeRecord("AAA", "2024-05-01", SignalState::Buy, 123.456789);
    record.cci = -150.12345;
    record.stoch_k = 61.005;
    record.slope_k = 0.123456;
    record.adx = 25.999;
    record.minus_di = core::kNaN;
    record.journal.trade_type = "Sell";
    record.journal.entry_price = 10.0;
    record.journal.exit_price = 9.0;

    auto result = engine.reconcile({record}, std::nullopt);
    const auto& row = result.table.rows[0];
    EXPECT_DOUBLE_EQ(row.close, 123.46);
    EXPECT_DOUBLE_EQ(row.cci, -150.12);
    EXPECT_DOUBLE_EQ(row.slope_k, 0.12);
    EXPECT_DOUBLE_EQ(row.adx, 26.0);
    EXPECT_TRUE(std::isnan(row.minus_di));
    EXPECT_DOUBLE_EQ(*row.journal.pnl, 1.0);
    EXPECT_DOUBLE_EQ(*row.journal.pnl_pct, 10.0);

    // Rounding again changes nothing
    auto again = engine.reconcile({}, result.table);
    EXPECT_DOUBLE_EQ(again.table.rows[0].close, row.close);
    EXPECT_DOUBLE_EQ(again.table.rows[0].cci, row.cci);
    EXPECT_DOUBLE_EQ(again.table.rows[0].stoch_k, row.stoch_k);
}

TEST_F(ReconciliationEngineTest, TrendsNormalisedToSchemaSiblings) {
    auto fresh = makeRecord("AAA", "2024-05-01", SignalState::Buy);
    fresh.trends = {{"weekly", "up"}, {"monthly", "down"}};

    auto legacy = makeRecord("OLD", "2023-01-01", SignalState::Sell);
    legacy.trends.clear();

    auto result = engine.reconcile({fresh}, previousTable({legacy}));
    const std::map<std::string, std::string> expected_fresh = {{"4h", ""}, {"weekly", "up"}};
    const std::map<std::string, std::string> expected_legacy = {{"4h", ""}, {"weekly", ""}};
    EXPECT_EQ(result.table.rows[0].trends, expected_fresh);
    EXPECT_EQ(result.table.rows[1].trends, expected_legacy);
}

TEST_F(ReconciliationEngineTest, EmptyRunKeepsWholeHistory) {
    auto a = makeRecord("AAA", "2024-05-01", SignalState::Buy);
    auto b = makeRecord("BBB", "2024-05-02", SignalState::Sell);
    auto result = engine.reconcile({}, previousTable({a, b}));
    EXPECT_EQ(result.table.rows.size(), 2u);
    EXPECT_EQ(result.stats.retained, 2u);
}
