#include <gtest/gtest.h>

#include "sqlite_bar_provider.hpp"
#include "database_manager.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

class SqliteBarProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        data::DatabaseManager db(path);
        ASSERT_TRUE(db.connect());
        ASSERT_TRUE(db.initializeSchema());
        std::vector<double> closes;
        for (int i = 0; i < 10; ++i) closes.push_back(10.0 + i);
        ASSERT_TRUE(db.saveCandles(test_helpers::barsFromCloses(closes, "2024-01-01"), "AAA", "1d"));
        // Re-saving overwrites the same rows
        ASSERT_TRUE(db.saveCandles(test_helpers::barsFromCloses(closes, "2024-01-01"), "AAA", "1d"));
    }

    test_helpers::TempDir dir;
    std::string path = dir.file("candles.db");
};

TEST_F(SqliteBarProviderTest, PeriodCountsBackFromNewestBar) {
    data::SqliteBarProvider provider(path);
    const auto bars = provider.fetchBars("AAA", core::TimeframeConfig{"daily", "1d", "5d"});
    // 2024-01-05 .. 2024-01-10 inclusive
    ASSERT_EQ(bars.size(), 6u);
    EXPECT_EQ(bars.front().timestamp, test_helpers::ts("2024-01-05"));
    EXPECT_EQ(bars.back().timestamp, test_helpers::ts("2024-01-10"));
    EXPECT_DOUBLE_EQ(bars.back().close, 19.0);
    EXPECT_DOUBLE_EQ(bars.back().high, 20.0);
    EXPECT_EQ(bars.back().volume, 1000);
}

TEST_F(SqliteBarProviderTest, UnknownPairIsDataUnavailable) {
    data::SqliteBarProvider provider(path);
    EXPECT_THROW(provider.fetchBars("ZZZ", core::TimeframeConfig{"daily", "1d", "5d"}),
                 core::DataUnavailableException);
    EXPECT_THROW(provider.fetchBars("AAA", core::TimeframeConfig{"weekly", "1wk", "1y"}),
                 core::DataUnavailableException);
}

TEST_F(SqliteBarProviderTest, MissingDatabaseIsDataUnavailable) {
    data::SqliteBarProvider provider(dir.file("nope.db"));
    EXPECT_THROW(provider.fetchBars("AAA", core::TimeframeConfig{"daily", "1d", "5d"}),
                 core::DataUnavailableException);
}
