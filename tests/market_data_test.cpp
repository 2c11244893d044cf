#include <gtest/gtest.h>

#include <fstream>

#include "foresight/errors.hpp"
#include "foresight/evaluator/market_data.hpp"
#include "test_helpers.hpp"

using namespace foresight;
using namespace foresight::test;

namespace {

void write_file(const std::string& path, const std::string& text)
{
    std::ofstream out(path);
    out << text;
}

}  // namespace

// ===========================================================================
// InMemoryMarketDataSource
// ===========================================================================

TEST(InMemoryMarketDataTest, LastBarAtOrBefore)
{
    InMemoryMarketDataSource source(minutes(5));
    source.add_bar("QBE", day(0, 10), 100.0);
    source.add_bar("QBE", day(0, 10) + minutes(1), 101.0);

    auto exact = source.bar_at("QBE", day(0, 10));
    ASSERT_TRUE(exact.has_value());
    EXPECT_DOUBLE_EQ(exact->close, 100.0);

    auto between = source.bar_at("QBE", day(0, 10) + seconds(90));
    ASSERT_TRUE(between.has_value());
    EXPECT_DOUBLE_EQ(between->close, 101.0);
    EXPECT_EQ(between->timestamp, day(0, 10) + minutes(1));
}

TEST(InMemoryMarketDataTest, NeverReturnsLaterBar)
{
    InMemoryMarketDataSource source(minutes(5));
    source.add_bar("QBE", day(0, 10) + seconds(1), 100.0);
    EXPECT_FALSE(source.bar_at("QBE", day(0, 10)).has_value());
}

TEST(InMemoryMarketDataTest, StaleBarIsMissing)
{
    InMemoryMarketDataSource source(minutes(5));
    source.add_bar("QBE", day(0, 10), 100.0);
    EXPECT_TRUE(source.bar_at("QBE", day(0, 10) + minutes(5)).has_value());
    EXPECT_FALSE(source.bar_at("QBE", day(0, 10) + minutes(6)).has_value());
}

TEST(InMemoryMarketDataTest, UnknownSymbol)
{
    InMemoryMarketDataSource source(minutes(5));
    source.add_bar("QBE", day(0, 10), 100.0);
    EXPECT_FALSE(source.bar_at("BHP", day(0, 10)).has_value());
    EXPECT_EQ(source.size(), 1u);
}

// ===========================================================================
// CsvMarketDataSource
// ===========================================================================

TEST(CsvMarketDataTest, LoadsRowsSkippingHeaderAndComments)
{
    TempDir dir;
    const int64_t t = to_epoch_seconds(day(0, 10));
    write_file(dir.file("prices.csv"), "symbol,timestamp,close\n"
                                       "# ASX close snapshots\n"
                                       "\n"
                                       "QBE," + std::to_string(t) + ",100.00\n"
                                       "QBE," + std::to_string(t + 4 * 3600) + ",102.76\n"
                                       " BHP , " + std::to_string(t) + " , 45.10 \n");

    CsvMarketDataSource source(dir.file("prices.csv"), minutes(5));
    EXPECT_EQ(source.size(), 3u);
    EXPECT_DOUBLE_EQ(source.bar_at("QBE", day(0, 14))->close, 102.76);
    EXPECT_DOUBLE_EQ(source.bar_at("BHP", day(0, 10))->close, 45.10);
}

TEST(CsvMarketDataTest, MalformedRowThrows)
{
    TempDir dir;
    write_file(dir.file("prices.csv"), "QBE,1760090400,100.0\nQBE,not-a-time,101.0\n");
    EXPECT_THROW(CsvMarketDataSource(dir.file("prices.csv"), minutes(5)), PipelineError);
}

TEST(CsvMarketDataTest, NonPositiveCloseThrows)
{
    TempDir dir;
    write_file(dir.file("prices.csv"), "QBE,1760090400,0\n");
    EXPECT_THROW(CsvMarketDataSource(dir.file("prices.csv"), minutes(5)), PipelineError);
}

TEST(CsvMarketDataTest, MissingFileThrows)
{
    TempDir dir;
    EXPECT_THROW(CsvMarketDataSource(dir.file("absent.csv"), minutes(5)), PipelineError);
}
