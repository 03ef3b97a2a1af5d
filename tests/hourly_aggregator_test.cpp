#include <gtest/gtest.h>
#include "../src/core/hourly_aggregator.hpp"

using namespace trade_rank;

namespace {

TradeRecord make_trade(const std::string& symbol, Side side, const char* qty, const char* price,
                       int hour, int minute, const char* commission = "0") {
    TradeRecord t;
    t.symbol = symbol;
    t.side = side;
    t.quantity = Decimal(qty);
    t.fill_price = Decimal(price);
    t.time = utils::utc_time_point(2024, 3, 4, hour, minute);
    t.net_amount = t.quantity * t.fill_price;
    t.commission = Decimal(commission);
    return t;
}

} // namespace

TEST(HourlyAggregatorTest, RoundTripAcrossHoursRealizesNothing) {
    auto slots = calculate_hourly_performance({
        make_trade("AAPL", Side::BUY, "10", "5", 9, 30),
        make_trade("AAPL", Side::SELL, "10", "6", 10, 15),
    });

    ASSERT_EQ(slots.size(), 2u);
    EXPECT_EQ(slots[0].hour, 9);
    EXPECT_EQ(slots[0].trades, 1u);
    EXPECT_TRUE(slots[0].pnl.is_zero());
    EXPECT_DOUBLE_EQ(slots[0].win_rate, 0.0);
    EXPECT_EQ(slots[1].hour, 10);
    EXPECT_EQ(slots[1].trades, 1u);
    EXPECT_TRUE(slots[1].pnl.is_zero());
}

TEST(HourlyAggregatorTest, ClosingCommissionComesOffEachRoundTrip) {
    auto slots = calculate_hourly_performance({
        make_trade("AAPL", Side::BUY, "10", "5", 9, 10, "1"),
        make_trade("AAPL", Side::SELL, "10", "6", 9, 50, "1"),
        make_trade("MSFT", Side::BUY, "10", "20", 9, 20, "1"),
        make_trade("MSFT", Side::SELL, "10", "19", 9, 40, "1"),
    });

    ASSERT_EQ(slots.size(), 1u);
    EXPECT_EQ(slots[0].trades, 4u);
    // AAPL 10 - 1, MSFT -10 - 1
    EXPECT_EQ(slots[0].pnl, Decimal(-2));
    EXPECT_DOUBLE_EQ(slots[0].win_rate, 50.0);
}

TEST(HourlyAggregatorTest, InactiveHoursAreOmittedAndSorted) {
    auto slots = calculate_hourly_performance({
        make_trade("AAPL", Side::BUY, "1", "5", 15, 0),
        make_trade("AAPL", Side::SELL, "1", "6", 15, 5),
        make_trade("MSFT", Side::BUY, "1", "5", 4, 0),
    });

    ASSERT_EQ(slots.size(), 2u);
    EXPECT_EQ(slots[0].hour, 4);
    EXPECT_EQ(slots[1].hour, 15);
    EXPECT_EQ(slots[1].pnl, Decimal(1));
    EXPECT_DOUBLE_EQ(slots[1].win_rate, 100.0);

    EXPECT_TRUE(calculate_hourly_performance({}).empty());
}

TEST(HourlyAggregatorTest, FlatRoundTripsCountAsTradesButNotInWinRate) {
    auto slots = calculate_hourly_performance({
        make_trade("AAPL", Side::BUY, "10", "5", 9, 10),
        make_trade("AAPL", Side::SELL, "10", "6", 9, 20),
        make_trade("MSFT", Side::BUY, "10", "20", 9, 30),
        make_trade("MSFT", Side::SELL, "10", "20", 9, 40),
    });

    ASSERT_EQ(slots.size(), 1u);
    EXPECT_EQ(slots[0].trades, 4u);
    EXPECT_EQ(slots[0].pnl, Decimal(10));
    EXPECT_DOUBLE_EQ(slots[0].win_rate, 100.0);
}
