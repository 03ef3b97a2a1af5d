#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>
#include "../src/core/trade.hpp"

using namespace trade_rank;

namespace {

TradeRecord make_trade(const std::string& symbol, Side side, const char* qty, const char* price,
                       Timestamp time, const char* commission = "0") {
    TradeRecord t;
    t.symbol = symbol;
    t.side = side;
    t.quantity = Decimal(qty);
    t.fill_price = Decimal(price);
    t.time = time;
    t.net_amount = t.quantity * t.fill_price;
    t.commission = Decimal(commission);
    return t;
}

} // namespace

TEST(TradeTest, PnlSignFollowsSide) {
    auto ts = utils::utc_time_point(2024, 3, 4, 14, 30);
    auto buy = make_trade("AAPL", Side::BUY, "100", "10", ts, "1");
    auto sell = make_trade("AAPL", Side::SELL, "100", "12", ts, "1");

    EXPECT_EQ(buy.gross_pnl(), Decimal(-1000));
    EXPECT_EQ(buy.net_pnl(), Decimal(-1001));
    EXPECT_EQ(sell.gross_pnl(), Decimal(1200));
    EXPECT_EQ(sell.net_pnl(), Decimal(1199));
    EXPECT_EQ(sell.notional(), Decimal(1200));
    EXPECT_EQ(sell.hour_of_day(), 14);
}

TEST(TradeTest, DeduplicateKeepsFirstOccurrence) {
    auto ts = utils::utc_time_point(2024, 3, 4, 14, 30);
    auto first = make_trade("AAPL", Side::BUY, "100", "10", ts, "1");
    auto dup = first;
    dup.commission = Decimal("5");   // not part of identity
    auto other = make_trade("AAPL", Side::SELL, "100", "10", ts);

    std::vector<TradeRecord> trades{first, other, dup};
    EXPECT_EQ(deduplicate_trades(trades), 1u);
    ASSERT_EQ(trades.size(), 2u);
    EXPECT_EQ(trades[0].commission, Decimal(1));
    EXPECT_EQ(trades[1].side, Side::SELL);

    EXPECT_EQ(deduplicate_trades(trades), 0u);
}

TEST(TradeTest, FillOrderBreaksTimestampTies) {
    auto ts = utils::utc_time_point(2024, 3, 4, 14, 30);
    auto a = make_trade("AAPL", Side::SELL, "10", "5", ts);
    auto b = make_trade("AAPL", Side::BUY, "10", "5", ts);
    auto c = make_trade("MSFT", Side::BUY, "1", "5", ts - std::chrono::seconds(1));

    std::vector<TradeRecord> v{a, b, c};
    std::sort(v.begin(), v.end(), fill_order_less);
    EXPECT_EQ(v[0].symbol, "MSFT");
    EXPECT_EQ(v[1].side, Side::BUY);
    EXPECT_EQ(v[2].side, Side::SELL);
    EXPECT_FALSE(fill_order_less(a, a));
}

TEST(TradeTest, ValidateRejectsBadRecords) {
    auto ts = utils::utc_time_point(2024, 3, 4, 14, 30);
    auto ok = make_trade("AAPL", Side::BUY, "1", "10", ts);
    EXPECT_NO_THROW(validate_trade(ok));

    auto no_symbol = ok;
    no_symbol.symbol.clear();
    EXPECT_THROW(validate_trade(no_symbol), std::invalid_argument);

    auto zero_qty = ok;
    zero_qty.quantity = Decimal();
    EXPECT_THROW(validate_trade(zero_qty), std::invalid_argument);

    auto negative_price = ok;
    negative_price.fill_price = Decimal("-1");
    EXPECT_THROW(validate_trade(negative_price), std::invalid_argument);

    auto negative_commission = ok;
    negative_commission.commission = Decimal("-0.01");
    EXPECT_THROW(validate_trades({ok, negative_commission}), std::invalid_argument);
}

TEST(TradeTest, SideParsing) {
    EXPECT_EQ(side_from_string("Buy"), Side::BUY);
    EXPECT_EQ(side_from_string(" LONG "), Side::BUY);
    EXPECT_EQ(side_from_string("sell"), Side::SELL);
    EXPECT_EQ(side_from_string("Short"), Side::SELL);
    EXPECT_FALSE(side_from_string("hold").has_value());
    EXPECT_STREQ(side_to_string(Side::SELL), "Sell");
}
