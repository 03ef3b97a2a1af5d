#include <gtest/gtest.h>
#include <sstream>
#include "../src/core/report.hpp"
#include "../src/core/period_analyzer.hpp"
#include "../src/core/trading_analytics.hpp"

using namespace trade_rank;

namespace {

TradeRecord make_trade(Side side, const char* price, int day, int hour, int minute) {
    TradeRecord t;
    t.symbol = "AAPL";
    t.side = side;
    t.quantity = Decimal(100);
    t.fill_price = Decimal(price);
    t.time = utils::utc_time_point(2024, 3, day, hour, minute);
    t.net_amount = t.quantity * t.fill_price;
    t.commission = Decimal(1);
    return t;
}

} // namespace

TEST(ReportTest, FormatsCurrency) {
    EXPECT_EQ(format_currency(Decimal("198")), "$198.00");
    EXPECT_EQ(format_currency(Decimal("-12.345")), "-$12.35");
    EXPECT_EQ(format_currency(Decimal("-0.001")), "$0.00");
}

TEST(ReportTest, RendersSummaryWeeklyAndPeriods) {
    std::vector<TradeRecord> trades{
        make_trade(Side::BUY, "10", 4, 10, 0),
        make_trade(Side::SELL, "12", 4, 10, 30),
        make_trade(Side::BUY, "10", 5, 14, 0),
        make_trade(Side::SELL, "9", 5, 14, 30),
    };
    auto summary = analyze_trades(trades, {1, nullptr});

    std::ostringstream out;
    render_summary(out, summary, 10);
    render_weekly(out, summary);
    render_periods(out, identify_best_trading_periods(trades), 2);
    std::string text = out.str();

    EXPECT_NE(text.find("Detailed report for 2024-03-05"), std::string::npos);
    EXPECT_NE(text.find("2024-03-04"), std::string::npos);
    EXPECT_NE(text.find("$96.00"), std::string::npos);   // 198 - 102
    EXPECT_NE(text.find("2024-W10"), std::string::npos);
    EXPECT_NE(text.find("1. Morning (10:00-12:00)"), std::string::npos);
    EXPECT_EQ(text.find("3. "), std::string::npos);
}

TEST(ReportTest, EmptySummary) {
    std::ostringstream out;
    render_summary(out, analyze_trades({}, {1, nullptr}), 10);
    render_weekly(out, TradingSummary{});
    EXPECT_NE(out.str().find("No trading days."), std::string::npos);
    EXPECT_EQ(out.str().find("Weekly performance"), std::string::npos);
}

TEST(ReportTest, RecentDaysTableIncludesLatestDay) {
    std::vector<TradeRecord> trades;
    for (int day = 4; day <= 6; ++day) {
        trades.push_back(make_trade(Side::BUY, "10", day, 10, 0));
        trades.push_back(make_trade(Side::SELL, "11", day, 10, 30));
    }
    auto summary = analyze_trades(trades, {1, nullptr});

    std::ostringstream out;
    render_summary(out, summary, 2);
    std::string text = out.str();
    std::string table = text.substr(0, text.find("Detailed report"));

    EXPECT_NE(table.find("Recent trading days"), std::string::npos);
    EXPECT_EQ(table.find("2024-03-04"), std::string::npos);
    EXPECT_NE(table.find("2024-03-05"), std::string::npos);
    EXPECT_NE(table.find("2024-03-06"), std::string::npos);

    std::ostringstream single;
    render_summary(single, summary, 1);
    std::string single_text = single.str();
    std::string single_table = single_text.substr(0, single_text.find("Detailed report"));
    EXPECT_EQ(single_table.find("2024-03-05"), std::string::npos);
    EXPECT_NE(single_table.find("2024-03-06"), std::string::npos);
}
