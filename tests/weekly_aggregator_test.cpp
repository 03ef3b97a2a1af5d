#include <gtest/gtest.h>
#include "../src/core/weekly_aggregator.hpp"

using namespace trade_rank;

namespace {

DailySummary make_day(int year, int month, int day, const char* pnl,
                      uint32_t wins = 0, const char* avg_win = "0",
                      uint32_t losses = 0, const char* avg_loss = "0") {
    DailySummary d;
    d.date = utils::utc_time_point(year, month, day);
    d.realized_pnl = Decimal(pnl);
    d.gross_pnl = Decimal(pnl);
    d.winning_trades = wins;
    d.losing_trades = losses;
    d.total_trades = wins + losses;
    d.avg_win = Decimal(avg_win);
    d.avg_loss = Decimal(avg_loss);
    d.largest_win = d.avg_win;
    d.largest_loss = d.avg_loss;
    return d;
}

} // namespace

TEST(WeeklyAggregatorTest, AveragesAreWeightedByCounts) {
    auto w = build_weekly_summary(2024, 2, {
        make_day(2024, 1, 8, "20", 2, "10"),
        make_day(2024, 1, 9, "60", 3, "20"),
    });

    EXPECT_EQ(w.winning_trades, 5u);
    EXPECT_EQ(w.avg_win, Decimal(16));
    EXPECT_EQ(w.realized_pnl, Decimal(80));
    EXPECT_EQ(w.avg_daily_pnl, Decimal(40));
    EXPECT_EQ(w.trading_days, 2u);
    EXPECT_EQ(w.profitable_days, 2u);
    EXPECT_EQ(w.largest_win, Decimal(20));
    EXPECT_DOUBLE_EQ(w.win_rate, 100.0);
}

TEST(WeeklyAggregatorTest, BestAndWorstDayPreferEarliestOnTies) {
    auto w = build_weekly_summary(2024, 2, {
        make_day(2024, 1, 10, "50", 1, "50"),
        make_day(2024, 1, 8, "50", 1, "50"),
        make_day(2024, 1, 9, "-10", 0, "0", 1, "-10"),
        make_day(2024, 1, 11, "-10", 0, "0", 1, "-10"),
    });

    ASSERT_TRUE(w.best_day.has_value());
    ASSERT_TRUE(w.worst_day.has_value());
    EXPECT_EQ(w.best_day->date, utils::utc_time_point(2024, 1, 8));
    EXPECT_EQ(w.worst_day->date, utils::utc_time_point(2024, 1, 9));
    EXPECT_EQ(w.profitable_days, 2u);
    EXPECT_EQ(w.avg_loss, Decimal(-10));
    EXPECT_EQ(w.largest_loss, Decimal(-10));
    ASSERT_EQ(w.daily_summaries.size(), 4u);
    EXPECT_EQ(w.daily_summaries.front().date, utils::utc_time_point(2024, 1, 8));
}

TEST(WeeklyAggregatorTest, WeekBoundsAreMondayToSunday) {
    auto w = build_weekly_summary(2024, 2, {make_day(2024, 1, 10, "1")});
    EXPECT_EQ(w.start_date, utils::utc_time_point(2024, 1, 8));
    EXPECT_EQ(w.end_date, utils::utc_time_point(2024, 1, 14, 23, 59, 59));
}

TEST(WeeklyAggregatorTest, IsoWeekCrossesCalendarYear) {
    auto k1 = utils::iso_week(utils::utc_time_point(2024, 12, 30));
    EXPECT_EQ(k1.year, 2025);
    EXPECT_EQ(k1.week, 1);
    auto k2 = utils::iso_week(utils::utc_time_point(2021, 1, 1));
    EXPECT_EQ(k2.year, 2020);
    EXPECT_EQ(k2.week, 53);

    auto weeks = calculate_weekly_summaries({
        make_day(2024, 12, 27, "5"),
        make_day(2024, 12, 30, "10"),
        make_day(2025, 1, 2, "20"),
    });
    ASSERT_EQ(weeks.size(), 2u);
    EXPECT_EQ(weeks[0].year, 2024);
    EXPECT_EQ(weeks[0].week_number, 52);
    EXPECT_EQ(weeks[1].year, 2025);
    EXPECT_EQ(weeks[1].week_number, 1);
    EXPECT_EQ(weeks[1].trading_days, 2u);
    EXPECT_EQ(weeks[1].realized_pnl, Decimal(30));
    EXPECT_EQ(weeks[1].start_date, utils::utc_time_point(2024, 12, 30));
}

TEST(WeeklyAggregatorTest, WeeksPartitionTheDays) {
    std::vector<DailySummary> days{
        make_day(2024, 3, 1, "12.5", 1, "12.5"),
        make_day(2024, 3, 4, "-3", 0, "0", 1, "-3"),
        make_day(2024, 3, 5, "7", 1, "7"),
        make_day(2024, 3, 12, "1.25", 1, "1.25"),
    };
    auto weeks = calculate_weekly_summaries(days);
    ASSERT_EQ(weeks.size(), 3u);

    Decimal daily_total;
    for (const auto& d : days) daily_total += d.realized_pnl;
    Decimal weekly_total;
    uint32_t day_count = 0;
    for (size_t i = 0; i < weeks.size(); ++i) {
        weekly_total += weeks[i].realized_pnl;
        day_count += weeks[i].trading_days;
        if (i > 0) EXPECT_LT(weeks[i - 1].start_date, weeks[i].start_date);
    }
    EXPECT_EQ(weekly_total, daily_total);
    EXPECT_EQ(day_count, days.size());

    EXPECT_TRUE(calculate_weekly_summaries({}).empty());
}
