#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "decimal.hpp"
#include "utils.hpp"

namespace trade_rank {

struct TimeSlotPerformance {
    int hour{0};
    uint32_t trades{0};
    Decimal pnl;
    double win_rate{0.0};
};

struct DayResult {
    Timestamp date;
    Decimal pnl;
};

struct WeekResult {
    int year{0};
    int week_number{0};
    Decimal pnl;
};

struct HourResult {
    int hour{0};
    Decimal pnl;
};

struct DailySummary {
    Timestamp date;
    uint32_t total_trades{0};
    uint32_t winning_trades{0};
    uint32_t losing_trades{0};
    Decimal realized_pnl;
    Decimal gross_pnl;
    Decimal total_commission;
    Decimal total_volume;
    double win_rate{0.0};
    Decimal avg_win;
    Decimal avg_loss;
    Decimal largest_win;
    Decimal largest_loss;
    std::vector<std::string> symbols_traded;
    std::vector<TimeSlotPerformance> time_slot_performance;

    std::optional<Decimal> profit_factor() const;
};

struct WeeklySummary {
    int week_number{0};
    int year{0};
    Timestamp start_date;
    Timestamp end_date;
    uint32_t total_trades{0};
    uint32_t winning_trades{0};
    uint32_t losing_trades{0};
    Decimal realized_pnl;
    Decimal gross_pnl;
    Decimal total_commission;
    Decimal total_volume;
    double win_rate{0.0};
    Decimal avg_win;
    Decimal avg_loss;
    Decimal largest_win;
    Decimal largest_loss;
    std::optional<DayResult> best_day;
    std::optional<DayResult> worst_day;
    uint32_t trading_days{0};
    uint32_t profitable_days{0};
    Decimal avg_daily_pnl;
    std::vector<std::string> symbols_traded;
    std::vector<DailySummary> daily_summaries;

    std::optional<Decimal> profit_factor() const;
};

struct TradingSummary {
    Timestamp start_date;
    Timestamp end_date;
    std::vector<DailySummary> daily_summaries;
    std::vector<WeeklySummary> weekly_summaries;
    Decimal total_pnl;
    Decimal total_volume;
    uint32_t total_trades{0};
    double overall_win_rate{0.0};
    std::optional<DayResult> best_day;
    std::optional<DayResult> worst_day;
    std::optional<WeekResult> best_week;
    std::optional<WeekResult> worst_week;
    std::optional<HourResult> most_profitable_hour;
    std::optional<HourResult> least_profitable_hour;
};

struct TradingPeriod {
    std::string name;
    int start_hour{0};
    int end_hour{0};
    uint32_t total_trades{0};
    Decimal total_pnl;
    double win_rate{0.0};
    Decimal avg_pnl_per_trade;
};

/**
 * Percentage of decided outcomes; 0 when nothing was decided.
 */
inline double win_rate_pct(uint32_t wins, uint32_t decided) {
    return decided > 0 ? static_cast<double>(wins) / static_cast<double>(decided) * 100.0 : 0.0;
}

/**
 * Gross wins over gross losses from average/count pairs; empty when there are no losses.
 */
std::optional<Decimal> profit_factor(const Decimal& avg_win, uint32_t winning,
                                     const Decimal& avg_loss, uint32_t losing);

} // namespace trade_rank
