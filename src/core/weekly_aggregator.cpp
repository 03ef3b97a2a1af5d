#include "weekly_aggregator.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace trade_rank {

WeeklySummary build_weekly_summary(int iso_year, int week_number, std::vector<DailySummary> days) {
    std::sort(days.begin(), days.end(),
              [](const DailySummary& a, const DailySummary& b) { return a.date < b.date; });

    WeeklySummary weekly;
    weekly.year = iso_year;
    weekly.week_number = week_number;
    if (!days.empty()) {
        weekly.start_date = utils::week_start(days.front().date);
        weekly.end_date = utils::week_end(days.front().date);
    }

    Decimal total_wins_amount;
    Decimal total_losses_amount;
    std::set<std::string> symbols;

    for (const auto& daily : days) {
        weekly.total_trades += daily.total_trades;
        weekly.winning_trades += daily.winning_trades;
        weekly.losing_trades += daily.losing_trades;
        weekly.realized_pnl += daily.realized_pnl;
        weekly.gross_pnl += daily.gross_pnl;
        weekly.total_commission += daily.total_commission;
        weekly.total_volume += daily.total_volume;

        total_wins_amount += daily.avg_win * Decimal(static_cast<int64_t>(daily.winning_trades));
        total_losses_amount += daily.avg_loss * Decimal(static_cast<int64_t>(daily.losing_trades));

        symbols.insert(daily.symbols_traded.begin(), daily.symbols_traded.end());

        if (daily.largest_win > weekly.largest_win) weekly.largest_win = daily.largest_win;
        if (daily.largest_loss < weekly.largest_loss) weekly.largest_loss = daily.largest_loss;

        if (daily.realized_pnl.is_positive()) ++weekly.profitable_days;

        // Strict comparisons keep the earliest day on ties.
        if (!weekly.best_day || daily.realized_pnl > weekly.best_day->pnl) {
            weekly.best_day = DayResult{daily.date, daily.realized_pnl};
        }
        if (!weekly.worst_day || daily.realized_pnl < weekly.worst_day->pnl) {
            weekly.worst_day = DayResult{daily.date, daily.realized_pnl};
        }
    }

    if (weekly.winning_trades > 0) {
        weekly.avg_win = total_wins_amount / Decimal(static_cast<int64_t>(weekly.winning_trades));
    }
    if (weekly.losing_trades > 0) {
        weekly.avg_loss = total_losses_amount / Decimal(static_cast<int64_t>(weekly.losing_trades));
    }
    weekly.win_rate = win_rate_pct(weekly.winning_trades, weekly.total_trades);

    weekly.symbols_traded.assign(symbols.begin(), symbols.end());
    weekly.trading_days = static_cast<uint32_t>(days.size());
    if (weekly.trading_days > 0) {
        weekly.avg_daily_pnl = weekly.realized_pnl / Decimal(static_cast<int64_t>(weekly.trading_days));
    }
    weekly.daily_summaries = std::move(days);
    return weekly;
}

std::vector<WeeklySummary> calculate_weekly_summaries(const std::vector<DailySummary>& daily_summaries) {
    std::map<utils::IsoWeek, std::vector<DailySummary>> groups;
    for (const auto& daily : daily_summaries) {
        groups[utils::iso_week(daily.date)].push_back(daily);
    }

    std::vector<WeeklySummary> weekly;
    weekly.reserve(groups.size());
    for (auto& [key, days] : groups) {
        weekly.push_back(build_weekly_summary(key.year, key.week, std::move(days)));
    }
    std::sort(weekly.begin(), weekly.end(),
              [](const WeeklySummary& a, const WeeklySummary& b) { return a.start_date < b.start_date; });
    return weekly;
}

} // namespace trade_rank
