#include "report.hpp"

#include <algorithm>
#include <string>
#include <spdlog/fmt/fmt.h>

namespace trade_rank {

namespace {

const std::string kRule(60, '-');

std::string format_factor(const std::optional<Decimal>& pf) {
    return pf ? pf->to_string(2) : std::string("n/a");
}

void render_detailed_day(std::ostream& out, const DailySummary& d) {
    out << "\nDetailed report for " << utils::ts_to_date(d.date) << "\n\n";
    auto row = [&out](const char* label, const std::string& value) {
        out << fmt::format("  {:<20} {}\n", label, value);
    };
    row("Realized P&L", format_currency(d.realized_pnl));
    row("Gross P&L", format_currency(d.gross_pnl));
    row("Commission", format_currency(d.total_commission));
    row("Volume", format_currency(d.total_volume));
    row("Trades", fmt::format("{} ({}W / {}L)", d.total_trades, d.winning_trades, d.losing_trades));
    row("Win rate", fmt::format("{:.1f}%", d.win_rate));
    row("Avg win / loss", format_currency(d.avg_win) + " / " + format_currency(d.avg_loss));
    row("Largest win / loss", format_currency(d.largest_win) + " / " + format_currency(d.largest_loss));
    row("Profit factor", format_factor(d.profit_factor()));

    std::string symbols;
    for (const auto& s : d.symbols_traded) {
        if (!symbols.empty()) symbols += ", ";
        symbols += s;
    }
    row("Symbols", symbols.empty() ? "-" : symbols);

    if (d.time_slot_performance.empty()) return;
    out << "\n  Hourly breakdown\n";
    out << fmt::format("  {:<8} {:>8} {:>12} {:>8}\n", "Hour", "Trades", "P&L", "Win%");
    for (const auto& slot : d.time_slot_performance) {
        out << fmt::format("  {:02d}:00    {:>8} {:>12} {:>7.1f}%\n",
                           slot.hour, slot.trades, format_currency(slot.pnl), slot.win_rate);
    }
}

} // namespace

std::string format_currency(const Decimal& amount) {
    std::string digits = amount.abs().to_string(2);
    return (amount.is_negative() && digits != "0.00" ? "-$" : "$") + digits;
}

void render_summary(std::ostream& out, const TradingSummary& summary, size_t recent_days) {
    out << std::string(60, '=') << "\n"
        << fmt::format("{:^60}\n", "TradeRank Analytics") << std::string(60, '=') << "\n";

    const auto& days = summary.daily_summaries;
    if (days.empty()) {
        out << "\nNo trading days.\n";
        return;
    }

    size_t count = std::min(std::max<size_t>(recent_days, 1), days.size());
    size_t first = days.size() - count;
    out << "\nRecent trading days\n\n";
    out << fmt::format("{:<12} {:>8} {:>8} {:>20} {:>12}\n", "Date", "Trades", "Win%", "Best/Worst", "P&L");
    out << kRule << "\n";
    for (size_t i = first; i < days.size(); ++i) {
        const auto& d = days[i];
        out << fmt::format("{:<12} {:>8} {:>7.1f}% {:>9}/{:<10} {:>12}\n",
                           utils::ts_to_date(d.date), d.total_trades, d.win_rate,
                           d.largest_win.to_string(2), d.largest_loss.to_string(2),
                           format_currency(d.realized_pnl));
    }

    render_detailed_day(out, days.back());

    out << "\nOverall\n\n";
    out << fmt::format("  {:<20} {} to {}\n", "Period",
                       utils::ts_to_date(summary.start_date), utils::ts_to_date(summary.end_date));
    out << fmt::format("  {:<20} {}\n", "Total P&L", format_currency(summary.total_pnl));
    out << fmt::format("  {:<20} {}\n", "Total volume", format_currency(summary.total_volume));
    out << fmt::format("  {:<20} {}\n", "Total trades", summary.total_trades);
    out << fmt::format("  {:<20} {:.1f}%\n", "Win rate", summary.overall_win_rate);
    if (summary.best_day) {
        out << fmt::format("  {:<20} {} ({})\n", "Best day",
                           utils::ts_to_date(summary.best_day->date), format_currency(summary.best_day->pnl));
    }
    if (summary.worst_day) {
        out << fmt::format("  {:<20} {} ({})\n", "Worst day",
                           utils::ts_to_date(summary.worst_day->date), format_currency(summary.worst_day->pnl));
    }
    if (summary.most_profitable_hour) {
        out << fmt::format("  {:<20} {:02d}:00 ({})\n", "Best hour",
                           summary.most_profitable_hour->hour, format_currency(summary.most_profitable_hour->pnl));
    }
    if (summary.least_profitable_hour) {
        out << fmt::format("  {:<20} {:02d}:00 ({})\n", "Worst hour",
                           summary.least_profitable_hour->hour, format_currency(summary.least_profitable_hour->pnl));
    }
}

void render_weekly(std::ostream& out, const TradingSummary& summary) {
    if (summary.weekly_summaries.empty()) return;

    out << "\nWeekly performance\n\n";
    out << fmt::format("{:<10} {:<12} {:>5} {:>7} {:>8} {:>12} {:>12} {:>6}\n",
                       "Week", "Starting", "Days", "Trades", "Win%", "P&L", "Avg/day", "PF");
    out << std::string(78, '-') << "\n";
    for (const auto& w : summary.weekly_summaries) {
        out << fmt::format("{:<10} {:<12} {:>5} {:>7} {:>7.1f}% {:>12} {:>12} {:>6}\n",
                           fmt::format("{}-W{:02d}", w.year, w.week_number),
                           utils::ts_to_date(w.start_date), w.trading_days, w.total_trades,
                           w.win_rate, format_currency(w.realized_pnl),
                           format_currency(w.avg_daily_pnl), format_factor(w.profit_factor()));
    }
    if (summary.best_week) {
        out << fmt::format("\n  Best week:  {}-W{:02d} ({})\n", summary.best_week->year,
                           summary.best_week->week_number, format_currency(summary.best_week->pnl));
    }
    if (summary.worst_week) {
        out << fmt::format("  Worst week: {}-W{:02d} ({})\n", summary.worst_week->year,
                           summary.worst_week->week_number, format_currency(summary.worst_week->pnl));
    }
}

void render_periods(std::ostream& out, const std::vector<TradingPeriod>& periods, size_t top_n) {
    out << "\nBest trading periods\n\n";
    size_t n = std::min(top_n, periods.size());
    for (size_t i = 0; i < n; ++i) {
        const auto& p = periods[i];
        out << fmt::format("{}. {} ({:02d}:00-{:02d}:00): {} | {} trades | Win rate: {:.1f}%\n",
                           i + 1, p.name, p.start_hour, p.end_hour, format_currency(p.total_pnl),
                           p.total_trades, p.win_rate);
    }
}

} // namespace trade_rank
