#include "trading_analytics.hpp"

#include <algorithm>
#include <exception>
#include <map>
#include <thread>
#include <spdlog/spdlog.h>
#include "daily_aggregator.hpp"
#include "grouping.hpp"
#include "weekly_aggregator.hpp"

namespace trade_rank {

namespace {

struct DayWork {
    Timestamp date;
    std::vector<TradeRecord> trades;
    DailySummary summary;
    std::vector<Diagnostic> diagnostics;
};

void run_days(std::vector<DayWork>& work, size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) {
        auto& day = work[i];
        day.summary = calculate_daily_summary(day.trades, collect_into(day.diagnostics));
    }
}

void compute_daily(std::vector<DayWork>& work, size_t worker_threads) {
    size_t workers = std::min(std::max<size_t>(worker_threads, 1), work.size());
    if (workers <= 1) {
        run_days(work, 0, work.size());
        return;
    }

    spdlog::debug("Computing {} daily summaries on {} worker threads", work.size(), workers);
    std::vector<std::thread> threads;
    std::vector<std::exception_ptr> errors(workers);
    size_t chunk = (work.size() + workers - 1) / workers;
    for (size_t w = 0; w < workers; ++w) {
        size_t begin = w * chunk;
        size_t end = std::min(begin + chunk, work.size());
        threads.emplace_back([&work, &errors, w, begin, end]() {
            try {
                run_days(work, begin, end);
            } catch (...) {
                errors[w] = std::current_exception();
            }
        });
    }
    for (auto& t : threads) t.join();
    for (auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }
}

void find_hour_extremes(const std::vector<DailySummary>& daily, TradingSummary& summary) {
    std::map<int, Decimal> hourly_totals;
    for (const auto& d : daily) {
        for (const auto& slot : d.time_slot_performance) {
            hourly_totals[slot.hour] += slot.pnl;
        }
    }
    for (const auto& [hour, pnl] : hourly_totals) {
        if (!summary.most_profitable_hour || pnl > summary.most_profitable_hour->pnl) {
            summary.most_profitable_hour = HourResult{hour, pnl};
        }
        if (!summary.least_profitable_hour || pnl < summary.least_profitable_hour->pnl) {
            summary.least_profitable_hour = HourResult{hour, pnl};
        }
    }
}

} // namespace

TradingSummary analyze_trades(const std::vector<TradeRecord>& trades, const AnalysisOptions& options) {
    validate_trades(trades);

    std::vector<DayWork> work;
    for (auto& [date, day_trades] : group_by_date(trades)) {
        DayWork day;
        day.date = date;
        day.trades = std::move(day_trades);
        work.push_back(std::move(day));
    }

    compute_daily(work, options.worker_threads);

    TradingSummary summary;
    summary.daily_summaries.reserve(work.size());
    for (auto& day : work) {
        if (options.sink) {
            for (const auto& d : day.diagnostics) options.sink(d);
        }
        summary.daily_summaries.push_back(std::move(day.summary));
    }
    std::sort(summary.daily_summaries.begin(), summary.daily_summaries.end(),
              [](const DailySummary& a, const DailySummary& b) { return a.date < b.date; });

    const auto& daily = summary.daily_summaries;
    uint32_t total_wins = 0;
    for (const auto& d : daily) {
        summary.total_pnl += d.realized_pnl;
        summary.total_volume += d.total_volume;
        summary.total_trades += d.total_trades;
        total_wins += d.winning_trades;

        if (!summary.best_day || d.realized_pnl > summary.best_day->pnl) {
            summary.best_day = DayResult{d.date, d.realized_pnl};
        }
        if (!summary.worst_day || d.realized_pnl < summary.worst_day->pnl) {
            summary.worst_day = DayResult{d.date, d.realized_pnl};
        }
    }
    summary.overall_win_rate = win_rate_pct(total_wins, summary.total_trades);

    if (daily.empty()) {
        summary.start_date = summary.end_date = std::chrono::system_clock::now();
    } else {
        summary.start_date = daily.front().date;
        summary.end_date = daily.back().date;
    }

    find_hour_extremes(daily, summary);

    summary.weekly_summaries = calculate_weekly_summaries(daily);
    for (const auto& w : summary.weekly_summaries) {
        if (!summary.best_week || w.realized_pnl > summary.best_week->pnl) {
            summary.best_week = WeekResult{w.year, w.week_number, w.realized_pnl};
        }
        if (!summary.worst_week || w.realized_pnl < summary.worst_week->pnl) {
            summary.worst_week = WeekResult{w.year, w.week_number, w.realized_pnl};
        }
    }

    spdlog::debug("Analyzed {} trades over {} days / {} weeks, total P&L {}",
                  trades.size(), daily.size(), summary.weekly_summaries.size(),
                  summary.total_pnl.to_string());
    return summary;
}

} // namespace trade_rank
