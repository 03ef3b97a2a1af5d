#include "daily_aggregator.hpp"

#include <stdexcept>
#include "grouping.hpp"
#include "hourly_aggregator.hpp"
#include "position_matcher.hpp"

namespace trade_rank {

DailySummary calculate_daily_summary(const std::vector<TradeRecord>& trades, const DiagnosticSink& sink) {
    if (trades.empty()) {
        throw std::invalid_argument("daily summary requires at least one trade");
    }

    DailySummary summary;
    summary.date = utils::day_start(trades.front().time);
    for (const auto& t : trades) {
        if (utils::day_start(t.time) != summary.date) {
            throw std::invalid_argument("daily summary trades span more than one date");
        }
    }

    Decimal total_commission;
    Decimal total_volume;
    Decimal realized_sum;
    Decimal win_sum;
    Decimal loss_sum;

    for (auto& [symbol, symbol_trades] : group_by_symbol(trades)) {
        for (const auto& t : symbol_trades) {
            total_commission += t.commission;
            total_volume += t.notional();
        }

        auto match = match_positions(symbol, std::move(symbol_trades), summary.date,
                                     CommissionMode::AGGREGATE);
        if (sink) {
            for (const auto& d : match.diagnostics) sink(d);
        }
        if (match.unmatched) continue;

        summary.symbols_traded.push_back(symbol);
        for (const auto& pnl : match.realized) {
            if (pnl.is_positive()) {
                ++summary.winning_trades;
                win_sum += pnl;
                if (pnl > summary.largest_win) summary.largest_win = pnl;
            } else if (pnl.is_negative()) {
                ++summary.losing_trades;
                loss_sum += pnl;
                if (pnl < summary.largest_loss) summary.largest_loss = pnl;
            }
            realized_sum += pnl;
        }
    }

    // Commission comes off once, in aggregate, not per round trip.
    summary.total_commission = total_commission;
    summary.total_volume = total_volume;
    summary.realized_pnl = realized_sum - total_commission;
    summary.gross_pnl = summary.realized_pnl + total_commission;
    summary.total_trades = summary.winning_trades + summary.losing_trades;

    if (summary.winning_trades > 0) {
        summary.avg_win = win_sum / Decimal(static_cast<int64_t>(summary.winning_trades));
    }
    if (summary.losing_trades > 0) {
        summary.avg_loss = loss_sum / Decimal(static_cast<int64_t>(summary.losing_trades));
    }
    summary.win_rate = win_rate_pct(summary.winning_trades, summary.total_trades);
    summary.time_slot_performance = calculate_hourly_performance(trades);
    return summary;
}

} // namespace trade_rank
