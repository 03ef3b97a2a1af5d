#include "summary.hpp"

namespace trade_rank {

std::optional<Decimal> profit_factor(const Decimal& avg_win, uint32_t winning,
                                     const Decimal& avg_loss, uint32_t losing) {
    if (avg_loss.is_zero() || losing == 0) return std::nullopt;
    Decimal total_wins = avg_win * Decimal(static_cast<int64_t>(winning));
    Decimal total_losses = avg_loss.abs() * Decimal(static_cast<int64_t>(losing));
    if (total_losses.is_zero()) return std::nullopt;
    return total_wins / total_losses;
}

std::optional<Decimal> DailySummary::profit_factor() const {
    return trade_rank::profit_factor(avg_win, winning_trades, avg_loss, losing_trades);
}

std::optional<Decimal> WeeklySummary::profit_factor() const {
    return trade_rank::profit_factor(avg_win, winning_trades, avg_loss, losing_trades);
}

} // namespace trade_rank
