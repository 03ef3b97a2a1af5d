#include "hourly_aggregator.hpp"

#include "grouping.hpp"
#include "position_matcher.hpp"

namespace trade_rank {

std::vector<TimeSlotPerformance> calculate_hourly_performance(const std::vector<TradeRecord>& trades) {
    std::vector<TimeSlotPerformance> slots;
    auto by_hour = group_by_hour(trades);
    slots.reserve(by_hour.size());

    for (auto& [hour, hour_trades] : by_hour) {
        TimeSlotPerformance slot;
        slot.hour = hour;
        slot.trades = static_cast<uint32_t>(hour_trades.size());
        uint32_t wins = 0;
        uint32_t losses = 0;
        Timestamp day = utils::day_start(hour_trades.front().time);

        for (auto& [symbol, symbol_trades] : group_by_symbol(hour_trades)) {
            // Diagnostics are reported by the daily pass; the hourly re-run stays quiet.
            auto match = match_positions(symbol, std::move(symbol_trades), day,
                                         CommissionMode::PER_ROUND_TRIP);
            for (const auto& pnl : match.realized) {
                slot.pnl += pnl;
                if (pnl.is_positive()) {
                    ++wins;
                } else if (pnl.is_negative()) {
                    ++losses;
                }
            }
        }

        slot.win_rate = win_rate_pct(wins, wins + losses);
        slots.push_back(std::move(slot));
    }
    return slots;
}

} // namespace trade_rank
