#pragma once

#include <string>
#include <vector>
#include "trade.hpp"
#include "summary.hpp"

namespace trade_rank {

/**
 * Named wall-clock window over UTC hours, start inclusive, end exclusive.
 */
struct PeriodDefinition {
    std::string name;
    int start_hour{0};
    int end_hour{0};
};

/**
 * Pre-Market 4-9, Market Open 9-10, Morning 10-12, Lunch 12-13,
 * Afternoon 13-15, Power Hour 15-16, After-Hours 16-20.
 */
const std::vector<PeriodDefinition>& default_trading_periods();

// Throws std::invalid_argument unless 0 <= start_hour < end_hour <= 24 and name is set.
void validate_period(const PeriodDefinition& period);

/**
 * Score each window from the trades' own net P&L (no position matching).
 * Sorted by total P&L descending; ties keep table order.
 */
std::vector<TradingPeriod> identify_best_trading_periods(const std::vector<TradeRecord>& trades);
std::vector<TradingPeriod> identify_best_trading_periods(const std::vector<TradeRecord>& trades,
                                                         const std::vector<PeriodDefinition>& periods);

} // namespace trade_rank
