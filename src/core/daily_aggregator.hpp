#pragma once

#include <vector>
#include "trade.hpp"
#include "summary.hpp"
#include "diagnostics.hpp"

namespace trade_rank {

/**
 * Build the Daily Summary for one UTC calendar day.
 *
 * All trades must fall on the same UTC date; throws std::invalid_argument when
 * the list is empty or spans several dates. Every symbol is matched on its own
 * with aggregate commission: realized_pnl is the sum of realized round trips
 * minus the commission of every fill that day, singleton fills included.
 * Diagnostics are delivered to sink in symbol order.
 */
DailySummary calculate_daily_summary(const std::vector<TradeRecord>& trades,
                                     const DiagnosticSink& sink = log_diagnostic);

} // namespace trade_rank
