#pragma once

#include <vector>
#include "trade.hpp"
#include "summary.hpp"

namespace trade_rank {

/**
 * Per-hour performance of one day's fills.
 *
 * Each (UTC hour, symbol) bucket is matched on its own with per-round-trip
 * commission, so a round trip spanning two hours realizes nothing in either.
 * trades counts every fill in the hour. Inactive hours are omitted; output is
 * ascending by hour.
 */
std::vector<TimeSlotPerformance> calculate_hourly_performance(const std::vector<TradeRecord>& trades);

} // namespace trade_rank
