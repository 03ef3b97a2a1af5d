#pragma once

#include <vector>
#include "summary.hpp"

namespace trade_rank {

/**
 * Fold Daily Summaries of one ISO week into a Weekly Summary.
 * Days are sorted by date first; avg_win/avg_loss are weighted by each day's counts.
 */
WeeklySummary build_weekly_summary(int iso_year, int week_number, std::vector<DailySummary> days);

/**
 * Group Daily Summaries by ISO week and fold each group. Ascending by week start.
 */
std::vector<WeeklySummary> calculate_weekly_summaries(const std::vector<DailySummary>& daily_summaries);

} // namespace trade_rank
