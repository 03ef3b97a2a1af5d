#pragma once

#include <ostream>
#include <vector>
#include "summary.hpp"

namespace trade_rank {

/**
 * Plain-text report: recent days table, detailed last day with its hourly
 * breakdown, and overall statistics.
 */
void render_summary(std::ostream& out, const TradingSummary& summary, size_t recent_days);

/**
 * One row per ISO week plus best/worst week.
 */
void render_weekly(std::ostream& out, const TradingSummary& summary);

/**
 * Top-N trading periods, best first.
 */
void render_periods(std::ostream& out, const std::vector<TradingPeriod>& periods, size_t top_n);

std::string format_currency(const Decimal& amount);

} // namespace trade_rank
