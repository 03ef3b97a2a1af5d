#pragma once

#include <cstddef>
#include <vector>
#include "trade.hpp"
#include "summary.hpp"
#include "diagnostics.hpp"

namespace trade_rank {

struct AnalysisOptions {
    // Dates are split into disjoint partitions, one per worker. 0 or 1 runs inline.
    size_t worker_threads{1};
    // Receives matching diagnostics in date order, then symbol order.
    DiagnosticSink sink{log_diagnostic};
};

/**
 * Full-period analysis: one Daily Summary per UTC date, weekly rollups, totals and
 * extrema. Ties on best/worst resolve to the earliest date, earliest week and lowest hour.
 * An empty input yields empty lists with start/end set to now.
 * Throws std::invalid_argument when a trade fails validate_trade.
 */
TradingSummary analyze_trades(const std::vector<TradeRecord>& trades,
                              const AnalysisOptions& options = AnalysisOptions{});

} // namespace trade_rank
