#pragma once

#include <string>
#include <vector>
#include <functional>
#include "decimal.hpp"
#include "trade.hpp"

namespace trade_rank {

enum class DiagnosticKind {
    UNMATCHED_TRADE,    // single fill for a symbol in its scope; no matching attempted
    OVERSELLING,        // sell exceeded the long position; the excess was dropped
    UNCLOSED_POSITION   // non-zero residual position at the end of the scope
};

/**
 * Non-fatal condition found while matching fills. Fields not relevant to a kind stay zero.
 */
struct Diagnostic {
    DiagnosticKind kind{DiagnosticKind::UNMATCHED_TRADE};
    std::string symbol;
    Timestamp scope_date;
    Side side{Side::BUY};
    Decimal quantity;   // unmatched fill size, dropped excess, or |residual|
    Decimal price;      // fill price of the offending fill (unmatched/overselling)
    Decimal position;   // signed position held when the condition was detected
};

using DiagnosticSink = std::function<void(const Diagnostic&)>;

const char* diagnostic_kind_to_string(DiagnosticKind kind);
std::string describe(const Diagnostic& d);

/**
 * Default sink: one spdlog warning per diagnostic.
 */
void log_diagnostic(const Diagnostic& d);

/**
 * Sink that appends to a vector; the vector must outlive the sink.
 */
inline DiagnosticSink collect_into(std::vector<Diagnostic>& out) {
    return [&out](const Diagnostic& d) { out.push_back(d); };
}

} // namespace trade_rank
