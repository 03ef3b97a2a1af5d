#include "diagnostics.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace trade_rank {

const char* diagnostic_kind_to_string(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::UNMATCHED_TRADE: return "unmatched";
        case DiagnosticKind::OVERSELLING: return "overselling";
        case DiagnosticKind::UNCLOSED_POSITION: return "unclosed";
    }
    return "unknown";
}

std::string describe(const Diagnostic& d) {
    std::string head = fmt::format("[{}] {} {}", diagnostic_kind_to_string(d.kind),
                                   utils::ts_to_date(d.scope_date), d.symbol);
    switch (d.kind) {
        case DiagnosticKind::UNMATCHED_TRADE:
            return fmt::format("{}: unmatched trade {} {} shares at ${}",
                               head, side_to_string(d.side),
                               d.quantity.to_string(), d.price.to_string());
        case DiagnosticKind::OVERSELLING:
            return fmt::format("{}: selling {} more shares than owned (had {} shares)",
                               head, d.quantity.to_string(), d.position.to_string());
        case DiagnosticKind::UNCLOSED_POSITION:
            return fmt::format("{}: unclosed {} position of {} shares",
                               head, d.position.is_negative() ? "short" : "long",
                               d.quantity.to_string());
    }
    return head;
}

void log_diagnostic(const Diagnostic& d) {
    spdlog::warn("{}", describe(d));
}

} // namespace trade_rank
