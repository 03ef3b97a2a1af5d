#include "position_matcher.hpp"

#include <algorithm>

namespace trade_rank {

PositionMatcher::PositionMatcher(std::string symbol, Timestamp scope_date, CommissionMode mode)
    : scope_date_(scope_date), mode_(mode) {
    result_.symbol = std::move(symbol);
}

void PositionMatcher::apply_fill(const TradeRecord& fill) {
    if (fill.side == Side::BUY) {
        apply_buy(fill);
    } else {
        apply_sell(fill);
    }
}

void PositionMatcher::realize(const Decimal& price_diff, const Decimal& qty, const TradeRecord& fill) {
    Decimal pnl = price_diff * qty;
    if (mode_ == CommissionMode::PER_ROUND_TRIP) {
        pnl -= fill.commission;
    }
    result_.realized.push_back(pnl);
}

void PositionMatcher::apply_buy(const TradeRecord& fill) {
    if (pos_.is_short()) {
        // Covering a short
        Decimal qty_to_close = min(fill.quantity, -pos_.qty);
        realize(pos_.avg_price - fill.fill_price, qty_to_close, fill);
        pos_.qty += qty_to_close;

        Decimal remaining = fill.quantity - qty_to_close;
        if (remaining.is_positive()) {
            // Crossed through flat; the excess opens a long
            pos_.qty = remaining;
            pos_.avg_price = fill.fill_price;
        } else if (pos_.is_flat()) {
            pos_.avg_price = Decimal{};
        }
    } else if (pos_.is_flat()) {
        pos_.qty = fill.quantity;
        pos_.avg_price = fill.fill_price;
    } else {
        Decimal total_cost = pos_.avg_price * pos_.qty + fill.fill_price * fill.quantity;
        pos_.qty += fill.quantity;
        pos_.avg_price = total_cost / pos_.qty;
    }
}

void PositionMatcher::apply_sell(const TradeRecord& fill) {
    if (pos_.is_long()) {
        Decimal held = pos_.qty;
        Decimal qty_to_close = min(fill.quantity, held);
        realize(fill.fill_price - pos_.avg_price, qty_to_close, fill);
        pos_.qty -= qty_to_close;

        Decimal excess = fill.quantity - qty_to_close;
        if (excess.is_positive()) {
            // Never open a short from an oversell
            result_.oversold_qty += excess;
            Diagnostic d;
            d.kind = DiagnosticKind::OVERSELLING;
            d.symbol = result_.symbol;
            d.scope_date = scope_date_;
            d.side = Side::SELL;
            d.quantity = excess;
            d.price = fill.fill_price;
            d.position = held;
            result_.diagnostics.push_back(std::move(d));
        }
        if (pos_.is_flat()) {
            pos_.avg_price = Decimal{};
        }
    } else if (pos_.is_flat()) {
        pos_.qty = -fill.quantity;
        pos_.avg_price = fill.fill_price;
    } else {
        Decimal short_qty = -pos_.qty;
        Decimal total_value = pos_.avg_price * short_qty + fill.fill_price * fill.quantity;
        pos_.qty -= fill.quantity;
        pos_.avg_price = total_value / -pos_.qty;
    }
}

MatchResult PositionMatcher::finish() {
    if (!pos_.is_flat()) {
        Diagnostic d;
        d.kind = DiagnosticKind::UNCLOSED_POSITION;
        d.symbol = result_.symbol;
        d.scope_date = scope_date_;
        d.side = pos_.is_long() ? Side::BUY : Side::SELL;
        d.quantity = pos_.qty.abs();
        d.price = pos_.avg_price;
        d.position = pos_.qty;
        result_.diagnostics.push_back(std::move(d));
    }
    result_.open = pos_;
    MatchResult out = std::move(result_);
    result_ = MatchResult{};
    result_.symbol = out.symbol;
    pos_ = OpenPosition{};
    return out;
}

MatchResult match_positions(const std::string& symbol,
                            std::vector<TradeRecord> fills,
                            Timestamp scope_date,
                            CommissionMode mode) {
    if (fills.size() < 2) {
        MatchResult result;
        result.symbol = symbol;
        result.unmatched = true;
        if (!fills.empty()) {
            const auto& f = fills.front();
            Diagnostic d;
            d.kind = DiagnosticKind::UNMATCHED_TRADE;
            d.symbol = symbol;
            d.scope_date = scope_date;
            d.side = f.side;
            d.quantity = f.quantity;
            d.price = f.fill_price;
            result.diagnostics.push_back(std::move(d));
        }
        return result;
    }

    std::sort(fills.begin(), fills.end(), fill_order_less);
    PositionMatcher matcher(symbol, scope_date, mode);
    for (const auto& f : fills) {
        matcher.apply_fill(f);
    }
    return matcher.finish();
}

} // namespace trade_rank
