#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include "decimal.hpp"
#include "utils.hpp"

namespace trade_rank {

enum class Side { BUY, SELL };

/**
 * One executed fill as exported by the broker.
 *
 * net_amount is the cash amount reported for the fill; its P&L sign follows
 * the side (a buy spends it, a sell receives it).
 */
struct TradeRecord {
    std::string symbol;
    Side side{Side::BUY};
    Decimal quantity;
    Decimal fill_price;
    Timestamp time;
    Decimal net_amount;
    Decimal commission;

    Decimal gross_pnl() const { return side == Side::BUY ? -net_amount : net_amount; }
    Decimal net_pnl() const { return gross_pnl() - commission; }
    Decimal notional() const { return quantity * fill_price; }
    int hour_of_day() const { return utils::hour_of_day(time); }
};

/**
 * Identity used for de-duplication: net amount and commission are not part of it.
 */
bool same_identity(const TradeRecord& a, const TradeRecord& b);

/**
 * Strict weak order on (time, symbol, side, quantity, fill_price). Gives fills with the
 * same timestamp a fixed processing order regardless of input order.
 */
bool fill_order_less(const TradeRecord& a, const TradeRecord& b);

struct TradeIdentityHash {
    size_t operator()(const TradeRecord& t) const;
};

struct TradeIdentityEqual {
    bool operator()(const TradeRecord& a, const TradeRecord& b) const { return same_identity(a, b); }
};

/**
 * Drop records whose identity was already seen; first occurrence wins and input order is kept.
 * Returns the number of duplicates removed.
 */
size_t deduplicate_trades(std::vector<TradeRecord>& trades);

/**
 * Precondition check for records handed to the analytics entry points.
 * Throws std::invalid_argument on an empty symbol, non-positive quantity,
 * negative fill price or negative commission.
 */
void validate_trade(const TradeRecord& trade);
void validate_trades(const std::vector<TradeRecord>& trades);

std::optional<Side> side_from_string(const std::string& s);
const char* side_to_string(Side side);

} // namespace trade_rank
