#pragma once

#include <string>
#include <vector>
#include "decimal.hpp"
#include "trade.hpp"
#include "diagnostics.hpp"

namespace trade_rank {

/**
 * How commission enters realized amounts.
 * AGGREGATE: realized amounts are pure price differences; the caller subtracts
 *            the scope's total commission once.
 * PER_ROUND_TRIP: each realized amount has the closing fill's commission subtracted.
 */
enum class CommissionMode { AGGREGATE, PER_ROUND_TRIP };

struct OpenPosition {
    Decimal qty;        // positive = long, negative = short
    Decimal avg_price;

    bool is_flat() const { return qty.is_zero(); }
    bool is_long() const { return qty.is_positive(); }
    bool is_short() const { return qty.is_negative(); }
};

struct MatchResult {
    std::string symbol;
    std::vector<Decimal> realized;   // one per closed round-trip portion, in fill order
    OpenPosition open;               // residual after the last fill
    bool unmatched{false};           // fewer than two fills; nothing was matched
    Decimal oversold_qty;            // total sell quantity dropped for overselling
    std::vector<Diagnostic> diagnostics;
};

/**
 * Average-price position tracker for one symbol within one scope.
 *
 * Buys cover shorts first and open a long with any excess. Sells close longs;
 * a sell larger than the long drops the excess instead of opening a short.
 * Sells while flat or short open/extend a short.
 */
class PositionMatcher {
public:
    PositionMatcher(std::string symbol, Timestamp scope_date, CommissionMode mode = CommissionMode::AGGREGATE);

    // Apply one fill; fills must arrive in time order.
    void apply_fill(const TradeRecord& fill);

    const OpenPosition& position() const { return pos_; }
    const std::vector<Decimal>& realized() const { return result_.realized; }

    // Flags an unclosed residual and hands back the accumulated result.
    MatchResult finish();

private:
    void apply_buy(const TradeRecord& fill);
    void apply_sell(const TradeRecord& fill);
    void realize(const Decimal& price_diff, const Decimal& qty, const TradeRecord& fill);

    Timestamp scope_date_;
    CommissionMode mode_;
    OpenPosition pos_;
    MatchResult result_;
};

/**
 * Match all fills of one symbol in one scope. Fills are ordered with fill_order_less
 * before matching; a scope with fewer than two fills is reported unmatched.
 */
MatchResult match_positions(const std::string& symbol,
                            std::vector<TradeRecord> fills,
                            Timestamp scope_date,
                            CommissionMode mode = CommissionMode::AGGREGATE);

} // namespace trade_rank
