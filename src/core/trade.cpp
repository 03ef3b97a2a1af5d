#include "trade.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <tuple>
#include <unordered_set>

namespace trade_rank {

bool same_identity(const TradeRecord& a, const TradeRecord& b) {
    return a.symbol == b.symbol && a.side == b.side && a.quantity == b.quantity &&
           a.fill_price == b.fill_price && a.time == b.time;
}

bool fill_order_less(const TradeRecord& a, const TradeRecord& b) {
    return std::tie(a.time, a.symbol, a.side, a.quantity, a.fill_price) <
           std::tie(b.time, b.symbol, b.side, b.quantity, b.fill_price);
}

size_t TradeIdentityHash::operator()(const TradeRecord& t) const {
    size_t h = std::hash<std::string>{}(t.symbol);
    auto mix = [&h](size_t v) { h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2); };
    mix(static_cast<size_t>(t.side));
    mix(std::hash<Decimal>{}(t.quantity));
    mix(std::hash<Decimal>{}(t.fill_price));
    mix(std::hash<int64_t>{}(utils::ts_to_sec(t.time)));
    return h;
}

size_t deduplicate_trades(std::vector<TradeRecord>& trades) {
    std::unordered_set<TradeRecord, TradeIdentityHash, TradeIdentityEqual> seen;
    seen.reserve(trades.size());
    std::vector<TradeRecord> unique;
    unique.reserve(trades.size());
    for (auto& t : trades) {
        if (seen.insert(t).second) {
            unique.push_back(std::move(t));
        }
    }
    size_t removed = trades.size() - unique.size();
    trades = std::move(unique);
    return removed;
}

void validate_trade(const TradeRecord& trade) {
    if (trade.symbol.empty()) {
        throw std::invalid_argument("trade has empty symbol");
    }
    if (!trade.quantity.is_positive()) {
        throw std::invalid_argument("trade " + trade.symbol + " has non-positive quantity " +
                                    trade.quantity.to_string());
    }
    if (trade.fill_price.is_negative()) {
        throw std::invalid_argument("trade " + trade.symbol + " has negative fill price " +
                                    trade.fill_price.to_string());
    }
    if (trade.commission.is_negative()) {
        throw std::invalid_argument("trade " + trade.symbol + " has negative commission " +
                                    trade.commission.to_string());
    }
}

void validate_trades(const std::vector<TradeRecord>& trades) {
    for (const auto& t : trades) validate_trade(t);
}

std::optional<Side> side_from_string(const std::string& s) {
    std::string lower;
    lower.reserve(s.size());
    for (unsigned char c : s) {
        if (!std::isspace(c)) lower.push_back(static_cast<char>(std::tolower(c)));
    }
    if (lower == "buy" || lower == "long") return Side::BUY;
    if (lower == "sell" || lower == "short") return Side::SELL;
    return std::nullopt;
}

const char* side_to_string(Side side) {
    return side == Side::BUY ? "Buy" : "Sell";
}

} // namespace trade_rank
