#pragma once

#include <map>
#include <string>
#include <vector>
#include "trade.hpp"

namespace trade_rank {

/**
 * Partition records by key. The result is an ordered local map, so iteration
 * order depends only on the keys and never on input order or hashing.
 */
template <typename Key, typename KeyFn>
std::map<Key, std::vector<TradeRecord>> group_by(const std::vector<TradeRecord>& trades, KeyFn key_fn) {
    std::map<Key, std::vector<TradeRecord>> groups;
    for (const auto& t : trades) {
        groups[key_fn(t)].push_back(t);
    }
    return groups;
}

inline std::map<Timestamp, std::vector<TradeRecord>> group_by_date(const std::vector<TradeRecord>& trades) {
    return group_by<Timestamp>(trades, [](const TradeRecord& t) { return utils::day_start(t.time); });
}

inline std::map<std::string, std::vector<TradeRecord>> group_by_symbol(const std::vector<TradeRecord>& trades) {
    return group_by<std::string>(trades, [](const TradeRecord& t) { return t.symbol; });
}

inline std::map<int, std::vector<TradeRecord>> group_by_hour(const std::vector<TradeRecord>& trades) {
    return group_by<int>(trades, [](const TradeRecord& t) { return t.hour_of_day(); });
}

} // namespace trade_rank
