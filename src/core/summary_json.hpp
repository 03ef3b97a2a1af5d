#pragma once

#include <nlohmann/json.hpp>
#include "decimal.hpp"
#include "trade.hpp"
#include "summary.hpp"

namespace trade_rank {

// Decimals are written as strings so they stay exact; numbers are accepted on read.
void to_json(nlohmann::json& j, const Decimal& d);
void from_json(const nlohmann::json& j, Decimal& d);

// Timestamps travel as ISO-8601 UTC strings.
void to_json(nlohmann::json& j, const TradeRecord& t);
void from_json(const nlohmann::json& j, TradeRecord& t);

void to_json(nlohmann::json& j, const TimeSlotPerformance& s);
void from_json(const nlohmann::json& j, TimeSlotPerformance& s);

void to_json(nlohmann::json& j, const DailySummary& s);
void from_json(const nlohmann::json& j, DailySummary& s);

void to_json(nlohmann::json& j, const WeeklySummary& s);
void from_json(const nlohmann::json& j, WeeklySummary& s);

void to_json(nlohmann::json& j, const TradingSummary& s);
void from_json(const nlohmann::json& j, TradingSummary& s);

void to_json(nlohmann::json& j, const TradingPeriod& p);

} // namespace trade_rank
