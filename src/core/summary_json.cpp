#include "summary_json.hpp"

#include <stdexcept>

namespace trade_rank {

using json = nlohmann::json;

namespace {

Timestamp read_ts(const json& j, const char* key) {
    auto ts = utils::parse_iso_ts(j.at(key).get<std::string>());
    if (!ts) {
        throw std::runtime_error(std::string("invalid timestamp in field '") + key + "'");
    }
    return *ts;
}

json day_result_json(const std::optional<DayResult>& r) {
    if (!r) return nullptr;
    return {{"date", utils::ts_to_iso(r->date)}, {"pnl", r->pnl}};
}

std::optional<DayResult> read_day_result(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    const auto& v = j.at(key);
    return DayResult{read_ts(v, "date"), v.at("pnl").get<Decimal>()};
}

json week_result_json(const std::optional<WeekResult>& r) {
    if (!r) return nullptr;
    return {{"year", r->year}, {"week_number", r->week_number}, {"pnl", r->pnl}};
}

std::optional<WeekResult> read_week_result(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    const auto& v = j.at(key);
    return WeekResult{v.at("year").get<int>(), v.at("week_number").get<int>(), v.at("pnl").get<Decimal>()};
}

json hour_result_json(const std::optional<HourResult>& r) {
    if (!r) return nullptr;
    return {{"hour", r->hour}, {"pnl", r->pnl}};
}

std::optional<HourResult> read_hour_result(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    const auto& v = j.at(key);
    return HourResult{v.at("hour").get<int>(), v.at("pnl").get<Decimal>()};
}

} // namespace

void to_json(json& j, const Decimal& d) {
    j = d.to_string();
}

void from_json(const json& j, Decimal& d) {
    std::string text = j.is_string() ? j.get<std::string>() : j.dump();
    auto parsed = Decimal::parse(text);
    if (!parsed) {
        throw std::runtime_error("invalid decimal: " + text);
    }
    d = *parsed;
}

void to_json(json& j, const TradeRecord& t) {
    j = {
        {"symbol", t.symbol},
        {"side", side_to_string(t.side)},
        {"quantity", t.quantity},
        {"fill_price", t.fill_price},
        {"time", utils::ts_to_iso(t.time)},
        {"net_amount", t.net_amount},
        {"commission", t.commission}
    };
}

void from_json(const json& j, TradeRecord& t) {
    t.symbol = j.at("symbol").get<std::string>();
    auto side = side_from_string(j.at("side").get<std::string>());
    if (!side) {
        throw std::runtime_error("invalid side for " + t.symbol);
    }
    t.side = *side;
    t.quantity = j.at("quantity").get<Decimal>();
    t.fill_price = j.at("fill_price").get<Decimal>();
    t.time = read_ts(j, "time");
    t.net_amount = j.at("net_amount").get<Decimal>();
    t.commission = j.value("commission", Decimal{});
}

void to_json(json& j, const TimeSlotPerformance& s) {
    j = {{"hour", s.hour}, {"trades", s.trades}, {"pnl", s.pnl}, {"win_rate", s.win_rate}};
}

void from_json(const json& j, TimeSlotPerformance& s) {
    s.hour = j.at("hour").get<int>();
    s.trades = j.at("trades").get<uint32_t>();
    s.pnl = j.at("pnl").get<Decimal>();
    s.win_rate = j.value("win_rate", 0.0);
}

void to_json(json& j, const DailySummary& s) {
    j = {
        {"date", utils::ts_to_iso(s.date)},
        {"total_trades", s.total_trades},
        {"winning_trades", s.winning_trades},
        {"losing_trades", s.losing_trades},
        {"realized_pnl", s.realized_pnl},
        {"gross_pnl", s.gross_pnl},
        {"total_commission", s.total_commission},
        {"total_volume", s.total_volume},
        {"win_rate", s.win_rate},
        {"avg_win", s.avg_win},
        {"avg_loss", s.avg_loss},
        {"largest_win", s.largest_win},
        {"largest_loss", s.largest_loss},
        {"symbols_traded", s.symbols_traded},
        {"time_slot_performance", s.time_slot_performance}
    };
}

void from_json(const json& j, DailySummary& s) {
    s.date = read_ts(j, "date");
    s.total_trades = j.at("total_trades").get<uint32_t>();
    s.winning_trades = j.at("winning_trades").get<uint32_t>();
    s.losing_trades = j.at("losing_trades").get<uint32_t>();
    s.realized_pnl = j.at("realized_pnl").get<Decimal>();
    s.gross_pnl = j.at("gross_pnl").get<Decimal>();
    s.total_commission = j.at("total_commission").get<Decimal>();
    s.total_volume = j.value("total_volume", Decimal{});
    s.win_rate = j.value("win_rate", 0.0);
    s.avg_win = j.value("avg_win", Decimal{});
    s.avg_loss = j.value("avg_loss", Decimal{});
    s.largest_win = j.value("largest_win", Decimal{});
    s.largest_loss = j.value("largest_loss", Decimal{});
    s.symbols_traded = j.value("symbols_traded", std::vector<std::string>{});
    s.time_slot_performance = j.value("time_slot_performance", std::vector<TimeSlotPerformance>{});
}

void to_json(json& j, const WeeklySummary& s) {
    j = {
        {"week_number", s.week_number},
        {"year", s.year},
        {"start_date", utils::ts_to_iso(s.start_date)},
        {"end_date", utils::ts_to_iso(s.end_date)},
        {"total_trades", s.total_trades},
        {"winning_trades", s.winning_trades},
        {"losing_trades", s.losing_trades},
        {"realized_pnl", s.realized_pnl},
        {"gross_pnl", s.gross_pnl},
        {"total_commission", s.total_commission},
        {"total_volume", s.total_volume},
        {"win_rate", s.win_rate},
        {"avg_win", s.avg_win},
        {"avg_loss", s.avg_loss},
        {"largest_win", s.largest_win},
        {"largest_loss", s.largest_loss},
        {"best_day", day_result_json(s.best_day)},
        {"worst_day", day_result_json(s.worst_day)},
        {"trading_days", s.trading_days},
        {"profitable_days", s.profitable_days},
        {"avg_daily_pnl", s.avg_daily_pnl},
        {"symbols_traded", s.symbols_traded},
        {"daily_summaries", s.daily_summaries}
    };
}

void from_json(const json& j, WeeklySummary& s) {
    s.week_number = j.at("week_number").get<int>();
    s.year = j.at("year").get<int>();
    s.start_date = read_ts(j, "start_date");
    s.end_date = read_ts(j, "end_date");
    s.total_trades = j.at("total_trades").get<uint32_t>();
    s.winning_trades = j.at("winning_trades").get<uint32_t>();
    s.losing_trades = j.at("losing_trades").get<uint32_t>();
    s.realized_pnl = j.at("realized_pnl").get<Decimal>();
    s.gross_pnl = j.at("gross_pnl").get<Decimal>();
    s.total_commission = j.at("total_commission").get<Decimal>();
    s.total_volume = j.value("total_volume", Decimal{});
    s.win_rate = j.value("win_rate", 0.0);
    s.avg_win = j.value("avg_win", Decimal{});
    s.avg_loss = j.value("avg_loss", Decimal{});
    s.largest_win = j.value("largest_win", Decimal{});
    s.largest_loss = j.value("largest_loss", Decimal{});
    s.best_day = read_day_result(j, "best_day");
    s.worst_day = read_day_result(j, "worst_day");
    s.trading_days = j.value("trading_days", 0u);
    s.profitable_days = j.value("profitable_days", 0u);
    s.avg_daily_pnl = j.value("avg_daily_pnl", Decimal{});
    s.symbols_traded = j.value("symbols_traded", std::vector<std::string>{});
    s.daily_summaries = j.value("daily_summaries", std::vector<DailySummary>{});
}

void to_json(json& j, const TradingSummary& s) {
    j = {
        {"start_date", utils::ts_to_iso(s.start_date)},
        {"end_date", utils::ts_to_iso(s.end_date)},
        {"daily_summaries", s.daily_summaries},
        {"weekly_summaries", s.weekly_summaries},
        {"total_pnl", s.total_pnl},
        {"total_volume", s.total_volume},
        {"total_trades", s.total_trades},
        {"overall_win_rate", s.overall_win_rate},
        {"best_day", day_result_json(s.best_day)},
        {"worst_day", day_result_json(s.worst_day)},
        {"best_week", week_result_json(s.best_week)},
        {"worst_week", week_result_json(s.worst_week)},
        {"most_profitable_hour", hour_result_json(s.most_profitable_hour)},
        {"least_profitable_hour", hour_result_json(s.least_profitable_hour)}
    };
}

void from_json(const json& j, TradingSummary& s) {
    s.start_date = read_ts(j, "start_date");
    s.end_date = read_ts(j, "end_date");
    s.daily_summaries = j.value("daily_summaries", std::vector<DailySummary>{});
    s.weekly_summaries = j.value("weekly_summaries", std::vector<WeeklySummary>{});
    s.total_pnl = j.at("total_pnl").get<Decimal>();
    s.total_volume = j.value("total_volume", Decimal{});
    s.total_trades = j.at("total_trades").get<uint32_t>();
    s.overall_win_rate = j.value("overall_win_rate", 0.0);
    s.best_day = read_day_result(j, "best_day");
    s.worst_day = read_day_result(j, "worst_day");
    s.best_week = read_week_result(j, "best_week");
    s.worst_week = read_week_result(j, "worst_week");
    s.most_profitable_hour = read_hour_result(j, "most_profitable_hour");
    s.least_profitable_hour = read_hour_result(j, "least_profitable_hour");
}

void to_json(json& j, const TradingPeriod& p) {
    j = {
        {"name", p.name},
        {"start_hour", p.start_hour},
        {"end_hour", p.end_hour},
        {"total_trades", p.total_trades},
        {"total_pnl", p.total_pnl},
        {"win_rate", p.win_rate},
        {"avg_pnl_per_trade", p.avg_pnl_per_trade}
    };
}

} // namespace trade_rank
