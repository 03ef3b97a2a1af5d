#include "period_analyzer.hpp"

#include <algorithm>
#include <stdexcept>

namespace trade_rank {

namespace {

TradingPeriod score_period(const PeriodDefinition& def, const std::vector<TradeRecord>& trades) {
    TradingPeriod period;
    period.name = def.name;
    period.start_hour = def.start_hour;
    period.end_hour = def.end_hour;

    uint32_t wins = 0;
    uint32_t losses = 0;
    for (const auto& t : trades) {
        int hour = t.hour_of_day();
        if (hour < def.start_hour || hour >= def.end_hour) continue;

        ++period.total_trades;
        Decimal pnl = t.net_pnl();
        period.total_pnl += pnl;
        if (pnl.is_positive()) {
            ++wins;
        } else if (pnl.is_negative()) {
            ++losses;
        }
    }

    if (period.total_trades > 0) {
        period.avg_pnl_per_trade = period.total_pnl / Decimal(static_cast<int64_t>(period.total_trades));
        period.win_rate = win_rate_pct(wins, wins + losses);
    }
    return period;
}

} // namespace

const std::vector<PeriodDefinition>& default_trading_periods() {
    static const std::vector<PeriodDefinition> periods{
        {"Pre-Market", 4, 9},
        {"Market Open", 9, 10},
        {"Morning", 10, 12},
        {"Lunch", 12, 13},
        {"Afternoon", 13, 15},
        {"Power Hour", 15, 16},
        {"After-Hours", 16, 20},
    };
    return periods;
}

void validate_period(const PeriodDefinition& period) {
    if (period.name.empty()) {
        throw std::invalid_argument("trading period has empty name");
    }
    if (period.start_hour < 0 || period.end_hour > 24 || period.start_hour >= period.end_hour) {
        throw std::invalid_argument("trading period '" + period.name + "' has invalid hour range " +
                                    std::to_string(period.start_hour) + "-" +
                                    std::to_string(period.end_hour));
    }
}

std::vector<TradingPeriod> identify_best_trading_periods(const std::vector<TradeRecord>& trades) {
    return identify_best_trading_periods(trades, default_trading_periods());
}

std::vector<TradingPeriod> identify_best_trading_periods(const std::vector<TradeRecord>& trades,
                                                         const std::vector<PeriodDefinition>& periods) {
    validate_trades(trades);
    for (const auto& def : periods) validate_period(def);

    std::vector<TradingPeriod> out;
    out.reserve(periods.size());
    for (const auto& def : periods) {
        out.push_back(score_period(def, trades));
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const TradingPeriod& a, const TradingPeriod& b) { return a.total_pnl > b.total_pnl; });
    return out;
}

} // namespace trade_rank
