#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "period_analyzer.hpp"

namespace trade_rank {

using json = nlohmann::json;

struct DataConfig {
    std::string source_dir{"Data/Source"};   // broker CSV exports
    std::string data_dir{"Data"};            // processed_data.json and Summaries/
};

struct AnalysisConfig {
    size_t worker_threads{1};
    size_t recent_days{10};     // days shown in the report table
    size_t top_periods{3};      // trading periods shown in the ranking
};

struct LoggingConfig {
    std::string level{"info"};
    std::string file{};         // empty = console only
};

struct Config {
    DataConfig data;
    AnalysisConfig analysis;
    LoggingConfig logging;
    std::vector<PeriodDefinition> trading_periods{default_trading_periods()};
};

/**
 * Load settings from a JSON file (comments allowed). Missing keys keep their
 * defaults; a missing file logs a warning and leaves cfg untouched. Throws
 * nlohmann::json::exception on malformed JSON and std::invalid_argument on an
 * invalid trading period.
 */
inline void load_config(Config& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file {} not found, using defaults", path);
        return;
    }
    json j = json::parse(f, nullptr, true, true);
    if (j.contains("data")) {
        auto& d = j["data"];
        cfg.data.source_dir = d.value("source_dir", cfg.data.source_dir);
        cfg.data.data_dir = d.value("data_dir", cfg.data.data_dir);
    }
    if (j.contains("analysis")) {
        auto& a = j["analysis"];
        cfg.analysis.worker_threads = a.value("worker_threads", cfg.analysis.worker_threads);
        cfg.analysis.recent_days = a.value("recent_days", cfg.analysis.recent_days);
        cfg.analysis.top_periods = a.value("top_periods", cfg.analysis.top_periods);
    }
    if (j.contains("logging")) {
        auto& l = j["logging"];
        cfg.logging.level = l.value("level", cfg.logging.level);
        cfg.logging.file = l.value("file", cfg.logging.file);
    }
    if (j.contains("trading_periods") && j["trading_periods"].is_array()) {
        std::vector<PeriodDefinition> periods;
        for (const auto& p : j["trading_periods"]) {
            PeriodDefinition def;
            def.name = p.value("name", std::string{});
            def.start_hour = p.value("start_hour", 0);
            def.end_hour = p.value("end_hour", 0);
            validate_period(def);
            periods.push_back(std::move(def));
        }
        cfg.trading_periods = std::move(periods);
    }
}

/**
 * Apply the logging section: level by name, plus a file sink when a path is set.
 */
void configure_logging(const LoggingConfig& cfg);

} // namespace trade_rank
