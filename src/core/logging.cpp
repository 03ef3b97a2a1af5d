#include "config.hpp"

#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace trade_rank {

void configure_logging(const LoggingConfig& cfg) {
    auto level = spdlog::level::from_str(cfg.level);
    if (level == spdlog::level::off && cfg.level != "off") {
        spdlog::warn("Unknown log level '{}', keeping info", cfg.level);
        level = spdlog::level::info;
    }

    if (!cfg.file.empty()) {
        try {
            auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file, false);
            auto logger = std::make_shared<spdlog::logger>(
                "trade_rank", spdlog::sinks_init_list{console, file});
            spdlog::set_default_logger(logger);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::error("Failed to open log file {}: {}", cfg.file, e.what());
        }
    }
    spdlog::set_level(level);
}

} // namespace trade_rank
