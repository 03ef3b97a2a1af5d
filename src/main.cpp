#include <filesystem>
#include <iostream>
#include <spdlog/spdlog.h>
#include "core/config.hpp"
#include "core/csv_parser.hpp"
#include "core/json_store.hpp"
#include "core/period_analyzer.hpp"
#include "core/report.hpp"
#include "core/trading_analytics.hpp"

namespace {

int run(const trade_rank::Config& cfg) {
    if (!std::filesystem::is_directory(cfg.data.source_dir)) {
        spdlog::error("Source directory {} not found; put broker CSV exports there", cfg.data.source_dir);
        return 1;
    }

    trade_rank::JsonStore store(cfg.data.data_dir);
    auto new_files = store.new_files(cfg.data.source_dir);
    auto processed = store.load_processed_data();
    if (!processed && std::filesystem::exists(store.processed_data_path())) {
        spdlog::error("Cannot read {}; fix or move it before processing more files",
                      store.processed_data_path());
        return 1;
    }

    if (new_files.empty()) {
        spdlog::info("All files already processed");
        if (!processed) {
            spdlog::warn("No processed data found");
            return 0;
        }
        trade_rank::render_summary(std::cout, processed->summary, cfg.analysis.recent_days);
        trade_rank::render_weekly(std::cout, processed->summary);
        auto periods = trade_rank::identify_best_trading_periods(processed->trades, cfg.trading_periods);
        trade_rank::render_periods(std::cout, periods, cfg.analysis.top_periods);
        return 0;
    }

    spdlog::info("Found {} new file(s) to process", new_files.size());
    std::vector<trade_rank::TradeRecord> trades;
    if (processed) {
        trades = std::move(processed->trades);
        spdlog::info("Loaded {} trades from history", trades.size());
    }
    for (const auto& file : new_files) {
        auto parsed = trade_rank::CsvParser::parse_file(file);
        spdlog::info("Processing {}: {} trades", std::filesystem::path(file).filename().string(), parsed.size());
        trades.insert(trades.end(), parsed.begin(), parsed.end());
    }

    size_t duplicates = trade_rank::deduplicate_trades(trades);
    if (duplicates > 0) {
        spdlog::warn("Filtered {} duplicate trade(s)", duplicates);
    }
    spdlog::info("Analyzing {} unique trades", trades.size());

    trade_rank::AnalysisOptions options;
    options.worker_threads = cfg.analysis.worker_threads;
    auto summary = trade_rank::analyze_trades(trades, options);
    auto periods = trade_rank::identify_best_trading_periods(trades, cfg.trading_periods);

    if (!store.mark_files_processed(new_files, trades, summary)) {
        spdlog::error("Failed to record processed files in {}", store.processed_data_path());
        return 1;
    }
    if (!store.save_summary_snapshot(summary, periods)) {
        spdlog::warn("Summary snapshot not written to {}", store.summaries_dir());
    }

    trade_rank::render_summary(std::cout, summary, cfg.analysis.recent_days);
    trade_rank::render_weekly(std::cout, summary);
    trade_rank::render_periods(std::cout, periods, cfg.analysis.top_periods);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    trade_rank::Config cfg;
    try {
        trade_rank::load_config(cfg, config_path);
    } catch (const std::exception& e) {
        spdlog::error("Invalid config {}: {}", config_path, e.what());
        return 1;
    }
    trade_rank::configure_logging(cfg.logging);
    spdlog::info("TradeRank starting. source={} data={}", cfg.data.source_dir, cfg.data.data_dir);

    try {
        int rc = run(cfg);
        if (rc == 0) spdlog::info("Analysis complete");
        return rc;
    } catch (const std::exception& e) {
        spdlog::error("Analysis failed: {}", e.what());
        return 1;
    }
}
