#include "json_store.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "summary_json.hpp"

namespace trade_rank {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool write_atomically(const std::string& path, const json& j) {
    std::string tmp_path = path + ".tmp";
    std::ofstream f(tmp_path, std::ios::out | std::ios::trunc);
    if (!f.is_open()) {
        spdlog::error("Failed to open {} for writing", tmp_path);
        return false;
    }
    f << j.dump(2);
    f.close();
    if (!f) {
        spdlog::error("Failed to write {}", tmp_path);
        return false;
    }
    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        spdlog::error("Failed to rename {} to {}: {}", tmp_path, path, ec.message());
        return false;
    }
    return true;
}

} // namespace

JsonStore::JsonStore(std::string data_dir) : data_dir_(std::move(data_dir)) {
    fs::create_directories(data_dir_);
    fs::create_directories(summaries_dir());
}

std::string JsonStore::processed_data_path() const {
    return (fs::path(data_dir_) / "processed_data.json").string();
}

std::string JsonStore::summaries_dir() const {
    return (fs::path(data_dir_) / "Summaries").string();
}

std::optional<ProcessedData> JsonStore::load_processed_data() const {
    std::ifstream f(processed_data_path());
    if (!f.is_open()) return std::nullopt;

    auto j = json::parse(f, nullptr, false);
    if (j.is_discarded()) {
        spdlog::warn("Failed to parse {}", processed_data_path());
        return std::nullopt;
    }

    try {
        ProcessedData data;
        auto ts = utils::parse_iso_ts(j.value("last_processed", std::string{}));
        data.last_processed = ts.value_or(Timestamp{});
        data.processed_files = j.value("processed_files", std::vector<std::string>{});
        data.trades = j.value("trades", std::vector<TradeRecord>{});
        if (j.contains("summary")) {
            data.summary = j.at("summary").get<TradingSummary>();
        }
        return data;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to load {}: {}", processed_data_path(), e.what());
        return std::nullopt;
    }
}

bool JsonStore::save_processed_data(const ProcessedData& data) const {
    json j;
    j["last_processed"] = utils::ts_to_iso(data.last_processed);
    j["processed_files"] = data.processed_files;
    j["trades"] = data.trades;
    j["summary"] = data.summary;
    if (!write_atomically(processed_data_path(), j)) return false;
    spdlog::debug("Saved processed data ({} files, {} trades)",
                  data.processed_files.size(), data.trades.size());
    return true;
}

std::vector<std::string> JsonStore::new_files(const std::string& source_dir) const {
    std::vector<std::string> processed;
    if (auto data = load_processed_data()) {
        processed = std::move(data->processed_files);
    }

    std::vector<std::string> out;
    for (const auto& entry : fs::directory_iterator(source_dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".csv") continue;
        std::string name = entry.path().filename().string();
        if (std::find(processed.begin(), processed.end(), name) == processed.end()) {
            out.push_back(entry.path().string());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

bool JsonStore::mark_files_processed(const std::vector<std::string>& files,
                                     std::vector<TradeRecord> trades,
                                     const TradingSummary& summary) const {
    ProcessedData data;
    if (fs::exists(processed_data_path())) {
        auto existing = load_processed_data();
        if (!existing) {
            spdlog::error("Not overwriting unreadable {}", processed_data_path());
            return false;
        }
        data.processed_files = std::move(existing->processed_files);
    }
    for (const auto& file : files) {
        std::string name = fs::path(file).filename().string();
        if (std::find(data.processed_files.begin(), data.processed_files.end(), name) ==
            data.processed_files.end()) {
            data.processed_files.push_back(name);
        }
    }
    data.last_processed = std::chrono::system_clock::now();
    data.trades = std::move(trades);
    data.summary = summary;
    return save_processed_data(data);
}

std::optional<std::string> JsonStore::save_summary_snapshot(const TradingSummary& summary,
                                                        const std::vector<TradingPeriod>& periods) const {
    std::tm tm = utils::to_utc_tm(std::chrono::system_clock::now());
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);

    fs::path path = fs::path(summaries_dir()) / (std::string("summary_") + stamp + ".json");
    for (int n = 1; fs::exists(path); ++n) {
        path = fs::path(summaries_dir()) /
               (std::string("summary_") + stamp + "_" + std::to_string(n) + ".json");
    }

    json j = summary;
    j["trading_periods"] = periods;
    if (!write_atomically(path.string(), j)) return std::nullopt;
    spdlog::info("Saved summary snapshot {}", path.string());
    return path.string();
}

} // namespace trade_rank
