#pragma once

#include <string>
#include <vector>
#include <optional>
#include "trade.hpp"
#include "summary.hpp"

namespace trade_rank {

/**
 * State persisted between runs: which exports were ingested, the de-duplicated
 * trade history they produced, and the last analysis.
 */
struct ProcessedData {
    Timestamp last_processed;
    std::vector<std::string> processed_files;   // file names, not paths
    std::vector<TradeRecord> trades;
    TradingSummary summary;
};

/**
 * File-backed store under a data directory:
 *   <data_dir>/processed_data.json
 *   <data_dir>/Summaries/summary_YYYYMMDD_HHMMSS.json
 */
class JsonStore {
public:
    // Creates the directories; throws std::filesystem::filesystem_error on failure.
    explicit JsonStore(std::string data_dir);

    std::optional<ProcessedData> load_processed_data() const;
    bool save_processed_data(const ProcessedData& data) const;

    /**
     * CSV files in source_dir whose names are not yet recorded as processed, sorted by name.
     */
    std::vector<std::string> new_files(const std::string& source_dir) const;

    /**
     * Record files as processed together with the full trade history and its summary.
     * Returns false without writing when an existing state file cannot be read.
     */
    bool mark_files_processed(const std::vector<std::string>& files,
                              std::vector<TradeRecord> trades,
                              const TradingSummary& summary) const;

    /**
     * Write a timestamped snapshot of the summary and the ranked trading periods;
     * returns its path.
     */
    std::optional<std::string> save_summary_snapshot(const TradingSummary& summary,
                                                     const std::vector<TradingPeriod>& periods) const;

    std::string processed_data_path() const;
    std::string summaries_dir() const;

private:
    std::string data_dir_;
};

} // namespace trade_rank
