#pragma once

#include <string>
#include <vector>
#include "trade.hpp"

namespace trade_rank {

enum class FileFormat { TRADES, POSITIONS, UNKNOWN };

/**
 * Reader for broker trade exports:
 *   Symbol,Side,Qty,Fill Price,Time,Net Amount[,Commission]
 * Time is "YYYY-MM-DD HH:MM:SS" in UTC; Side accepts buy/long/sell/short.
 */
class CsvParser {
public:
    /**
     * Classify a file from its header line. Throws std::runtime_error if it cannot be opened.
     */
    static FileFormat detect_format(const std::string& path);

    /**
     * Parse every trade in a trades export. Position exports and unrecognised files are
     * skipped with a warning and yield no trades. Throws std::runtime_error naming the
     * file and line of the first malformed row.
     */
    static std::vector<TradeRecord> parse_file(const std::string& path);

    /**
     * Parse one data row. Throws std::runtime_error describing the bad field.
     */
    static TradeRecord parse_line(const std::string& line);
};

} // namespace trade_rank
