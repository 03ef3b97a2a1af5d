#include "csv_parser.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace trade_rank {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> split(const std::string& line, char sep) {
    std::vector<std::string> parts;
    std::string field;
    std::istringstream ss(line);
    while (std::getline(ss, field, sep)) {
        parts.push_back(trim(field));
    }
    if (!line.empty() && line.back() == sep) parts.emplace_back();
    return parts;
}

Decimal parse_decimal_field(const std::string& value, const char* what) {
    auto d = Decimal::parse(value);
    if (!d) {
        throw std::runtime_error(std::string("Invalid ") + what + ": " + value);
    }
    return *d;
}

std::string file_name(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

} // namespace

FileFormat CsvParser::detect_format(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open " + path);
    }
    std::string header;
    if (!std::getline(f, header)) return FileFormat::UNKNOWN;
    header = to_lower(header);

    auto has = [&header](const char* s) { return header.find(s) != std::string::npos; };
    if (has("unrealized") || has("avg price") || has("last price") || has("position id")) {
        return FileFormat::POSITIONS;
    }
    if (has("symbol") && has("side") && (has("qty") || has("quantity")) && has("fill price")) {
        return FileFormat::TRADES;
    }
    return FileFormat::UNKNOWN;
}

std::vector<TradeRecord> CsvParser::parse_file(const std::string& path) {
    switch (detect_format(path)) {
        case FileFormat::POSITIONS:
            spdlog::warn("Skipping positions file: {} (not a trades file)", file_name(path));
            return {};
        case FileFormat::UNKNOWN:
            spdlog::warn("Skipping unrecognized file format: {}", file_name(path));
            return {};
        case FileFormat::TRADES:
            break;
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open " + path);
    }
    std::vector<TradeRecord> trades;
    std::string line;
    std::getline(f, line);  // header
    size_t line_no = 1;
    while (std::getline(f, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        try {
            trades.push_back(parse_line(line));
        } catch (const std::exception& e) {
            throw std::runtime_error("Failed to parse line " + std::to_string(line_no) + " in " +
                                     path + ": " + e.what());
        }
    }
    spdlog::debug("Parsed {} trades from {}", trades.size(), file_name(path));
    return trades;
}

TradeRecord CsvParser::parse_line(const std::string& line) {
    auto parts = split(line, ',');
    if (parts.size() < 6) {
        throw std::runtime_error("Invalid CSV format: expected at least 6 fields, got " +
                                 std::to_string(parts.size()));
    }

    TradeRecord t;
    t.symbol = parts[0];
    if (t.symbol.empty()) {
        throw std::runtime_error("Empty symbol");
    }
    auto side = side_from_string(parts[1]);
    if (!side) {
        throw std::runtime_error("Invalid side: " + parts[1]);
    }
    t.side = *side;
    t.quantity = parse_decimal_field(parts[2], "quantity");
    t.fill_price = parse_decimal_field(parts[3], "fill price");
    auto time = utils::parse_trade_time(parts[4]);
    if (!time) {
        throw std::runtime_error("Invalid time: " + parts[4]);
    }
    t.time = *time;
    t.net_amount = parse_decimal_field(parts[5], "net amount");
    if (parts.size() > 6 && !parts[6].empty()) {
        t.commission = parse_decimal_field(parts[6], "commission");
    }
    return t;
}

} // namespace trade_rank
