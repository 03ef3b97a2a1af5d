#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include "../src/core/csv_parser.hpp"

using namespace trade_rank;

namespace fs = std::filesystem;

namespace {

constexpr const char* kTradesHeader = "Symbol,Side,Qty,Fill Price,Time,Net Amount,Commission";

class CsvParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               (std::string("trade_rank_csv_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write_file(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream f(path);
        f << content;
        return path.string();
    }

    fs::path dir_;
};

} // namespace

TEST(CsvParserLineTest, ParsesFullRow) {
    auto t = CsvParser::parse_line("AAPL,Buy,100,10.25,2024-03-04 14:30:05,1025.00,1.5");
    EXPECT_EQ(t.symbol, "AAPL");
    EXPECT_EQ(t.side, Side::BUY);
    EXPECT_EQ(t.quantity, Decimal(100));
    EXPECT_EQ(t.fill_price, Decimal("10.25"));
    EXPECT_EQ(t.time, utils::utc_time_point(2024, 3, 4, 14, 30, 5));
    EXPECT_EQ(t.net_amount, Decimal("1025"));
    EXPECT_EQ(t.commission, Decimal("1.5"));
}

TEST(CsvParserLineTest, CommissionIsOptional) {
    auto t = CsvParser::parse_line(" MSFT , Short , 5 , 400 , 2024-03-04 09:31:00 , 2000 ");
    EXPECT_EQ(t.symbol, "MSFT");
    EXPECT_EQ(t.side, Side::SELL);
    EXPECT_TRUE(t.commission.is_zero());

    auto blank = CsvParser::parse_line("MSFT,Sell,5,400,2024-03-04 09:31:00,2000,");
    EXPECT_TRUE(blank.commission.is_zero());
}

TEST(CsvParserLineTest, RejectsBadFields) {
    EXPECT_THROW(CsvParser::parse_line("AAPL,Buy,100,10"), std::runtime_error);
    EXPECT_THROW(CsvParser::parse_line(",Buy,100,10,2024-03-04 14:30:05,1000"), std::runtime_error);
    EXPECT_THROW(CsvParser::parse_line("AAPL,Hold,100,10,2024-03-04 14:30:05,1000"), std::runtime_error);
    EXPECT_THROW(CsvParser::parse_line("AAPL,Buy,ten,10,2024-03-04 14:30:05,1000"), std::runtime_error);
    EXPECT_THROW(CsvParser::parse_line("AAPL,Buy,100,10,yesterday,1000"), std::runtime_error);
    EXPECT_THROW(CsvParser::parse_line("AAPL,Buy,100,10,2024-03-04 14:30:05,1000,abc"), std::runtime_error);
}

TEST_F(CsvParserTest, DetectsFormatFromHeader) {
    auto trades = write_file("trades.csv", std::string(kTradesHeader) + "\n");
    auto positions = write_file("positions.csv", "Symbol,Side,Qty,Avg Price,Last Price,Unrealized P&L\n");
    auto other = write_file("other.csv", "Date,Description,Amount\n");
    auto empty = write_file("empty.csv", "");

    EXPECT_EQ(CsvParser::detect_format(trades), FileFormat::TRADES);
    EXPECT_EQ(CsvParser::detect_format(positions), FileFormat::POSITIONS);
    EXPECT_EQ(CsvParser::detect_format(other), FileFormat::UNKNOWN);
    EXPECT_EQ(CsvParser::detect_format(empty), FileFormat::UNKNOWN);
    EXPECT_THROW(CsvParser::detect_format((dir_ / "missing.csv").string()), std::runtime_error);
}

TEST_F(CsvParserTest, ParsesTradesFileSkippingBlankLines) {
    auto path = write_file("trades.csv", std::string(kTradesHeader) + "\r\n"
                           "AAPL,Buy,100,10,2024-03-04 10:00:00,1000,1\r\n"
                           "\r\n"
                           "AAPL,Sell,100,12,2024-03-04 10:30:00,1200,1\r\n");
    auto trades = CsvParser::parse_file(path);
    ASSERT_EQ(trades.size(), 2u);
    EXPECT_EQ(trades[0].side, Side::BUY);
    EXPECT_EQ(trades[1].side, Side::SELL);
    EXPECT_EQ(trades[1].commission, Decimal(1));
}

TEST_F(CsvParserTest, SkipsPositionsAndUnknownFiles) {
    auto positions = write_file("positions.csv", "Symbol,Side,Qty,Avg Price,Last Price,Unrealized P&L\n"
                                "AAPL,Long,100,10,12,200\n");
    auto other = write_file("other.csv", "Date,Description,Amount\n2024-03-04,Deposit,100\n");
    EXPECT_TRUE(CsvParser::parse_file(positions).empty());
    EXPECT_TRUE(CsvParser::parse_file(other).empty());
}

TEST_F(CsvParserTest, ErrorNamesTheLine) {
    auto path = write_file("broken.csv", std::string(kTradesHeader) + "\n"
                           "AAPL,Buy,100,10,2024-03-04 10:00:00,1000,1\n"
                           "AAPL,Sell,oops,12,2024-03-04 10:30:00,1200,1\n");
    try {
        CsvParser::parse_file(path);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("line 3"), std::string::npos) << msg;
        EXPECT_NE(msg.find("quantity"), std::string::npos) << msg;
    }
}
