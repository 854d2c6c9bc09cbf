#include <string>

#include <gtest/gtest.h>

#include "trade_recon/core/record_table_view.h"

namespace trade_recon {

TEST(RecordTableViewTest, FindsColumnsByTrimmedCaseInsensitiveAlias) {
    RecordTable table;
    table.columns = {" Ticker ", "Операция", "AMOUNT"};
    const RecordTableView view(table);

    EXPECT_EQ(view.FindColumn({"ticker", "Тикер"}), std::optional<std::size_t>(0));
    EXPECT_EQ(view.FindColumn({"operation", "Операция"}), std::optional<std::size_t>(1));
    EXPECT_EQ(view.FindColumn({"amount"}), std::optional<std::size_t>(2));
    EXPECT_FALSE(view.FindColumn({"price", "Цена"}).has_value());
}

TEST(RecordTableViewTest, ShortRowsArePaddedWithEmptyCells) {
    RecordTable table;
    table.columns = {"a", "b", "c"};
    table.rows = {{"1"}, {"1", "2", "3"}};
    const RecordTableView view(table);

    EXPECT_EQ(view.RowCount(), 2U);
    EXPECT_EQ(view.Cell(0, 0), "1");
    EXPECT_EQ(view.Cell(0, 2), "");
    EXPECT_EQ(view.Cell(1, 2), "3");
    EXPECT_EQ(view.Cell(5, 0), "");
}

TEST(RecordTableViewTest, TrimCellStripsUnicodeSpaces) {
    EXPECT_EQ(TrimCell("  ABC\t"), "ABC");
    EXPECT_EQ(TrimCell("\xC2\xA0" "ABC" "\xE2\x80\xAF"), "ABC");
    EXPECT_EQ(TrimCell("\xC2\xA0"), "");
    EXPECT_EQ(TrimCell("A B"), "A B");
}

TEST(RecordTableViewTest, NumericCellsAcceptGroupingAndDecimalComma) {
    Decimal value;
    std::string error;
    ASSERT_TRUE(ParseDecimalCell("1 234,56", &value, &error)) << error;
    EXPECT_EQ(value.ToString(2), "1234.56");
    ASSERT_TRUE(ParseDecimalCell("12\xC2\xA0" "000", &value, &error)) << error;
    EXPECT_EQ(value.ToString(), "12000");
    ASSERT_TRUE(ParseDecimalCell("-5,5", &value, &error)) << error;
    EXPECT_EQ(value.ToString(), "-5.5");

    EXPECT_FALSE(ParseDecimalCell("", &value, &error));
    EXPECT_FALSE(ParseDecimalCell("12 USD", &value, &error));
    EXPECT_FALSE(ParseDecimalCell("1,234.56", &value, &error));
}

TEST(RecordTableViewTest, DateCellsAreTrimmedBeforeParsing) {
    Timestamp value;
    std::string error;
    ASSERT_TRUE(ParseTimestampCell(" 05.01.2024 ", &value, &error)) << error;
    EXPECT_EQ(value.ToDate(), "2024-01-05");
    EXPECT_FALSE(ParseTimestampCell("", &value, &error));
    EXPECT_FALSE(ParseTimestampCell("05/01/2024", &value, &error));
    EXPECT_NE(error.find("invalid date"), std::string::npos);
}

}  // namespace trade_recon
