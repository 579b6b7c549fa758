#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "pipeline/pipeline_error.h"
#include "pipeline/tabular_decoder.h"

namespace csvsentry::pipeline {
namespace {

auto Decode(const std::string& bytes, SanitizationLimits limits = {}) -> DecodedTable {
    return TabularDecoder(limits).Decode(bytes);
}

auto DecodeKind(const std::string& bytes, SanitizationLimits limits = {}) -> ErrorKind {
    try {
        Decode(bytes, limits);
    } catch (const PipelineError& e) {
        return e.Kind();
    }
    ADD_FAILURE() << "expected PipelineError";
    return ErrorKind::Internal;
}

TEST(TabularDecoderTest, TypesColumnsOnFirstAttempt) {
    auto decoded = Decode("id,amount,name\n1,2.5,alpha\n2,3.75,beta\n");
    const Table& t = decoded.table;
    ASSERT_EQ(t.ColumnCount(), 3u);
    ASSERT_EQ(t.RowCount(), 2u);

    const Column* id = t.FindColumn("id");
    ASSERT_NE(id, nullptr);
    EXPECT_TRUE(id->IsNumeric());
    EXPECT_TRUE(id->integral);

    const Column* amount = t.FindColumn("amount");
    ASSERT_NE(amount, nullptr);
    EXPECT_TRUE(amount->IsNumeric());
    EXPECT_FALSE(amount->integral);
    EXPECT_DOUBLE_EQ(*amount->numbers[1], 3.75);

    const Column* name = t.FindColumn("name");
    ASSERT_NE(name, nullptr);
    EXPECT_FALSE(name->IsNumeric());
    EXPECT_EQ(*name->texts[0], "alpha");

    EXPECT_EQ(decoded.report.attempt, 1u);
    EXPECT_EQ(decoded.report.config.encoding, text::Encoding::Utf8);
    EXPECT_EQ(decoded.report.skipped_rows, 0u);
}

TEST(TabularDecoderTest, MissingTokensBecomeMissingCells) {
    auto decoded = Decode("a,b\n1,NA\n2,\n3,5\n4,null\n");
    const Column* b = decoded.table.FindColumn("b");
    ASSERT_NE(b, nullptr);
    EXPECT_TRUE(b->IsNumeric());
    EXPECT_TRUE(b->IsMissing(0));
    EXPECT_TRUE(b->IsMissing(1));
    EXPECT_FALSE(b->IsMissing(2));
    EXPECT_TRUE(b->IsMissing(3));
    EXPECT_FALSE(b->integral);
}

TEST(TabularDecoderTest, InfinityFormsAreNumeric) {
    auto decoded = Decode("a\ninf\n-Infinity\n1.5\n");
    const Column* a = decoded.table.FindColumn("a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->IsNumeric());
    EXPECT_TRUE(std::isinf(*a->numbers[0]));
    EXPECT_LT(*a->numbers[1], 0.0);
    EXPECT_TRUE(std::isinf(*a->numbers[1]));
}

TEST(TabularDecoderTest, HeaderWithoutRowsIsEmptyData) {
    EXPECT_EQ(DecodeKind("a,b\n"), ErrorKind::EmptyData);
    EXPECT_EQ(DecodeKind("\n\n\n"), ErrorKind::EmptyData);
}

TEST(TabularDecoderTest, LongRowsAreSkippedOnSecondAttempt) {
    auto decoded = Decode("a,b\n1,2\n3,4,5\n6,7\n");
    EXPECT_EQ(decoded.report.attempt, 2u);
    EXPECT_EQ(decoded.report.config.malformed_rows, MalformedRowPolicy::Skip);
    EXPECT_EQ(decoded.report.skipped_rows, 1u);
    ASSERT_EQ(decoded.table.RowCount(), 2u);
    EXPECT_DOUBLE_EQ(*decoded.table.FindColumn("a")->numbers[1], 6.0);
}

TEST(TabularDecoderTest, ShortRowsArePaddedWithMissing) {
    auto decoded = Decode("a,b,c\n1,2\n3,4,x\n");
    const Column* c = decoded.table.FindColumn("c");
    ASSERT_NE(c, nullptr);
    EXPECT_TRUE(c->IsMissing(0));
    EXPECT_EQ(*c->texts[1], "x");
    EXPECT_EQ(decoded.report.attempt, 1u);
}

TEST(TabularDecoderTest, StrayQuoteFallsBackToTolerantParser) {
    auto decoded = Decode("a,b\n1,x\"y\n2,z\n");
    EXPECT_EQ(decoded.report.attempt, 3u);
    EXPECT_EQ(decoded.report.config.parser, ParserMode::Tolerant);
    EXPECT_EQ(*decoded.table.FindColumn("b")->texts[0], "x\"y");
}

TEST(TabularDecoderTest, InvalidUtf8FallsBackToLatin1) {
    auto decoded = Decode("name,v\ncaf\xE9,1\nbar,2\n");
    EXPECT_EQ(decoded.report.attempt, 4u);
    EXPECT_EQ(decoded.report.config.encoding, text::Encoding::Latin1);
    EXPECT_EQ(*decoded.table.FindColumn("name")->texts[0], "caf\xC3\xA9");
}

TEST(TabularDecoderTest, QuotedFieldsAndCrlf) {
    auto decoded = Decode("a,b\r\n\"x,1\",\"he said \"\"hi\"\"\"\r\n\"multi\nline\",plain\r\n");
    ASSERT_EQ(decoded.table.RowCount(), 2u);
    EXPECT_EQ(*decoded.table.FindColumn("a")->texts[0], "x,1");
    EXPECT_EQ(*decoded.table.FindColumn("b")->texts[0], "he said \"hi\"");
    EXPECT_EQ(*decoded.table.FindColumn("a")->texts[1], "multi\nline");
}

TEST(TabularDecoderTest, LeadingBomIsSkipped) {
    auto decoded = Decode("\xEF\xBB\xBF" "a,b\n1,2\n");
    EXPECT_EQ(decoded.table.ColumnNames(), (std::vector<std::string>{"a", "b"}));
}

TEST(TabularDecoderTest, RowAndColumnLimits) {
    SanitizationLimits rows;
    rows.max_rows = 2;
    EXPECT_EQ(DecodeKind("a\n1\n2\n3\n", rows), ErrorKind::TooManyRows);
    EXPECT_NO_THROW(Decode("a\n1\n2\n", rows));

    SanitizationLimits cols;
    cols.max_columns = 2;
    EXPECT_EQ(DecodeKind("a,b,c\n1,2,3\n", cols), ErrorKind::TooManyColumns);
}

TEST(TabularDecoderTest, DuplicateHeadersAreKeptVerbatim) {
    auto decoded = Decode("a,a\n1,2\n");
    EXPECT_EQ(decoded.table.ColumnNames(), (std::vector<std::string>{"a", "a"}));
}

TEST(TabularDecoderTest, NumberParsing) {
    EXPECT_DOUBLE_EQ(*TabularDecoder::ParseNumber("1e5"), 1e5);
    EXPECT_DOUBLE_EQ(*TabularDecoder::ParseNumber(" 3 "), 3.0);
    EXPECT_DOUBLE_EQ(*TabularDecoder::ParseNumber(".5"), 0.5);
    EXPECT_DOUBLE_EQ(*TabularDecoder::ParseNumber("5."), 5.0);
    EXPECT_DOUBLE_EQ(*TabularDecoder::ParseNumber("-2.5E-1"), -0.25);
    EXPECT_EQ(*TabularDecoder::ParseNumber("-inf"), -std::numeric_limits<double>::infinity());
    EXPECT_FALSE(TabularDecoder::ParseNumber("0x10"));
    EXPECT_FALSE(TabularDecoder::ParseNumber("1e"));
    EXPECT_FALSE(TabularDecoder::ParseNumber("abc"));
    EXPECT_FALSE(TabularDecoder::ParseNumber("1,000"));
    EXPECT_FALSE(TabularDecoder::ParseNumber("."));

    EXPECT_TRUE(TabularDecoder::IsIntegerLiteral("42"));
    EXPECT_TRUE(TabularDecoder::IsIntegerLiteral("-7"));
    EXPECT_FALSE(TabularDecoder::IsIntegerLiteral("4.0"));

    EXPECT_TRUE(TabularDecoder::IsMissingToken(""));
    EXPECT_TRUE(TabularDecoder::IsMissingToken("N/A"));
    EXPECT_TRUE(TabularDecoder::IsMissingToken("None"));
    EXPECT_FALSE(TabularDecoder::IsMissingToken("none "));
}

} // namespace
} // namespace csvsentry::pipeline
