#include <gtest/gtest.h>

#include <limits>
#include <string>

#include "pipeline/pipeline_error.h"
#include "pipeline/value_policy.h"

namespace csvsentry::pipeline {
namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

TEST(ValuePolicyTest, DropsRowsMissingAnyNumericValue) {
    Table table({Column::MakeNumeric("a", {1.0, std::nullopt, 3.0}),
                 Column::MakeNumeric("b", {10.0, 20.0, std::nullopt}),
                 Column::MakeText("label", {std::string("x"), std::string("y"), std::string("z")})});

    auto result = ValuePolicy::Apply(table, {"a", "b"});
    EXPECT_EQ(result.original_rows, 3u);
    EXPECT_EQ(result.remaining_rows, 1u);
    EXPECT_EQ(result.rows_removed, 2u);
    EXPECT_EQ(result.remaining_rows, result.original_rows - result.rows_removed);
    ASSERT_EQ(table.RowCount(), 1u);
    EXPECT_EQ(*table.FindColumn("label")->texts[0], "x");
}

TEST(ValuePolicyTest, InfinityIsTreatedAsMissing) {
    Table table({Column::MakeNumeric("a", {1.0, kInf, 3.0, -kInf})});
    auto result = ValuePolicy::Apply(table, {"a"});
    EXPECT_EQ(result.infinite_values_replaced, 2u);
    EXPECT_EQ(result.rows_removed, 2u);
    EXPECT_DOUBLE_EQ(*table.FindColumn("a")->numbers[1], 3.0);
}

TEST(ValuePolicyTest, MissingTextDoesNotDropRows) {
    Table table({Column::MakeNumeric("a", {1.0, 2.0}), Column::MakeText("t", {std::nullopt, std::string("y")})});
    auto result = ValuePolicy::Apply(table, {"a"});
    EXPECT_EQ(result.rows_removed, 0u);
    EXPECT_EQ(table.RowCount(), 2u);
}

TEST(ValuePolicyTest, NothingLeftIsAllRowsInvalid) {
    Table table({Column::MakeNumeric("a", {std::nullopt, kInf})});
    try {
        ValuePolicy::Apply(table, {"a"});
        FAIL() << "expected AllRowsInvalid";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::AllRowsInvalid);
    }
}

TEST(ValuePolicyTest, LongTextCellsSurviveWhenNothingIsDropped) {
    const std::string first = "this is a long description";
    const std::string second = "another long description here";
    Table table({Column::MakeText("note", {first, second}), Column::MakeNumeric("v", {1.0, 2.0})});

    auto result = ValuePolicy::Apply(table, {"v"});
    EXPECT_EQ(result.rows_removed, 0u);
    const Column* note = table.FindColumn("note");
    EXPECT_EQ(*note->texts[0], first);
    EXPECT_EQ(*note->texts[1], second);
}

TEST(ValuePolicyTest, LongTextCellsSurviveAroundDroppedRows) {
    const std::string kept_before = "kept row ahead of the gap";
    const std::string dropped = "row that has no number at all";
    const std::string kept_after = "kept row shifted into the gap";
    Table table({Column::MakeText("note", {kept_before, dropped, kept_after}),
                 Column::MakeNumeric("v", {1.0, std::nullopt, 3.0})});

    auto result = ValuePolicy::Apply(table, {"v"});
    EXPECT_EQ(result.rows_removed, 1u);
    const Column* note = table.FindColumn("note");
    ASSERT_EQ(note->texts.size(), 2u);
    EXPECT_EQ(*note->texts[0], kept_before);
    EXPECT_EQ(*note->texts[1], kept_after);
}

} // namespace
} // namespace csvsentry::pipeline
