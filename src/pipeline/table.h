#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace csvsentry::pipeline {

enum class ColumnType {
    Numeric,
    Text
};

// One named column. Exactly one of numbers/texts is populated, chosen by type;
// std::nullopt marks a missing cell.
struct Column {
    std::string name;
    ColumnType type = ColumnType::Text;
    bool integral = false; // every source token was an integer literal
    std::vector<std::optional<double>> numbers;
    std::vector<std::optional<std::string>> texts;

    [[nodiscard]] auto IsNumeric() const -> bool { return type == ColumnType::Numeric; }
    [[nodiscard]] auto Size() const -> size_t { return IsNumeric() ? numbers.size() : texts.size(); }
    [[nodiscard]] auto IsMissing(size_t row) const -> bool {
        return IsNumeric() ? !numbers[row].has_value() : !texts[row].has_value();
    }

    static auto MakeNumeric(std::string name, std::vector<std::optional<double>> values) -> Column;
    static auto MakeText(std::string name, std::vector<std::optional<std::string>> values) -> Column;
};

class Table {
public:
    Table() = default;
    // Throws std::invalid_argument when column lengths differ.
    explicit Table(std::vector<Column> columns);

    [[nodiscard]] auto RowCount() const -> size_t;
    [[nodiscard]] auto ColumnCount() const -> size_t { return columns_.size(); }

    auto Columns() -> std::vector<Column>& { return columns_; }
    [[nodiscard]] auto Columns() const -> const std::vector<Column>& { return columns_; }

    [[nodiscard]] auto ColumnNames() const -> std::vector<std::string>;
    [[nodiscard]] auto NumericColumnNames() const -> std::vector<std::string>;
    [[nodiscard]] auto TextColumnNames() const -> std::vector<std::string>;

    auto FindColumn(const std::string& name) -> Column*;
    [[nodiscard]] auto FindColumn(const std::string& name) const -> const Column*;

    // Keeps row i iff keep[i]; order is preserved.
    void RetainRows(const std::vector<bool>& keep);

    // New table holding only the named columns, in the given order.
    [[nodiscard]] auto Select(const std::vector<std::string>& names) const -> Table;

private:
    std::vector<Column> columns_;
};

} // namespace csvsentry::pipeline
