#include "pipeline/table.h"

#include <stdexcept>
#include <utility>

namespace csvsentry::pipeline {

auto Column::MakeNumeric(std::string name, std::vector<std::optional<double>> values) -> Column {
    Column c;
    c.name = std::move(name);
    c.type = ColumnType::Numeric;
    c.numbers = std::move(values);
    return c;
}

auto Column::MakeText(std::string name, std::vector<std::optional<std::string>> values) -> Column {
    Column c;
    c.name = std::move(name);
    c.type = ColumnType::Text;
    c.texts = std::move(values);
    return c;
}

Table::Table(std::vector<Column> columns) : columns_(std::move(columns)) {
    if (columns_.empty()) return;
    size_t expected = columns_.front().Size();
    for (const auto& c : columns_) {
        if (c.Size() != expected) {
            throw std::invalid_argument("column '" + c.name + "' has " + std::to_string(c.Size()) +
                                        " rows, expected " + std::to_string(expected));
        }
    }
}

auto Table::RowCount() const -> size_t {
    return columns_.empty() ? 0 : columns_.front().Size();
}

auto Table::ColumnNames() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& c : columns_) {
        names.push_back(c.name);
    }
    return names;
}

auto Table::NumericColumnNames() const -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& c : columns_) {
        if (c.IsNumeric()) names.push_back(c.name);
    }
    return names;
}

auto Table::TextColumnNames() const -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& c : columns_) {
        if (!c.IsNumeric()) names.push_back(c.name);
    }
    return names;
}

auto Table::FindColumn(const std::string& name) -> Column* {
    for (auto& c : columns_) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

auto Table::FindColumn(const std::string& name) const -> const Column* {
    for (const auto& c : columns_) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

void Table::RetainRows(const std::vector<bool>& keep) {
    if (keep.size() != RowCount()) {
        throw std::invalid_argument("RetainRows mask size mismatch");
    }
    for (auto& c : columns_) {
        size_t out = 0;
        for (size_t i = 0; i < keep.size(); ++i) {
            if (!keep[i]) continue;
            // out == i until the first dropped row; a self-move would clear the string.
            if (out != i) {
                if (c.IsNumeric()) {
                    c.numbers[out] = c.numbers[i];
                } else {
                    c.texts[out] = std::move(c.texts[i]);
                }
            }
            ++out;
        }
        if (c.IsNumeric()) {
            c.numbers.resize(out);
        } else {
            c.texts.resize(out);
        }
    }
}

auto Table::Select(const std::vector<std::string>& names) const -> Table {
    std::vector<Column> selected;
    selected.reserve(names.size());
    for (const auto& name : names) {
        const Column* c = FindColumn(name);
        if (c == nullptr) {
            throw std::invalid_argument("unknown column '" + name + "'");
        }
        selected.push_back(*c);
    }
    return Table(std::move(selected));
}

} // namespace csvsentry::pipeline
