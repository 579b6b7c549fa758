#include "pipeline/cell_sanitizer.h"

#include "obs/logging.h"

namespace csvsentry::pipeline {

auto CellSanitizer::IsDangerous(const std::string& value) -> bool {
    if (value.empty()) return false;
    switch (value.front()) {
        case '=':
        case '+':
        case '-':
        case '@':
        case '\t':
        case '\r':
            return true;
        default:
            return false;
    }
}

auto CellSanitizer::SanitizeValue(const std::string& value) -> std::string {
    return IsDangerous(value) ? "'" + value : value;
}

auto CellSanitizer::Apply(Table& table) -> size_t {
    size_t neutralized = 0;
    for (auto& column : table.Columns()) {
        if (column.IsNumeric()) continue;
        for (auto& cell : column.texts) {
            if (cell && IsDangerous(*cell)) {
                cell->insert(cell->begin(), '\'');
                ++neutralized;
            }
        }
    }
    if (neutralized > 0) {
        obs::LogEvent(obs::LogLevel::Warn, "cells_neutralized", "cell_sanitizer", {{"cells", neutralized}});
    }
    return neutralized;
}

} // namespace csvsentry::pipeline
