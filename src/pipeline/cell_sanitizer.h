#pragma once

#include <cstddef>
#include <string>

#include "pipeline/table.h"

namespace csvsentry::pipeline {

// Neutralizes spreadsheet formula injection in text cells.
class CellSanitizer {
public:
    static auto IsDangerous(const std::string& value) -> bool;

    // "'" + value for dangerous values, the value unchanged otherwise.
    static auto SanitizeValue(const std::string& value) -> std::string;

    // Rewrites every text column in place; numeric columns are untouched.
    // Returns the number of cells neutralized.
    static auto Apply(Table& table) -> size_t;
};

} // namespace csvsentry::pipeline
