#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "pipeline/table.h"

namespace csvsentry::pipeline {

class NameSanitizer {
public:
    static constexpr size_t kMaxNameLength = 100;

    // Sanitized form of one header. position is the 0-based column index used
    // for the synthesized name when nothing is left.
    static auto SanitizeName(const std::string& raw, size_t position) -> std::string;

    // 1:1 and order-preserving. Throws PipelineError(DuplicateColumns) when two
    // sanitized names collide.
    static auto SanitizeAll(const std::vector<std::string>& raw) -> std::vector<std::string>;

    // Renames the table's columns in place.
    static void Apply(Table& table);
};

} // namespace csvsentry::pipeline
