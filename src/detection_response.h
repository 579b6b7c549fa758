#pragma once

#include <nlohmann/json.hpp>

#include "detection_orchestrator.h"

namespace csvsentry {

// Column name -> cell for one table row. Integral columns serialize as
// integers and missing cells as null.
auto RowFields(const pipeline::Table& table, size_t row) -> nlohmann::json;

auto ToJson(const anomaly::RowExplanation& explanation) -> nlohmann::json;
auto ToJson(const pipeline::DecodeReport& report) -> nlohmann::json;
auto ToJson(const RunMetadata& metadata) -> nlohmann::json;
auto ToJson(const DetectionReport& report) -> nlohmann::json;
auto ToJson(const CategoricalMetadata& metadata) -> nlohmann::json;
auto ToJson(const CategoricalReport& report) -> nlohmann::json;

} // namespace csvsentry
