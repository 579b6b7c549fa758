#include "detection_response.h"

#include <cmath>

namespace csvsentry {

auto RowFields(const pipeline::Table& table, size_t row) -> nlohmann::json {
    nlohmann::json fields = nlohmann::json::object();
    for (const auto& column : table.Columns()) {
        if (column.IsNumeric()) {
            const auto& cell = column.numbers[row];
            if (!cell || !std::isfinite(*cell)) {
                fields[column.name] = nullptr;
            } else if (column.integral) {
                fields[column.name] = static_cast<long long>(*cell);
            } else {
                fields[column.name] = *cell;
            }
        } else {
            const auto& cell = column.texts[row];
            if (cell) {
                fields[column.name] = *cell;
            } else {
                fields[column.name] = nullptr;
            }
        }
    }
    return fields;
}

auto ToJson(const anomaly::RowExplanation& explanation) -> nlohmann::json {
    nlohmann::json j;
    if (explanation.base_value) {
        j["base_value"] = *explanation.base_value;
    }
    j["features"] = nlohmann::json::array();
    for (const auto& f : explanation.features) {
        j["features"].push_back({{"feature", f.feature}, {"value", f.value}, {"attribution", f.attribution}});
    }
    return j;
}

auto ToJson(const pipeline::DecodeReport& report) -> nlohmann::json {
    return {{"encoding", pipeline::text::EncodingName(report.config.encoding)},
            {"malformed_rows", pipeline::PolicyName(report.config.malformed_rows)},
            {"parser", pipeline::ParserModeName(report.config.parser)},
            {"attempt", report.attempt},
            {"skipped_rows", report.skipped_rows}};
}

auto ToJson(const RunMetadata& metadata) -> nlohmann::json {
    nlohmann::json j;
    j["filename"] = metadata.upload_name;
    j["original_rows"] = metadata.original_rows;
    j["cleaned_rows"] = metadata.cleaned_rows;
    j["rows_removed"] = metadata.rows_removed;
    j["total_columns"] = metadata.total_columns;
    j["numeric_columns"] = metadata.numeric_columns;
    j["numeric_column_names"] = metadata.numeric_column_names;
    j["column_names"] = metadata.column_names;
    j["feature_columns"] = metadata.feature_columns;
    j["dropped_zero_variance_columns"] = metadata.dropped_zero_variance_columns;
    j["contamination_rate"] = metadata.contamination_rate;
    j["scorer"] = metadata.scorer;
    j["explainability_status"] = ExplainabilityStatusName(metadata.explainability_status);
    if (metadata.explainability_error) {
        j["explainability_error"] = *metadata.explainability_error;
    }
    j["cells_neutralized"] = metadata.cells_neutralized;
    j["infinite_values_replaced"] = metadata.infinite_values_replaced;
    j["decode"] = ToJson(metadata.decode);
    return j;
}

auto ToJson(const DetectionReport& report) -> nlohmann::json {
    nlohmann::json anomalies = nlohmann::json::array();
    for (const auto& result : report.anomalies) {
        nlohmann::json row = RowFields(report.table, result.row);
        row["anomaly"] = 1;
        row["score"] = result.score;
        row["explanation"] = result.explanation ? ToJson(*result.explanation) : nlohmann::json(nullptr);
        anomalies.push_back(std::move(row));
    }
    nlohmann::json j;
    j["total_rows"] = report.total_rows;
    j["anomalies_found"] = report.anomalies.size();
    j["anomalies"] = std::move(anomalies);
    j["metadata"] = ToJson(report.metadata);
    return j;
}

auto ToJson(const CategoricalMetadata& metadata) -> nlohmann::json {
    nlohmann::json j;
    j["filename"] = metadata.upload_name;
    j["method"] = metadata.method;
    j["threshold"] = metadata.threshold;
    j["threshold_percentile"] = metadata.threshold_percentile;
    j["categorical_columns"] = metadata.categorical_columns;
    j["original_rows"] = metadata.original_rows;
    j["total_columns"] = metadata.total_columns;
    j["cells_neutralized"] = metadata.cells_neutralized;
    j["decode"] = ToJson(metadata.decode);
    return j;
}

auto ToJson(const CategoricalReport& report) -> nlohmann::json {
    nlohmann::json anomalies = nlohmann::json::array();
    for (const auto& entry : report.anomalies) {
        nlohmann::json row = RowFields(report.table, entry.row);
        row["score"] = entry.score;
        row["per_feature"] = nlohmann::json::array();
        for (const auto& loss : entry.per_feature) {
            row["per_feature"].push_back({{"feature", loss.feature}, {"loss", loss.loss}});
        }
        anomalies.push_back(std::move(row));
    }
    nlohmann::json j;
    j["total_rows"] = report.total_rows;
    j["anomalies_found"] = report.anomalies.size();
    j["anomalies"] = std::move(anomalies);
    j["metadata"] = ToJson(report.metadata);
    return j;
}

} // namespace csvsentry
