#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "config.h"
#include "detectors/capabilities.h"
#include "pipeline/feature_preparer.h"
#include "pipeline/file_validator.h"
#include "pipeline/table.h"
#include "pipeline/tabular_decoder.h"

namespace csvsentry {

enum class ExplainabilityStatus {
    Explained,
    Disabled,
    Failed
};

auto ExplainabilityStatusName(ExplainabilityStatus status) -> const char*;

class ExplanationOutcome {
public:
    static auto Explained(std::vector<anomaly::RowExplanation> explanations) -> ExplanationOutcome;
    static auto Disabled() -> ExplanationOutcome;
    static auto Failed(std::string diagnostic) -> ExplanationOutcome;

    [[nodiscard]] auto Status() const -> ExplainabilityStatus { return status_; }
    [[nodiscard]] auto Explanations() const -> const std::vector<anomaly::RowExplanation>& { return explanations_; }
    [[nodiscard]] auto Diagnostic() const -> const std::string& { return diagnostic_; }

private:
    ExplainabilityStatus status_ = ExplainabilityStatus::Disabled;
    std::vector<anomaly::RowExplanation> explanations_;
    std::string diagnostic_;
};

struct StageTiming {
    std::string stage;
    double duration_ms = 0.0;
};

struct DetectionResult {
    size_t row = 0; // index into DetectionReport::table
    double score = 0.0;
    std::optional<anomaly::RowExplanation> explanation;
};

struct RunMetadata {
    size_t original_rows = 0;
    size_t cleaned_rows = 0;
    size_t rows_removed = 0;
    size_t total_columns = 0;
    size_t numeric_columns = 0;
    std::vector<std::string> numeric_column_names;
    std::vector<std::string> column_names;
    std::vector<std::string> feature_columns;
    std::vector<std::string> dropped_zero_variance_columns;
    double contamination_rate = 0.0; // percent of scored rows flagged
    ExplainabilityStatus explainability_status = ExplainabilityStatus::Disabled;
    std::optional<std::string> explainability_error;
    std::string scorer;
    std::string upload_name;
    pipeline::DecodeReport decode;
    size_t cells_neutralized = 0;
    size_t infinite_values_replaced = 0;
};

struct DetectionReport {
    pipeline::Table table; // sanitized rows that were scored
    size_t total_rows = 0;
    std::vector<DetectionResult> anomalies; // descending score
    RunMetadata metadata;
    std::vector<StageTiming> timings;
};

struct CategoricalAnomaly {
    size_t row = 0;
    double score = 0.0;
    std::vector<anomaly::FeatureLoss> per_feature; // descending loss
};

struct CategoricalMetadata {
    std::string method;
    double threshold = 0.0;
    double threshold_percentile = 0.0;
    std::vector<std::string> categorical_columns;
    size_t original_rows = 0;
    size_t total_columns = 0;
    std::string upload_name;
    pipeline::DecodeReport decode;
    size_t cells_neutralized = 0;
};

struct CategoricalReport {
    pipeline::Table table;
    size_t total_rows = 0;
    std::vector<CategoricalAnomaly> anomalies;
    CategoricalMetadata metadata;
    std::vector<StageTiming> timings;
};

// Runs one upload through validation, decoding and sanitization, then the
// numeric or categorical detection path. Holds no per-request state; safe to
// share across server threads.
class DetectionOrchestrator {
public:
    inline static const std::string kMissingCategory = "__NA__";

    // Throws std::invalid_argument when no scorer is given.
    DetectionOrchestrator(SanitizationLimits limits, anomaly::Collaborators collaborators);

    // Throws pipeline::PipelineError. Explainer failures never throw; they are
    // reported in RunMetadata.
    auto DetectNumeric(pipeline::RawUpload* upload) const -> DetectionReport;

    // threshold_percentile must lie in [0, 100].
    auto DetectCategorical(pipeline::RawUpload* upload, double threshold_percentile) const -> CategoricalReport;

    [[nodiscard]] auto Limits() const -> const SanitizationLimits& { return limits_; }
    [[nodiscard]] auto CategoricalAvailable() const -> bool { return collaborators_.reconstruction.IsEnabled(); }

private:
    struct Ingested {
        pipeline::Table table;
        pipeline::DecodeReport decode;
        size_t cells_neutralized = 0;
        std::string upload_name;
    };

    auto Ingest(pipeline::RawUpload* upload, std::vector<StageTiming>& timings) const -> Ingested;
    auto ExplainSafely(const pipeline::FeatureMatrix& matrix, const std::vector<size_t>& rows) const
        -> ExplanationOutcome;

    SanitizationLimits limits_;
    anomaly::Collaborators collaborators_;
};

} // namespace csvsentry
