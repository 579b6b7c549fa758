#include "detection_orchestrator.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "linalg/matrix.h"
#include "obs/error_codes.h"
#include "obs/logging.h"
#include "obs/metrics.h"
#include "pipeline/cell_sanitizer.h"
#include "pipeline/name_sanitizer.h"
#include "pipeline/pipeline_error.h"
#include "pipeline/value_policy.h"

namespace csvsentry {

using pipeline::ErrorKind;
using pipeline::PipelineError;

namespace {

constexpr const char* kComponent = "orchestrator";

template <typename Fn>
auto TimedStage(const char* stage, std::vector<StageTiming>& timings, Fn&& fn) {
    obs::ScopedTimer timer("pipeline_stage", kComponent, {{"stage", stage}});
    if constexpr (std::is_void_v<decltype(fn())>) {
        fn();
        timings.push_back({stage, timer.Stop()});
    } else {
        auto result = fn();
        timings.push_back({stage, timer.Stop()});
        return result;
    }
}

void SortByMagnitude(anomaly::RowExplanation& explanation) {
    std::stable_sort(explanation.features.begin(), explanation.features.end(),
                     [](const anomaly::FeatureAttribution& a, const anomaly::FeatureAttribution& b) {
                         return std::abs(a.attribution) > std::abs(b.attribution);
                     });
}

// Row indices ordered by descending score, ties by row order.
auto RankByScore(const std::vector<size_t>& rows, const std::vector<double>& scores) -> std::vector<size_t> {
    std::vector<size_t> ranked = rows;
    std::stable_sort(ranked.begin(), ranked.end(), [&scores](size_t a, size_t b) { return scores[a] > scores[b]; });
    return ranked;
}

} // namespace

auto ExplainabilityStatusName(ExplainabilityStatus status) -> const char* {
    switch (status) {
        case ExplainabilityStatus::Explained: return "explained";
        case ExplainabilityStatus::Disabled: return "disabled";
        case ExplainabilityStatus::Failed: return "failed";
    }
    return "disabled";
}

auto ExplanationOutcome::Explained(std::vector<anomaly::RowExplanation> explanations) -> ExplanationOutcome {
    ExplanationOutcome outcome;
    outcome.status_ = ExplainabilityStatus::Explained;
    outcome.explanations_ = std::move(explanations);
    return outcome;
}

auto ExplanationOutcome::Disabled() -> ExplanationOutcome {
    return ExplanationOutcome();
}

auto ExplanationOutcome::Failed(std::string diagnostic) -> ExplanationOutcome {
    ExplanationOutcome outcome;
    outcome.status_ = ExplainabilityStatus::Failed;
    outcome.diagnostic_ = std::move(diagnostic);
    return outcome;
}

DetectionOrchestrator::DetectionOrchestrator(SanitizationLimits limits, anomaly::Collaborators collaborators)
    : limits_(limits), collaborators_(std::move(collaborators)) {
    if (!collaborators_.scorer) {
        throw std::invalid_argument("DetectionOrchestrator requires a scorer");
    }
}

auto DetectionOrchestrator::Ingest(pipeline::RawUpload* upload, std::vector<StageTiming>& timings) const
    -> Ingested {
    pipeline::FileValidator validator(limits_);
    auto validated = TimedStage("validate", timings, [&] { return validator.Validate(upload); });

    pipeline::TabularDecoder decoder(limits_);
    auto decoded = TimedStage("decode", timings, [&] { return decoder.Decode(validated.bytes); });
    // The decoded table is the only copy from here on.
    std::string().swap(validated.bytes);

    Ingested ingested;
    ingested.table = std::move(decoded.table);
    ingested.decode = decoded.report;
    ingested.upload_name = validated.sanitized_filename;

    TimedStage("sanitize_names", timings, [&] { pipeline::NameSanitizer::Apply(ingested.table); });
    ingested.cells_neutralized =
        TimedStage("sanitize_cells", timings, [&] { return pipeline::CellSanitizer::Apply(ingested.table); });
    if (ingested.cells_neutralized > 0) {
        obs::EmitCounter("cells_neutralized_total", static_cast<long>(ingested.cells_neutralized), "cells",
                         kComponent);
    }
    return ingested;
}

auto DetectionOrchestrator::ExplainSafely(const pipeline::FeatureMatrix& matrix,
                                          const std::vector<size_t>& rows) const -> ExplanationOutcome {
    if (!collaborators_.explainer.IsEnabled()) {
        return ExplanationOutcome::Disabled();
    }
    if (rows.empty()) {
        return ExplanationOutcome::Explained({});
    }

    std::string diagnostic;
    try {
        auto explanations = collaborators_.explainer.Get().Explain(matrix, rows);
        if (explanations.size() != rows.size()) {
            diagnostic = "explainer returned " + std::to_string(explanations.size()) + " explanations for " +
                         std::to_string(rows.size()) + " rows";
        } else {
            for (auto& explanation : explanations) {
                SortByMagnitude(explanation);
            }
            return ExplanationOutcome::Explained(std::move(explanations));
        }
    } catch (const std::exception& e) {
        diagnostic = e.what();
    } catch (...) {
        diagnostic = "explainer raised a non-standard exception";
    }

    obs::LogEvent(obs::LogLevel::Warn, "explainability_failed", kComponent,
                  {{"error_code", obs::kErrExplainerFailed}, {"error", diagnostic}, {"rows", rows.size()}});
    obs::EmitCounter("explainability_failures_total", 1, "requests", kComponent);
    return ExplanationOutcome::Failed(diagnostic);
}

auto DetectionOrchestrator::DetectNumeric(pipeline::RawUpload* upload) const -> DetectionReport {
    DetectionReport report;
    Ingested ingested = Ingest(upload, report.timings);
    pipeline::Table& table = ingested.table;

    RunMetadata& meta = report.metadata;
    meta.upload_name = ingested.upload_name;
    meta.decode = ingested.decode;
    meta.cells_neutralized = ingested.cells_neutralized;
    meta.original_rows = table.RowCount();
    meta.total_columns = table.ColumnCount();
    meta.column_names = table.ColumnNames();
    meta.numeric_column_names = table.NumericColumnNames();
    meta.numeric_columns = meta.numeric_column_names.size();
    meta.scorer = collaborators_.scorer->Name();

    if (meta.numeric_columns < limits_.min_numeric_columns) {
        throw PipelineError(ErrorKind::NoNumericColumns,
                            meta.numeric_columns == 0
                                ? "No numeric columns found in CSV"
                                : "At least " + std::to_string(limits_.min_numeric_columns) +
                                      " numeric columns required, found " + std::to_string(meta.numeric_columns));
    }

    auto policy = TimedStage("value_policy", report.timings,
                             [&] { return pipeline::ValuePolicy::Apply(table, meta.numeric_column_names); });
    meta.cleaned_rows = policy.remaining_rows;
    meta.rows_removed = policy.rows_removed;
    meta.infinite_values_replaced = policy.infinite_values_replaced;
    if (policy.rows_removed > 0) {
        obs::EmitCounter("rows_removed_total", static_cast<long>(policy.rows_removed), "rows", kComponent);
    }

    auto prepared =
        TimedStage("prepare_features", report.timings, [&] { return pipeline::FeaturePreparer::Prepare(table); });
    meta.feature_columns = prepared.matrix.feature_names;
    meta.dropped_zero_variance_columns = prepared.dropped_zero_variance;
    const size_t rows = prepared.matrix.Rows();

    anomaly::ScoreResult scored = TimedStage("score", report.timings, [&] {
        try {
            return collaborators_.scorer->FitAndScore(prepared.matrix);
        } catch (const std::exception& e) {
            obs::LogEvent(obs::LogLevel::Error, "scorer_failed", kComponent,
                          {{"error_code", obs::kErrScorerFailed}, {"error", e.what()}, {"scorer", meta.scorer}});
            throw PipelineError(ErrorKind::ScorerFailure, std::string("scorer failed: ") + e.what());
        } catch (...) {
            obs::LogEvent(obs::LogLevel::Error, "scorer_failed", kComponent,
                          {{"error_code", obs::kErrScorerFailed}, {"scorer", meta.scorer}});
            throw PipelineError(ErrorKind::ScorerFailure, "scorer raised a non-standard exception");
        }
    });
    if (scored.labels.size() != rows || scored.scores.size() != rows) {
        throw PipelineError(ErrorKind::ScorerFailure,
                            "scorer returned " + std::to_string(scored.labels.size()) + " labels and " +
                                std::to_string(scored.scores.size()) + " scores for " + std::to_string(rows) +
                                " rows");
    }

    std::vector<size_t> flagged;
    for (size_t r = 0; r < rows; ++r) {
        if (scored.labels[r] == 1) flagged.push_back(r);
    }
    std::vector<size_t> ranked = RankByScore(flagged, scored.scores);

    ExplanationOutcome outcome =
        TimedStage("explain", report.timings, [&] { return ExplainSafely(prepared.matrix, ranked); });
    meta.explainability_status = outcome.Status();
    if (outcome.Status() == ExplainabilityStatus::Failed) {
        meta.explainability_error = outcome.Diagnostic();
    }

    report.anomalies.reserve(ranked.size());
    for (size_t i = 0; i < ranked.size(); ++i) {
        DetectionResult result;
        result.row = ranked[i];
        result.score = scored.scores[ranked[i]];
        if (outcome.Status() == ExplainabilityStatus::Explained) {
            result.explanation = outcome.Explanations()[i];
        }
        report.anomalies.push_back(std::move(result));
    }

    report.total_rows = rows;
    meta.contamination_rate = 100.0 * static_cast<double>(ranked.size()) / static_cast<double>(rows);
    report.table = std::move(table);

    obs::EmitCounter("rows_scored_total", static_cast<long>(rows), "rows", kComponent, {{"path", "numeric"}});
    obs::EmitCounter("anomalies_flagged_total", static_cast<long>(ranked.size()), "rows", kComponent,
                     {{"path", "numeric"}});
    obs::LogEvent(obs::LogLevel::Info, "detection_complete", kComponent,
                  {{"rows", rows},
                   {"anomalies", ranked.size()},
                   {"features", meta.feature_columns.size()},
                   {"explainability", ExplainabilityStatusName(meta.explainability_status)}});
    return report;
}

auto DetectionOrchestrator::DetectCategorical(pipeline::RawUpload* upload, double threshold_percentile) const
    -> CategoricalReport {
    if (!(threshold_percentile >= 0.0 && threshold_percentile <= 100.0)) {
        throw PipelineError(ErrorKind::InvalidArgument, "threshold_percentile must be between 0 and 100");
    }

    CategoricalReport report;
    Ingested ingested = Ingest(upload, report.timings);
    pipeline::Table& table = ingested.table;

    CategoricalMetadata& meta = report.metadata;
    meta.upload_name = ingested.upload_name;
    meta.decode = ingested.decode;
    meta.cells_neutralized = ingested.cells_neutralized;
    meta.original_rows = table.RowCount();
    meta.total_columns = table.ColumnCount();
    meta.threshold_percentile = threshold_percentile;
    meta.categorical_columns = table.TextColumnNames();
    if (meta.categorical_columns.empty()) {
        throw PipelineError(ErrorKind::NoCategoricalColumns, "No categorical columns found in CSV");
    }
    if (!collaborators_.reconstruction.IsEnabled()) {
        throw PipelineError(ErrorKind::ReconstructionScorerFailure,
                            "categorical reconstruction scorer is not configured");
    }
    const auto& scorer = collaborators_.reconstruction.Get();
    meta.method = scorer.Name();

    pipeline::Table categorical = table.Select(meta.categorical_columns);
    for (auto& column : categorical.Columns()) {
        for (auto& cell : column.texts) {
            if (!cell) cell = kMissingCategory;
        }
    }

    const size_t rows = categorical.RowCount();
    const size_t width = categorical.ColumnCount();
    anomaly::ReconstructionResult scored = TimedStage("score", report.timings, [&] {
        try {
            return scorer.FitAndScore(categorical);
        } catch (const std::exception& e) {
            obs::LogEvent(obs::LogLevel::Error, "reconstruction_scorer_failed", kComponent,
                          {{"error_code", obs::kErrReconstructionScorerFailed}, {"error", e.what()}});
            throw PipelineError(ErrorKind::ReconstructionScorerFailure,
                                std::string("reconstruction scorer failed: ") + e.what());
        } catch (...) {
            obs::LogEvent(obs::LogLevel::Error, "reconstruction_scorer_failed", kComponent,
                          {{"error_code", obs::kErrReconstructionScorerFailed}});
            throw PipelineError(ErrorKind::ReconstructionScorerFailure,
                                "reconstruction scorer raised a non-standard exception");
        }
    });

    bool shape_ok = scored.total_loss.size() == rows && scored.feature_losses.size() == rows &&
                    scored.features.size() == width;
    for (size_t r = 0; shape_ok && r < rows; ++r) {
        shape_ok = scored.feature_losses[r].size() == width;
    }
    if (!shape_ok) {
        throw PipelineError(ErrorKind::ReconstructionScorerFailure,
                            "reconstruction scorer returned a result that does not match the table shape");
    }

    meta.threshold = linalg::percentile(scored.total_loss, threshold_percentile);

    std::vector<size_t> flagged;
    for (size_t r = 0; r < rows; ++r) {
        if (scored.total_loss[r] > meta.threshold) flagged.push_back(r);
    }
    for (size_t row : RankByScore(flagged, scored.total_loss)) {
        CategoricalAnomaly entry;
        entry.row = row;
        entry.score = scored.total_loss[row];
        entry.per_feature.reserve(width);
        for (size_t c = 0; c < width; ++c) {
            entry.per_feature.push_back({scored.features[c], scored.feature_losses[row][c]});
        }
        std::stable_sort(entry.per_feature.begin(), entry.per_feature.end(),
                         [](const anomaly::FeatureLoss& a, const anomaly::FeatureLoss& b) { return a.loss > b.loss; });
        report.anomalies.push_back(std::move(entry));
    }

    report.total_rows = rows;
    report.table = std::move(table);

    obs::EmitCounter("rows_scored_total", static_cast<long>(rows), "rows", kComponent, {{"path", "categorical"}});
    obs::EmitCounter("anomalies_flagged_total", static_cast<long>(report.anomalies.size()), "rows", kComponent,
                     {{"path", "categorical"}});
    obs::LogEvent(obs::LogLevel::Info, "categorical_detection_complete", kComponent,
                  {{"rows", rows},
                   {"anomalies", report.anomalies.size()},
                   {"threshold", meta.threshold},
                   {"categorical_columns", width}});
    return report;
}

} // namespace csvsentry
