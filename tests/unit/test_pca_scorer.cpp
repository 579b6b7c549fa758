#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>

#include "detectors/frequency_reconstruction_scorer.h"
#include "detectors/pca_model.h"
#include "detectors/pca_scorer.h"

namespace csvsentry::anomaly {
namespace {

// Points along y = 2x with small alternating noise, plus one off-line row.
auto LineWithOutlier() -> pipeline::FeatureMatrix {
    pipeline::FeatureMatrix m;
    m.feature_names = {"x", "y"};
    m.values = linalg::Matrix(21, 2);
    for (size_t i = 0; i < 20; ++i) {
        m.values(i, 0) = static_cast<double>(i);
        m.values(i, 1) = 2.0 * static_cast<double>(i) + (i % 2 == 0 ? 0.1 : -0.1);
    }
    m.values(20, 0) = 10.0;
    m.values(20, 1) = -10.0;
    return m;
}

TEST(PcaModelTest, KeepsFewerComponentsThanFeatures) {
    auto m = LineWithOutlier();
    auto model = PcaModel::Fit(m.values);
    EXPECT_EQ(model.Dimension(), 2u);
    EXPECT_EQ(model.ComponentCount(), 1u);
    EXPECT_GT(model.ExplainedVariance()[0], 0.0);
}

TEST(PcaModelTest, RejectsEmptyMatrix) {
    EXPECT_THROW(PcaModel::Fit(linalg::Matrix()), std::invalid_argument);
}

TEST(PcaScorerTest, FlagsOffLineRowWithHighestScore) {
    auto m = LineWithOutlier();
    PcaScorer scorer(0.1);
    auto result = scorer.FitAndScore(m);

    ASSERT_EQ(result.scores.size(), 21u);
    ASSERT_EQ(result.labels.size(), 21u);
    EXPECT_EQ(result.labels[20], 1);
    auto max_it = std::max_element(result.scores.begin(), result.scores.end());
    EXPECT_EQ(std::distance(result.scores.begin(), max_it), 20);

    long flagged = std::count(result.labels.begin(), result.labels.end(), 1);
    EXPECT_GE(flagged, 1);
    EXPECT_LE(flagged, 3);
}

TEST(PcaScorerTest, DeterministicAcrossCalls) {
    auto m = LineWithOutlier();
    PcaScorer scorer;
    auto a = scorer.FitAndScore(m);
    auto b = scorer.FitAndScore(m);
    EXPECT_EQ(a.labels, b.labels);
    EXPECT_EQ(a.scores, b.scores);
}

TEST(PcaScorerTest, ContaminationMustBeInRange) {
    EXPECT_THROW(PcaScorer(0.0), std::invalid_argument);
    EXPECT_THROW(PcaScorer(0.6), std::invalid_argument);
    EXPECT_NO_THROW(PcaScorer(0.5));
}

TEST(PcaResidualExplainerTest, AttributionMagnitudesSumToScore) {
    auto m = LineWithOutlier();
    PcaScorer scorer;
    auto scored = scorer.FitAndScore(m);

    PcaResidualExplainer explainer;
    auto explanations = explainer.Explain(m, {20, 3});
    ASSERT_EQ(explanations.size(), 2u);

    const auto& outlier = explanations[0];
    ASSERT_EQ(outlier.features.size(), 2u);
    EXPECT_EQ(outlier.features[0].feature, "x");
    EXPECT_DOUBLE_EQ(outlier.features[1].value, -10.0);
    double total = 0.0;
    for (const auto& f : outlier.features) {
        total += std::abs(f.attribution);
    }
    EXPECT_NEAR(total, scored.scores[20], 1e-9);
    ASSERT_TRUE(outlier.base_value.has_value());
    EXPECT_LT(*outlier.base_value, scored.scores[20]);
}

TEST(PcaResidualExplainerTest, RejectsRowOutsideMatrix) {
    auto m = LineWithOutlier();
    PcaResidualExplainer explainer;
    EXPECT_THROW(explainer.Explain(m, {21}), std::out_of_range);
}

TEST(FrequencyReconstructionScorerTest, RareValuesLoseMore) {
    pipeline::Table table({pipeline::Column::MakeText(
        "color", {std::string("blue"), std::string("red"), std::string("red"), std::string("red")})});
    FrequencyReconstructionScorer scorer;
    auto result = scorer.FitAndScore(table);

    ASSERT_EQ(result.total_loss.size(), 4u);
    EXPECT_EQ(result.features, std::vector<std::string>{"color"});
    EXPECT_NEAR(result.total_loss[0], -std::log(0.25), 1e-12);
    EXPECT_NEAR(result.total_loss[1], -std::log(0.75), 1e-12);
    EXPECT_NEAR(result.feature_losses[0][0], result.total_loss[0], 1e-12);
}

TEST(FrequencyReconstructionScorerTest, LossesAddAcrossColumns) {
    pipeline::Table table({
        pipeline::Column::MakeText("a", {std::string("x"), std::string("y")}),
        pipeline::Column::MakeText("b", {std::string("z"), std::string("z")}),
    });
    FrequencyReconstructionScorer scorer;
    auto result = scorer.FitAndScore(table);
    EXPECT_NEAR(result.total_loss[0], -std::log(0.5), 1e-12);
    EXPECT_NEAR(result.feature_losses[1][1], 0.0, 1e-12);
}

TEST(FrequencyReconstructionScorerTest, RejectsUnfilledMissingCells) {
    pipeline::Table table({pipeline::Column::MakeText("a", {std::string("x"), std::nullopt})});
    FrequencyReconstructionScorer scorer;
    EXPECT_THROW(scorer.FitAndScore(table), std::invalid_argument);
}

} // namespace
} // namespace csvsentry::anomaly
