// Included first so the header has to bring in the registry itself.
#include "obs/metrics.h"

#include <gtest/gtest.h>
#include <string>

#include "metrics.h"

TEST(ObsMetricsTest, EmitCounterUpdatesRegistry) {
    csvsentry::obs::EmitCounter("test_obs_counter", 3, "count", "test");
    auto text = csvsentry::metrics::MetricsRegistry::Instance().ToPrometheus();
    EXPECT_NE(text.find("test_obs_counter"), std::string::npos);
}

TEST(ObsMetricsTest, EmitHistogramUpdatesRegistry) {
    csvsentry::obs::EmitHistogram("test_obs_latency_ms", 12.5, "ms", "test");
    auto text = csvsentry::metrics::MetricsRegistry::Instance().ToPrometheus();
    EXPECT_NE(text.find("test_obs_latency_ms_count"), std::string::npos);
    EXPECT_NE(text.find("test_obs_latency_ms_sum"), std::string::npos);
}

TEST(ObsMetricsTest, LabelledSeriesAreCountedSeparately) {
    auto& registry = csvsentry::metrics::MetricsRegistry::Instance();
    long before = registry.GetCounter("test_labelled_total", {{"kind", "TooLarge"}});
    csvsentry::obs::EmitCounter("test_labelled_total", 2, "requests", "test", {{"kind", "TooLarge"}});
    csvsentry::obs::EmitCounter("test_labelled_total", 1, "requests", "test", {{"kind", "Empty"}});
    EXPECT_EQ(registry.GetCounter("test_labelled_total", {{"kind", "TooLarge"}}), before + 2);
    EXPECT_EQ(registry.GetCounter("test_never_seen_total"), 0);
}

TEST(ObsMetricsTest, HistogramSuffixPrecedesLabels) {
    csvsentry::obs::EmitHistogram("test_route_ms", 1.0, "ms", "test", {{"route", "/detect"}});
    auto text = csvsentry::metrics::MetricsRegistry::Instance().ToPrometheus();
    EXPECT_NE(text.find("test_route_ms_count{route=\"/detect\"}"), std::string::npos);
}

TEST(ObsMetricsTest, ExpositionDeclaresMetricTypes) {
    csvsentry::obs::EmitCounter("test_typed_total", 1, "count", "test");
    csvsentry::obs::EmitHistogram("test_typed_ms", 3.0, "ms", "test");
    auto text = csvsentry::metrics::MetricsRegistry::Instance().ToPrometheus();
    EXPECT_NE(text.find("# TYPE test_typed_total counter\n"), std::string::npos);
    EXPECT_NE(text.find("# TYPE test_typed_ms summary\n"), std::string::npos);
    EXPECT_NE(text.find("test_typed_ms_max 3.000000"), std::string::npos);
}
