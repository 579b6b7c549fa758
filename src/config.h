#pragma once

#include <cstddef>
#include <string>

namespace csvsentry {

// Upload and table bounds. Read once at startup and passed by value into the
// pipeline; nothing mutates it at request time.
struct SanitizationLimits {
    size_t max_file_size_bytes = 200ULL * 1024ULL * 1024ULL;
    size_t max_rows = 1000000;
    size_t max_columns = 200;
    size_t min_numeric_columns = 1;
};

struct DetectionConfig {
    double contamination = 0.1; // share of rows the default scorer flags
    double pca_variance_retained = 0.9;
    double categorical_threshold_percentile = 95.0;
    bool explainability_enabled = true;
    bool categorical_enabled = true;
};

struct ServiceConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    SanitizationLimits limits;
    DetectionConfig detection;
};

// Reads MAX_FILE_SIZE_MB, MAX_ROWS, MAX_COLUMNS, MIN_NUMERIC_COLUMNS, API_HOST,
// API_PORT, DETECT_CONTAMINATION, PCA_VARIANCE_RETAINED,
// CATEGORICAL_THRESHOLD_PERCENTILE, EXPLAINABILITY_ENABLED, CATEGORICAL_ENABLED.
// Unparseable or out-of-range values are logged and the default is kept.
auto LoadServiceConfigFromEnv() -> ServiceConfig;

} // namespace csvsentry
