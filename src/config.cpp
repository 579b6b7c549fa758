#include "config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace csvsentry {

namespace {

auto EnvValue(const char* name) -> const char* {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return nullptr;
    }
    return value;
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
void ReadSize(const char* name, size_t min_value, size_t& target) {
    const char* env = EnvValue(name);
    if (!env) return;
    try {
        std::string raw(env);
        if (raw.find('-') != std::string::npos) {
            throw std::invalid_argument("negative");
        }
        size_t parsed = std::stoul(raw);
        if (parsed < min_value) {
            throw std::out_of_range("below minimum");
        }
        target = parsed;
        spdlog::info("Using {} from env: {}", name, parsed);
    } catch (const std::exception& e) {
        spdlog::warn("Invalid {}: '{}' ({}). Using default: {}", name, env, e.what(), target);
    }
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
void ReadDouble(const char* name, double min_value, double max_value, double& target) {
    const char* env = EnvValue(name);
    if (!env) return;
    try {
        double parsed = std::stod(env);
        if (!(parsed >= min_value && parsed <= max_value)) {
            throw std::out_of_range("outside allowed range");
        }
        target = parsed;
        spdlog::info("Using {} from env: {}", name, parsed);
    } catch (const std::exception& e) {
        spdlog::warn("Invalid {}: '{}' ({}). Using default: {}", name, env, e.what(), target);
    }
}

void ReadBool(const char* name, bool& target) {
    const char* env = EnvValue(name);
    if (!env) return;
    std::string v(env);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        target = true;
    } else if (v == "0" || v == "false" || v == "no" || v == "off") {
        target = false;
    } else {
        spdlog::warn("Invalid {}: '{}'. Using default: {}", name, env, target);
    }
}

} // namespace

auto LoadServiceConfigFromEnv() -> ServiceConfig {
    ServiceConfig config;

    size_t max_file_size_mb = config.limits.max_file_size_bytes / (1024ULL * 1024ULL);
    ReadSize("MAX_FILE_SIZE_MB", 1, max_file_size_mb);
    config.limits.max_file_size_bytes = max_file_size_mb * 1024ULL * 1024ULL;
    ReadSize("MAX_ROWS", 1, config.limits.max_rows);
    ReadSize("MAX_COLUMNS", 1, config.limits.max_columns);
    ReadSize("MIN_NUMERIC_COLUMNS", 1, config.limits.min_numeric_columns);

    if (const char* host = EnvValue("API_HOST")) {
        config.host = host;
    }
    size_t port = static_cast<size_t>(config.port);
    ReadSize("API_PORT", 1, port);
    if (port > 65535) {
        spdlog::warn("Invalid API_PORT: {}. Using default: 8000", port);
        port = 8000;
    }
    config.port = static_cast<int>(port);

    ReadDouble("DETECT_CONTAMINATION", 1e-6, 0.5, config.detection.contamination);
    ReadDouble("PCA_VARIANCE_RETAINED", 1e-6, 1.0, config.detection.pca_variance_retained);
    ReadDouble("CATEGORICAL_THRESHOLD_PERCENTILE", 0.0, 100.0,
               config.detection.categorical_threshold_percentile);
    ReadBool("EXPLAINABILITY_ENABLED", config.detection.explainability_enabled);
    ReadBool("CATEGORICAL_ENABLED", config.detection.categorical_enabled);

    return config;
}

} // namespace csvsentry
