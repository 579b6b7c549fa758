#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "../metrics.h"
#include "obs/logging.h"

namespace csvsentry {
namespace obs {

namespace detail {

inline void LogMetric(const std::string& name,
                      const nlohmann::json& value,
                      const std::string& unit,
                      const std::string& component,
                      const metrics::Labels& labels,
                      const nlohmann::json& fields) {
    nlohmann::json payload = fields;
    payload["metric_name"] = name;
    payload["value"] = value;
    payload["unit"] = unit;
    if (!labels.empty()) {
        payload["labels"] = labels;
    }
    LogEvent(LogLevel::Info, "metric", component, payload);
}

} // namespace detail

// Records into the registry and mirrors the sample as a structured log line.
inline void EmitCounter(const std::string& name,
                        long value,
                        const std::string& unit,
                        const std::string& component,
                        const metrics::Labels& labels = {},
                        const nlohmann::json& fields = nlohmann::json::object()) {
    metrics::MetricsRegistry::Instance().Increment(name, labels, value);
    detail::LogMetric(name, value, unit, component, labels, fields);
}

inline void EmitHistogram(const std::string& name,
                          double value,
                          const std::string& unit,
                          const std::string& component,
                          const metrics::Labels& labels = {},
                          const nlohmann::json& fields = nlohmann::json::object()) {
    metrics::MetricsRegistry::Instance().RecordLatency(name, labels, value);
    detail::LogMetric(name, value, unit, component, labels, fields);
}

} // namespace obs
} // namespace csvsentry
