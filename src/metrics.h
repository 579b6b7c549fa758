#pragma once

#include <map>
#include <mutex>
#include <string>

namespace csvsentry::metrics {

using Labels = std::map<std::string, std::string>;

// Process-wide counters and latency summaries, rendered for GET /metrics.
class MetricsRegistry {
public:
    static MetricsRegistry& Instance() {
        static MetricsRegistry instance;
        return instance;
    }

    void Increment(const std::string& name, const Labels& labels, long value = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name][labels] += value;
    }

    void RecordLatency(const std::string& name, const Labels& labels, double ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& s = summaries_[name][labels];
        s.count++;
        s.sum += ms;
        if (ms > s.max) s.max = ms;
    }

    // Zero when the series has never been incremented.
    long GetCounter(const std::string& name, const Labels& labels = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto family = counters_.find(name);
        if (family == counters_.end()) return 0;
        auto it = family->second.find(labels);
        return it == family->second.end() ? 0 : it->second;
    }

    // Prometheus text exposition format.
    std::string ToPrometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string out;
        for (const auto& family : counters_) {
            out += "# TYPE " + family.first + " counter\n";
            for (const auto& series : family.second) {
                out += family.first + FormatLabels(series.first) + " " + std::to_string(series.second) + "\n";
            }
        }
        for (const auto& family : summaries_) {
            out += "# TYPE " + family.first + " summary\n";
            for (const auto& series : family.second) {
                std::string labels = FormatLabels(series.first);
                out += family.first + "_count" + labels + " " + std::to_string(series.second.count) + "\n";
                out += family.first + "_sum" + labels + " " + std::to_string(series.second.sum) + "\n";
                out += family.first + "_max" + labels + " " + std::to_string(series.second.max) + "\n";
            }
        }
        return out;
    }

private:
    struct Summary {
        long count = 0;
        double sum = 0.0;
        double max = 0.0;
    };

    MetricsRegistry() = default;

    static std::string FormatLabels(const Labels& labels) {
        if (labels.empty()) return "";
        std::string out = "{";
        for (auto it = labels.begin(); it != labels.end(); ++it) {
            if (it != labels.begin()) out += ",";
            out += it->first + "=\"" + it->second + "\"";
        }
        return out + "}";
    }

    std::mutex mutex_;
    std::map<std::string, std::map<Labels, long>> counters_;
    std::map<std::string, std::map<Labels, Summary>> summaries_;
};

} // namespace csvsentry::metrics
