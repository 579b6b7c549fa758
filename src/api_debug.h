#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include "detection_orchestrator.h"

namespace csvsentry::api {

struct DebugMetaArgs {
    double duration_ms;
    long row_count;
    std::vector<StageTiming> stages;
};

inline auto BuildDebugMeta(const DebugMetaArgs& args) -> nlohmann::json {
    nlohmann::json meta;
    meta["duration_ms"] = args.duration_ms;
    meta["row_count"] = args.row_count;
    if (!args.stages.empty()) {
        nlohmann::json stages = nlohmann::json::array();
        for (const auto& s : args.stages) {
            stages.push_back({{"stage", s.stage}, {"duration_ms", s.duration_ms}});
        }
        meta["stages"] = stages;
    }
    return meta;
}

} // namespace csvsentry::api
