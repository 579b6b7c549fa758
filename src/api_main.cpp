#include "api_server.h"

#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "config.h"
#include "detection_orchestrator.h"
#include "detectors/default_collaborators.h"

int main() {
    auto console = spdlog::stdout_color_mt("console");
    spdlog::set_default_logger(console);

    try {
        csvsentry::ServiceConfig config = csvsentry::LoadServiceConfigFromEnv();
        auto orchestrator = std::make_shared<csvsentry::DetectionOrchestrator>(
            config.limits, csvsentry::anomaly::MakeDefaultCollaborators(config.detection));

        csvsentry::api::ApiServer server(config, orchestrator);
        server.Start(config.host, config.port);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error in API Server: {}", e.what());
        return 1;
    }

    return 0;
}
