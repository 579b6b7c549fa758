#include "route_registry.h"

namespace csvsentry::api {

const std::vector<RouteSpec> kRequiredRoutes = {
    {"POST", "/detect", "DetectNumeric"},
    {"POST", "/detect/categorical", "DetectCategorical"},
    {"GET", "/healthz", "HealthCheck"},
    {"GET", "/limits", "GetLimits"},
    {"GET", "/metrics", "Metrics"}
};

} // namespace csvsentry::api
