#pragma once

#include "server/route_table.hpp"
#include "versioning/api_version.hpp"
#include "versioning/deprecation_registry.hpp"

#include <functional>
#include <string>

namespace apipipe {

struct BuiltinRouteOptions {
    std::string service_name = "api-pipeline";
    std::function<bool()> ready_probe;   // Empty = always ready
};

/**
 * @brief Docs version for the "/" and "/docs" redirects
 *
 * "v1" when supported, otherwise the highest supported version.
 */
[[nodiscard]] std::string docs_version(const SupportedVersionSet& supported);

/**
 * @brief Register the service's own endpoints
 *
 * GET /health, /health/live, /health/ready
 * GET /, /docs                → 307 to /api/<docs_version>/docs
 * GET /api/<v>/docs           → version status for each supported version
 */
void register_builtin_routes(RouteTable& routes,
                             const SupportedVersionSet& supported,
                             const DeprecationRegistry& deprecations,
                             BuiltinRouteOptions options = {});

} // namespace apipipe
