#include "server/builtin_routes.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <format>

namespace apipipe {

namespace {

ApiResponse json_response(int status, const nlohmann::json& body) {
    return ApiResponse::json(status, body.dump());
}

ApiResponse redirect(std::string location) {
    ApiResponse response;
    response.status = 307;
    response.headers["Location"] = std::move(location);
    return response;
}

double unix_time() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

} // anonymous namespace

std::string docs_version(const SupportedVersionSet& supported) {
    if (supported.contains("v1")) return "v1";
    return supported.latest().value_or("v1");
}

void register_builtin_routes(RouteTable& routes,
                             const SupportedVersionSet& supported,
                             const DeprecationRegistry& deprecations,
                             BuiltinRouteOptions options) {
    const std::string service = options.service_name;

    routes.get("/health", [service](RequestContext&) {
        return json_response(200, {{"status", "ok"}, {"service", service},
                                   {"message", "Service is running"}});
    });

    routes.get("/health/live", [](RequestContext&) {
        return json_response(200, {{"status", "ok"}, {"timestamp", unix_time()},
                                   {"message", "Application is live"}});
    });

    routes.get("/health/ready", [probe = std::move(options.ready_probe)](RequestContext&) {
        if (probe && !probe()) {
            return json_response(503, {{"status", "error"},
                                       {"message", "Application is not ready"}});
        }
        return json_response(200, {{"status", "ok"},
                                   {"message", "Application is ready to accept requests"}});
    });

    const std::string docs_url = std::format("/api/{}/docs", docs_version(supported));
    routes.get("/", [docs_url](RequestContext&) { return redirect(docs_url); });
    routes.get("/docs", [docs_url](RequestContext&) { return redirect(docs_url); });

    for (const auto& version : supported.versions()) {
        nlohmann::json body{{"service", service}, {"version", version}};
        if (const auto* entry = deprecations.find(version)) {
            body["status"] = "deprecated";
            body["sunset"] = entry->sunset;
            body["replacement"] = entry->replacement;
        } else {
            body["status"] = "supported";
        }
        routes.get(std::format("/api/{}/docs", version),
                   [payload = body.dump()](RequestContext&) {
                       return ApiResponse::json(200, payload);
                   });
    }
}

} // namespace apipipe
