#include "config/config_loader.hpp"
#include "core/pipeline.hpp"
#include "core/pipeline_builder.hpp"
#include "logging/log_setup.hpp"
#include "logging/logger.hpp"
#include "server/builtin_routes.hpp"
#include "server/http_server.hpp"
#include "server/route_table.hpp"
#include "tracing/trace_correlator.hpp"
#include "versioning/api_version.hpp"
#include "versioning/deprecation_registry.hpp"

#include <csignal>
#include <format>
#include <memory>

using namespace apipipe;

// Global instance for signal handling
std::shared_ptr<HttpServer> g_server;

void signal_handler(int signal) {
    logging::get_logger("api_pipeline").info(
        std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    install_trace_correlation("api_pipeline");
    auto& logger = logging::get_logger("api_pipeline");
    try {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/api_pipeline.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        logger.info(std::format("[1/4] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            logger.error(config_result.error_message);
            return 1;
        }
        const AppConfig& config = config_result.config;

        // Reconfigure logging first so everything after carries trace ids
        logging::configure_logging(config.logging);
        auto& app_log = logging::get_logger(config.logging.app_logger);
        app_log.info(std::format("[2/4] Logging configured (level={}, format={})",
                                 config.logging.level, config.logging.format));

        // Version tables (throws on misconfigured deprecation entries)
        const auto supported = std::make_shared<const SupportedVersionSet>(config.versioning.supported);
        const auto deprecations = std::make_shared<const DeprecationRegistry>(
            DeprecationRegistry::EntryMap(config.versioning.deprecated.begin(),
                                          config.versioning.deprecated.end()));

        auto routes = std::make_shared<RouteTable>();
        BuiltinRouteOptions route_options;
        route_options.service_name = config.tracing.service_name;
        route_options.ready_probe = [] { return g_server && g_server->is_running(); };
        register_builtin_routes(*routes, *supported, *deprecations, std::move(route_options));

        std::shared_ptr<const RouteTable> handler_routes = routes;
        auto pipeline = PipelineBuilder()
            .with_config(config)
            .with_supported_versions(supported)
            .with_deprecation_registry(deprecations)
            .with_handler([handler_routes](RequestContext& ctx) { return handler_routes->dispatch(ctx); })
            .build();

        std::string stage_list;
        for (const auto stage : pipeline->stage_names()) {
            if (!stage_list.empty()) stage_list += " -> ";
            stage_list += stage;
        }
        app_log.info(std::format("[3/4] Pipeline built: {} ({} routes, {} versions, {} deprecated)",
                                 stage_list, routes->size(), supported->size(), deprecations->size()));

        g_server = std::make_shared<HttpServer>(pipeline, config.server);
        app_log.info(std::format("[4/4] Server ready on http://{}:{}",
                                 config.server.host, config.server.port));

        // Start HTTP server (blocking)
        g_server->start();

        const auto stats = pipeline->get_stats();
        app_log.info(std::format("Served {} requests ({} rejected versions, {} deprecated)",
                                 stats.total_requests, stats.requests_rejected,
                                 stats.deprecated_responses));
    } catch (const std::exception& e) {
        logger.error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
