#pragma once

#include "config/config_types.hpp"
#include "core/middleware.hpp"
#include "versioning/api_version.hpp"
#include "versioning/deprecation_registry.hpp"

#include <memory>
#include <string>
#include <vector>

namespace apipipe {

// Forward declarations
class Pipeline;

/**
 * @brief All components that Pipeline needs, grouped in a single struct.
 *
 * Version tables are immutable and shared read-only between request
 * threads; adding a component only requires adding a field here.
 */
struct PipelineComponents {
    // Required
    std::shared_ptr<const SupportedVersionSet> supported_versions;
    Handler handler;

    // Optional (nullptr = no deprecated versions)
    std::shared_ptr<const DeprecationRegistry> deprecation_registry;

    // Version resolution
    BypassRules bypass;
    VersionMatchMode match_mode = VersionMatchMode::ANCHORED;

    // Stage toggles and settings
    MiddlewareConfig middleware;
    bool tracing_enabled = true;
    std::string app_logger = "api_pipeline";

    // Appended after the built-in stages, before the handler
    std::vector<std::unique_ptr<IMiddleware>> extra_stages;
};

/**
 * @brief Builder pattern for Pipeline construction.
 *
 * Usage:
 *   auto pipeline = PipelineBuilder()
 *       .with_supported_versions(std::make_shared<const SupportedVersionSet>(
 *           SupportedVersionSet{"v1", "v2"}))
 *       .with_deprecation_registry(registry)    // optional
 *       .with_handler(routes.as_handler())
 *       .build();
 */
class PipelineBuilder {
public:
    PipelineBuilder& with_supported_versions(std::shared_ptr<const SupportedVersionSet> p) { c_.supported_versions = std::move(p); return *this; }
    PipelineBuilder& with_deprecation_registry(std::shared_ptr<const DeprecationRegistry> p) { c_.deprecation_registry = std::move(p); return *this; }
    PipelineBuilder& with_handler(Handler h)                      { c_.handler = std::move(h); return *this; }
    PipelineBuilder& with_bypass_rules(BypassRules rules)         { c_.bypass = std::move(rules); return *this; }
    PipelineBuilder& with_match_mode(VersionMatchMode mode)       { c_.match_mode = mode; return *this; }
    PipelineBuilder& with_middleware_config(MiddlewareConfig cfg) { c_.middleware = std::move(cfg); return *this; }
    PipelineBuilder& with_tracing_enabled(bool enabled)           { c_.tracing_enabled = enabled; return *this; }
    PipelineBuilder& with_app_logger(std::string name)            { c_.app_logger = std::move(name); return *this; }
    PipelineBuilder& with_stage(std::unique_ptr<IMiddleware> s)   { c_.extra_stages.push_back(std::move(s)); return *this; }

    /**
     * @brief Take versioning, middleware, tracing and logger settings from config
     * @throws ConfigurationError on malformed version ids or match mode
     * @throws MisconfiguredDeprecationError for a deprecated entry without replacement
     */
    PipelineBuilder& with_config(const AppConfig& config);

    /**
     * @brief Build the Pipeline from accumulated components.
     * @throws std::runtime_error if required components are missing.
     */
    [[nodiscard]] std::shared_ptr<Pipeline> build();

private:
    PipelineComponents c_;
};

} // namespace apipipe
