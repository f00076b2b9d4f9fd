#include "core/pipeline_builder.hpp"
#include "core/error.hpp"
#include "core/pipeline.hpp"
#include "core/pipeline_stages.hpp"
#include "logging/logger.hpp"

#include <format>
#include <stdexcept>

namespace apipipe {

PipelineBuilder& PipelineBuilder::with_config(const AppConfig& config) {
    const auto& v = config.versioning;

    const auto mode = parse_match_mode(v.match);
    if (!mode) {
        throw ConfigurationError(std::format("Unknown version match mode '{}'", v.match));
    }

    c_.supported_versions = std::make_shared<const SupportedVersionSet>(v.supported);
    c_.deprecation_registry = std::make_shared<const DeprecationRegistry>(
        DeprecationRegistry::EntryMap(v.deprecated.begin(), v.deprecated.end()));
    c_.bypass = BypassRules{v.bypass_exact, v.bypass_prefixes};
    c_.match_mode = *mode;
    c_.middleware = config.middleware;
    c_.tracing_enabled = config.tracing.enabled;
    c_.app_logger = config.logging.app_logger;
    return *this;
}

std::shared_ptr<Pipeline> PipelineBuilder::build() {
    if (!c_.handler) throw std::runtime_error("PipelineBuilder: handler is required");
    if (!c_.supported_versions) throw std::runtime_error("PipelineBuilder: supported_versions is required");
    if (!c_.deprecation_registry) c_.deprecation_registry = std::make_shared<const DeprecationRegistry>();

    auto& logger = logging::get_logger(std::format("{}.middleware", c_.app_logger));
    const auto& mw = c_.middleware;

    std::vector<std::unique_ptr<IMiddleware>> stages;
    if (mw.request_id) stages.push_back(std::make_unique<RequestIdStage>());
    if (c_.tracing_enabled) stages.push_back(std::make_unique<TraceScopeStage>());
    if (mw.timing) stages.push_back(std::make_unique<TimingStage>(logger, mw.slow_request_threshold));
    if (mw.request_logging) {
        stages.push_back(std::make_unique<RequestLoggingStage>(
            logger, mw.sensitive_headers, mw.trusted_proxies));
    }
    stages.push_back(std::make_unique<VersionStage>(
        VersionResolver(c_.supported_versions, c_.bypass, c_.match_mode), logger));
    stages.push_back(std::make_unique<DeprecationStage>(
        DeprecationAnnotator(c_.deprecation_registry), logger));

    for (auto& extra : c_.extra_stages) stages.push_back(std::move(extra));
    c_.extra_stages.clear();

    return std::make_shared<Pipeline>(std::move(stages), std::move(c_.handler));
}

} // namespace apipipe
