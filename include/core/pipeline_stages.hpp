#pragma once

#include "core/middleware.hpp"
#include "core/types.hpp"
#include "logging/logger.hpp"
#include "versioning/api_version.hpp"
#include "versioning/deprecation_registry.hpp"

#include <chrono>
#include <string>
#include <unordered_set>
#include <vector>

namespace apipipe {

// ============================================================================
// Outer stages (identity, tracing, observability)
// ============================================================================

/**
 * @brief Takes X-Request-ID from the request (or keeps the generated UUID)
 * and echoes it on the response
 */
class RequestIdStage final : public IMiddleware {
public:
    [[nodiscard]] ApiResponse handle(RequestContext& ctx, const Handler& next) override;
    [[nodiscard]] std::string_view name() const override { return "request_id"; }
};

/**
 * @brief Continues an incoming traceparent (or starts a new trace) and keeps
 * the request's TraceScope open for the rest of the chain
 */
class TraceScopeStage final : public IMiddleware {
public:
    [[nodiscard]] ApiResponse handle(RequestContext& ctx, const Handler& next) override;
    [[nodiscard]] std::string_view name() const override { return "trace_scope"; }
};

class TimingStage final : public IMiddleware {
public:
    TimingStage(logging::Logger& logger, std::chrono::milliseconds slow_threshold)
        : logger_(logger), slow_threshold_(slow_threshold) {}

    [[nodiscard]] ApiResponse handle(RequestContext& ctx, const Handler& next) override;
    [[nodiscard]] std::string_view name() const override { return "timing"; }

private:
    logging::Logger& logger_;
    const std::chrono::milliseconds slow_threshold_;
};

/**
 * @brief Logs request start/completion with client IP and redacted headers
 *
 * Downstream exceptions are logged and rethrown.
 */
class RequestLoggingStage final : public IMiddleware {
public:
    RequestLoggingStage(logging::Logger& logger,
                        const std::vector<std::string>& sensitive_headers,
                        std::vector<std::string> trusted_proxies);

    [[nodiscard]] ApiResponse handle(RequestContext& ctx, const Handler& next) override;
    [[nodiscard]] std::string_view name() const override { return "request_logging"; }

private:
    logging::Logger& logger_;
    std::unordered_set<std::string> sensitive_;
    const std::vector<std::string> trusted_proxies_;
};

// ============================================================================
// Versioning stages
// ============================================================================

/**
 * @brief Resolves the path's API version
 *
 * Unsupported version → 404 {"detail": "API version vN not found"} and the
 * rest of the chain never runs.
 */
class VersionStage final : public IMiddleware {
public:
    VersionStage(VersionResolver resolver, logging::Logger& logger)
        : resolver_(std::move(resolver)), logger_(logger) {}

    [[nodiscard]] ApiResponse handle(RequestContext& ctx, const Handler& next) override;
    [[nodiscard]] std::string_view name() const override { return "version"; }

private:
    const VersionResolver resolver_;
    logging::Logger& logger_;
};

class DeprecationStage final : public IMiddleware {
public:
    DeprecationStage(DeprecationAnnotator annotator, logging::Logger& logger)
        : annotator_(std::move(annotator)), logger_(logger) {}

    [[nodiscard]] ApiResponse handle(RequestContext& ctx, const Handler& next) override;
    [[nodiscard]] std::string_view name() const override { return "deprecation"; }

private:
    const DeprecationAnnotator annotator_;
    logging::Logger& logger_;
};

} // namespace apipipe
