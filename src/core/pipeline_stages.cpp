#include "core/pipeline_stages.hpp"
#include "core/utils.hpp"
#include "server/client_info.hpp"
#include "server/http_constants.hpp"
#include "tracing/span.hpp"
#include "tracing/trace_scope.hpp"

#include <format>
#include <optional>

namespace apipipe {

// ============================================================================
// RequestIdStage
// ============================================================================
ApiResponse RequestIdStage::handle(RequestContext& ctx, const Handler& next) {
    auto incoming = utils::trim(ctx.header(http::kRequestIdHeader));
    if (!incoming.empty()) ctx.request_id = std::string(incoming);

    auto response = next(ctx);
    response.headers[http::kRequestIdHeader] = ctx.request_id;
    return response;
}

// ============================================================================
// TraceScopeStage
// ============================================================================
ApiResponse TraceScopeStage::handle(RequestContext& ctx, const Handler& next) {
    const auto incoming = TraceContext::parse_traceparent(ctx.header(http::kTraceparentHeader));
    if (incoming) {
        ctx.trace_context = *incoming;
        ctx.trace_context.tracestate = ctx.header(http::kTracestateHeader);
    } else {
        ctx.trace_context = TraceContext::generate();
    }
    ctx.tracing_active = true;

    ApiResponse response;
    {
        TraceScope scope(ctx.trace_context);
        response = next(ctx);
    }
    response.headers[http::kTraceparentHeader] = ctx.trace_context.to_traceparent();
    if (!ctx.trace_context.tracestate.empty()) {
        response.headers[http::kTracestateHeader] = ctx.trace_context.tracestate;
    }
    return response;
}

// ============================================================================
// TimingStage
// ============================================================================
ApiResponse TimingStage::handle(RequestContext& ctx, const Handler& next) {
    utils::Timer timer;
    auto response = next(ctx);
    const double elapsed_ms = timer.elapsed_ms_f();

    response.headers[http::kResponseTimeHeader] = std::format("{:.2f}ms", elapsed_ms);

    logger_.info(std::format("{} {} completed in {:.2f}ms (status: {})",
                             ctx.method, ctx.path, elapsed_ms, response.status));
    if (elapsed_ms > static_cast<double>(slow_threshold_.count())) {
        logger_.warn(std::format("Slow request: {} {} took {:.2f}ms",
                                 ctx.method, ctx.path, elapsed_ms),
                     {{"threshold_ms", std::to_string(slow_threshold_.count())}});
    }
    return response;
}

// ============================================================================
// RequestLoggingStage
// ============================================================================
RequestLoggingStage::RequestLoggingStage(logging::Logger& logger,
                                         const std::vector<std::string>& sensitive_headers,
                                         std::vector<std::string> trusted_proxies)
    : logger_(logger), trusted_proxies_(std::move(trusted_proxies)) {
    for (const auto& h : sensitive_headers) sensitive_.insert(utils::to_lower(h));
}

ApiResponse RequestLoggingStage::handle(RequestContext& ctx, const Handler& next) {
    ctx.client_ip = extract_client_ip(ctx.remote_addr, ctx.header(http::kForwardedForHeader),
                                      trusted_proxies_);

    logging::Fields fields{{"request_id", ctx.request_id}, {"client_ip", ctx.client_ip}};
    for (auto& [name, value] : sanitize_headers(ctx.headers, sensitive_)) {
        fields.emplace_back("header." + utils::to_lower(name), std::move(value));
    }
    logger_.info(std::format("Request started: {} {}", ctx.method, ctx.path), std::move(fields));

    std::optional<ApiResponse> response;
    try {
        response = next(ctx);
    } catch (const std::exception& e) {
        logger_.error(std::format("Request failed: {} {}", ctx.method, ctx.path),
                      {{"request_id", ctx.request_id}, {"error", e.what()}});
        throw;
    }

    logger_.info(std::format("Request completed: {} {} (status: {})",
                             ctx.method, ctx.path, response->status),
                 {{"request_id", ctx.request_id}});
    return std::move(*response);
}

// ============================================================================
// VersionStage
// ============================================================================
ApiResponse VersionStage::handle(RequestContext& ctx, const Handler& next) {
    {
        ScopedSpan span(ctx, "api.version_resolve");
        const auto resolution = resolver_.resolve(ctx.path);

        switch (resolution.decision) {
            case VersionDecision::BYPASS:
            case VersionDecision::UNVERSIONED:
                break;

            case VersionDecision::REJECT:
                ctx.version_rejected = true;
                logger_.info(std::format("Rejected unsupported API version {}", resolution.version),
                             {{"path", ctx.path}});
                return ApiResponse::detail(
                    404, std::format("API version {} not found", resolution.version),
                    ErrorCode::VERSION_NOT_FOUND);

            case VersionDecision::ACCEPT:
                if (!ctx.set_api_version(resolution.version)) {
                    logger_.debug(std::format("API version already set to {}, ignoring {}",
                                              *ctx.api_version(), resolution.version));
                }
                break;
        }
    }
    return next(ctx);
}

// ============================================================================
// DeprecationStage
// ============================================================================
ApiResponse DeprecationStage::handle(RequestContext& ctx, const Handler& next) {
    auto response = next(ctx);
    if (annotator_.annotate(ctx.api_version(), response.headers)) {
        ctx.deprecation_signalled = true;
        logger_.debug(std::format("Deprecated API version {} used", *ctx.api_version()),
                      {{"path", ctx.path}});
    }
    return response;
}

} // namespace apipipe
