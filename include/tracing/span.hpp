#pragma once

#include "tracing/trace_context.hpp"
#include "tracing/trace_scope.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace apipipe {

// Forward declaration
struct RequestContext;

/**
 * @brief Represents a single span in the pipeline execution
 *
 * Stages that do measurable work get their own span with timing information.
 * Spans are collected in RequestContext::spans.
 */
struct Span {
    uint64_t span_id = 0;         // 0 when tracing is off for the request
    uint64_t parent_span_id = 0;  // Request-level span ID
    std::string operation;        // e.g. "api.version_resolve"
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
};

/**
 * @brief RAII span helper: creates span on construction, finishes on destruction
 *
 * While alive, a child of the ambient trace context is active on this
 * thread, so log lines emitted inside carry the child's span_id. Without an
 * ambient context the span is still timed but no scope is opened.
 *
 * Usage:
 *   ApiResponse VersionStage::handle(RequestContext& ctx, const Handler& next) {
 *       ScopedSpan span(ctx, "api.version_resolve");
 *       // ...
 *   } // span automatically recorded on scope exit
 */
class ScopedSpan {
public:
    ScopedSpan(RequestContext& ctx, const char* operation);
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

private:
    RequestContext& ctx_;
    Span span_;
    TraceContext context_;
    std::optional<TraceScope> scope_;
};

} // namespace apipipe
