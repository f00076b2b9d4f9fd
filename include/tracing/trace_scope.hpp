#pragma once

#include "tracing/trace_context.hpp"

namespace apipipe {

/**
 * @brief RAII activation of a trace context on the current thread
 *
 * Scopes nest: the constructor makes @p ctx the ambient context and the
 * destructor restores whatever was active before. The referenced context
 * must outlive the scope.
 *
 * Usage:
 *   TraceContext ctx = TraceContext::generate();
 *   {
 *       TraceScope scope(ctx);
 *       log.info("..."); // carries ctx's trace_id / span_id
 *   }
 */
class TraceScope {
public:
    explicit TraceScope(const TraceContext& ctx) noexcept;
    ~TraceScope();

    TraceScope(const TraceScope&) = delete;
    TraceScope& operator=(const TraceScope&) = delete;

    /// Active context on this thread, or nullptr when no scope is open
    [[nodiscard]] static const TraceContext* current() noexcept;

private:
    const TraceContext* previous_;
};

} // namespace apipipe
