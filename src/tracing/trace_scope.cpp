#include "tracing/trace_scope.hpp"

namespace apipipe {

namespace {
thread_local const TraceContext* t_current = nullptr;
}

TraceScope::TraceScope(const TraceContext& ctx) noexcept
    : previous_(t_current) {
    t_current = &ctx;
}

TraceScope::~TraceScope() {
    t_current = previous_;
}

const TraceContext* TraceScope::current() noexcept {
    return t_current;
}

} // namespace apipipe
