#include "tracing/span.hpp"
#include "core/request_context.hpp"

namespace apipipe {

ScopedSpan::ScopedSpan(RequestContext& ctx, const char* operation)
    : ctx_(ctx) {
    span_.operation = operation;
    if (const auto* parent = TraceScope::current()) {
        context_ = parent->child();
        span_.span_id = context_.span_id;
        span_.parent_span_id = parent->span_id;
        scope_.emplace(context_);
    }
    span_.start_time = std::chrono::steady_clock::now();
}

ScopedSpan::~ScopedSpan() {
    span_.end_time = std::chrono::steady_clock::now();
    scope_.reset();
    ctx_.spans.push_back(std::move(span_));
}

} // namespace apipipe
