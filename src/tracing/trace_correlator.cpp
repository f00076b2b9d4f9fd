#include "tracing/trace_correlator.hpp"
#include "tracing/trace_scope.hpp"

#include <memory>

namespace apipipe {

namespace {

TraceIds sentinel() {
    return TraceIds{std::string(kZeroTraceId), std::string(kZeroSpanId)};
}

const TraceContext* ambient_scope() {
    return TraceScope::current();
}

} // anonymous namespace

TraceIds correlate(const TraceContext* ctx) {
    if (ctx == nullptr || !ctx->is_recording()) return sentinel();
    return TraceIds{to_hex(ctx->trace_id), to_hex(ctx->span_id)};
}

TraceIds current_trace_ids(const ScopeProvider& provider) noexcept {
    try {
        return correlate(provider ? provider() : nullptr);
    } catch (const std::exception&) {
        return sentinel();
    } catch (...) {
        return sentinel();
    }
}

TraceIds current_trace_ids() noexcept {
    return current_trace_ids(ScopeProvider(&ambient_scope));
}

TraceCorrelationFilter::TraceCorrelationFilter()
    : provider_(&ambient_scope) {}

bool TraceCorrelationFilter::filter(logging::LogRecord& record) noexcept {
    auto ids = current_trace_ids(provider_);
    record.trace_id = std::move(ids.trace_id);
    record.span_id = std::move(ids.span_id);
    return true;
}

void install_trace_correlation(std::string_view app_logger_name) {
    const auto filter = std::make_shared<TraceCorrelationFilter>();
    logging::get_logger().add_filter(filter);
    if (!app_logger_name.empty()) {
        logging::get_logger(app_logger_name).add_filter(filter);
    }
}

} // namespace apipipe
