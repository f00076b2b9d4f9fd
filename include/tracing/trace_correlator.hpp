#pragma once

#include "logging/logger.hpp"
#include "tracing/trace_context.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace apipipe {

inline constexpr std::string_view kZeroTraceId = logging::kUnsetTraceId;
inline constexpr std::string_view kZeroSpanId = logging::kUnsetSpanId;

/**
 * @brief Hex identifiers attached to log records
 *
 * Always 32 / 16 lowercase hex chars; all zeros when nothing is recording.
 */
struct TraceIds {
    std::string trace_id;
    std::string span_id;
};

/// Supplies the ambient context snapshot (nullptr = no active scope)
using ScopeProvider = std::function<const TraceContext*()>;

/**
 * @brief Identifiers for a context snapshot
 *
 * Non-recording (unsampled or invalid) contexts and nullptr map to the
 * zero sentinel.
 */
[[nodiscard]] TraceIds correlate(const TraceContext* ctx);

/**
 * @brief Identifiers for whatever @p provider reports as active
 *
 * Never throws: a provider that fails yields the sentinel.
 */
[[nodiscard]] TraceIds current_trace_ids(const ScopeProvider& provider) noexcept;

/// Same, reading the thread's TraceScope
[[nodiscard]] TraceIds current_trace_ids() noexcept;

/**
 * @brief Log filter stamping trace_id / span_id on every record
 *
 * Never drops a record.
 */
class TraceCorrelationFilter final : public logging::ILogFilter {
public:
    TraceCorrelationFilter();
    explicit TraceCorrelationFilter(ScopeProvider provider)
        : provider_(std::move(provider)) {}

    bool filter(logging::LogRecord& record) noexcept override;

private:
    ScopeProvider provider_;
};

/**
 * @brief Install one correlation filter on the root logger and on the
 * application logger @p app_logger_name (and thereby on their descendants)
 */
void install_trace_correlation(std::string_view app_logger_name);

} // namespace apipipe
