#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace apipipe {

/**
 * @brief 128-bit trace identifier
 */
struct TraceId {
    uint64_t high = 0;
    uint64_t low = 0;

    [[nodiscard]] bool is_zero() const noexcept { return high == 0 && low == 0; }
    bool operator==(const TraceId&) const = default;
};

/// 32 lowercase hex chars, zero-padded
[[nodiscard]] std::string to_hex(const TraceId& id);

/// 16 lowercase hex chars, zero-padded
[[nodiscard]] std::string to_hex(uint64_t span_id);

/**
 * @brief W3C Trace Context (traceparent + tracestate)
 *
 * Identifiers are held as integers; hex is produced at the edges
 * (traceparent header, log records).
 *
 * Format: "00-{trace_id}-{parent_id}-{flags}"
 *   trace_id: 32 hex chars (128-bit)
 *   parent_id: 16 hex chars (64-bit)
 *   flags: 2 hex chars (8-bit, 01 = sampled)
 */
struct TraceContext {
    TraceId trace_id;
    uint64_t span_id = 0;          // Span of this service
    uint64_t parent_span_id = 0;   // From incoming traceparent (0 = root)
    uint8_t trace_flags = 1;       // 01 = sampled by default
    std::string tracestate;        // Opaque vendor-specific state (propagated as-is)

    [[nodiscard]] bool is_valid() const noexcept {
        return !trace_id.is_zero() && span_id != 0;
    }
    [[nodiscard]] bool is_sampled() const noexcept { return (trace_flags & 0x01) != 0; }

    /// Valid and sampled: log lines and spans are attributed to this context
    [[nodiscard]] bool is_recording() const noexcept { return is_valid() && is_sampled(); }

    /// Generate a fresh trace context (new trace_id + span_id)
    [[nodiscard]] static TraceContext generate();

    /// Same trace, new span whose parent is this span
    [[nodiscard]] TraceContext child() const;

    /// Parse W3C traceparent header: "00-{trace_id}-{parent_id}-{flags}"
    [[nodiscard]] static std::optional<TraceContext> parse_traceparent(std::string_view header);

    /// Serialize to traceparent header value
    [[nodiscard]] std::string to_traceparent() const;

    /// Random non-zero 64-bit span ID
    [[nodiscard]] static uint64_t generate_span_id();

    /// Random non-zero 128-bit trace ID
    [[nodiscard]] static TraceId generate_trace_id();
};

} // namespace apipipe
