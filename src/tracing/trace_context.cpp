#include "tracing/trace_context.hpp"
#include <charconv>
#include <format>
#include <random>

namespace apipipe {

namespace {

bool is_valid_hex(std::string_view s) {
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'))) {
            return false;
        }
    }
    return true;
}

// s holds at most 16 hex chars (already validated)
uint64_t parse_hex_u64(std::string_view s) {
    uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value, 16);
    return (ec == std::errc{}) ? value : 0;
}

uint64_t random_u64() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;
    return dis(gen);
}

} // anonymous namespace

std::string to_hex(const TraceId& id) {
    return std::format("{:016x}{:016x}", id.high, id.low);
}

std::string to_hex(uint64_t span_id) {
    return std::format("{:016x}", span_id);
}

TraceContext TraceContext::generate() {
    TraceContext ctx;
    ctx.trace_id = generate_trace_id();
    ctx.span_id = generate_span_id();
    ctx.trace_flags = 0x01; // sampled
    return ctx;
}

TraceContext TraceContext::child() const {
    TraceContext ctx;
    ctx.trace_id = trace_id;
    ctx.parent_span_id = span_id;
    ctx.span_id = generate_span_id();
    ctx.trace_flags = trace_flags;
    ctx.tracestate = tracestate;
    return ctx;
}

std::optional<TraceContext> TraceContext::parse_traceparent(std::string_view header) {
    // Format: "VV-TTTTTTTTTTTTTTTTTTTTTTTTTTTTTTTT-PPPPPPPPPPPPPPPP-FF"
    // Lengths: 2 + 1 + 32 + 1 + 16 + 1 + 2 = 55, exactly, for version 00

    if (header.size() != 55) return std::nullopt;

    // Validate separators
    if (header[2] != '-' || header[35] != '-' || header[52] != '-') {
        return std::nullopt;
    }

    const auto version = header.substr(0, 2);
    const auto trace_hex = header.substr(3, 32);
    const auto parent_hex = header.substr(36, 16);
    const auto flags = header.substr(53, 2);

    // Version must be "00"
    if (version != "00") return std::nullopt;

    if (!is_valid_hex(trace_hex) || !is_valid_hex(parent_hex) || !is_valid_hex(flags)) {
        return std::nullopt;
    }

    TraceContext ctx;
    ctx.trace_id.high = parse_hex_u64(trace_hex.substr(0, 16));
    ctx.trace_id.low = parse_hex_u64(trace_hex.substr(16, 16));
    ctx.parent_span_id = parse_hex_u64(parent_hex);

    // Neither trace_id nor parent_id may be all zeros
    if (ctx.trace_id.is_zero() || ctx.parent_span_id == 0) return std::nullopt;

    ctx.span_id = generate_span_id(); // New span for this request
    ctx.trace_flags = static_cast<uint8_t>(parse_hex_u64(flags));
    return ctx;
}

std::string TraceContext::to_traceparent() const {
    return std::format("00-{}-{}-{:02x}", to_hex(trace_id), to_hex(span_id), trace_flags);
}

uint64_t TraceContext::generate_span_id() {
    uint64_t id = 0;
    while (id == 0) id = random_u64();
    return id;
}

TraceId TraceContext::generate_trace_id() {
    TraceId id;
    while (id.is_zero()) {
        id.high = random_u64();
        id.low = random_u64();
    }
    return id;
}

} // namespace apipipe
