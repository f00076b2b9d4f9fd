#include <catch2/catch_test_macros.hpp>
#include "tracing/trace_context.hpp"
#include "tracing/trace_scope.hpp"

using namespace apipipe;

// ============================================================================
// W3C Trace Context Tests
// ============================================================================

TEST_CASE("TraceContext: parse valid traceparent", "[tracing]") {
    auto ctx = TraceContext::parse_traceparent(
        "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01");

    REQUIRE(ctx.has_value());
    REQUIRE(to_hex(ctx->trace_id) == "4bf92f3577b34da6a3ce929d0e0e4736");
    REQUIRE(to_hex(ctx->parent_span_id) == "00f067aa0ba902b7");
    REQUIRE(ctx->trace_flags == 0x01);
    REQUIRE(ctx->is_sampled());
    REQUIRE(ctx->span_id != 0);  // Generated new span
    REQUIRE(ctx->span_id != ctx->parent_span_id);
}

TEST_CASE("TraceContext: parse unsampled traceparent", "[tracing]") {
    auto ctx = TraceContext::parse_traceparent(
        "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-00");

    REQUIRE(ctx.has_value());
    REQUIRE(ctx->trace_flags == 0x00);
    REQUIRE_FALSE(ctx->is_sampled());
    REQUIRE_FALSE(ctx->is_recording());
}

TEST_CASE("TraceContext: reject invalid version", "[tracing]") {
    auto ctx = TraceContext::parse_traceparent(
        "01-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01");
    REQUIRE_FALSE(ctx.has_value());
}

TEST_CASE("TraceContext: reject too short header", "[tracing]") {
    auto ctx = TraceContext::parse_traceparent("00-abcd-1234-01");
    REQUIRE_FALSE(ctx.has_value());
}

TEST_CASE("TraceContext: reject trailing data after flags", "[tracing]") {
    const std::string valid = "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01";
    REQUIRE(TraceContext::parse_traceparent(valid).has_value());
    REQUIRE_FALSE(TraceContext::parse_traceparent(valid + "garbage").has_value());
    REQUIRE_FALSE(TraceContext::parse_traceparent(valid + "-extra").has_value());
}

TEST_CASE("TraceContext: reject all-zero trace_id", "[tracing]") {
    auto ctx = TraceContext::parse_traceparent(
        "00-00000000000000000000000000000000-00f067aa0ba902b7-01");
    REQUIRE_FALSE(ctx.has_value());
}

TEST_CASE("TraceContext: reject all-zero parent_id", "[tracing]") {
    auto ctx = TraceContext::parse_traceparent(
        "00-4bf92f3577b34da6a3ce929d0e0e4736-0000000000000000-01");
    REQUIRE_FALSE(ctx.has_value());
}

TEST_CASE("TraceContext: reject invalid hex characters", "[tracing]") {
    auto ctx = TraceContext::parse_traceparent(
        "00-zzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzz-00f067aa0ba902b7-01");
    REQUIRE_FALSE(ctx.has_value());
}

TEST_CASE("TraceContext: reject bad separators", "[tracing]") {
    auto ctx = TraceContext::parse_traceparent(
        "00_4bf92f3577b34da6a3ce929d0e0e4736_00f067aa0ba902b7_01");
    REQUIRE_FALSE(ctx.has_value());
}

TEST_CASE("TraceContext: generate creates valid context", "[tracing]") {
    auto ctx = TraceContext::generate();

    REQUIRE(to_hex(ctx.trace_id).size() == 32);
    REQUIRE(to_hex(ctx.span_id).size() == 16);
    REQUIRE(ctx.is_valid());
    REQUIRE(ctx.is_sampled());
    REQUIRE(ctx.parent_span_id == 0);
}

TEST_CASE("TraceContext: generate unique IDs", "[tracing]") {
    auto ctx1 = TraceContext::generate();
    auto ctx2 = TraceContext::generate();

    REQUIRE_FALSE(ctx1.trace_id == ctx2.trace_id);
    REQUIRE(ctx1.span_id != ctx2.span_id);
}

TEST_CASE("TraceContext: to_traceparent round-trip", "[tracing]") {
    auto original = TraceContext::generate();
    auto header = original.to_traceparent();

    // Format: "00-{32hex}-{16hex}-{2hex}"
    REQUIRE(header.size() == 55);
    REQUIRE(header.substr(0, 3) == "00-");
    REQUIRE(header.substr(53) == "01");

    // Parse it back
    auto parsed = TraceContext::parse_traceparent(header);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->trace_id == original.trace_id);
    // parent_span_id will be original's span_id
    REQUIRE(parsed->parent_span_id == original.span_id);
}

TEST_CASE("TraceContext: child keeps trace and links parent", "[tracing]") {
    auto parent = TraceContext::generate();
    parent.tracestate = "vendor=abc";
    const auto child = parent.child();

    REQUIRE(child.trace_id == parent.trace_id);
    REQUIRE(child.parent_span_id == parent.span_id);
    REQUIRE(child.span_id != parent.span_id);
    REQUIRE(child.tracestate == "vendor=abc");
}

TEST_CASE("TraceContext: hex identifiers are zero-padded lowercase", "[tracing]") {
    REQUIRE(to_hex(uint64_t{0xABC}) == "0000000000000abc");
    REQUIRE(to_hex(TraceId{0, 1}) == "00000000000000000000000000000001");
}

TEST_CASE("TraceContext: is_valid rejects empty IDs", "[tracing]") {
    TraceContext ctx;
    REQUIRE_FALSE(ctx.is_valid());
    REQUIRE_FALSE(ctx.is_recording());
}

TEST_CASE("TraceContext: is_valid rejects zero span", "[tracing]") {
    TraceContext ctx;
    ctx.trace_id = TraceContext::generate_trace_id();
    ctx.span_id = 0;
    REQUIRE_FALSE(ctx.is_valid());
}

// ============================================================================
// TraceScope
// ============================================================================

TEST_CASE("TraceScope: nested scopes restore the previous context", "[tracing]") {
    REQUIRE(TraceScope::current() == nullptr);

    const auto outer_ctx = TraceContext::generate();
    {
        TraceScope outer(outer_ctx);
        REQUIRE(TraceScope::current() == &outer_ctx);

        const auto inner_ctx = outer_ctx.child();
        {
            TraceScope inner(inner_ctx);
            REQUIRE(TraceScope::current() == &inner_ctx);
        }
        REQUIRE(TraceScope::current() == &outer_ctx);
    }
    REQUIRE(TraceScope::current() == nullptr);
}
