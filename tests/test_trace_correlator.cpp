#include <catch2/catch_test_macros.hpp>
#include "tracing/trace_correlator.hpp"
#include "tracing/trace_scope.hpp"
#include "mocks/memory_log_sink.hpp"

#include <stdexcept>

using namespace apipipe;
using apipipe::testing::CapturedLogs;

namespace {

TraceContext fixed_context() {
    TraceContext ctx;
    ctx.trace_id = TraceId{0x4bf92f3577b34da6ULL, 0xa3ce929d0e0e4736ULL};
    ctx.span_id = 0x00f067aa0ba902b7ULL;
    ctx.trace_flags = 0x01;
    return ctx;
}

} // namespace

// ============================================================================
// Identifier extraction
// ============================================================================

TEST_CASE("TraceCorrelator: recording context yields fixed-width hex", "[trace_correlator]") {
    const auto ctx = fixed_context();
    const auto ids = correlate(&ctx);
    CHECK(ids.trace_id == "4bf92f3577b34da6a3ce929d0e0e4736");
    CHECK(ids.span_id == "00f067aa0ba902b7");
}

TEST_CASE("TraceCorrelator: small ids are zero padded", "[trace_correlator]") {
    TraceContext ctx;
    ctx.trace_id = TraceId{0, 0x1f};
    ctx.span_id = 0x2a;
    const auto ids = correlate(&ctx);
    CHECK(ids.trace_id == "0000000000000000000000000000001f");
    CHECK(ids.span_id == "000000000000002a");
}

TEST_CASE("TraceCorrelator: no scope yields the zero sentinel", "[trace_correlator]") {
    const auto ids = correlate(nullptr);
    CHECK(ids.trace_id == std::string(32, '0'));
    CHECK(ids.span_id == std::string(16, '0'));
}

TEST_CASE("TraceCorrelator: non-recording scope yields the zero sentinel", "[trace_correlator]") {
    auto unsampled = fixed_context();
    unsampled.trace_flags = 0x00;
    CHECK(correlate(&unsampled).trace_id == kZeroTraceId);

    TraceContext invalid;
    CHECK(correlate(&invalid).span_id == kZeroSpanId);
}

TEST_CASE("TraceCorrelator: failing provider degrades to the sentinel", "[trace_correlator]") {
    const ScopeProvider broken = []() -> const TraceContext* {
        throw std::runtime_error("tracing backend unavailable");
    };
    const auto ids = current_trace_ids(broken);
    CHECK(ids.trace_id == kZeroTraceId);
    CHECK(ids.span_id == kZeroSpanId);
}

TEST_CASE("TraceCorrelator: provider throwing a non-exception degrades to the sentinel",
          "[trace_correlator]") {
    const ScopeProvider broken = []() -> const TraceContext* { throw 42; };
    const auto ids = current_trace_ids(broken);
    CHECK(ids.trace_id == kZeroTraceId);
    CHECK(ids.span_id == kZeroSpanId);

    TraceCorrelationFilter filter(broken);
    logging::LogRecord record;
    record.trace_id = "stale";
    CHECK(filter.filter(record));
    CHECK(record.trace_id == kZeroTraceId);
}

TEST_CASE("TraceCorrelator: ambient scope is read at call time", "[trace_correlator]") {
    CHECK(current_trace_ids().trace_id == kZeroTraceId);

    const auto ctx = fixed_context();
    {
        TraceScope scope(ctx);
        CHECK(current_trace_ids().span_id == "00f067aa0ba902b7");
    }
    CHECK(current_trace_ids().span_id == kZeroSpanId);
}

// ============================================================================
// Log filter
// ============================================================================

TEST_CASE("TraceCorrelationFilter: stamps ids and never drops", "[trace_correlator]") {
    TraceCorrelationFilter filter;
    logging::LogRecord record;
    record.message = "hello";

    CHECK(filter.filter(record));
    CHECK(record.trace_id == kZeroTraceId);
    CHECK(record.span_id == kZeroSpanId);

    const auto ctx = fixed_context();
    TraceScope scope(ctx);
    CHECK(filter.filter(record));
    CHECK(record.trace_id == "4bf92f3577b34da6a3ce929d0e0e4736");
}

TEST_CASE("TraceCorrelationFilter: provider failure still passes the record", "[trace_correlator]") {
    TraceCorrelationFilter filter([]() -> const TraceContext* {
        throw std::runtime_error("boom");
    });
    logging::LogRecord record;
    CHECK(filter.filter(record));
    CHECK(record.trace_id == kZeroTraceId);
}

TEST_CASE("TraceCorrelator: installed filter reaches descendant loggers", "[trace_correlator]") {
    CapturedLogs logs;
    install_trace_correlation("api_pipeline");

    const auto ctx = fixed_context();
    {
        TraceScope scope(ctx);
        logging::get_logger("api_pipeline.jobs.worker").info("inside scope");
        logging::get_logger("third_party").info("other library");
    }
    logging::get_logger("api_pipeline").info("outside scope");

    const auto inside = logs.sink->find("inside scope");
    CHECK(inside.trace_id == "4bf92f3577b34da6a3ce929d0e0e4736");
    CHECK(inside.span_id == "00f067aa0ba902b7");

    // Root-level installation covers loggers outside the application tree
    CHECK(logs.sink->find("other library").span_id == "00f067aa0ba902b7");

    const auto outside = logs.sink->find("outside scope");
    CHECK(outside.trace_id == kZeroTraceId);
    CHECK(outside.span_id == kZeroSpanId);
}
