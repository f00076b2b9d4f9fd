#pragma once

#include "core/middleware.hpp"
#include "core/pipeline_builder.hpp"
#include "core/request_context.hpp"
#include "core/types.hpp"

#include <atomic>
#include <memory>
#include <string_view>
#include <vector>

namespace apipipe {

/**
 * @brief Middleware chain - runs every request through an ordered list of stages
 *
 * Default stage order (see PipelineBuilder):
 * 1. Request ID (X-Request-ID)
 * 2. Trace scope (traceparent, ambient TraceScope)
 * 3. Timing (X-Response-Time)
 * 4. Request logging
 * 5. Version resolution (may short-circuit with 404)
 * 6. Deprecation headers (after the handler returned)
 * 7. Handler
 *
 * Stage i receives a continuation running stages i+1..n and then the
 * handler. The chain itself catches nothing: handler exceptions reach the
 * caller after unwinding every stage.
 */
class Pipeline {
public:
    Pipeline(std::vector<std::unique_ptr<IMiddleware>> stages, Handler handler);

    /**
     * @brief Execute request through the chain
     * @param request Incoming request
     * @return Response from the handler or from a short-circuiting stage
     */
    [[nodiscard]] ApiResponse execute(const ApiRequest& request);

    /// Same, for a caller-owned context (inspectable afterwards)
    [[nodiscard]] ApiResponse execute(RequestContext& ctx);

    /// Stage names in execution order
    [[nodiscard]] std::vector<std::string_view> stage_names() const;

    struct Stats {
        uint64_t total_requests;
        uint64_t requests_rejected;
        uint64_t deprecated_responses;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_requests = total_requests_.load(std::memory_order_relaxed),
            .requests_rejected = requests_rejected_.load(std::memory_order_relaxed),
            .deprecated_responses = deprecated_responses_.load(std::memory_order_relaxed),
        };
    }

private:
    [[nodiscard]] ApiResponse run_from(size_t index, RequestContext& ctx);

    const std::vector<std::unique_ptr<IMiddleware>> stages_;
    const Handler handler_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> requests_rejected_{0};
    std::atomic<uint64_t> deprecated_responses_{0};
};

} // namespace apipipe
