#include "core/pipeline.hpp"

#include <stdexcept>

namespace apipipe {

Pipeline::Pipeline(std::vector<std::unique_ptr<IMiddleware>> stages, Handler handler)
    : stages_(std::move(stages)), handler_(std::move(handler)) {
    if (!handler_) throw std::invalid_argument("Pipeline: handler is required");
    for (const auto& stage : stages_) {
        if (!stage) throw std::invalid_argument("Pipeline: null stage");
    }
}

ApiResponse Pipeline::execute(const ApiRequest& request) {
    RequestContext ctx(request);
    return execute(ctx);
}

ApiResponse Pipeline::execute(RequestContext& ctx) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    auto response = run_from(0, ctx);

    if (ctx.version_rejected) requests_rejected_.fetch_add(1, std::memory_order_relaxed);
    if (ctx.deprecation_signalled) deprecated_responses_.fetch_add(1, std::memory_order_relaxed);
    return response;
}

ApiResponse Pipeline::run_from(const size_t index, RequestContext& ctx) {
    if (index >= stages_.size()) return handler_(ctx);

    const Handler next = [this, index](RequestContext& c) {
        return run_from(index + 1, c);
    };
    return stages_[index]->handle(ctx, next);
}

std::vector<std::string_view> Pipeline::stage_names() const {
    std::vector<std::string_view> names;
    names.reserve(stages_.size());
    for (const auto& stage : stages_) names.push_back(stage->name());
    return names;
}

} // namespace apipipe
