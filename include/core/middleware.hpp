#pragma once

#include "core/request_context.hpp"
#include "core/types.hpp"

#include <functional>
#include <string_view>

namespace apipipe {

/// Rest of the chain (or the business handler at the end of it)
using Handler = std::function<ApiResponse(RequestContext&)>;

/**
 * @brief Middleware stage interface
 *
 * Each stage receives the request context and a continuation for the rest
 * of the chain. A stage may:
 * - call next(ctx) and inspect or modify the returned response,
 * - return its own response without calling next (short-circuit),
 * - modify ctx before calling next.
 *
 * Exceptions thrown downstream propagate through stages unchanged unless a
 * stage documents otherwise.
 */
class IMiddleware {
public:
    virtual ~IMiddleware() = default;

    [[nodiscard]] virtual ApiResponse handle(RequestContext& ctx, const Handler& next) = 0;

    /**
     * @brief Human-readable stage name for tracing/logging
     */
    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace apipipe
