#pragma once

#include "core/middleware.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace apipipe::testing {

/**
 * @brief Stage that appends "<name>:in" / "<name>:out" to a shared journal
 */
class RecordingMiddleware : public IMiddleware {
public:
    RecordingMiddleware(std::string name, std::shared_ptr<std::vector<std::string>> journal)
        : name_(std::move(name)), journal_(std::move(journal)) {}

    [[nodiscard]] ApiResponse handle(RequestContext& ctx, const Handler& next) override {
        journal_->push_back(name_ + ":in");
        auto response = next(ctx);
        journal_->push_back(name_ + ":out");
        return response;
    }

    [[nodiscard]] std::string_view name() const override { return name_; }

private:
    std::string name_;
    std::shared_ptr<std::vector<std::string>> journal_;
};

/**
 * @brief Stage that answers without calling the rest of the chain
 */
class ShortCircuitMiddleware : public IMiddleware {
public:
    explicit ShortCircuitMiddleware(int status) : status_(status) {}

    [[nodiscard]] ApiResponse handle(RequestContext&, const Handler&) override {
        return ApiResponse::json(status_, R"({"short":"circuit"})");
    }

    [[nodiscard]] std::string_view name() const override { return "short_circuit"; }

private:
    int status_;
};

/**
 * @brief Business handler counting its invocations
 */
struct CountingHandler {
    std::shared_ptr<int> calls = std::make_shared<int>(0);
    std::shared_ptr<std::optional<std::string>> seen_version =
        std::make_shared<std::optional<std::string>>();

    [[nodiscard]] Handler as_handler() const {
        return [calls = calls, seen = seen_version](RequestContext& ctx) {
            ++*calls;
            *seen = ctx.api_version();
            return ApiResponse::json(200, R"({"ok":true})");
        };
    }
};

} // namespace apipipe::testing
