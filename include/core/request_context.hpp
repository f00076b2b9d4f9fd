#pragma once

#include "core/types.hpp"
#include "core/utils.hpp"
#include "tracing/span.hpp"
#include "tracing/trace_context.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace apipipe {

/**
 * @brief Request context - carries state through the middleware chain
 *
 * Created per request on the dispatching thread and never shared with
 * another request. Stages may modify the request fields before calling the
 * rest of the chain.
 */
struct RequestContext {
    // Input
    std::string request_id;
    std::string method;
    std::string path;
    std::string query;
    Headers headers;
    std::string body;
    std::string remote_addr;
    std::string client_ip;   // Resolved by RequestLoggingStage

    // Timestamps
    std::chrono::system_clock::time_point received_at;
    std::chrono::steady_clock::time_point started_at;

    // Distributed tracing (W3C Trace Context)
    TraceContext trace_context;
    bool tracing_active = false;
    std::vector<Span> spans;

    // Flags
    bool version_rejected = false;
    bool deprecation_signalled = false;

    RequestContext()
        : request_id(utils::generate_uuid()),
          received_at(std::chrono::system_clock::now()),
          started_at(std::chrono::steady_clock::now()) {}

    explicit RequestContext(const ApiRequest& request)
        : request_id(utils::generate_uuid()),
          method(request.method),
          path(request.path),
          query(request.query),
          headers(request.headers),
          body(request.body),
          remote_addr(request.remote_addr),
          received_at(request.received_at),
          started_at(std::chrono::steady_clock::now()) {}

    [[nodiscard]] const std::optional<std::string>& api_version() const noexcept { return api_version_; }

    /**
     * @brief Record the resolved API version
     * @return false (and no change) if a version was already set
     */
    [[nodiscard]] bool set_api_version(std::string version) {
        if (api_version_) return false;
        api_version_ = std::move(version);
        return true;
    }

    [[nodiscard]] std::string header(std::string_view name) const {
        const auto it = headers.find(name);
        return it == headers.end() ? std::string{} : it->second;
    }

private:
    std::optional<std::string> api_version_;
};

} // namespace apipipe
