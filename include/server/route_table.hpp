#pragma once

#include "core/middleware.hpp"
#include "core/request_context.hpp"
#include "core/types.hpp"

#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace apipipe {

/**
 * @brief Terminal handler: method + exact path → handler
 *
 * Unknown routes get 404 {"detail": "Not Found"}. Populate before the
 * server starts; dispatch() is read-only afterwards.
 */
class RouteTable {
public:
    /// Replaces an existing route with the same method and path
    void add(std::string method, std::string path, Handler handler);
    void get(std::string path, Handler handler) { add("GET", std::move(path), std::move(handler)); }
    void post(std::string path, Handler handler) { add("POST", std::move(path), std::move(handler)); }

    [[nodiscard]] bool contains(std::string_view method, std::string_view path) const;
    [[nodiscard]] size_t size() const noexcept { return routes_.size(); }

    [[nodiscard]] ApiResponse dispatch(RequestContext& ctx) const;

private:
    using Key = std::pair<std::string, std::string>;
    std::map<Key, Handler> routes_;
};

} // namespace apipipe
