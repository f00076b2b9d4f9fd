#include "server/route_table.hpp"

#include <cctype>
#include <stdexcept>

namespace apipipe {

namespace {

std::string normalize_method(std::string_view method) {
    std::string out(method);
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

} // anonymous namespace

void RouteTable::add(std::string method, std::string path, Handler handler) {
    if (!handler) throw std::invalid_argument("RouteTable: handler is required");
    routes_.insert_or_assign(Key{normalize_method(method), std::move(path)}, std::move(handler));
}

bool RouteTable::contains(std::string_view method, std::string_view path) const {
    return routes_.find(Key{normalize_method(method), std::string(path)}) != routes_.end();
}

ApiResponse RouteTable::dispatch(RequestContext& ctx) const {
    const auto it = routes_.find(Key{normalize_method(ctx.method), ctx.path});
    if (it == routes_.end()) {
        return ApiResponse::detail(404, "Not Found", ErrorCode::ROUTE_NOT_FOUND);
    }
    return it->second(ctx);
}

} // namespace apipipe
