#include "core/types.hpp"
#include "core/utils.hpp"

#include <format>

namespace apipipe {

ApiResponse ApiResponse::detail(int status, std::string_view message, ErrorCode code) {
    ApiResponse response(status, std::format(R"({{"detail": "{}"}})", utils::escape_json(message)));
    response.error_code = code;
    return response;
}

} // namespace apipipe
