#pragma once

#include "server/http_constants.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace apipipe {

// ============================================================================
// Basic Enums
// ============================================================================

enum class ErrorCode {
    NONE,
    VERSION_NOT_FOUND,
    ROUTE_NOT_FOUND,
    INTERNAL_ERROR
};

// ============================================================================
// Header Map
// ============================================================================

/**
 * @brief Case-insensitive ordering for HTTP header names
 */
struct CaseInsensitiveLess {
    using is_transparent = void;

    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept {
        const size_t n = a.size() < b.size() ? a.size() : b.size();
        for (size_t i = 0; i < n; ++i) {
            const auto ca = static_cast<unsigned char>(a[i]);
            const auto cb = static_cast<unsigned char>(b[i]);
            const auto la = (ca >= 'A' && ca <= 'Z') ? ca + 32 : ca;
            const auto lb = (cb >= 'A' && cb <= 'Z') ? cb + 32 : cb;
            if (la != lb) return la < lb;
        }
        return a.size() < b.size();
    }
};

/// One value per header name; assignment overwrites.
using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;

// ============================================================================
// Request/Response Types
// ============================================================================

struct ApiRequest {
    std::string method = "GET";
    std::string path = "/";
    std::string query;              // Raw query string without '?'
    Headers headers;
    std::string body;
    std::string remote_addr;        // Direct peer address
    std::chrono::system_clock::time_point received_at;

    ApiRequest()
        : received_at(std::chrono::system_clock::now()) {}
    ApiRequest(std::string m, std::string p)
        : method(std::move(m)), path(std::move(p)),
          received_at(std::chrono::system_clock::now()) {}
};

struct ApiResponse {
    int status = 200;
    Headers headers;
    std::string body;
    std::string content_type = http::kJsonContentType;
    ErrorCode error_code = ErrorCode::NONE;

    ApiResponse() = default;
    ApiResponse(int s, std::string b)
        : status(s), body(std::move(b)) {}

    [[nodiscard]] static ApiResponse json(int status, std::string body) {
        return ApiResponse(status, std::move(body));
    }

    /// {"detail": "<message>"} error envelope
    [[nodiscard]] static ApiResponse detail(int status, std::string_view message, ErrorCode code);

    [[nodiscard]] std::string header(std::string_view name) const {
        const auto it = headers.find(name);
        return it == headers.end() ? std::string{} : it->second;
    }
    [[nodiscard]] bool has_header(std::string_view name) const {
        return headers.find(name) != headers.end();
    }
};

} // namespace apipipe
