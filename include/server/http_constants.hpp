#pragma once

#include <string>
#include <string_view>

namespace apipipe::http {

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kRequestIdHeader = "X-Request-ID";
inline const std::string kResponseTimeHeader = "X-Response-Time";
inline const std::string kForwardedForHeader = "X-Forwarded-For";
inline const std::string kTraceparentHeader = "traceparent";
inline const std::string kTracestateHeader = "tracestate";

// RFC 8594 / RFC 9745
inline const std::string kDeprecationHeader = "Deprecation";
inline const std::string kSunsetHeader = "Sunset";
inline const std::string kLinkHeader = "Link";

inline constexpr const char* kJsonContentType = "application/json";
inline constexpr std::string_view kRedactedValue = "***REDACTED***";

} // namespace apipipe::http
