#pragma once

#include "versioning/deprecation_registry.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace apipipe {

// ============================================================================
// Configuration Types
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    int64_t port = 8000;                  // Range-checked by validate_config
    size_t thread_pool_size = 4;
};

struct LoggingConfig {
    std::string level = "info";
    std::string format = "text";          // "text" | "json"
    std::string file;                     // Empty = stderr only
    std::string app_logger = "api_pipeline";
};

struct VersioningConfig {
    std::vector<std::string> supported{"v1"};
    std::string match = "anchored";       // "anchored" | "anywhere"
    std::vector<std::string> bypass_exact{"/"};
    std::vector<std::string> bypass_prefixes{"/health", "/docs"};
    std::map<std::string, DeprecatedVersionEntry, std::less<>> deprecated;
};

struct MiddlewareConfig {
    bool request_id = true;
    bool request_logging = true;
    bool timing = true;
    std::chrono::milliseconds slow_request_threshold{1000};
    std::vector<std::string> sensitive_headers{
        "authorization", "cookie", "set-cookie", "x-api-key", "x-auth-token"};
    std::vector<std::string> trusted_proxies;   // CIDR ranges allowed to set X-Forwarded-For
};

struct TracingConfig {
    bool enabled = true;
    std::string service_name = "api-pipeline";
};

// ============================================================================
// AppConfig - Complete parsed configuration
// ============================================================================

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    VersioningConfig versioning;
    MiddlewareConfig middleware;
    TracingConfig tracing;
};

} // namespace apipipe
