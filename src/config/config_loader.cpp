#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "logging/log_sinks.hpp"
#include "server/client_info.hpp"
#include "versioning/api_version.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace apipipe {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars and arrays.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (auto&& [key, val] : overlay) {
        if (val.is_table() && base.contains(key.str()) && base[key.str()].is_table()) {
            merge_tables(*base[key.str()].as_table(), *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Merge: included is base, root is overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir.empty() ? "." : base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or(cfg.host);
    cfg.port = s["port"].value_or(cfg.port);
    const auto threads = s["threads"].value_or(static_cast<int64_t>(cfg.thread_pool_size));
    cfg.thread_pool_size = threads > 0 ? static_cast<size_t>(threads) : 0;
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or(cfg.level);
    cfg.format = l["format"].value_or(cfg.format);
    cfg.file = l["file"].value_or(""s);
    cfg.app_logger = l["app_logger"].value_or(cfg.app_logger);
    return cfg;
}

VersioningConfig ConfigLoader::extract_versioning(const toml::table& root) {
    VersioningConfig cfg;
    const auto* versioning = root["versioning"].as_table();
    if (!versioning) return cfg;
    const auto& v = *versioning;

    if (v["supported"].is_array()) cfg.supported = toml_string_array(v, "supported");
    cfg.match = v["match"].value_or(cfg.match);
    if (v["bypass_exact"].is_array()) cfg.bypass_exact = toml_string_array(v, "bypass_exact");
    if (v["bypass_prefixes"].is_array()) cfg.bypass_prefixes = toml_string_array(v, "bypass_prefixes");

    if (const auto* deprecated = v["deprecated"].as_table()) {
        for (auto&& [version, node] : *deprecated) {
            const auto* entry_tbl = node.as_table();
            if (!entry_tbl) continue;
            DeprecatedVersionEntry entry;
            entry.sunset = (*entry_tbl)["sunset"].value_or(""s);
            entry.replacement = (*entry_tbl)["replacement"].value_or(""s);
            entry.docs_url = toml_optional_string(*entry_tbl, "docs_url");
            cfg.deprecated.emplace(std::string(version.str()), std::move(entry));
        }
    }
    return cfg;
}

MiddlewareConfig ConfigLoader::extract_middleware(const toml::table& root) {
    MiddlewareConfig cfg;
    const auto* middleware = root["middleware"].as_table();
    if (!middleware) return cfg;
    const auto& m = *middleware;

    cfg.request_id = m["request_id"].value_or(cfg.request_id);
    cfg.request_logging = m["request_logging"].value_or(cfg.request_logging);
    cfg.timing = m["timing"].value_or(cfg.timing);
    cfg.slow_request_threshold = std::chrono::milliseconds(
        m["slow_request_threshold_ms"].value_or(int64_t{cfg.slow_request_threshold.count()}));
    if (m["sensitive_headers"].is_array()) {
        cfg.sensitive_headers.clear();
        for (const auto& h : toml_string_array(m, "sensitive_headers")) {
            cfg.sensitive_headers.push_back(utils::to_lower(h));
        }
    }
    cfg.trusted_proxies = toml_string_array(m, "trusted_proxies");
    return cfg;
}

TracingConfig ConfigLoader::extract_tracing(const toml::table& root) {
    TracingConfig cfg;
    const auto* tracing = root["tracing"].as_table();
    if (!tracing) return cfg;
    const auto& t = *tracing;

    cfg.enabled = t["enabled"].value_or(cfg.enabled);
    cfg.service_name = t["service_name"].value_or(cfg.service_name);
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

AppConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    AppConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.versioning = extract_versioning(tbl);
    config.middleware = extract_middleware(tbl);
    config.tracing = extract_tracing(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (!utils::in_range<1, 65535>(config.server.port)) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.thread_pool_size == 0) {
        errors.push_back("server.threads must be > 0");
    }

    if (!logging::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug|info|warn|error, got '{}'",
                                     config.logging.level));
    }
    if (!logging::parse_format(config.logging.format)) {
        errors.push_back(std::format("logging.format must be text|json, got '{}'",
                                     config.logging.format));
    }

    const auto& v = config.versioning;
    for (const auto& version : v.supported) {
        if (!is_valid_version_id(version)) {
            errors.push_back(std::format("versioning.supported: '{}' is not of the form v<digits>", version));
        }
    }
    if (!parse_match_mode(v.match)) {
        errors.push_back(std::format("versioning.match must be anchored|anywhere, got '{}'", v.match));
    }
    for (const auto& [version, entry] : v.deprecated) {
        if (!is_valid_version_id(version)) {
            errors.push_back(std::format("versioning.deprecated: '{}' is not of the form v<digits>", version));
        }
        if (entry.sunset.empty()) {
            errors.push_back(std::format("versioning.deprecated.{}.sunset is required", version));
        }
        if (entry.replacement.empty()) {
            errors.push_back(std::format("versioning.deprecated.{}.replacement is required", version));
        } else if (!is_valid_version_id(entry.replacement)) {
            errors.push_back(std::format("versioning.deprecated.{}.replacement '{}' is not of the form v<digits>",
                                         version, entry.replacement));
        }
    }

    if (config.middleware.slow_request_threshold.count() <= 0) {
        errors.push_back("middleware.slow_request_threshold_ms must be > 0");
    }
    for (const auto& proxy : config.middleware.trusted_proxies) {
        if (!Ipv4Cidr::parse(proxy)) {
            errors.push_back(std::format("middleware.trusted_proxies: '{}' is not an IPv4 address or CIDR range", proxy));
        }
    }

    return errors;
}

} // namespace apipipe
