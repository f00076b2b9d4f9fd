#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace apipipe {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads api_pipeline.toml
 *
 * Supports ${ENV_VAR} expansion in string values and `include = "..."` (or
 * an array of paths) resolved relative to the including file; the including
 * file wins on conflicts.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to api_pipeline.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate a config, collecting every problem
     * @return Human-readable errors (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

private:
    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static VersioningConfig extract_versioning(const toml::table& root);
    static MiddlewareConfig extract_middleware(const toml::table& root);
    static TracingConfig extract_tracing(const toml::table& root);

    static AppConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(AppConfig config);
};

} // namespace apipipe
