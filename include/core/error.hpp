#pragma once

#include <stdexcept>
#include <string>

namespace apipipe {

/**
 * @brief Static configuration is unusable
 *
 * Raised while building immutable startup data (version sets, deprecation
 * registry). Never raised for per-request input.
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Deprecated version entry without a successor version
 */
class MisconfiguredDeprecationError : public ConfigurationError {
public:
    explicit MisconfiguredDeprecationError(std::string version)
        : ConfigurationError("Deprecated API version " + version + " has no replacement"),
          version_(std::move(version)) {}

    [[nodiscard]] const std::string& version() const noexcept { return version_; }

private:
    std::string version_;
};

} // namespace apipipe
