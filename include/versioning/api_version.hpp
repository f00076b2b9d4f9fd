#pragma once

#include <initializer_list>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace apipipe {

/**
 * @brief Where a version token may appear in the path
 *
 * ANCHORED: only "/api/v<N>/..." with "/api/" at the very start.
 * ANYWHERE: first "/api/v<N>/" found anywhere in the path.
 */
enum class VersionMatchMode { ANCHORED, ANYWHERE };

[[nodiscard]] std::optional<VersionMatchMode> parse_match_mode(std::string_view name);

/// "v" followed by one or more ASCII digits
[[nodiscard]] bool is_valid_version_id(std::string_view id) noexcept;

/**
 * @brief Extract the version token from a request path
 *
 * The token must be a whole segment ("v12" in "/api/v12/jobs") followed by
 * '/'. "/api/v1" and "/api/v1abc/x" carry no token.
 */
[[nodiscard]] std::optional<std::string> extract_version_token(
    std::string_view path, VersionMatchMode mode = VersionMatchMode::ANCHORED);

/**
 * @brief Immutable set of accepted version identifiers
 */
class SupportedVersionSet {
public:
    SupportedVersionSet() = default;

    /// @throws ConfigurationError on a malformed identifier
    explicit SupportedVersionSet(const std::vector<std::string>& versions);
    SupportedVersionSet(std::initializer_list<std::string> versions)
        : SupportedVersionSet(std::vector<std::string>(versions)) {}

    [[nodiscard]] bool contains(std::string_view version) const {
        return versions_.find(version) != versions_.end();
    }
    [[nodiscard]] bool empty() const noexcept { return versions_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return versions_.size(); }
    [[nodiscard]] const std::set<std::string, std::less<>>& versions() const noexcept { return versions_; }

    /// Highest numbered version ("v10" > "v9"), if any
    [[nodiscard]] std::optional<std::string> latest() const;

private:
    std::set<std::string, std::less<>> versions_;
};

/**
 * @brief Paths that never take part in version resolution
 */
struct BypassRules {
    std::vector<std::string> exact{"/"};
    std::vector<std::string> prefixes{"/health", "/docs"};

    [[nodiscard]] bool matches(std::string_view path) const;
};

enum class VersionDecision {
    BYPASS,       // Unversioned endpoint (health, root, docs)
    UNVERSIONED,  // No version token in the path
    REJECT,       // Token present but not supported
    ACCEPT        // Token present and supported
};

struct VersionResolution {
    VersionDecision decision = VersionDecision::UNVERSIONED;
    std::string version;  // Set for REJECT and ACCEPT
};

/**
 * @brief Decides bypass / pass-through / reject / accept for a request path
 *
 * Stateless apart from the immutable version set; safe for concurrent use.
 */
class VersionResolver {
public:
    explicit VersionResolver(std::shared_ptr<const SupportedVersionSet> supported,
                             BypassRules bypass = {},
                             VersionMatchMode mode = VersionMatchMode::ANCHORED);

    [[nodiscard]] VersionResolution resolve(std::string_view path) const;

    [[nodiscard]] const SupportedVersionSet& supported() const noexcept { return *supported_; }
    [[nodiscard]] VersionMatchMode mode() const noexcept { return mode_; }

private:
    std::shared_ptr<const SupportedVersionSet> supported_;
    BypassRules bypass_;
    VersionMatchMode mode_;
};

} // namespace apipipe
