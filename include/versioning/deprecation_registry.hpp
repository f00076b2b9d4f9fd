#pragma once

#include "core/types.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace apipipe {

struct DeprecatedVersionEntry {
    std::string sunset;                   // Date string, passed through verbatim
    std::string replacement;              // Successor version id (required)
    std::optional<std::string> docs_url;  // Overrides /api/{replacement}/docs
};

/**
 * @brief Immutable version → deprecation metadata map
 *
 * Built once at startup and shared read-only between request threads.
 */
class DeprecationRegistry {
public:
    using EntryMap = std::map<std::string, DeprecatedVersionEntry, std::less<>>;

    DeprecationRegistry() = default;

    /**
     * @throws ConfigurationError if a key is not a valid version id
     * @throws MisconfiguredDeprecationError if an entry has no replacement
     */
    explicit DeprecationRegistry(EntryMap entries);

    /// nullptr when @p version is not deprecated
    [[nodiscard]] const DeprecatedVersionEntry* find(std::string_view version) const;

    [[nodiscard]] bool contains(std::string_view version) const { return find(version) != nullptr; }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] const EntryMap& entries() const noexcept { return entries_; }

private:
    EntryMap entries_;
};

/**
 * @brief Successor documentation URL for a deprecated version
 * @throws MisconfiguredDeprecationError if the entry has no replacement
 */
[[nodiscard]] std::string successor_docs_url(std::string_view version,
                                             const DeprecatedVersionEntry& entry);

/**
 * @brief Sets RFC 8594 headers on a response for deprecated versions
 *
 *   Deprecation: true
 *   Sunset: <entry.sunset>
 *   Link: <url>; rel="successor-version"
 *
 * Headers are assigned, never appended, so repeated calls are idempotent.
 */
class DeprecationAnnotator {
public:
    explicit DeprecationAnnotator(std::shared_ptr<const DeprecationRegistry> registry);

    /**
     * @return true if headers were set
     * @throws MisconfiguredDeprecationError for an entry without replacement
     */
    bool annotate(const std::optional<std::string>& version, Headers& headers) const;

    [[nodiscard]] const DeprecationRegistry& registry() const noexcept { return *registry_; }

private:
    std::shared_ptr<const DeprecationRegistry> registry_;
};

} // namespace apipipe
