#include "versioning/deprecation_registry.hpp"
#include "versioning/api_version.hpp"
#include "server/http_constants.hpp"
#include "core/error.hpp"

#include <format>

namespace apipipe {

DeprecationRegistry::DeprecationRegistry(EntryMap entries)
    : entries_(std::move(entries)) {
    for (const auto& [version, entry] : entries_) {
        if (!is_valid_version_id(version)) {
            throw ConfigurationError(std::format("Invalid deprecated API version identifier: '{}'", version));
        }
        if (entry.replacement.empty()) {
            throw MisconfiguredDeprecationError(version);
        }
    }
}

const DeprecatedVersionEntry* DeprecationRegistry::find(std::string_view version) const {
    const auto it = entries_.find(version);
    return it == entries_.end() ? nullptr : &it->second;
}

std::string successor_docs_url(std::string_view version, const DeprecatedVersionEntry& entry) {
    if (entry.replacement.empty()) {
        throw MisconfiguredDeprecationError(std::string(version));
    }
    if (entry.docs_url) return *entry.docs_url;
    return std::format("/api/{}/docs", entry.replacement);
}

DeprecationAnnotator::DeprecationAnnotator(std::shared_ptr<const DeprecationRegistry> registry)
    : registry_(std::move(registry)) {
    if (!registry_) {
        registry_ = std::make_shared<const DeprecationRegistry>();
    }
}

bool DeprecationAnnotator::annotate(const std::optional<std::string>& version, Headers& headers) const {
    if (!version) return false;
    const auto* entry = registry_->find(*version);
    if (!entry) return false;

    const auto url = successor_docs_url(*version, *entry);
    headers[http::kDeprecationHeader] = "true";
    headers[http::kSunsetHeader] = entry->sunset;
    headers[http::kLinkHeader] = std::format(R"(<{}>; rel="successor-version")", url);
    return true;
}

} // namespace apipipe
