#include "versioning/api_version.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace apipipe {

namespace {

constexpr std::string_view kApiPrefix = "/api/";

// Token at the start of `rest` if rest = "v<digits>/..."
std::optional<std::string> leading_token(std::string_view rest) {
    const size_t slash = rest.find('/');
    if (slash == std::string_view::npos) return std::nullopt;
    const auto segment = rest.substr(0, slash);
    if (!is_valid_version_id(segment)) return std::nullopt;
    return std::string(segment);
}

// Numeric part of a validated id; saturates on overflow
unsigned long long version_number(std::string_view id) {
    unsigned long long n = 0;
    for (const char c : id.substr(1)) {
        const auto digit = static_cast<unsigned long long>(c - '0');
        if (n > (~0ULL - digit) / 10) return ~0ULL;
        n = n * 10 + digit;
    }
    return n;
}

} // anonymous namespace

std::optional<VersionMatchMode> parse_match_mode(std::string_view name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "anchored") return VersionMatchMode::ANCHORED;
    if (lower == "anywhere") return VersionMatchMode::ANYWHERE;
    return std::nullopt;
}

bool is_valid_version_id(std::string_view id) noexcept {
    return id.size() >= 2 && id[0] == 'v' && utils::is_digits(id.substr(1));
}

std::optional<std::string> extract_version_token(std::string_view path, VersionMatchMode mode) {
    if (mode == VersionMatchMode::ANCHORED) {
        if (!path.starts_with(kApiPrefix)) return std::nullopt;
        return leading_token(path.substr(kApiPrefix.size()));
    }

    // First match wins, like a regex search for "/api/v(\d+)/"
    size_t pos = 0;
    while ((pos = path.find(kApiPrefix, pos)) != std::string_view::npos) {
        if (auto token = leading_token(path.substr(pos + kApiPrefix.size()))) {
            return token;
        }
        ++pos;
    }
    return std::nullopt;
}

// ============================================================================
// SupportedVersionSet
// ============================================================================

SupportedVersionSet::SupportedVersionSet(const std::vector<std::string>& versions) {
    for (const auto& v : versions) {
        if (!is_valid_version_id(v)) {
            throw ConfigurationError(std::format("Invalid API version identifier: '{}'", v));
        }
        versions_.insert(v);
    }
}

std::optional<std::string> SupportedVersionSet::latest() const {
    std::optional<std::string> best;
    for (const auto& v : versions_) {
        if (!best || version_number(v) > version_number(*best)) best = v;
    }
    return best;
}

// ============================================================================
// BypassRules
// ============================================================================

bool BypassRules::matches(std::string_view path) const {
    for (const auto& e : exact) {
        if (path == e) return true;
    }
    for (const auto& p : prefixes) {
        if (path.starts_with(p)) return true;
    }
    return false;
}

// ============================================================================
// VersionResolver
// ============================================================================

VersionResolver::VersionResolver(std::shared_ptr<const SupportedVersionSet> supported,
                                 BypassRules bypass,
                                 VersionMatchMode mode)
    : supported_(std::move(supported)), bypass_(std::move(bypass)), mode_(mode) {
    if (!supported_) {
        supported_ = std::make_shared<const SupportedVersionSet>();
    }
}

VersionResolution VersionResolver::resolve(std::string_view path) const {
    if (bypass_.matches(path)) {
        return {VersionDecision::BYPASS, {}};
    }

    auto token = extract_version_token(path, mode_);
    if (!token) {
        return {VersionDecision::UNVERSIONED, {}};
    }

    const auto decision = supported_->contains(*token)
        ? VersionDecision::ACCEPT : VersionDecision::REJECT;
    return {decision, std::move(*token)};
}

} // namespace apipipe
