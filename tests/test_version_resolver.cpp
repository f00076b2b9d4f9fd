#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "versioning/api_version.hpp"

#include <memory>

using namespace apipipe;

namespace {

VersionResolver make_resolver(std::initializer_list<std::string> versions,
                              VersionMatchMode mode = VersionMatchMode::ANCHORED) {
    return VersionResolver(std::make_shared<const SupportedVersionSet>(versions), BypassRules{}, mode);
}

} // namespace

// ============================================================================
// Version identifiers
// ============================================================================

TEST_CASE("ApiVersion: valid identifiers are v followed by digits", "[versioning]") {
    CHECK(is_valid_version_id("v1"));
    CHECK(is_valid_version_id("v2"));
    CHECK(is_valid_version_id("v10"));
    CHECK(is_valid_version_id("v007"));

    CHECK_FALSE(is_valid_version_id(""));
    CHECK_FALSE(is_valid_version_id("v"));
    CHECK_FALSE(is_valid_version_id("1"));
    CHECK_FALSE(is_valid_version_id("V1"));
    CHECK_FALSE(is_valid_version_id("v1a"));
    CHECK_FALSE(is_valid_version_id("v1.2"));
    CHECK_FALSE(is_valid_version_id("latest"));
}

TEST_CASE("ApiVersion: supported set rejects malformed identifiers", "[versioning]") {
    CHECK_THROWS_AS(SupportedVersionSet({"v1", "beta"}), ConfigurationError);
    CHECK_THROWS_AS(SupportedVersionSet(std::vector<std::string>{"2"}), ConfigurationError);
    CHECK_NOTHROW(SupportedVersionSet({"v1", "v2"}));
}

TEST_CASE("ApiVersion: latest compares numerically", "[versioning]") {
    const SupportedVersionSet set{"v2", "v10", "v9"};
    REQUIRE(set.latest().has_value());
    CHECK(*set.latest() == "v10");
    CHECK_FALSE(SupportedVersionSet{}.latest().has_value());
}

// ============================================================================
// Token extraction
// ============================================================================

TEST_CASE("ApiVersion: token must be a whole segment followed by slash", "[versioning]") {
    CHECK(extract_version_token("/api/v1/jobs") == std::optional<std::string>("v1"));
    CHECK(extract_version_token("/api/v12/jobs/7") == std::optional<std::string>("v12"));
    CHECK(extract_version_token("/api/v1/") == std::optional<std::string>("v1"));

    CHECK_FALSE(extract_version_token("/api/v1").has_value());
    CHECK_FALSE(extract_version_token("/api/v1abc/x").has_value());
    CHECK_FALSE(extract_version_token("/api/jobs").has_value());
    CHECK_FALSE(extract_version_token("/api/v/x").has_value());
}

TEST_CASE("ApiVersion: anchored mode ignores tokens deeper in the path", "[versioning]") {
    CHECK_FALSE(extract_version_token("/files/api/v9/x", VersionMatchMode::ANCHORED).has_value());
    CHECK(extract_version_token("/files/api/v9/x", VersionMatchMode::ANYWHERE)
          == std::optional<std::string>("v9"));
}

TEST_CASE("ApiVersion: anywhere mode takes the first match", "[versioning]") {
    const auto token = extract_version_token("/x/api/vX/api/v3/api/v4/", VersionMatchMode::ANYWHERE);
    REQUIRE(token.has_value());
    CHECK(*token == "v3");
}

TEST_CASE("ApiVersion: match mode parses case-insensitively", "[versioning]") {
    CHECK(parse_match_mode("anchored") == VersionMatchMode::ANCHORED);
    CHECK(parse_match_mode("ANYWHERE") == VersionMatchMode::ANYWHERE);
    CHECK_FALSE(parse_match_mode("regex").has_value());
}

// ============================================================================
// Resolution decisions
// ============================================================================

TEST_CASE("VersionResolver: bypass paths are never inspected", "[versioning]") {
    const auto resolver = make_resolver({"v1"});

    CHECK(resolver.resolve("/").decision == VersionDecision::BYPASS);
    CHECK(resolver.resolve("/health").decision == VersionDecision::BYPASS);
    CHECK(resolver.resolve("/health/ready").decision == VersionDecision::BYPASS);
    CHECK(resolver.resolve("/docs").decision == VersionDecision::BYPASS);
    CHECK(resolver.resolve("/docs/api/v9/x").decision == VersionDecision::BYPASS);
}

TEST_CASE("VersionResolver: exact bypass does not match longer paths", "[versioning]") {
    const auto resolver = make_resolver({"v1"});
    CHECK(resolver.resolve("/other").decision == VersionDecision::UNVERSIONED);
}

TEST_CASE("VersionResolver: unversioned path passes through", "[versioning]") {
    const auto resolver = make_resolver({"v1"});
    const auto r = resolver.resolve("/metrics");
    CHECK(r.decision == VersionDecision::UNVERSIONED);
    CHECK(r.version.empty());
}

TEST_CASE("VersionResolver: supported version is accepted", "[versioning]") {
    const auto resolver = make_resolver({"v1", "v2"});
    const auto r = resolver.resolve("/api/v2/jobs");
    CHECK(r.decision == VersionDecision::ACCEPT);
    CHECK(r.version == "v2");
}

TEST_CASE("VersionResolver: unsupported version is rejected", "[versioning]") {
    const auto resolver = make_resolver({"v1"});
    const auto r = resolver.resolve("/api/v9/jobs");
    CHECK(r.decision == VersionDecision::REJECT);
    CHECK(r.version == "v9");
}

TEST_CASE("VersionResolver: custom bypass rules replace the defaults", "[versioning]") {
    BypassRules rules;
    rules.exact = {"/status"};
    rules.prefixes = {"/internal"};
    const VersionResolver resolver(
        std::make_shared<const SupportedVersionSet>(SupportedVersionSet{"v1"}), rules);

    CHECK(resolver.resolve("/status").decision == VersionDecision::BYPASS);
    CHECK(resolver.resolve("/internal/api/v9/x").decision == VersionDecision::BYPASS);
    CHECK(resolver.resolve("/health").decision == VersionDecision::UNVERSIONED);
}

TEST_CASE("VersionResolver: null version set rejects every token", "[versioning]") {
    const VersionResolver resolver(nullptr);
    CHECK(resolver.supported().empty());
    CHECK(resolver.resolve("/api/v1/x").decision == VersionDecision::REJECT);
}
