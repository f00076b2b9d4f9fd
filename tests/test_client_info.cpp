#include <catch2/catch_test_macros.hpp>
#include "server/client_info.hpp"

using namespace apipipe;

// ============================================================================
// IPv4 / CIDR parsing
// ============================================================================

TEST_CASE("ClientInfo: parse_ipv4 accepts dotted quads only", "[client_info]") {
    CHECK(parse_ipv4("10.0.0.1") == std::optional<uint32_t>(0x0A000001u));
    CHECK(parse_ipv4("255.255.255.255") == std::optional<uint32_t>(0xFFFFFFFFu));

    CHECK_FALSE(parse_ipv4("256.0.0.1").has_value());
    CHECK_FALSE(parse_ipv4("10.0.0").has_value());
    CHECK_FALSE(parse_ipv4("10.0.0.1.2").has_value());
    CHECK_FALSE(parse_ipv4("10..0.1").has_value());
    CHECK_FALSE(parse_ipv4("not-an-ip").has_value());
    CHECK_FALSE(parse_ipv4("").has_value());
}

TEST_CASE("ClientInfo: CIDR /8 range matches", "[client_info]") {
    const auto range = Ipv4Cidr::parse("10.0.0.0/8");
    REQUIRE(range.has_value());
    CHECK(range->contains(*parse_ipv4("10.255.255.255")));
    CHECK(range->contains(*parse_ipv4("10.1.2.3")));
    CHECK_FALSE(range->contains(*parse_ipv4("11.0.0.1")));
}

TEST_CASE("ClientInfo: bare address is a /32", "[client_info]") {
    const auto range = Ipv4Cidr::parse("192.168.1.100");
    REQUIRE(range.has_value());
    CHECK(range->contains(*parse_ipv4("192.168.1.100")));
    CHECK_FALSE(range->contains(*parse_ipv4("192.168.1.101")));
}

TEST_CASE("ClientInfo: /0 matches everything", "[client_info]") {
    const auto range = Ipv4Cidr::parse("0.0.0.0/0");
    REQUIRE(range.has_value());
    CHECK(range->contains(*parse_ipv4("8.8.8.8")));
}

TEST_CASE("ClientInfo: malformed CIDR is rejected", "[client_info]") {
    CHECK_FALSE(Ipv4Cidr::parse("10.0.0.0/33").has_value());
    CHECK_FALSE(Ipv4Cidr::parse("10.0.0.0/").has_value());
    CHECK_FALSE(Ipv4Cidr::parse("10.0.0.0/x").has_value());
    CHECK_FALSE(Ipv4Cidr::parse("10.0.0/8").has_value());
}

// ============================================================================
// Client IP extraction
// ============================================================================

TEST_CASE("ClientInfo: IPv6-mapped prefix is stripped", "[client_info]") {
    CHECK(strip_ipv6_mapped("::ffff:172.18.0.4") == "172.18.0.4");
    CHECK(strip_ipv6_mapped("172.18.0.4") == "172.18.0.4");
    CHECK(strip_ipv6_mapped("::1") == "::1");
}

TEST_CASE("ClientInfo: trusted proxy forwards the first X-Forwarded-For entry", "[client_info]") {
    const std::vector<std::string> trusted{"172.16.0.0/12"};
    CHECK(extract_client_ip("::ffff:172.18.0.4", " 203.0.113.9 , 172.18.0.4", trusted) == "203.0.113.9");
}

TEST_CASE("ClientInfo: untrusted peer cannot spoof X-Forwarded-For", "[client_info]") {
    const std::vector<std::string> trusted{"172.16.0.0/12"};
    CHECK(extract_client_ip("198.51.100.7", "203.0.113.9", trusted) == "198.51.100.7");
    CHECK(extract_client_ip("198.51.100.7", "203.0.113.9", {}) == "198.51.100.7");
}

TEST_CASE("ClientInfo: missing peer address is unknown", "[client_info]") {
    CHECK(extract_client_ip("", "", {}) == "unknown");
}

TEST_CASE("ClientInfo: trusted proxy without header falls back to peer", "[client_info]") {
    CHECK(extract_client_ip("10.0.0.5", "", {"10.0.0.0/8"}) == "10.0.0.5");
}

// ============================================================================
// Header sanitization
// ============================================================================

TEST_CASE("ClientInfo: sensitive headers are redacted case-insensitively", "[client_info]") {
    Headers headers{{"AUTHORIZATION", "Bearer x"}, {"Cookie", "sid=1"}, {"Accept", "*/*"}};
    const auto fields = sanitize_headers(headers, {"authorization", "cookie"});

    REQUIRE(fields.size() == 3);
    for (const auto& [name, value] : fields) {
        if (name == "Accept") {
            CHECK(value == "*/*");
        } else {
            CHECK(value == "***REDACTED***");
        }
    }
}
