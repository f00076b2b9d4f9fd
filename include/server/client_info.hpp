#pragma once

#include "core/types.hpp"
#include "logging/log_record.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace apipipe {

/**
 * @brief IPv4 network in CIDR form ("10.0.0.0/8"; bare address = /32)
 */
struct Ipv4Cidr {
    uint32_t network = 0;
    uint32_t mask = 0;

    [[nodiscard]] static std::optional<Ipv4Cidr> parse(std::string_view cidr);
    [[nodiscard]] bool contains(uint32_t addr) const noexcept { return (addr & mask) == network; }
};

[[nodiscard]] std::optional<uint32_t> parse_ipv4(std::string_view ip);

/// Strip IPv6-mapped IPv4 prefix ("::ffff:172.18.0.4" → "172.18.0.4")
[[nodiscard]] std::string_view strip_ipv6_mapped(std::string_view addr);

/// True if @p addr lies in any of @p trusted (exact IPs or CIDR ranges)
[[nodiscard]] bool is_trusted_proxy(std::string_view addr, const std::vector<std::string>& trusted);

/**
 * @brief Real client address
 *
 * The leftmost X-Forwarded-For entry is used only when the direct peer is a
 * trusted proxy; otherwise the peer address itself. Empty peer → "unknown".
 */
[[nodiscard]] std::string extract_client_ip(std::string_view remote_addr,
                                            std::string_view forwarded_for,
                                            const std::vector<std::string>& trusted_proxies);

/**
 * @brief Header list safe for logging
 *
 * Values of headers named in @p sensitive (lower-case names, matched
 * case-insensitively) are replaced by "***REDACTED***".
 */
[[nodiscard]] logging::Fields sanitize_headers(const Headers& headers,
                                               const std::unordered_set<std::string>& sensitive);

} // namespace apipipe
