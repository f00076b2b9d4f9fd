#include "server/client_info.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

namespace apipipe {

std::optional<uint32_t> parse_ipv4(std::string_view ip) {
    uint32_t octets[4]{};
    size_t octet_idx = 0;
    uint32_t val = 0;
    bool has_digit = false;

    for (size_t i = 0; i <= ip.size(); ++i) {
        if (i == ip.size() || ip[i] == '.') {
            if (!has_digit || val > 255 || octet_idx > 3) return std::nullopt;
            octets[octet_idx++] = val;
            val = 0;
            has_digit = false;
        } else if (ip[i] >= '0' && ip[i] <= '9') {
            val = val * 10 + static_cast<uint32_t>(ip[i] - '0');
            if (val > 255) return std::nullopt;
            has_digit = true;
        } else {
            return std::nullopt;
        }
    }
    if (octet_idx != 4) return std::nullopt;
    return (octets[0] << 24) | (octets[1] << 16) | (octets[2] << 8) | octets[3];
}

std::optional<Ipv4Cidr> Ipv4Cidr::parse(std::string_view cidr) {
    Ipv4Cidr out;
    const auto slash = cidr.find('/');
    const auto addr = parse_ipv4(cidr.substr(0, slash));
    if (!addr) return std::nullopt;

    uint32_t prefix = 32;
    if (slash != std::string_view::npos) {
        const auto bits = cidr.substr(slash + 1);
        if (!utils::is_digits(bits) || bits.size() > 2) return std::nullopt;
        prefix = 0;
        for (const char c : bits) prefix = prefix * 10 + static_cast<uint32_t>(c - '0');
        if (prefix > 32) return std::nullopt;
    }
    out.mask = (prefix == 0) ? 0u : ~((prefix == 32) ? 0u : ((1u << (32 - prefix)) - 1));
    out.network = *addr & out.mask;
    return out;
}

std::string_view strip_ipv6_mapped(std::string_view addr) {
    constexpr std::string_view prefix = "::ffff:";
    if (addr.size() > prefix.size() && addr.substr(0, prefix.size()) == prefix) {
        return addr.substr(prefix.size());
    }
    return addr;
}

bool is_trusted_proxy(std::string_view addr, const std::vector<std::string>& trusted) {
    if (trusted.empty()) return false;
    const auto ip = parse_ipv4(strip_ipv6_mapped(addr));
    if (!ip) return false;
    for (const auto& entry : trusted) {
        const auto range = Ipv4Cidr::parse(entry);
        if (range && range->contains(*ip)) return true;
    }
    return false;
}

std::string extract_client_ip(std::string_view remote_addr,
                              std::string_view forwarded_for,
                              const std::vector<std::string>& trusted_proxies) {
    const std::string remote{strip_ipv6_mapped(remote_addr)};
    const std::string fallback = remote.empty() ? "unknown" : remote;

    // Untrusted peer: X-Forwarded-For is client-controlled, ignore it
    if (!is_trusted_proxy(remote_addr, trusted_proxies)) return fallback;
    if (forwarded_for.empty()) return fallback;

    const auto first = utils::trim(forwarded_for.substr(0, forwarded_for.find(',')));
    return first.empty() ? fallback : first;
}

logging::Fields sanitize_headers(const Headers& headers,
                                 const std::unordered_set<std::string>& sensitive) {
    logging::Fields out;
    out.reserve(headers.size());
    for (const auto& [name, value] : headers) {
        if (sensitive.contains(utils::to_lower(name))) {
            out.emplace_back(name, std::string(http::kRedactedValue));
        } else {
            out.emplace_back(name, value);
        }
    }
    return out;
}

} // namespace apipipe
