// ---------------------------------------------------------------------------
// network_allowlist.cpp
//
// inet_pton 기반 CIDR 매칭. 프리픽스 길이만큼 바이트 단위로 비교하고
// 남은 비트는 마스크로 비교한다.
//
// [오탐/미탐 트레이드오프]
// - X-Forwarded-For 는 클라이언트가 임의로 설정할 수 있다. 헤더는
//   trust_forwarded_headers 가 켜져 있고 상대 주소가 trusted_proxies 에 있을
//   때만 사용한다. trusted_proxies 가 비어 있으면 항상 peer_ip 를 쓴다.
// ---------------------------------------------------------------------------

#include "waf/network_allowlist.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <charconv>
#include <cstring>

#include <spdlog/spdlog.h>

namespace {

constexpr std::array<std::uint8_t, 12> kV4MappedPrefix{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xFF, 0xFF};

[[nodiscard]] bool prefix_match(const IpAddress& ip, const AllowedNetwork& net) {
    if (ip.is_v6 != net.network.is_v6) {
        return false;
    }
    const unsigned full_bytes = net.prefix_len / 8u;
    const unsigned rest_bits  = net.prefix_len % 8u;

    if (std::memcmp(ip.bytes.data(), net.network.bytes.data(), full_bytes) != 0) {
        return false;
    }
    if (rest_bits == 0) {
        return true;
    }
    const auto mask = static_cast<std::uint8_t>(0xFFu << (8u - rest_bits));
    return (ip.bytes[full_bytes] & mask) == (net.network.bytes[full_bytes] & mask);
}

// 호스트 비트 제거 (strict=false 동작)
void mask_host_bits(AllowedNetwork& net) {
    const unsigned total_bytes = net.network.is_v6 ? 16u : 4u;
    const unsigned full_bytes  = net.prefix_len / 8u;
    const unsigned rest_bits   = net.prefix_len % 8u;
    for (unsigned i = full_bytes; i < total_bytes; ++i) {
        if (i == full_bytes && rest_bits != 0) {
            net.network.bytes[i] &= static_cast<std::uint8_t>(0xFFu << (8u - rest_bits));
        } else {
            net.network.bytes[i] = 0;
        }
    }
}

}  // namespace

std::optional<IpAddress> parse_ip(std::string_view text) {
    text = trim(text);
    // "[::1]" 형태 허용
    if (text.size() >= 2 && text.front() == '[' && text.back() == ']') {
        text = text.substr(1, text.size() - 2);
    }
    if (text.empty() || text.size() >= INET6_ADDRSTRLEN) {
        return std::nullopt;
    }
    const std::string buf(text);

    IpAddress out{};
    in_addr v4{};
    if (inet_pton(AF_INET, buf.c_str(), &v4) == 1) {
        std::memcpy(out.bytes.data(), &v4.s_addr, 4);
        return out;
    }

    in6_addr v6{};
    if (inet_pton(AF_INET6, buf.c_str(), &v6) == 1) {
        if (std::memcmp(v6.s6_addr, kV4MappedPrefix.data(), kV4MappedPrefix.size()) == 0) {
            std::memcpy(out.bytes.data(), v6.s6_addr + 12, 4);
            return out;
        }
        out.is_v6 = true;
        std::memcpy(out.bytes.data(), v6.s6_addr, 16);
        return out;
    }
    return std::nullopt;
}

std::optional<AllowedNetwork> parse_network(std::string_view cidr) {
    cidr = trim(cidr);
    const auto slash = cidr.find('/');

    auto ip = parse_ip(cidr.substr(0, slash));
    if (!ip) {
        return std::nullopt;
    }

    AllowedNetwork net{};
    net.network    = *ip;
    net.cidr       = std::string(cidr);
    const unsigned max_prefix = ip->is_v6 ? 128u : 32u;
    net.prefix_len = static_cast<std::uint8_t>(max_prefix);

    if (slash != std::string_view::npos) {
        const auto prefix_str = cidr.substr(slash + 1);
        unsigned prefix{0};
        auto [ptr, ec] = std::from_chars(prefix_str.data(), prefix_str.data() + prefix_str.size(), prefix);
        if (ec != std::errc{} || ptr != prefix_str.data() + prefix_str.size() || prefix > max_prefix
            || prefix_str.empty()) {
            return std::nullopt;
        }
        net.prefix_len = static_cast<std::uint8_t>(prefix);
    }
    mask_host_bits(net);
    return net;
}

NetworkAllowlist::NetworkAllowlist(const std::vector<std::string>& entries) {
    networks_.reserve(entries.size());
    for (const auto& entry : entries) {
        auto net = parse_network(entry);
        if (!net) {
            spdlog::warn("network_allowlist: invalid network entry '{}', skipping", entry);
            continue;
        }
        networks_.push_back(std::move(*net));
    }

    if (!entries.empty() && networks_.empty()) {
        spdlog::error("network_allowlist: none of the {} configured entries is valid, "
                      "allowlist is empty (fail-open)", entries.size());
    }
}

bool NetworkAllowlist::contains(std::string_view ip) const {
    const auto addr = parse_ip(ip);
    if (!addr) {
        spdlog::debug("network_allowlist: cannot parse client IP '{}'", ip);
        return false;
    }
    for (const auto& net : networks_) {
        if (prefix_match(*addr, net)) {
            return true;
        }
    }
    return false;
}

bool NetworkAllowlist::is_allowed(std::string_view ip) const {
    if (networks_.empty()) {
        return true;
    }
    return contains(ip);
}

std::string resolve_client_ip(const RequestView&      request,
                              bool                    trust_forwarded,
                              const NetworkAllowlist& trusted_proxies) {
    if (!trust_forwarded) {
        return request.peer_ip;
    }
    // 알려진 프록시에서 온 연결만 헤더를 신뢰한다. 목록이 비어 있으면 아무도 신뢰하지 않는다.
    if (!trusted_proxies.is_configured() || !trusted_proxies.contains(request.peer_ip)) {
        return request.peer_ip;
    }

    const std::string_view forwarded = find_header(request.headers, "X-Forwarded-For");
    if (!forwarded.empty()) {
        const auto first_hop = trim(forwarded.substr(0, forwarded.find(',')));
        if (!first_hop.empty()) {
            return std::string(first_hop);
        }
    }

    const std::string_view real_ip = trim(find_header(request.headers, "X-Real-IP"));
    if (!real_ip.empty()) {
        return std::string(real_ip);
    }
    return request.peer_ip;
}
