#pragma once

// ---------------------------------------------------------------------------
// network_allowlist.hpp
//
// 관리자 경로 접근용 IP / CIDR 허용목록.
//
// [설계 원칙]
// - 생성 시 문자열을 한 번 파싱하고 이후 불변. 동시 읽기 안전.
// - 허용목록이 비어 있으면 모든 IP 허용 (fail-open). 이 상태는
//   is_configured() 로 노출되어 시작 로그와 posture 에 기록된다.
// - 항목이 하나라도 있으면, 파싱할 수 없는 클라이언트 IP 는 차단 (fail-close).
// - IPv4 / IPv6 모두 지원. IPv4-mapped IPv6(::ffff:a.b.c.d)는 IPv4 로 정규화.
//
// [알려진 한계]
// - 잘못된 항목은 경고 후 건너뛴다. 모든 항목이 잘못되면 빈 목록과 같아져
//   fail-open 이 된다. 이 경우 error 로그를 남긴다.
// ---------------------------------------------------------------------------

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// IpAddress
//   파싱된 주소. IPv4 는 bytes[0..3] 만 사용한다.
// ---------------------------------------------------------------------------
struct IpAddress {
    bool                          is_v6{false};
    std::array<std::uint8_t, 16>  bytes{};
};

// ---------------------------------------------------------------------------
// AllowedNetwork
//   불변 {cidr}. 단일 IP 는 /32 (IPv6 는 /128) 로 취급한다.
//   호스트 비트가 설정된 CIDR(10.1.2.3/8)도 허용한다 (네트워크 주소로 마스킹).
// ---------------------------------------------------------------------------
struct AllowedNetwork {
    IpAddress     network{};
    std::uint8_t  prefix_len{0};
    std::string   cidr{};      // 원문 (로그용)
};

[[nodiscard]] std::optional<IpAddress> parse_ip(std::string_view text);
[[nodiscard]] std::optional<AllowedNetwork> parse_network(std::string_view cidr);

class NetworkAllowlist {
public:
    NetworkAllowlist() = default;
    explicit NetworkAllowlist(const std::vector<std::string>& entries);

    // is_allowed
    //   비어 있으면 true (fail-open). 아니면 contains(ip).
    [[nodiscard]] bool is_allowed(std::string_view ip) const;

    // contains
    //   fail-open 없이 순수 멤버십만 판단한다. 파싱 불가 IP 는 false.
    [[nodiscard]] bool contains(std::string_view ip) const;

    [[nodiscard]] bool is_configured() const noexcept { return !networks_.empty(); }
    [[nodiscard]] const std::vector<AllowedNetwork>& networks() const noexcept { return networks_; }

private:
    std::vector<AllowedNetwork> networks_;
};

// ---------------------------------------------------------------------------
// resolve_client_ip
//   클라이언트 IP 판별 순서:
//     1. X-Forwarded-For 의 첫 번째 hop
//     2. X-Real-IP
//     3. 전송 계층 상대 주소 (peer_ip)
//   헤더는 trust_forwarded 이고 peer_ip 가 trusted_proxies 안에 있을 때만 신뢰한다.
//   trusted_proxies 가 비어 있으면 항상 peer_ip.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string resolve_client_ip(const RequestView&       request,
                                            bool                     trust_forwarded,
                                            const NetworkAllowlist&  trusted_proxies);
