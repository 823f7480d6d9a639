#pragma once

// ---------------------------------------------------------------------------
// request_filter.hpp
//
// 모든 인바운드 요청이 라우팅 전에 통과하는 필터.
// ThreatMatcher + NetworkAllowlist + SecurityHeaders 를 조합한다.
//
// [판정 순서]
// 1. inspect()            : 경로 → path traversal, 쿼리 → SQLi → XSS.
//                           첫 매칭에서 중단. waf.enabled == false 면 검사 생략.
// 2. check_admin_access() : admin_path_prefixes 에 해당하는 경로만.
//                           허용목록 미설정이면 통과 (fail-open, 시작 시 경고).
//
// [모드]
// - block    : FilterAction::kBlock. 게이트는 상세 없는 403 으로 응답한다.
// - log-only : FilterAction::kLog. 매칭을 기록하고 요청은 통과시킨다.
//   log-only 는 WAF 시그니처에만 적용된다. 허용목록 차단은 항상 kBlock.
//
// [Hot Reload]
// FilterRules 스냅샷을 std::atomic<std::shared_ptr<const FilterRules>> 로 보관한다.
// 진행 중인 inspect() 는 취득한 스냅샷으로 끝까지 평가된다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "common/types.hpp"
#include "config/gate_config.hpp"
#include "waf/network_allowlist.hpp"
#include "waf/security_headers.hpp"
#include "waf/threat_matcher.hpp"

enum class FilterAction : std::uint8_t {
    kAllow = 0,
    kBlock = 1,
    kLog   = 2,   // 허용 + 보안 이벤트 기록 (log-only 모드의 WAF 매칭)
};

// ---------------------------------------------------------------------------
// FilterDecision
//   rule   : "waf" | "admin_allowlist" (감사 로그용)
//   reason : 서버 로그 전용. 클라이언트 응답에 포함하지 말 것.
// ---------------------------------------------------------------------------
struct FilterDecision {
    FilterAction action{FilterAction::kAllow};
    std::string  rule{};
    std::string  category{};
    std::string  matched_pattern{};
    std::string  reason{};
    std::string  client_ip{};

    [[nodiscard]] bool blocked() const noexcept { return action == FilterAction::kBlock; }
};

// ---------------------------------------------------------------------------
// FilterRules
//   설정에서 만들어지는 불변 스냅샷. reload 단위.
// ---------------------------------------------------------------------------
struct FilterRules {
    WafSection       waf;
    ThreatMatcher    sqli;
    ThreatMatcher    xss;
    ThreatMatcher    path_traversal;
    NetworkAllowlist admin_allowlist;
    NetworkAllowlist trusted_proxies;
    bool             trust_forwarded_headers;
    SecurityHeaders  headers;

    [[nodiscard]] static std::shared_ptr<const FilterRules> build(const GateConfig& config);
};

class RequestFilter {
public:
    // rules 가 nullptr 이면 모든 요청을 차단한다 (fail-close).
    explicit RequestFilter(std::shared_ptr<const FilterRules> rules);

    RequestFilter(const RequestFilter&)            = delete;
    RequestFilter& operator=(const RequestFilter&) = delete;

    // inspect: WAF 시그니처 검사
    [[nodiscard]] FilterDecision inspect(const RequestView& request) const;

    // check_admin_access: 관리자 경로 IP 허용목록 검사
    [[nodiscard]] FilterDecision check_admin_access(const RequestView& request) const;

    // evaluate: inspect → check_admin_access. 첫 kBlock 에서 중단.
    //   inspect 가 kLog 를 반환하고 허용목록이 통과하면 kLog 를 그대로 반환한다.
    [[nodiscard]] FilterDecision evaluate(const RequestView& request) const;

    [[nodiscard]] bool is_admin_path(std::string_view path) const;

    // client_ip_for: 현재 스냅샷의 forwarded 헤더 신뢰 정책으로 클라이언트 IP 판별
    [[nodiscard]] std::string client_ip_for(const RequestView& request) const;

    // response_headers / apply_response_headers: SecurityHeaders 위임
    [[nodiscard]] HeaderList response_headers(std::string_view path) const;
    void apply_response_headers(HeaderList& headers, std::string_view path) const;

    void reload(std::shared_ptr<const FilterRules> new_rules);

    [[nodiscard]] std::shared_ptr<const FilterRules> snapshot() const {
        return rules_.load(std::memory_order_acquire);
    }

private:
    std::atomic<std::shared_ptr<const FilterRules>> rules_;
};
