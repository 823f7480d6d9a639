// ---------------------------------------------------------------------------
// request_filter.cpp
//
// [인코딩 처리]
// 경로와 쿼리는 원문과 1회 percent 디코딩 결과를 모두 검사한다.
// 쿼리 디코딩은 '+' 를 공백으로 취급한다 (union+select → union select).
//
// [관리자 경로]
// 허용목록 대상 판별은 원문 경로와 정규화 경로(디코딩, "//", "/./", "/../"
// 정리) 양쪽으로 한다. 게이트웨이는 원문 target 을 그대로 전달하므로
// 업스트림이 디코딩한 뒤 라우팅하는 경로도 같은 판정을 받아야 한다.
//
// [오탐/미탐 트레이드오프]
// - 헤더와 본문은 검사하지 않는다. 본문 기반 공격은 애플리케이션 레이어와
//   업로드 파이프라인의 책임이다 (false negative).
// - 검색어에 "<script" 같은 문자열이 정상적으로 들어가는 서비스라면
//   log-only 모드로 먼저 관찰한 뒤 block 으로 전환해야 한다.
// ---------------------------------------------------------------------------

#include "waf/request_filter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <vector>

#include "common/encoding.hpp"

namespace {

[[nodiscard]] ThreatMatch match_raw_and_decoded(const ThreatMatcher& matcher,
                                                std::string_view     raw,
                                                bool                 plus_as_space) {
    auto match = matcher.check(raw);
    if (match.detected) {
        return match;
    }
    const std::string decoded = percent_decode(raw, plus_as_space);
    if (decoded != raw) {
        return matcher.check(decoded);
    }
    return match;
}

// canonical_path
//   업스트림 라우터가 보는 형태로 경로를 정규화한다.
//   1회 percent 디코딩, '\' → '/', 빈 세그먼트와 "." 제거, ".." 는 상위 세그먼트 제거.
//   결과는 항상 '/' 로 시작하고 '/' 로 끝나지 않는다 (루트 제외).
[[nodiscard]] std::string canonical_path(std::string_view raw) {
    std::string decoded = percent_decode(raw, false);
    std::replace(decoded.begin(), decoded.end(), '\\', '/');

    std::vector<std::string_view> segments;
    std::string_view rest{decoded};
    while (!rest.empty()) {
        const auto slash = rest.find('/');
        const std::string_view segment = rest.substr(0, slash);
        rest = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash + 1);

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
            continue;
        }
        segments.push_back(segment);
    }

    if (segments.empty()) {
        return "/";
    }
    std::string out;
    for (const auto segment : segments) {
        out += '/';
        out += segment;
    }
    return out;
}

// has_path_prefix: 대소문자 무관. 접두사는 세그먼트 경계(끝, '/', ';')에서 끝나야 한다.
[[nodiscard]] bool has_path_prefix(std::string_view path, std::string_view prefix) {
    if (prefix.empty() || path.size() < prefix.size() || !iequals(path.substr(0, prefix.size()), prefix)) {
        return false;
    }
    return path.size() == prefix.size() || prefix.back() == '/'
        || path[prefix.size()] == '/' || path[prefix.size()] == ';';
}

// admin_path_matches: 원문 경로와 정규화된 경로 중 하나라도 접두사에 걸리면 관리자 경로
[[nodiscard]] bool admin_path_matches(const FilterRules& rules, std::string_view path) {
    if (rules.waf.admin_path_prefixes.empty()) {
        return false;
    }
    const std::string canonical = canonical_path(path);
    for (const auto& prefix : rules.waf.admin_path_prefixes) {
        if (has_path_prefix(path, prefix) || has_path_prefix(canonical, prefix)) {
            return true;
        }
    }
    return false;
}

[[nodiscard]] FilterDecision fail_close_decision(const RequestView& request) {
    return FilterDecision{
        FilterAction::kBlock,
        "fail-close",
        "",
        "",
        "request filter has no rules loaded",
        request.peer_ip,
    };
}

}  // namespace

// ---------------------------------------------------------------------------
// FilterRules::build
// ---------------------------------------------------------------------------
std::shared_ptr<const FilterRules> FilterRules::build(const GateConfig& config) {
    auto rules = std::make_shared<const FilterRules>(FilterRules{
        config.waf,
        ThreatMatcher(ThreatCategory::kSqlInjection, config.waf.sqli_patterns),
        ThreatMatcher(ThreatCategory::kXss, config.waf.xss_patterns),
        ThreatMatcher(ThreatCategory::kPathTraversal, config.waf.path_traversal_patterns),
        NetworkAllowlist(config.network.admin_allowed_networks),
        NetworkAllowlist(config.network.trusted_proxies),
        config.network.trust_forwarded_headers,
        SecurityHeaders(config.headers),
    });

    if (!rules->waf.enabled) {
        spdlog::warn("request_filter: WAF disabled by configuration");
    } else if (!rules->waf.block_mode) {
        spdlog::warn("request_filter: WAF in log-only mode, matches are recorded but not blocked");
    }

    // 미설정 허용목록은 명시적인 fail-open 상태로 기록한다
    if (!rules->admin_allowlist.is_configured()) {
        spdlog::warn("request_filter: admin allowlist not configured, "
                     "admin routes are reachable from ANY address (fail-open)");
    } else {
        spdlog::info("request_filter: admin allowlist has {} network(s)",
                     rules->admin_allowlist.networks().size());
    }
    if (rules->trust_forwarded_headers && !rules->trusted_proxies.is_configured()) {
        spdlog::warn("request_filter: trust_forwarded_headers is set but network.trusted_proxies "
                     "is empty, forwarded headers are ignored");
    }
    return rules;
}

// ---------------------------------------------------------------------------
// RequestFilter
// ---------------------------------------------------------------------------
RequestFilter::RequestFilter(std::shared_ptr<const FilterRules> rules)
    : rules_(std::move(rules))
{
    if (!rules_.load()) {
        spdlog::error("request_filter: constructed without rules, fail-close active");
    }
}

FilterDecision RequestFilter::inspect(const RequestView& request) const {
    const auto rules = rules_.load(std::memory_order_acquire);
    if (!rules) {
        return fail_close_decision(request);
    }
    if (!rules->waf.enabled) {
        return FilterDecision{};
    }

    ThreatMatch match = match_raw_and_decoded(rules->path_traversal, request.path, false);
    if (!match.detected && !request.query.empty()) {
        match = match_raw_and_decoded(rules->sqli, request.query, true);
        if (!match.detected) {
            match = match_raw_and_decoded(rules->xss, request.query, true);
        }
    }
    if (!match.detected) {
        return FilterDecision{};
    }

    const std::string_view location =
        match.category == ThreatCategory::kPathTraversal ? "path" : "query";
    return FilterDecision{
        rules->waf.block_mode ? FilterAction::kBlock : FilterAction::kLog,
        "waf",
        std::string(threat_category_name(match.category)),
        std::move(match.matched_pattern),
        fmt::format("{} in {}", match.reason, location),
        resolve_client_ip(request, rules->trust_forwarded_headers, rules->trusted_proxies),
    };
}

bool RequestFilter::is_admin_path(std::string_view path) const {
    const auto rules = rules_.load(std::memory_order_acquire);
    return rules && admin_path_matches(*rules, path);
}

std::string RequestFilter::client_ip_for(const RequestView& request) const {
    const auto rules = rules_.load(std::memory_order_acquire);
    if (!rules) {
        return request.peer_ip;
    }
    return resolve_client_ip(request, rules->trust_forwarded_headers, rules->trusted_proxies);
}

FilterDecision RequestFilter::check_admin_access(const RequestView& request) const {
    const auto rules = rules_.load(std::memory_order_acquire);
    if (!rules) {
        return fail_close_decision(request);
    }
    if (!admin_path_matches(*rules, request.path)) {
        return FilterDecision{};
    }

    std::string client_ip =
        resolve_client_ip(request, rules->trust_forwarded_headers, rules->trusted_proxies);
    if (rules->admin_allowlist.is_allowed(client_ip)) {
        return FilterDecision{FilterAction::kAllow, "", "", "", "", std::move(client_ip)};
    }
    return FilterDecision{
        FilterAction::kBlock,
        "admin_allowlist",
        "ip_allowlist",
        "",
        fmt::format("client IP {} not in admin allowlist", client_ip),
        std::move(client_ip),
    };
}

FilterDecision RequestFilter::evaluate(const RequestView& request) const {
    FilterDecision waf = inspect(request);
    if (waf.blocked()) {
        return waf;
    }
    FilterDecision admin = check_admin_access(request);
    if (admin.blocked()) {
        return admin;
    }
    return waf.action == FilterAction::kLog ? waf : admin;
}

HeaderList RequestFilter::response_headers(std::string_view path) const {
    const auto rules = rules_.load(std::memory_order_acquire);
    if (!rules) {
        return {};
    }
    return rules->headers.headers_for(path);
}

void RequestFilter::apply_response_headers(HeaderList& headers, std::string_view path) const {
    const auto rules = rules_.load(std::memory_order_acquire);
    if (rules) {
        rules->headers.apply(headers, path);
    }
}

void RequestFilter::reload(std::shared_ptr<const FilterRules> new_rules) {
    if (!new_rules) {
        spdlog::warn("request_filter: reload called with nullptr rules, "
                     "all requests will be blocked after reload (fail-close)");
    } else {
        spdlog::info("request_filter: rules reloaded (waf={}, block_mode={}, admin_networks={})",
                     new_rules->waf.enabled, new_rules->waf.block_mode,
                     new_rules->admin_allowlist.networks().size());
    }
    rules_.store(std::move(new_rules), std::memory_order_release);
}
