// ---------------------------------------------------------------------------
// url_validator.cpp
//
// [IP 리터럴 판정]
// inet_pton 으로 파싱되는 주소뿐 아니라, 마지막 라벨이 숫자이거나 0x 로
// 시작하는 호스트(2130706433, 0x7f.1, 127.1 등)도 IP 표기로 간주한다.
// 실제 TLD 는 숫자로만 이루어지지 않으므로 오탐은 없다.
// ---------------------------------------------------------------------------

#include "ssrf/url_validator.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <regex>

#include <spdlog/spdlog.h>

#include "waf/network_allowlist.hpp"

namespace {

constexpr std::array<std::string_view, 11> kSuspiciousSubstrings{
    "%2e%2e", "%00", "%0d", "%0a", "@", "\\", "..",
    "file://", "ftp://", "data:", "javascript:",
};

constexpr std::array<std::string_view, 5> kLocalhostAliases{
    "localhost", "0.0.0.0", "127.0.0.1", "::1", "ip6-loopback",
};

// 라벨: 영숫자로 시작/끝, 내부 '-' 허용, 최대 63자
const std::regex& hostname_regex() {
    static const std::regex kRe(
        R"(^[a-z0-9]([a-z0-9\-]{0,61}[a-z0-9])?(\.[a-z0-9]([a-z0-9\-]{0,61}[a-z0-9])?)*$)",
        std::regex_constants::ECMAScript);
    return kRe;
}

[[nodiscard]] bool looks_like_ip(std::string_view host) {
    if (parse_ip(host)) {
        return true;
    }
    const auto dot   = host.rfind('.');
    const auto label = dot == std::string_view::npos ? host : host.substr(dot + 1);
    if (label.starts_with("0x")) {
        return true;
    }
    return !label.empty()
        && std::all_of(label.begin(), label.end(), [](unsigned char c) { return std::isdigit(c); });
}

[[nodiscard]] std::unexpected<UrlRejection> reject(UrlRejectReason reason, std::string detail) {
    spdlog::debug("url_validator: rejected ({}): {}", url_reject_reason_name(reason), detail);
    return std::unexpected(UrlRejection{reason, std::move(detail)});
}

}  // namespace

std::string_view url_reject_reason_name(UrlRejectReason reason) noexcept {
    switch (reason) {
        case UrlRejectReason::kEmpty:             return "empty";
        case UrlRejectReason::kSuspiciousPattern: return "suspicious_pattern";
        case UrlRejectReason::kUnsupportedScheme: return "unsupported_scheme";
        case UrlRejectReason::kUnparseable:       return "unparseable";
        case UrlRejectReason::kMissingHost:       return "missing_host";
        case UrlRejectReason::kInvalidHostname:   return "invalid_hostname";
        case UrlRejectReason::kLocalhost:         return "localhost";
        case UrlRejectReason::kIpLiteral:         return "ip_literal";
        case UrlRejectReason::kBlockedKeyword:    return "blocked_keyword";
        case UrlRejectReason::kHostTooShort:      return "host_too_short";
    }
    return "unknown";
}

GateError to_gate_error(const UrlRejection& rejection) {
    switch (rejection.reason) {
        case UrlRejectReason::kEmpty:
        case UrlRejectReason::kUnparseable:
        case UrlRejectReason::kMissingHost:
        case UrlRejectReason::kInvalidHostname:
        case UrlRejectReason::kUnsupportedScheme:
            return GateError{GateErrorCode::kValidation, "Invalid URL", rejection.detail};
        default:
            return GateError{GateErrorCode::kSecurityRejection, "URL not allowed", rejection.detail};
    }
}

UrlValidator::UrlValidator()
    : UrlValidator({"internal", "admin", "api", "backend", "database",
                    "db", "staging", "test", "dev", "debug"})
{}

UrlValidator::UrlValidator(std::vector<std::string> blocked_keywords)
    : blocked_keywords_(std::move(blocked_keywords))
{
    for (auto& kw : blocked_keywords_) {
        kw = to_lower(kw);
    }
}

std::expected<SafeUrl, UrlRejection> UrlValidator::validate(std::string_view candidate) const {
    const std::string_view url = trim(candidate);
    if (url.empty()) {
        return reject(UrlRejectReason::kEmpty, "URL is required");
    }

    // ── 1. 의심 패턴 ────────────────────────────────────────────────────
    const std::string lowered = to_lower(url);
    for (const auto pattern : kSuspiciousSubstrings) {
        if (lowered.find(pattern) != std::string::npos) {
            return reject(UrlRejectReason::kSuspiciousPattern,
                          fmt::format("suspicious pattern '{}'", pattern));
        }
    }

    // ── 2. scheme ───────────────────────────────────────────────────────
    const auto scheme_end = lowered.find("://");
    if (scheme_end == std::string::npos) {
        return reject(UrlRejectReason::kUnparseable, "missing scheme separator");
    }
    const std::string scheme = lowered.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        return reject(UrlRejectReason::kUnsupportedScheme, fmt::format("scheme '{}'", scheme));
    }

    // ── 3. authority / host / port ──────────────────────────────────────
    const std::string_view rest{lowered.data() + scheme_end + 3, lowered.size() - scheme_end - 3};
    const auto authority_end = rest.find_first_of("/?#");
    const std::string_view authority = rest.substr(0, authority_end);
    if (authority.empty()) {
        return reject(UrlRejectReason::kMissingHost, "no hostname");
    }

    std::string_view host = authority;
    std::uint16_t port = scheme == "https" ? 443 : 80;
    if (const auto colon = authority.find(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        const auto port_str = authority.substr(colon + 1);
        if (!port_str.empty()) {
            unsigned parsed{0};
            auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), parsed);
            if (ec != std::errc{} || ptr != port_str.data() + port_str.size()
                || parsed == 0 || parsed > 65535) {
                return reject(UrlRejectReason::kUnparseable, fmt::format("invalid port '{}'", port_str));
            }
            port = static_cast<std::uint16_t>(parsed);
        }
    }
    if (host.empty()) {
        return reject(UrlRejectReason::kMissingHost, "no hostname");
    }
    if (host.size() > 253 || !std::regex_match(host.begin(), host.end(), hostname_regex())) {
        return reject(UrlRejectReason::kInvalidHostname, fmt::format("hostname '{}'", host));
    }

    // ── 4. localhost ────────────────────────────────────────────────────
    for (const auto alias : kLocalhostAliases) {
        if (host.find(alias) != std::string_view::npos) {
            return reject(UrlRejectReason::kLocalhost, fmt::format("localhost alias '{}'", host));
        }
    }

    // ── 5. IP 리터럴 ────────────────────────────────────────────────────
    if (looks_like_ip(host)) {
        return reject(UrlRejectReason::kIpLiteral, fmt::format("direct IP address '{}'", host));
    }

    // ── 6. 키워드 라벨 ──────────────────────────────────────────────────
    std::string_view labels = host;
    while (!labels.empty()) {
        const auto dot   = labels.find('.');
        const auto label = labels.substr(0, dot);
        if (std::find(blocked_keywords_.begin(), blocked_keywords_.end(), label) != blocked_keywords_.end()) {
            return reject(UrlRejectReason::kBlockedKeyword, fmt::format("restricted label '{}'", label));
        }
        if (dot == std::string_view::npos) {
            break;
        }
        labels.remove_prefix(dot + 1);
    }

    // ── 7. 길이 ─────────────────────────────────────────────────────────
    if (host.size() < 4) {
        return reject(UrlRejectReason::kHostTooShort, fmt::format("hostname '{}' too short", host));
    }

    SafeUrl safe{};
    safe.url    = std::string(url);
    safe.scheme = scheme;
    safe.host   = std::string(host);
    safe.port   = port;
    if (authority_end == std::string_view::npos) {
        safe.target = "/";
    } else {
        // 대소문자를 보존하기 위해 원문에서 잘라낸다 (fragment 제외)
        std::string_view target = url.substr(scheme_end + 3 + authority_end);
        target = target.substr(0, target.find('#'));
        safe.target = target.empty() || target.front() != '/' ? "/" + std::string(target)
                                                              : std::string(target);
    }
    return safe;
}
