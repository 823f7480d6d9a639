#pragma once

// ---------------------------------------------------------------------------
// url_validator.hpp
//
// 서버가 사용자 제공 URL 을 가져오기(fetch) 전에 반드시 거쳐야 하는 SSRF 가드.
//
// [검사 순서]
// 1. 의심 패턴 (대소문자 무관 부분 문자열)
//    %2e%2e, %00, %0d, %0a, '@', '\', "..", file://, ftp://, data:, javascript:
// 2. scheme 은 http / https 만 허용
// 3. 호스트 존재 + 포트(있다면 1..65535) + 엄격한 호스트명 정규식
// 4. localhost 별칭 (부분 문자열, 어떤 표기든)
// 5. IP 리터럴은 공인 IP 라도 무조건 거부 (이름만 허용)
// 6. 내부 인프라 키워드 라벨 (internal, admin, api, db, staging, dev, ...)
// 7. 4자 미만 호스트명
//
// [알려진 한계]
// - denylist/휴리스틱 방식이다. DNS 가 사설 주소로 해석되는 공개 도메인
//   (DNS rebinding, 와일드카드 DNS)은 막지 못한다 (accepted false negative).
//   egress 네트워크 정책을 대체하지 않는 best-effort 경계 방어이다.
// - 리다이렉트 대상은 fetcher 가 이 검증기를 다시 호출해야 한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"

// 거부 사유 (감사 로그, 테스트용). 클라이언트에는 일반 메시지만 노출된다.
enum class UrlRejectReason : std::uint8_t {
    kEmpty,
    kSuspiciousPattern,
    kUnsupportedScheme,
    kUnparseable,
    kMissingHost,
    kInvalidHostname,
    kLocalhost,
    kIpLiteral,
    kBlockedKeyword,
    kHostTooShort,
};

[[nodiscard]] std::string_view url_reject_reason_name(UrlRejectReason reason) noexcept;

struct UrlRejection {
    UrlRejectReason reason{UrlRejectReason::kUnparseable};
    std::string     detail{};   // 서버 로그 전용
};

// to_gate_error
//   형식 오류(kEmpty, kUnparseable, kMissingHost, kInvalidHostname, kUnsupportedScheme)
//   → kValidation, 나머지 → kSecurityRejection.
[[nodiscard]] GateError to_gate_error(const UrlRejection& rejection);

// ---------------------------------------------------------------------------
// SafeUrl
//   검증을 통과한 URL. url 은 앞뒤 공백을 제거한 원문이다.
// ---------------------------------------------------------------------------
struct SafeUrl {
    std::string   url{};
    std::string   scheme{};
    std::string   host{};      // 소문자
    std::uint16_t port{0};     // 명시되지 않으면 scheme 기본 포트
    std::string   target{};    // path + query (없으면 "/")
};

class UrlValidator {
public:
    UrlValidator();
    explicit UrlValidator(std::vector<std::string> blocked_keywords);

    [[nodiscard]] std::expected<SafeUrl, UrlRejection> validate(std::string_view candidate) const;

    [[nodiscard]] const std::vector<std::string>& blocked_keywords() const noexcept {
        return blocked_keywords_;
    }

private:
    std::vector<std::string> blocked_keywords_;
};
