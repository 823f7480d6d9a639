#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 보안 이벤트 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - FilterAction, ScanVerdict 등을 직접 include 하지 않는다.
//   호출자가 문자열(mode, outcome)로 변환하여 채운다.
//
// [민감정보 취급 주의]
// - path 와 query 는 공격 페이로드를 포함할 수 있다. JSON 이스케이프는 하지만
//   로그 소비 측에서 렌더링할 때 추가 이스케이프가 필요하다.
// - API 키, TOTP 코드, 백업 코드, 암호 키는 어떤 필드에도 넣지 말 것.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// "debug" | "info" | "warn"/"warning" | "error". 알 수 없으면 kInfo.
[[nodiscard]] LogLevel parse_log_level(std::string_view text) noexcept;

// ---------------------------------------------------------------------------
// RequestLog
//   게이트를 통과한 요청 하나의 결과.
// ---------------------------------------------------------------------------
struct RequestLog {
    std::uint64_t                         request_id{0};
    std::string                           method{};
    std::string                           path{};
    std::string                           client_ip{};
    int                                   status{0};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};
};

// ---------------------------------------------------------------------------
// BlockLog
//   WAF / 허용목록 판정 이벤트.
//   mode: "block" | "log_only"
//   reason, matched_pattern 은 클라이언트에 노출 금지.
// ---------------------------------------------------------------------------
struct BlockLog {
    std::uint64_t                         request_id{0};
    std::string                           client_ip{};
    std::string                           method{};
    std::string                           path{};
    std::string                           rule{};             // "waf" | "admin_allowlist"
    std::string                           category{};         // "sqli" | "xss" | ...
    std::string                           matched_pattern{};
    std::string                           reason{};
    std::string                           mode{};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// UploadLog
//   파일 수집 파이프라인 결과.
//   stage  : 마지막으로 도달한 단계 ("received" ... "stored")
//   outcome: "stored" | "rejected"
// ---------------------------------------------------------------------------
struct UploadLog {
    std::string                           category{};
    std::string                           declared_filename{};
    std::string                           stored_name{};
    std::string                           stage{};
    std::string                           outcome{};
    std::uint64_t                         size{0};
    bool                                  encrypted{false};
    std::string                           reason{};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// AuthLog
//   자격 증명 검증 이벤트.
//   factor : "api_key" | "totp" | "backup_code" | "second_factor"
//   outcome: "success" | "failure" | "migrated"
//   detail : 내부 원인 (클라이언트 응답은 항상 동일한 일반 메시지)
// ---------------------------------------------------------------------------
struct AuthLog {
    std::string                           subject_id{};
    std::string                           factor{};
    std::string                           outcome{};
    std::string                           detail{};
    std::string                           client_ip{};
    std::chrono::system_clock::time_point timestamp{};
};
