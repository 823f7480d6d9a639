#pragma once

// ---------------------------------------------------------------------------
// security_posture.hpp
//
// 운영자에게 노출되는 현재 보안 설정 상태.
// "보호되고 있다" 고 착각하기 쉬운 상태(허용목록 미설정 fail-open, 휴리스틱 스캔,
// 평문 fallback)를 숨기지 않고 드러내는 것이 목적이다.
// ---------------------------------------------------------------------------

#include <string>

struct SecurityPosture {
    std::string scan_mode{};                   // "delegated" | "heuristic"
    bool        waf_enabled{true};
    bool        waf_block_mode{true};
    bool        admin_allowlist_configured{false};
    bool        trust_forwarded_headers{false};
    bool        encryption_required{true};
    bool        legacy_plaintext_fallback{false};
};

// serialize_posture: 한 줄 JSON 객체
[[nodiscard]] std::string serialize_posture(const SecurityPosture& posture);
