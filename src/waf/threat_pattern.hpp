#pragma once

// ---------------------------------------------------------------------------
// threat_pattern.hpp
//
// WAF 시그니처 분류와 기본 패턴 목록.
//
// [검사 대상]
// - kSqlInjection  : 쿼리스트링
// - kXss           : 쿼리스트링
// - kPathTraversal : 요청 경로
//
// 패턴은 프로세스 시작 시 한 번 컴파일되고 이후 변경되지 않는다.
// 운영자가 config 의 waf.*_patterns 로 교체할 수 있으며, 비어 있으면
// default_patterns() 가 사용된다.
//
// [알려진 한계]
// - denylist 방식이므로 변형된 공격은 놓칠 수 있다 (false negative).
//   네트워크 최소 권한 정책을 대체하지 않는 best-effort 경계 방어이다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

enum class ThreatCategory : std::uint8_t {
    kSqlInjection  = 0,
    kXss           = 1,
    kPathTraversal = 2,
};

// 로그 필드용 이름: "sqli" / "xss" / "path_traversal"
[[nodiscard]] std::string_view threat_category_name(ThreatCategory category) noexcept;

// ---------------------------------------------------------------------------
// ThreatPattern
//   불변 {category, regex 원문}. 컴파일은 ThreatMatcher 가 담당한다.
// ---------------------------------------------------------------------------
struct ThreatPattern {
    ThreatCategory category{ThreatCategory::kSqlInjection};
    std::string    regex{};
};

// default_patterns
//   카테고리별 기본 시그니처. 모든 패턴은 icase + ECMAScript 로 컴파일된다.
[[nodiscard]] const std::vector<std::string>& default_patterns(ThreatCategory category);
