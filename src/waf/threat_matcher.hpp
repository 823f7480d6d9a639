#pragma once

// ---------------------------------------------------------------------------
// threat_matcher.hpp
//
// 단일 카테고리(SQLi / XSS / path traversal) 정규식 시그니처 매처.
// 상태 없는 순수 함수. 생성 후 불변이므로 여러 세션에서 동시 호출 가능.
//
// [설계 한계 / 알려진 우회 가능성]
// 1. 이중 인코딩: RequestFilter 가 원문과 1회 percent 디코딩 결과를 모두
//    검사한다. 2회 이상 인코딩된 입력은 %252e 같은 일부 패턴만 잡는다.
// 2. 대소문자 변형: icase 플래그로 완화.
// 3. 유니코드 정규화 우회(전각 문자 등)는 탐지 불가.
//
// [보안 원칙]
// - ThreatMatch::matched_pattern 은 감사 로그 전용. 클라이언트에 노출 금지.
// - 유효한 패턴이 하나도 없으면 fail-close: 모든 입력을 detected 로 판정.
// ---------------------------------------------------------------------------

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "waf/threat_pattern.hpp"

// ---------------------------------------------------------------------------
// ThreatMatch
//   매칭 결과. detected == false 이면 나머지 필드는 비어 있다.
// ---------------------------------------------------------------------------
struct ThreatMatch {
    bool           detected{false};
    ThreatCategory category{ThreatCategory::kSqlInjection};
    std::string    matched_pattern{};   // 매칭된 정규식 원문 (감사 로그용)
    std::string    reason{};
};

// ---------------------------------------------------------------------------
// ThreatMatcher
//   생성 시 패턴을 icase + ECMAScript 로 컴파일한다.
//
//   [성능 고려사항]
//   - O(P * N). 입력 길이 상한은 호출자(gateway 의 헤더 크기 제한)가 보장한다.
//   - 인스턴스를 재사용할 것 (생성자에서 regex 컴파일 비용 발생).
// ---------------------------------------------------------------------------
class ThreatMatcher {
public:
    // patterns 가 비어 있으면 default_patterns(category) 를 사용한다.
    // 잘못된 패턴은 경고 로그 후 건너뛴다. 전부 잘못되면 기본 패턴으로
    // 돌아가지 않고 fail-close (모든 입력 탐지) 상태가 된다.
    ThreatMatcher(ThreatCategory category, std::vector<std::string> patterns);
    ~ThreatMatcher();

    ThreatMatcher(const ThreatMatcher&)            = delete;
    ThreatMatcher& operator=(const ThreatMatcher&) = delete;
    ThreatMatcher(ThreatMatcher&&) noexcept;
    ThreatMatcher& operator=(ThreatMatcher&&) noexcept;

    // check
    //   첫 번째 매칭에서 즉시 반환한다.
    [[nodiscard]] ThreatMatch check(std::string_view text) const;

    [[nodiscard]] ThreatCategory category() const noexcept { return category_; }
    // pattern_count: CompiledPattern 이 불완전 타입이므로 .cpp 에서 정의한다
    [[nodiscard]] std::size_t pattern_count() const noexcept;
    [[nodiscard]] bool fail_close_active() const noexcept { return fail_close_active_; }

private:
    struct CompiledPattern;

    ThreatCategory               category_;
    std::vector<CompiledPattern> compiled_patterns_;
    bool                         fail_close_active_{false};
};
