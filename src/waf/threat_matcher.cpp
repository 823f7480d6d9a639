// ---------------------------------------------------------------------------
// threat_matcher.cpp
//
// [CompiledPattern 구현 주의사항]
// 헤더에서 CompiledPattern 은 전방 선언만 되어 있으므로 소멸자/이동 연산은
// 이 파일에서 정의한다. std::regex 는 shared_ptr 로 보관한다.
// ---------------------------------------------------------------------------

#include "waf/threat_matcher.hpp"

#include <regex>

#include <spdlog/spdlog.h>

struct ThreatMatcher::CompiledPattern {
    std::string                 source_pattern;
    std::shared_ptr<std::regex> compiled;
};

ThreatMatcher::~ThreatMatcher() = default;
ThreatMatcher::ThreatMatcher(ThreatMatcher&&) noexcept = default;
ThreatMatcher& ThreatMatcher::operator=(ThreatMatcher&&) noexcept = default;

std::size_t ThreatMatcher::pattern_count() const noexcept {
    return compiled_patterns_.size();
}

ThreatMatcher::ThreatMatcher(ThreatCategory category, std::vector<std::string> patterns)
    : category_(category)
{
    if (patterns.empty()) {
        patterns = default_patterns(category);
    }
    compiled_patterns_.reserve(patterns.size());

    for (auto& p : patterns) {
        try {
            auto re = std::make_shared<std::regex>(
                p, std::regex_constants::icase | std::regex_constants::ECMAScript);
            compiled_patterns_.push_back(CompiledPattern{std::move(p), std::move(re)});
        } catch (const std::regex_error& e) {
            // [보안 주의] 건너뛴 패턴만큼 탐지 범위가 줄어든다 (false negative 증가).
            spdlog::warn("threat_matcher: invalid {} pattern '{}', skipping: {}",
                         threat_category_name(category), p, e.what());
        }
    }

    // [Fail-close] 유효한 패턴이 없으면 모든 입력을 탐지로 판정한다.
    // 서비스 중단(false positive)을 감수하고 무조건 통과(false negative)를 막는다.
    if (compiled_patterns_.empty()) {
        fail_close_active_ = true;
        spdlog::error("threat_matcher: no valid {} patterns loaded, "
                      "fail-close active, every request will match",
                      threat_category_name(category));
    }
}

ThreatMatch ThreatMatcher::check(std::string_view text) const {
    if (fail_close_active_) {
        return ThreatMatch{true, category_, "", "no valid patterns loaded"};
    }
    if (text.empty()) {
        return ThreatMatch{};
    }

    for (const auto& cp : compiled_patterns_) {
        if (!cp.compiled) {
            continue;
        }
        if (std::regex_search(text.begin(), text.end(), *cp.compiled)) {
            return ThreatMatch{
                true,
                category_,
                cp.source_pattern,
                fmt::format("matched {} pattern", threat_category_name(category_)),
            };
        }
    }
    return ThreatMatch{};
}
