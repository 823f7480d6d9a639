// ---------------------------------------------------------------------------
// threat_pattern.cpp
//
// [기본 시그니처]
// SQLi
//  1. union ... select       : 공백/'+'/인라인 주석 구분자 변형 포함
//  2. ' or 1 / ' and 'a      : tautology
//  3. ; drop|delete|...      : piggyback
//  4. sleep( / benchmark(    : time-based blind
//  5. waitfor delay          : MSSQL time-based
//  6. ' --                   : 주석 꼬리 무력화
//  7. information_schema     : 스키마 탐색
//  8. exec xp_ / sp_         : 확장 프로시저 호출
// XSS
//  <script, javascript:, on*= 이벤트 핸들러, iframe/object/embed/svg 태그,
//  document.cookie / document.location, eval(
// Path traversal
//  ../ ..\ 와 그 percent 인코딩(단일/이중), /etc/passwd, %00
//
// [오탐/미탐 트레이드오프]
// - SQLi 2번은 따옴표 뒤 OR/AND 로 제한하여 자연어 검색어 오탐을 줄인다.
//   대신 따옴표 없는 숫자 컨텍스트(id=1 or 1=1)는 놓친다.
// - XSS 이벤트 핸들러는 대표적인 6개만 포함한다.
// ---------------------------------------------------------------------------

#include "waf/threat_pattern.hpp"

std::string_view threat_category_name(ThreatCategory category) noexcept {
    switch (category) {
        case ThreatCategory::kSqlInjection:  return "sqli";
        case ThreatCategory::kXss:           return "xss";
        case ThreatCategory::kPathTraversal: return "path_traversal";
    }
    return "unknown";
}

const std::vector<std::string>& default_patterns(ThreatCategory category) {
    static const std::vector<std::string> kSqli{
        R"(union(\s|\+|/\*.*?\*/)+(all(\s|\+|/\*.*?\*/)+)?select)",
        R"(('|%27)\s*(or|and)\s+['"\d])",
        R"(;\s*(drop|delete|update|insert|alter|create|truncate)\s)",
        R"(\b(sleep|benchmark|pg_sleep)\s*\()",
        R"(\bwaitfor\s+delay\b)",
        R"('\s*--)",
        R"(\b(information_schema|sysobjects)\b)",
        R"(\bexec(\s|\+)+(xp_|sp_))",
    };
    static const std::vector<std::string> kXss{
        R"(<\s*script\b)",
        R"(javascript\s*:)",
        R"(\bon(error|load|click|mouseover|focus|submit)\s*=)",
        R"(<\s*(iframe|object|embed|svg)\b)",
        R"(document\.(cookie|location))",
        R"(\beval\s*\()",
    };
    static const std::vector<std::string> kPathTraversal{
        R"(\.\./)",
        R"(\.\.\\)",
        R"(%2e%2e(%2f|%5c|/|\\))",
        R"(\.\.%2f)",
        R"(%252e%252e)",
        R"(/etc/passwd)",
        R"(%00)",
    };

    switch (category) {
        case ThreatCategory::kSqlInjection:  return kSqli;
        case ThreatCategory::kXss:           return kXss;
        case ThreatCategory::kPathTraversal: return kPathTraversal;
    }
    return kSqli;
}
