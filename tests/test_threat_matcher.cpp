// ---------------------------------------------------------------------------
// test_threat_matcher.cpp
//
// ThreatMatcher 단위 테스트 (기본 시그니처 + 사용자 패턴 + fail-close).
//
// [알려진 한계]
// - 시그니처는 denylist 이므로 여기서 통과하는 우회 변형이 존재한다.
//   테스트는 대표 공격 형태와 정상 입력의 오탐 여부만 확인한다.
// ---------------------------------------------------------------------------

#include "waf/threat_matcher.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// SQL Injection
// ---------------------------------------------------------------------------
TEST(ThreatMatcher, Sqli_UnionSelectAnyCaseAndSpacing) {
    const ThreatMatcher sqli(ThreatCategory::kSqlInjection, {});

    for (const char* q : {"id=1 union select password from users",
                          "id=1 UNION SELECT 1",
                          "id=1 UnIoN   sElEcT 1",
                          "id=1 union all select 1",
                          "id=1 union/**/select 1",
                          "id=1+union+select+1"}) {
        const auto m = sqli.check(q);
        EXPECT_TRUE(m.detected) << q;
        EXPECT_EQ(m.category, ThreatCategory::kSqlInjection) << q;
        EXPECT_FALSE(m.matched_pattern.empty()) << q;
    }
}

TEST(ThreatMatcher, Sqli_TautologyAndTimeBased) {
    const ThreatMatcher sqli(ThreatCategory::kSqlInjection, {});
    EXPECT_TRUE(sqli.check("name=' OR '1'='1").detected);
    EXPECT_TRUE(sqli.check("id=1; DROP TABLE users").detected);
    EXPECT_TRUE(sqli.check("id=1 AND SLEEP(5)").detected);
    EXPECT_TRUE(sqli.check("user=admin'--").detected);
}

TEST(ThreatMatcher, Sqli_NormalQueriesPass) {
    const ThreatMatcher sqli(ThreatCategory::kSqlInjection, {});
    EXPECT_FALSE(sqli.check("q=software+engineer&page=2").detected);
    EXPECT_FALSE(sqli.check("sort=created_at&order=desc").detected);
    EXPECT_FALSE(sqli.check("").detected);
}

// ---------------------------------------------------------------------------
// XSS
// ---------------------------------------------------------------------------
TEST(ThreatMatcher, Xss_ScriptTagAndHandlers) {
    const ThreatMatcher xss(ThreatCategory::kXss, {});
    EXPECT_TRUE(xss.check("q=<script>alert(1)</script>").detected);
    EXPECT_TRUE(xss.check("q=< SCRIPT src=x>").detected);
    EXPECT_TRUE(xss.check("q=javascript:alert(1)").detected);
    EXPECT_TRUE(xss.check("q=<img src=x onerror=alert(1)>").detected);
    EXPECT_EQ(xss.check("q=<script>").category, ThreatCategory::kXss);
    EXPECT_FALSE(xss.check("q=description&lang=en").detected);
}

// ---------------------------------------------------------------------------
// Path traversal
// ---------------------------------------------------------------------------
TEST(ThreatMatcher, PathTraversal_DotDotVariants) {
    const ThreatMatcher pt(ThreatCategory::kPathTraversal, {});
    EXPECT_TRUE(pt.check("/files/../../etc/passwd").detected);
    EXPECT_TRUE(pt.check("/files/..\\windows").detected);
    EXPECT_TRUE(pt.check("/files/%2e%2e%2fsecret").detected);
    EXPECT_TRUE(pt.check("/files/%252e%252e/secret").detected);
    EXPECT_FALSE(pt.check("/api/jobs/42").detected);
    EXPECT_FALSE(pt.check("/static/app.v1.2.js").detected);
}

// ---------------------------------------------------------------------------
// 사용자 패턴 / fail-close
// ---------------------------------------------------------------------------
TEST(ThreatMatcher, CustomPatterns_ReplaceDefaults) {
    const ThreatMatcher sqli(ThreatCategory::kSqlInjection, {R"(\bxp_cmdshell\b)"});
    EXPECT_EQ(sqli.pattern_count(), 1u);
    EXPECT_TRUE(sqli.check("cmd=exec xp_cmdshell 'dir'").detected);
    EXPECT_FALSE(sqli.check("id=1 union select 1").detected)
        << "custom list replaces the built-in signatures";
}

TEST(ThreatMatcher, InvalidPatternSkipped_OthersStillApply) {
    const ThreatMatcher xss(ThreatCategory::kXss, {"(unclosed", R"(<\s*script)"});
    EXPECT_EQ(xss.pattern_count(), 1u);
    EXPECT_FALSE(xss.fail_close_active());
    EXPECT_TRUE(xss.check("<script>").detected);
}

TEST(ThreatMatcher, AllPatternsInvalid_FailCloseMatchesEverything) {
    const ThreatMatcher xss(ThreatCategory::kXss, {"(unclosed", "[bad"});
    EXPECT_TRUE(xss.fail_close_active());
    EXPECT_EQ(xss.pattern_count(), 0u) << "an all-invalid list does not fall back to the built-ins";
    EXPECT_TRUE(xss.check("harmless").detected);
}

TEST(ThreatMatcher, EmptyList_UsesBuiltIns) {
    const ThreatMatcher sqli(ThreatCategory::kSqlInjection, {});
    EXPECT_EQ(sqli.pattern_count(), default_patterns(ThreatCategory::kSqlInjection).size());
    EXPECT_FALSE(sqli.fail_close_active());
}

TEST(ThreatMatcher, CategoryNames) {
    EXPECT_EQ(threat_category_name(ThreatCategory::kSqlInjection),  "sqli");
    EXPECT_EQ(threat_category_name(ThreatCategory::kXss),           "xss");
    EXPECT_EQ(threat_category_name(ThreatCategory::kPathTraversal), "path_traversal");
}
