// ---------------------------------------------------------------------------
// test_security_headers.cpp
//
// SecurityHeaders / build_csp 단위 테스트.
// ---------------------------------------------------------------------------

#include "waf/security_headers.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(SecurityHeaders, BuildCsp_JoinsDirectiveTable) {
    HeaderSection cfg;
    cfg.csp_directives = {{"default-src", "'self'"}, {"upgrade-insecure-requests", ""}};
    EXPECT_EQ(build_csp(cfg), "default-src 'self'; upgrade-insecure-requests");
}

TEST(SecurityHeaders, BuildCsp_OverrideWins) {
    HeaderSection cfg;
    cfg.csp_override = "default-src 'none'";
    EXPECT_EQ(build_csp(cfg), "default-src 'none'");
}

TEST(SecurityHeaders, PageResponse_CarriesFullSet) {
    const SecurityHeaders headers{HeaderSection{}};
    const HeaderList h = headers.headers_for("/dashboard");

    EXPECT_EQ(find_header(h, "Content-Security-Policy"), headers.content_security_policy());
    EXPECT_FALSE(headers.content_security_policy().empty());
    EXPECT_EQ(find_header(h, "Strict-Transport-Security"), "max-age=31536000; includeSubDomains");
    EXPECT_EQ(find_header(h, "X-Frame-Options"), "DENY");
    EXPECT_EQ(find_header(h, "X-Content-Type-Options"), "nosniff");
    EXPECT_EQ(find_header(h, "X-XSS-Protection"), "1; mode=block");
    EXPECT_EQ(find_header(h, "Referrer-Policy"), "strict-origin-when-cross-origin");
    EXPECT_FALSE(find_header(h, "Permissions-Policy").empty());
    EXPECT_EQ(find_header(h, "Cross-Origin-Opener-Policy"), "same-origin");
    EXPECT_EQ(find_header(h, "Cross-Origin-Embedder-Policy"), "require-corp");
}

TEST(SecurityHeaders, ApiResponse_SkipsCrossOriginIsolation) {
    const SecurityHeaders headers{HeaderSection{}};
    const HeaderList h = headers.headers_for("/api/jobs");

    EXPECT_TRUE(find_header(h, "Cross-Origin-Opener-Policy").empty());
    EXPECT_TRUE(find_header(h, "Cross-Origin-Embedder-Policy").empty());
    EXPECT_EQ(find_header(h, "X-Frame-Options"), "DENY");

    EXPECT_TRUE(headers.is_api_path("/api"));
    EXPECT_FALSE(headers.is_api_path("/apidocs")) << "prefix must end at a segment boundary";
}

TEST(SecurityHeaders, DisabledCspAndHsts_AreOmitted) {
    HeaderSection cfg;
    cfg.csp_enabled  = false;
    cfg.hsts_enabled = false;
    const SecurityHeaders headers{cfg};
    const HeaderList h = headers.headers_for("/");

    EXPECT_TRUE(find_header(h, "Content-Security-Policy").empty());
    EXPECT_TRUE(find_header(h, "Strict-Transport-Security").empty());
    EXPECT_FALSE(find_header(h, "X-Content-Type-Options").empty());
}

TEST(SecurityHeaders, Apply_ReplacesWeakUpstreamValues) {
    const SecurityHeaders headers{HeaderSection{}};
    HeaderList response{
        {"Content-Type", "text/html"},
        {"x-frame-options", "ALLOWALL"},
        {"X-Frame-Options", "SAMEORIGIN"},
    };
    headers.apply(response, "/");

    int frame_options = 0;
    for (const auto& [name, value] : response) {
        if (iequals(name, "X-Frame-Options")) {
            ++frame_options;
            EXPECT_EQ(value, "DENY");
        }
    }
    EXPECT_EQ(frame_options, 1);
    EXPECT_EQ(find_header(response, "Content-Type"), "text/html") << "unrelated headers are kept";
}
