// ---------------------------------------------------------------------------
// test_http_message.cpp
//
// HTTP 헤드 파서/직렬화 단위 테스트.
//
// [테스트 범위]
// - 요청 라인 / 상태 라인 파싱, path 와 query 분리
// - request smuggling 계열 거부: obs-fold, 상충하는 Content-Length,
//   Transfer-Encoding + Content-Length 동시 사용
// - 헤더 편집 헬퍼와 게이트웨이 자체 JSON 응답
// ---------------------------------------------------------------------------

#include "gateway/http_message.hpp"

#include <gtest/gtest.h>

#include <string>

namespace {

void expect_bad_request(std::string_view head) {
    const auto r = HttpRequestHead::parse(head);
    ASSERT_FALSE(r.has_value()) << head;
    EXPECT_EQ(r.error().code, GateErrorCode::kValidation);
    EXPECT_EQ(r.error().public_message, "Bad request");
}

}  // namespace

// ---------------------------------------------------------------------------
// 요청 헤드
// ---------------------------------------------------------------------------
TEST(HttpRequestHead, Parse_SplitsTargetAndReadsFraming) {
    const auto r = HttpRequestHead::parse(
        "POST /api/resumes?category=resumes&x=1 HTTP/1.1\r\n"
        "Host: jobs.example.com\r\n"
        "Content-Type: application/pdf\r\n"
        "Content-Length:   2048  \r\n"
        "\r\n");
    ASSERT_TRUE(r.has_value()) << r.error().detail;

    EXPECT_EQ(r->method, "POST");
    EXPECT_EQ(r->target, "/api/resumes?category=resumes&x=1");
    EXPECT_EQ(r->path, "/api/resumes");
    EXPECT_EQ(r->query, "category=resumes&x=1");
    EXPECT_EQ(r->version, "HTTP/1.1");
    ASSERT_EQ(r->headers.size(), 3u);
    EXPECT_EQ(find_header(r->headers, "content-length"), "2048") << "values are trimmed";
    ASSERT_TRUE(r->content_length.has_value());
    EXPECT_EQ(*r->content_length, 2048u);
    EXPECT_FALSE(r->chunked);
}

TEST(HttpRequestHead, Parse_NoQueryAndNoBody) {
    const auto r = HttpRequestHead::parse("GET /health HTTP/1.0\r\n\r\n");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->path, "/health");
    EXPECT_TRUE(r->query.empty());
    EXPECT_FALSE(r->content_length.has_value());
}

TEST(HttpRequestHead, Parse_ChunkedWhenLastCodingIsChunked) {
    const auto chunked = HttpRequestHead::parse(
        "POST /upload HTTP/1.1\r\nTransfer-Encoding: gzip, Chunked\r\n\r\n");
    ASSERT_TRUE(chunked.has_value());
    EXPECT_TRUE(chunked->chunked);

    const auto split = HttpRequestHead::parse(
        "POST /upload HTTP/1.1\r\nTransfer-Encoding: gzip\r\nTransfer-Encoding: chunked\r\n\r\n");
    ASSERT_TRUE(split.has_value());
    EXPECT_TRUE(split->chunked);
}

TEST(HttpRequestHead, Parse_RejectsTransferEncodingNotEndingInChunked) {
    expect_bad_request("POST /upload HTTP/1.1\r\nTransfer-Encoding: chunked, gzip\r\n\r\n");
    expect_bad_request("POST /upload HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n");
    expect_bad_request("POST /upload HTTP/1.1\r\nTransfer-Encoding: chunked\r\nTransfer-Encoding: identity\r\n\r\n");
    expect_bad_request("POST /upload HTTP/1.1\r\nTransfer-Encoding: gzip\r\nContent-Length: 4\r\n\r\n");
}

TEST(HttpRequestHead, Parse_DuplicateEqualContentLengthIsAccepted) {
    const auto r = HttpRequestHead::parse(
        "POST /a HTTP/1.1\r\nContent-Length: 5\r\nContent-Length: 5\r\n\r\n");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r->content_length, 5u);
}

TEST(HttpRequestHead, Parse_RejectsSmugglingShapes) {
    expect_bad_request("POST /a HTTP/1.1\r\nContent-Length: 5\r\nContent-Length: 6\r\n\r\n");
    expect_bad_request("POST /a HTTP/1.1\r\nTransfer-Encoding: chunked\r\nContent-Length: 5\r\n\r\n");
    expect_bad_request("POST /a HTTP/1.1\r\nX-Long: first\r\n continued\r\n\r\n");
    expect_bad_request("POST /a HTTP/1.1\r\nContent-Length: -1\r\n\r\n");
    expect_bad_request("POST /a HTTP/1.1\r\nContent-Length: 12abc\r\n\r\n");
}

TEST(HttpRequestHead, Parse_RejectsMalformedRequestLines) {
    expect_bad_request("");
    expect_bad_request("GET /a\r\n\r\n");
    expect_bad_request("GET  /a HTTP/1.1\r\n\r\n");
    expect_bad_request("GET /a HTTP/2\r\n\r\n");
    expect_bad_request("G(T /a HTTP/1.1\r\n\r\n");
    expect_bad_request("GET http://evil.example/ HTTP/1.1\r\n\r\n");
    expect_bad_request("GET /a HTTP/1.1\r\nNoColonHere\r\n\r\n");
    expect_bad_request("GET /a HTTP/1.1\r\nBad Name: x\r\n\r\n");
}

TEST(HttpRequestHead, Serialize_PreservesHeaderOrder) {
    auto r = HttpRequestHead::parse(
        "GET /jobs?page=2 HTTP/1.1\r\nHost: a\r\nAccept: */*\r\nHost-Extra: b\r\n\r\n");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->serialize(),
              "GET /jobs?page=2 HTTP/1.1\r\nHost: a\r\nAccept: */*\r\nHost-Extra: b\r\n\r\n");
}

// ---------------------------------------------------------------------------
// 응답 헤드
// ---------------------------------------------------------------------------
TEST(HttpResponseHead, Parse_StatusReasonAndHeaders) {
    const auto r = HttpResponseHead::parse(
        "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\nX-Frame-Options: SAMEORIGIN\r\n\r\n");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->status, 404);
    EXPECT_EQ(r->reason, "Not Found");
    EXPECT_EQ(*r->content_length, 0u);
    EXPECT_EQ(find_header(r->headers, "x-frame-options"), "SAMEORIGIN");
}

TEST(HttpResponseHead, Parse_NonChunkedTransferEncodingReadsUntilClose) {
    const auto r = HttpResponseHead::parse("HTTP/1.1 200 OK\r\nTransfer-Encoding: gzip\r\n\r\n");
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r->chunked);
    EXPECT_FALSE(r->content_length.has_value());
}

TEST(HttpResponseHead, Parse_EmptyReasonIsAllowed) {
    const auto r = HttpResponseHead::parse("HTTP/1.1 204\r\n\r\n");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->status, 204);
    EXPECT_TRUE(r->reason.empty());
}

TEST(HttpResponseHead, Parse_RejectsBadStatus) {
    EXPECT_FALSE(HttpResponseHead::parse("HTTP/1.1 099 Odd\r\n\r\n").has_value());
    EXPECT_FALSE(HttpResponseHead::parse("HTTP/1.1 600 Odd\r\n\r\n").has_value());
    EXPECT_FALSE(HttpResponseHead::parse("HTTP/1.1 2x0 Odd\r\n\r\n").has_value());
    EXPECT_FALSE(HttpResponseHead::parse("SPDY/3 200 OK\r\n\r\n").has_value());
}

// ---------------------------------------------------------------------------
// 헬퍼
// ---------------------------------------------------------------------------
TEST(HttpHelpers, FindHeadEnd) {
    EXPECT_FALSE(find_head_end("GET / HTTP/1.1\r\nHost: a\r\n").has_value());
    const std::string buf = "GET / HTTP/1.1\r\n\r\nBODY";
    const auto end = find_head_end(buf);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(buf.substr(*end), "BODY");
}

TEST(HttpHelpers, SetHeaderReplacesAllCaseInsensitiveMatches) {
    HeaderList headers{{"X-Forwarded-For", "1.2.3.4"}, {"Host", "a"}, {"x-forwarded-for", "5.6.7.8"}};
    set_header(headers, "X-Forwarded-For", "203.0.113.9");
    ASSERT_EQ(headers.size(), 2u);
    EXPECT_EQ(headers[0].first, "Host");
    EXPECT_EQ(headers[1].second, "203.0.113.9");

    remove_header(headers, "HOST");
    ASSERT_EQ(headers.size(), 1u);
}

TEST(HttpHelpers, MakeJsonResponse_SetsFramingAndExtraHeaders) {
    const std::string body = R"({"error":"Forbidden"})";
    const auto out = make_json_response(403, body, {{"X-Content-Type-Options", "nosniff"},
                                                    {"Connection", "keep-alive"}});

    const auto end = find_head_end(out);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(out.substr(*end), body);

    const auto head = HttpResponseHead::parse(std::string_view(out).substr(0, *end));
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(head->status, 403);
    EXPECT_EQ(head->reason, "Forbidden");
    EXPECT_EQ(find_header(head->headers, "Content-Type"), "application/json");
    EXPECT_EQ(*head->content_length, body.size());
    EXPECT_EQ(find_header(head->headers, "X-Content-Type-Options"), "nosniff");
    EXPECT_EQ(find_header(head->headers, "Connection"), "keep-alive")
        << "extra headers override the defaults";
}

TEST(HttpHelpers, ReasonPhrase) {
    EXPECT_EQ(reason_phrase(411), "Length Required");
    EXPECT_EQ(reason_phrase(413), "Content Too Large");
    EXPECT_EQ(reason_phrase(299), "Unknown");
}
