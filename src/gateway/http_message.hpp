#pragma once

// ---------------------------------------------------------------------------
// http_message.hpp
//
// HTTP/1.1 메시지 헤드(start line + 헤더) 파서/직렬화.
// 바디는 다루지 않는다. 바디 길이 판단에 필요한 정보만 뽑아낸다.
//
// [설계 원칙]
// - 입력은 "\r\n\r\n" 까지의 완결된 헤드 바이트. 경계 탐색은 호출자 몫.
// - 파싱 실패는 std::expected<T, GateError> (kValidation) 로 반환.
// - obs-fold(줄바꿈으로 이어지는 헤더 값)는 거부한다.
// - Content-Length 가 여러 개이고 값이 다르면 거부 (request smuggling 방지).
//
// - 요청의 Transfer-Encoding 최종 코딩이 chunked 가 아니면 거부한다
//   (RFC 9112 §6.3). 응답은 연결 종료까지를 바디로 본다.
// - Transfer-Encoding 과 Content-Length 가 함께 오면 거부.
//
// [알려진 한계]
// - Transfer-Encoding 은 최종 코딩만 본다. 게이트웨이는 chunked 요청
//   바디를 받지 않는다 (411).
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// HttpRequestHead
//   target : 요청 라인의 원문 request-target
//   path   : target 중 '?' 이전 부분
//   query  : '?' 이후 부분 ('?' 미포함)
// ---------------------------------------------------------------------------
struct HttpRequestHead {
    std::string                  method{};
    std::string                  target{};
    std::string                  path{};
    std::string                  query{};
    std::string                  version{};
    HeaderList                   headers{};
    std::optional<std::uint64_t> content_length{};
    bool                         chunked{false};

    [[nodiscard]] static std::expected<HttpRequestHead, GateError> parse(std::string_view head);

    // serialize: 업스트림 전달용. headers 순서를 보존한다.
    [[nodiscard]] std::string serialize() const;
};

// ---------------------------------------------------------------------------
// HttpResponseHead
//   업스트림 응답 헤드. 보안 헤더 교체 후 다시 직렬화하여 클라이언트에 보낸다.
// ---------------------------------------------------------------------------
struct HttpResponseHead {
    std::string                  version{"HTTP/1.1"};
    int                          status{200};
    std::string                  reason{"OK"};
    HeaderList                   headers{};
    std::optional<std::uint64_t> content_length{};
    bool                         chunked{false};

    [[nodiscard]] static std::expected<HttpResponseHead, GateError> parse(std::string_view head);

    [[nodiscard]] std::string serialize() const;
};

// find_head_end
//   buffer 에서 "\r\n\r\n" 의 끝 위치(헤드 길이)를 찾는다. 없으면 nullopt.
[[nodiscard]] std::optional<std::size_t> find_head_end(std::string_view buffer) noexcept;

// remove_header / set_header: 대소문자 무관. set_header 는 기존 값을 모두 지우고 추가.
void remove_header(HeaderList& headers, std::string_view name);
void set_header(HeaderList& headers, std::string_view name, std::string value);

// reason_phrase: 게이트웨이가 직접 만드는 응답에 쓰는 상태 문구
[[nodiscard]] std::string_view reason_phrase(int status) noexcept;

// make_json_response
//   게이트웨이 자체 응답 (403/411/413/502 등). Connection: close 고정.
//   extra_headers 는 보안 헤더 등 추가 헤더.
[[nodiscard]] std::string make_json_response(int               status,
                                             std::string_view  json_body,
                                             const HeaderList& extra_headers = {});
