#pragma once

// ---------------------------------------------------------------------------
// security_headers.hpp
//
// 모든 응답에 주입하는 보안 헤더 집합.
//
// 항상 포함:
//   Content-Security-Policy (csp_enabled), Strict-Transport-Security (hsts_enabled),
//   X-Frame-Options, X-Content-Type-Options, X-XSS-Protection,
//   Referrer-Policy, Permissions-Policy
// API 경로가 아닌 경우에만:
//   Cross-Origin-Opener-Policy, Cross-Origin-Embedder-Policy,
//   Cross-Origin-Resource-Policy
//
// cross-origin isolation 헤더를 API 응답에 붙이면 다른 origin 의 API 소비가
// 깨지므로 api_path_prefix 로 시작하는 경로는 제외한다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>

#include "common/types.hpp"
#include "config/gate_config.hpp"

// build_csp
//   csp_override 가 있으면 그대로, 없으면 "directive value; directive value" 형태로 조합.
[[nodiscard]] std::string build_csp(const HeaderSection& config);

class SecurityHeaders {
public:
    explicit SecurityHeaders(HeaderSection config);

    // headers_for: 해당 경로의 응답에 붙일 헤더 목록
    [[nodiscard]] HeaderList headers_for(std::string_view path) const;

    // apply
    //   response_headers 에서 같은 이름의 헤더(대소문자 무관)를 제거한 뒤
    //   headers_for(path) 를 추가한다. upstream 이 약한 값을 보내도 덮어쓴다.
    void apply(HeaderList& response_headers, std::string_view path) const;

    [[nodiscard]] bool is_api_path(std::string_view path) const noexcept;
    [[nodiscard]] const std::string& content_security_policy() const noexcept { return csp_; }

private:
    HeaderSection config_;
    std::string   csp_;
    std::string   hsts_;
};
