#pragma once

// ---------------------------------------------------------------------------
// encoding.hpp
//
// 바이트 ↔ 텍스트 인코딩 헬퍼.
//
// - hex            : 서명(HMAC) 표기
// - base64 / url   : Fernet 토큰, PBKDF2 해시 문자열, 키 로딩
// - base32         : TOTP 시크릿 (RFC 4648, 패딩 없이 출력)
// - percent_decode : WAF 가 쿼리/경로를 디코딩된 형태로도 검사하기 위해 사용
//
// 디코딩 실패는 std::nullopt. 부분 디코딩 결과를 반환하지 않는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using Bytes = std::vector<std::uint8_t>;

[[nodiscard]] std::string hex_encode(std::span<const std::uint8_t> data);

[[nodiscard]] std::string base64_encode(std::span<const std::uint8_t> data);
[[nodiscard]] std::optional<Bytes> base64_decode(std::string_view text);

// URL-safe 변형 ('-' '_'), 패딩 '=' 유지 (Fernet 호환)
[[nodiscard]] std::string base64url_encode(std::span<const std::uint8_t> data);
[[nodiscard]] std::optional<Bytes> base64url_decode(std::string_view text);

// RFC 4648 base32. 인코딩은 패딩 없음, 디코딩은 패딩/소문자/공백 허용.
[[nodiscard]] std::string base32_encode(std::span<const std::uint8_t> data);
[[nodiscard]] std::optional<Bytes> base32_decode(std::string_view text);

// percent_decode
//   %XX 시퀀스를 디코딩한다. plus_as_space 이면 '+' → ' ' (쿼리스트링용).
//   잘못된 %XX 는 원문 그대로 남긴다 (WAF 입력이므로 실패 대신 보존).
[[nodiscard]] std::string percent_decode(std::string_view text, bool plus_as_space);

// percent_encode: RFC 3986 unreserved 외 문자를 %XX 로 인코딩
[[nodiscard]] std::string percent_encode(std::string_view text);

[[nodiscard]] inline std::span<const std::uint8_t> as_bytes(std::string_view s) noexcept {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

[[nodiscard]] inline std::string to_string(std::span<const std::uint8_t> b) {
    return {reinterpret_cast<const char*>(b.data()), b.size()};
}
