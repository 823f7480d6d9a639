#pragma once

// ---------------------------------------------------------------------------
// random.hpp
//
// OpenSSL CSPRNG(RAND_bytes) 래퍼와 상수 시간 비교.
// RAND_bytes 실패는 드물지만 무시하면 예측 가능한 키/코드가 만들어지므로
// 반드시 kCryptoFailure 로 전파한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <string_view>

#include "common/encoding.hpp"
#include "common/types.hpp"

[[nodiscard]] std::expected<Bytes, GateError> random_bytes(std::size_t count);

// random_hex: count 바이트 → 2*count 자리 소문자 hex
[[nodiscard]] std::expected<std::string, GateError> random_hex(std::size_t count);

// random_token_urlsafe: count 바이트 → 패딩 없는 URL-safe base64 (API 키)
[[nodiscard]] std::expected<std::string, GateError> random_token_urlsafe(std::size_t count);

// constant_time_equals: 길이가 다르면 즉시 false (길이는 비밀이 아님)
[[nodiscard]] bool constant_time_equals(std::span<const std::uint8_t> a,
                                        std::span<const std::uint8_t> b) noexcept;
[[nodiscard]] bool constant_time_equals(std::string_view a, std::string_view b) noexcept;

// openssl_error: ERR 큐의 첫 오류를 "context: message" 로 포맷 (큐 비움)
[[nodiscard]] std::string openssl_error(std::string_view context);
