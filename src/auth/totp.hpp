#pragma once

// ---------------------------------------------------------------------------
// totp.hpp
//
// RFC 6238 TOTP (HMAC-SHA1, 동적 절단). 인증 앱 호환 기본값: 6자리, 30초.
//
// 시크릿은 base32 문자열로 주고받는다. 저장 시에는 항상 TokenCipher 로 암호화한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

#include "common/types.hpp"

class Totp {
public:
    static constexpr std::size_t kSecretBytes = 20;  // base32 32자

    explicit Totp(std::uint32_t digits = 6, std::uint32_t period_sec = 30);

    [[nodiscard]] static std::expected<std::string, GateError> generate_secret();

    // code_at: 시크릿이 base32 로 디코딩되지 않으면 kValidation
    [[nodiscard]] std::expected<std::string, GateError>
    code_at(std::string_view secret_b32, std::chrono::system_clock::time_point at) const;

    // verify: now 기준 ±window 스텝의 코드와 각각 상수 시간 비교
    [[nodiscard]] bool verify(std::string_view                      secret_b32,
                              std::string_view                      code,
                              std::chrono::system_clock::time_point now,
                              std::uint32_t                         window) const;

    // provisioning_uri: otpauth://totp/<issuer>:<account>?secret=...&issuer=...
    [[nodiscard]] std::string provisioning_uri(std::string_view secret_b32,
                                               std::string_view account,
                                               std::string_view issuer) const;

    [[nodiscard]] std::uint32_t digits() const noexcept { return digits_; }
    [[nodiscard]] std::uint32_t period() const noexcept { return period_; }

private:
    [[nodiscard]] std::expected<std::string, GateError>
    code_for_counter(std::span<const std::uint8_t> key, std::uint64_t counter) const;

    std::uint32_t digits_;
    std::uint32_t period_;
};
