#pragma once

// ---------------------------------------------------------------------------
// token_cipher.hpp
//
// 인증된 대칭 암호화 (Fernet 토큰 형식 호환).
//
// [토큰 구조] (URL-safe base64, '=' 패딩 포함)
//   0x80 | timestamp(8, big-endian) | IV(16) | AES-128-CBC(PKCS7) | HMAC-SHA256(32)
//   HMAC 은 앞의 모든 바이트에 대해 계산한다.
//
// [키]
//   32 바이트를 URL-safe base64 로 인코딩한 문자열.
//   앞 16 바이트 = 서명 키, 뒤 16 바이트 = 암호화 키.
//
// [보안 원칙]
// - decrypt 는 HMAC 을 먼저 상수 시간으로 검증하고, 통과한 경우에만 복호화한다.
// - 키 문자열은 로그에 출력하지 않는다.
// - 생성자에서 키가 잘못되면 std::invalid_argument. 요청 경로에서는 생성하지 않는다.
// ---------------------------------------------------------------------------

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

#include "common/encoding.hpp"
#include "common/types.hpp"

// ---------------------------------------------------------------------------
// ArtifactCipher
//   파일 수집 파이프라인이 사용하는 암호화 경계.
//   TokenCipher 가 기본 구현이며, 테스트는 실패하는 구현을 주입한다.
// ---------------------------------------------------------------------------
class ArtifactCipher {
public:
    virtual ~ArtifactCipher() = default;

    [[nodiscard]] virtual std::expected<std::string, GateError>
    encrypt(std::span<const std::uint8_t> plaintext) const = 0;

    [[nodiscard]] virtual std::expected<Bytes, GateError> decrypt(std::string_view token) const = 0;
};

class TokenCipher final : public ArtifactCipher {
public:
    static constexpr std::size_t kKeySize   = 32;
    static constexpr std::size_t kIvSize    = 16;
    static constexpr std::size_t kMacSize   = 32;
    static constexpr std::uint8_t kVersion  = 0x80;

    explicit TokenCipher(std::string_view key_b64);

    // generate_key: 새 32 바이트 키 (URL-safe base64)
    [[nodiscard]] static std::expected<std::string, GateError> generate_key();

    // encrypt: 현재 시각 + 랜덤 IV 로 토큰 생성
    [[nodiscard]] std::expected<std::string, GateError>
    encrypt(std::span<const std::uint8_t> plaintext) const override;

    // encrypt_at: timestamp/IV 를 지정하여 토큰 생성 (결정적, 호환성 검증용)
    [[nodiscard]] std::expected<std::string, GateError>
    encrypt_at(std::span<const std::uint8_t>              plaintext,
               std::uint64_t                              timestamp,
               std::span<const std::uint8_t, kIvSize>     iv) const;

    // decrypt: 형식/버전/HMAC/패딩 중 하나라도 실패하면 kCryptoFailure
    [[nodiscard]] std::expected<Bytes, GateError> decrypt(std::string_view token) const override;

    // 문자열 편의 함수 (TOTP 시크릿, 백업 코드 blob)
    [[nodiscard]] std::expected<std::string, GateError> encrypt_text(std::string_view plaintext) const;
    [[nodiscard]] std::expected<std::string, GateError> decrypt_text(std::string_view token) const;

private:
    std::array<std::uint8_t, 16> signing_key_{};
    std::array<std::uint8_t, 16> encryption_key_{};
};
