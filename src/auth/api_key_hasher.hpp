#pragma once

// ---------------------------------------------------------------------------
// api_key_hasher.hpp
//
// API 키 저장용 적응형 솔트 해시 (PBKDF2-HMAC-SHA256).
//
// [저장 형식]
//   pbkdf2_sha256$<iterations>$<salt base64>$<hash base64>
//   반복 횟수는 문자열 안에 보관되므로 기본값을 올려도 기존 해시는 계속 검증된다.
//
// [보안 원칙]
// - 평문 키는 저장하지 않는다. hash() 결과만 영속성 협력자에 넘긴다.
// - verify 는 상수 시간 비교. 형식이 깨진 문자열은 false.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "common/types.hpp"

class ApiKeyHasher {
public:
    static constexpr std::uint32_t    kDefaultIterations = 600'000;
    static constexpr std::size_t      kSaltBytes         = 16;
    static constexpr std::size_t      kHashBytes         = 32;
    static constexpr std::string_view kScheme            = "pbkdf2_sha256";

    explicit ApiKeyHasher(std::uint32_t iterations = kDefaultIterations);

    [[nodiscard]] std::expected<std::string, GateError> hash(std::string_view key) const;

    [[nodiscard]] bool verify(std::string_view key, std::string_view encoded) const;

    // is_hash: 저장 형식을 따르는지만 본다 (검증은 하지 않음)
    [[nodiscard]] static bool is_hash(std::string_view stored) noexcept;

    [[nodiscard]] std::uint32_t iterations() const noexcept { return iterations_; }

private:
    std::uint32_t iterations_;
};
