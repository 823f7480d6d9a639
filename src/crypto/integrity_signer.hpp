#pragma once

// ---------------------------------------------------------------------------
// integrity_signer.hpp
//
// 저장된 아티팩트의 무결성 서명 (HMAC-SHA256, 소문자 hex 64자).
//
// 서명은 파일 안이 아니라 아티팩트 메타데이터(영속성 협력자)에 저장된다.
// 파일과 서명은 항상 함께 검증해야 한다. 서명이 맞지 않는 아티팩트는 신뢰하지 않는다.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

#include "common/types.hpp"

// ArtifactSigner: 파일 수집 파이프라인이 사용하는 서명 경계 (기본 구현 IntegritySigner)
class ArtifactSigner {
public:
    virtual ~ArtifactSigner() = default;

    [[nodiscard]] virtual std::expected<std::string, GateError>
    sign_file(const std::filesystem::path& path) const = 0;

    [[nodiscard]] virtual bool verify_file(const std::filesystem::path& path,
                                           std::string_view             signature_hex) const = 0;
};

class IntegritySigner final : public ArtifactSigner {
public:
    // secret 이 비어 있으면 std::invalid_argument
    explicit IntegritySigner(std::string secret);

    [[nodiscard]] std::expected<std::string, GateError> sign(std::span<const std::uint8_t> data) const;

    // sign_file: 64 KiB 단위로 스트리밍. I/O 실패는 kInternal, OpenSSL 실패는 kCryptoFailure.
    [[nodiscard]] std::expected<std::string, GateError> sign_file(const std::filesystem::path& path) const override;

    // verify / verify_file: 상수 시간 비교. 어떤 오류든 false.
    [[nodiscard]] bool verify(std::span<const std::uint8_t> data, std::string_view signature_hex) const;
    [[nodiscard]] bool verify_file(const std::filesystem::path& path, std::string_view signature_hex) const override;

private:
    std::string secret_;
};
