#pragma once

// ---------------------------------------------------------------------------
// file_ingestion.hpp
//
// 신뢰할 수 없는 업로드를 암호화 + 서명된 아티팩트로 변환하는 파이프라인.
//
// [상태 전이] (선형, 모든 단계에서 중단 가능)
//   Received → SizeBounded → TypeSniffed → Scanned → Encrypted → Signed → Stored
//   어느 단계에서든 Rejected 로 빠지며, 그 시점까지 쓰인 파일은 항상 삭제된다.
//
// [설계 원칙]
// - 크기 힌트가 한도를 넘으면 한 바이트도 쓰지 않고 거부한다.
// - 스트리밍 중 누적 크기가 한도를 넘는 순간 중단한다.
//   디스크에 남는 최대 크기는 한도 이하 (초과 청크는 쓰지 않는다).
// - 타입은 매직 바이트로만 판별하고, 선언 확장자와 불일치하면 거부한다.
// - 스캔 오류는 위협과 동일하게 거부한다.
// - 암호화 실패는 기본적으로 파이프라인 실패 (require_encryption).
// - 서명 실패는 항상 파이프라인 실패.
//
// [동시성]
// - ingest() 는 블로킹 호출이다 (디스크 쓰기 + 스캐너 타임아웃).
// - 인스턴스는 요청 간 가변 상태가 없어 여러 스레드에서 동시에 호출할 수 있다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "common/encoding.hpp"
#include "common/types.hpp"
#include "config/gate_config.hpp"
#include "ingest/byte_source.hpp"

class ScanEngine;
class ArtifactCipher;
class ArtifactSigner;
class StructuredLogger;

// ---------------------------------------------------------------------------
// UploadRequest
//   ingest() 호출 동안만 존재한다. body 의 수명은 호출자가 보장한다.
// ---------------------------------------------------------------------------
struct UploadRequest {
    std::string                  declared_filename{};
    std::optional<std::uint64_t> declared_size{};
    ByteSource&                  body;
};

// ---------------------------------------------------------------------------
// IngestedArtifact
//   byte_size 는 암호화 전 원본 크기.
//   disk_path 의 파일과 integrity_signature 는 항상 함께 검증해야 한다.
// ---------------------------------------------------------------------------
struct IngestedArtifact {
    std::filesystem::path disk_path{};
    std::uint64_t         byte_size{0};
    bool                  is_encrypted{false};
    std::string           integrity_signature{};
    std::string           stored_name{};
    std::string           mime_type{};
};

enum class IngestStage : std::uint8_t {
    kReceived    = 0,
    kSizeBounded = 1,
    kTypeSniffed = 2,
    kScanned     = 3,
    kEncrypted   = 4,
    kSigned      = 5,
    kStored      = 6,
};

[[nodiscard]] std::string_view ingest_stage_name(IngestStage stage) noexcept;

// IngestRejection: 거부된 단계 + 오류 (public_message 만 클라이언트에 노출)
struct IngestRejection {
    IngestStage stage{IngestStage::kReceived};
    GateError   error{};
};

class FileIngestionPipeline {
public:
    // scanner / cipher / signer 는 파이프라인보다 오래 살아야 한다.
    // logger 가 nullptr 이면 구조화 업로드 로그를 남기지 않는다 (spdlog 진단 로그는 유지).
    FileIngestionPipeline(UploadSection         config,
                          const ScanEngine&     scanner,
                          const ArtifactCipher& cipher,
                          const ArtifactSigner& signer,
                          StructuredLogger*     logger = nullptr);

    // ingest
    //   category: upload_dir 하위 디렉터리 이름 ([A-Za-z0-9_-] 만 허용)
    [[nodiscard]] std::expected<IngestedArtifact, IngestRejection>
    ingest(UploadRequest& request, std::string_view category = "resumes") const;

    // verify_artifact: 디스크 파일과 서명 일치 여부
    [[nodiscard]] bool verify_artifact(const IngestedArtifact& artifact) const;

    // read_artifact
    //   서명 검증 → 복호화. 서명 불일치는 kSecurityRejection.
    //   복호화 실패는 kCryptoFailure. allow_legacy_plaintext 가 켜져 있으면
    //   경고 로그 후 원본 바이트를 반환한다.
    [[nodiscard]] std::expected<Bytes, GateError> read_artifact(const IngestedArtifact& artifact) const;

    // remove_artifact: upload_dir 밖의 경로는 거부한다. 없는 파일은 성공.
    [[nodiscard]] std::expected<void, GateError> remove_artifact(const std::filesystem::path& path) const;

    // cleanup_older_than: 수정 시각이 days 일보다 오래된 파일 삭제. 삭제 개수 반환.
    [[nodiscard]] std::expected<std::size_t, GateError> cleanup_older_than(std::uint32_t days) const;

    [[nodiscard]] const UploadSection& config() const noexcept { return config_; }

    // sanitize_filename: 경로 구성요소 제거 후 [A-Za-z0-9._-] 외 문자를 '_' 로 치환
    [[nodiscard]] static std::string sanitize_filename(std::string_view declared);

private:
    [[nodiscard]] std::expected<IngestedArtifact, IngestRejection>
    run(UploadRequest& request, std::string_view category) const;

    [[nodiscard]] std::expected<void, GateError> encrypt_in_place(const std::filesystem::path& path) const;

    UploadSection         config_;
    const ScanEngine&     scanner_;
    const ArtifactCipher& cipher_;
    const ArtifactSigner& signer_;
    StructuredLogger*     logger_;
};
