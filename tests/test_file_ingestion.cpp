// ---------------------------------------------------------------------------
// test_file_ingestion.cpp
//
// MimeSniffer / FileIngestionPipeline 단위 테스트.
//
// [테스트 범위]
// - 매직 바이트 판별 (PDF, DOCX, ZIP, 이미지, 실행 파일)
// - 정상 업로드: 암호화 + 서명 + 복호화 읽기
// - 크기 힌트 초과 / 스트리밍 초과 → 디스크에 파일이 남지 않음
// - 확장자 불일치, 허용되지 않은 탐지 타입, 스캔 거부
// - 암호화 실패 (require_encryption 켜짐/꺼짐), 서명 실패
// - 서명 불일치, 레거시 평문 fallback
// - remove_artifact 경로 제한
//
// 스캐너는 고정 판정을 돌려주는 StubScanner 로 대체한다.
// ---------------------------------------------------------------------------

#include "crypto/integrity_signer.hpp"
#include "crypto/token_cipher.hpp"
#include "ingest/file_ingestion.hpp"
#include "ingest/mime_sniffer.hpp"
#include "scan/scan_engine.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr const char* kKey = "AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8=";

class StubScanner final : public ScanEngine {
public:
    ScanResult result{ScanResult::clean()};
    mutable int calls{0};

    ScanResult scan(const fs::path& /*path*/) const override {
        ++calls;
        return result;
    }
    ScanMode mode() const noexcept override { return ScanMode::kDelegated; }
};

// 항상 실패하는 암호화 (키 저장소 장애 등)
class FailingCipher final : public ArtifactCipher {
public:
    mutable int encrypt_calls{0};

    std::expected<std::string, GateError> encrypt(std::span<const std::uint8_t> /*plaintext*/) const override {
        ++encrypt_calls;
        return std::unexpected(GateError{GateErrorCode::kCryptoFailure, "Internal error", "cipher unavailable"});
    }
    std::expected<Bytes, GateError> decrypt(std::string_view /*token*/) const override {
        return std::unexpected(GateError{GateErrorCode::kCryptoFailure, "Internal error", "cipher unavailable"});
    }
};

class FailingSigner final : public ArtifactSigner {
public:
    std::expected<std::string, GateError> sign_file(const fs::path& /*path*/) const override {
        return std::unexpected(GateError{GateErrorCode::kCryptoFailure, "Internal error", "HMAC init failed"});
    }
    bool verify_file(const fs::path& /*path*/, std::string_view /*signature_hex*/) const override {
        return false;
    }
};

// 읽기 중 실패하는 본문 (연결 끊김)
class BrokenByteSource final : public ByteSource {
public:
    std::expected<std::size_t, std::string> read(std::span<char> buffer) override {
        if (sent_) {
            return std::unexpected(std::string{"connection reset"});
        }
        sent_ = true;
        const std::string_view head = "%PDF-1.7\n";
        std::copy(head.begin(), head.end(), buffer.begin());
        return head.size();
    }

private:
    bool sent_{false};
};

// ZIP local file header 하나 + 이름 + 내용
std::string zip_entry(std::string_view name, std::string_view content) {
    std::string out = std::string("PK\x03\x04", 4);
    auto le16 = [&](std::uint16_t v) {
        out += static_cast<char>(v & 0xFF);
        out += static_cast<char>(v >> 8);
    };
    auto le32 = [&](std::uint32_t v) {
        le16(static_cast<std::uint16_t>(v & 0xFFFF));
        le16(static_cast<std::uint16_t>(v >> 16));
    };
    le16(20);                                   // version
    le16(0);                                    // flags
    le16(0);                                    // stored
    le16(0);                                    // time
    le16(0);                                    // date
    le32(0);                                    // crc (검사하지 않음)
    le32(static_cast<std::uint32_t>(content.size()));
    le32(static_cast<std::uint32_t>(content.size()));
    le16(static_cast<std::uint16_t>(name.size()));
    le16(0);                                    // extra
    out += name;
    out += content;
    return out;
}

std::string docx_bytes() {
    return zip_entry("[Content_Types].xml", "<Types/>") + zip_entry("word/document.xml", "<w:document/>");
}

const std::string kPdf = "%PDF-1.7\n1 0 obj << /Type /Catalog >> endobj\n%%EOF\n";

Bytes bytes_of(std::string_view s) {
    return Bytes(s.begin(), s.end());
}

class FileIngestionTest : public ::testing::Test {
protected:
    void SetUp() override {
        static int counter = 0;
        root_ = fs::temp_directory_path()
              / ("trustgate_ingest_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        config_.upload_dir = root_.string();
        config_.max_upload_bytes = 4096;
        config_.chunk_size = 64;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    FileIngestionPipeline pipeline() const {
        return FileIngestionPipeline(config_, scanner_, cipher_, signer_);
    }

    FileIngestionPipeline pipeline(const ArtifactCipher& cipher, const ArtifactSigner& signer) const {
        return FileIngestionPipeline(config_, scanner_, cipher, signer);
    }

    std::size_t file_count() const {
        std::error_code ec;
        if (!fs::exists(root_, ec)) {
            return 0;
        }
        std::size_t n = 0;
        for (const auto& entry : fs::recursive_directory_iterator(root_)) {
            if (entry.is_regular_file()) {
                ++n;
            }
        }
        return n;
    }

    std::expected<IngestedArtifact, IngestRejection>
    upload(const FileIngestionPipeline& p, std::string name, std::string body,
           std::optional<std::uint64_t> declared = std::nullopt) const {
        StringByteSource source(std::move(body));
        UploadRequest request{std::move(name), declared, source};
        return p.ingest(request);
    }

    fs::path        root_;
    UploadSection   config_;
    StubScanner     scanner_;
    TokenCipher     cipher_{kKey};
    IntegritySigner signer_{"integrity-secret"};
};

}  // namespace

// ---------------------------------------------------------------------------
// MimeSniffer
// ---------------------------------------------------------------------------
TEST(MimeSniffer, DetectBytes_KnownMagic) {
    EXPECT_EQ(MimeSniffer::detect_bytes(as_bytes(kPdf)), std::string(mime::kPdf));
    EXPECT_EQ(MimeSniffer::detect_bytes(as_bytes(docx_bytes())), std::string(mime::kDocx));
    EXPECT_EQ(MimeSniffer::detect_bytes(as_bytes(zip_entry("notes.txt", "hello"))), std::string(mime::kZip));
    EXPECT_EQ(MimeSniffer::detect_bytes(as_bytes("\x89PNG\r\n\x1a\n....")), std::string(mime::kPng));
    EXPECT_EQ(MimeSniffer::detect_bytes(as_bytes("\xFF\xD8\xFF\xE0")), std::string(mime::kJpeg));
    EXPECT_EQ(MimeSniffer::detect_bytes(as_bytes("GIF89a")), std::string(mime::kGif));
    EXPECT_EQ(MimeSniffer::detect_bytes(as_bytes("\x7F" "ELF")), std::string(mime::kElf));
    EXPECT_EQ(MimeSniffer::detect_bytes(as_bytes("MZ\x90")), std::string(mime::kPe));
}

TEST(MimeSniffer, DetectBytes_UnknownIsNullopt) {
    EXPECT_FALSE(MimeSniffer::detect_bytes(as_bytes("plain text")).has_value());
    EXPECT_FALSE(MimeSniffer::detect_bytes(as_bytes("")).has_value());
}

TEST(MimeSniffer, ExtensionFor_OnlyDocumentTypes) {
    EXPECT_EQ(MimeSniffer::extension_for(mime::kPdf), ".pdf");
    EXPECT_EQ(MimeSniffer::extension_for(mime::kDocx), ".docx");
    EXPECT_TRUE(MimeSniffer::extension_for(mime::kZip).empty());
    EXPECT_TRUE(MimeSniffer::extension_for(mime::kPe).empty());
}

TEST(FileIngestion, SanitizeFilename_StripsPathAndSpecials) {
    EXPECT_EQ(FileIngestionPipeline::sanitize_filename("../../etc/pass wd.pdf"), "pass_wd.pdf");
    EXPECT_EQ(FileIngestionPipeline::sanitize_filename("C:\\Users\\me\\cv (1).pdf"), "cv__1_.pdf");
}

// ---------------------------------------------------------------------------
// 정상 경로
// ---------------------------------------------------------------------------
TEST_F(FileIngestionTest, Ingest_PdfIsEncryptedSignedAndReadable) {
    const auto p = pipeline();
    const auto artifact = upload(p, "My CV.pdf", kPdf, kPdf.size());
    ASSERT_TRUE(artifact.has_value()) << artifact.error().error.detail;

    EXPECT_TRUE(artifact->is_encrypted);
    EXPECT_EQ(artifact->byte_size, kPdf.size());
    EXPECT_EQ(artifact->mime_type, mime::kPdf);
    EXPECT_EQ(artifact->integrity_signature.size(), 64u);
    EXPECT_TRUE(artifact->stored_name.ends_with("_My_CV.pdf"));
    EXPECT_EQ(artifact->disk_path.parent_path().filename().string(), "resumes");
    EXPECT_EQ(scanner_.calls, 1);
    EXPECT_EQ(file_count(), 1u) << "no temp files left behind";

    // 디스크 내용은 평문이 아니다
    std::ifstream in(artifact->disk_path, std::ios::binary);
    const std::string on_disk((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(on_disk.find("%PDF"), std::string::npos);

    EXPECT_TRUE(p.verify_artifact(*artifact));
    const auto plain = p.read_artifact(*artifact);
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(*plain, bytes_of(kPdf));
}

TEST_F(FileIngestionTest, Ingest_DocxAccepted) {
    const auto artifact = upload(pipeline(), "resume.DOCX", docx_bytes());
    ASSERT_TRUE(artifact.has_value()) << artifact.error().error.detail;
    EXPECT_EQ(artifact->mime_type, mime::kDocx);
}

// ---------------------------------------------------------------------------
// 크기
// ---------------------------------------------------------------------------
TEST_F(FileIngestionTest, Ingest_DeclaredOversizeRejectedBeforeWriting) {
    const auto r = upload(pipeline(), "cv.pdf", kPdf, 1'000'000);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().stage, IngestStage::kSizeBounded);
    EXPECT_EQ(r.error().error.public_message, "File too large");
    EXPECT_EQ(file_count(), 0u);
}

TEST_F(FileIngestionTest, Ingest_StreamingOversizeLeavesNoFile) {
    const auto r = upload(pipeline(), "cv.pdf", kPdf + std::string(8192, 'x'));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().stage, IngestStage::kSizeBounded);
    EXPECT_EQ(r.error().error.code, GateErrorCode::kValidation);
    EXPECT_EQ(file_count(), 0u);
    EXPECT_EQ(scanner_.calls, 0);
}

TEST_F(FileIngestionTest, Ingest_ExactlyAtLimitAccepted) {
    std::string body = kPdf;
    body.resize(config_.max_upload_bytes, ' ');
    EXPECT_TRUE(upload(pipeline(), "cv.pdf", body).has_value());
}

TEST_F(FileIngestionTest, Ingest_BodyReadFailureCleansUp) {
    const auto p = pipeline();
    BrokenByteSource source;
    UploadRequest request{"cv.pdf", std::nullopt, source};
    const auto r = p.ingest(request);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().error.code, GateErrorCode::kInternal);
    EXPECT_EQ(file_count(), 0u);
}

// ---------------------------------------------------------------------------
// 타입
// ---------------------------------------------------------------------------
TEST_F(FileIngestionTest, Ingest_DisallowedExtensionRejectedImmediately) {
    const auto r = upload(pipeline(), "setup.exe", "MZ");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().stage, IngestStage::kReceived);
    EXPECT_EQ(r.error().error.public_message, "Invalid file type");
}

TEST_F(FileIngestionTest, Ingest_ExtensionMismatchRejected) {
    const auto r = upload(pipeline(), "cv.pdf", docx_bytes());
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().stage, IngestStage::kTypeSniffed);
    EXPECT_EQ(r.error().error.public_message, "File extension mismatch");
    EXPECT_EQ(file_count(), 0u);
}

TEST_F(FileIngestionTest, Ingest_ExecutableRenamedToPdfRejected) {
    const auto r = upload(pipeline(), "cv.pdf", "MZ\x90 this is not a pdf");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().stage, IngestStage::kTypeSniffed);
    EXPECT_EQ(r.error().error.public_message, "Invalid file type");
    EXPECT_EQ(file_count(), 0u);
}

TEST_F(FileIngestionTest, Ingest_UnknownContentRejected) {
    const auto r = upload(pipeline(), "cv.pdf", "just text");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().error.public_message, "Could not determine file type");
}

TEST_F(FileIngestionTest, Ingest_InvalidCategoryRejected) {
    const auto p = pipeline();
    StringByteSource source(kPdf);
    UploadRequest request{"cv.pdf", std::nullopt, source};
    const auto r = p.ingest(request, "../escape");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().stage, IngestStage::kReceived);
}

// ---------------------------------------------------------------------------
// 스캔
// ---------------------------------------------------------------------------
TEST_F(FileIngestionTest, Ingest_ScanRejectionDeletesFile) {
    scanner_.result = ScanResult::unsafe("Eicar-Signature");
    const auto r = upload(pipeline(), "cv.pdf", kPdf);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().stage, IngestStage::kScanned);
    EXPECT_EQ(r.error().error.code, GateErrorCode::kSecurityRejection);
    EXPECT_EQ(r.error().error.public_message, "File rejected");
    EXPECT_NE(r.error().error.detail.find("Eicar-Signature"), std::string::npos);
    EXPECT_EQ(file_count(), 0u);
}

// ---------------------------------------------------------------------------
// 암호화 / 서명 실패
// ---------------------------------------------------------------------------
TEST_F(FileIngestionTest, Ingest_EncryptionFailureRejectsWhenRequired) {
    config_.require_encryption = true;
    const FailingCipher cipher;
    const auto r = upload(pipeline(cipher, signer_), "cv.pdf", kPdf);

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().stage, IngestStage::kEncrypted);
    EXPECT_EQ(r.error().error.code, GateErrorCode::kCryptoFailure);
    EXPECT_EQ(r.error().error.public_message, "File storage failed");
    EXPECT_EQ(cipher.encrypt_calls, 1);
    EXPECT_EQ(file_count(), 0u) << "plaintext must not survive a failed encryption";
}

TEST_F(FileIngestionTest, Ingest_EncryptionFailureStoresSignedPlaintextWhenOptional) {
    config_.require_encryption = false;
    const FailingCipher cipher;
    const auto p = pipeline(cipher, signer_);
    const auto artifact = upload(p, "cv.pdf", kPdf);

    ASSERT_TRUE(artifact.has_value()) << artifact.error().error.detail;
    EXPECT_FALSE(artifact->is_encrypted);
    EXPECT_EQ(file_count(), 1u);

    std::ifstream in(artifact->disk_path, std::ios::binary);
    const std::string on_disk((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(on_disk, kPdf);

    // 서명은 디스크에 있는 평문 바이트에 대한 것이다
    EXPECT_TRUE(signer_.verify(bytes_of(kPdf), artifact->integrity_signature));
    EXPECT_TRUE(p.verify_artifact(*artifact));
    const auto plain = p.read_artifact(*artifact);
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(*plain, bytes_of(kPdf));
}

TEST_F(FileIngestionTest, Ingest_SigningFailureIsFatal) {
    const FailingSigner signer;
    const auto r = upload(pipeline(cipher_, signer), "cv.pdf", kPdf);

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().stage, IngestStage::kSigned);
    EXPECT_EQ(r.error().error.code, GateErrorCode::kCryptoFailure);
    EXPECT_EQ(r.error().error.public_message, "File storage failed");
    EXPECT_EQ(file_count(), 0u) << "unsigned artifacts are never stored";
}

// ---------------------------------------------------------------------------
// 읽기
// ---------------------------------------------------------------------------
TEST_F(FileIngestionTest, ReadArtifact_TamperedFileRejected) {
    const auto p = pipeline();
    const auto artifact = upload(p, "cv.pdf", kPdf);
    ASSERT_TRUE(artifact.has_value());

    {
        std::ofstream out(artifact->disk_path, std::ios::binary | std::ios::app);
        out << "x";
    }
    EXPECT_FALSE(p.verify_artifact(*artifact));
    const auto r = p.read_artifact(*artifact);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, GateErrorCode::kSecurityRejection);
}

TEST_F(FileIngestionTest, ReadArtifact_LegacyPlaintextNeedsOptIn) {
    fs::create_directories(root_);
    const fs::path legacy = root_ / "legacy.pdf";
    {
        std::ofstream out(legacy, std::ios::binary);
        out << kPdf;
    }
    const auto sig = signer_.sign_file(legacy);
    ASSERT_TRUE(sig.has_value());
    const IngestedArtifact artifact{legacy, kPdf.size(), true, *sig, "legacy.pdf", std::string(mime::kPdf)};

    const auto strict = pipeline().read_artifact(artifact);
    ASSERT_FALSE(strict.has_value());
    EXPECT_EQ(strict.error().code, GateErrorCode::kCryptoFailure);

    config_.allow_legacy_plaintext = true;
    const auto lenient = pipeline().read_artifact(artifact);
    ASSERT_TRUE(lenient.has_value());
    EXPECT_EQ(*lenient, bytes_of(kPdf));
}

// ---------------------------------------------------------------------------
// 삭제
// ---------------------------------------------------------------------------
TEST_F(FileIngestionTest, RemoveArtifact_OnlyInsideUploadDir) {
    const auto p = pipeline();
    const auto artifact = upload(p, "cv.pdf", kPdf);
    ASSERT_TRUE(artifact.has_value());

    const fs::path outside = fs::temp_directory_path()
                           / ("trustgate_outside_" + std::to_string(::getpid()) + ".txt");
    {
        std::ofstream out(outside);
        out << "keep";
    }
    const auto denied = p.remove_artifact(outside);
    ASSERT_FALSE(denied.has_value());
    EXPECT_EQ(denied.error().code, GateErrorCode::kValidation);
    EXPECT_TRUE(fs::exists(outside));
    fs::remove(outside);

    const auto escaped = p.remove_artifact(root_ / "resumes" / ".." / ".." / "etc" / "passwd");
    EXPECT_FALSE(escaped.has_value());

    EXPECT_TRUE(p.remove_artifact(artifact->disk_path).has_value());
    EXPECT_FALSE(fs::exists(artifact->disk_path));
    EXPECT_TRUE(p.remove_artifact(artifact->disk_path).has_value()) << "missing file is not an error";
}

TEST_F(FileIngestionTest, CleanupOlderThan_RemovesOnlyOldFiles) {
    const auto p = pipeline();
    const auto old_file   = upload(p, "old.pdf", kPdf);
    const auto fresh_file = upload(p, "new.pdf", kPdf);
    ASSERT_TRUE(old_file.has_value());
    ASSERT_TRUE(fresh_file.has_value());

    fs::last_write_time(old_file->disk_path,
                        fs::file_time_type::clock::now() - std::chrono::hours(24 * 40));

    const auto removed = p.cleanup_older_than(30);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 1u);
    EXPECT_FALSE(fs::exists(old_file->disk_path));
    EXPECT_TRUE(fs::exists(fresh_file->disk_path));
}
