// ---------------------------------------------------------------------------
// file_ingestion.cpp
//
// [부분 파일 정리]
// PartialFileGuard 가 쓰기 시작 직후부터 경로를 잡고 있다가,
// 파이프라인이 kStored 에 도달하여 release() 하지 않으면 소멸 시 파일을 삭제한다.
// 조기 반환 경로마다 unlink 를 호출하지 않아도 된다.
//
// [알려진 한계]
// - 암호화는 평문 전체(최대 max_upload_bytes)를 메모리에 올린다.
// - 스캐너는 평문 파일을 디스크에서 읽는다. 스캔 도중에는 평문이 디스크에 존재한다.
// ---------------------------------------------------------------------------

#include "ingest/file_ingestion.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "crypto/integrity_signer.hpp"
#include "crypto/random.hpp"
#include "crypto/token_cipher.hpp"
#include "ingest/mime_sniffer.hpp"
#include "logger/structured_logger.hpp"
#include "scan/scan_engine.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kStoredNameRandomBytes = 4;

[[nodiscard]] std::unexpected<IngestRejection> reject(IngestStage   stage,
                                                      GateErrorCode code,
                                                      std::string   public_message,
                                                      std::string   detail) {
    return std::unexpected(IngestRejection{
        stage, GateError{code, std::move(public_message), std::move(detail)}});
}

// ---------------------------------------------------------------------------
// PartialFileGuard
//   release() 되지 않으면 소멸 시 파일을 삭제한다.
// ---------------------------------------------------------------------------
class PartialFileGuard {
public:
    explicit PartialFileGuard(fs::path path)
        : path_(std::move(path))
    {}

    ~PartialFileGuard() {
        if (!armed_) {
            return;
        }
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            spdlog::error("file_ingestion: failed to delete partial file '{}': {}",
                          path_.filename().string(), ec.message());
        }
    }

    PartialFileGuard(const PartialFileGuard&)            = delete;
    PartialFileGuard& operator=(const PartialFileGuard&) = delete;

    void release() noexcept { armed_ = false; }

private:
    fs::path path_;
    bool     armed_{true};
};

[[nodiscard]] bool valid_category(std::string_view category) noexcept {
    if (category.empty()) {
        return false;
    }
    return std::all_of(category.begin(), category.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '_' || c == '-';
    });
}

// UTC "YYYYMMDD_HHMMSS"
[[nodiscard]] std::string utc_stamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_val{};
    gmtime_r(&now, &tm_val);
    char buf[32]{};
    const auto len = std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm_val);
    return std::string(buf, len);
}

[[nodiscard]] std::string extension_of(const std::string& filename) {
    return to_lower(fs::path(filename).extension().string());
}

[[nodiscard]] std::expected<Bytes, GateError> read_file_bytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(GateError{GateErrorCode::kInternal, "Internal error",
                                         "cannot open '" + path.filename().string() + "'"});
    }
    Bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return std::unexpected(GateError{GateErrorCode::kInternal, "Internal error",
                                         "read failed for '" + path.filename().string() + "'"});
    }
    return data;
}

}  // namespace

std::string_view ingest_stage_name(IngestStage stage) noexcept {
    switch (stage) {
        case IngestStage::kReceived:    return "received";
        case IngestStage::kSizeBounded: return "size_bounded";
        case IngestStage::kTypeSniffed: return "type_sniffed";
        case IngestStage::kScanned:     return "scanned";
        case IngestStage::kEncrypted:   return "encrypted";
        case IngestStage::kSigned:      return "signed";
        case IngestStage::kStored:      return "stored";
    }
    return "unknown";
}

std::string FileIngestionPipeline::sanitize_filename(std::string_view declared) {
    // 마지막 경로 구분자('/' 또는 '\') 이후만 사용
    const auto slash = declared.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        declared.remove_prefix(slash + 1);
    }
    std::string out;
    out.reserve(declared.size());
    for (const unsigned char c : declared) {
        if (std::isalnum(c) != 0 || c == '.' || c == '_' || c == '-') {
            out += static_cast<char>(c);
        } else {
            out += '_';
        }
    }
    return out;
}

FileIngestionPipeline::FileIngestionPipeline(UploadSection         config,
                                             const ScanEngine&     scanner,
                                             const ArtifactCipher& cipher,
                                             const ArtifactSigner& signer,
                                             StructuredLogger*     logger)
    : config_(std::move(config))
    , scanner_(scanner)
    , cipher_(cipher)
    , signer_(signer)
    , logger_(logger)
{
    std::error_code ec;
    fs::create_directories(config_.upload_dir, ec);
    if (ec) {
        spdlog::error("file_ingestion: cannot create upload dir '{}': {}", config_.upload_dir, ec.message());
    }
    if (!config_.require_encryption) {
        spdlog::warn("file_ingestion: encryption failures will store plaintext (require_encryption=false)");
    }
    if (config_.allow_legacy_plaintext) {
        spdlog::warn("file_ingestion: legacy plaintext fallback enabled on read");
    }
}

// ---------------------------------------------------------------------------
// ingest
// ---------------------------------------------------------------------------
std::expected<IngestedArtifact, IngestRejection>
FileIngestionPipeline::ingest(UploadRequest& request, std::string_view category) const {
    auto result = run(request, category);

    UploadLog entry{};
    entry.category          = std::string(category);
    entry.declared_filename = request.declared_filename;
    entry.timestamp         = std::chrono::system_clock::now();

    if (result) {
        spdlog::info("file_ingestion: stored '{}' ({} bytes, mime={}, encrypted={})",
                     result->stored_name, result->byte_size, result->mime_type, result->is_encrypted);
        entry.stored_name = result->stored_name;
        entry.stage       = std::string(ingest_stage_name(IngestStage::kStored));
        entry.outcome     = "stored";
        entry.size        = result->byte_size;
        entry.encrypted   = result->is_encrypted;
    } else {
        spdlog::warn("file_ingestion: rejected at {} ({}): {}",
                     ingest_stage_name(result.error().stage),
                     error_code_name(result.error().error.code), result.error().error.detail);
        entry.stage   = std::string(ingest_stage_name(result.error().stage));
        entry.outcome = "rejected";
        entry.reason  = result.error().error.detail;
    }

    if (logger_ != nullptr) {
        logger_->log_upload(entry);
    }
    return result;
}

std::expected<IngestedArtifact, IngestRejection>
FileIngestionPipeline::run(UploadRequest& request, std::string_view category) const {
    // --- Received ---------------------------------------------------------
    if (trim(request.declared_filename).empty()) {
        return reject(IngestStage::kReceived, GateErrorCode::kValidation,
                      "No filename provided", "declared filename is empty");
    }
    if (!valid_category(category)) {
        return reject(IngestStage::kReceived, GateErrorCode::kValidation,
                      "Invalid upload category", "category '" + std::string(category) + "' rejected");
    }

    const std::string safe_name = sanitize_filename(request.declared_filename);
    const std::string ext       = extension_of(safe_name);
    const auto& allowed         = config_.allowed_extensions;
    const auto is_allowed_ext   = [&](std::string_view e) {
        return std::find(allowed.begin(), allowed.end(), e) != allowed.end();
    };
    if (ext.empty() || !is_allowed_ext(ext)) {
        return reject(IngestStage::kReceived, GateErrorCode::kValidation,
                      "Invalid file type", "extension '" + ext + "' not in allowlist");
    }

    // --- SizeBounded (힌트) -----------------------------------------------
    if (request.declared_size && *request.declared_size > config_.max_upload_bytes) {
        return reject(IngestStage::kSizeBounded, GateErrorCode::kValidation, "File too large",
                      "declared size " + std::to_string(*request.declared_size) + " exceeds "
                          + std::to_string(config_.max_upload_bytes));
    }

    auto suffix = random_hex(kStoredNameRandomBytes);
    if (!suffix) {
        return std::unexpected(IngestRejection{IngestStage::kReceived, suffix.error()});
    }
    const std::string stored_name = utc_stamp() + "_" + *suffix + "_" + safe_name;

    const fs::path save_dir = fs::path(config_.upload_dir) / std::string(category);
    std::error_code ec;
    fs::create_directories(save_dir, ec);
    if (ec) {
        return reject(IngestStage::kSizeBounded, GateErrorCode::kInternal,
                      "File save failed", "create_directories: " + ec.message());
    }
    const fs::path file_path = save_dir / stored_name;

    // --- SizeBounded (스트리밍) -------------------------------------------
    PartialFileGuard guard(file_path);
    std::uint64_t total = 0;
    {
        std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return reject(IngestStage::kSizeBounded, GateErrorCode::kInternal,
                          "File save failed", "cannot open '" + stored_name + "' for write");
        }

        std::vector<char> chunk(std::max<std::size_t>(config_.chunk_size, 1));
        for (;;) {
            auto n = request.body.read(chunk);
            if (!n) {
                return reject(IngestStage::kSizeBounded, GateErrorCode::kInternal,
                              "File save failed", "body read failed: " + n.error());
            }
            if (*n == 0) {
                break;
            }
            total += *n;
            // 초과 청크는 쓰기 전에 중단한다
            if (total > config_.max_upload_bytes) {
                return reject(IngestStage::kSizeBounded, GateErrorCode::kValidation, "File too large",
                              "stream exceeded " + std::to_string(config_.max_upload_bytes) + " bytes");
            }
            out.write(chunk.data(), static_cast<std::streamsize>(*n));
            if (!out) {
                return reject(IngestStage::kSizeBounded, GateErrorCode::kInternal,
                              "File save failed", "write failed for '" + stored_name + "'");
            }
        }
        out.flush();
        if (!out) {
            return reject(IngestStage::kSizeBounded, GateErrorCode::kInternal,
                          "File save failed", "flush failed for '" + stored_name + "'");
        }
    }

    // --- TypeSniffed ------------------------------------------------------
    const auto detected = MimeSniffer::detect(file_path);
    if (!detected) {
        return reject(IngestStage::kTypeSniffed, GateErrorCode::kValidation,
                      "Could not determine file type", "no known magic bytes");
    }
    const std::string_view expected_ext = MimeSniffer::extension_for(*detected);
    if (expected_ext.empty() || !is_allowed_ext(expected_ext)) {
        return reject(IngestStage::kTypeSniffed, GateErrorCode::kValidation,
                      "Invalid file type", "detected type " + *detected + " not allowed");
    }
    if (expected_ext != ext) {
        return reject(IngestStage::kTypeSniffed, GateErrorCode::kValidation, "File extension mismatch",
                      "extension " + ext + " but detected " + *detected);
    }

    // --- Scanned ----------------------------------------------------------
    const ScanResult verdict = scanner_.scan(file_path);
    if (!verdict.safe()) {
        return reject(IngestStage::kScanned, GateErrorCode::kSecurityRejection,
                      "File rejected", "scan (" + std::string(scan_mode_name(scanner_.mode()))
                          + "): " + verdict.threat_name);
    }

    // --- Encrypted --------------------------------------------------------
    bool encrypted = false;
    if (auto enc = encrypt_in_place(file_path); enc) {
        encrypted = true;
    } else if (config_.require_encryption) {
        return std::unexpected(IngestRejection{
            IngestStage::kEncrypted,
            GateError{enc.error().code, "File storage failed", enc.error().detail}});
    } else {
        spdlog::warn("file_ingestion: encryption failed for '{}', stored as plaintext: {}",
                     stored_name, enc.error().detail);
    }

    // --- Signed -----------------------------------------------------------
    auto signature = signer_.sign_file(file_path);
    if (!signature) {
        return reject(IngestStage::kSigned, GateErrorCode::kCryptoFailure,
                      "File storage failed", signature.error().detail);
    }

    // --- Stored -----------------------------------------------------------
    guard.release();
    return IngestedArtifact{
        file_path,
        total,
        encrypted,
        std::move(*signature),
        stored_name,
        *detected,
    };
}

// ---------------------------------------------------------------------------
// encrypt_in_place
//   평문 → 토큰을 임시 파일에 쓰고 rename 으로 교체한다.
//   rename 은 같은 디렉터리 안이므로 원자적이다.
// ---------------------------------------------------------------------------
std::expected<void, GateError> FileIngestionPipeline::encrypt_in_place(const fs::path& path) const {
    auto plain = read_file_bytes(path);
    if (!plain) {
        return std::unexpected(plain.error());
    }
    auto token = cipher_.encrypt(*plain);
    if (!token) {
        return std::unexpected(token.error());
    }

    fs::path tmp = path;
    tmp += ".enc.tmp";
    PartialFileGuard tmp_guard(tmp);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        out.write(token->data(), static_cast<std::streamsize>(token->size()));
        out.flush();
        if (!out) {
            return std::unexpected(GateError{GateErrorCode::kInternal, "Internal error",
                                             "write failed for '" + tmp.filename().string() + "'"});
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        return std::unexpected(GateError{GateErrorCode::kInternal, "Internal error",
                                         "rename failed: " + ec.message()});
    }
    tmp_guard.release();
    return {};
}

bool FileIngestionPipeline::verify_artifact(const IngestedArtifact& artifact) const {
    return signer_.verify_file(artifact.disk_path, artifact.integrity_signature);
}

// ---------------------------------------------------------------------------
// read_artifact
// ---------------------------------------------------------------------------
std::expected<Bytes, GateError> FileIngestionPipeline::read_artifact(const IngestedArtifact& artifact) const {
    if (!verify_artifact(artifact)) {
        spdlog::warn("file_ingestion: integrity check failed for '{}'", artifact.disk_path.filename().string());
        return std::unexpected(GateError{GateErrorCode::kSecurityRejection, "File integrity check failed",
                                         "signature mismatch for '" + artifact.disk_path.filename().string() + "'"});
    }

    auto raw = read_file_bytes(artifact.disk_path);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    if (!artifact.is_encrypted) {
        return raw;
    }

    const std::string_view token(reinterpret_cast<const char*>(raw->data()), raw->size());
    auto plain = cipher_.decrypt(token);
    if (plain) {
        return plain;
    }

    if (config_.allow_legacy_plaintext) {
        spdlog::warn("file_ingestion: decryption failed for '{}', returning raw bytes as legacy plaintext ({})",
                     artifact.disk_path.filename().string(), plain.error().detail);
        return raw;
    }
    return std::unexpected(GateError{GateErrorCode::kCryptoFailure, "Internal error",
                                     "decryption failed: " + plain.error().detail});
}

// ---------------------------------------------------------------------------
// remove_artifact
// ---------------------------------------------------------------------------
std::expected<void, GateError> FileIngestionPipeline::remove_artifact(const fs::path& path) const {
    std::error_code ec;
    const fs::path root   = fs::weakly_canonical(config_.upload_dir, ec);
    std::error_code ec_target;
    const fs::path target = fs::weakly_canonical(path, ec_target);
    if (ec || ec_target) {
        return std::unexpected(GateError{GateErrorCode::kInternal, "Internal error",
                                         "cannot resolve path: " + (ec ? ec : ec_target).message()});
    }

    const fs::path rel = target.lexically_relative(root);
    if (rel.empty() || rel == "." || *rel.begin() == "..") {
        return std::unexpected(GateError{GateErrorCode::kValidation, "Invalid file path",
                                         "path outside upload dir: " + path.string()});
    }

    fs::remove(target, ec);
    if (ec) {
        return std::unexpected(GateError{GateErrorCode::kInternal, "Internal error",
                                         "remove failed: " + ec.message()});
    }
    return {};
}

// ---------------------------------------------------------------------------
// cleanup_older_than
// ---------------------------------------------------------------------------
std::expected<std::size_t, GateError> FileIngestionPipeline::cleanup_older_than(std::uint32_t days) const {
    const fs::path root = config_.upload_dir;
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return std::size_t{0};
    }

    const auto cutoff = fs::file_time_type::clock::now() - std::chrono::hours(24) * days;
    std::size_t removed = 0;

    fs::recursive_directory_iterator it(root, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }
        const auto mtime = it->last_write_time(entry_ec);
        if (entry_ec || mtime >= cutoff) {
            continue;
        }
        if (fs::remove(it->path(), entry_ec)) {
            ++removed;
        } else if (entry_ec) {
            spdlog::warn("file_ingestion: cleanup could not remove '{}': {}",
                         it->path().filename().string(), entry_ec.message());
        }
    }
    if (ec) {
        return std::unexpected(GateError{GateErrorCode::kInternal, "Internal error",
                                         "cleanup iteration failed: " + ec.message()});
    }

    spdlog::info("file_ingestion: cleanup removed {} file(s) older than {} day(s)", removed, days);
    return removed;
}
