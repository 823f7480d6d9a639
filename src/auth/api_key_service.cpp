#include "auth/api_key_service.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "crypto/random.hpp"
#include "logger/structured_logger.hpp"

namespace {

[[nodiscard]] std::unexpected<GateError> auth_failure(std::string detail) {
    return std::unexpected(GateError{GateErrorCode::kAuthFailure, "Invalid credentials", std::move(detail)});
}

}  // namespace

ApiKeyService::ApiKeyService(const ApiKeyHasher& hasher, ApiKeyStore& store, StructuredLogger* logger)
    : hasher_(hasher)
    , store_(store)
    , logger_(logger)
{
    auto dummy = random_token_urlsafe(kKeyBytes).and_then(
        [this](const std::string& key) { return hasher_.hash(key); });
    if (!dummy) {
        throw std::runtime_error("api_key_service: cannot prepare dummy hash: " + dummy.error().detail);
    }
    dummy_hash_ = std::move(*dummy);
}

std::expected<IssuedApiKey, GateError> ApiKeyService::issue() const {
    auto plaintext = random_token_urlsafe(kKeyBytes);
    if (!plaintext) {
        return std::unexpected(plaintext.error());
    }
    auto hash = hasher_.hash(*plaintext);
    if (!hash) {
        return std::unexpected(hash.error());
    }
    return IssuedApiKey{std::move(*plaintext), std::move(*hash)};
}

// ---------------------------------------------------------------------------
// verify
// ---------------------------------------------------------------------------
std::expected<void, GateError> ApiKeyService::verify(std::string_view subject_id,
                                                     std::string_view presented,
                                                     std::string_view stored) const {
    if (presented.empty() || stored.empty()) {
        // 빈 값도 해시 경로와 비슷한 비용을 치른다
        static_cast<void>(hasher_.verify(presented, dummy_hash_));
        audit(subject_id, "failure", "missing key");
        return auth_failure("missing key");
    }

    if (ApiKeyHasher::is_hash(stored)) {
        if (hasher_.verify(presented, stored)) {
            audit(subject_id, "success", "hash");
            return {};
        }
        audit(subject_id, "failure", "hash mismatch");
        return auth_failure("hash mismatch");
    }

    // --- 레거시 평문 경로 ---------------------------------------------------
    static_cast<void>(hasher_.verify(presented, dummy_hash_));
    if (!constant_time_equals(presented, stored)) {
        audit(subject_id, "failure", "legacy mismatch");
        return auth_failure("legacy mismatch");
    }

    auto new_hash = hasher_.hash(presented);
    if (!new_hash) {
        // 인증 자체는 성공. 다음 검증에서 다시 마이그레이션을 시도한다.
        spdlog::error("api_key_service: migration hash failed for '{}': {}", subject_id, new_hash.error().detail);
        audit(subject_id, "success", "legacy, migration failed");
        return {};
    }
    if (!store_.replace_stored_key(subject_id, stored, *new_hash)) {
        spdlog::warn("api_key_service: migration CAS lost for '{}', stored key already changed", subject_id);
        audit(subject_id, "success", "legacy, migration skipped");
        return {};
    }

    spdlog::info("api_key_service: migrated legacy plaintext key for '{}'", subject_id);
    audit(subject_id, "migrated", "legacy plaintext replaced with hash");
    return {};
}

void ApiKeyService::audit(std::string_view subject_id, std::string_view outcome, std::string_view detail) const {
    if (logger_ == nullptr) {
        return;
    }
    AuthLog entry{};
    entry.subject_id = std::string(subject_id);
    entry.factor     = "api_key";
    entry.outcome    = std::string(outcome);
    entry.detail     = std::string(detail);
    entry.timestamp  = std::chrono::system_clock::now();
    logger_->log_auth(entry);
}
