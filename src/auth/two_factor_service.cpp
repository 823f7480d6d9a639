#include "auth/two_factor_service.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "crypto/token_cipher.hpp"
#include "logger/structured_logger.hpp"

namespace {

[[nodiscard]] std::unexpected<GateError> auth_failure(std::string detail) {
    return std::unexpected(GateError{GateErrorCode::kAuthFailure, "Invalid credentials", std::move(detail)});
}

}  // namespace

TwoFactorService::TwoFactorService(MfaSection         config,
                                   const TokenCipher& cipher,
                                   TwoFactorStore&    store,
                                   StructuredLogger*  logger)
    : config_(std::move(config))
    , totp_(config_.totp_digits, config_.totp_period_sec)
    , cipher_(cipher)
    , store_(store)
    , logger_(logger)
{}

std::expected<std::string, GateError> TwoFactorService::seal_backup_codes(const BackupCodeSet& set) const {
    return cipher_.encrypt_text(set.to_json());
}

// ---------------------------------------------------------------------------
// begin_enrollment
//   시크릿과 백업 코드를 평문 + 암호문으로 함께 반환한다.
//   호출자는 암호문만 저장하고, 2FA 활성화는 첫 TOTP 검증 성공 후에 한다.
// ---------------------------------------------------------------------------
std::expected<Enrollment, GateError> TwoFactorService::begin_enrollment(std::string_view account) const {
    auto secret = Totp::generate_secret();
    if (!secret) {
        return std::unexpected(secret.error());
    }
    auto encrypted_secret = cipher_.encrypt_text(*secret);
    if (!encrypted_secret) {
        return std::unexpected(encrypted_secret.error());
    }
    auto regenerated = regenerate_backup_codes();
    if (!regenerated) {
        return std::unexpected(regenerated.error());
    }

    Enrollment out;
    out.provisioning_uri       = totp_.provisioning_uri(*secret, account, config_.issuer);
    out.secret                 = std::move(*secret);
    out.encrypted_secret       = std::move(*encrypted_secret);
    out.backup_codes           = std::move(regenerated->codes);
    out.encrypted_backup_codes = std::move(regenerated->encrypted_blob);
    return out;
}

std::expected<void, GateError>
TwoFactorService::verify_totp(std::string_view                      encrypted_secret,
                              std::string_view                      code,
                              std::chrono::system_clock::time_point now) const {
    auto secret = cipher_.decrypt_text(encrypted_secret);
    if (!secret) {
        spdlog::error("two_factor: cannot decrypt TOTP secret: {}", secret.error().detail);
        return auth_failure("secret decryption failed");
    }
    if (!totp_.verify(*secret, code, now, config_.totp_window)) {
        return auth_failure("totp mismatch");
    }
    return {};
}

// ---------------------------------------------------------------------------
// consume_backup_code
// ---------------------------------------------------------------------------
std::expected<void, GateError>
TwoFactorService::consume_backup_code(std::string_view subject_id, std::string_view code) const {
    const auto record = store_.load(subject_id);
    if (!record || record->encrypted_backup_codes.empty()) {
        audit(subject_id, "backup_code", "failure", "no backup codes");
        return auth_failure("no backup codes");
    }

    auto plain = cipher_.decrypt_text(record->encrypted_backup_codes);
    if (!plain) {
        spdlog::error("two_factor: cannot decrypt backup codes for '{}': {}", subject_id, plain.error().detail);
        audit(subject_id, "backup_code", "failure", "blob decryption failed");
        return auth_failure("blob decryption failed");
    }
    auto set = BackupCodeSet::from_json(*plain);
    if (!set) {
        spdlog::error("two_factor: {} ('{}')", set.error().detail, subject_id);
        audit(subject_id, "backup_code", "failure", "blob malformed");
        return auth_failure("blob malformed");
    }

    if (!set->consume(normalize_backup_code(code))) {
        audit(subject_id, "backup_code", "failure", "unknown or used code");
        return auth_failure("unknown or used code");
    }

    auto sealed = seal_backup_codes(*set);
    if (!sealed) {
        audit(subject_id, "backup_code", "failure", "re-encryption failed");
        return auth_failure("re-encryption failed");
    }
    if (!store_.compare_and_swap_backup_codes(subject_id, record->encrypted_backup_codes, *sealed)) {
        audit(subject_id, "backup_code", "failure", "concurrent update");
        return auth_failure("concurrent update");
    }

    audit(subject_id, "backup_code", "success",
          "remaining=" + std::to_string(set->remaining()));
    return {};
}

std::expected<void, GateError>
TwoFactorService::verify_second_factor(std::string_view                      subject_id,
                                       std::string_view                      code,
                                       std::chrono::system_clock::time_point now) const {
    const auto record = store_.load(subject_id);
    if (!record || !record->twofa_enabled) {
        audit(subject_id, "second_factor", "failure", "2fa not enabled");
        return auth_failure("2fa not enabled");
    }

    if (verify_totp(record->encrypted_secret, code, now)) {
        audit(subject_id, "totp", "success", "");
        return {};
    }
    return consume_backup_code(subject_id, code);
}

std::size_t TwoFactorService::remaining_backup_codes(std::string_view encrypted_blob) const {
    auto set = cipher_.decrypt_text(encrypted_blob).and_then(
        [](const std::string& json) { return BackupCodeSet::from_json(json); });
    if (!set) {
        spdlog::warn("two_factor: remaining_backup_codes: {}", set.error().detail);
        return 0;
    }
    return set->remaining();
}

std::expected<RegeneratedBackupCodes, GateError> TwoFactorService::regenerate_backup_codes() const {
    auto set = BackupCodeSet::generate(config_.backup_code_count);
    if (!set) {
        return std::unexpected(set.error());
    }
    auto sealed = seal_backup_codes(*set);
    if (!sealed) {
        return std::unexpected(sealed.error());
    }
    return RegeneratedBackupCodes{std::move(set->codes), std::move(*sealed)};
}

void TwoFactorService::audit(std::string_view subject_id, std::string_view factor,
                             std::string_view outcome, std::string_view detail) const {
    if (logger_ == nullptr) {
        return;
    }
    AuthLog entry{};
    entry.subject_id = std::string(subject_id);
    entry.factor     = std::string(factor);
    entry.outcome    = std::string(outcome);
    entry.detail     = std::string(detail);
    entry.timestamp  = std::chrono::system_clock::now();
    logger_->log_auth(entry);
}
