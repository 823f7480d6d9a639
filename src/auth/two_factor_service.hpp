#pragma once

// ---------------------------------------------------------------------------
// two_factor_service.hpp
//
// TOTP 2차 인증과 백업 코드 소비.
//
// [설계 원칙]
// - TOTP 시크릿과 백업 코드 blob 은 MFA 전용 TokenCipher 로 암호화된 형태로만 저장된다.
// - 평문 시크릿/코드는 begin_enrollment / regenerate_backup_codes 의 반환값으로
//   한 번만 호출자에게 전달된다.
// - 실패 응답은 항상 동일한 kAuthFailure("Invalid credentials").
//
// [동시성]
// - 백업 코드 소비는 read → 검사 → used 추가 → 재암호화 → compare-and-swap.
//   내부 잠금과 재시도는 없다. 같은 코드로 동시에 두 요청이 들어오면
//   CAS 에서 진 쪽은 인증 실패로 끝난다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "auth/backup_codes.hpp"
#include "auth/totp.hpp"
#include "common/types.hpp"
#include "config/gate_config.hpp"

class TokenCipher;
class StructuredLogger;

// TwoFactorRecord: 영속성 협력자가 보관하는 사용자별 2FA 상태
struct TwoFactorRecord {
    std::string encrypted_secret{};
    bool        twofa_enabled{false};
    std::string encrypted_backup_codes{};
};

class TwoFactorStore {
public:
    virtual ~TwoFactorStore() = default;

    [[nodiscard]] virtual std::optional<TwoFactorRecord> load(std::string_view subject_id) const = 0;

    // 현재 blob 이 expected_blob 과 같을 때만 new_blob 으로 교체하고 true
    [[nodiscard]] virtual bool compare_and_swap_backup_codes(std::string_view subject_id,
                                                             std::string_view expected_blob,
                                                             std::string_view new_blob) = 0;
};

struct Enrollment {
    std::string              secret{};
    std::string              provisioning_uri{};
    std::vector<std::string> backup_codes{};
    std::string              encrypted_secret{};
    std::string              encrypted_backup_codes{};
};

struct RegeneratedBackupCodes {
    std::vector<std::string> codes{};
    std::string              encrypted_blob{};
};

class TwoFactorService {
public:
    TwoFactorService(MfaSection         config,
                     const TokenCipher& cipher,
                     TwoFactorStore&    store,
                     StructuredLogger*  logger = nullptr);

    [[nodiscard]] std::expected<Enrollment, GateError> begin_enrollment(std::string_view account) const;

    [[nodiscard]] std::expected<void, GateError>
    verify_totp(std::string_view                      encrypted_secret,
                std::string_view                      code,
                std::chrono::system_clock::time_point now) const;

    [[nodiscard]] std::expected<void, GateError>
    consume_backup_code(std::string_view subject_id, std::string_view code) const;

    // verify_second_factor: 2FA 가 켜진 사용자에 대해 TOTP → 백업 코드 순서로 시도
    [[nodiscard]] std::expected<void, GateError>
    verify_second_factor(std::string_view                      subject_id,
                         std::string_view                      code,
                         std::chrono::system_clock::time_point now) const;

    // remaining_backup_codes: 복호화/파싱 실패 시 0
    [[nodiscard]] std::size_t remaining_backup_codes(std::string_view encrypted_blob) const;

    [[nodiscard]] std::expected<RegeneratedBackupCodes, GateError> regenerate_backup_codes() const;

    [[nodiscard]] const Totp& totp() const noexcept { return totp_; }

private:
    [[nodiscard]] std::expected<std::string, GateError> seal_backup_codes(const BackupCodeSet& set) const;

    void audit(std::string_view subject_id, std::string_view factor,
               std::string_view outcome, std::string_view detail) const;

    MfaSection         config_;
    Totp               totp_;
    const TokenCipher& cipher_;
    TwoFactorStore&    store_;
    StructuredLogger*  logger_;
};
