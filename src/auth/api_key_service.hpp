#pragma once

// ---------------------------------------------------------------------------
// api_key_service.hpp
//
// API 키 발급/검증과 레거시 평문 키의 1회성 자가 마이그레이션.
//
// [검증 경로]
//   저장값이 해시   → PBKDF2 검증
//   저장값이 평문   → 더미 해시 검증(시간 균일화) 후 상수 시간 평문 비교.
//                     성공하면 즉시 해시로 교체 (compare-and-swap).
//   어느 경로든 실패 응답은 동일한 kAuthFailure("Invalid credentials").
//   어느 경로로 성공했는지는 AuthLog(서버 로그)에만 남긴다.
//
// [동시성]
// - 내부 잠금 없음. 같은 레거시 키에 대한 동시 마이그레이션은 저장소의 CAS 가
//   하나만 반영하고, 나머지는 인증 성공 + 마이그레이션 생략으로 끝난다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>

#include "auth/api_key_hasher.hpp"
#include "common/types.hpp"

class StructuredLogger;

// ---------------------------------------------------------------------------
// ApiKeyStore
//   영속성 협력자 인터페이스. 저장값 교체는 CAS 의미를 가져야 한다.
// ---------------------------------------------------------------------------
class ApiKeyStore {
public:
    virtual ~ApiKeyStore() = default;

    // 현재 저장값이 expected_old 와 같을 때만 new_value 로 교체하고 true
    [[nodiscard]] virtual bool replace_stored_key(std::string_view subject_id,
                                                  std::string_view expected_old,
                                                  std::string_view new_value) = 0;
};

// IssuedApiKey: plaintext 는 호출자에게 한 번만 보여주고 버린다.
struct IssuedApiKey {
    std::string plaintext{};
    std::string hash{};
};

class ApiKeyService {
public:
    static constexpr std::size_t kKeyBytes = 32;

    // 생성 시 더미 해시를 미리 계산한다. 실패하면 std::runtime_error.
    ApiKeyService(const ApiKeyHasher& hasher, ApiKeyStore& store, StructuredLogger* logger = nullptr);

    // issue: 생성과 교체(rotation) 모두 사용
    [[nodiscard]] std::expected<IssuedApiKey, GateError> issue() const;

    [[nodiscard]] std::expected<void, GateError>
    verify(std::string_view subject_id, std::string_view presented, std::string_view stored) const;

private:
    void audit(std::string_view subject_id, std::string_view outcome, std::string_view detail) const;

    const ApiKeyHasher& hasher_;
    ApiKeyStore&        store_;
    StructuredLogger*   logger_;
    std::string         dummy_hash_;
};
