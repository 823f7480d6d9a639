// ---------------------------------------------------------------------------
// test_two_factor.cpp
//
// Totp / BackupCodeSet / TwoFactorService 단위 테스트.
//
// [테스트 범위]
// - RFC 6238 부록 B 벡터 (SHA1, 8자리)
// - ±window 허용 범위, 형식이 틀린 코드
// - 백업 코드 생성 형식, JSON 직렬화, 1회 사용
// - 2차 인증: TOTP → 백업 코드 fallback, CAS 경합 시 실패
// ---------------------------------------------------------------------------

#include "auth/backup_codes.hpp"
#include "auth/totp.hpp"
#include "auth/two_factor_service.hpp"
#include "common/types.hpp"
#include "crypto/token_cipher.hpp"

#include <gtest/gtest.h>

#include <cctype>
#include <functional>
#include <map>
#include <regex>
#include <string>

namespace {

// RFC 6238 부록 B: "12345678901234567890" 의 base32
constexpr const char* kRfcSecret = "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ";
constexpr const char* kKey       = "AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8=";

std::chrono::system_clock::time_point at(std::int64_t unix_seconds) {
    return std::chrono::system_clock::time_point{std::chrono::seconds{unix_seconds}};
}

class MemoryTwoFactorStore final : public TwoFactorStore {
public:
    std::map<std::string, TwoFactorRecord, std::less<>> records;
    std::function<void()> before_swap;

    std::optional<TwoFactorRecord> load(std::string_view subject_id) const override {
        const auto it = records.find(subject_id);
        if (it == records.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool compare_and_swap_backup_codes(std::string_view subject_id,
                                       std::string_view expected_blob,
                                       std::string_view new_blob) override {
        if (before_swap) {
            before_swap();
        }
        const auto it = records.find(subject_id);
        if (it == records.end() || it->second.encrypted_backup_codes != expected_blob) {
            return false;
        }
        it->second.encrypted_backup_codes = std::string(new_blob);
        return true;
    }
};

}  // namespace

// ---------------------------------------------------------------------------
// Totp
// ---------------------------------------------------------------------------
TEST(Totp, CodeAt_Rfc6238Vectors) {
    const Totp totp(8, 30);
    const std::pair<std::int64_t, const char*> vectors[] = {
        {59,         "94287082"},
        {1111111109, "07081804"},
        {1111111111, "14050471"},
        {1234567890, "89005924"},
        {2000000000, "69279037"},
    };
    for (const auto& [t, code] : vectors) {
        EXPECT_EQ(totp.code_at(kRfcSecret, at(t)).value_or(""), code) << "T=" << t;
    }
}

TEST(Totp, CodeAt_SixDigitsTruncatesSameValue) {
    const Totp totp;
    EXPECT_EQ(totp.digits(), 6u);
    EXPECT_EQ(totp.period(), 30u);
    EXPECT_EQ(totp.code_at(kRfcSecret, at(59)).value_or(""), "287082");
}

TEST(Totp, CodeAt_InvalidSecretIsValidationError) {
    const Totp totp;
    const auto r = totp.code_at("not base32!", at(59));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, GateErrorCode::kValidation);
}

TEST(Totp, Verify_AcceptsAdjacentStepsOnly) {
    const Totp totp;
    EXPECT_TRUE(totp.verify(kRfcSecret, "287082", at(59), 1));
    EXPECT_TRUE(totp.verify(kRfcSecret, "287082", at(59 + 30), 1)) << "previous step within window";
    EXPECT_FALSE(totp.verify(kRfcSecret, "287082", at(59 + 90), 1));
    EXPECT_FALSE(totp.verify(kRfcSecret, "287082", at(59 + 30), 0));
}

TEST(Totp, Verify_RejectsMalformedCodes) {
    const Totp totp;
    EXPECT_FALSE(totp.verify(kRfcSecret, "28708", at(59), 1));
    EXPECT_FALSE(totp.verify(kRfcSecret, "28708a", at(59), 1));
    EXPECT_FALSE(totp.verify(kRfcSecret, "", at(59), 1));
    EXPECT_TRUE(totp.verify(kRfcSecret, " 287082 ", at(59), 1)) << "surrounding whitespace is trimmed";
}

TEST(Totp, GenerateSecretAndProvisioningUri) {
    const auto secret = Totp::generate_secret();
    ASSERT_TRUE(secret.has_value());
    EXPECT_EQ(secret->size(), 32u);

    const Totp totp;
    EXPECT_EQ(totp.provisioning_uri("ABC", "alice@example.com", "Acme Jobs"),
              "otpauth://totp/Acme%20Jobs:alice%40example.com?secret=ABC&issuer=Acme%20Jobs");
}

// ---------------------------------------------------------------------------
// BackupCodeSet
// ---------------------------------------------------------------------------
TEST(BackupCodes, Generate_FormatAndUniqueness) {
    const auto set = BackupCodeSet::generate(10);
    ASSERT_TRUE(set.has_value());
    ASSERT_EQ(set->codes.size(), 10u);
    const std::regex format("^[0-9A-F]{4}-[0-9A-F]{4}-[0-9A-F]{4}$");
    for (const auto& code : set->codes) {
        EXPECT_TRUE(std::regex_match(code, format)) << code;
    }
    EXPECT_EQ(set->remaining(), 10u);
    EXPECT_FALSE(set->generated_at.empty());
}

TEST(BackupCodes, Consume_OnlyOnceAndOnlyKnownCodes) {
    BackupCodeSet set;
    set.codes = {"AAAA-BBBB-CCCC", "1111-2222-3333"};

    EXPECT_TRUE(set.consume("AAAA-BBBB-CCCC"));
    EXPECT_FALSE(set.consume("AAAA-BBBB-CCCC"));
    EXPECT_FALSE(set.consume("FFFF-FFFF-FFFF"));
    EXPECT_EQ(set.used.size(), 1u);
    EXPECT_EQ(set.remaining(), 1u);
}

TEST(BackupCodes, Json_PreservesUsedList) {
    BackupCodeSet set;
    set.codes        = {"AAAA-BBBB-CCCC", "1111-2222-3333"};
    set.used         = {"1111-2222-3333"};
    set.generated_at = "2026-01-02T03:04:05Z";

    const auto back = BackupCodeSet::from_json(set.to_json());
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->codes, set.codes);
    EXPECT_EQ(back->used, set.used);
    EXPECT_EQ(back->generated_at, set.generated_at);
}

TEST(BackupCodes, FromJson_RejectsWrongShape) {
    EXPECT_FALSE(BackupCodeSet::from_json("{\"codes\": \"nope\"}").has_value());
    EXPECT_FALSE(BackupCodeSet::from_json("[1, 2]").has_value());
    EXPECT_FALSE(BackupCodeSet::from_json("{unterminated").has_value());
}

TEST(BackupCodes, Normalize_TrimsAndUppercases) {
    EXPECT_EQ(normalize_backup_code("  aaaa-bbbb-cccc\n"), "AAAA-BBBB-CCCC");
}

// ---------------------------------------------------------------------------
// TwoFactorService
// ---------------------------------------------------------------------------
class TwoFactorServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto enrollment = service_.begin_enrollment("alice@example.com");
        ASSERT_TRUE(enrollment.has_value());
        enrollment_ = std::move(*enrollment);
        store_.records["alice"] = TwoFactorRecord{
            enrollment_.encrypted_secret, true, enrollment_.encrypted_backup_codes};
    }

    TokenCipher          cipher_{kKey};
    MemoryTwoFactorStore store_;
    TwoFactorService     service_{MfaSection{}, cipher_, store_};
    Enrollment           enrollment_;
};

TEST_F(TwoFactorServiceTest, Enrollment_ReturnsPlainAndSealedForms) {
    EXPECT_EQ(enrollment_.secret.size(), 32u);
    EXPECT_TRUE(enrollment_.provisioning_uri.starts_with("otpauth://totp/trustgate:alice%40example.com?secret="));
    EXPECT_EQ(enrollment_.backup_codes.size(), 10u);
    EXPECT_EQ(enrollment_.encrypted_secret.find(enrollment_.secret), std::string::npos);
    EXPECT_EQ(cipher_.decrypt_text(enrollment_.encrypted_secret).value_or(""), enrollment_.secret);
    EXPECT_EQ(service_.remaining_backup_codes(enrollment_.encrypted_backup_codes), 10u);
}

TEST_F(TwoFactorServiceTest, SecondFactor_AcceptsCurrentTotp) {
    const auto now  = std::chrono::system_clock::now();
    const auto code = service_.totp().code_at(enrollment_.secret, now);
    ASSERT_TRUE(code.has_value());

    EXPECT_TRUE(service_.verify_second_factor("alice", *code, now).has_value());
    EXPECT_EQ(store_.records["alice"].encrypted_backup_codes, enrollment_.encrypted_backup_codes)
        << "TOTP success does not touch backup codes";
}

TEST_F(TwoFactorServiceTest, SecondFactor_BackupCodeWorksOnce) {
    const auto now  = std::chrono::system_clock::now();
    const std::string code = enrollment_.backup_codes.front();
    std::string typed = code;
    for (auto& c : typed) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    EXPECT_TRUE(service_.verify_second_factor("alice", " " + typed + " ", now).has_value());
    EXPECT_EQ(service_.remaining_backup_codes(store_.records["alice"].encrypted_backup_codes), 9u);

    const auto again = service_.verify_second_factor("alice", code, now);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, GateErrorCode::kAuthFailure);
    EXPECT_EQ(again.error().public_message, "Invalid credentials");
}

TEST_F(TwoFactorServiceTest, SecondFactor_ConcurrentConsumeLosesCas) {
    const std::string code = enrollment_.backup_codes.front();
    // 다른 요청이 먼저 blob 을 교체한 상황
    store_.before_swap = [this] {
        store_.records["alice"].encrypted_backup_codes =
            cipher_.encrypt_text("{\"codes\": [], \"used\": []}").value();
    };

    const auto r = service_.consume_backup_code("alice", code);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, GateErrorCode::kAuthFailure);
}

TEST_F(TwoFactorServiceTest, SecondFactor_DisabledOrUnknownSubjectFails) {
    const auto now = std::chrono::system_clock::now();
    store_.records["alice"].twofa_enabled = false;
    EXPECT_FALSE(service_.verify_second_factor("alice", enrollment_.backup_codes.front(), now).has_value());
    EXPECT_FALSE(service_.verify_second_factor("bob", "123456", now).has_value());
}

TEST_F(TwoFactorServiceTest, VerifyTotp_CorruptSecretFails) {
    const auto r = service_.verify_totp("garbage", "123456", std::chrono::system_clock::now());
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, GateErrorCode::kAuthFailure);
}

TEST_F(TwoFactorServiceTest, RegenerateBackupCodes_ReplacesSet) {
    const auto regenerated = service_.regenerate_backup_codes();
    ASSERT_TRUE(regenerated.has_value());
    EXPECT_EQ(regenerated->codes.size(), 10u);
    EXPECT_NE(regenerated->codes, enrollment_.backup_codes);
    EXPECT_EQ(service_.remaining_backup_codes(regenerated->encrypted_blob), 10u);
    EXPECT_EQ(service_.remaining_backup_codes("garbage"), 0u);
}

TEST_F(TwoFactorServiceTest, SecondFactor_CodeTakenFromRequestHeader) {
    const auto now  = std::chrono::system_clock::now();
    const auto code = service_.totp().code_at(enrollment_.secret, now);
    ASSERT_TRUE(code.has_value());

    const HeaderList headers{{"X-TOTP-Code", " " + *code + "\t"}};
    EXPECT_TRUE(service_.verify_second_factor("alice", presented_totp_code(headers), now).has_value());

    const auto empty = service_.verify_second_factor("alice", presented_totp_code(HeaderList{}), now);
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, GateErrorCode::kAuthFailure);
}
