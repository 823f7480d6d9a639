// ---------------------------------------------------------------------------
// test_crypto.cpp
//
// random / TokenCipher / IntegritySigner 단위 테스트.
//
// [테스트 범위]
// - Fernet 호환 고정 벡터 (timestamp/IV 고정)
// - 변조 / 다른 키 / 잘못된 형식 → kCryptoFailure
// - HMAC-SHA256 공개 벡터, 비트 변조 검출, 파일 스트리밍 서명
// ---------------------------------------------------------------------------

#include "crypto/integrity_signer.hpp"
#include "crypto/random.hpp"
#include "crypto/token_cipher.hpp"

#include <gtest/gtest.h>

#include <array>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr const char* kFernetKey   = "cw_0x689RpI-jtRR7oE8h_eQsKImvJapLeSbXpwF4e4=";
constexpr const char* kFernetToken =
    "gAAAAAAdwJ6wAAECAwQFBgcICQoLDA0ODy021cpGVWKZ_eEwCGM4BLLF_5CV9dOPmrhuVUPgJobwOz7JcbmrR64jVmpU4IwqDA==";
constexpr std::uint64_t kFernetTime = 499162800;

constexpr const char* kOtherKey = "AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8=";

std::array<std::uint8_t, TokenCipher::kIvSize> sequential_iv() {
    std::array<std::uint8_t, TokenCipher::kIvSize> iv{};
    for (std::size_t i = 0; i < iv.size(); ++i) {
        iv[i] = static_cast<std::uint8_t>(i);
    }
    return iv;
}

}  // namespace

// ---------------------------------------------------------------------------
// random
// ---------------------------------------------------------------------------
TEST(Random, TokenAndHexLengths) {
    const auto token = random_token_urlsafe(32);
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->size(), 43u);
    EXPECT_EQ(token->find_first_of("+/="), std::string::npos);

    const auto hex = random_hex(4);
    ASSERT_TRUE(hex.has_value());
    EXPECT_EQ(hex->size(), 8u);

    EXPECT_NE(*random_token_urlsafe(32), *token);
}

TEST(Random, ConstantTimeEquals) {
    EXPECT_TRUE(constant_time_equals("abc", "abc"));
    EXPECT_FALSE(constant_time_equals("abc", "abd"));
    EXPECT_FALSE(constant_time_equals("abc", "abcd"));
}

// ---------------------------------------------------------------------------
// TokenCipher
// ---------------------------------------------------------------------------
TEST(TokenCipher, EncryptAt_MatchesFernetVector) {
    const TokenCipher cipher(kFernetKey);
    const auto iv = sequential_iv();
    const auto token = cipher.encrypt_at(as_bytes("hello"), kFernetTime, iv);
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(*token, kFernetToken);
}

TEST(TokenCipher, Decrypt_FernetVector) {
    const TokenCipher cipher(kFernetKey);
    const auto plain = cipher.decrypt_text(kFernetToken);
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(*plain, "hello");
}

TEST(TokenCipher, EncryptDecrypt_BinaryAndEmpty) {
    const TokenCipher cipher(kOtherKey);
    Bytes data(1000);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::uint8_t>(i * 7);
    }
    const auto token = cipher.encrypt(data);
    ASSERT_TRUE(token.has_value());
    const auto back = cipher.decrypt(*token);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, data);

    const auto empty = cipher.encrypt_text("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(cipher.decrypt_text(*empty).value_or("x"), "");
}

TEST(TokenCipher, Decrypt_TamperedTokenFails) {
    const TokenCipher cipher(kFernetKey);
    std::string token = kFernetToken;
    token[40] = token[40] == 'A' ? 'B' : 'A';

    const auto r = cipher.decrypt(token);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, GateErrorCode::kCryptoFailure);
}

TEST(TokenCipher, Decrypt_WrongKeyFails) {
    const TokenCipher other(kOtherKey);
    EXPECT_FALSE(other.decrypt(kFernetToken).has_value());
}

TEST(TokenCipher, Decrypt_MalformedInputFails) {
    const TokenCipher cipher(kFernetKey);
    EXPECT_FALSE(cipher.decrypt("").has_value());
    EXPECT_FALSE(cipher.decrypt("not a token").has_value());
    EXPECT_FALSE(cipher.decrypt("gAAAAA==").has_value()) << "too short";
}

TEST(TokenCipher, Ctor_RejectsBadKeys) {
    EXPECT_THROW(TokenCipher("AAECAwQFBgcICQoLDA0ODw=="), std::invalid_argument);
    EXPECT_THROW(TokenCipher("not base64!"), std::invalid_argument);
    EXPECT_THROW(TokenCipher(""), std::invalid_argument);
}

TEST(TokenCipher, GenerateKey_IsUsable) {
    const auto key = TokenCipher::generate_key();
    ASSERT_TRUE(key.has_value());
    const TokenCipher cipher(*key);
    const auto token = cipher.encrypt_text("secret");
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(cipher.decrypt_text(*token).value_or(""), "secret");
}

// ---------------------------------------------------------------------------
// IntegritySigner
// ---------------------------------------------------------------------------
TEST(IntegritySigner, Sign_KnownHmacVector) {
    const IntegritySigner signer("key");
    const auto sig = signer.sign(as_bytes("The quick brown fox jumps over the lazy dog"));
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(*sig, "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");
}

TEST(IntegritySigner, Verify_DetectsSingleBitFlip) {
    const IntegritySigner signer("integrity-secret");
    Bytes data(256, 0x41);
    const auto sig = signer.sign(data);
    ASSERT_TRUE(sig.has_value());
    EXPECT_TRUE(signer.verify(data, *sig));

    data[100] ^= 0x01;
    EXPECT_FALSE(signer.verify(data, *sig));
    EXPECT_FALSE(signer.verify(data, "not-hex"));
}

TEST(IntegritySigner, SignFile_MatchesInMemorySignature) {
    const IntegritySigner signer("integrity-secret");
    const fs::path path = fs::temp_directory_path()
                        / ("trustgate_sign_" + std::to_string(::getpid()) + ".bin");
    Bytes data(200 * 1024);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::uint8_t>(i % 251);
    }
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    const auto file_sig = signer.sign_file(path);
    const auto mem_sig  = signer.sign(data);
    ASSERT_TRUE(file_sig.has_value());
    ASSERT_TRUE(mem_sig.has_value());
    EXPECT_EQ(*file_sig, *mem_sig);
    EXPECT_TRUE(signer.verify_file(path, *file_sig));

    std::error_code ec;
    fs::remove(path, ec);
    EXPECT_FALSE(signer.verify_file(path, *file_sig)) << "missing file never verifies";
    EXPECT_EQ(signer.sign_file(path).error().code, GateErrorCode::kInternal);
}

TEST(IntegritySigner, Ctor_RejectsEmptySecret) {
    EXPECT_THROW(IntegritySigner(""), std::invalid_argument);
}
