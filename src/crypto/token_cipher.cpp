// ---------------------------------------------------------------------------
// token_cipher.cpp
//
// OpenSSL EVP(AES-128-CBC) + HMAC(SHA-256) 로 구현한다.
// EVP_CIPHER_CTX 는 unique_ptr 커스텀 deleter 로 관리한다.
//
// [오류 상세]
// GateError::detail 에는 실패 단계("hmac mismatch", "bad padding")만 기록한다.
// 평문이나 키 바이트는 절대 포함하지 않는다.
// ---------------------------------------------------------------------------

#include "crypto/token_cipher.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <chrono>
#include <cstring>
#include <memory>
#include <stdexcept>


#include "crypto/random.hpp"

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

constexpr std::size_t kHeaderSize = 1 + 8 + TokenCipher::kIvSize;
constexpr std::size_t kBlockSize  = 16;

[[nodiscard]] std::unexpected<GateError> crypto_error(std::string detail) {
    return std::unexpected(GateError{GateErrorCode::kCryptoFailure, "Internal error", std::move(detail)});
}

[[nodiscard]] bool hmac_sha256(std::span<const std::uint8_t> key,
                               std::span<const std::uint8_t> data,
                               std::uint8_t*                 out) {
    unsigned int len = 0;
    const unsigned char* p = HMAC(EVP_sha256(),
                                  key.data(), static_cast<int>(key.size()),
                                  data.data(), data.size(),
                                  out, &len);
    return p != nullptr && len == TokenCipher::kMacSize;
}

}  // namespace

TokenCipher::TokenCipher(std::string_view key_b64) {
    const auto key = base64url_decode(trim(key_b64));
    if (!key || key->size() != kKeySize) {
        throw std::invalid_argument("token cipher key must be 32 bytes of URL-safe base64");
    }
    std::memcpy(signing_key_.data(), key->data(), 16);
    std::memcpy(encryption_key_.data(), key->data() + 16, 16);
}

std::expected<std::string, GateError> TokenCipher::generate_key() {
    return random_bytes(kKeySize).transform([](const Bytes& b) { return base64url_encode(b); });
}

std::expected<std::string, GateError>
TokenCipher::encrypt(std::span<const std::uint8_t> plaintext) const {
    auto iv = random_bytes(kIvSize);
    if (!iv) {
        return std::unexpected(iv.error());
    }
    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return encrypt_at(plaintext, static_cast<std::uint64_t>(now),
                      std::span<const std::uint8_t, kIvSize>(iv->data(), kIvSize));
}

std::expected<std::string, GateError>
TokenCipher::encrypt_at(std::span<const std::uint8_t>          plaintext,
                        std::uint64_t                          timestamp,
                        std::span<const std::uint8_t, kIvSize> iv) const {
    Bytes token;
    token.reserve(kHeaderSize + plaintext.size() + kBlockSize + kMacSize);
    token.push_back(kVersion);
    for (int shift = 56; shift >= 0; shift -= 8) {
        token.push_back(static_cast<std::uint8_t>((timestamp >> shift) & 0xFF));
    }
    token.insert(token.end(), iv.begin(), iv.end());

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return crypto_error("EVP_CIPHER_CTX_new failed");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr,
                           encryption_key_.data(), iv.data()) != 1) {
        return crypto_error(openssl_error("EVP_EncryptInit_ex"));
    }

    const std::size_t ct_offset = token.size();
    token.resize(ct_offset + plaintext.size() + kBlockSize);
    int len   = 0;
    int total = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), token.data() + ct_offset, &len,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            return crypto_error(openssl_error("EVP_EncryptUpdate"));
        }
        total = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), token.data() + ct_offset + total, &len) != 1) {
        return crypto_error(openssl_error("EVP_EncryptFinal_ex"));
    }
    total += len;
    token.resize(ct_offset + static_cast<std::size_t>(total));

    std::array<std::uint8_t, kMacSize> mac{};
    if (!hmac_sha256(signing_key_, token, mac.data())) {
        return crypto_error(openssl_error("HMAC"));
    }
    token.insert(token.end(), mac.begin(), mac.end());
    return base64url_encode(token);
}

std::expected<Bytes, GateError> TokenCipher::decrypt(std::string_view token_text) const {
    const auto token = base64url_decode(trim(token_text));
    if (!token) {
        return crypto_error("token is not valid base64");
    }
    if (token->size() < kHeaderSize + kBlockSize + kMacSize
        || (token->size() - kHeaderSize - kMacSize) % kBlockSize != 0) {
        return crypto_error("token has invalid length");
    }
    if ((*token)[0] != kVersion) {
        return crypto_error("token has unknown version");
    }

    const std::span<const std::uint8_t> signed_part(token->data(), token->size() - kMacSize);
    const std::span<const std::uint8_t> presented_mac(token->data() + signed_part.size(), kMacSize);
    std::array<std::uint8_t, kMacSize> expected_mac{};
    if (!hmac_sha256(signing_key_, signed_part, expected_mac.data())) {
        return crypto_error(openssl_error("HMAC"));
    }
    if (!constant_time_equals(expected_mac, presented_mac)) {
        return crypto_error("hmac mismatch");
    }

    const std::uint8_t* iv         = token->data() + 9;
    const std::uint8_t* ciphertext = token->data() + kHeaderSize;
    const std::size_t   ct_size    = signed_part.size() - kHeaderSize;

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return crypto_error("EVP_CIPHER_CTX_new failed");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, encryption_key_.data(), iv) != 1) {
        return crypto_error(openssl_error("EVP_DecryptInit_ex"));
    }

    Bytes plaintext(ct_size + kBlockSize);
    int len   = 0;
    int total = 0;
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext, static_cast<int>(ct_size)) != 1) {
        return crypto_error(openssl_error("EVP_DecryptUpdate"));
    }
    total = len;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) != 1) {
        return crypto_error("bad padding");
    }
    total += len;
    plaintext.resize(static_cast<std::size_t>(total));
    return plaintext;
}

std::expected<std::string, GateError> TokenCipher::encrypt_text(std::string_view plaintext) const {
    return encrypt(as_bytes(plaintext));
}

std::expected<std::string, GateError> TokenCipher::decrypt_text(std::string_view token) const {
    return decrypt(token).transform([](const Bytes& b) { return to_string(b); });
}
