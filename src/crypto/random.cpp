#include "crypto/random.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/rand.h>

#include <spdlog/spdlog.h>

std::string openssl_error(std::string_view context) {
    const unsigned long err = ERR_get_error();
    ERR_clear_error();
    if (err == 0) {
        return fmt::format("{}: unknown OpenSSL error", context);
    }
    char buf[256] = {0};
    ERR_error_string_n(err, buf, sizeof(buf));
    return fmt::format("{}: {}", context, buf);
}

std::expected<Bytes, GateError> random_bytes(std::size_t count) {
    Bytes out(count);
    if (count == 0) {
        return out;
    }
    if (RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        const std::string detail = openssl_error("RAND_bytes");
        spdlog::error("crypto: {}", detail);
        return std::unexpected(GateError{GateErrorCode::kCryptoFailure, "Internal error", detail});
    }
    return out;
}

std::expected<std::string, GateError> random_hex(std::size_t count) {
    return random_bytes(count).transform([](const Bytes& b) { return hex_encode(b); });
}

std::expected<std::string, GateError> random_token_urlsafe(std::size_t count) {
    return random_bytes(count).transform([](const Bytes& b) {
        std::string token = base64url_encode(b);
        while (!token.empty() && token.back() == '=') {
            token.pop_back();
        }
        return token;
    });
}

bool constant_time_equals(std::span<const std::uint8_t> a,
                          std::span<const std::uint8_t> b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool constant_time_equals(std::string_view a, std::string_view b) noexcept {
    return constant_time_equals(as_bytes(a), as_bytes(b));
}
