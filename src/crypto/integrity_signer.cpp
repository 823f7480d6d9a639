// ---------------------------------------------------------------------------
// integrity_signer.cpp
//
// OpenSSL 3 EVP_MAC("HMAC", digest=SHA256) 로 스트리밍 계산한다.
// ---------------------------------------------------------------------------

#include "crypto/integrity_signer.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include <array>
#include <fstream>
#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "common/encoding.hpp"
#include "crypto/random.hpp"

namespace {

struct MacDeleter {
    void operator()(EVP_MAC* mac) const noexcept { EVP_MAC_free(mac); }
    void operator()(EVP_MAC_CTX* ctx) const noexcept { EVP_MAC_CTX_free(ctx); }
};
using MacPtr    = std::unique_ptr<EVP_MAC, MacDeleter>;
using MacCtxPtr = std::unique_ptr<EVP_MAC_CTX, MacDeleter>;

constexpr std::size_t kReadChunk = 64 * 1024;

[[nodiscard]] std::unexpected<GateError> crypto_error(std::string detail) {
    spdlog::error("integrity_signer: {}", detail);
    return std::unexpected(GateError{GateErrorCode::kCryptoFailure, "Internal error", std::move(detail)});
}

// ---------------------------------------------------------------------------
// HmacStream
//   init → update* → final_hex. 단일 호출 범위에서만 사용한다.
// ---------------------------------------------------------------------------
class HmacStream {
public:
    std::expected<void, GateError> init(std::string_view key) {
        mac_.reset(EVP_MAC_fetch(nullptr, "HMAC", nullptr));
        if (!mac_) {
            return crypto_error(openssl_error("EVP_MAC_fetch"));
        }
        ctx_.reset(EVP_MAC_CTX_new(mac_.get()));
        if (!ctx_) {
            return crypto_error(openssl_error("EVP_MAC_CTX_new"));
        }
        char digest[] = "SHA256";
        const OSSL_PARAM params[] = {
            OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest, 0),
            OSSL_PARAM_construct_end(),
        };
        if (EVP_MAC_init(ctx_.get(), reinterpret_cast<const unsigned char*>(key.data()),
                         key.size(), params) != 1) {
            return crypto_error(openssl_error("EVP_MAC_init"));
        }
        return {};
    }

    std::expected<void, GateError> update(const std::uint8_t* data, std::size_t size) {
        if (size > 0 && EVP_MAC_update(ctx_.get(), data, size) != 1) {
            return crypto_error(openssl_error("EVP_MAC_update"));
        }
        return {};
    }

    std::expected<std::string, GateError> final_hex() {
        std::array<std::uint8_t, EVP_MAX_MD_SIZE> out{};
        std::size_t len = 0;
        if (EVP_MAC_final(ctx_.get(), out.data(), &len, out.size()) != 1) {
            return crypto_error(openssl_error("EVP_MAC_final"));
        }
        return hex_encode(std::span<const std::uint8_t>(out.data(), len));
    }

private:
    MacPtr    mac_;
    MacCtxPtr ctx_;
};

}  // namespace

IntegritySigner::IntegritySigner(std::string secret)
    : secret_(std::move(secret))
{
    if (secret_.empty()) {
        throw std::invalid_argument("integrity secret must not be empty");
    }
}

std::expected<std::string, GateError>
IntegritySigner::sign(std::span<const std::uint8_t> data) const {
    HmacStream hmac;
    if (auto r = hmac.init(secret_); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = hmac.update(data.data(), data.size()); !r) {
        return std::unexpected(r.error());
    }
    return hmac.final_hex();
}

std::expected<std::string, GateError>
IntegritySigner::sign_file(const std::filesystem::path& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(GateError{
            GateErrorCode::kInternal, "Internal error",
            fmt::format("cannot open '{}' for signing", path.string())});
    }

    HmacStream hmac;
    if (auto r = hmac.init(secret_); !r) {
        return std::unexpected(r.error());
    }

    std::array<char, kReadChunk> buf{};
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto got = static_cast<std::size_t>(in.gcount());
        if (auto r = hmac.update(reinterpret_cast<const std::uint8_t*>(buf.data()), got); !r) {
            return std::unexpected(r.error());
        }
    }
    if (in.bad()) {
        return std::unexpected(GateError{
            GateErrorCode::kInternal, "Internal error",
            fmt::format("read error while signing '{}'", path.string())});
    }
    return hmac.final_hex();
}

bool IntegritySigner::verify(std::span<const std::uint8_t> data, std::string_view signature_hex) const {
    const auto actual = sign(data);
    return actual && constant_time_equals(*actual, to_lower(trim(signature_hex)));
}

bool IntegritySigner::verify_file(const std::filesystem::path& path, std::string_view signature_hex) const {
    const auto actual = sign_file(path);
    if (!actual) {
        spdlog::warn("integrity_signer: cannot verify '{}': {}", path.string(), actual.error().detail);
        return false;
    }
    return constant_time_equals(*actual, to_lower(trim(signature_hex)));
}
