// ---------------------------------------------------------------------------
// api_key_hasher.cpp
//
// OpenSSL PKCS5_PBKDF2_HMAC(EVP_sha256) 사용.
// ---------------------------------------------------------------------------

#include "auth/api_key_hasher.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

#include "common/encoding.hpp"
#include "crypto/random.hpp"

namespace {

// 저장된 문자열이 비정상적으로 큰 반복 횟수를 가지면 검증 자체가 DoS 가 된다
constexpr std::uint32_t kMaxIterations = 10'000'000;

struct ParsedHash {
    std::uint32_t iterations{0};
    Bytes         salt{};
    Bytes         digest{};
};

[[nodiscard]] std::optional<ParsedHash> parse(std::string_view encoded) {
    std::array<std::string_view, 4> parts{};
    std::size_t index = 0;
    while (index < parts.size()) {
        const auto pos = encoded.find('$');
        if (pos == std::string_view::npos) {
            parts[index++] = encoded;
            encoded        = {};
            break;
        }
        parts[index++] = encoded.substr(0, pos);
        encoded.remove_prefix(pos + 1);
    }
    if (index != parts.size() || !encoded.empty() || parts[0] != ApiKeyHasher::kScheme) {
        return std::nullopt;
    }

    ParsedHash out;
    const auto* first = parts[1].data();
    const auto* last  = parts[1].data() + parts[1].size();
    const auto  res   = std::from_chars(first, last, out.iterations);
    if (res.ec != std::errc{} || res.ptr != last || out.iterations == 0 || out.iterations > kMaxIterations) {
        return std::nullopt;
    }

    auto salt   = base64_decode(parts[2]);
    auto digest = base64_decode(parts[3]);
    if (!salt || !digest || salt->empty() || digest->size() != ApiKeyHasher::kHashBytes) {
        return std::nullopt;
    }
    out.salt   = std::move(*salt);
    out.digest = std::move(*digest);
    return out;
}

[[nodiscard]] std::expected<Bytes, GateError> derive(std::string_view             key,
                                                     std::span<const std::uint8_t> salt,
                                                     std::uint32_t                 iterations) {
    Bytes out(ApiKeyHasher::kHashBytes);
    if (PKCS5_PBKDF2_HMAC(key.data(), static_cast<int>(key.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          static_cast<int>(iterations), EVP_sha256(),
                          static_cast<int>(out.size()), out.data()) != 1) {
        const std::string detail = openssl_error("PKCS5_PBKDF2_HMAC");
        spdlog::error("api_key_hasher: {}", detail);
        return std::unexpected(GateError{GateErrorCode::kCryptoFailure, "Internal error", detail});
    }
    return out;
}

}  // namespace

ApiKeyHasher::ApiKeyHasher(std::uint32_t iterations)
    : iterations_(iterations == 0 ? 1 : std::min(iterations, kMaxIterations))
{}

std::expected<std::string, GateError> ApiKeyHasher::hash(std::string_view key) const {
    auto salt = random_bytes(kSaltBytes);
    if (!salt) {
        return std::unexpected(salt.error());
    }
    auto digest = derive(key, *salt, iterations_);
    if (!digest) {
        return std::unexpected(digest.error());
    }
    return std::string(kScheme) + "$" + std::to_string(iterations_) + "$"
         + base64_encode(*salt) + "$" + base64_encode(*digest);
}

bool ApiKeyHasher::verify(std::string_view key, std::string_view encoded) const {
    const auto parsed = parse(encoded);
    if (!parsed) {
        return false;
    }
    auto digest = derive(key, parsed->salt, parsed->iterations);
    if (!digest) {
        return false;
    }
    const bool match = constant_time_equals(*digest, parsed->digest);
    OPENSSL_cleanse(digest->data(), digest->size());
    return match;
}

bool ApiKeyHasher::is_hash(std::string_view stored) noexcept {
    return stored.starts_with(kScheme) && stored.size() > kScheme.size() && stored[kScheme.size()] == '$';
}
