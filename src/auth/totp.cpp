#include "auth/totp.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <array>

#include <spdlog/spdlog.h>

#include "common/encoding.hpp"
#include "crypto/random.hpp"

namespace {

constexpr std::array<std::uint32_t, 9> kPow10{
    1, 10, 100, 1'000, 10'000, 100'000, 1'000'000, 10'000'000, 100'000'000,
};

[[nodiscard]] std::int64_t unix_seconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

}  // namespace

Totp::Totp(std::uint32_t digits, std::uint32_t period_sec)
    : digits_(std::clamp<std::uint32_t>(digits, 6, 8))
    , period_(period_sec == 0 ? 30 : period_sec)
{}

std::expected<std::string, GateError> Totp::generate_secret() {
    return random_bytes(kSecretBytes).transform([](const Bytes& b) { return base32_encode(b); });
}

// ---------------------------------------------------------------------------
// code_for_counter (RFC 4226 §5.3)
// ---------------------------------------------------------------------------
std::expected<std::string, GateError>
Totp::code_for_counter(std::span<const std::uint8_t> key, std::uint64_t counter) const {
    std::array<std::uint8_t, 8> msg{};
    for (int i = 7; i >= 0; --i) {
        msg[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(counter & 0xFF);
        counter >>= 8;
    }

    std::array<std::uint8_t, EVP_MAX_MD_SIZE> mac{};
    unsigned int mac_len = 0;
    if (HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()),
             msg.data(), msg.size(), mac.data(), &mac_len) == nullptr || mac_len < 20) {
        const std::string detail = openssl_error("HMAC-SHA1");
        spdlog::error("totp: {}", detail);
        return std::unexpected(GateError{GateErrorCode::kCryptoFailure, "Internal error", detail});
    }

    const std::size_t offset = mac[mac_len - 1] & 0x0F;
    const std::uint32_t binary = (static_cast<std::uint32_t>(mac[offset] & 0x7F) << 24)
                               | (static_cast<std::uint32_t>(mac[offset + 1]) << 16)
                               | (static_cast<std::uint32_t>(mac[offset + 2]) << 8)
                               | static_cast<std::uint32_t>(mac[offset + 3]);
    OPENSSL_cleanse(mac.data(), mac.size());

    std::string code = std::to_string(binary % kPow10[digits_]);
    if (code.size() < digits_) {
        code.insert(0, digits_ - code.size(), '0');
    }
    return code;
}

std::expected<std::string, GateError>
Totp::code_at(std::string_view secret_b32, std::chrono::system_clock::time_point at) const {
    auto key = base32_decode(secret_b32);
    if (!key || key->empty()) {
        return std::unexpected(GateError{GateErrorCode::kValidation, "Invalid secret", "secret is not base32"});
    }
    const auto seconds = std::max<std::int64_t>(unix_seconds(at), 0);
    auto code = code_for_counter(*key, static_cast<std::uint64_t>(seconds) / period_);
    OPENSSL_cleanse(key->data(), key->size());
    return code;
}

// ---------------------------------------------------------------------------
// verify
//   부분 일치 정보가 새지 않도록 각 후보와 상수 시간 비교한다.
//   일치 후에도 남은 후보를 계속 계산하여 어느 스텝이 맞았는지 시간으로 드러내지 않는다.
// ---------------------------------------------------------------------------
bool Totp::verify(std::string_view                      secret_b32,
                  std::string_view                      code,
                  std::chrono::system_clock::time_point now,
                  std::uint32_t                         window) const {
    const std::string_view candidate = trim(code);
    if (candidate.size() != digits_
        || !std::all_of(candidate.begin(), candidate.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    auto key = base32_decode(secret_b32);
    if (!key || key->empty()) {
        return false;
    }

    const auto current = static_cast<std::int64_t>(std::max<std::int64_t>(unix_seconds(now), 0) / period_);
    bool matched = false;
    for (std::int64_t step = current - window; step <= current + static_cast<std::int64_t>(window); ++step) {
        if (step < 0) {
            continue;
        }
        auto expected = code_for_counter(*key, static_cast<std::uint64_t>(step));
        if (!expected) {
            matched = false;
            break;
        }
        matched = constant_time_equals(*expected, candidate) || matched;
    }
    OPENSSL_cleanse(key->data(), key->size());
    return matched;
}

std::string Totp::provisioning_uri(std::string_view secret_b32,
                                   std::string_view account,
                                   std::string_view issuer) const {
    std::string uri = "otpauth://totp/";
    if (!issuer.empty()) {
        uri += percent_encode(issuer);
        uri += ':';
    }
    uri += percent_encode(account);
    uri += "?secret=";
    uri += secret_b32;
    if (!issuer.empty()) {
        uri += "&issuer=";
        uri += percent_encode(issuer);
    }
    if (digits_ != 6) {
        uri += "&digits=" + std::to_string(digits_);
    }
    if (period_ != 30) {
        uri += "&period=" + std::to_string(period_);
    }
    return uri;
}
