// ---------------------------------------------------------------------------
// encoding.cpp
//
// hex / base64 / base32 / percent 인코딩 구현.
// 외부 라이브러리 없이 테이블 기반으로 구현한다 (입력 크기는 수 MiB 이하).
// ---------------------------------------------------------------------------

#include "common/encoding.hpp"

#include <array>
#include <cctype>

namespace {

constexpr std::string_view kHexDigits   = "0123456789abcdef";
constexpr std::string_view kB64Std      = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr std::string_view kB64Url      = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
constexpr std::string_view kB32Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

std::string b64_encode_with(std::span<const std::uint8_t> data, std::string_view alphabet) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        const std::uint32_t v = (static_cast<std::uint32_t>(data[i]) << 16)
                              | (static_cast<std::uint32_t>(data[i + 1]) << 8)
                              |  static_cast<std::uint32_t>(data[i + 2]);
        out += alphabet[(v >> 18) & 0x3F];
        out += alphabet[(v >> 12) & 0x3F];
        out += alphabet[(v >> 6) & 0x3F];
        out += alphabet[v & 0x3F];
    }

    const std::size_t rest = data.size() - i;
    if (rest == 1) {
        const std::uint32_t v = static_cast<std::uint32_t>(data[i]) << 16;
        out += alphabet[(v >> 18) & 0x3F];
        out += alphabet[(v >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const std::uint32_t v = (static_cast<std::uint32_t>(data[i]) << 16)
                              | (static_cast<std::uint32_t>(data[i + 1]) << 8);
        out += alphabet[(v >> 18) & 0x3F];
        out += alphabet[(v >> 12) & 0x3F];
        out += alphabet[(v >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::optional<Bytes> b64_decode_with(std::string_view text, std::string_view alphabet) {
    std::array<int, 256> table{};
    table.fill(-1);
    for (std::size_t i = 0; i < alphabet.size(); ++i) {
        table[static_cast<unsigned char>(alphabet[i])] = static_cast<int>(i);
    }

    // 패딩 제거 (최대 2개). 패딩 없는 입력도 허용한다.
    while (!text.empty() && text.back() == '=') {
        text.remove_suffix(1);
    }
    if (text.size() % 4 == 1) {
        return std::nullopt;
    }

    Bytes out;
    out.reserve(text.size() * 3 / 4);

    std::uint32_t acc  = 0;
    int           bits = 0;
    for (const char ch : text) {
        const int v = table[static_cast<unsigned char>(ch)];
        if (v < 0) {
            return std::nullopt;
        }
        acc = (acc << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
        }
    }
    return out;
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') { return c - '0'; }
    if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
    if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
    return -1;
}

}  // namespace

std::string hex_encode(std::span<const std::uint8_t> data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (const auto b : data) {
        out += kHexDigits[b >> 4];
        out += kHexDigits[b & 0x0F];
    }
    return out;
}

std::string base64_encode(std::span<const std::uint8_t> data) {
    return b64_encode_with(data, kB64Std);
}

std::optional<Bytes> base64_decode(std::string_view text) {
    return b64_decode_with(text, kB64Std);
}

std::string base64url_encode(std::span<const std::uint8_t> data) {
    return b64_encode_with(data, kB64Url);
}

std::optional<Bytes> base64url_decode(std::string_view text) {
    return b64_decode_with(text, kB64Url);
}

std::string base32_encode(std::span<const std::uint8_t> data) {
    std::string out;
    out.reserve((data.size() * 8 + 4) / 5);

    std::uint32_t acc  = 0;
    int           bits = 0;
    for (const auto b : data) {
        acc = (acc << 8) | b;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out += kB32Alphabet[(acc >> bits) & 0x1F];
        }
    }
    if (bits > 0) {
        out += kB32Alphabet[(acc << (5 - bits)) & 0x1F];
    }
    return out;
}

std::optional<Bytes> base32_decode(std::string_view text) {
    Bytes out;
    out.reserve(text.size() * 5 / 8);

    std::uint32_t acc  = 0;
    int           bits = 0;
    for (const char raw : text) {
        if (raw == '=' || raw == ' ' || raw == '-') {
            continue;
        }
        const char c = static_cast<char>(std::toupper(static_cast<unsigned char>(raw)));
        const auto pos = kB32Alphabet.find(c);
        if (pos == std::string_view::npos) {
            return std::nullopt;
        }
        acc = (acc << 5) | static_cast<std::uint32_t>(pos);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
        }
    }
    return out;
}

std::string percent_decode(std::string_view text, bool plus_as_space) {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '%' && i + 2 < text.size()) {
            const int hi = hex_value(text[i + 1]);
            const int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        if (c == '+' && plus_as_space) {
            out += ' ';
            continue;
        }
        out += c;
    }
    return out;
}

std::string percent_encode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '.' || c == '_' || c == '~') {
            out += c;
        } else {
            out += '%';
            out += static_cast<char>(std::toupper(kHexDigits[uc >> 4]));
            out += static_cast<char>(std::toupper(kHexDigits[uc & 0x0F]));
        }
    }
    return out;
}
