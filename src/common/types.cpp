#include "common/types.hpp"

#include <algorithm>
#include <cctype>

std::string_view error_code_name(GateErrorCode code) noexcept {
    switch (code) {
        case GateErrorCode::kValidation:        return "validation";
        case GateErrorCode::kSecurityRejection: return "security_rejection";
        case GateErrorCode::kCryptoFailure:     return "crypto_failure";
        case GateErrorCode::kAuthFailure:       return "auth_failure";
        case GateErrorCode::kInternal:          return "internal";
    }
    return "internal";
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char ac, unsigned char bc) {
        return std::tolower(ac) == std::tolower(bc);
    });
}

std::string_view find_header(const HeaderList& headers, std::string_view name) noexcept {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return {};
}

std::string_view trim(std::string_view s) noexcept {
    constexpr std::string_view kWs = " \t\r\n";
    const auto first = s.find_first_not_of(kWs);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(kWs);
    return s.substr(first, last - first + 1);
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string_view presented_api_key(const HeaderList& headers) noexcept {
    return trim(find_header(headers, "X-API-Key"));
}

std::string_view presented_totp_code(const HeaderList& headers) noexcept {
    return trim(find_header(headers, "X-TOTP-Code"));
}
