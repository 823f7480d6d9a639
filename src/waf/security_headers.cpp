#include "waf/security_headers.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace {

constexpr std::string_view kPermissionsPolicy =
    "geolocation=(), microphone=(), camera=(), payment=(), usb=()";

}  // namespace

std::string build_csp(const HeaderSection& config) {
    if (!config.csp_override.empty()) {
        return config.csp_override;
    }
    std::string csp;
    for (const auto& [directive, value] : config.csp_directives) {
        if (!csp.empty()) {
            csp += "; ";
        }
        csp += directive;
        if (!value.empty()) {
            csp += ' ';
            csp += value;
        }
    }
    return csp;
}

SecurityHeaders::SecurityHeaders(HeaderSection config)
    : config_(std::move(config))
    , csp_(build_csp(config_))
    , hsts_(fmt::format("max-age={}; includeSubDomains", config_.hsts_max_age))
{
    if (!config_.csp_override.empty()) {
        spdlog::info("security_headers: using CSP override from configuration");
    }
    if (!config_.csp_enabled) {
        spdlog::warn("security_headers: Content-Security-Policy disabled");
    }
    if (!config_.hsts_enabled) {
        spdlog::warn("security_headers: Strict-Transport-Security disabled");
    }
}

bool SecurityHeaders::is_api_path(std::string_view path) const noexcept {
    const std::string_view prefix = config_.api_path_prefix;
    if (prefix.empty() || !path.starts_with(prefix)) {
        return false;
    }
    // "/api" 는 "/api", "/api/..." 에만 매칭하고 "/apidocs" 에는 매칭하지 않는다
    return path.size() == prefix.size() || prefix.back() == '/' || path[prefix.size()] == '/'
        || path[prefix.size()] == '?';
}

HeaderList SecurityHeaders::headers_for(std::string_view path) const {
    HeaderList out;
    out.reserve(10);

    if (config_.csp_enabled && !csp_.empty()) {
        out.emplace_back("Content-Security-Policy", csp_);
    }
    if (config_.hsts_enabled) {
        out.emplace_back("Strict-Transport-Security", hsts_);
    }
    out.emplace_back("X-Frame-Options", "DENY");
    out.emplace_back("X-Content-Type-Options", "nosniff");
    out.emplace_back("X-XSS-Protection", "1; mode=block");
    out.emplace_back("Referrer-Policy", "strict-origin-when-cross-origin");
    out.emplace_back("Permissions-Policy", std::string(kPermissionsPolicy));

    if (!is_api_path(path)) {
        out.emplace_back("Cross-Origin-Opener-Policy", "same-origin");
        out.emplace_back("Cross-Origin-Embedder-Policy", "require-corp");
        out.emplace_back("Cross-Origin-Resource-Policy", "same-origin");
    }
    return out;
}

void SecurityHeaders::apply(HeaderList& response_headers, std::string_view path) const {
    const HeaderList injected = headers_for(path);
    std::erase_if(response_headers, [&injected](const auto& header) {
        return std::any_of(injected.begin(), injected.end(), [&header](const auto& h) {
            return iequals(h.first, header.first);
        });
    });
    response_headers.insert(response_headers.end(), injected.begin(), injected.end());
}
