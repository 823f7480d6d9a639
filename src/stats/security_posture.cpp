#include "stats/security_posture.hpp"

#include <spdlog/fmt/fmt.h>

#include "logger/structured_logger.hpp"

std::string serialize_posture(const SecurityPosture& p) {
    return fmt::format(
        R"({{"scan_mode":"{}","waf_enabled":{},"waf_block_mode":{},"admin_allowlist_configured":{},)"
        R"("admin_allowlist_fail_open":{},"trust_forwarded_headers":{},"encryption_required":{},)"
        R"("legacy_plaintext_fallback":{}}})",
        escape_json_string(p.scan_mode),
        p.waf_enabled,
        p.waf_block_mode,
        p.admin_allowlist_configured,
        !p.admin_allowlist_configured,
        p.trust_forwarded_headers,
        p.encryption_required,
        p.legacy_plaintext_fallback);
}
