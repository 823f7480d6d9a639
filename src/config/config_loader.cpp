// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML 설정 파일을 로드하여 GateConfig 구조체로 파싱하고,
// 환경변수 오버라이드를 적용한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 설정을 반환하지 않는다.
// - 필드 누락 시 구조체 기본값을 적용한다.
// - 비밀값은 YAML 에서 읽지 않는다. secrets 섹션이 있으면 경고만 남긴다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [알려진 한계]
// - connection_timeout 은 "30s" 형태의 숫자+단위 문자열에서 숫자만 추출한다.
// - CIDR 문자열 유효성은 NetworkAllowlist 생성 시점에 검사된다.
//   잘못된 항목은 그 시점에 경고 후 건너뛴다.
//
// [오탐/미탐 트레이드오프]
// - WAF 패턴에 잘못된 regex 가 있으면 ThreatMatcher 가 해당 패턴을 건너뛴다.
//   이는 false negative 증가를 의미하므로 로드 시점에 경고를 출력한다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <charconv>
#include <cstdlib>
#include <regex>
#include <string>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "common/encoding.hpp"
#include "common/types.hpp"

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: connection_timeout 문자열("30s")에서 정수(30)를 추출.
// ---------------------------------------------------------------------------
[[nodiscard]] std::uint32_t parse_timeout_str(const std::string& raw, std::uint32_t fallback) {
    if (raw.empty()) {
        return fallback;
    }
    std::uint32_t value{0};
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{}) {
        spdlog::warn("config_loader: cannot parse timeout '{}', using default {}s", raw, fallback);
        return fallback;
    }
    return value;
}

void warn_invalid_patterns(std::string_view category, const std::vector<std::string>& patterns) {
    for (const auto& p : patterns) {
        try {
            std::regex re(p, std::regex_constants::icase | std::regex_constants::ECMAScript);
            (void)re;
        } catch (const std::regex_error& e) {
            spdlog::warn(
                "config_loader: waf.{} pattern '{}' is invalid regex and will be skipped "
                "(false negative risk): {}",
                category, p, e.what());
        }
    }
}

[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

// 스칼라 읽기 헬퍼. 노드가 없거나 스칼라가 아니면 fallback.
// 타입 변환 실패는 YAML::Exception 으로 올려보내 섹션 단위로 실패 처리한다.
template <typename T>
[[nodiscard]] T read_scalar(const YAML::Node& node, const T& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    return node.as<T>();
}

[[nodiscard]] ServerSection parse_server(const YAML::Node& node) {
    ServerSection s{};
    if (!node || !node.IsMap()) {
        return s;
    }
    s.listen_address         = read_scalar(node["listen_address"], s.listen_address);
    s.listen_port            = read_scalar(node["listen_port"], s.listen_port);
    s.upstream_address       = read_scalar(node["upstream_address"], s.upstream_address);
    s.upstream_port          = read_scalar(node["upstream_port"], s.upstream_port);
    s.max_connections        = read_scalar(node["max_connections"], s.max_connections);
    s.max_request_head_bytes = read_scalar(node["max_request_head_bytes"], s.max_request_head_bytes);
    s.max_request_body_bytes = read_scalar(node["max_request_body_bytes"], s.max_request_body_bytes);
    s.health_check_port      = read_scalar(node["health_check_port"], s.health_check_port);
    s.uds_socket_path        = read_scalar(node["uds_socket_path"], s.uds_socket_path);
    s.log_path               = read_scalar(node["log_path"], s.log_path);
    s.log_level              = read_scalar(node["log_level"], s.log_level);

    if (node["connection_timeout"] && node["connection_timeout"].IsScalar()) {
        s.connection_timeout_sec = parse_timeout_str(
            node["connection_timeout"].as<std::string>(), s.connection_timeout_sec);
    }
    return s;
}

[[nodiscard]] WafSection parse_waf(const YAML::Node& node) {
    WafSection w{};
    if (!node || !node.IsMap()) {
        return w;
    }
    w.enabled    = read_scalar(node["enabled"], w.enabled);
    w.block_mode = read_scalar(node["block_mode"], w.block_mode);
    w.sqli_patterns           = read_string_sequence(node["sqli_patterns"]);
    w.xss_patterns            = read_string_sequence(node["xss_patterns"]);
    w.path_traversal_patterns = read_string_sequence(node["path_traversal_patterns"]);
    if (node["admin_path_prefixes"]) {
        w.admin_path_prefixes = read_string_sequence(node["admin_path_prefixes"]);
    }

    warn_invalid_patterns("sqli_patterns", w.sqli_patterns);
    warn_invalid_patterns("xss_patterns", w.xss_patterns);
    warn_invalid_patterns("path_traversal_patterns", w.path_traversal_patterns);
    return w;
}

// csp_directives 는 순서를 보존해야 하므로 map 순회 순서(문서 순서)를 그대로 따른다.
[[nodiscard]] HeaderSection parse_headers(const YAML::Node& node) {
    HeaderSection h{};
    if (!node || !node.IsMap()) {
        return h;
    }
    h.csp_enabled     = read_scalar(node["csp_enabled"], h.csp_enabled);
    h.csp_override    = read_scalar(node["csp_policy"], h.csp_override);
    h.hsts_enabled    = read_scalar(node["hsts_enabled"], h.hsts_enabled);
    h.hsts_max_age    = read_scalar(node["hsts_max_age"], h.hsts_max_age);
    h.api_path_prefix = read_scalar(node["api_path_prefix"], h.api_path_prefix);

    const YAML::Node directives = node["csp_directives"];
    if (directives && directives.IsMap()) {
        h.csp_directives.clear();
        for (const auto& kv : directives) {
            h.csp_directives.emplace_back(kv.first.as<std::string>(), kv.second.as<std::string>());
        }
    }
    return h;
}

[[nodiscard]] NetworkSection parse_network(const YAML::Node& node) {
    NetworkSection n{};
    if (!node || !node.IsMap()) {
        return n;
    }
    n.admin_allowed_networks  = read_string_sequence(node["admin_allowed_networks"]);
    n.trust_forwarded_headers = read_scalar(node["trust_forwarded_headers"], n.trust_forwarded_headers);
    n.trusted_proxies         = read_string_sequence(node["trusted_proxies"]);
    return n;
}

[[nodiscard]] UploadSection parse_upload(const YAML::Node& node) {
    UploadSection u{};
    if (!node || !node.IsMap()) {
        return u;
    }
    u.upload_dir             = read_scalar(node["upload_dir"], u.upload_dir);
    u.max_upload_bytes       = read_scalar(node["max_upload_bytes"], u.max_upload_bytes);
    u.chunk_size             = read_scalar(node["chunk_size"], u.chunk_size);
    u.require_encryption     = read_scalar(node["require_encryption"], u.require_encryption);
    u.allow_legacy_plaintext = read_scalar(node["allow_legacy_plaintext"], u.allow_legacy_plaintext);
    if (node["allowed_extensions"]) {
        u.allowed_extensions = read_string_sequence(node["allowed_extensions"]);
    }
    return u;
}

[[nodiscard]] ScanSection parse_scan(const YAML::Node& node) {
    ScanSection s{};
    if (!node || !node.IsMap()) {
        return s;
    }
    s.scanner_binary      = read_scalar(node["scanner_binary"], s.scanner_binary);
    s.scan_timeout_sec    = read_scalar(node["scan_timeout_sec"], s.scan_timeout_sec);
    s.detect_timeout_sec   = read_scalar(node["detect_timeout_sec"], s.detect_timeout_sec);
    s.heuristic_max_bytes = read_scalar(node["heuristic_max_bytes"], s.heuristic_max_bytes);
    return s;
}

[[nodiscard]] MfaSection parse_mfa(const YAML::Node& node) {
    MfaSection m{};
    if (!node || !node.IsMap()) {
        return m;
    }
    m.issuer            = read_scalar(node["issuer"], m.issuer);
    m.totp_digits       = read_scalar(node["totp_digits"], m.totp_digits);
    m.totp_period_sec   = read_scalar(node["totp_period_sec"], m.totp_period_sec);
    m.totp_window       = read_scalar(node["totp_window"], m.totp_window);
    m.backup_code_count = read_scalar(node["backup_code_count"], m.backup_code_count);
    return m;
}

// ---------------------------------------------------------------------------
// 환경변수 헬퍼
// ---------------------------------------------------------------------------
[[nodiscard]] const char* lookup_env(const ConfigLoader::EnvLookup& lookup, const char* name) {
    const char* val = lookup ? lookup(name) : std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return nullptr;
    }
    return val;
}

void env_str(const ConfigLoader::EnvLookup& lookup, const char* name, std::string& target) {
    if (const char* val = lookup_env(lookup, name)) {
        target = val;
    }
}

void env_bool(const ConfigLoader::EnvLookup& lookup, const char* name, bool& target) {
    const char* val = lookup_env(lookup, name);
    if (val == nullptr) {
        return;
    }
    const std::string v = to_lower(trim(val));
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        target = true;
    } else if (v == "false" || v == "0" || v == "no" || v == "off") {
        target = false;
    } else {
        spdlog::warn("env {}: invalid boolean '{}', keeping {}", name, val, target);
    }
}

template <typename T>
void env_uint(const ConfigLoader::EnvLookup& lookup, const char* name, T& target) {
    const char* val = lookup_env(lookup, name);
    if (val == nullptr) {
        return;
    }
    const std::string_view sv{val};
    T parsed{};
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), parsed);
    if (ec != std::errc{} || ptr != sv.data() + sv.size() || parsed == 0) {
        spdlog::warn("env {}: invalid value '{}', keeping {}", name, val, target);
        return;
    }
    target = parsed;
}

}  // namespace

std::vector<std::string> split_csv(std::string_view csv) {
    std::vector<std::string> out;
    while (!csv.empty()) {
        const auto comma = csv.find(',');
        const auto item  = trim(csv.substr(0, comma));
        if (!item.empty()) {
            out.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        csv.remove_prefix(comma + 1);
    }
    return out;
}

// ---------------------------------------------------------------------------
// ConfigLoader::load
// ---------------------------------------------------------------------------
std::expected<GateConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "config_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("config_loader: loading configuration from '{}'", canonical_path.string());

    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(), e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: cannot read '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (root.IsNull()) {
        spdlog::warn("config_loader: '{}' is empty, using defaults", canonical_path.string());
        return GateConfig{};
    }
    if (!root.IsMap()) {
        const std::string err = fmt::format(
            "config_loader: '{}' is not a valid YAML map (top-level)", canonical_path.string());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (root["secrets"]) {
        spdlog::warn("config_loader: 'secrets' section in YAML is ignored, "
                     "secrets are read from the environment only");
    }

    // 섹션 하나라도 타입이 맞지 않으면 전체 실패 (부분 설정 반환 금지)
    GateConfig cfg{};
    const char* section = "server";
    try {
        cfg.server  = parse_server(root["server"]);
        section     = "waf";
        cfg.waf     = parse_waf(root["waf"]);
        section     = "headers";
        cfg.headers = parse_headers(root["headers"]);
        section     = "network";
        cfg.network = parse_network(root["network"]);
        section     = "upload";
        cfg.upload  = parse_upload(root["upload"]);
        section     = "scan";
        cfg.scan    = parse_scan(root["scan"]);
        section     = "mfa";
        cfg.mfa     = parse_mfa(root["mfa"]);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: error parsing '{}' section: {}", section, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("config_loader: loaded (waf={}, block_mode={}, admin_networks={})",
                 cfg.waf.enabled, cfg.waf.block_mode, cfg.network.admin_allowed_networks.size());
    return cfg;
}

std::expected<GateConfig, std::string>
ConfigLoader::load_or_default(const std::filesystem::path& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        spdlog::warn("config_loader: '{}' not found, using built-in defaults", config_path.string());
        return GateConfig{};
    }
    return load(config_path);
}

// ---------------------------------------------------------------------------
// ConfigLoader::apply_env
// ---------------------------------------------------------------------------
void ConfigLoader::apply_env(GateConfig& config, const EnvLookup& lookup) {
    // ── 비밀값 ──────────────────────────────────────────────────────────
    env_str(lookup, "ENCRYPTION_KEY", config.secrets.encryption_key);
    env_str(lookup, "FILE_INTEGRITY_SECRET", config.secrets.integrity_secret);
    env_str(lookup, "MFA_ENCRYPTION_KEY", config.secrets.mfa_encryption_key);
    if (config.secrets.mfa_encryption_key.empty() && !config.secrets.encryption_key.empty()) {
        spdlog::warn("config_loader: MFA_ENCRYPTION_KEY not set, falling back to ENCRYPTION_KEY");
        config.secrets.mfa_encryption_key = config.secrets.encryption_key;
    }

    // ── 관리자 허용목록 ────────────────────────────────────────────────
    if (const char* ips = lookup_env(lookup, "ADMIN_ALLOWED_IPS")) {
        config.network.admin_allowed_networks = split_csv(ips);
    }
    env_bool(lookup, "TRUST_FORWARDED_HEADERS", config.network.trust_forwarded_headers);

    // ── WAF / 보안 헤더 ────────────────────────────────────────────────
    env_bool(lookup, "WAF_ENABLED", config.waf.enabled);
    env_bool(lookup, "WAF_BLOCK_MODE", config.waf.block_mode);
    env_bool(lookup, "CSP_ENABLED", config.headers.csp_enabled);
    env_str(lookup, "CSP_POLICY", config.headers.csp_override);
    env_bool(lookup, "HSTS_ENABLED", config.headers.hsts_enabled);

    // ── 프로세스 ───────────────────────────────────────────────────────
    env_str(lookup, "LISTEN_ADDR", config.server.listen_address);
    env_uint(lookup, "LISTEN_PORT", config.server.listen_port);
    env_str(lookup, "UPSTREAM_HOST", config.server.upstream_address);
    env_uint(lookup, "UPSTREAM_PORT", config.server.upstream_port);
    env_uint(lookup, "HEALTH_CHECK_PORT", config.server.health_check_port);
    env_uint(lookup, "MAX_CONNECTIONS", config.server.max_connections);
    env_str(lookup, "UDS_SOCKET_PATH", config.server.uds_socket_path);
    env_str(lookup, "LOG_PATH", config.server.log_path);
    env_str(lookup, "LOG_LEVEL", config.server.log_level);
    env_str(lookup, "UPLOAD_DIR", config.upload.upload_dir);
    env_str(lookup, "SCANNER_BINARY", config.scan.scanner_binary);
}

// ---------------------------------------------------------------------------
// ConfigLoader::validate
// ---------------------------------------------------------------------------
std::expected<void, std::string> ConfigLoader::validate(const GateConfig& config) {
    const auto check_key = [](std::string_view name, const std::string& value)
        -> std::expected<void, std::string> {
        if (value.empty()) {
            return std::unexpected(fmt::format("{} is not set", name));
        }
        const auto decoded = base64url_decode(value);
        if (!decoded || decoded->size() != 32) {
            return std::unexpected(
                fmt::format("{} must be 32 bytes encoded as URL-safe base64", name));
        }
        return {};
    };

    if (auto r = check_key("ENCRYPTION_KEY", config.secrets.encryption_key); !r) {
        return r;
    }
    if (auto r = check_key("MFA_ENCRYPTION_KEY", config.secrets.mfa_encryption_key); !r) {
        return r;
    }
    if (config.secrets.integrity_secret.empty()) {
        return std::unexpected(std::string{"FILE_INTEGRITY_SECRET is not set"});
    }
    if (config.upload.max_upload_bytes == 0 || config.upload.chunk_size == 0) {
        return std::unexpected(std::string{"upload size limits must be positive"});
    }
    if (config.upload.allowed_extensions.empty()) {
        return std::unexpected(std::string{"upload.allowed_extensions must not be empty"});
    }
    if (config.scan.scan_timeout_sec == 0) {
        return std::unexpected(std::string{"scan.scan_timeout_sec must be positive"});
    }
    if (config.mfa.totp_digits < 6 || config.mfa.totp_digits > 8 || config.mfa.totp_period_sec == 0) {
        return std::unexpected(std::string{"mfa TOTP parameters out of range"});
    }
    if (config.server.max_request_head_bytes == 0) {
        return std::unexpected(std::string{"server.max_request_head_bytes must be positive"});
    }
    return {};
}
