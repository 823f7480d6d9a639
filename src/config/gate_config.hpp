#pragma once

// ---------------------------------------------------------------------------
// gate_config.hpp
//
// 게이트 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/trustgate.yaml 에서 로드되고, 환경변수로 덮어쓴다.
//
// [설계 원칙]
// - 이 헤더는 다른 프로젝트 헤더에 의존하지 않는다 (독립적).
// - 모든 멤버는 기본값을 명시하여 미초기화 동작을 방지한다.
// - 비밀값(SecretSection)은 환경변수에서만 채운다. YAML 에 두지 않는다.
//
// [Hot Reload 범위]
// - WafSection / HeaderSection / NetworkSection 만 SIGHUP 으로 교체된다.
// - 암호 키와 업로드/스캔 설정은 프로세스 수명 동안 고정.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// ServerSection
//   게이트웨이 프로세스(리스너/업스트림/운영 채널) 설정.
// ---------------------------------------------------------------------------
struct ServerSection {
    std::string   listen_address{"0.0.0.0"};
    std::uint16_t listen_port{8443};
    std::string   upstream_address{"127.0.0.1"};
    std::uint16_t upstream_port{8000};

    std::uint32_t max_connections{1000};
    std::uint32_t connection_timeout_sec{30};
    std::uint32_t max_request_head_bytes{16 * 1024};
    std::uint64_t max_request_body_bytes{12ull * 1024 * 1024};  // 업로드 한도 + multipart 여유

    std::uint16_t health_check_port{8080};
    std::string   uds_socket_path{"/tmp/trustgate.sock"};
    std::string   log_path{"/tmp/trustgate.log"};
    std::string   log_level{"info"};
};

// ---------------------------------------------------------------------------
// WafSection
//   요청 시그니처 검사 설정.
//   block_mode = false 이면 log-only (매칭 기록 후 통과).
//   패턴 목록이 비어 있으면 기본 패턴(threat_pattern.hpp)을 사용한다.
// ---------------------------------------------------------------------------
struct WafSection {
    bool                     enabled{true};
    bool                     block_mode{true};
    std::vector<std::string> sqli_patterns{};
    std::vector<std::string> xss_patterns{};
    std::vector<std::string> path_traversal_patterns{};
    std::vector<std::string> admin_path_prefixes{"/api/admin"};
};

// ---------------------------------------------------------------------------
// HeaderSection
//   응답 보안 헤더 설정.
//   csp_override 가 비어 있지 않으면 csp_directives 테이블을 무시하고 그대로 사용.
//   api_path_prefix 로 시작하는 경로에는 cross-origin isolation 헤더를 붙이지 않는다.
// ---------------------------------------------------------------------------
struct HeaderSection {
    bool        csp_enabled{true};
    std::string csp_override{};
    std::vector<std::pair<std::string, std::string>> csp_directives{
        {"default-src",     "'self'"},
        {"script-src",      "'self'"},
        {"style-src",       "'self' 'unsafe-inline'"},
        {"img-src",         "'self' data: https:"},
        {"font-src",        "'self' data:"},
        {"connect-src",     "'self'"},
        {"object-src",      "'none'"},
        {"base-uri",        "'self'"},
        {"form-action",     "'self'"},
        {"frame-ancestors", "'none'"},
    };
    bool          hsts_enabled{true};
    std::uint32_t hsts_max_age{31536000};
    std::string   api_path_prefix{"/api"};
};

// ---------------------------------------------------------------------------
// NetworkSection
//   관리자 경로 IP 허용목록 + 클라이언트 IP 판별 정책.
//
//   admin_allowed_networks 가 비어 있으면 모든 IP 허용 (fail-open).
//   이 상태는 시작 시 경고로 기록되고 posture 에 노출된다.
//
//   trust_forwarded_headers : X-Forwarded-For / X-Real-IP 를 신뢰할지 여부 (기본 false)
//   trusted_proxies         : 이 네트워크에서 온 연결의 forwarded 헤더만 신뢰한다.
//                             비어 있으면 trust_forwarded_headers 와 무관하게 peer 주소 사용.
// ---------------------------------------------------------------------------
struct NetworkSection {
    std::vector<std::string> admin_allowed_networks{};
    bool                     trust_forwarded_headers{false};
    std::vector<std::string> trusted_proxies{};
};

// ---------------------------------------------------------------------------
// UploadSection
//   파일 수집 파이프라인 설정.
//
//   require_encryption     : true 면 암호화 실패 = 파이프라인 실패 (기본)
//   allow_legacy_plaintext : true 면 읽기 시 복호화 실패를 평문 레거시로 간주
//                            (경고 로그). 기본 false.
// ---------------------------------------------------------------------------
struct UploadSection {
    std::string              upload_dir{"./uploads"};
    std::uint64_t            max_upload_bytes{10ull * 1024 * 1024};
    std::size_t              chunk_size{8192};
    std::vector<std::string> allowed_extensions{".docx", ".pdf"};
    bool                     require_encryption{true};
    bool                     allow_legacy_plaintext{false};
};

// ---------------------------------------------------------------------------
// ScanSection
//   외부 스캐너(clamscan 계열) 호출 설정과 휴리스틱 fallback 한도.
// ---------------------------------------------------------------------------
struct ScanSection {
    std::string   scanner_binary{"clamscan"};
    std::uint32_t scan_timeout_sec{30};
    std::uint32_t detect_timeout_sec{5};
    std::uint64_t heuristic_max_bytes{100ull * 1024 * 1024};
};

// ---------------------------------------------------------------------------
// MfaSection
//   TOTP / 백업 코드 파라미터.
// ---------------------------------------------------------------------------
struct MfaSection {
    std::string   issuer{"trustgate"};
    std::uint32_t totp_digits{6};
    std::uint32_t totp_period_sec{30};
    std::uint32_t totp_window{1};
    std::uint32_t backup_code_count{10};
};

// ---------------------------------------------------------------------------
// SecretSection
//   환경변수에서만 로드되는 비밀값. 로그에 절대 출력하지 말 것.
//
//   encryption_key     : 파일 암호화 키 (URL-safe base64, 32 bytes)
//   integrity_secret   : 파일 HMAC 서명 키 (임의 문자열)
//   mfa_encryption_key : TOTP 시크릿/백업 코드 blob 암호화 키
// ---------------------------------------------------------------------------
struct SecretSection {
    std::string encryption_key{};
    std::string integrity_secret{};
    std::string mfa_encryption_key{};
};

// ---------------------------------------------------------------------------
// GateConfig
//   전체 설정의 루트 구조체. ConfigLoader::load 가 반환한다.
// ---------------------------------------------------------------------------
struct GateConfig {
    ServerSection  server{};
    WafSection     waf{};
    HeaderSection  headers{};
    NetworkSection network{};
    UploadSection  upload{};
    ScanSection    scan{};
    MfaSection     mfa{};
    SecretSection  secrets{};
};
