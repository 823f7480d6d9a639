#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// HeaderList
//   HTTP 헤더 목록. 순서를 보존하고 같은 이름의 중복 헤더를 허용한다.
//   이름 비교는 항상 대소문자 무관 (find_header 사용).
// ---------------------------------------------------------------------------
using HeaderList = std::vector<std::pair<std::string, std::string>>;

// ---------------------------------------------------------------------------
// RequestView
//   인바운드 HTTP 요청 하나를 필터 레이어에 전달하기 위한 불변 뷰.
//   gateway 레이어가 생성하고 waf/auth 레이어에 const-ref 로 전달한다.
//
//   path  : 쿼리스트링을 제외한 요청 경로 (원문, 디코딩 전)
//   query : '?' 이후 문자열 (원문, 디코딩 전, '?' 미포함)
//   peer_ip : 전송 계층(TCP) 상대 주소
// ---------------------------------------------------------------------------
struct RequestView {
    std::uint64_t request_id{0};   // 프로세스 범위 내 유일 요청 ID
    std::string   method{};
    std::string   path{};
    std::string   query{};
    HeaderList    headers{};
    std::string   peer_ip{};
};

// ---------------------------------------------------------------------------
// GateErrorCode
//   신뢰 경계에서 발생하는 오류 분류.
//
//   kValidation        : 입력 형식 오류 (크기, 타입, URL 형태)
//   kSecurityRejection : WAF 매칭, SSRF 차단, IP 허용목록 차단, 악성 파일
//   kCryptoFailure     : 암호화/서명/복호화 실패
//   kAuthFailure       : API 키, TOTP, 백업 코드 검증 실패 (하위 원인 비노출)
//   kInternal          : I/O 등 내부 오류
// ---------------------------------------------------------------------------
enum class GateErrorCode : std::uint8_t {
    kValidation        = 0,
    kSecurityRejection = 1,
    kCryptoFailure     = 2,
    kAuthFailure       = 3,
    kInternal          = 4,
};

// ---------------------------------------------------------------------------
// GateError
//   std::expected<T, GateError> 패턴과 함께 사용한다.
//
//   public_message : 클라이언트에 노출 가능한 일반 메시지
//   detail         : 서버 로그 전용 상세 원인. 응답에 절대 포함하지 말 것.
// ---------------------------------------------------------------------------
struct GateError {
    GateErrorCode code{GateErrorCode::kInternal};
    std::string   public_message{};
    std::string   detail{};
};

// http_status_for
//   오류 분류 → HTTP 상태 코드. 모든 레이어가 같은 매핑을 쓰도록 한 곳에 둔다.
[[nodiscard]] constexpr int http_status_for(GateErrorCode code) noexcept {
    switch (code) {
        case GateErrorCode::kValidation:        return 400;
        case GateErrorCode::kSecurityRejection: return 403;
        case GateErrorCode::kAuthFailure:       return 401;
        case GateErrorCode::kCryptoFailure:     return 500;
        case GateErrorCode::kInternal:          return 500;
    }
    return 500;
}

[[nodiscard]] std::string_view error_code_name(GateErrorCode code) noexcept;

// find_header
//   대소문자 무관 헤더 조회. 없으면 빈 string_view.
//   같은 이름이 여러 번 나오면 첫 번째 값을 반환한다.
[[nodiscard]] std::string_view find_header(const HeaderList& headers,
                                           std::string_view   name) noexcept;

// iequals: ASCII 대소문자 무관 비교
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

// trim: 앞뒤 공백(스페이스/탭/CR/LF) 제거
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;

// to_lower: ASCII 소문자 변환 복사본
[[nodiscard]] std::string to_lower(std::string_view s);

// 인증 헤더 추출. 값은 trim 되어 반환되며, 없으면 빈 string_view.
[[nodiscard]] std::string_view presented_api_key(const HeaderList& headers) noexcept;    // X-API-Key
[[nodiscard]] std::string_view presented_totp_code(const HeaderList& headers) noexcept;  // X-TOTP-Code
