#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 보안 이벤트 JSON 로거.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입. 필요한 컴포넌트에 참조로 전달한다.
// - 한 이벤트 = 한 줄 JSON. 필드명은 snake_case.
// - 상세 원인은 이 로그에만 남기고 클라이언트 응답에는 일반 메시지만 보낸다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace spdlog {
class logger;
}

class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (rotating, 100MB x 3)
    //   console   : true 면 stdout 에도 출력
    //   초기화 실패 시 std::runtime_error.
    StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path, bool console = true);

    ~StructuredLogger();

    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&)                 = default;
    StructuredLogger& operator=(StructuredLogger&&)      = default;

    void log_request(const RequestLog& entry);
    void log_block(const BlockLog& entry);
    void log_upload(const UploadLog& entry);
    void log_auth(const AuthLog& entry);

    // 내부 진단용 spdlog 래퍼. 클라이언트 데이터를 직접 전달하지 말 것.
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    void flush();

private:
    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};

// set_diagnostic_level: spdlog 기본 로거(spdlog::info 등) 의 최소 레벨 설정
void set_diagnostic_level(LogLevel level);

// escape_json_string: JSON 문자열 리터럴 내부용 이스케이프 (따옴표 미포함)
[[nodiscard]] std::string escape_json_string(std::string_view str);

// format_iso8601: "2025-01-01T00:00:00.000Z"
[[nodiscard]] std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
