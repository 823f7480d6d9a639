// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// 레벨 정책: request → info, upload(stored) → info, upload(rejected) → warn,
//            block → warn, auth(failure) → warn, auth(success/migrated) → info.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "common/types.hpp"

namespace {

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

}  // namespace

void set_diagnostic_level(LogLevel level) {
    spdlog::set_level(to_spdlog_level(level));
}

LogLevel parse_log_level(std::string_view text) noexcept {
    if (iequals(text, "debug")) { return LogLevel::kDebug; }
    if (iequals(text, "warn") || iequals(text, "warning")) { return LogLevel::kWarn; }
    if (iequals(text, "error")) { return LogLevel::kError; }
    return LogLevel::kInfo;
}

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (const unsigned char ch : str) {
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level,
                                   const std::filesystem::path& log_path,
                                   bool console)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;
        if (console) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
        }

        // Rotating file sink (100MB, 3개 파일 유지)
        constexpr std::size_t kMaxFileSize = 100 * 1024 * 1024;
        constexpr std::size_t kMaxFiles    = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), kMaxFileSize, kMaxFiles));

        logger_ = std::make_shared<spdlog::logger>("trustgate", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 기본 패턴: 타임스탬프만 (이벤트 본문은 각 메서드에서 JSON 으로 생성)
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::warn);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// log_request
// ---------------------------------------------------------------------------
void StructuredLogger::log_request(const RequestLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kInfo) {
        return;
    }
    std::ostringstream json;
    json << R"({"event":"request","request_id":)" << entry.request_id
         << R"(,"method":")" << escape_json_string(entry.method)
         << R"(","path":")" << escape_json_string(entry.path)
         << R"(","client_ip":")" << escape_json_string(entry.client_ip)
         << R"(","status":)" << entry.status
         << R"(,"timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << '}';
    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_block
// ---------------------------------------------------------------------------
void StructuredLogger::log_block(const BlockLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kWarn) {
        return;
    }
    std::ostringstream json;
    json << R"({"event":"request_blocked","request_id":)" << entry.request_id
         << R"(,"client_ip":")" << escape_json_string(entry.client_ip)
         << R"(","method":")" << escape_json_string(entry.method)
         << R"(","path":")" << escape_json_string(entry.path)
         << R"(","rule":")" << escape_json_string(entry.rule)
         << R"(","category":")" << escape_json_string(entry.category)
         << R"(","matched_pattern":")" << escape_json_string(entry.matched_pattern)
         << R"(","reason":")" << escape_json_string(entry.reason)
         << R"(","mode":")" << escape_json_string(entry.mode)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";
    logger_->warn(json.str());
}

// ---------------------------------------------------------------------------
// log_upload
// ---------------------------------------------------------------------------
void StructuredLogger::log_upload(const UploadLog& entry) {
    const bool rejected = entry.outcome != "stored";
    if (!logger_ || min_level_ > (rejected ? LogLevel::kWarn : LogLevel::kInfo)) {
        return;
    }
    std::ostringstream json;
    json << R"({"event":"upload","category":")" << escape_json_string(entry.category)
         << R"(","declared_filename":")" << escape_json_string(entry.declared_filename)
         << R"(","stored_name":")" << escape_json_string(entry.stored_name)
         << R"(","stage":")" << escape_json_string(entry.stage)
         << R"(","outcome":")" << escape_json_string(entry.outcome)
         << R"(","size":)" << entry.size
         << R"(,"encrypted":)" << (entry.encrypted ? "true" : "false")
         << R"(,"reason":")" << escape_json_string(entry.reason)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";
    if (rejected) {
        logger_->warn(json.str());
    } else {
        logger_->info(json.str());
    }
}

// ---------------------------------------------------------------------------
// log_auth
// ---------------------------------------------------------------------------
void StructuredLogger::log_auth(const AuthLog& entry) {
    const bool failed = entry.outcome == "failure";
    if (!logger_ || min_level_ > (failed ? LogLevel::kWarn : LogLevel::kInfo)) {
        return;
    }
    std::ostringstream json;
    json << R"({"event":"auth","subject_id":")" << escape_json_string(entry.subject_id)
         << R"(","factor":")" << escape_json_string(entry.factor)
         << R"(","outcome":")" << escape_json_string(entry.outcome)
         << R"(","detail":")" << escape_json_string(entry.detail)
         << R"(","client_ip":")" << escape_json_string(entry.client_ip)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";
    if (failed) {
        logger_->warn(json.str());
    } else {
        logger_->info(json.str());
    }
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}
