#include "scan/clamav_scanner.hpp"

#include <spdlog/spdlog.h>

#include "common/types.hpp"
#include "scan/process_runner.hpp"

std::string parse_threat_name(std::string_view output) {
    // 한 줄씩: "<path>: <name> FOUND". 경로에 ':' 가 있을 수 있으므로 마지막 ": " 기준.
    while (!output.empty()) {
        const auto nl   = output.find('\n');
        const auto line = trim(output.substr(0, nl));
        constexpr std::string_view kFound = " FOUND";
        if (line.ends_with(kFound)) {
            const auto body = line.substr(0, line.size() - kFound.size());
            const auto sep  = body.rfind(": ");
            const auto name = trim(sep == std::string_view::npos ? body : body.substr(sep + 2));
            if (!name.empty()) {
                return std::string(name);
            }
        }
        if (nl == std::string_view::npos) {
            break;
        }
        output.remove_prefix(nl + 1);
    }
    return "Unknown threat";
}

ClamAvScanner::ClamAvScanner(ScanSection config)
    : config_(std::move(config))
{}

ScanResult ClamAvScanner::scan(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return ScanResult::unsafe("File not found");
    }

    const auto result = run_process({config_.scanner_binary, "--no-summary", path.string()},
                                    std::chrono::seconds(config_.scan_timeout_sec));
    if (!result) {
        spdlog::error("clamav_scanner: cannot run '{}': {}", config_.scanner_binary, result.error());
        return ScanResult::unsafe("Scan error");
    }
    if (result->timed_out) {
        spdlog::warn("clamav_scanner: scan timeout after {}s for '{}'",
                     config_.scan_timeout_sec, path.filename().string());
        return ScanResult::unsafe("Scan timeout");
    }

    switch (result->exit_code) {
        case 0:
            spdlog::debug("clamav_scanner: clean '{}'", path.filename().string());
            return ScanResult::clean();
        case 1: {
            auto name = parse_threat_name(result->output);
            spdlog::warn("clamav_scanner: THREAT DETECTED '{}' in '{}'", name, path.filename().string());
            return ScanResult::unsafe(std::move(name));
        }
        default:
            spdlog::error("clamav_scanner: scanner exited with code {} for '{}'",
                          result->exit_code, path.filename().string());
            return ScanResult::unsafe("Scan error");
    }
}
