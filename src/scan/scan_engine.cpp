#include "scan/scan_engine.hpp"

#include <spdlog/spdlog.h>

#include "scan/clamav_scanner.hpp"
#include "scan/heuristic_scanner.hpp"
#include "scan/process_runner.hpp"

std::string_view scan_mode_name(ScanMode mode) noexcept {
    switch (mode) {
        case ScanMode::kDelegated: return "delegated";
        case ScanMode::kHeuristic: return "heuristic";
    }
    return "unknown";
}

bool detect_scanner(const ScanSection& config) {
    const auto result = run_process({config.scanner_binary, "--version"},
                                    std::chrono::seconds(config.detect_timeout_sec));
    if (!result) {
        spdlog::warn("scan_engine: cannot run '{}': {}", config.scanner_binary, result.error());
        return false;
    }
    if (result->timed_out) {
        spdlog::warn("scan_engine: '{} --version' timed out after {}s",
                     config.scanner_binary, config.detect_timeout_sec);
        return false;
    }
    return result->exit_code == 0;
}

std::unique_ptr<ScanEngine> make_scan_engine(const ScanSection& config) {
    if (detect_scanner(config)) {
        spdlog::info("scan_engine: '{}' available, using delegated scanning", config.scanner_binary);
        return std::make_unique<ClamAvScanner>(config);
    }
    spdlog::warn("scan_engine: '{}' not available, falling back to HEURISTIC scanning only "
                 "(executable magic bytes, EICAR, size limit). This is not a malware scan.",
                 config.scanner_binary);
    return std::make_unique<HeuristicScanner>(config.heuristic_max_bytes);
}
