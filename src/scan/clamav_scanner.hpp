#pragma once

// ---------------------------------------------------------------------------
// clamav_scanner.hpp
//
// clamscan 호환 CLI 에 검사를 위임한다: "<binary> --no-summary <path>"
//
// [종료 코드 매핑]
//   0        → kSafe
//   1        → kUnsafe(위협 이름)   출력 "<path>: <name> FOUND" 에서 추출
//   그 외    → kUnsafe("Scan error")
//   타임아웃 → kUnsafe("Scan timeout")
// ---------------------------------------------------------------------------

#include <string_view>

#include "scan/scan_engine.hpp"

class ClamAvScanner : public ScanEngine {
public:
    explicit ClamAvScanner(ScanSection config);

    [[nodiscard]] ScanResult scan(const std::filesystem::path& path) const override;
    [[nodiscard]] ScanMode mode() const noexcept override { return ScanMode::kDelegated; }

private:
    ScanSection config_;
};

// parse_threat_name: 스캐너 출력에서 위협 이름 추출. 없으면 "Unknown threat".
[[nodiscard]] std::string parse_threat_name(std::string_view output);
