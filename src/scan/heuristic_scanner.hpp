#pragma once

// ---------------------------------------------------------------------------
// heuristic_scanner.hpp
//
// 외부 스캐너가 없을 때의 fallback. 첫 1 KiB 만 본다.
//
// 거부 조건:
//   - 크기 > max_bytes (기본 100 MiB)
//   - "MZ" (Windows PE), "\x7FELF", Mach-O (FEEDFACE / FEEDFACF, 양쪽 엔디언)
//   - EICAR 테스트 시그니처
//
// [알려진 한계]
// 문서 내부 매크로, 압축 안의 실행 파일, 난독화된 스크립트는 탐지하지 못한다.
// 전체 검사와 동등하게 취급하지 말 것.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <span>

#include "scan/scan_engine.hpp"

class HeuristicScanner : public ScanEngine {
public:
    static constexpr std::size_t kHeaderBytes = 1024;

    explicit HeuristicScanner(std::uint64_t max_bytes);

    [[nodiscard]] ScanResult scan(const std::filesystem::path& path) const override;
    [[nodiscard]] ScanMode mode() const noexcept override { return ScanMode::kHeuristic; }

    // inspect_header: 헤더 바이트만으로 판정 (크기 검사 제외)
    [[nodiscard]] static ScanResult inspect_header(std::span<const std::uint8_t> header);

private:
    std::uint64_t max_bytes_;
};
