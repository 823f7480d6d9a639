#pragma once

// ---------------------------------------------------------------------------
// scan_engine.hpp
//
// 업로드 파일 악성코드 검사 인터페이스.
//
// 두 가지 전략 중 하나가 시작 시 선택된다:
//   kDelegated : 외부 시그니처 스캐너(clamscan) 호출 (ClamAvScanner)
//   kHeuristic : 스캐너를 찾지 못했을 때의 매직 바이트 휴리스틱 (HeuristicScanner)
//
// [보안 원칙]
// - 스캔 오류/타임아웃은 항상 kUnsafe. 통과로 취급하지 않는다.
// - 휴리스틱 모드는 전체 검사보다 약하다. mode() 로 노출되어
//   health / posture 응답과 시작 경고 로그에 반드시 표시된다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "config/gate_config.hpp"

enum class ScanMode : std::uint8_t {
    kDelegated = 0,
    kHeuristic = 1,
};

enum class ScanVerdict : std::uint8_t {
    kSafe   = 0,
    kUnsafe = 1,
};

[[nodiscard]] std::string_view scan_mode_name(ScanMode mode) noexcept;

// ---------------------------------------------------------------------------
// ScanResult
//   threat_name: kUnsafe 일 때 위협 이름 또는 실패 사유 (감사 로그용)
// ---------------------------------------------------------------------------
struct ScanResult {
    ScanVerdict verdict{ScanVerdict::kUnsafe};
    std::string threat_name{};

    [[nodiscard]] bool safe() const noexcept { return verdict == ScanVerdict::kSafe; }

    [[nodiscard]] static ScanResult clean() { return ScanResult{ScanVerdict::kSafe, ""}; }
    [[nodiscard]] static ScanResult unsafe(std::string name) {
        return ScanResult{ScanVerdict::kUnsafe, std::move(name)};
    }
};

class ScanEngine {
public:
    virtual ~ScanEngine() = default;

    // scan: 블로킹 호출. 최대 scan_timeout_sec 동안 대기할 수 있다.
    [[nodiscard]] virtual ScanResult scan(const std::filesystem::path& path) const = 0;
    [[nodiscard]] virtual ScanMode mode() const noexcept = 0;
};

// detect_scanner: "<binary> --version" 이 detect_timeout_sec 안에 0 으로 끝나면 true
[[nodiscard]] bool detect_scanner(const ScanSection& config);

// make_scan_engine: 감지 결과에 따라 ClamAvScanner 또는 HeuristicScanner 생성
[[nodiscard]] std::unique_ptr<ScanEngine> make_scan_engine(const ScanSection& config);
