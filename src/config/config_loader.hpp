#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일 + 환경변수를 GateConfig 로 합성하는 로더.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message). 부분 파싱 결과를 반환하지 않는다.
// - 환경변수는 YAML 보다 우선한다 (apply_env).
// - 비밀값은 환경변수에서만 읽는다. YAML 에 secrets 섹션이 있어도 무시하고 경고.
// - 파싱 실패 원인은 로깅하되, 파일 전체를 로그에 출력하지 말 것.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "gate_config.hpp"

class ConfigLoader {
public:
    // EnvLookup
    //   환경변수 조회 함수. 테스트에서 getenv 대신 주입한다.
    //   값이 없으면 nullptr 반환.
    using EnvLookup = std::function<const char*(const char*)>;

    // load
    //   지정된 경로의 YAML 파일을 읽어 GateConfig 로 파싱한다.
    //   파일 없음, 파싱 오류, 타입 불일치 모두 실패로 처리한다.
    [[nodiscard]] static std::expected<GateConfig, std::string>
    load(const std::filesystem::path& config_path);

    // load_or_default
    //   파일이 존재하지 않으면 기본값 GateConfig 를 반환한다 (경고 로그).
    //   파일이 존재하지만 깨져 있으면 실패.
    [[nodiscard]] static std::expected<GateConfig, std::string>
    load_or_default(const std::filesystem::path& config_path);

    // apply_env
    //   환경변수 오버라이드를 적용한다.
    //   lookup 이 비어 있으면 std::getenv 사용.
    static void apply_env(GateConfig& config, const EnvLookup& lookup = {});

    // validate
    //   비밀값 누락, 0 크기 한도, 잘못된 키 길이를 검사한다.
    [[nodiscard]] static std::expected<void, std::string>
    validate(const GateConfig& config);
};

// split_csv
//   "a, b,,c" → {"a","b","c"} (빈 항목/공백 제거). ADMIN_ALLOWED_IPS 파싱용.
[[nodiscard]] std::vector<std::string> split_csv(std::string_view csv);
