#pragma once

// ---------------------------------------------------------------------------
// backup_codes.hpp
//
// 일회용 백업 코드 집합. 하나의 JSON blob 으로 직렬화되어 통째로 암호화된다.
//
//   {"codes": ["1A2B-3C4D-5E6F", ...], "used": [...], "generated_at": "..."}
//
// [불변식]
// - used 는 추가만 된다. used 에 있는 코드는 다시 검증을 통과하지 못한다.
// - codes 에 없는 코드는 used 에 들어가지 않는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"

struct BackupCodeSet {
    std::vector<std::string> codes{};
    std::vector<std::string> used{};
    std::string              generated_at{};

    [[nodiscard]] bool        is_available(std::string_view code) const;
    [[nodiscard]] std::size_t remaining() const;

    // consume: 사용 가능하면 used 에 추가하고 true
    [[nodiscard]] bool consume(std::string_view code);

    // generate: XXXX-XXXX-XXXX (대문자 hex) count 개
    [[nodiscard]] static std::expected<BackupCodeSet, GateError> generate(std::uint32_t count);

    // JSON 호환 flow 스타일 (yaml-cpp Emitter)
    [[nodiscard]] std::string to_json() const;
    [[nodiscard]] static std::expected<BackupCodeSet, GateError> from_json(std::string_view json);
};

// normalize_backup_code: 앞뒤 공백 제거 + 대문자
[[nodiscard]] std::string normalize_backup_code(std::string_view code);
