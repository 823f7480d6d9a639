#include "auth/backup_codes.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "crypto/random.hpp"
#include "logger/structured_logger.hpp"

namespace {

constexpr std::size_t kGroups       = 3;
constexpr std::size_t kGroupBytes   = 2;

[[nodiscard]] bool contains(const std::vector<std::string>& list, std::string_view value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

[[nodiscard]] std::unexpected<GateError> malformed(std::string detail) {
    return std::unexpected(GateError{GateErrorCode::kCryptoFailure, "Internal error",
                                     "backup code blob: " + std::move(detail)});
}

}  // namespace

std::string normalize_backup_code(std::string_view code) {
    std::string out(trim(code));
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool BackupCodeSet::is_available(std::string_view code) const {
    return contains(codes, code) && !contains(used, code);
}

std::size_t BackupCodeSet::remaining() const {
    return static_cast<std::size_t>(std::count_if(codes.begin(), codes.end(),
        [this](const std::string& c) { return !contains(used, c); }));
}

bool BackupCodeSet::consume(std::string_view code) {
    if (!is_available(code)) {
        return false;
    }
    used.emplace_back(code);
    return true;
}

std::expected<BackupCodeSet, GateError> BackupCodeSet::generate(std::uint32_t count) {
    BackupCodeSet set;
    set.codes.reserve(count);
    while (set.codes.size() < count) {
        auto raw = random_bytes(kGroups * kGroupBytes);
        if (!raw) {
            return std::unexpected(raw.error());
        }
        const std::string hex = normalize_backup_code(hex_encode(*raw));
        std::string code;
        for (std::size_t g = 0; g < kGroups; ++g) {
            if (g > 0) {
                code += '-';
            }
            code += hex.substr(g * kGroupBytes * 2, kGroupBytes * 2);
        }
        // 드문 중복은 다시 뽑는다
        if (!contains(set.codes, code)) {
            set.codes.push_back(std::move(code));
        }
    }
    set.generated_at = format_iso8601(std::chrono::system_clock::now());
    return set;
}

std::string BackupCodeSet::to_json() const {
    YAML::Emitter out;
    out.SetStringFormat(YAML::DoubleQuoted);
    out << YAML::Flow << YAML::BeginMap;

    out << YAML::Key << "codes" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (const auto& c : codes) {
        out << c;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "used" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (const auto& c : used) {
        out << c;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "generated_at" << YAML::Value << generated_at;
    out << YAML::EndMap;
    return out.c_str();
}

// ---------------------------------------------------------------------------
// from_json
//   JSON 은 YAML 의 부분집합이므로 yaml-cpp 로 읽는다.
//   복호화는 통과했는데 구조가 깨져 있으면 키 오용/손상으로 보고 kCryptoFailure.
// ---------------------------------------------------------------------------
std::expected<BackupCodeSet, GateError> BackupCodeSet::from_json(std::string_view json) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(json));
    } catch (const YAML::Exception& e) {
        return malformed(e.what());
    }
    if (!root.IsMap() || !root["codes"] || !root["codes"].IsSequence()) {
        return malformed("missing 'codes' list");
    }

    BackupCodeSet set;
    try {
        for (const auto& node : root["codes"]) {
            set.codes.push_back(node.as<std::string>());
        }
        if (const auto used = root["used"]) {
            if (!used.IsSequence()) {
                return malformed("'used' is not a list");
            }
            for (const auto& node : used) {
                set.used.push_back(node.as<std::string>());
            }
        }
        if (const auto generated = root["generated_at"]) {
            set.generated_at = generated.as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        return malformed(e.what());
    }
    return set;
}
