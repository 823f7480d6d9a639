#include "scan/heuristic_scanner.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <string_view>

#include <spdlog/spdlog.h>

namespace {

constexpr std::string_view kEicar =
    R"(X5O!P%@AP[4\PZX54(P^)7CC)7}$EICAR-STANDARD-ANTIVIRUS-TEST-FILE!$H+H*)";

struct Magic {
    std::array<std::uint8_t, 4> bytes;
    std::size_t                 size;
    const char*                 name;
};

constexpr std::array<Magic, 6> kExecutableMagic{{
    {{'M', 'Z', 0, 0},             2, "Executable file detected"},
    {{0x7F, 'E', 'L', 'F'},        4, "Linux executable detected"},
    {{0xFE, 0xED, 0xFA, 0xCE},     4, "macOS executable detected"},
    {{0xFE, 0xED, 0xFA, 0xCF},     4, "macOS executable detected"},
    {{0xCE, 0xFA, 0xED, 0xFE},     4, "macOS executable detected"},
    {{0xCF, 0xFA, 0xED, 0xFE},     4, "macOS executable detected"},
}};

}  // namespace

HeuristicScanner::HeuristicScanner(std::uint64_t max_bytes)
    : max_bytes_(max_bytes)
{}

ScanResult HeuristicScanner::inspect_header(std::span<const std::uint8_t> header) {
    for (const auto& magic : kExecutableMagic) {
        if (header.size() >= magic.size
            && std::equal(magic.bytes.begin(), magic.bytes.begin() + magic.size, header.begin())) {
            return ScanResult::unsafe(magic.name);
        }
    }
    const std::string_view text(reinterpret_cast<const char*>(header.data()), header.size());
    if (text.find(kEicar) != std::string_view::npos) {
        return ScanResult::unsafe("EICAR-Test-Signature");
    }
    return ScanResult::clean();
}

ScanResult HeuristicScanner::scan(const std::filesystem::path& path) const {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return ScanResult::unsafe("File not found");
    }
    if (size > max_bytes_) {
        spdlog::warn("heuristic_scanner: file too large ({} bytes) '{}'", size, path.filename().string());
        return ScanResult::unsafe("File too large");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return ScanResult::unsafe("Validation error");
    }
    std::array<std::uint8_t, kHeaderBytes> header{};
    in.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
    if (in.bad()) {
        return ScanResult::unsafe("Validation error");
    }
    const auto got = static_cast<std::size_t>(in.gcount());

    auto result = inspect_header(std::span<const std::uint8_t>(header.data(), got));
    if (!result.safe()) {
        spdlog::warn("heuristic_scanner: {} in '{}'", result.threat_name, path.filename().string());
    }
    return result;
}
