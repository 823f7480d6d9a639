#pragma once

// ---------------------------------------------------------------------------
// mime_sniffer.hpp
//
// 매직 바이트 기반 파일 타입 판별. 선언된 확장자는 보지 않는다.
//
// [판별 대상]
//   %PDF-            → application/pdf
//   PK\x03\x04       → word/ 항목이 있으면 DOCX, 아니면 application/zip
//   PNG / JPEG / GIF → 이미지
//   \x7FELF          → application/x-executable
//   MZ               → application/x-msdownload
//
// [알려진 한계]
// - DOCX 판별은 앞 256 KiB 안의 ZIP local file header 만 본다.
//   word/ 항목이 그 뒤에만 있는 비정상 DOCX 는 application/zip 으로 판별된다 (오탐 → 거부).
// - 폴리글랏 파일(PDF 헤더 + 뒤에 다른 포맷)은 헤더 기준으로만 판별한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace mime {
inline constexpr std::string_view kPdf  = "application/pdf";
inline constexpr std::string_view kDocx =
    "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
inline constexpr std::string_view kZip  = "application/zip";
inline constexpr std::string_view kPng  = "image/png";
inline constexpr std::string_view kJpeg = "image/jpeg";
inline constexpr std::string_view kGif  = "image/gif";
inline constexpr std::string_view kElf  = "application/x-executable";
inline constexpr std::string_view kPe   = "application/x-msdownload";
}  // namespace mime

class MimeSniffer {
public:
    static constexpr std::size_t kSniffBytes = 256 * 1024;

    // detect: 파일 앞 kSniffBytes 를 읽어 판별. 판별 불가 / 읽기 실패 시 nullopt.
    [[nodiscard]] static std::optional<std::string> detect(const std::filesystem::path& path);

    [[nodiscard]] static std::optional<std::string> detect_bytes(std::span<const std::uint8_t> head);

    // extension_for: 허용 가능한 문서 MIME → 기대 확장자. 그 외는 빈 문자열.
    [[nodiscard]] static std::string_view extension_for(std::string_view mime_type) noexcept;
};
