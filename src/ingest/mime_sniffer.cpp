#include "ingest/mime_sniffer.hpp"

#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <vector>

namespace {

[[nodiscard]] bool starts_with(std::span<const std::uint8_t> data,
                               std::initializer_list<std::uint8_t> magic) noexcept {
    return data.size() >= magic.size() && std::equal(magic.begin(), magic.end(), data.begin());
}

[[nodiscard]] std::uint32_t read_le(std::span<const std::uint8_t> data, std::size_t offset, std::size_t width) noexcept {
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        value |= static_cast<std::uint32_t>(data[offset + i]) << (8 * i);
    }
    return value;
}

// ---------------------------------------------------------------------------
// has_word_entry
//   ZIP local file header 를 따라가며 이름이 "word/" 로 시작하는 항목을 찾는다.
//
//   local header (30 bytes)
//     0  signature  PK\x03\x04
//     6  flags      (bit 3 = data descriptor, 이 경우 크기 필드가 0)
//     18 compressed size
//     26 name length
//     28 extra length
//
//   크기를 모르는 항목(bit 3)을 만나면 다음 시그니처를 선형 탐색한다.
// ---------------------------------------------------------------------------
[[nodiscard]] bool has_word_entry(std::span<const std::uint8_t> data) {
    constexpr std::size_t     kHeaderSize = 30;
    constexpr std::string_view kWordPrefix = "word/";
    constexpr std::uint8_t    kSig[]       = {'P', 'K', 0x03, 0x04};

    auto find_sig = [&](std::size_t from) -> std::size_t {
        const auto it = std::search(data.begin() + static_cast<std::ptrdiff_t>(from), data.end(),
                                    std::begin(kSig), std::end(kSig));
        return static_cast<std::size_t>(it - data.begin());
    };

    std::size_t pos = 0;
    while (pos + kHeaderSize <= data.size()) {
        if (!std::equal(std::begin(kSig), std::end(kSig), data.begin() + static_cast<std::ptrdiff_t>(pos))) {
            pos = find_sig(pos + 1);
            continue;
        }
        const std::uint32_t flags     = read_le(data, pos + 6, 2);
        const std::uint32_t comp_size = read_le(data, pos + 18, 4);
        const std::uint32_t name_len  = read_le(data, pos + 26, 2);
        const std::uint32_t extra_len = read_le(data, pos + 28, 2);

        const std::size_t name_begin = pos + kHeaderSize;
        if (name_begin + name_len > data.size()) {
            return false;
        }
        const std::string_view name(reinterpret_cast<const char*>(data.data() + name_begin), name_len);
        if (name.starts_with(kWordPrefix)) {
            return true;
        }

        if ((flags & 0x08u) != 0 || comp_size == 0) {
            pos = find_sig(name_begin + name_len);
        } else {
            pos = name_begin + name_len + extra_len + comp_size;
        }
    }
    return false;
}

}  // namespace

std::optional<std::string> MimeSniffer::detect_bytes(std::span<const std::uint8_t> head) {
    if (starts_with(head, {'%', 'P', 'D', 'F', '-'})) {
        return std::string(mime::kPdf);
    }
    if (starts_with(head, {'P', 'K', 0x03, 0x04})) {
        return std::string(has_word_entry(head) ? mime::kDocx : mime::kZip);
    }
    if (starts_with(head, {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A})) {
        return std::string(mime::kPng);
    }
    if (starts_with(head, {0xFF, 0xD8, 0xFF})) {
        return std::string(mime::kJpeg);
    }
    if (starts_with(head, {'G', 'I', 'F', '8', '7', 'a'}) || starts_with(head, {'G', 'I', 'F', '8', '9', 'a'})) {
        return std::string(mime::kGif);
    }
    if (starts_with(head, {0x7F, 'E', 'L', 'F'})) {
        return std::string(mime::kElf);
    }
    if (starts_with(head, {'M', 'Z'})) {
        return std::string(mime::kPe);
    }
    return std::nullopt;
}

std::optional<std::string> MimeSniffer::detect(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::vector<std::uint8_t> head(kSniffBytes);
    in.read(reinterpret_cast<char*>(head.data()), static_cast<std::streamsize>(head.size()));
    if (in.bad()) {
        return std::nullopt;
    }
    head.resize(static_cast<std::size_t>(in.gcount()));
    return detect_bytes(head);
}

std::string_view MimeSniffer::extension_for(std::string_view mime_type) noexcept {
    if (mime_type == mime::kPdf) {
        return ".pdf";
    }
    if (mime_type == mime::kDocx) {
        return ".docx";
    }
    return {};
}
