#include "ingest/byte_source.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

StringByteSource::StringByteSource(std::string data)
    : data_(std::move(data))
{}

std::expected<std::size_t, std::string> StringByteSource::read(std::span<char> buffer) {
    const std::size_t n = std::min(buffer.size(), data_.size() - offset_);
    if (n > 0) {
        std::memcpy(buffer.data(), data_.data() + offset_, n);
        offset_ += n;
    }
    return n;
}

StreamByteSource::StreamByteSource(std::istream& in)
    : in_(in)
{}

std::expected<std::size_t, std::string> StreamByteSource::read(std::span<char> buffer) {
    if (buffer.empty() || in_.eof()) {
        return std::size_t{0};
    }
    in_.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (in_.bad()) {
        return std::unexpected(std::string("stream read failed"));
    }
    return static_cast<std::size_t>(in_.gcount());
}
