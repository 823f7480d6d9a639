#pragma once

// ---------------------------------------------------------------------------
// byte_source.hpp
//
// 업로드 본문을 청크 단위로 읽기 위한 추상 인터페이스.
// 파이프라인은 전체 본문을 메모리에 올리지 않고 read() 를 반복 호출한다.
//
// read 반환값
//   n > 0 : buffer 앞 n 바이트가 채워짐
//   0     : 스트림 끝
//   error : 읽기 실패 (연결 끊김 등). 파이프라인은 부분 파일을 삭제한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <istream>
#include <span>
#include <string>

class ByteSource {
public:
    virtual ~ByteSource() = default;

    [[nodiscard]] virtual std::expected<std::size_t, std::string> read(std::span<char> buffer) = 0;
};

// StringByteSource: 메모리 버퍼 (테스트, 작은 multipart 파트)
class StringByteSource final : public ByteSource {
public:
    explicit StringByteSource(std::string data);

    [[nodiscard]] std::expected<std::size_t, std::string> read(std::span<char> buffer) override;

private:
    std::string data_;
    std::size_t offset_{0};
};

// StreamByteSource: std::istream 어댑터. 스트림 수명은 호출자가 보장한다.
class StreamByteSource final : public ByteSource {
public:
    explicit StreamByteSource(std::istream& in);

    [[nodiscard]] std::expected<std::size_t, std::string> read(std::span<char> buffer) override;

private:
    std::istream& in_;
};
