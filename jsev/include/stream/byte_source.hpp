//! # Byte Sources
//!
//! The parser reads from any `ByteSource`: an in-memory buffer, a
//! `std::istream`, a file or standard input. Sources may be unbounded and
//! need not be seekable; the parser only ever reads forward.
//!
//! ## Contract
//!
//! `read()` fills up to `capacity` bytes and returns how many were written.
//! Returning `0` means the source is exhausted. A read failure is reported as
//! an error string and is terminal.

#pragma once

#include "common.hpp"

#include <cstddef>
#include <cstdio>
#include <iosfwd>
#include <string>
#include <string_view>

namespace jsev::stream {

/// Abstract forward-only byte producer.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Reads up to `capacity` bytes into `buffer`.
    ///
    /// # Returns
    ///
    /// `Ok(n)` with `n > 0` bytes read, `Ok(0)` at end of input, or
    /// `Err(message)` if the underlying device failed.
    virtual auto read(char* buffer, size_t capacity) -> Result<size_t, std::string> = 0;
};

/// A source over an owned in-memory string.
class StringSource : public ByteSource {
public:
    explicit StringSource(std::string data) : data_(std::move(data)) {}
    explicit StringSource(std::string_view data) : data_(data) {}
    explicit StringSource(const char* data) : data_(data) {}

    auto read(char* buffer, size_t capacity) -> Result<size_t, std::string> override;

private:
    std::string data_;
    size_t pos_ = 0;
};

/// A source over a caller-owned `std::istream`.
class IstreamSource : public ByteSource {
public:
    explicit IstreamSource(std::istream& stream) : stream_(stream) {}

    auto read(char* buffer, size_t capacity) -> Result<size_t, std::string> override;

private:
    std::istream& stream_;
};

/// A source over a C `FILE*`, owned unless it is standard input.
class FileSource : public ByteSource {
public:
    ~FileSource() override;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    /// Opens `path` for binary reading.
    ///
    /// # Returns
    ///
    /// The source, or an error message naming the path and the OS error.
    static auto open(const std::string& path) -> Result<Box<FileSource>, std::string>;

    /// Wraps the process's standard input without taking ownership.
    static auto standard_input() -> Box<FileSource>;

    auto read(char* buffer, size_t capacity) -> Result<size_t, std::string> override;

private:
    FileSource(std::FILE* file, bool owned) : file_(file), owned_(owned) {}

    std::FILE* file_;
    bool owned_;
};

} // namespace jsev::stream
