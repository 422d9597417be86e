//! # Byte Source Implementations

#include "stream/byte_source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <istream>

namespace jsev::stream {

// ============================================================================
// StringSource
// ============================================================================

auto StringSource::read(char* buffer, size_t capacity) -> Result<size_t, std::string> {
    size_t n = std::min(capacity, data_.size() - pos_);
    if (n > 0) {
        std::memcpy(buffer, data_.data() + pos_, n);
        pos_ += n;
    }
    return n;
}

// ============================================================================
// IstreamSource
// ============================================================================

auto IstreamSource::read(char* buffer, size_t capacity) -> Result<size_t, std::string> {
    if (stream_.bad()) {
        return std::string("stream is in a bad state");
    }
    if (stream_.eof()) {
        return size_t{0};
    }

    stream_.read(buffer, static_cast<std::streamsize>(capacity));
    if (stream_.bad()) {
        return std::string("stream read failed");
    }
    return static_cast<size_t>(stream_.gcount());
}

// ============================================================================
// FileSource
// ============================================================================

FileSource::~FileSource() {
    if (owned_ && file_) {
        std::fclose(file_);
    }
}

auto FileSource::open(const std::string& path) -> Result<Box<FileSource>, std::string> {
    std::FILE* file = std::fopen(path.c_str(), "rb");
    if (!file) {
        return "cannot open " + path + ": " + std::strerror(errno);
    }
    return Box<FileSource>(new FileSource(file, true));
}

auto FileSource::standard_input() -> Box<FileSource> {
    return Box<FileSource>(new FileSource(stdin, false));
}

auto FileSource::read(char* buffer, size_t capacity) -> Result<size_t, std::string> {
    size_t n = std::fread(buffer, 1, capacity, file_);
    if (n == 0 && std::ferror(file_)) {
        return std::string(std::strerror(errno));
    }
    return n;
}

} // namespace jsev::stream
