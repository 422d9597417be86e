//! # Cursor
//!
//! Buffered byte cursor over a `ByteSource` with line/position bookkeeping
//! and one byte of push-back.
//!
//! ## Coordinates
//!
//! `(line, position)` always names the last byte consumed: `line` is 1-based,
//! `position` is the 0-based column, reset to 0 by a newline. Before any byte is
//! consumed the cursor reports `(1, 0)`.
//!
//! | Input consumed | line | position |
//! |----------------|------|----------|
//! | (nothing)      | 1    | 0        |
//! | `{`            | 1    | 1        |
//! | `{\n`          | 2    | 0        |
//! | `{\n"`         | 2    | 1        |
//!
//! Pushing back the newline in the third row restores `(1, 1)`, which is why
//! the cursor remembers the column it had before crossing a newline.

#pragma once

#include "stream/byte_source.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace jsev::stream {

/// Marker returned by `Cursor::advance()` when no more bytes are available.
constexpr int END_OF_INPUT = -1;

/// Default size of the cursor's read buffer.
constexpr size_t DEFAULT_BUFFER_SIZE = 4096;

/// Returns `true` for the JSON whitespace bytes plus VT and FF, and, when
/// `extended` is set, the Latin-1 spaces 0x85 (NEL) and 0xA0 (NBSP).
[[nodiscard]] inline auto is_space(int c, bool extended = true) -> bool {
    switch (c) {
    case ' ':
    case '\t':
    case '\n':
    case '\v':
    case '\f':
    case '\r':
        return true;
    case 0x85:
    case 0xA0:
        return extended;
    default:
        return false;
    }
}

class Cursor {
public:
    /// Creates a cursor reading `source` through a buffer of `buffer_size` bytes.
    explicit Cursor(ByteSource& source, size_t buffer_size = DEFAULT_BUFFER_SIZE,
                    bool extended_whitespace = true);

    /// Consumes and returns the next byte (0-255), or `END_OF_INPUT`.
    ///
    /// Exhaustion and read failures are sticky: once `END_OF_INPUT` has been
    /// returned, every further call returns it again without touching the source.
    auto advance() -> int;

    /// Un-consumes the byte returned by the last `advance()`.
    ///
    /// Only one level is supported: the previous call must have been an
    /// `advance()` that returned a byte.
    void push_back();

    /// Consumes whitespace and returns the first other byte, or `END_OF_INPUT`.
    auto skip_whitespace() -> int;

    /// Restarts the line/position counters at `(1, 0)`. The byte offset is kept.
    void reset_coordinates();

    [[nodiscard]] auto line() const -> size_t {
        return line_;
    }
    [[nodiscard]] auto position() const -> size_t {
        return position_;
    }
    /// Bytes consumed since the start of the stream.
    [[nodiscard]] auto offset() const -> size_t {
        return offset_;
    }

    /// Returns `true` once the source has been exhausted or failed.
    [[nodiscard]] auto at_end() const -> bool {
        return exhausted_;
    }

    /// The source's error message, if it failed rather than ran out.
    [[nodiscard]] auto io_error() const -> const std::optional<std::string>& {
        return io_error_;
    }

private:
    auto fill() -> bool;

    ByteSource& source_;
    std::vector<char> buffer_;
    size_t begin_ = 0;
    size_t end_ = 0;
    bool extended_whitespace_;

    size_t line_ = 1;
    size_t position_ = 0;
    size_t offset_ = 0;

    bool crossed_newline_ = false;
    size_t previous_line_position_ = 0;
    bool can_push_back_ = false;

    bool exhausted_ = false;
    std::optional<std::string> io_error_;
};

} // namespace jsev::stream
