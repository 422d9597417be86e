//! # Cursor Implementation

#include "stream/cursor.hpp"

#include "log/log.hpp"

#include <cassert>

namespace jsev::stream {

Cursor::Cursor(ByteSource& source, size_t buffer_size, bool extended_whitespace)
    : source_(source), buffer_(buffer_size > 0 ? buffer_size : DEFAULT_BUFFER_SIZE),
      extended_whitespace_(extended_whitespace) {}

/// Refills the buffer from the source.
///
/// # Returns
///
/// `true` if at least one byte is available, `false` once the source is
/// exhausted or has failed.
auto Cursor::fill() -> bool {
    if (exhausted_) {
        return false;
    }

    auto result = source_.read(buffer_.data(), buffer_.size());
    if (is_err(result)) {
        io_error_ = std::move(unwrap_err(result));
        exhausted_ = true;
        JSEV_LOG_DEBUG("cursor", "source failed at offset " << offset_ << ": " << *io_error_);
        return false;
    }

    size_t n = unwrap(result);
    if (n == 0) {
        exhausted_ = true;
        JSEV_LOG_TRACE("cursor", "source exhausted after " << offset_ << " bytes");
        return false;
    }

    begin_ = 0;
    end_ = n;
    return true;
}

auto Cursor::advance() -> int {
    if (begin_ == end_ && !fill()) {
        can_push_back_ = false;
        return END_OF_INPUT;
    }

    auto c = static_cast<unsigned char>(buffer_[begin_++]);
    ++offset_;
    can_push_back_ = true;

    ++position_;
    if (c == '\n') {
        previous_line_position_ = position_ - 1;
        ++line_;
        position_ = 0;
        crossed_newline_ = true;
    } else {
        crossed_newline_ = false;
    }

    return c;
}

void Cursor::push_back() {
    assert(can_push_back_ && "push_back() needs a preceding successful advance()");
    if (!can_push_back_) {
        return;
    }

    // fill() only runs when the buffer is drained, so the byte is still there.
    --begin_;
    --offset_;
    can_push_back_ = false;

    if (crossed_newline_) {
        --line_;
        position_ = previous_line_position_;
        crossed_newline_ = false;
    } else {
        --position_;
    }
}

auto Cursor::skip_whitespace() -> int {
    int c = advance();
    while (c != END_OF_INPUT && is_space(c, extended_whitespace_)) {
        c = advance();
    }
    return c;
}

void Cursor::reset_coordinates() {
    line_ = 1;
    position_ = 0;
    crossed_newline_ = false;
}

} // namespace jsev::stream
