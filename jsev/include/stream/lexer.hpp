//! # Lexical Helpers
//!
//! Byte classification, JSON string unescaping and number classification used
//! by the streaming parser. These functions work on complete lexemes that the
//! parser has already buffered, so they never touch the cursor.
//!
//! ## String Escapes
//!
//! | Escape | Result |
//! |--------|--------|
//! | `\"` `\\` `\/` `\'` | the escaped byte |
//! | `\b` `\f` `\n` `\r` `\t` | the control byte |
//! | `\uXXXX` | the code point, UTF-8 encoded |
//! | `\uD83D\uDE03` | surrogate pair joined into one code point |
//! | lone surrogate | U+FFFD |
//!
//! Raw bytes below 0x20, a raw `"`, unknown escapes and malformed `\u` escapes
//! are errors. Invalid UTF-8 in the raw text is replaced by U+FFFD.

#pragma once

#include "common.hpp"
#include "stream/event.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace jsev::stream {

/// Failure detail from `decode_string` or `parse_number_lexeme`.
struct LexError {
    std::string detail;
};

/// Unicode replacement character.
constexpr uint32_t REPLACEMENT_CHARACTER = 0xFFFD;

[[nodiscard]] inline auto is_digit(int c) -> bool {
    return c >= '0' && c <= '9';
}

/// Returns `true` for the bytes that may appear in a number lexeme: `[0-9+\-.eE]`.
[[nodiscard]] inline auto is_number_byte(int c) -> bool {
    return is_digit(c) || c == '+' || c == '-' || c == '.' || c == 'e' || c == 'E';
}

/// Renders a byte for diagnostics: printable ASCII as itself, anything else as `\xNN`.
[[nodiscard]] auto describe_byte(int c) -> std::string;

/// Renders a byte run for diagnostics, quoted, each byte as by `describe_byte`.
[[nodiscard]] auto quote_bytes(std::string_view bytes) -> std::string;

/// Appends the UTF-8 encoding of `cp` to `out`.
void append_utf8(std::string& out, uint32_t cp);

/// Decodes the body of a JSON string literal (the bytes between the quotes).
///
/// # Returns
///
/// `Ok(text)` with the unescaped UTF-8 text, or `Err(detail)` describing the
/// first offending escape or byte.
[[nodiscard]] auto decode_string(std::string_view raw) -> Result<std::string, LexError>;

/// Parses a number lexeme.
///
/// The representation is chosen lexically: a lexeme containing `.`, `e` or `E`
/// is parsed as a double, anything else as a signed 64-bit integer. An integer
/// that does not fit is an error, not a float.
///
/// # Returns
///
/// `Ok(number)` or `Err(detail)`.
[[nodiscard]] auto parse_number_lexeme(std::string_view lexeme) -> Result<Number, LexError>;

} // namespace jsev::stream
