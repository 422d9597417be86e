//! # Parse Errors
//!
//! The single error type surfaced by the streaming parser. Every failure is
//! terminal for the parse and reaches the consumer attached to the final
//! `EndOfStream` event.
//!
//! ## Example
//!
//! ```cpp
//! auto error = ParseError::make(ParseErrorKind::Structural, "expected : but got x", 3, 14);
//! std::cerr << error.to_string() << std::endl;
//! // Output: "ParseError: l:3 pos:14 msg:expected : but got x"
//! ```

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace jsev::stream {

/// Category of a parse failure.
enum class ParseErrorKind : uint8_t {
    Structural,           ///< A grammar expectation was violated
    UnexpectedEndOfInput, ///< The source ran out inside a value
    EscapeDecode,         ///< A string could not be decoded
    NumericFormat,        ///< A number lexeme did not parse under its representation
    Io,                   ///< The byte source reported a read failure
    Cancelled             ///< The consumer went away or the deadline passed
};

/// Returns the name of an error kind (e.g. "Structural").
auto error_kind_name(ParseErrorKind kind) -> const char*;

/// A location-tagged parse failure.
///
/// # Fields
///
/// - `kind`: taxonomy bucket, see `ParseErrorKind`
/// - `message`: short English diagnostic
/// - `line`: 1-based line of the last consumed byte
/// - `position`: 0-based column of the last consumed byte within its line
/// - `offset`: number of bytes consumed from the start of the stream
/// - `cause`: underlying detail (I/O error text, decoder diagnostic), may be empty
struct ParseError {
    ParseErrorKind kind = ParseErrorKind::Structural;
    std::string message;
    size_t line = 1;
    size_t position = 0;
    size_t offset = 0;
    std::string cause;

    /// Creates an error at the given coordinates.
    static auto make(ParseErrorKind kind, std::string msg, size_t line, size_t position,
                     size_t offset = 0, std::string cause = {}) -> ParseError {
        return ParseError{kind, std::move(msg), line, position, offset, std::move(cause)};
    }

    /// Formats the error as `ParseError: l:<line> pos:<position> msg:<message>`,
    /// followed by `: <cause>` when a cause is recorded.
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const ParseError& other) const -> bool = default;
};

} // namespace jsev::stream
