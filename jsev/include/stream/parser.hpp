//! # Streaming Parser
//!
//! Incremental recursive-descent JSON tokenizer. `StreamParser` pulls bytes
//! from a `ByteSource` and emits one `Event` per completed grammar element
//! into an `EventSink`, never building a tree.
//!
//! ## Grammar
//!
//! ```text
//! stream := ws (container ws)+           ; back-to-back documents
//! container := object | array
//! object := '{' ws '}' | '{' member (',' member)* '}'
//! member := ws string ws ':' value ws
//! array  := '[' ws ']' | '[' value (',' value)* ']'
//! value  := ws (string | number | boolean | null | object | array)
//! ```
//!
//! ## Events
//!
//! | Input | Events |
//! |-------|--------|
//! | `{}` | `ObjectStart`, `ObjectEnd` |
//! | `{"a": 1}` | `ObjectStart`, `ObjectKey`, `String "a"`, `ObjectValue`, `Number 1`, `ObjectEnd` |
//! | `[true, null]` | `ArrayStart`, `Boolean true`, `Null`, `ArrayEnd` |
//!
//! Every parse ends with exactly one `EndOfStream` event whose `error` is
//! empty on success. The first failure is terminal.
//!
//! ## Example
//!
//! ```cpp
//! StringSource source(R"({"foo": "bar"} {"bar": "baz"})");
//! Channel<Event> channel;
//! StreamParser parser(source);
//! std::thread worker([&] { parser.parse(channel); });
//! while (auto event = channel.receive()) {
//!     std::cout << event->to_string() << "\n";
//! }
//! worker.join();
//! ```

#pragma once

#include "common.hpp"
#include "stream/byte_source.hpp"
#include "stream/channel.hpp"
#include "stream/cursor.hpp"
#include "stream/event.hpp"
#include "stream/event_sink.hpp"
#include "stream/parse_error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsev::stream {

/// How error coordinates relate to a stream of several documents.
enum class CoordinateMode : uint8_t {
    PerDocument, ///< `(line, position)` restart at `(1, 0)` for each top-level document
    Absolute     ///< `(line, position)` count from the start of the stream
};

/// Parser configuration.
struct ParserOptions {
    CoordinateMode coordinates = CoordinateMode::PerDocument;
    bool allow_null = true;           ///< Accept `null` and emit `Null` events
    bool extended_whitespace = true;  ///< Treat 0x85 and 0xA0 as whitespace
    size_t max_depth = 0;             ///< Maximum container nesting, 0 for unlimited
    size_t buffer_size = DEFAULT_BUFFER_SIZE;
    std::optional<std::chrono::steady_clock::time_point> deadline; ///< Abort after this point
};

class StreamParser {
public:
    /// Creates a parser over a caller-owned source.
    ///
    /// # Arguments
    ///
    /// * `source` - Bytes to parse; must outlive the parser
    /// * `options` - Parser configuration
    explicit StreamParser(ByteSource& source, ParserOptions options = {});

    /// Parses the whole source, emitting every event into `sink`.
    ///
    /// The final event is always `EndOfStream`. If the sink refuses an event
    /// the parse stops with a `Cancelled` error.
    ///
    /// # Returns
    ///
    /// `true` if the stream was parsed without error.
    auto parse(EventSink& sink) -> bool;

    /// Parses the whole source into `channel`, then closes it.
    auto parse(Channel<Event>& channel) -> bool;

    /// The terminal error of the last parse, if any.
    [[nodiscard]] auto error() const -> const std::optional<ParseError>& {
        return error_;
    }

    /// Number of events accepted by the sink, including `EndOfStream`.
    [[nodiscard]] auto events_emitted() const -> size_t {
        return events_emitted_;
    }

    /// Number of complete top-level documents parsed.
    [[nodiscard]] auto documents() const -> size_t {
        return documents_;
    }

private:
    auto parse_stream() -> bool;
    auto parse_object() -> bool;
    auto parse_array() -> bool;
    auto parse_value() -> bool;
    auto parse_string() -> bool;
    auto parse_number() -> bool;
    auto parse_boolean() -> bool;
    auto parse_null() -> bool;

    /// Reads exactly `count` bytes into `scratch_`.
    auto read_literal(size_t count) -> bool;

    /// Increments the nesting depth, failing past `max_depth`.
    auto enter_container() -> bool;

    auto emit(Event event) -> bool;
    [[nodiscard]] auto deadline_passed() const -> bool;

    /// Records the terminal error at the cursor's coordinates.
    auto fail(ParseErrorKind kind, std::string message, std::string cause = {}) -> bool;

    /// Fails for an exhausted or broken source.
    auto fail_end() -> bool;

    /// Fails with `expected <what> but got <c>`.
    auto fail_expected(std::string_view what, int c) -> bool;

    ParserOptions options_;
    Cursor cursor_;
    EventSink* sink_ = nullptr;
    std::string scratch_;
    size_t depth_ = 0;
    size_t documents_ = 0;
    size_t events_emitted_ = 0;
    std::optional<ParseError> error_;
};

/// Parses `input` synchronously and collects every event, `EndOfStream` included.
///
/// # Example
///
/// ```cpp
/// auto events = parse_events(R"({"foo": 10.0})");
/// // events[4].as_number().is_float() == true
/// ```
[[nodiscard]] auto parse_events(std::string_view input, ParserOptions options = {})
    -> std::vector<Event>;

} // namespace jsev::stream
