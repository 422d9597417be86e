//! # Event Writer
//!
//! Streams events back out as compact JSON, one top-level document per line.
//! The writer keeps only a stack of open containers, so arbitrarily large
//! documents are re-serialized in constant memory per nesting level.
//!
//! ## Output
//!
//! | Events | Output |
//! |--------|--------|
//! | `ObjectStart`, `ObjectEnd` | `{}` |
//! | `ObjectStart`, `ObjectKey`, `String "a"`, `ObjectValue`, `Number 1.0`, `ObjectEnd` | `{"a":1.0}` |
//! | `ArrayStart`, `Boolean true`, `Null`, `ArrayEnd` | `[true,null]` |
//!
//! Numbers keep their representation: a float is always written with a `.`,
//! `e` or `E` so it parses back as a float.
//!
//! ## Example
//!
//! ```cpp
//! EventWriter writer(std::cout);
//! StreamParser parser(source);
//! parser.parse(writer);
//! ```

#pragma once

#include "common.hpp"
#include "stream/event.hpp"
#include "stream/event_sink.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace jsev::stream {

/// Failure from `events_to_json`.
struct WriteError {
    std::string message;
};

/// Escapes `text` for a JSON string literal (without the surrounding quotes).
[[nodiscard]] auto escape_string(const std::string& text) -> std::string;

class EventWriter : public EventSink {
public:
    explicit EventWriter(std::ostream& out) : out_(out) {}

    /// Writes one event.
    ///
    /// # Returns
    ///
    /// `false` if the event is out of order for the current structure (see
    /// `error()`). The writer refuses every later event.
    auto write(const Event& event) -> bool;

    auto emit(Event event) -> bool override {
        return write(event);
    }

    /// Number of complete top-level documents written.
    [[nodiscard]] auto documents() const -> size_t {
        return documents_;
    }

    /// Description of the first out-of-order event, empty if none.
    [[nodiscard]] auto error() const -> const std::string& {
        return error_;
    }

private:
    enum class FrameKind : uint8_t { Object, Array };

    /// Position inside an object member.
    enum class MemberState : uint8_t {
        ExpectKey,   ///< Before `ObjectKey` or `ObjectEnd`
        ExpectName,  ///< After `ObjectKey`, before the key's `String`
        ExpectColon, ///< After the key, before `ObjectValue`
        ExpectValue  ///< After `ObjectValue`, before the value
    };

    struct Frame {
        FrameKind kind;
        MemberState state = MemberState::ExpectKey;
        size_t count = 0;
    };

    /// Emits the separator a value needs at the current position.
    ///
    /// Top-level values must be containers.
    auto begin_value(const Event& event, bool container) -> bool;

    /// Closes the innermost container.
    auto end_container(const Event& event, FrameKind kind, char close) -> bool;

    auto reject(const Event& event) -> bool;

    std::ostream& out_;
    std::vector<Frame> stack_;
    size_t documents_ = 0;
    std::string error_;
};

/// Serializes a complete event sequence to compact JSON.
///
/// # Returns
///
/// `Ok(json)`, or `Err(error)` if the sequence is not well formed or ends
/// with a parse error.
[[nodiscard]] auto events_to_json(const std::vector<Event>& events)
    -> Result<std::string, WriteError>;

} // namespace jsev::stream
