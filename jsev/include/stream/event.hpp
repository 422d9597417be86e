//! # Events
//!
//! The unit of output of the streaming parser. A parse produces a totally
//! ordered sequence of events terminated by exactly one `EndOfStream`.
//!
//! ## Event Types
//!
//! | Type | Payload | Emitted |
//! |------|---------|---------|
//! | `ObjectStart` | - | on `{` |
//! | `ObjectKey` | - | before the key's `String` event |
//! | `ObjectValue` | - | before the member value's first event |
//! | `ObjectEnd` | - | on `}` |
//! | `ArrayStart` | - | on `[` |
//! | `ArrayEnd` | - | on `]` |
//! | `String` | `std::string` | decoded UTF-8 text |
//! | `Number` | `Number` | integer or float, decided lexically |
//! | `Boolean` | `bool` | `true` / `false` |
//! | `Null` | - | `null` |
//! | `EndOfStream` | `ParseError` if failed | once, last |
//!
//! ## Example
//!
//! ```text
//! input:  {"foo": "bar"}
//! events: ObjectStart, ObjectKey, String("foo"), ObjectValue, String("bar"), ObjectEnd,
//!         EndOfStream
//! ```

#pragma once

#include "stream/parse_error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace jsev::stream {

/// Kind of an `Event`.
enum class EventType : uint8_t {
    Unknown,
    ObjectStart,
    ObjectKey,
    ObjectValue,
    ObjectEnd,
    ArrayStart,
    ArrayEnd,
    String,
    Number,
    Boolean,
    Null,
    EndOfStream
};

/// Returns the name of an event type (e.g. "ObjectStart").
auto event_type_name(EventType type) -> const char*;

/// A JSON number in the representation its lexeme selected.
///
/// A lexeme containing `.`, `e` or `E` is a float, anything else an integer.
/// `10` and `10.0` are different values of this type even though they are
/// numerically equal.
struct Number {
    enum class Kind : uint8_t {
        Integer, ///< `i64` is active
        Float    ///< `f64` is active
    };

    Kind kind;

    union {
        int64_t i64;
        double f64;
    };

    explicit Number(int64_t value) : kind(Kind::Integer), i64(value) {}
    explicit Number(double value) : kind(Kind::Float), f64(value) {}
    Number() : kind(Kind::Integer), i64(0) {}

    [[nodiscard]] auto is_integer() const -> bool {
        return kind == Kind::Integer;
    }
    [[nodiscard]] auto is_float() const -> bool {
        return kind == Kind::Float;
    }

    /// Integer value; floats are truncated.
    [[nodiscard]] auto as_i64() const -> int64_t {
        return is_integer() ? i64 : static_cast<int64_t>(f64);
    }

    /// Floating-point value; integers are converted.
    [[nodiscard]] auto as_f64() const -> double {
        return is_float() ? f64 : static_cast<double>(i64);
    }

    /// Compares values regardless of representation.
    [[nodiscard]] auto numerically_equal(const Number& other) const -> bool {
        if (is_integer() && other.is_integer()) {
            return i64 == other.i64;
        }
        return as_f64() == other.as_f64();
    }

    /// Representation-sensitive equality: `Number(10) != Number(10.0)`.
    [[nodiscard]] auto operator==(const Number& other) const -> bool {
        if (kind != other.kind) {
            return false;
        }
        return is_integer() ? i64 == other.i64 : f64 == other.f64;
    }

    /// Formats the number: integers plainly, floats in shortest round-trip form
    /// with a guaranteed `.`, `e` or `E` so the representation survives re-parsing.
    [[nodiscard]] auto to_string() const -> std::string;
};

/// One structural or scalar parse event.
struct Event {
    using Value = std::variant<std::monostate, std::string, Number, bool>;

    EventType type = EventType::Unknown;
    Value value;
    std::optional<ParseError> error;

    // ========================================================================
    // Factories
    // ========================================================================

    static auto object_start() -> Event {
        return Event{EventType::ObjectStart, {}, std::nullopt};
    }
    static auto object_key() -> Event {
        return Event{EventType::ObjectKey, {}, std::nullopt};
    }
    static auto object_value() -> Event {
        return Event{EventType::ObjectValue, {}, std::nullopt};
    }
    static auto object_end() -> Event {
        return Event{EventType::ObjectEnd, {}, std::nullopt};
    }
    static auto array_start() -> Event {
        return Event{EventType::ArrayStart, {}, std::nullopt};
    }
    static auto array_end() -> Event {
        return Event{EventType::ArrayEnd, {}, std::nullopt};
    }
    static auto string(std::string text) -> Event {
        return Event{EventType::String, std::move(text), std::nullopt};
    }
    static auto number(Number n) -> Event {
        return Event{EventType::Number, n, std::nullopt};
    }
    static auto boolean(bool b) -> Event {
        return Event{EventType::Boolean, b, std::nullopt};
    }
    static auto null() -> Event {
        return Event{EventType::Null, {}, std::nullopt};
    }
    static auto end_of_stream(std::optional<ParseError> error = std::nullopt) -> Event {
        return Event{EventType::EndOfStream, {}, std::move(error)};
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    /// Text of a `String` event.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` for any other event type.
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(value);
    }
    [[nodiscard]] auto as_number() const -> const Number& {
        return std::get<Number>(value);
    }
    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(value);
    }

    /// Returns `true` for the terminal `EndOfStream` event.
    [[nodiscard]] auto is_end() const -> bool {
        return type == EventType::EndOfStream;
    }

    /// Returns `true` for an `EndOfStream` event carrying an error.
    [[nodiscard]] auto is_error() const -> bool {
        return is_end() && error.has_value();
    }

    /// Human-readable form, e.g. `ObjectStart`, `String "foo"`, `Number 10.0`.
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const Event& other) const -> bool = default;
};

} // namespace jsev::stream
