//! # Event Formatting
//!
//! Names and textual forms of events, numbers and errors.

#include "stream/event.hpp"

#include <charconv>
#include <cmath>

namespace jsev::stream {

auto error_kind_name(ParseErrorKind kind) -> const char* {
    switch (kind) {
    case ParseErrorKind::Structural:
        return "Structural";
    case ParseErrorKind::UnexpectedEndOfInput:
        return "UnexpectedEndOfInput";
    case ParseErrorKind::EscapeDecode:
        return "EscapeDecode";
    case ParseErrorKind::NumericFormat:
        return "NumericFormat";
    case ParseErrorKind::Io:
        return "Io";
    case ParseErrorKind::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

auto ParseError::to_string() const -> std::string {
    std::string out = "ParseError: l:" + std::to_string(line) + " pos:" + std::to_string(position) +
                      " msg:" + message;
    if (!cause.empty()) {
        out += ": ";
        out += cause;
    }
    return out;
}

auto event_type_name(EventType type) -> const char* {
    switch (type) {
    case EventType::Unknown:
        return "Unknown";
    case EventType::ObjectStart:
        return "ObjectStart";
    case EventType::ObjectKey:
        return "ObjectKey";
    case EventType::ObjectValue:
        return "ObjectValue";
    case EventType::ObjectEnd:
        return "ObjectEnd";
    case EventType::ArrayStart:
        return "ArrayStart";
    case EventType::ArrayEnd:
        return "ArrayEnd";
    case EventType::String:
        return "String";
    case EventType::Number:
        return "Number";
    case EventType::Boolean:
        return "Boolean";
    case EventType::Null:
        return "Null";
    case EventType::EndOfStream:
        return "EndOfStream";
    }
    return "Unknown";
}

auto Number::to_string() const -> std::string {
    if (is_integer()) {
        return std::to_string(i64);
    }
    // JSON has no spelling for these
    if (std::isnan(f64) || std::isinf(f64)) {
        return "null";
    }

    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), f64);
    std::string result(buf, ec == std::errc{} ? ptr : buf);
    if (result.find_first_of(".eE") == std::string::npos) {
        result += ".0";
    }
    return result;
}

auto Event::to_string() const -> std::string {
    std::string out = event_type_name(type);
    switch (type) {
    case EventType::String:
        out += " \"";
        out += as_string();
        out += '"';
        break;
    case EventType::Number:
        out += ' ';
        out += as_number().to_string();
        break;
    case EventType::Boolean:
        out += as_bool() ? " true" : " false";
        break;
    case EventType::EndOfStream:
        if (error) {
            out += ' ';
            out += error->to_string();
        }
        break;
    default:
        break;
    }
    return out;
}

} // namespace jsev::stream
