//! # Event Writer Implementation
//!
//! ## Member States
//!
//! ```text
//! ExpectKey --ObjectKey--> ExpectName --String--> ExpectColon
//!     ^                                               |
//!     +---- value <-- ExpectValue <--ObjectValue------+
//! ```

#include "stream/event_writer.hpp"

#include "log/log.hpp"

#include <iomanip>
#include <sstream>

namespace jsev::stream {

auto escape_string(const std::string& text) -> std::string {
    std::string result;
    result.reserve(text.size() + 2);

    for (char c : text) {
        switch (c) {
        case '"':
            result += "\\\"";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '\b':
            result += "\\b";
            break;
        case '\f':
            result += "\\f";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                std::ostringstream oss;
                oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                    << static_cast<int>(static_cast<unsigned char>(c));
                result += oss.str();
            } else {
                result += c;
            }
            break;
        }
    }

    return result;
}

// ============================================================================
// EventWriter
// ============================================================================

auto EventWriter::write(const Event& event) -> bool {
    if (!error_.empty()) {
        return false;
    }

    switch (event.type) {
    case EventType::ObjectStart:
        if (!begin_value(event, true)) {
            return false;
        }
        stack_.push_back(Frame{FrameKind::Object});
        out_ << '{';
        return true;

    case EventType::ArrayStart:
        if (!begin_value(event, true)) {
            return false;
        }
        stack_.push_back(Frame{FrameKind::Array});
        out_ << '[';
        return true;

    case EventType::ObjectEnd:
        return end_container(event, FrameKind::Object, '}');

    case EventType::ArrayEnd:
        return end_container(event, FrameKind::Array, ']');

    case EventType::ObjectKey: {
        if (stack_.empty() || stack_.back().kind != FrameKind::Object ||
            stack_.back().state != MemberState::ExpectKey) {
            return reject(event);
        }
        Frame& frame = stack_.back();
        if (frame.count > 0) {
            out_ << ',';
        }
        frame.state = MemberState::ExpectName;
        return true;
    }

    case EventType::ObjectValue:
        if (stack_.empty() || stack_.back().state != MemberState::ExpectColon) {
            return reject(event);
        }
        stack_.back().state = MemberState::ExpectValue;
        out_ << ':';
        return true;

    case EventType::String:
        if (!stack_.empty() && stack_.back().state == MemberState::ExpectName) {
            stack_.back().state = MemberState::ExpectColon;
        } else if (!begin_value(event, false)) {
            return false;
        }
        out_ << '"' << escape_string(event.as_string()) << '"';
        return true;

    case EventType::Number:
        if (!begin_value(event, false)) {
            return false;
        }
        out_ << event.as_number().to_string();
        return true;

    case EventType::Boolean:
        if (!begin_value(event, false)) {
            return false;
        }
        out_ << (event.as_bool() ? "true" : "false");
        return true;

    case EventType::Null:
        if (!begin_value(event, false)) {
            return false;
        }
        out_ << "null";
        return true;

    case EventType::EndOfStream:
        if (!event.error && !stack_.empty()) {
            return reject(event);
        }
        return true;

    case EventType::Unknown:
        break;
    }

    return reject(event);
}

auto EventWriter::begin_value(const Event& event, bool container) -> bool {
    if (stack_.empty()) {
        return container ? true : reject(event);
    }

    Frame& frame = stack_.back();
    if (frame.kind == FrameKind::Object) {
        if (frame.state != MemberState::ExpectValue) {
            return reject(event);
        }
        frame.state = MemberState::ExpectKey;
    } else if (frame.count > 0) {
        out_ << ',';
    }
    ++frame.count;
    return true;
}

auto EventWriter::end_container(const Event& event, FrameKind kind, char close) -> bool {
    if (stack_.empty() || stack_.back().kind != kind ||
        stack_.back().state != MemberState::ExpectKey) {
        return reject(event);
    }

    stack_.pop_back();
    out_ << close;
    if (stack_.empty()) {
        out_ << '\n';
        ++documents_;
    }
    return true;
}

auto EventWriter::reject(const Event& event) -> bool {
    error_ = "unexpected " + event.to_string() + " after " + std::to_string(documents_) +
             " documents at nesting depth " + std::to_string(stack_.size());
    JSEV_LOG_DEBUG("writer", error_);
    return false;
}

// ============================================================================
// Convenience Functions
// ============================================================================

auto events_to_json(const std::vector<Event>& events) -> Result<std::string, WriteError> {
    std::ostringstream out;
    EventWriter writer(out);

    for (const auto& event : events) {
        if (event.is_error()) {
            return WriteError{event.error->to_string()};
        }
        if (!writer.write(event)) {
            return WriteError{writer.error()};
        }
    }
    return out.str();
}

} // namespace jsev::stream
