//! # Streaming Parser Implementation
//!
//! Recursive descent over the cursor. Each production consumes its own
//! leading whitespace, so callers push back the byte they dispatched on and
//! the production re-reads it.
//!
//! ## Failure Handling
//!
//! Every production returns `false` after recording the terminal error with
//! `fail()`. Callers propagate the `false` without adding errors of their
//! own, so the first failure is the one reported.
//!
//! | Condition | Kind | Message |
//! |-----------|------|---------|
//! | source exhausted mid-value | `UnexpectedEndOfInput` | `unexpected end of file` |
//! | source failed | `Io` | `read error` |
//! | wrong delimiter | `Structural` | `expected , or } but got x` |
//! | bad value start | `Structural` | `unexpected character x` |
//! | bad escape | `EscapeDecode` | `unable to decode string into a valid UTF-8 string` |
//! | bad number | `NumericFormat` | `invalid integer literal "1-"` |
//! | sink refused event | `Cancelled` | `event consumer went away` |

#include "stream/parser.hpp"

#include "log/log.hpp"
#include "stream/lexer.hpp"

namespace jsev::stream {

StreamParser::StreamParser(ByteSource& source, ParserOptions options)
    : options_(options), cursor_(source, options.buffer_size, options.extended_whitespace) {}

// ============================================================================
// Entry Points
// ============================================================================

auto StreamParser::parse(EventSink& sink) -> bool {
    sink_ = &sink;
    JSEV_LOG_DEBUG("parser", "parse started (buffer " << options_.buffer_size
                                                      << " bytes, max depth " << options_.max_depth
                                                      << ")");

    if (parse_stream()) {
        JSEV_LOG_DEBUG("parser", "parse finished: " << documents_ << " documents, "
                                                    << events_emitted_ << " events, "
                                                    << cursor_.offset() << " bytes");
    } else {
        JSEV_LOG_DEBUG("parser", "parse failed after " << documents_
                                                       << " documents: " << error_->to_string());
    }

    if (sink.emit(Event::end_of_stream(error_))) {
        ++events_emitted_;
    } else {
        JSEV_LOG_DEBUG("parser", "terminal event was not delivered");
    }

    sink_ = nullptr;
    return !error_.has_value();
}

auto StreamParser::parse(Channel<Event>& channel) -> bool {
    ChannelSink sink(channel, options_.deadline);
    bool ok = parse(sink);
    channel.close();
    return ok;
}

// ============================================================================
// Productions
// ============================================================================

auto StreamParser::parse_stream() -> bool {
    int c = cursor_.skip_whitespace();
    if (c == END_OF_INPUT) {
        return fail_end();
    }

    while (true) {
        if (c != '{' && c != '[') {
            return fail(ParseErrorKind::Structural, "unexpected character " + describe_byte(c));
        }
        cursor_.push_back();

        bool ok = c == '{' ? parse_object() : parse_array();
        if (!ok) {
            return false;
        }
        ++documents_;
        JSEV_LOG_TRACE("parser",
                       "document " << documents_ << " ends at offset " << cursor_.offset());

        // End of input after a complete document is the valid terminator.
        c = cursor_.skip_whitespace();
        if (c == END_OF_INPUT) {
            return cursor_.io_error() ? fail_end() : true;
        }

        if (options_.coordinates == CoordinateMode::PerDocument) {
            cursor_.push_back();
            cursor_.reset_coordinates();
            c = cursor_.advance();
        }
    }
}

auto StreamParser::parse_object() -> bool {
    int c = cursor_.skip_whitespace();
    if (c == END_OF_INPUT) {
        return fail_end();
    }
    if (c != '{') {
        return fail_expected("{", c);
    }
    if (!enter_container() || !emit(Event::object_start())) {
        return false;
    }

    c = cursor_.skip_whitespace();
    if (c == END_OF_INPUT) {
        return fail_end();
    }

    if (c != '}') {
        cursor_.push_back();
        while (true) {
            if (!emit(Event::object_key()) || !parse_string()) {
                return false;
            }

            c = cursor_.skip_whitespace();
            if (c == END_OF_INPUT) {
                return fail_end();
            }
            if (c != ':') {
                return fail_expected(":", c);
            }

            if (!emit(Event::object_value()) || !parse_value()) {
                return false;
            }

            c = cursor_.skip_whitespace();
            if (c == END_OF_INPUT) {
                return fail_end();
            }
            if (c == '}') {
                break;
            }
            if (c != ',') {
                return fail_expected(", or }", c);
            }
        }
    }

    --depth_;
    return emit(Event::object_end());
}

auto StreamParser::parse_array() -> bool {
    int c = cursor_.skip_whitespace();
    if (c == END_OF_INPUT) {
        return fail_end();
    }
    if (c != '[') {
        return fail_expected("[", c);
    }
    if (!enter_container() || !emit(Event::array_start())) {
        return false;
    }

    c = cursor_.skip_whitespace();
    if (c == END_OF_INPUT) {
        return fail_end();
    }

    if (c != ']') {
        cursor_.push_back();
        while (true) {
            if (!parse_value()) {
                return false;
            }

            c = cursor_.skip_whitespace();
            if (c == END_OF_INPUT) {
                return fail_end();
            }
            if (c == ']') {
                break;
            }
            if (c != ',') {
                return fail_expected(", or ]", c);
            }
        }
    }

    --depth_;
    return emit(Event::array_end());
}

auto StreamParser::parse_value() -> bool {
    int c = cursor_.skip_whitespace();
    if (c == END_OF_INPUT) {
        return fail_end();
    }

    switch (c) {
    case '"':
        cursor_.push_back();
        return parse_string();
    case 't':
    case 'f':
        cursor_.push_back();
        return parse_boolean();
    case '{':
        cursor_.push_back();
        return parse_object();
    case '[':
        cursor_.push_back();
        return parse_array();
    case 'n':
        if (!options_.allow_null) {
            break;
        }
        cursor_.push_back();
        return parse_null();
    case '+':
    case '-':
        cursor_.push_back();
        return parse_number();
    default:
        if (is_digit(c)) {
            cursor_.push_back();
            return parse_number();
        }
        break;
    }

    return fail(ParseErrorKind::Structural, "unexpected character " + describe_byte(c));
}

// ============================================================================
// Scalars
// ============================================================================

auto StreamParser::parse_string() -> bool {
    int c = cursor_.skip_whitespace();
    if (c == END_OF_INPUT) {
        return fail_end();
    }
    if (c != '"') {
        return fail_expected("\"", c);
    }

    scratch_.clear();
    while (true) {
        c = cursor_.advance();
        if (c == END_OF_INPUT) {
            return fail_end();
        }
        if (c == '"') {
            break;
        }
        scratch_.push_back(static_cast<char>(c));

        // The escaped byte is taken verbatim so that \" does not close the string.
        if (c == '\\') {
            c = cursor_.advance();
            if (c == END_OF_INPUT) {
                return fail_end();
            }
            scratch_.push_back(static_cast<char>(c));
        }
    }

    auto decoded = decode_string(scratch_);
    if (is_err(decoded)) {
        return fail(ParseErrorKind::EscapeDecode,
                    "unable to decode string into a valid UTF-8 string",
                    std::move(unwrap_err(decoded).detail));
    }
    return emit(Event::string(std::move(unwrap(decoded))));
}

auto StreamParser::parse_number() -> bool {
    scratch_.clear();
    while (true) {
        int c = cursor_.advance();
        if (c == END_OF_INPUT) {
            return fail_end();
        }
        if (!is_number_byte(c)) {
            cursor_.push_back();
            break;
        }
        scratch_.push_back(static_cast<char>(c));
    }

    auto number = parse_number_lexeme(scratch_);
    if (is_err(number)) {
        return fail(ParseErrorKind::NumericFormat, std::move(unwrap_err(number).detail));
    }
    return emit(Event::number(unwrap(number)));
}

auto StreamParser::parse_boolean() -> bool {
    if (!read_literal(4)) {
        return false;
    }
    if (scratch_ == "true") {
        return emit(Event::boolean(true));
    }
    if (scratch_ != "fals") {
        return fail(ParseErrorKind::Structural, "invalid literal " + quote_bytes(scratch_));
    }

    int c = cursor_.advance();
    if (c == END_OF_INPUT) {
        return fail_end();
    }
    if (c != 'e') {
        return fail_expected("e", c);
    }
    return emit(Event::boolean(false));
}

auto StreamParser::parse_null() -> bool {
    if (!read_literal(4)) {
        return false;
    }
    if (scratch_ != "null") {
        return fail(ParseErrorKind::Structural, "invalid literal " + quote_bytes(scratch_));
    }
    return emit(Event::null());
}

auto StreamParser::read_literal(size_t count) -> bool {
    scratch_.clear();
    for (size_t i = 0; i < count; ++i) {
        int c = cursor_.advance();
        if (c == END_OF_INPUT) {
            return fail_end();
        }
        scratch_.push_back(static_cast<char>(c));
    }
    return true;
}

// ============================================================================
// Helpers
// ============================================================================

auto StreamParser::enter_container() -> bool {
    if (options_.max_depth > 0 && depth_ >= options_.max_depth) {
        return fail(ParseErrorKind::Structural, "maximum nesting depth exceeded");
    }
    ++depth_;
    return true;
}

auto StreamParser::emit(Event event) -> bool {
    if (deadline_passed()) {
        return fail(ParseErrorKind::Cancelled, "deadline exceeded");
    }
    if (!sink_->emit(std::move(event))) {
        if (deadline_passed()) {
            return fail(ParseErrorKind::Cancelled, "deadline exceeded");
        }
        return fail(ParseErrorKind::Cancelled, "event consumer went away");
    }
    ++events_emitted_;
    return true;
}

auto StreamParser::deadline_passed() const -> bool {
    return options_.deadline && std::chrono::steady_clock::now() >= *options_.deadline;
}

auto StreamParser::fail(ParseErrorKind kind, std::string message, std::string cause) -> bool {
    if (!error_) {
        error_ = ParseError::make(kind, std::move(message), cursor_.line(), cursor_.position(),
                                  cursor_.offset(), std::move(cause));
    }
    return false;
}

auto StreamParser::fail_end() -> bool {
    if (const auto& io_error = cursor_.io_error()) {
        return fail(ParseErrorKind::Io, "read error", *io_error);
    }
    return fail(ParseErrorKind::UnexpectedEndOfInput, "unexpected end of file");
}

auto StreamParser::fail_expected(std::string_view what, int c) -> bool {
    std::string message = "expected ";
    message += what;
    message += " but got ";
    message += describe_byte(c);
    return fail(ParseErrorKind::Structural, std::move(message));
}

// ============================================================================
// Convenience Functions
// ============================================================================

auto parse_events(std::string_view input, ParserOptions options) -> std::vector<Event> {
    StringSource source(input);
    StreamParser parser(source, options);

    std::vector<Event> events;
    CallbackSink sink([&events](Event event) {
        events.push_back(std::move(event));
        return true;
    });
    parser.parse(sink);
    return events;
}

} // namespace jsev::stream
