//! # Lexical Helpers Implementation
//!
//! String unescaping follows RFC 8259 with two lenient extensions kept for
//! compatibility with existing producers: `\'` is accepted as an escape, and
//! invalid UTF-8 is coerced to U+FFFD instead of failing the parse.

#include "stream/lexer.hpp"

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace jsev::stream {

namespace {

auto hex_val(char c) -> int {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
        return 10 + (c - 'A');
    }
    return -1;
}

/// Reads a `\uXXXX` escape starting at `s[i]` (the backslash).
///
/// # Returns
///
/// The 16-bit code unit, or -1 if `s[i..i+6)` is not a well-formed escape.
auto read_u4(std::string_view s, size_t i) -> int32_t {
    if (i + 6 > s.size() || s[i] != '\\' || s[i + 1] != 'u') {
        return -1;
    }
    int32_t cp = 0;
    for (size_t k = i + 2; k < i + 6; ++k) {
        int h = hex_val(s[k]);
        if (h < 0) {
            return -1;
        }
        cp = (cp << 4) | h;
    }
    return cp;
}

auto is_high_surrogate(int32_t cp) -> bool {
    return cp >= 0xD800 && cp < 0xDC00;
}

auto is_low_surrogate(int32_t cp) -> bool {
    return cp >= 0xDC00 && cp < 0xE000;
}

/// Decodes one UTF-8 sequence at `s[i]`.
///
/// # Returns
///
/// `{code point, length}`; malformed input yields `{U+FFFD, 1}`.
auto decode_utf8(std::string_view s, size_t i) -> std::pair<uint32_t, size_t> {
    const auto b0 = static_cast<unsigned char>(s[i]);
    const size_t remaining = s.size() - i;
    auto cont = [&](size_t k) -> int {
        if (k >= remaining) {
            return -1;
        }
        auto b = static_cast<unsigned char>(s[i + k]);
        return (b & 0xC0) == 0x80 ? (b & 0x3F) : -1;
    };

    if (b0 < 0x80) {
        return {b0, 1};
    }
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        int c1 = cont(1);
        if (c1 >= 0) {
            return {((b0 & 0x1Fu) << 6) | static_cast<uint32_t>(c1), 2};
        }
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        int c1 = cont(1);
        int c2 = cont(2);
        if (c1 >= 0 && c2 >= 0) {
            uint32_t cp = ((b0 & 0x0Fu) << 12) | (static_cast<uint32_t>(c1) << 6) |
                          static_cast<uint32_t>(c2);
            // Reject overlong forms and encoded surrogates.
            if (cp >= 0x800 && (cp < 0xD800 || cp > 0xDFFF)) {
                return {cp, 3};
            }
        }
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        int c1 = cont(1);
        int c2 = cont(2);
        int c3 = cont(3);
        if (c1 >= 0 && c2 >= 0 && c3 >= 0) {
            uint32_t cp = ((b0 & 0x07u) << 18) | (static_cast<uint32_t>(c1) << 12) |
                          (static_cast<uint32_t>(c2) << 6) | static_cast<uint32_t>(c3);
            if (cp >= 0x10000 && cp <= 0x10FFFF) {
                return {cp, 4};
            }
        }
    }
    return {REPLACEMENT_CHARACTER, 1};
}

} // namespace

auto describe_byte(int c) -> std::string {
    if (c >= 0x20 && c < 0x7F) {
        return std::string(1, static_cast<char>(c));
    }
    static const char* digits = "0123456789abcdef";
    std::string out = "\\x";
    out += digits[(c >> 4) & 0xF];
    out += digits[c & 0xF];
    return out;
}

auto quote_bytes(std::string_view bytes) -> std::string {
    std::string out = "\"";
    for (char c : bytes) {
        out += describe_byte(static_cast<unsigned char>(c));
    }
    out += '"';
    return out;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto decode_string(std::string_view raw) -> Result<std::string, LexError> {
    // Fast path: plain, well-formed text is returned as-is.
    size_t r = 0;
    while (r < raw.size()) {
        auto c = static_cast<unsigned char>(raw[r]);
        if (c == '\\' || c == '"' || c < 0x20) {
            break;
        }
        if (c < 0x80) {
            ++r;
            continue;
        }
        auto [cp, size] = decode_utf8(raw, r);
        if (cp == REPLACEMENT_CHARACTER && size == 1) {
            break;
        }
        r += size;
    }
    if (r == raw.size()) {
        return std::string(raw);
    }

    std::string out;
    out.reserve(raw.size());
    out.append(raw.substr(0, r));

    while (r < raw.size()) {
        auto c = static_cast<unsigned char>(raw[r]);

        if (c == '\\') {
            if (r + 1 >= raw.size()) {
                return LexError{"truncated escape at end of string"};
            }
            char escaped = raw[r + 1];
            switch (escaped) {
            case '"':
            case '\\':
            case '/':
            case '\'':
                out += escaped;
                r += 2;
                break;
            case 'b':
                out += '\b';
                r += 2;
                break;
            case 'f':
                out += '\f';
                r += 2;
                break;
            case 'n':
                out += '\n';
                r += 2;
                break;
            case 'r':
                out += '\r';
                r += 2;
                break;
            case 't':
                out += '\t';
                r += 2;
                break;
            case 'u': {
                int32_t cp = read_u4(raw, r);
                if (cp < 0) {
                    return LexError{"invalid unicode escape at byte " + std::to_string(r)};
                }
                r += 6;
                if (is_high_surrogate(cp) || is_low_surrogate(cp)) {
                    int32_t low = read_u4(raw, r);
                    if (is_high_surrogate(cp) && is_low_surrogate(low)) {
                        r += 6;
                        append_utf8(out, 0x10000 + ((static_cast<uint32_t>(cp) - 0xD800) << 10) +
                                             (static_cast<uint32_t>(low) - 0xDC00));
                        break;
                    }
                    // Unpaired surrogate; the next escape is decoded on its own.
                    cp = REPLACEMENT_CHARACTER;
                }
                append_utf8(out, static_cast<uint32_t>(cp));
                break;
            }
            default:
                return LexError{"invalid escape \\" +
                                describe_byte(static_cast<unsigned char>(escaped))};
            }
        } else if (c == '"') {
            return LexError{"unescaped quote at byte " + std::to_string(r)};
        } else if (c < 0x20) {
            return LexError{"control byte " + describe_byte(c) + " at byte " +
                            std::to_string(r)};
        } else if (c < 0x80) {
            out += static_cast<char>(c);
            ++r;
        } else {
            auto [cp, size] = decode_utf8(raw, r);
            append_utf8(out, cp);
            r += size;
        }
    }

    return out;
}

auto parse_number_lexeme(std::string_view lexeme) -> Result<Number, LexError> {
    if (lexeme.empty()) {
        return LexError{"empty number literal"};
    }

    const bool is_float = lexeme.find_first_of(".eE") != std::string_view::npos;

    if (is_float) {
        std::string text(lexeme);
        char* end = nullptr;
        errno = 0;
        double value = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size()) {
            return LexError{"invalid float literal \"" + text + "\""};
        }
        if (errno == ERANGE && std::isinf(value)) {
            return LexError{"float literal \"" + text + "\" out of range"};
        }
        return Number(value);
    }

    // from_chars does not take a leading '+', a second sign is still invalid.
    std::string_view digits = lexeme;
    if (digits.front() == '+') {
        digits.remove_prefix(1);
        if (digits.empty() || digits.front() == '-') {
            return LexError{"invalid integer literal \"" + std::string(lexeme) + "\""};
        }
    }

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return LexError{"integer literal \"" + std::string(lexeme) + "\" out of range"};
    }
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return LexError{"invalid integer literal \"" + std::string(lexeme) + "\""};
    }
    return Number(value);
}

} // namespace jsev::stream
