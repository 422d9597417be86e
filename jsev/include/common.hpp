//! # Common Definitions
//!
//! Vocabulary shared by the stream engine, the logger and the `jsev` tool.
//!
//! - `VERSION`: the release string printed by `jsev --version`
//! - `Result<T, E>`: value-or-error return of every fallible call, such as
//!   opening a `FileSource` or decoding a string
//! - `Box<T>`: owning handle for byte sources moved into an `EventStream`

#ifndef JSEV_COMMON_HPP
#define JSEV_COMMON_HPP

#include <memory>
#include <string>
#include <utility>
#include <variant>

// Set by the build from the CMake project version.
#ifndef JSEV_VERSION_STRING
#define JSEV_VERSION_STRING "0.3.0"
#endif

namespace jsev {

constexpr const char* VERSION = JSEV_VERSION_STRING;

// ============================================================================
// Result Type
// ============================================================================

/// Either the value of a successful call or the reason it failed.
///
/// The error type must differ from the value type; use a small error struct
/// (`LexError`, `WriteError`) when both would be strings.
///
/// # Example
///
/// ```cpp
/// auto file = FileSource::open("big.json");
/// if (is_err(file)) {
///     std::cerr << unwrap_err(file) << "\n";
///     return 1;
/// }
/// EventStream events(std::move(unwrap(file)));
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Value of a successful Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` when the Result holds an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Error of a failed Result; throws `std::bad_variant_access` on success.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Ownership
// ============================================================================

template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace jsev

#endif // JSEV_COMMON_HPP
