//! # Common Definitions
//!
//! Types and constants shared by every part of `just-ext`.
//!
//! ## Overview
//!
//! - **Version Information**: tool version constants
//! - **Result Type**: error handling without exceptions
//!
//! Public operations never throw. Anything that can fail returns a
//! `Result<T, E>` and callers branch on `is_ok()` / `is_err()`.

#ifndef JUST_COMMON_HPP
#define JUST_COMMON_HPP

#include <string>
#include <variant>

namespace just {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto repo = parse_repository_name(url);
/// if (is_err(repo)) {
///     report(unwrap_err(repo));
///     return;
/// }
/// use(unwrap(repo));
/// ```
///
/// `T` and `E` must be distinct types.
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value. Throws `std::bad_variant_access` on success.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace just

#endif // JUST_COMMON_HPP
