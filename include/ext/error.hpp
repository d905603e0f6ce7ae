//! # Extension Errors
//!
//! The single error value returned by every fallible extension operation.
//!
//! | Kind                    | Raised by                                          |
//! |-------------------------|----------------------------------------------------|
//! | `InvalidUrl`            | URL does not parse                                 |
//! | `UnsupportedProvider`   | URL host is not github.com                         |
//! | `MissingRepositoryName` | URL path has no repository segment                 |
//! | `FetchFailed`           | `git clone` could not run or exited non-zero       |
//! | `BuildFailed`           | `cargo build` could not run or exited non-zero     |
//! | `IoError`               | workspace removal, copy, cleanup, uninstall, setup |

#ifndef JUST_EXT_ERROR_HPP
#define JUST_EXT_ERROR_HPP

#include "common.hpp"

#include <string>
#include <utility>

namespace just::ext {

enum class ErrorKind {
    InvalidUrl,
    UnsupportedProvider,
    MissingRepositoryName,
    FetchFailed,
    BuildFailed,
    IoError,
};

/// Stable display name of an error kind ("InvalidUrl", ...).
const char* error_kind_name(ErrorKind kind);

struct ExtensionError {
    ErrorKind kind;
    std::string message;

    /// "<kind>: <message>"
    std::string to_string() const;
};

template <typename T> using ExtResult = Result<T, ExtensionError>;

inline ExtensionError make_error(ErrorKind kind, std::string message) {
    return ExtensionError{kind, std::move(message)};
}

} // namespace just::ext

#endif // JUST_EXT_ERROR_HPP
