//! # Extension Name Resolution
//!
//! Pure functions mapping user input to the names used on disk:
//!
//! ```text
//! "fmt"                              -> "just-fmt"      (canonicalize)
//! "just-fmt"                         -> "just-fmt.exe"  (platform_executable_name, Windows)
//! "https://github.com/owner/fmt"     -> "fmt"           (parse_repository_name)
//! ```
//!
//! Installed extensions are named exactly `just-<repository><EXE_SUFFIX>`;
//! anything locating or listing extensions relies on that pattern.

#ifndef JUST_EXT_NAME_RESOLVER_HPP
#define JUST_EXT_NAME_RESOLVER_HPP

#include "ext/error.hpp"

#include <string>
#include <string_view>

namespace just::ext {

/// Prefix shared by every extension binary.
constexpr std::string_view EXTENSION_PREFIX = "just-";

/// Executable suffix of the host platform.
#ifdef _WIN32
constexpr std::string_view EXE_SUFFIX = ".exe";
#else
constexpr std::string_view EXE_SUFFIX = "";
#endif

/// The only hosting provider extensions can be installed from.
constexpr std::string_view SUPPORTED_HOST = "github.com";

/// Prepends EXTENSION_PREFIX unless `name` already starts with it.
std::string canonicalize(std::string_view name);

/// Appends EXE_SUFFIX.
std::string platform_executable_name(std::string_view name);

/// True for file names of the form `just-<name><EXE_SUFFIX>`.
///
/// The suffix check compares the file's extension (the part from its last
/// '.', if any), so on platforms without an executable suffix an extension
/// must have no extension at all: "just-fmt" matches, "just-fmt.tmp" does not.
bool is_extension_file_name(std::string_view file_name);

/// Extracts the repository name from a github.com URL.
///
/// Errors, in order of precedence:
/// 1. `InvalidUrl` if `url` does not parse,
/// 2. `UnsupportedProvider` if the host is not github.com,
/// 3. `MissingRepositoryName` if the path has no non-empty second segment.
///
/// A trailing ".git" is dropped ("owner/tool.git" gives "tool").
ExtResult<std::string> parse_repository_name(std::string_view url);

} // namespace just::ext

#endif // JUST_EXT_NAME_RESOLVER_HPP
