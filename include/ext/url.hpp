//! # Absolute URL Parsing
//!
//! A small parser for absolute URLs of the form
//!
//! ```text
//! scheme:[//[userinfo@]host[:port]]path[?query][#fragment]
//! ```
//!
//! It accepts what source-hosting URLs look like in practice and rejects
//! relative references ("owner/repo"), free text ("not a url"), bad schemes
//! and malformed authorities. Scheme and host are lowercased.

#ifndef JUST_EXT_URL_HPP
#define JUST_EXT_URL_HPP

#include "common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace just::ext {

struct Url {
    std::string scheme;
    std::string userinfo;
    std::string host; ///< Empty when the URL has no authority (mailto:, file:/x)
    std::optional<uint16_t> port;
    std::string path;
    std::string query;
    std::string fragment;

    /// Parses an absolute URL. The error string describes what is wrong.
    static Result<Url, std::string> parse(std::string_view input);

    /// Path split on '/', without the leading slash. "/a/b" gives {"a", "b"},
    /// "/a/" gives {"a", ""} and "/" gives {""}. URLs without an authority
    /// and without a leading slash ("mailto:x") have no segments.
    std::optional<std::vector<std::string>> path_segments() const;
};

} // namespace just::ext

#endif // JUST_EXT_URL_HPP
