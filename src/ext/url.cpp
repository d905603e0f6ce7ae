//! # URL Parser
//!
//! Splits an absolute URL into its components. Schemes with a well-known
//! authority (http, https, ws, wss, ftp) tolerate missing or extra slashes
//! after the colon the way browsers do; other schemes only have an authority
//! when "//" follows the colon.

#include "ext/url.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>

namespace just::ext {

// ============================================================================
// Helpers
// ============================================================================

static std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

static bool is_special_scheme(std::string_view scheme) {
    return scheme == "http" || scheme == "https" || scheme == "ws" || scheme == "wss" ||
           scheme == "ftp";
}

static bool is_scheme_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

static bool is_forbidden_host_char(char c) {
    switch (c) {
    case ' ':
    case '#':
    case '%':
    case '/':
    case ':':
    case '<':
    case '>':
    case '?':
    case '@':
    case '[':
    case '\\':
    case ']':
    case '^':
    case '|':
        return true;
    default:
        return static_cast<unsigned char>(c) < 0x20 || c == 0x7f;
    }
}

/// Trims leading and trailing spaces and C0 controls.
static std::string_view trim(std::string_view s) {
    auto is_blank = [](char c) { return static_cast<unsigned char>(c) <= 0x20; };
    while (!s.empty() && is_blank(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && is_blank(s.back()))
        s.remove_suffix(1);
    return s;
}

static Result<std::optional<uint16_t>, std::string> parse_port(std::string_view text) {
    if (text.empty()) {
        return std::optional<uint16_t>{};
    }
    uint32_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::string("invalid port number");
        }
        value = value * 10 + static_cast<uint32_t>(c - '0');
        if (value > 65535) {
            return std::string("invalid port number");
        }
    }
    return std::optional<uint16_t>(static_cast<uint16_t>(value));
}

/// Parses "[userinfo@]host[:port]" into `url`.
static std::optional<std::string> parse_authority(std::string_view authority, Url& url,
                                                  bool special) {
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        url.userinfo = std::string(authority.substr(0, at));
        authority = authority.substr(at + 1);
    }

    std::string_view host = authority;
    std::string_view port;

    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::string("invalid IPv6 address");
        }
        host = authority.substr(0, close + 1);
        auto rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return std::string("invalid IPv6 address");
            }
            port = rest.substr(1);
        }
        auto inner = host.substr(1, host.size() - 2);
        if (inner.empty() || !std::all_of(inner.begin(), inner.end(), [](char c) {
                return std::isxdigit(static_cast<unsigned char>(c)) || c == ':' || c == '.';
            })) {
            return std::string("invalid IPv6 address");
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }
        if (std::any_of(host.begin(), host.end(), is_forbidden_host_char)) {
            return std::string("invalid domain character");
        }
    }

    if (host.empty() && special) {
        return std::string("empty host");
    }

    auto parsed_port = parse_port(port);
    if (is_err(parsed_port)) {
        return unwrap_err(parsed_port);
    }

    url.host = to_lower(host);
    url.port = unwrap(parsed_port);
    return std::nullopt;
}

// ============================================================================
// Url
// ============================================================================

/// `lower` must already be lower case.
static bool equals_ignore_case(std::string_view text, std::string_view lower) {
    return to_lower(text) == lower;
}

static bool is_single_dot(std::string_view segment) {
    return segment == "." || equals_ignore_case(segment, "%2e");
}

static bool is_double_dot(std::string_view segment) {
    return segment == ".." || equals_ignore_case(segment, ".%2e") ||
           equals_ignore_case(segment, "%2e.") || equals_ignore_case(segment, "%2e%2e");
}

/// Resolves "." and ".." segments (plain or percent-encoded) in a path that
/// starts with '/'. ".." never climbs above the root, and a trailing dot
/// segment leaves a trailing slash: "/a/b/.." becomes "/a/".
static std::string remove_dot_segments(std::string_view path) {
    std::vector<std::string_view> kept;
    std::string_view rest = path.substr(1);
    while (true) {
        auto slash = rest.find('/');
        auto segment = rest.substr(0, slash);
        bool last = slash == std::string_view::npos;

        if (is_double_dot(segment)) {
            if (!kept.empty()) {
                kept.pop_back();
            }
            if (last) {
                kept.push_back({});
            }
        } else if (is_single_dot(segment)) {
            if (last) {
                kept.push_back({});
            }
        } else {
            kept.push_back(segment);
        }

        if (last) {
            break;
        }
        rest = rest.substr(slash + 1);
    }

    std::string result;
    for (auto segment : kept) {
        result += '/';
        result += segment;
    }
    return result.empty() ? "/" : result;
}

Result<Url, std::string> Url::parse(std::string_view input) {
    input = trim(input);

    auto colon = input.find(':');
    if (colon == std::string_view::npos || colon == 0 ||
        !std::isalpha(static_cast<unsigned char>(input.front())) ||
        !std::all_of(input.begin(), input.begin() + static_cast<std::ptrdiff_t>(colon),
                     is_scheme_char)) {
        return std::string("relative URL without a base");
    }

    Url url;
    url.scheme = to_lower(input.substr(0, colon));
    std::string_view rest = input.substr(colon + 1);

    auto fragment_pos = rest.find('#');
    if (fragment_pos != std::string_view::npos) {
        url.fragment = std::string(rest.substr(fragment_pos + 1));
        rest = rest.substr(0, fragment_pos);
    }
    auto query_pos = rest.find('?');
    if (query_pos != std::string_view::npos) {
        url.query = std::string(rest.substr(query_pos + 1));
        rest = rest.substr(0, query_pos);
    }

    bool special = is_special_scheme(url.scheme);
    bool has_authority = false;
    if (special) {
        while (!rest.empty() && (rest.front() == '/' || rest.front() == '\\')) {
            rest.remove_prefix(1);
        }
        has_authority = true;
    } else if (rest.starts_with("//")) {
        rest.remove_prefix(2);
        has_authority = true;
    }

    if (has_authority) {
        auto end = rest.find_first_of(special ? "/\\" : "/");
        auto authority = rest.substr(0, end);
        rest = end == std::string_view::npos ? std::string_view{} : rest.substr(end);
        if (auto error = parse_authority(authority, url, special)) {
            return *error;
        }
    }

    url.path = std::string(rest);
    if (special) {
        std::replace(url.path.begin(), url.path.end(), '\\', '/');
        if (url.path.empty()) {
            url.path = "/";
        }
    }
    if (url.path.starts_with('/')) {
        url.path = remove_dot_segments(url.path);
    }
    return url;
}

std::optional<std::vector<std::string>> Url::path_segments() const {
    if (path.empty() || path.front() != '/') {
        return std::nullopt;
    }

    std::vector<std::string> segments;
    size_t start = 1;
    while (true) {
        auto slash = path.find('/', start);
        if (slash == std::string::npos) {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return segments;
}

} // namespace just::ext
