#include "ext/name_resolver.hpp"

#include "ext/url.hpp"

namespace just::ext {

std::string canonicalize(std::string_view name) {
    if (name.starts_with(EXTENSION_PREFIX)) {
        return std::string(name);
    }
    std::string result(EXTENSION_PREFIX);
    result += name;
    return result;
}

std::string platform_executable_name(std::string_view name) {
    std::string result(name);
    result += EXE_SUFFIX;
    return result;
}

bool is_extension_file_name(std::string_view file_name) {
    if (!file_name.starts_with(EXTENSION_PREFIX)) {
        return false;
    }
    auto stem = file_name.substr(EXTENSION_PREFIX.size());
    auto dot = stem.rfind('.');
    auto extension = dot == std::string_view::npos ? std::string_view{} : stem.substr(dot);
    return extension == EXE_SUFFIX;
}

ExtResult<std::string> parse_repository_name(std::string_view url) {
    auto parsed = Url::parse(url);
    if (is_err(parsed)) {
        return make_error(ErrorKind::InvalidUrl,
                          "Invalid URL '" + std::string(url) + "': " + unwrap_err(parsed));
    }

    const Url& repo_url = unwrap(parsed);
    if (repo_url.host != SUPPORTED_HOST) {
        return make_error(ErrorKind::UnsupportedProvider,
                          "Currently, only github.com is supported for just extensions (got '" +
                              repo_url.host + "')");
    }

    auto segments = repo_url.path_segments();
    if (!segments || segments->size() < 2) {
        return make_error(ErrorKind::MissingRepositoryName,
                          "No repository name in '" + std::string(url) + "'");
    }

    std::string name = (*segments)[1];
    // Clone URLs end in ".git"; git names the checkout and cargo names the
    // binary without it.
    if (name.ends_with(".git")) {
        name.resize(name.size() - 4);
    }
    // The name becomes a directory under the work dir that install removes,
    // so it must not resolve to the work dir or its parent ("...git" strips
    // to "..").
    if (name.empty() || name == "." || name == ".." ||
        name.find_first_of("/\\") != std::string::npos) {
        return make_error(ErrorKind::MissingRepositoryName,
                          "No repository name in '" + std::string(url) + "'");
    }
    return name;
}

} // namespace just::ext
