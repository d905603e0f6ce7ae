#include "ext/error.hpp"

namespace just::ext {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidUrl:
        return "InvalidUrl";
    case ErrorKind::UnsupportedProvider:
        return "UnsupportedProvider";
    case ErrorKind::MissingRepositoryName:
        return "MissingRepositoryName";
    case ErrorKind::FetchFailed:
        return "FetchFailed";
    case ErrorKind::BuildFailed:
        return "BuildFailed";
    case ErrorKind::IoError:
        return "IoError";
    }
    return "Unknown";
}

std::string ExtensionError::to_string() const {
    return std::string(error_kind_name(kind)) + ": " + message;
}

} // namespace just::ext
