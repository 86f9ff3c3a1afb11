#pragma once

#include <string>

namespace strata {

enum class ErrorKind {
    Io,              ///< Filesystem read/write/create failure
    NotFound,        ///< Nothing to work on (e.g. no journal segments)
    Decode,          ///< Bytes do not parse as the expected structure
    InvalidArgument  ///< Rejected option or configuration value
};

struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Io: return "IOError";
        case ErrorKind::NotFound: return "NotFoundError";
        case ErrorKind::Decode: return "DecodeError";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

inline std::string to_string(const Error& error) {
    return std::string(error_kind_name(error.kind)) + ": " + error.message;
}

} // namespace strata
