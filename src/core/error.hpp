#pragma once

#include <string>
#include <utility>

namespace vbi {

enum class ErrorKind {
    kNone = 0,
    kIo,        // source/destination cannot be opened, created or read
    kFormat,    // persisted index is truncated or malformed
    kNotFound,  // a single record could not be located in the source
    kArgument,  // malformed region syntax or option value
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone:     return "none";
        case ErrorKind::kIo:       return "I/O error";
        case ErrorKind::kFormat:   return "format error";
        case ErrorKind::kNotFound: return "not found";
        case ErrorKind::kArgument: return "argument error";
    }
    return "unknown";
}

// Filled by fallible operations that return false.
struct Error {
    ErrorKind kind = ErrorKind::kNone;
    std::string message;

    bool ok() const { return kind == ErrorKind::kNone; }
};

// Set *err (if given) and return false, so callers can write
// `return fail(err, ErrorKind::kIo, msg);`.
inline bool fail(Error* err, ErrorKind kind, std::string message) {
    if (err) {
        err->kind = kind;
        err->message = std::move(message);
    }
    return false;
}

} // namespace vbi
