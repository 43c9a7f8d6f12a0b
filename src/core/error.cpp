/*
 * Error reporting implementation - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <rawline/core/error.hpp>
#include <cerrno>
#include <cstring>

namespace rawline {

const char* describe(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InitializationFailure: return "initialization failed";
        case ErrorKind::ReadFailure: return "IO read error";
        case ErrorKind::WriteFailure: return "IO write error";
        case ErrorKind::FlushFailure: return "IO flush error";
        case ErrorKind::LineProcessingFailure: return "process line error";
    }
    return "unknown error";
}

std::string to_string(const Error& err) {
    std::string out = describe(err.kind);
    if (!err.message.empty()) { out += ": "; out += err.message; }
    return out;
}

Error os_error(ErrorKind kind, const std::string& what) {
    int saved = errno;
    std::string msg = what;
    if (saved != 0) {
        if (!msg.empty()) msg += ": ";
        msg += std::strerror(saved);
    }
    return Error{kind, msg};
}

} // namespace rawline
