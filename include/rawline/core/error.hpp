/*
 * Error reporting - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <optional>

namespace rawline {

enum class ErrorKind {
    InitializationFailure, // raw mode could not be engaged
    ReadFailure,
    WriteFailure,
    FlushFailure,
    LineProcessingFailure  // injected processor reported an error
};

struct Error {
    ErrorKind kind;
    std::string message;
};

// Empty on success.
using MaybeError = std::optional<Error>;

const char* describe(ErrorKind kind);
std::string to_string(const Error& err);

// Builds an Error whose message ends with strerror(errno).
Error os_error(ErrorKind kind, const std::string& what);

} // namespace rawline
