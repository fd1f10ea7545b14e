#pragma once

/// \file error.h
/// \brief Typed error hierarchy for TraceDigit.
///
/// All public functions throw subclasses of TraceDigit::Error instead of
/// plain std::runtime_error, so callers can catch specific categories.
/// Recoverable per-image conditions (too few peaks, empty regions) are not
/// errors; they are reported through DigitizeStatus.

#include "export.h"

#include <stdexcept>
#include <string>

namespace TraceDigit {

/// Error categories returned by Error::code().
enum class ErrorCode : int {
    Ok = 0,
    InvalidInput,   ///< Caller supplied invalid arguments or data.
    IOError,        ///< File or stream I/O failure.
    FormatError,    ///< Data format / parsing error (JSON, sidecar files, ...).
    InvalidConfig,  ///< Configuration value out of its allowed range.
    InternalError,  ///< Logic error inside the library.
};

/// Base exception for all TraceDigit errors.
class TRACEDIGIT_API Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/// File / stream I/O failure.
class TRACEDIGIT_API IOError : public Error {
public:
    explicit IOError(const std::string& msg)
        : Error(ErrorCode::IOError, msg) {}
};

/// Invalid input arguments or data (empty matrix, bad region, ...).
class TRACEDIGIT_API InputError : public Error {
public:
    explicit InputError(const std::string& msg)
        : Error(ErrorCode::InvalidInput, msg) {}
};

/// Data format / parsing failure.
class TRACEDIGIT_API FormatError : public Error {
public:
    explicit FormatError(const std::string& msg)
        : Error(ErrorCode::FormatError, msg) {}
};

/// Configuration value rejected by validation.
class TRACEDIGIT_API ConfigError : public Error {
public:
    explicit ConfigError(const std::string& msg)
        : Error(ErrorCode::InvalidConfig, msg) {}
};

/// Broken internal invariant.
class TRACEDIGIT_API InternalError : public Error {
public:
    explicit InternalError(const std::string& msg)
        : Error(ErrorCode::InternalError, msg) {}
};

} // namespace TraceDigit
