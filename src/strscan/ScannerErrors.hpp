#pragma once

#include <stdexcept>
#include <string>

namespace strscan
{

/**
 * @brief Base class for caller contract violations
 *
 * A failed match is never reported through these; it is an empty optional.
 * These mark a bug on the calling side (bad offset, unknown group, bad pattern).
 */
class ScannerError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// Cursor or peek offset outside [0, Size()].
class OutOfRangeError : public ScannerError
{
public:
    using ScannerError::ScannerError;
};

/// Group index or name that the matched pattern does not declare.
class UnknownGroupError : public ScannerError
{
public:
    using ScannerError::ScannerError;
};

/// Pattern source rejected by the matching engine.
class InvalidPatternError : public ScannerError
{
public:
    InvalidPatternError(const std::string& source, const std::string& diagnostic)
        : ScannerError("invalid pattern '" + source + "': " + diagnostic)
        , source_(source)
        , diagnostic_(diagnostic)
    {
    }

    const std::string& source() const { return source_; }
    const std::string& diagnostic() const { return diagnostic_; }

private:
    std::string source_;
    std::string diagnostic_;
};

/// Text that is not well-formed UTF-8.
class InvalidTextError : public ScannerError
{
public:
    using ScannerError::ScannerError;
};

} // namespace strscan
