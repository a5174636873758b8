// include/common/Exceptions.hpp
#ifndef FILEUTIL_EXCEPTIONS_HPP
#define FILEUTIL_EXCEPTIONS_HPP

#include "ErrorCodes.hpp"
#include <stdexcept>
#include <string>
#include <system_error>

namespace fileutil {
namespace common {

class FileUtilException : public std::system_error {
public:
    FileUtilException(ErrorCode code, const std::string& message)
        : std::system_error(make_error_code(code), message) {}

    ErrorCode errorCode() const noexcept {
        return static_cast<ErrorCode>(code().value());
    }
};

// Wrong input type or shape, rejected at the call boundary.
class InvalidArgumentException : public FileUtilException {
public:
    explicit InvalidArgumentException(const std::string& message,
                                      ErrorCode code = ErrorCode::INVALID_ARGUMENT)
        : FileUtilException(code, message) {}
};

class UnsupportedFormatException : public FileUtilException {
public:
    explicit UnsupportedFormatException(const std::string& format)
        : FileUtilException(ErrorCode::UNSUPPORTED_FORMAT,
                            "Unknown compression format: '" + format + "'"),
          format_(format) {}

    const std::string& format() const noexcept { return format_; }

private:
    std::string format_;
};

class IOFailureException : public FileUtilException {
public:
    explicit IOFailureException(const std::string& message,
                                ErrorCode code = ErrorCode::STREAM_ERROR)
        : FileUtilException(code, message) {}
};

// Raised by the compression handle itself. Never caught by the session stack.
class ArchiveException : public IOFailureException {
public:
    explicit ArchiveException(const std::string& message)
        : IOFailureException(message, ErrorCode::ARCHIVE_ERROR) {}
};

class UsageErrorException : public FileUtilException {
public:
    explicit UsageErrorException(const std::string& message,
                                 ErrorCode code = ErrorCode::USAGE_ERROR)
        : FileUtilException(code, message) {}
};

} // namespace common
} // namespace fileutil

#endif
