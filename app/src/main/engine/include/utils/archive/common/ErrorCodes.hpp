// include/common/ErrorCodes.hpp
#ifndef FILEUTIL_ERRORCODES_HPP
#define FILEUTIL_ERRORCODES_HPP

#include <string>
#include <system_error>

namespace fileutil {
namespace common {

enum class ErrorCode {
    SUCCESS = 0,

    // Argument validation
    INVALID_ARGUMENT = 100,
    INVALID_OPTIONS,
    INVALID_GLOB,
    INVALID_ENCODING,
    INVALID_ENCODED_DATA,

    // Format selection
    UNSUPPORTED_FORMAT = 200,

    // File system and stream operations
    FILE_NOT_FOUND = 300,
    FILE_READ_ERROR,
    FILE_WRITE_ERROR,
    FILE_COPY_ERROR,
    DIRECTORY_ERROR,
    STREAM_ERROR,
    ARCHIVE_ERROR,

    // Session misuse
    USAGE_ERROR = 400,
    SESSION_NOT_OPEN,
    SESSION_ALREADY_FINALIZED,

    UNKNOWN_ERROR = 999
};

class FileUtilErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "fileutil";
    }

    std::string message(int ev) const override {
        switch (static_cast<ErrorCode>(ev)) {
            case ErrorCode::SUCCESS:
                return "Success";

            case ErrorCode::INVALID_ARGUMENT:
                return "Invalid argument";
            case ErrorCode::INVALID_OPTIONS:
                return "Invalid options";
            case ErrorCode::INVALID_GLOB:
                return "Invalid glob input";
            case ErrorCode::INVALID_ENCODING:
                return "Unknown encoding";
            case ErrorCode::INVALID_ENCODED_DATA:
                return "Malformed encoded data";

            case ErrorCode::UNSUPPORTED_FORMAT:
                return "Unsupported compression format";

            case ErrorCode::FILE_NOT_FOUND:
                return "File not found";
            case ErrorCode::FILE_READ_ERROR:
                return "File read error";
            case ErrorCode::FILE_WRITE_ERROR:
                return "File write error";
            case ErrorCode::FILE_COPY_ERROR:
                return "File copy error";
            case ErrorCode::DIRECTORY_ERROR:
                return "Directory operation failed";
            case ErrorCode::STREAM_ERROR:
                return "Stream error";
            case ErrorCode::ARCHIVE_ERROR:
                return "Archive error";

            case ErrorCode::USAGE_ERROR:
                return "Usage error";
            case ErrorCode::SESSION_NOT_OPEN:
                return "Archive session is not open";
            case ErrorCode::SESSION_ALREADY_FINALIZED:
                return "Archive session already finalized";

            case ErrorCode::UNKNOWN_ERROR:
            default:
                return "Unknown error";
        }
    }
};

inline const std::error_category& fileutil_error_category() {
    static FileUtilErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(ErrorCode e) {
    return std::error_code(static_cast<int>(e), fileutil_error_category());
}

inline std::error_condition make_error_condition(ErrorCode e) {
    return std::error_condition(static_cast<int>(e), fileutil_error_category());
}

} // namespace common
} // namespace fileutil

namespace std {
    template<>
    struct is_error_code_enum<fileutil::common::ErrorCode> : true_type {};
}

#endif
