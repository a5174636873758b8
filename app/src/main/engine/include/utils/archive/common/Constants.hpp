// include/common/Constants.hpp
#ifndef FILEUTIL_CONSTANTS_HPP
#define FILEUTIL_CONSTANTS_HPP

#include <cstddef>

namespace fileutil {
namespace common {

class Constants {
public:
    static constexpr size_t STREAM_BUFFER_SIZE = 8192;

    static constexpr int DEFAULT_COMPRESSION_LEVEL = 9;

    static constexpr int FILE_PERMISSIONS = 0644;
    static constexpr int DIRECTORY_PERMISSIONS = 0755;

    static constexpr const char* FORMAT_TAR_GZ = "tar.gz";
    static constexpr const char* FORMAT_ZIP = "zip";
    static constexpr const char* DEFAULT_COMPRESS_FORMAT = FORMAT_TAR_GZ;

    static constexpr const char* TEMP_ARCHIVE_PREFIX = ".temp-";

    // Upper bound on the patterns one brace expression may produce.
    static constexpr size_t MAX_BRACE_EXPANSION = 10000;

    static constexpr const char* DEFAULT_ENCODING = "utf8";
    static constexpr const char* DEFAULT_LOG_EVENT = "log:info:raw";
    static constexpr const char* DEFAULT_EVENT_PREPEND = "typhonjs";
};

} // namespace common
} // namespace fileutil

#endif
