// include/common/Types.hpp
#ifndef FILEUTIL_TYPES_HPP
#define FILEUTIL_TYPES_HPP

#include <cstdint>
#include <vector>
#include <memory>
#include <string>

namespace fileutil {
namespace common {

using Byte = uint8_t;
using ByteArray = std::vector<Byte>;
using ConstBytePtr = const Byte*;

enum class ArchiveFormat {
    TAR_GZ,
    ZIP
};

enum class SessionState {
    Open,
    Closing,
    Closed
};

// Location of a finished child archive waiting to be spliced into its parent.
struct MergeResult {
    std::string resolvedOutputPath;
    std::string logicalPath;
};

class NonCopyable {
protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;

    NonCopyable(NonCopyable&&) = default;
    NonCopyable& operator=(NonCopyable&&) = default;
};

inline ByteArray toBytes(const std::string& text) {
    return ByteArray(text.begin(), text.end());
}

inline std::string toString(const ByteArray& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace common
} // namespace fileutil

#endif
