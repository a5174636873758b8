#ifndef FILEUTIL_ENCODING_HPP
#define FILEUTIL_ENCODING_HPP

#include "utils/archive/common/Types.hpp"
#include <string>

namespace fileutil {
namespace encoding {

// Text encodings accepted for file payloads. utf8, ascii and latin1 keep the
// bytes as they are; hex and base64 are decoded on write and encoded on read.
enum class Encoding {
    UTF8,
    ASCII,
    LATIN1,
    HEX,
    BASE64
};

// Accepts utf8/utf-8, ascii, latin1/binary, hex and base64, case-insensitively.
// Throws common::InvalidArgumentException for any other name.
Encoding parse(const std::string& name);

std::string toString(Encoding encoding);

common::ByteArray decode(const std::string& data, Encoding encoding);
std::string encode(const common::ByteArray& bytes, Encoding encoding);

} // namespace encoding
} // namespace fileutil

#endif
