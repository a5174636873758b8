#include "utils/encoding.hpp"
#include "utils/archive/common/Exceptions.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

fileutil::common::ByteArray decodeHex(const std::string& data) {
    if (data.size() % 2 != 0) {
        throw fileutil::common::InvalidArgumentException("hex payload has odd length",
                                                         fileutil::common::ErrorCode::INVALID_ENCODED_DATA);
    }

    fileutil::common::ByteArray out;
    out.reserve(data.size() / 2);
    for (size_t i = 0; i < data.size(); i += 2) {
        int hi = hexValue(data[i]);
        int lo = hexValue(data[i + 1]);
        if (hi < 0 || lo < 0) {
            throw fileutil::common::InvalidArgumentException("hex payload contains a non-hex character at offset " +
                                                             std::to_string(hi < 0 ? i : i + 1),
                                                             fileutil::common::ErrorCode::INVALID_ENCODED_DATA);
        }
        out.push_back(static_cast<fileutil::common::Byte>((hi << 4) | lo));
    }
    return out;
}

std::string encodeHex(const fileutil::common::ByteArray& bytes) {
    static const char digits[] = "0123456789abcdef";

    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

// Accepts url-safe characters, embedded whitespace and missing padding.
fileutil::common::ByteArray decodeBase64(const std::string& data) {
    std::string normalized;
    normalized.reserve(data.size() + 3);
    for (char c : data) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        normalized.push_back(c);
    }

    if (normalized.empty()) {
        return {};
    }

    if (normalized.size() % 4 == 1) {
        throw fileutil::common::InvalidArgumentException("base64 payload has invalid length",
                                                         fileutil::common::ErrorCode::INVALID_ENCODED_DATA);
    }
    while (normalized.size() % 4 != 0) {
        normalized.push_back('=');
    }

    size_t padding = 0;
    for (auto it = normalized.rbegin(); it != normalized.rend() && *it == '=' && padding < 2; ++it) {
        ++padding;
    }
    if (normalized.find('=') < normalized.size() - padding) {
        throw fileutil::common::InvalidArgumentException("base64 payload has padding before the end",
                                                         fileutil::common::ErrorCode::INVALID_ENCODED_DATA);
    }

    fileutil::common::ByteArray out(normalized.size() / 4 * 3);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(normalized.data()),
                                  static_cast<int>(normalized.size()));
    if (written < 0) {
        throw fileutil::common::InvalidArgumentException("base64 payload contains invalid characters",
                                                         fileutil::common::ErrorCode::INVALID_ENCODED_DATA);
    }

    // EVP_DecodeBlock counts padding as zero bytes.
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

std::string encodeBase64(const fileutil::common::ByteArray& bytes) {
    if (bytes.empty()) {
        return {};
    }

    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  bytes.data(), static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

} // namespace

fileutil::encoding::Encoding fileutil::encoding::parse(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "utf8" || lowered == "utf-8") return Encoding::UTF8;
    if (lowered == "ascii") return Encoding::ASCII;
    if (lowered == "latin1" || lowered == "binary") return Encoding::LATIN1;
    if (lowered == "hex") return Encoding::HEX;
    if (lowered == "base64") return Encoding::BASE64;

    throw fileutil::common::InvalidArgumentException("Unknown encoding: '" + name + "'",
                                                     fileutil::common::ErrorCode::INVALID_ENCODING);
}

std::string fileutil::encoding::toString(Encoding encoding) {
    switch (encoding) {
        case Encoding::ASCII: return "ascii";
        case Encoding::LATIN1: return "latin1";
        case Encoding::HEX: return "hex";
        case Encoding::BASE64: return "base64";
        case Encoding::UTF8:
        default:
            return "utf8";
    }
}

fileutil::common::ByteArray fileutil::encoding::decode(const std::string& data, Encoding encoding) {
    switch (encoding) {
        case Encoding::HEX:
            return decodeHex(data);
        case Encoding::BASE64:
            return decodeBase64(data);
        case Encoding::UTF8:
        case Encoding::ASCII:
        case Encoding::LATIN1:
        default:
            return common::toBytes(data);
    }
}

std::string fileutil::encoding::encode(const common::ByteArray& bytes, Encoding encoding) {
    switch (encoding) {
        case Encoding::HEX:
            return encodeHex(bytes);
        case Encoding::BASE64:
            return encodeBase64(bytes);
        case Encoding::UTF8:
        case Encoding::ASCII:
        case Encoding::LATIN1:
        default:
            return common::toString(bytes);
    }
}
