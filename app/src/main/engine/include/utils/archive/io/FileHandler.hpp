// include/io/FileHandler.hpp
#ifndef FILEUTIL_FILEHANDLER_HPP
#define FILEUTIL_FILEHANDLER_HPP

#include "../common/Types.hpp"
#include "../common/ErrorCodes.hpp"
#include <cstdio>
#include <string>
#include <system_error>

namespace fileutil {
namespace io {

// Read-side file access for line reads and for streaming source files into an archive.
class FileHandler : public common::NonCopyable {
private:
    std::string filePath_;
    size_t fileSize_;
    bool isOpen_;
    FILE* fileHandle_;

public:
    explicit FileHandler(const std::string& filePath);
    ~FileHandler();

    std::error_code openForRead();

    void close();
    bool isOpen() const { return isOpen_; }
    size_t getFileSize() const { return fileSize_; }
    std::string getFilePath() const { return filePath_; }

    std::error_code read(common::ByteArray& buffer, size_t bytesToRead);
    std::error_code readAll(common::ByteArray& buffer);
    bool endOfFile() const;

    static bool fileExists(const std::string& filePath);
    static std::error_code getFileSize(const std::string& filePath, size_t& size);

private:
    std::error_code updateFileSize();
};

} // namespace io
} // namespace fileutil

#endif
