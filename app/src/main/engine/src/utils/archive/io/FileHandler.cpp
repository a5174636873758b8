// src/io/FileHandler.cpp
#include "utils/archive/io/FileHandler.hpp"
#include "utils/archive/common/Constants.hpp"
#include <sys/stat.h>
#include <cstdio>

fileutil::io::FileHandler::FileHandler(const std::string& filePath)
    : filePath_(filePath), fileSize_(0), isOpen_(false), fileHandle_(nullptr) {}

fileutil::io::FileHandler::~FileHandler() {
    close();
}

std::error_code fileutil::io::FileHandler::openForRead() {
    if (isOpen_) {
        close();
    }

    if (!fileExists(filePath_)) {
        return fileutil::common::ErrorCode::FILE_NOT_FOUND;
    }

    FILE* file = std::fopen(filePath_.c_str(), "rb");
    if (!file) {
        return fileutil::common::ErrorCode::FILE_READ_ERROR;
    }

    fileHandle_ = file;
    isOpen_ = true;

    return updateFileSize();
}

void fileutil::io::FileHandler::close() {
    if (fileHandle_) {
        std::fclose(fileHandle_);
        fileHandle_ = nullptr;
    }
    isOpen_ = false;
}

std::error_code fileutil::io::FileHandler::read(fileutil::common::ByteArray& buffer, size_t bytesToRead) {
    if (!isOpen_ || !fileHandle_) {
        return fileutil::common::ErrorCode::FILE_READ_ERROR;
    }

    buffer.resize(bytesToRead);
    size_t bytesRead = std::fread(buffer.data(), 1, bytesToRead, fileHandle_);

    if (bytesRead < bytesToRead) {
        if (std::feof(fileHandle_)) {
            buffer.resize(bytesRead);
            return fileutil::common::ErrorCode::SUCCESS;
        }
        return fileutil::common::ErrorCode::FILE_READ_ERROR;
    }

    return fileutil::common::ErrorCode::SUCCESS;
}

std::error_code fileutil::io::FileHandler::readAll(fileutil::common::ByteArray& buffer) {
    buffer.clear();
    buffer.reserve(fileSize_);

    fileutil::common::ByteArray chunk;
    while (!endOfFile()) {
        auto ec = read(chunk, fileutil::common::Constants::STREAM_BUFFER_SIZE);
        if (ec) {
            return ec;
        }
        if (chunk.empty()) {
            break;
        }
        buffer.insert(buffer.end(), chunk.begin(), chunk.end());
    }

    return fileutil::common::ErrorCode::SUCCESS;
}

bool fileutil::io::FileHandler::endOfFile() const {
    if (!isOpen_ || !fileHandle_) {
        return true;
    }

    return std::feof(fileHandle_) != 0;
}

bool fileutil::io::FileHandler::fileExists(const std::string& filePath) {
    struct stat buffer;
    return stat(filePath.c_str(), &buffer) == 0;
}

std::error_code fileutil::io::FileHandler::getFileSize(const std::string& filePath, size_t& size) {
    struct stat buffer;
    if (stat(filePath.c_str(), &buffer) != 0) {
        return fileutil::common::ErrorCode::FILE_NOT_FOUND;
    }

    size = static_cast<size_t>(buffer.st_size);
    return fileutil::common::ErrorCode::SUCCESS;
}

std::error_code fileutil::io::FileHandler::updateFileSize() {
    size_t size = 0;
    auto ec = getFileSize(filePath_, size);
    if (ec) {
        return ec;
    }

    fileSize_ = size;
    return fileutil::common::ErrorCode::SUCCESS;
}
