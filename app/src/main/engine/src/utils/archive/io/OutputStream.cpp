// src/io/OutputStream.cpp
#include "utils/archive/io/OutputStream.hpp"
#include <cerrno>
#include <cstring>

fileutil::io::OutputStream::OutputStream(const std::string& filePath)
    : filePath_(filePath), fileHandle_(nullptr), bytesWritten_(0), closed_(false) {}

fileutil::io::OutputStream::~OutputStream() {
    if (fileHandle_) {
        std::fclose(fileHandle_);
        fileHandle_ = nullptr;
    }
}

std::error_code fileutil::io::OutputStream::open() {
    if (fileHandle_ || closed_) {
        return fileutil::common::ErrorCode::STREAM_ERROR;
    }

    fileHandle_ = std::fopen(filePath_.c_str(), "wb");
    if (!fileHandle_) {
        std::error_code ec = fileutil::common::ErrorCode::FILE_WRITE_ERROR;
        emitError(ec, "open '" + filePath_ + "': " + std::strerror(errno));
        return ec;
    }

    return fileutil::common::ErrorCode::SUCCESS;
}

std::error_code fileutil::io::OutputStream::write(const fileutil::common::Byte* data, size_t size) {
    if (!fileHandle_ || (size > 0 && !data)) {
        std::error_code ec = fileutil::common::ErrorCode::STREAM_ERROR;
        emitError(ec, "write after close on '" + filePath_ + "'");
        return ec;
    }

    size_t written = std::fwrite(data, 1, size, fileHandle_);
    if (written != size) {
        std::error_code ec = fileutil::common::ErrorCode::FILE_WRITE_ERROR;
        emitError(ec, "write '" + filePath_ + "': " + std::strerror(errno));
        return ec;
    }

    bytesWritten_ += written;
    return fileutil::common::ErrorCode::SUCCESS;
}

std::error_code fileutil::io::OutputStream::close() {
    if (closed_) {
        return fileutil::common::ErrorCode::SUCCESS;
    }

    std::error_code result = fileutil::common::ErrorCode::SUCCESS;
    if (fileHandle_) {
        int rc = std::fclose(fileHandle_);
        fileHandle_ = nullptr;
        if (rc != 0) {
            result = fileutil::common::ErrorCode::FILE_WRITE_ERROR;
            emitError(result, "close '" + filePath_ + "': " + std::strerror(errno));
        }
    }

    closed_ = true;
    emitClose();
    return result;
}

void fileutil::io::OutputStream::onClose(CloseListener listener) {
    if (!listener) {
        return;
    }
    if (closed_) {
        listener();
        return;
    }
    closeListeners_.push_back(std::move(listener));
}

void fileutil::io::OutputStream::onError(ErrorListener listener) {
    if (!listener) {
        return;
    }
    if (lastError_) {
        listener(lastError_, lastErrorMessage_);
        return;
    }
    errorListeners_.push_back(std::move(listener));
}

void fileutil::io::OutputStream::emitError(const std::error_code& ec, const std::string& message) {
    if (lastError_) {
        return;
    }

    lastError_ = ec;
    lastErrorMessage_ = message;

    auto listeners = std::move(errorListeners_);
    errorListeners_.clear();
    for (auto& listener : listeners) {
        listener(ec, message);
    }
}

void fileutil::io::OutputStream::emitClose() {
    auto listeners = std::move(closeListeners_);
    closeListeners_.clear();
    for (auto& listener : listeners) {
        listener();
    }
}
