// include/io/OutputStream.hpp
#ifndef FILEUTIL_OUTPUTSTREAM_HPP
#define FILEUTIL_OUTPUTSTREAM_HPP

#include "../common/Types.hpp"
#include "../common/ErrorCodes.hpp"
#include <cstdio>
#include <functional>
#include <string>
#include <system_error>
#include <vector>

namespace fileutil {
namespace io {

/**
 * File-backed byte sink with lifecycle events.
 *
 * Close listeners fire once when the file is closed. Error listeners fire once
 * on the first write/close failure. A listener registered after its event has
 * already happened is invoked immediately, so late subscribers never miss the
 * outcome.
 */
class OutputStream : public common::NonCopyable {
public:
    using CloseListener = std::function<void()>;
    using ErrorListener = std::function<void(const std::error_code&, const std::string&)>;

private:
    std::string filePath_;
    FILE* fileHandle_;
    size_t bytesWritten_;
    bool closed_;
    std::error_code lastError_;
    std::string lastErrorMessage_;
    std::vector<CloseListener> closeListeners_;
    std::vector<ErrorListener> errorListeners_;

public:
    explicit OutputStream(const std::string& filePath);
    ~OutputStream();

    OutputStream(OutputStream&&) = delete;
    OutputStream& operator=(OutputStream&&) = delete;

    std::error_code open();
    std::error_code write(const common::Byte* data, size_t size);
    std::error_code close();

    void onClose(CloseListener listener);
    void onError(ErrorListener listener);

    bool isOpen() const { return fileHandle_ != nullptr; }
    bool isClosed() const { return closed_; }
    bool failed() const { return static_cast<bool>(lastError_); }
    std::error_code lastError() const { return lastError_; }
    const std::string& lastErrorMessage() const { return lastErrorMessage_; }
    size_t bytesWritten() const { return bytesWritten_; }
    const std::string& getFilePath() const { return filePath_; }

private:
    void emitError(const std::error_code& ec, const std::string& message);
    void emitClose();
};

} // namespace io
} // namespace fileutil

#endif
