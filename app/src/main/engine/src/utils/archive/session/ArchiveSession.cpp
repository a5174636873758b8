// src/session/ArchiveSession.cpp
#include "utils/archive/session/ArchiveSession.hpp"
#include "utils/archive/common/Exceptions.hpp"
#include <filesystem>

void fileutil::session::ArchiveSession::MergeCompletion::resolve(const common::MergeResult& result) {
    if (settled) {
        return;
    }
    settled = true;
    promise.set_value(result);
}

void fileutil::session::ArchiveSession::MergeCompletion::reject(std::exception_ptr error) {
    if (settled) {
        return;
    }
    settled = true;
    promise.set_exception(error);
}

fileutil::session::ArchiveSession::ArchiveSession(const std::string& logicalPath,
                                                  const std::string& resolvedOutputPath,
                                                  common::ArchiveFormat format,
                                                  bool foldIntoParent,
                                                  int level)
    : MetricsBase("ARCHIVE_SESSION"),
      logicalPath_(logicalPath),
      resolvedOutputPath_(resolvedOutputPath),
      format_(format),
      foldIntoParent_(foldIntoParent),
      state_(common::SessionState::Open),
      outputStream_(std::make_shared<io::OutputStream>(resolvedOutputPath)) {
    if (auto ec = outputStream_->open()) {
        logError("open", "Failed to open archive output", ec.value(),
                 {{"path", resolvedOutputPath_}, {"error", outputStream_->lastErrorMessage()}});
        throw common::IOFailureException(outputStream_->lastErrorMessage(), common::ErrorCode::FILE_WRITE_ERROR);
    }

    try {
        writer_ = std::make_unique<compression::ArchiveWriter>(format, outputStream_, level);
    } catch (...) {
        state_ = common::SessionState::Closed;
        if (auto ec = outputStream_->close()) {
            logWarning("open", "Closing output after a failed open also failed",
                       {{"path", resolvedOutputPath_}, {"error", ec.message()}});
        }
        removeOwnOutput();
        throw;
    }

    logDebug("open", "Archive session opened",
             {{"logical_path", logicalPath_}, {"output", resolvedOutputPath_}, {"fold", foldIntoParent_}});
}

fileutil::session::ArchiveSession::~ArchiveSession() {
    if (state_ == common::SessionState::Closed) {
        return;
    }

    logWarning("destroy", "Archive session destroyed before finalize", {{"logical_path", logicalPath_}});
    fail(std::make_exception_ptr(common::UsageErrorException(
        "archive session '" + logicalPath_ + "' was destroyed before it was finalized",
        common::ErrorCode::SESSION_NOT_OPEN)));
    if (foldIntoParent_ && !completion_) {
        removeOwnOutput();
    }
}

void fileutil::session::ArchiveSession::requireOpen(const char* operation) const {
    if (state_ != common::SessionState::Open) {
        throw common::UsageErrorException(std::string(operation) + ": archive session '" + logicalPath_ +
                                          "' is no longer open",
                                          common::ErrorCode::SESSION_NOT_OPEN);
    }
}

void fileutil::session::ArchiveSession::appendData(const common::ByteArray& data, const std::string& entryName) {
    requireOpen("write");
    writer_->appendData(data, entryName);
}

void fileutil::session::ArchiveSession::appendFile(const std::string& sourcePath, const std::string& entryName) {
    requireOpen("copy");
    writer_->appendFile(sourcePath, entryName);
}

void fileutil::session::ArchiveSession::appendDirectory(const std::string& sourceDir, const std::string& entryPrefix) {
    requireOpen("copy");
    writer_->appendDirectory(sourceDir, entryPrefix);
}

void fileutil::session::ArchiveSession::linkToParent(ArchiveSession& parent) {
    requireOpen("link");
    if (completion_) {
        throw common::UsageErrorException("archive session '" + logicalPath_ + "' is already linked to a parent");
    }

    auto completion = std::make_shared<MergeCompletion>();
    parent.addPendingChild(completion->promise.get_future().share());
    completion_ = completion;

    const common::MergeResult result{resolvedOutputPath_, logicalPath_};
    const std::string path = resolvedOutputPath_;

    // Error listeners run before close listeners, so a failed close rejects.
    outputStream_->onError([completion, path](const std::error_code& ec, const std::string& message) {
        completion->reject(std::make_exception_ptr(common::IOFailureException(
            message.empty() ? "stream error on '" + path + "'" : message,
            static_cast<common::ErrorCode>(ec.value()))));
    });
    outputStream_->onClose([completion, result]() {
        completion->resolve(result);
    });
}

void fileutil::session::ArchiveSession::addPendingChild(std::shared_future<common::MergeResult> child) {
    requireOpen("register child");
    pendingChildren_.push_back(std::move(child));
}

void fileutil::session::ArchiveSession::close() {
    if (state_ != common::SessionState::Open) {
        throw common::UsageErrorException("finalize: archive session '" + logicalPath_ + "' was already finalized",
                                          common::ErrorCode::SESSION_ALREADY_FINALIZED);
    }
    state_ = common::SessionState::Closing;

    try {
        mergeChildren();
        writer_->finalize();
        state_ = common::SessionState::Closed;
    } catch (...) {
        fail(std::current_exception());
        throw;
    }

    logInfo("close", "Archive session finalized",
            {{"logical_path", logicalPath_}, {"output", resolvedOutputPath_},
             {"entries", writer_->getEntryCount()}, {"bytes", outputStream_->bytesWritten()}});
}

void fileutil::session::ArchiveSession::mergeChildren() {
    auto batch = createBatchOperation("merge_children", pendingChildren_.size());

    std::vector<common::MergeResult> merged;
    std::exception_ptr firstFailure;

    for (auto& child : pendingChildren_) {
        try {
            merged.push_back(child.get());
        } catch (const std::exception& e) {
            batch->itemFailed();
            logError("merge_children", "Child archive failed", 0,
                     {{"logical_path", logicalPath_}, {"error", e.what()}});
            if (!firstFailure) {
                firstFailure = std::current_exception();
            }
        }
    }

    if (firstFailure) {
        for (const auto& result : merged) {
            std::error_code ec;
            std::filesystem::remove(result.resolvedOutputPath, ec);
            batch->itemProcessed(!ec);
        }
        std::rethrow_exception(firstFailure);
    }

    for (size_t i = 0; i < merged.size(); ++i) {
        const auto& result = merged[i];
        try {
            writer_->appendFile(result.resolvedOutputPath, result.logicalPath);
        } catch (...) {
            batch->itemFailed();
            for (size_t j = i; j < merged.size(); ++j) {
                std::error_code ec;
                std::filesystem::remove(merged[j].resolvedOutputPath, ec);
            }
            throw;
        }

        std::error_code ec;
        std::filesystem::remove(result.resolvedOutputPath, ec);
        if (ec) {
            batch->itemFailed();
            throw common::IOFailureException("remove temporary archive '" + result.resolvedOutputPath + "': " +
                                             ec.message(),
                                             common::ErrorCode::FILE_WRITE_ERROR);
        }
        batch->itemProcessed();
    }
}

void fileutil::session::ArchiveSession::fail(std::exception_ptr error) noexcept {
    state_ = common::SessionState::Closed;

    if (completion_) {
        completion_->reject(error);
    }

    if (writer_) {
        if (auto ec = writer_->abort()) {
            logWarning("abort", "Closing output after a failure also failed",
                       {{"path", resolvedOutputPath_}, {"error", ec.message()}});
        }
    }

    if (completion_) {
        removeOwnOutput();
    }
}

void fileutil::session::ArchiveSession::removeOwnOutput() noexcept {
    std::error_code ec;
    std::filesystem::remove(resolvedOutputPath_, ec);
    if (ec) {
        logWarning("cleanup", "Failed to remove archive output",
                   {{"path", resolvedOutputPath_}, {"error", ec.message()}});
    }
}
