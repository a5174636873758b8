// include/session/ArchiveSession.hpp
#ifndef FILEUTIL_ARCHIVESESSION_HPP
#define FILEUTIL_ARCHIVESESSION_HPP

#include "../common/Types.hpp"
#include "../common/Constants.hpp"
#include "../compression/ArchiveWriter.hpp"
#include "../io/OutputStream.hpp"
#include "utils/metrics_base.hpp"
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace fileutil {
namespace session {

/**
 * One in-progress archive: a libarchive handle writing into an OutputStream.
 *
 * A session that folds into a parent writes to a temporary file. When it is
 * linked to its parent, the parent receives a completion that resolves with
 * {resolvedOutputPath, logicalPath} once this session's output stream closes,
 * or rejects if the stream or the close itself fails. close() waits for every
 * registered child, splices each child's file in under its logical path and
 * deletes it, then finalizes the handle.
 */
class ArchiveSession : public MetricsBase, public common::NonCopyable {
private:
    // Settles a child's completion exactly once.
    struct MergeCompletion {
        std::promise<common::MergeResult> promise;
        bool settled = false;

        void resolve(const common::MergeResult& result);
        void reject(std::exception_ptr error);
    };

    std::string logicalPath_;
    std::string resolvedOutputPath_;
    common::ArchiveFormat format_;
    bool foldIntoParent_;
    common::SessionState state_;

    std::shared_ptr<io::OutputStream> outputStream_;
    std::unique_ptr<compression::ArchiveWriter> writer_;
    std::vector<std::shared_future<common::MergeResult>> pendingChildren_;
    std::shared_ptr<MergeCompletion> completion_;

public:
    ArchiveSession(const std::string& logicalPath,
                   const std::string& resolvedOutputPath,
                   common::ArchiveFormat format,
                   bool foldIntoParent,
                   int level = common::Constants::DEFAULT_COMPRESSION_LEVEL);
    ~ArchiveSession() override;

    ArchiveSession(ArchiveSession&&) = delete;
    ArchiveSession& operator=(ArchiveSession&&) = delete;

    void appendData(const common::ByteArray& data, const std::string& entryName);
    void appendFile(const std::string& sourcePath, const std::string& entryName);
    void appendDirectory(const std::string& sourceDir, const std::string& entryPrefix);

    void linkToParent(ArchiveSession& parent);
    void addPendingChild(std::shared_future<common::MergeResult> child);

    // Open -> Closing -> Closed. Throws UsageErrorException unless Open.
    void close();

    const std::string& getLogicalPath() const { return logicalPath_; }
    const std::string& getResolvedOutputPath() const { return resolvedOutputPath_; }
    common::ArchiveFormat getFormat() const { return format_; }
    bool foldsIntoParent() const { return foldIntoParent_; }
    bool isLinkedToParent() const { return completion_ != nullptr; }
    common::SessionState getState() const { return state_; }
    size_t getPendingChildCount() const { return pendingChildren_.size(); }
    size_t getEntryCount() const { return writer_ ? writer_->getEntryCount() : 0; }

private:
    void requireOpen(const char* operation) const;
    void mergeChildren();
    void fail(std::exception_ptr error) noexcept;
    void removeOwnOutput() noexcept;
};

} // namespace session
} // namespace fileutil

#endif
