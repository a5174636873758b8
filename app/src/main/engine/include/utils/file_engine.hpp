#ifndef FILEUTIL_FILE_ENGINE_HPP
#define FILEUTIL_FILE_ENGINE_HPP

#include "utils/metrics_base.hpp"
#include "utils/file_options.hpp"
#include "utils/glob_engine.hpp"
#include "utils/directory_engine.hpp"
#include "utils/event_engine.hpp"
#include "utils/archive/common/Types.hpp"
#include "utils/archive/session/ArchiveSession.hpp"
#include "utils/archive/session/ArchiveSessionStack.hpp"
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fileutil {

/**
 * File output helpers that route into the active archive session when one is
 * open, and into the filesystem under options().relativePath otherwise.
 *
 * Progress messages ("output: <path>", "creating archive: <name>", ...) go to
 * the metrics log and, when set, to the notification sink.
 */
class FileEngine : public MetricsBase {
public:
    explicit FileEngine(const nlohmann::json& options = nlohmann::json::object());
    explicit FileEngine(const FileUtilOptions& options);
    ~FileEngine() override = default;

    FileEngine(const FileEngine&) = delete;
    FileEngine& operator=(const FileEngine&) = delete;

    // Archive sessions
    std::shared_ptr<session::ArchiveSession> archiveCreate(const std::string& destPath,
                                                           bool addToParent = true,
                                                           bool silent = false);
    std::shared_future<void> archiveFinalize(bool silent = false);
    size_t archiveDepth() const { return archives_.depth(); }

    // File I/O. An empty encoding selects options().encoding.
    void writeFile(const std::string& data, const std::string& fileName,
                   bool silent = false, const std::string& encoding = "");
    void writeFile(const common::ByteArray& data, const std::string& fileName, bool silent = false);
    void copy(const std::string& srcPath, const std::string& destPath, bool silent = false);

    // "<n>| <line>" for lines [lineStart, lineEnd) of filePath, clamped to the file.
    std::vector<std::string> readLines(const std::string& filePath, int64_t lineStart, int64_t lineEnd);

    // Reads fileName resolved like writeFile and encodes its bytes.
    std::string readFile(const std::string& fileName, const std::string& encoding = "");

    // Removes everything under the base directory unless it is, or contains,
    // the current working directory. Returns whether anything was emptied.
    bool emptyDirectory();

    // Globs
    HydrateResult hydrateGlob(const nlohmann::json& globs);
    HydrateResult hydrateGlob(const std::vector<std::string>& globs);

    // Options
    nlohmann::json getOptions() const;
    void setOptions(const nlohmann::json& options);
    const FileUtilOptions& options() const { return options_; }

    void setNotificationSink(std::shared_ptr<EventSystem::ILogger> sink);

private:
    void notify(const std::string& message);
    void applyMetrics();
    std::string resolveDestination(const std::string& path) const;
    void writeBytes(const common::ByteArray& bytes, const std::string& fileName, bool silent);

    FileUtilOptions options_;
    session::ArchiveSessionStack archives_;
    GlobEngine globs_;
    DirectoryEngine directories_;
    std::shared_ptr<EventSystem::ILogger> sink_;
};

} // namespace fileutil

#endif
