#include "utils/file_engine.hpp"
#include "utils/encoding.hpp"
#include "utils/path_resolver.hpp"
#include "utils/archive/common/Exceptions.hpp"
#include "utils/archive/io/FileHandler.hpp"
#include "utils/archive/io/OutputStream.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

fileutil::FileEngine::FileEngine(const nlohmann::json& options)
    : MetricsBase("FILE_ENGINE") {
    options_.apply(options);
    if (options.contains("metrics")) {
        applyMetrics();
    }
}

fileutil::FileEngine::FileEngine(const FileUtilOptions& options)
    : MetricsBase("FILE_ENGINE"), options_(options) {
    if (!options_.metrics.directory.empty()) {
        applyMetrics();
    }
}

std::shared_ptr<fileutil::session::ArchiveSession>
fileutil::FileEngine::archiveCreate(const std::string& destPath, bool addToParent, bool silent) {
    if (!silent) {
        notify("creating archive: " + destPath);
    }
    return archives_.begin(destPath, options_.compressFormat, options_.relativePath, addToParent);
}

std::shared_future<void> fileutil::FileEngine::archiveFinalize(bool silent) {
    auto current = archives_.top();
    if (!current) {
        notify("No active archive to finalize.");
    } else if (!silent) {
        notify("finalizing archive: " + current->getLogicalPath());
    }
    return archives_.finalize();
}

void fileutil::FileEngine::writeFile(const std::string& data, const std::string& fileName,
                                     bool silent, const std::string& encoding) {
    const auto enc = encoding::parse(encoding.empty() ? options_.encoding : encoding);
    writeBytes(encoding::decode(data, enc), fileName, silent);
}

void fileutil::FileEngine::writeFile(const common::ByteArray& data, const std::string& fileName, bool silent) {
    writeBytes(data, fileName, silent);
}

void fileutil::FileEngine::writeBytes(const common::ByteArray& bytes, const std::string& fileName, bool silent) {
    measure("write_file", [&]() {
        if (!silent) {
            notify("output: " + fileName);
        }

        if (auto active = archives_.top()) {
            active->appendData(bytes, fileName);
            return;
        }

        const std::string resolved = resolveDestination(fileName);
        directories_.ensureParentDirectory(resolved);

        io::OutputStream out(resolved);
        if (auto ec = out.open()) {
            throw common::IOFailureException("open '" + resolved + "': " + out.lastErrorMessage(),
                                             common::ErrorCode::FILE_WRITE_ERROR);
        }
        if (auto ec = out.write(bytes.data(), bytes.size())) {
            const std::string message = out.lastErrorMessage();
            if (auto closeEc = out.close()) {
                logWarning("write_file", "Closing output after a failed write also failed",
                           {{"path", resolved}, {"error", closeEc.message()}});
            }
            throw common::IOFailureException("write '" + resolved + "': " + message,
                                             common::ErrorCode::FILE_WRITE_ERROR);
        }
        if (auto ec = out.close()) {
            throw common::IOFailureException("close '" + resolved + "': " + out.lastErrorMessage(),
                                             common::ErrorCode::FILE_WRITE_ERROR);
        }
    }, {{"path", fileName}, {"bytes", bytes.size()}});
}

void fileutil::FileEngine::copy(const std::string& srcPath, const std::string& destPath, bool silent) {
    measure("copy", [&]() {
        if (!silent) {
            notify("output: " + destPath);
        }

        if (auto active = archives_.top()) {
            std::error_code ec;
            const auto status = fs::status(srcPath, ec);
            if (ec || !fs::exists(status)) {
                throw common::IOFailureException("copy: source '" + srcPath + "' does not exist",
                                                 common::ErrorCode::FILE_NOT_FOUND);
            }
            if (fs::is_directory(status)) {
                active->appendDirectory(srcPath, destPath);
            } else {
                active->appendFile(srcPath, destPath);
            }
            return;
        }

        directories_.copyRecursive(srcPath, resolveDestination(destPath));
    }, {{"source", srcPath}, {"dest", destPath}});
}

std::vector<std::string> fileutil::FileEngine::readLines(const std::string& filePath,
                                                         int64_t lineStart, int64_t lineEnd) {
    return measure("read_lines", [&]() {
        io::FileHandler handler(filePath);
        if (auto ec = handler.openForRead()) {
            throw common::IOFailureException("read: cannot open '" + filePath + "': " + ec.message(),
                                             common::ErrorCode::FILE_NOT_FOUND);
        }
        common::ByteArray buffer;
        if (auto ec = handler.readAll(buffer)) {
            throw common::IOFailureException("read '" + filePath + "': " + ec.message(),
                                             common::ErrorCode::FILE_READ_ERROR);
        }
        handler.close();

        std::vector<std::string> lines;
        const std::string text = common::toString(buffer);
        size_t begin = 0;
        while (true) {
            const size_t end = text.find('\n', begin);
            if (end == std::string::npos) {
                lines.push_back(text.substr(begin));
                break;
            }
            lines.push_back(text.substr(begin, end - begin));
            begin = end + 1;
        }

        const int64_t count = static_cast<int64_t>(lines.size());
        const int64_t first = std::clamp<int64_t>(lineStart, 0, count);
        const int64_t last = std::clamp<int64_t>(lineEnd, first, count);

        std::vector<std::string> result;
        result.reserve(static_cast<size_t>(last - first));
        for (int64_t i = first; i < last; ++i) {
            result.push_back(std::to_string(i + 1) + "| " + lines[static_cast<size_t>(i)]);
        }
        return result;
    }, {{"path", filePath}, {"start", lineStart}, {"end", lineEnd}});
}

std::string fileutil::FileEngine::readFile(const std::string& fileName, const std::string& encoding) {
    const auto enc = encoding::parse(encoding.empty() ? options_.encoding : encoding);
    const std::string resolved = resolveDestination(fileName);

    return measure("read_file", [&]() {
        io::FileHandler handler(resolved);
        if (auto ec = handler.openForRead()) {
            throw common::IOFailureException("read: cannot open '" + resolved + "': " + ec.message(),
                                             common::ErrorCode::FILE_NOT_FOUND);
        }
        common::ByteArray buffer;
        if (auto ec = handler.readAll(buffer)) {
            throw common::IOFailureException("read '" + resolved + "': " + ec.message(),
                                             common::ErrorCode::FILE_READ_ERROR);
        }
        return encoding::encode(buffer, enc);
    }, {{"path", resolved}, {"encoding", encoding::toString(enc)}});
}

bool fileutil::FileEngine::emptyDirectory() {
    const std::string base = PathResolver::basePath(options_.relativePath);
    const std::string cwd = DirectoryEngine::getCurrentWorkingDirectory();

    if (PathResolver::isAncestorOrEqual(base, cwd)) {
        logWarning("empty_directory", "Refusing to empty a directory containing the working directory",
                   {{"path", base}, {"cwd", cwd}});
        notify("emptyDirectory: refusing to empty '" + base + "' as it contains the current working directory.");
        return false;
    }

    const uint64_t removed = directories_.cleanDirectory(base);
    logInfo("empty_directory", "Directory emptied", {{"path", base}, {"removed", removed}});
    return true;
}

fileutil::HydrateResult fileutil::FileEngine::hydrateGlob(const nlohmann::json& globs) {
    return globs_.hydrate(globs);
}

fileutil::HydrateResult fileutil::FileEngine::hydrateGlob(const std::vector<std::string>& globs) {
    return globs_.hydrate(globs);
}

nlohmann::json fileutil::FileEngine::getOptions() const {
    return options_.toJson();
}

void fileutil::FileEngine::setOptions(const nlohmann::json& options) {
    options_.apply(options);
    if (options.contains("metrics")) {
        applyMetrics();
    }
    logDebug("set_options", "Options updated", options_.toJson());
}

// The metrics engine is process-wide; without a directory it keeps its current storage.
void fileutil::FileEngine::applyMetrics() {
    const MetricsOptions& settings = options_.metrics;
    metrics_.setMinimumLevel(settings.minLevel);
    if (settings.directory.empty()) {
        return;
    }

    if (!metrics_.configure(settings.toStorageConfig())) {
        throw common::IOFailureException("cannot open metrics log under '" + settings.directory + "'",
                                         common::ErrorCode::FILE_WRITE_ERROR);
    }
    logInfo("set_options", "Metrics storage configured",
            {{"directory", settings.directory}, {"file", metrics_.storagePath()}});
}

void fileutil::FileEngine::setNotificationSink(std::shared_ptr<EventSystem::ILogger> sink) {
    sink_ = std::move(sink);
}

void fileutil::FileEngine::notify(const std::string& message) {
    logInfo("notify", message);
    if (sink_) {
        sink_->log(EventSystem::ILogger::Level::Info, message);
    }
}

std::string fileutil::FileEngine::resolveDestination(const std::string& path) const {
    return PathResolver::resolve(options_.relativePath, path);
}
