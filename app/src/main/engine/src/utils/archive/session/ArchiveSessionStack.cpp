// src/session/ArchiveSessionStack.cpp
#include "utils/archive/session/ArchiveSessionStack.hpp"
#include "utils/archive/common/Exceptions.hpp"
#include "utils/path_resolver.hpp"

fileutil::session::ArchiveSessionStack::ArchiveSessionStack()
    : MetricsBase("ARCHIVE_STACK"), tempCounter_(0) {}

// Unfinished sessions are released top first so children settle before parents.
fileutil::session::ArchiveSessionStack::~ArchiveSessionStack() {
    if (!sessions_.empty()) {
        logWarning("destroy", "Archive stack destroyed with open sessions", {{"depth", sessions_.size()}});
    }
    while (!sessions_.empty()) {
        sessions_.pop_back();
    }
}

std::shared_ptr<fileutil::session::ArchiveSession>
fileutil::session::ArchiveSessionStack::begin(const std::string& name,
                                              const std::string& format,
                                              const std::string& baseDirectory,
                                              bool foldIntoParent) {
    return measure("begin", [&]() {
        common::ArchiveFormat archiveFormat;
        try {
            archiveFormat = compression::ArchiveWriter::parseFormat(format);
        } catch (const common::UnsupportedFormatException& e) {
            logError("begin", e.what(), static_cast<int>(e.errorCode()), {{"format", format}});
            throw;
        }

        const std::string logicalPath = name + "." + compression::ArchiveWriter::formatExtension(archiveFormat);
        std::string resolved = PathResolver::resolve(baseDirectory, logicalPath);

        const bool folds = !sessions_.empty() && foldIntoParent;
        if (folds) {
            resolved = PathResolver::parentDirectory(resolved) + "/" +
                       common::Constants::TEMP_ARCHIVE_PREFIX + std::to_string(tempCounter_++);
        }

        directories_.ensureParentDirectory(resolved);

        auto session = std::make_shared<ArchiveSession>(logicalPath, resolved, archiveFormat, folds);
        sessions_.push_back(session);

        logInfo("begin", "Archive session pushed",
                {{"logical_path", logicalPath}, {"output", resolved}, {"depth", sessions_.size()}});
        return session;
    }, {{"name", name}, {"format", format}});
}

std::shared_future<void> fileutil::session::ArchiveSessionStack::finalize() {
    std::promise<void> done;
    std::shared_future<void> signal = done.get_future().share();

    // Callers report the empty case; FileEngine notifies through its sink.
    if (sessions_.empty()) {
        done.set_value();
        return signal;
    }

    std::shared_ptr<ArchiveSession> session = sessions_.back();
    sessions_.pop_back();

    try {
        if (session->foldsIntoParent() && !sessions_.empty()) {
            session->linkToParent(*sessions_.back());
        }
        session->close();
        done.set_value();
    } catch (const common::ArchiveException& e) {
        logCritical("finalize", e.what(), static_cast<int>(e.errorCode()),
                    {{"logical_path", session->getLogicalPath()}});
        throw;
    } catch (const common::FileUtilException& e) {
        logError("finalize", e.what(), static_cast<int>(e.errorCode()),
                 {{"logical_path", session->getLogicalPath()}});
        done.set_exception(std::current_exception());
    }

    return signal;
}

std::shared_ptr<fileutil::session::ArchiveSession> fileutil::session::ArchiveSessionStack::top() const {
    return sessions_.empty() ? nullptr : sessions_.back();
}
