#include "utils/directory_engine.hpp"
#include "utils/archive/common/Exceptions.hpp"
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

void fileutil::DirectoryEngine::ensureDirectory(const std::string& path) {
    if (path.empty()) {
        return;
    }

    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        logError("ensure_directory", "Failed to create directory",
                 static_cast<int>(common::ErrorCode::DIRECTORY_ERROR),
                 {{"path", path}, {"error", ec.message()}});
        throw common::IOFailureException("create directory '" + path + "': " + ec.message(),
                                         common::ErrorCode::DIRECTORY_ERROR);
    }
}

void fileutil::DirectoryEngine::ensureParentDirectory(const std::string& filePath) {
    ensureDirectory(fs::path(filePath).parent_path().string());
}

void fileutil::DirectoryEngine::copyRecursive(const std::string& source, const std::string& dest) {
    measure("copy_recursive", [&]() {
        std::error_code ec;
        const auto status = fs::status(source, ec);
        if (ec || !fs::exists(status)) {
            logError("copy_recursive", "Source does not exist",
                     static_cast<int>(common::ErrorCode::FILE_NOT_FOUND), {{"source", source}});
            throw common::IOFailureException("copy source '" + source + "' does not exist",
                                             common::ErrorCode::FILE_NOT_FOUND);
        }

        if (fs::is_directory(status)) {
            ensureDirectory(dest);
            fs::copy(source, dest, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
        } else {
            ensureParentDirectory(dest);
            fs::copy_file(source, dest, fs::copy_options::overwrite_existing, ec);
        }

        if (ec) {
            logError("copy_recursive", "Copy failed", static_cast<int>(common::ErrorCode::FILE_COPY_ERROR),
                     {{"source", source}, {"dest", dest}, {"error", ec.message()}});
            throw common::IOFailureException("copy '" + source + "' to '" + dest + "': " + ec.message(),
                                             common::ErrorCode::FILE_COPY_ERROR);
        }
    }, {{"source", source}, {"dest", dest}});
}

uint64_t fileutil::DirectoryEngine::cleanDirectory(const std::string& path) {
    return measure("clean_directory", [&]() -> uint64_t {
        ensureDirectory(path);

        std::error_code ec;
        std::vector<fs::path> entries;
        for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
            entries.push_back(it->path());
        }

        if (ec) {
            logError("clean_directory", "Failed to list directory",
                     static_cast<int>(common::ErrorCode::DIRECTORY_ERROR),
                     {{"path", path}, {"error", ec.message()}});
            throw common::IOFailureException("list '" + path + "': " + ec.message(),
                                             common::ErrorCode::DIRECTORY_ERROR);
        }

        uint64_t removed = 0;
        for (const auto& entry : entries) {
            fs::remove_all(entry, ec);
            if (ec) {
                logError("clean_directory", "Failed to remove entry",
                         static_cast<int>(common::ErrorCode::DIRECTORY_ERROR),
                         {{"path", entry.string()}, {"error", ec.message()}});
                throw common::IOFailureException("remove '" + entry.string() + "': " + ec.message(),
                                                 common::ErrorCode::DIRECTORY_ERROR);
            }
            ++removed;
        }

        logInfo("clean_directory", "Directory cleaned successfully",
                {{"path", path}, {"items_removed", removed}});
        return removed;
    }, {{"path", path}});
}

bool fileutil::DirectoryEngine::exists(const std::string& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool fileutil::DirectoryEngine::isDirectory(const std::string& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::string fileutil::DirectoryEngine::getCurrentWorkingDirectory() {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        throw common::IOFailureException("cannot read the current working directory: " + ec.message(),
                                         common::ErrorCode::DIRECTORY_ERROR);
    }
    return cwd.string();
}
