#ifndef FILEUTIL_DIRECTORY_ENGINE_HPP
#define FILEUTIL_DIRECTORY_ENGINE_HPP

#include "utils/metrics_base.hpp"
#include <string>
#include <cstdint>

namespace fileutil {

// Plain filesystem primitives used when no archive session is active.
// Failures are logged and raised as common::IOFailureException.
class DirectoryEngine : public MetricsBase {
public:
    DirectoryEngine() : MetricsBase("DIRECTORY_ENGINE") {}

    void ensureDirectory(const std::string& path);
    void ensureParentDirectory(const std::string& filePath);

    // Directories are copied recursively; existing destination files are overwritten.
    void copyRecursive(const std::string& source, const std::string& dest);

    // Removes every entry inside path, creating path when missing. Returns the number of entries removed.
    uint64_t cleanDirectory(const std::string& path);

    bool exists(const std::string& path) const;
    bool isDirectory(const std::string& path) const;

    static std::string getCurrentWorkingDirectory();
};

} // namespace fileutil

#endif
