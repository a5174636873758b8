#ifndef FILEUTIL_GLOB_ENGINE_HPP
#define FILEUTIL_GLOB_ENGINE_HPP

#include "utils/metrics_base.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fileutil {

struct HydrateResult {
    std::vector<std::string> files;
    // Effective patterns in input order, after bare paths were rewritten.
    std::vector<std::string> globs;
};

/**
 * Expands paths and glob patterns into a list of regular files.
 *
 * A bare path is rewritten into a recursive all-files pattern anchored at it
 * (reusing a trailing '/' or '\' when present), so a directory enumerates every
 * file below it. Patterns are resolved against the current working directory,
 * brace sets are expanded, and each '/'-separated segment is matched with
 * fnmatch(3). Leading dots are only matched explicitly and "**" never descends
 * into dot-directories.
 */
class GlobEngine : public MetricsBase {
public:
    GlobEngine() : MetricsBase("GLOB_ENGINE") {}

    // Accepts a string or an array of strings; anything else throws
    // common::InvalidArgumentException.
    HydrateResult hydrate(const nlohmann::json& globs);
    HydrateResult hydrate(const std::vector<std::string>& globs);

    static bool isGlob(const std::string& entry);
    static std::string toRecursiveGlob(const std::string& path);
    static std::vector<std::string> expandBraces(const std::string& pattern);

    // Every filesystem path (files and directories) matching an absolute pattern, sorted.
    std::vector<std::string> expand(const std::string& absolutePattern);

private:
    void matchSegments(const std::vector<std::string>& segments, size_t index,
                       const std::string& base, std::vector<std::string>& out);
    void collectDescendants(const std::string& dir, bool includeFiles, std::vector<std::string>& out);
};

} // namespace fileutil

#endif
