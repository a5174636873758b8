#ifndef FILEUTIL_PATH_RESOLVER_HPP
#define FILEUTIL_PATH_RESOLVER_HPP

#include <string>

namespace fileutil {

class PathResolver {
public:
    // Absolute, lexically normalized form of path against base. An empty base
    // means the current working directory; an absolute path ignores base.
    static std::string resolve(const std::string& base, const std::string& path);

    static std::string basePath(const std::string& base);

    static std::string parentDirectory(const std::string& path);

    // True when ancestor equals path or contains it, after resolving symlinks
    // of the existing prefix of each.
    static bool isAncestorOrEqual(const std::string& ancestor, const std::string& path);
};

} // namespace fileutil

#endif
