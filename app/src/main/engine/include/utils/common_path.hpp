#ifndef FILEUTIL_COMMON_PATH_HPP
#define FILEUTIL_COMMON_PATH_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fileutil {

/**
 * Longest run of leading '/'-separated segments shared by every path, joined
 * back with a trailing '/'. Returns "" for no input or no shared segment.
 *
 *   commonPath("/a/b/c/x.js", "/a/b/d/y.js")  -> "/a/b/"
 *   commonPath("../../a/x.js", "../../b/y.js") -> "../../"
 */
std::string commonPath(const std::vector<std::string>& paths);

inline std::string commonPath() {
    return {};
}

template<typename... Paths>
std::string commonPath(const std::string& first, const Paths&... rest) {
    return commonPath(std::vector<std::string>{first, std::string(rest)...});
}

// commonPath over records[i][key]; records without a string at key are skipped.
// Throws InvalidArgumentException when records is not an array.
std::string commonMappedPath(const std::string& key, const nlohmann::json& records);

} // namespace fileutil

#endif
