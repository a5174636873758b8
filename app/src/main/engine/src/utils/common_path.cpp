#include "utils/common_path.hpp"
#include "utils/archive/common/Exceptions.hpp"
#include <algorithm>

namespace {

std::vector<std::string> splitSegments(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return segments;
}

} // namespace

std::string fileutil::commonPath(const std::vector<std::string>& paths) {
    if (paths.empty()) {
        return {};
    }

    std::vector<std::vector<std::string>> split;
    split.reserve(paths.size());
    for (const auto& path : paths) {
        split.push_back(splitSegments(path));
    }

    const auto& first = split.front();
    size_t shared = 0;
    for (; shared < first.size(); ++shared) {
        bool allMatch = std::all_of(split.begin() + 1, split.end(), [&](const std::vector<std::string>& segs) {
            return shared < segs.size() && segs[shared] == first[shared];
        });
        if (!allMatch) {
            break;
        }
    }

    if (shared == 0) {
        return {};
    }

    std::string result;
    for (size_t i = 0; i < shared; ++i) {
        result += first[i];
        result += '/';
    }
    return result;
}

std::string fileutil::commonMappedPath(const std::string& key, const nlohmann::json& records) {
    if (!records.is_array()) {
        throw common::InvalidArgumentException("commonMappedPath: records must be an array, got " +
                                               std::string(records.type_name()));
    }

    std::vector<std::string> paths;
    for (const auto& record : records) {
        if (!record.is_object()) continue;

        auto it = record.find(key);
        if (it != record.end() && it->is_string()) {
            paths.push_back(it->get<std::string>());
        }
    }

    return commonPath(paths);
}
