#include "utils/glob_engine.hpp"
#include "utils/archive/common/Constants.hpp"
#include "utils/archive/common/Exceptions.hpp"
#include <fnmatch.h>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

int matchFlags() {
    int flags = FNM_PERIOD;
#ifdef FNM_EXTMATCH
    flags |= FNM_EXTMATCH;
#endif
    return flags;
}

std::string joinPath(const std::string& base, const std::string& name) {
    if (base.empty() || base.back() == '/') {
        return base + name;
    }
    return base + "/" + name;
}

std::string unescape(const std::string& segment) {
    std::string out;
    out.reserve(segment.size());
    for (size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '\\' && i + 1 < segment.size()) {
            ++i;
        }
        out.push_back(segment[i]);
    }
    return out;
}

std::vector<std::string> splitSegments(const std::string& pattern) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= pattern.size()) {
        size_t slash = pattern.find('/', start);
        if (slash == std::string::npos) slash = pattern.size();
        if (slash > start) {
            segments.push_back(pattern.substr(start, slash - start));
        }
        start = slash + 1;
    }
    return segments;
}

// Index of the '}' closing the '{' at open, or npos.
size_t findClosingBrace(const std::string& pattern, size_t open) {
    int depth = 0;
    for (size_t i = open; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '\\') {
            ++i;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) return i;
        }
    }
    return std::string::npos;
}

std::vector<std::string> splitAlternatives(const std::string& body) {
    std::vector<std::string> parts;
    std::string current;
    int depth = 0;
    for (size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c == '\\' && i + 1 < body.size()) {
            current.push_back(c);
            current.push_back(body[++i]);
            continue;
        }
        if (c == '{') ++depth;
        if (c == '}') --depth;
        if (c == ',' && depth == 0) {
            parts.push_back(current);
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    parts.push_back(current);
    return parts;
}

bool isInteger(const std::string& text) {
    size_t start = (!text.empty() && text[0] == '-') ? 1 : 0;
    if (start == text.size() || text.size() - start > 9) return false;
    return std::all_of(text.begin() + static_cast<long>(start), text.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

// "1..3" -> {1,2,3}, "c..a" -> {c,b,a}. Empty when body is not a range.
std::vector<std::string> expandRange(const std::string& body) {
    size_t dots = body.find("..");
    if (dots == std::string::npos) return {};

    std::string from = body.substr(0, dots);
    std::string to = body.substr(dots + 2);
    std::vector<std::string> out;

    if (isInteger(from) && isInteger(to)) {
        long a = std::stol(from);
        long b = std::stol(to);
        const unsigned long span = static_cast<unsigned long>(a <= b ? b - a : a - b) + 1;
        if (span > fileutil::common::Constants::MAX_BRACE_EXPANSION) {
            throw fileutil::common::InvalidArgumentException(
                "brace range '{" + body + "}' expands to " + std::to_string(span) + " patterns",
                fileutil::common::ErrorCode::INVALID_GLOB);
        }
        long step = a <= b ? 1 : -1;
        for (long v = a;; v += step) {
            out.push_back(std::to_string(v));
            if (v == b) break;
        }
    } else if (from.size() == 1 && to.size() == 1 &&
               std::isalpha(static_cast<unsigned char>(from[0])) &&
               std::isalpha(static_cast<unsigned char>(to[0]))) {
        int step = from[0] <= to[0] ? 1 : -1;
        for (char c = from[0];; c = static_cast<char>(c + step)) {
            out.push_back(std::string(1, c));
            if (c == to[0]) break;
        }
    }
    return out;
}

} // namespace

bool fileutil::GlobEngine::isGlob(const std::string& entry) {
    for (size_t i = 0; i < entry.size(); ++i) {
        char c = entry[i];
        switch (c) {
            case '\\':
                ++i;
                break;
            case '*':
            case '?':
                return true;
            case '[':
                if (entry.find(']', i + 1) != std::string::npos) return true;
                break;
            case '{':
                if (entry.find('}', i + 1) != std::string::npos) return true;
                break;
            case '@':
            case '!':
            case '+':
                if (i + 1 < entry.size() && entry[i + 1] == '(' &&
                    entry.find(')', i + 2) != std::string::npos) {
                    return true;
                }
                break;
            default:
                break;
        }
    }
    return false;
}

std::string fileutil::GlobEngine::toRecursiveGlob(const std::string& path) {
    if (!path.empty() && (path.back() == '/' || path.back() == '\\')) {
        const char sep = path.back();
        return path + "**" + sep + "*";
    }
    return path + "/**/*";
}

std::vector<std::string> fileutil::GlobEngine::expandBraces(const std::string& pattern) {
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '\\') {
            ++i;
            continue;
        }
        if (pattern[i] != '{') continue;

        size_t close = findClosingBrace(pattern, i);
        if (close == std::string::npos) {
            break;
        }

        const std::string body = pattern.substr(i + 1, close - i - 1);
        std::vector<std::string> alternatives = splitAlternatives(body);
        if (alternatives.size() < 2) {
            alternatives = expandRange(body);
            if (alternatives.empty()) {
                continue;
            }
        }

        const std::string prefix = pattern.substr(0, i);
        const std::string suffix = pattern.substr(close + 1);

        std::vector<std::string> result;
        for (const auto& alt : alternatives) {
            for (auto& expanded : expandBraces(prefix + alt + suffix)) {
                result.push_back(std::move(expanded));
            }
            if (result.size() > common::Constants::MAX_BRACE_EXPANSION) {
                throw common::InvalidArgumentException("brace expansion of '" + pattern + "' is too large",
                                                       common::ErrorCode::INVALID_GLOB);
            }
        }
        return result;
    }

    return {pattern};
}

std::vector<std::string> fileutil::GlobEngine::expand(const std::string& absolutePattern) {
    std::vector<std::string> out;
    matchSegments(splitSegments(absolutePattern), 0, "/", out);

    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

void fileutil::GlobEngine::matchSegments(const std::vector<std::string>& segments, size_t index,
                                         const std::string& base, std::vector<std::string>& out) {
    if (index == segments.size()) {
        out.push_back(base);
        return;
    }

    const std::string& segment = segments[index];
    const bool last = index + 1 == segments.size();
    std::error_code ec;

    if (segment == "**") {
        if (last) {
            out.push_back(base);
            collectDescendants(base, true, out);
            return;
        }

        std::vector<std::string> dirs{base};
        collectDescendants(base, false, dirs);
        for (const auto& dir : dirs) {
            matchSegments(segments, index + 1, dir, out);
        }
        return;
    }

    if (!isGlob(segment)) {
        const std::string path = joinPath(base, unescape(segment));
        if (last) {
            if (fs::exists(fs::symlink_status(path, ec))) {
                out.push_back(path);
            }
        } else if (fs::is_directory(path, ec)) {
            matchSegments(segments, index + 1, path, out);
        }
        return;
    }

    if (!fs::is_directory(base, ec)) {
        return;
    }

    std::vector<std::string> matches;
    for (fs::directory_iterator it(base, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (fnmatch(segment.c_str(), name.c_str(), matchFlags()) == 0) {
            matches.push_back(joinPath(base, name));
        }
    }
    if (ec) {
        logWarning("expand", "Directory listing failed", {{"path", base}, {"error", ec.message()}});
    }

    std::sort(matches.begin(), matches.end());
    for (const auto& path : matches) {
        if (last) {
            out.push_back(path);
        } else if (fs::is_directory(path, ec)) {
            matchSegments(segments, index + 1, path, out);
        }
    }
}

void fileutil::GlobEngine::collectDescendants(const std::string& dir, bool includeFiles,
                                              std::vector<std::string>& out) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return;
    }

    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        const bool isDir = it->is_directory(ec);

        if (!name.empty() && name[0] == '.') {
            if (isDir) it.disable_recursion_pending();
            continue;
        }

        if (isDir || includeFiles) {
            out.push_back(it->path().string());
        }
    }
    if (ec) {
        logWarning("expand", "Recursive listing failed", {{"path", dir}, {"error", ec.message()}});
    }
}

fileutil::HydrateResult fileutil::GlobEngine::hydrate(const nlohmann::json& globs) {
    std::vector<std::string> entries;

    if (globs.is_string()) {
        entries.push_back(globs.get<std::string>());
    } else if (globs.is_array()) {
        for (const auto& entry : globs) {
            if (!entry.is_string()) {
                logError("hydrate_glob", "Array entry is not a string",
                         static_cast<int>(common::ErrorCode::INVALID_GLOB), {{"entry", entry}});
                throw common::InvalidArgumentException("'globs' array entry is not a 'string': " + entry.dump(),
                                                       common::ErrorCode::INVALID_GLOB);
            }
            entries.push_back(entry.get<std::string>());
        }
    } else {
        logError("hydrate_glob", "Input is not a string or an array",
                 static_cast<int>(common::ErrorCode::INVALID_GLOB), {{"type", globs.type_name()}});
        throw common::InvalidArgumentException("'globs' is not a 'string' or an 'array'.",
                                               common::ErrorCode::INVALID_GLOB);
    }

    return hydrate(entries);
}

fileutil::HydrateResult fileutil::GlobEngine::hydrate(const std::vector<std::string>& globs) {
    return measure("hydrate_glob", [&]() {
        HydrateResult result;

        for (const auto& entry : globs) {
            if (entry.empty()) {
                throw common::InvalidArgumentException("'globs' entry is an empty string",
                                                       common::ErrorCode::INVALID_GLOB);
            }

            const std::string effective = isGlob(entry) ? entry : toRecursiveGlob(entry);
            result.globs.push_back(effective);

            std::vector<std::string> matches;
            for (const auto& alternative : expandBraces(effective)) {
                std::error_code ec;
                fs::path absolute = fs::absolute(alternative, ec);
                if (ec) {
                    throw common::IOFailureException("cannot resolve '" + alternative + "': " + ec.message(),
                                                     common::ErrorCode::DIRECTORY_ERROR);
                }
                auto found = expand(absolute.lexically_normal().string());
                matches.insert(matches.end(), found.begin(), found.end());
            }

            std::sort(matches.begin(), matches.end());
            matches.erase(std::unique(matches.begin(), matches.end()), matches.end());

            for (auto& match : matches) {
                std::error_code ec;
                if (fs::is_regular_file(match, ec)) {
                    result.files.push_back(std::move(match));
                }
            }
        }

        logDebug("hydrate_glob", "Globs hydrated",
                 {{"globs", result.globs}, {"file_count", result.files.size()}});
        return result;
    }, {{"entries", globs.size()}});
}
