#include "utils/path_resolver.hpp"
#include "utils/archive/common/Exceptions.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace {

fs::path absoluteOf(const fs::path& path) {
    std::error_code ec;
    fs::path result = fs::absolute(path, ec);
    if (ec) {
        throw fileutil::common::IOFailureException("cannot resolve '" + path.string() + "': " + ec.message(),
                                                   fileutil::common::ErrorCode::DIRECTORY_ERROR);
    }
    return result.lexically_normal();
}

std::string withoutTrailingSeparator(const fs::path& path) {
    std::string text = path.string();
    while (text.size() > 1 && text.back() == '/') {
        text.pop_back();
    }
    return text;
}

} // namespace

std::string fileutil::PathResolver::resolve(const std::string& base, const std::string& path) {
    fs::path root = base.empty() ? fs::path(".") : fs::path(base);
    return withoutTrailingSeparator(absoluteOf(root / path));
}

std::string fileutil::PathResolver::basePath(const std::string& base) {
    return withoutTrailingSeparator(absoluteOf(base.empty() ? fs::path(".") : fs::path(base)));
}

std::string fileutil::PathResolver::parentDirectory(const std::string& path) {
    return fs::path(path).parent_path().string();
}

bool fileutil::PathResolver::isAncestorOrEqual(const std::string& ancestor, const std::string& path) {
    auto canonicalOf = [](const std::string& text) {
        fs::path absolute = absoluteOf(text);
        std::error_code ec;
        fs::path canonical = fs::weakly_canonical(absolute, ec);
        return fs::path(withoutTrailingSeparator(ec ? absolute : canonical));
    };

    const fs::path a = canonicalOf(ancestor);
    const fs::path p = canonicalOf(path);

    auto pi = p.begin();
    for (auto ai = a.begin(); ai != a.end(); ++ai, ++pi) {
        if (pi == p.end() || *ai != *pi) {
            return false;
        }
    }
    return true;
}
