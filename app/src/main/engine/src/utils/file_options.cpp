#include "utils/file_options.hpp"
#include "utils/archive/common/Exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace {

const char* formatName(metrics::StorageFormat format) {
    return format == metrics::StorageFormat::JSON ? "json" : "text";
}

// Non-negative integers only; anything else leaves target unchanged.
template <typename T>
void readCount(const nlohmann::json& options, const char* key, T& target) {
    auto it = options.find(key);
    if (it != options.end() && it->is_number_integer() && it->get<int64_t>() >= 0) {
        target = it->get<T>();
    }
}

} // namespace

// Validates every key before assigning any, so a bad name leaves the options untouched.
void fileutil::MetricsOptions::apply(const nlohmann::json& options) {
    MetricsOptions next = *this;

    auto it = options.find("directory");
    if (it != options.end() && it->is_string()) {
        next.directory = it->get<std::string>();
    }

    it = options.find("format");
    if (it != options.end() && it->is_string() && !metrics::parseFormat(it->get<std::string>(), next.format)) {
        throw common::InvalidArgumentException("setOptions: unknown metrics format '" + it->get<std::string>() + "'",
                                               common::ErrorCode::INVALID_OPTIONS);
    }

    it = options.find("minLevel");
    if (it != options.end() && it->is_string() && !metrics::parseLevel(it->get<std::string>(), next.minLevel)) {
        throw common::InvalidArgumentException("setOptions: unknown metrics level '" + it->get<std::string>() + "'",
                                               common::ErrorCode::INVALID_OPTIONS);
    }

    readCount(options, "maxFileSize", next.maxFileSize);
    readCount(options, "maxFiles", next.maxFiles);

    it = options.find("compress");
    if (it != options.end() && it->is_boolean()) {
        next.compress = it->get<bool>();
    }
    readCount(options, "batchSize", next.batchSize);

    *this = next;
}

nlohmann::json fileutil::MetricsOptions::toJson() const {
    std::string level = metrics::levelName(minLevel);
    std::transform(level.begin(), level.end(), level.begin(), [](unsigned char c) { return std::tolower(c); });

    return nlohmann::json{
        {"directory", directory.empty() ? nlohmann::json(nullptr) : nlohmann::json(directory)},
        {"format", formatName(format)},
        {"minLevel", level},
        {"maxFileSize", maxFileSize},
        {"maxFiles", maxFiles},
        {"compress", compress},
        {"batchSize", batchSize}
    };
}

metrics::StorageConfig fileutil::MetricsOptions::toStorageConfig() const {
    metrics::StorageConfig config;
    config.base_path = directory;
    config.format = format;
    config.max_file_size = maxFileSize;
    config.max_files = maxFiles;
    config.compress_old_files = compress;
    config.batch_size = batchSize;
    return config;
}

void fileutil::FileUtilOptions::apply(const nlohmann::json& options) {
    if (!options.is_object()) {
        throw common::InvalidArgumentException("setOptions: options must be an object, got " +
                                               std::string(options.type_name()),
                                               common::ErrorCode::INVALID_OPTIONS);
    }

    MetricsOptions nextMetrics = metrics;
    auto metricsIt = options.find("metrics");
    if (metricsIt != options.end() && metricsIt->is_object()) {
        nextMetrics.apply(*metricsIt);
    }

    if (!lockRelative) {
        auto it = options.find("relativePath");
        if (it != options.end() && it->is_string()) {
            relativePath = it->get<std::string>();
        }

        it = options.find("lockRelative");
        if (it != options.end() && it->is_boolean()) {
            lockRelative = it->get<bool>();
        }
    }

    auto it = options.find("compressFormat");
    if (it != options.end() && it->is_string()) {
        compressFormat = it->get<std::string>();
    }

    it = options.find("logEvent");
    if (it != options.end() && it->is_string()) {
        logEvent = it->get<std::string>();
    }

    it = options.find("encoding");
    if (it != options.end() && it->is_string()) {
        encoding = it->get<std::string>();
    }

    metrics = nextMetrics;
}

nlohmann::json fileutil::FileUtilOptions::toJson() const {
    return nlohmann::json{
        {"compressFormat", compressFormat},
        {"relativePath", relativePath.empty() ? nlohmann::json(nullptr) : nlohmann::json(relativePath)},
        {"lockRelative", lockRelative},
        {"logEvent", logEvent},
        {"encoding", encoding},
        {"metrics", metrics.toJson()}
    };
}

fileutil::FileUtilOptions fileutil::FileUtilOptions::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw common::IOFailureException("cannot open options file '" + path + "'",
                                         common::ErrorCode::FILE_NOT_FOUND);
    }

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw common::InvalidArgumentException("options file '" + path + "' is not valid JSON: " + e.what(),
                                               common::ErrorCode::INVALID_OPTIONS);
    }

    FileUtilOptions options;
    options.apply(parsed);
    return options;
}

void fileutil::to_json(nlohmann::json& j, const FileUtilOptions& options) {
    j = options.toJson();
}
