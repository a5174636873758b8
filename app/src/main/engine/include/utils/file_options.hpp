#ifndef FILEUTIL_FILE_OPTIONS_HPP
#define FILEUTIL_FILE_OPTIONS_HPP

#include "utils/metrics_engine.hpp"
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace fileutil {

// The "metrics" options key. An empty directory keeps logs in memory only.
struct MetricsOptions {
    std::string directory;
    metrics::StorageFormat format = metrics::StorageFormat::TEXT;
    metrics::LogLevel minLevel = metrics::LogLevel::DEBUG;
    uint64_t maxFileSize = 10 * 1024 * 1024;
    uint32_t maxFiles = 5;
    bool compress = true;
    uint32_t batchSize = 32;

    void apply(const nlohmann::json& options);
    nlohmann::json toJson() const;
    metrics::StorageConfig toStorageConfig() const;
};

/**
 * Runtime configuration shared by every FileEngine operation.
 *
 * relativePath is the base directory destinations resolve against; an empty
 * value means the current working directory. Once lockRelative is set,
 * neither relativePath nor lockRelative can change again.
 */
struct FileUtilOptions {
    std::string compressFormat = "tar.gz";
    std::string relativePath;
    bool lockRelative = false;
    std::string logEvent = "log:info:raw";
    std::string encoding = "utf8";
    MetricsOptions metrics;

    // Merges recognised keys of an options object. Keys holding a value of the
    // wrong type are ignored. Throws InvalidArgumentException for a non-object.
    void apply(const nlohmann::json& options);

    nlohmann::json toJson() const;

    // Throws IOFailureException when the file cannot be read and
    // InvalidArgumentException when it does not hold a JSON object.
    static FileUtilOptions fromFile(const std::string& path);
};

void to_json(nlohmann::json& j, const FileUtilOptions& options);

} // namespace fileutil

#endif
