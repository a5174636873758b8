#ifndef FILEUTIL_METRICS_ENGINE_HPP
#define FILEUTIL_METRICS_ENGINE_HPP

#include <cstdint>
#include <string>
#include <deque>
#include <vector>
#include <memory>
#include <atomic>
#include <mutex>
#include <fstream>
#include <nlohmann/json.hpp>

namespace metrics {
    enum class LogLevel {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class StorageFormat {
        TEXT,
        JSON
    };

    struct MetricEntry {
        std::string timestamp;
        LogLevel level = LogLevel::INFO;
        std::string category;
        std::string operation;
        std::string message;
        nlohmann::json data;
        int error_code = 0;
        double duration_ms = 0.0;
        bool success = true;
    };

    // max_file_size of 0 turns size-based rotation off; rotateNow() still rotates.
    struct StorageConfig {
        std::string base_path;
        StorageFormat format = StorageFormat::TEXT;
        uint64_t max_file_size = 10 * 1024 * 1024;
        uint32_t max_files = 5;
        bool compress_old_files = true;
        uint32_t batch_size = 32;
    };

    const char* levelName(LogLevel level);

    // Accepts "debug", "info", "warn"/"warning", "error" and "critical".
    bool parseLevel(const std::string& name, LogLevel& level);
    // Accepts "text" and "json".
    bool parseFormat(const std::string& name, StorageFormat& format);

    class MetricsStorage {
    public:
        virtual ~MetricsStorage() = default;
        virtual bool open(const StorageConfig& config) = 0;
        virtual bool store(const MetricEntry& entry) = 0;
        virtual bool flush() = 0;
        virtual bool rotate() = 0;
        virtual uint64_t currentSize() const = 0;
        virtual void cleanup() = 0;
    };

    /**
     * Process-wide log sink. Every entry lands in an in-memory ring served by
     * queryLogs(); once configure() has opened a storage, entries are also
     * written to disk in batches of StorageConfig::batch_size.
     */
    class MetricsEngine {
    public:
        static constexpr size_t RECENT_CAPACITY = 1000;

        static MetricsEngine& getInstance();

        // Replaces any open storage; pending entries are flushed to the old one first.
        bool configure(const StorageConfig& config);
        bool shutdown();
        bool isConfigured() const;
        std::string storagePath() const;

        void log(LogLevel level, const std::string& category, const std::string& operation,
                 const std::string& message, int error_code = 0, const nlohmann::json& data = {});
        void logOperation(const std::string& category, const std::string& operation,
                          bool success, double duration_ms, const nlohmann::json& data = {});

        void setMinimumLevel(LogLevel level) { min_level_ = level; }
        LogLevel getMinimumLevel() const { return min_level_.load(); }

        std::vector<MetricEntry> queryLogs(const std::string& category = "",
                                           LogLevel min_level = LogLevel::DEBUG,
                                           const std::string& operation = "") const;
        void clearRecent();

        bool rotateNow();

    private:
        MetricsEngine();
        ~MetricsEngine();

        MetricsEngine(const MetricsEngine&) = delete;
        MetricsEngine& operator=(const MetricsEngine&) = delete;

        void record(MetricEntry entry);
        void flushPendingUnsafe();
        void rotateUnsafe();

        std::unique_ptr<MetricsStorage> storage_;
        StorageConfig config_;
        std::atomic<LogLevel> min_level_;

        std::vector<MetricEntry> pending_;
        std::deque<MetricEntry> recent_;

        mutable std::mutex mutex_;
    };

    // One series of log files under StorageConfig::base_path; subclasses pick
    // the line format.
    class FileStorageBase : public MetricsStorage {
    public:
        bool open(const StorageConfig& config) override;
        bool store(const MetricEntry& entry) override;
        bool flush() override;
        bool rotate() override;
        uint64_t currentSize() const override { return bytes_written_; }
        void cleanup() override;

        const std::string& currentFile() const { return current_file_; }

    protected:
        explicit FileStorageBase(std::string extension) : extension_(std::move(extension)) {}

        virtual std::string render(const MetricEntry& entry) const = 0;

    private:
        bool openNextFile();
        std::vector<std::string> listLogFiles() const;
        bool compressFile(const std::string& path);

        std::string extension_;
        StorageConfig config_;
        std::string current_file_;
        std::ofstream file_stream_;
        uint64_t bytes_written_ = 0;
        uint32_t sequence_ = 0;
    };

    class TextStorage : public FileStorageBase {
    public:
        TextStorage() : FileStorageBase(".log") {}

        static std::string formatEntry(const MetricEntry& entry);

    protected:
        std::string render(const MetricEntry& entry) const override { return formatEntry(entry); }
    };

    // One JSON object per line so rotated files stay appendable.
    class JsonStorage : public FileStorageBase {
    public:
        JsonStorage() : FileStorageBase(".json") {}

        static nlohmann::json convertToJson(const MetricEntry& entry);

    protected:
        std::string render(const MetricEntry& entry) const override { return convertToJson(entry).dump(); }
    };
}

#endif
