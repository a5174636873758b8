#include "utils/metrics_engine.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <chrono>
#include <cstdio>
#include <algorithm>
#include <iterator>
#include <filesystem>
#include <zlib.h>

namespace metrics {

namespace {

// UTC, millisecond precision: 2024-05-01T12:00:00.123Z
std::string utcTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return out.str();
}

bool sameSeries(const StorageConfig& a, const StorageConfig& b) {
    return a.base_path == b.base_path && a.format == b.format;
}

std::unique_ptr<MetricsStorage> makeStorage(StorageFormat format) {
    if (format == StorageFormat::JSON) {
        return std::make_unique<JsonStorage>();
    }
    return std::make_unique<TextStorage>();
}

} // namespace

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

bool parseLevel(const std::string& name, LogLevel& level) {
    if (name == "debug") level = LogLevel::DEBUG;
    else if (name == "info") level = LogLevel::INFO;
    else if (name == "warn" || name == "warning") level = LogLevel::WARNING;
    else if (name == "error") level = LogLevel::ERROR;
    else if (name == "critical") level = LogLevel::CRITICAL;
    else return false;
    return true;
}

bool parseFormat(const std::string& name, StorageFormat& format) {
    if (name == "text") format = StorageFormat::TEXT;
    else if (name == "json") format = StorageFormat::JSON;
    else return false;
    return true;
}

MetricsEngine& MetricsEngine::getInstance() {
    static MetricsEngine instance;
    return instance;
}

MetricsEngine::MetricsEngine() : min_level_(LogLevel::DEBUG) {}

MetricsEngine::~MetricsEngine() {
    shutdown();
}

bool MetricsEngine::configure(const StorageConfig& requested) {
    StorageConfig config = requested;
    config.batch_size = std::max<uint32_t>(config.batch_size, 1);

    std::lock_guard<std::mutex> lock(mutex_);

    // Same file series: keep the open file and pick up the new limits.
    if (storage_ && sameSeries(config_, config)) {
        config_ = config;
        return storage_->open(config_);
    }

    auto next = makeStorage(config.format);
    if (!next->open(config)) {
        return false;
    }

    flushPendingUnsafe();
    storage_ = std::move(next);
    config_ = config;
    return true;
}

bool MetricsEngine::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!storage_) {
        return false;
    }

    flushPendingUnsafe();
    storage_.reset();
    return true;
}

bool MetricsEngine::isConfigured() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(storage_);
}

std::string MetricsEngine::storagePath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* files = dynamic_cast<FileStorageBase*>(storage_.get());
    return files ? files->currentFile() : std::string();
}

void MetricsEngine::log(LogLevel level, const std::string& category, const std::string& operation,
                        const std::string& message, int error_code, const nlohmann::json& data) {
    MetricEntry entry;
    entry.level = level;
    entry.category = category;
    entry.operation = operation;
    entry.message = message;
    entry.error_code = error_code;
    entry.data = data;
    entry.success = level < LogLevel::WARNING;

    record(std::move(entry));
}

void MetricsEngine::logOperation(const std::string& category, const std::string& operation,
                                 bool success, double duration_ms, const nlohmann::json& data) {
    MetricEntry entry;
    entry.level = success ? LogLevel::INFO : LogLevel::ERROR;
    entry.category = category;
    entry.operation = operation;
    entry.message = success ? "Operation completed successfully" : "Operation failed";
    entry.duration_ms = duration_ms;
    entry.data = data;
    entry.success = success;

    record(std::move(entry));
}

std::vector<MetricEntry> MetricsEngine::queryLogs(const std::string& category,
                                                  LogLevel min_level,
                                                  const std::string& operation) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<MetricEntry> matches;
    std::copy_if(recent_.begin(), recent_.end(), std::back_inserter(matches), [&](const MetricEntry& entry) {
        return entry.level >= min_level &&
               (category.empty() || entry.category == category) &&
               (operation.empty() || entry.operation == operation);
    });
    return matches;
}

void MetricsEngine::clearRecent() {
    std::lock_guard<std::mutex> lock(mutex_);
    recent_.clear();
}

bool MetricsEngine::rotateNow() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!storage_) {
        return false;
    }

    flushPendingUnsafe();
    rotateUnsafe();
    return true;
}

void MetricsEngine::record(MetricEntry entry) {
    if (entry.level < min_level_.load()) {
        return;
    }
    entry.timestamp = utcTimestamp();

    std::lock_guard<std::mutex> lock(mutex_);

    recent_.push_back(entry);
    if (recent_.size() > RECENT_CAPACITY) {
        recent_.pop_front();
    }

    if (!storage_) {
        return;
    }

    pending_.push_back(std::move(entry));
    if (pending_.size() < config_.batch_size) {
        return;
    }

    flushPendingUnsafe();
    if (config_.max_file_size > 0 && storage_->currentSize() >= config_.max_file_size) {
        rotateUnsafe();
    }
}

void MetricsEngine::flushPendingUnsafe() {
    if (storage_) {
        for (const auto& entry : pending_) {
            storage_->store(entry);
        }
        storage_->flush();
    }
    pending_.clear();
}

void MetricsEngine::rotateUnsafe() {
    storage_->rotate();
    storage_->cleanup();
}

// ----------------- File storage -----------------

bool FileStorageBase::open(const StorageConfig& config) {
    config_ = config;
    if (file_stream_.is_open()) {
        return true;
    }
    return openNextFile();
}

bool FileStorageBase::store(const MetricEntry& entry) {
    if (!file_stream_.is_open()) {
        return false;
    }

    const std::string line = render(entry);
    file_stream_ << line << '\n';
    bytes_written_ += line.size() + 1;
    return static_cast<bool>(file_stream_);
}

bool FileStorageBase::flush() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
    return static_cast<bool>(file_stream_);
}

bool FileStorageBase::openNextFile() {
    std::error_code ec;
    std::filesystem::create_directories(config_.base_path, ec);
    if (ec) {
        return false;
    }

    const std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);

    std::ostringstream name;
    name << "fileutil_" << std::put_time(&utc, "%Y%m%dT%H%M%S") << '_'
         << std::setfill('0') << std::setw(4) << sequence_++ << extension_;

    current_file_ = (std::filesystem::path(config_.base_path) / name.str()).string();
    file_stream_.open(current_file_, std::ios::app);
    bytes_written_ = 0;
    return file_stream_.is_open();
}

bool FileStorageBase::rotate() {
    const std::string finished = current_file_;
    if (file_stream_.is_open()) {
        file_stream_.close();
    }

    if (config_.compress_old_files && !finished.empty()) {
        compressFile(finished);
    }
    return openNextFile();
}

// Live and gzip-rotated files of this series, oldest first.
std::vector<std::string> FileStorageBase::listLogFiles() const {
    std::vector<std::string> files;

    std::error_code ec;
    for (std::filesystem::directory_iterator it(config_.base_path, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.rfind("fileutil_", 0) != 0) continue;

        const bool live = it->path().extension() == extension_;
        const bool gzipped = it->path().extension() == ".gz" && it->path().stem().extension() == extension_;
        if (live || gzipped) {
            files.push_back(it->path().string());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

void FileStorageBase::cleanup() {
    auto files = listLogFiles();
    files.erase(std::remove(files.begin(), files.end(), current_file_), files.end());

    // max_files counts the live file too.
    const size_t keep = config_.max_files > 0 ? config_.max_files - 1 : 0;
    if (files.size() <= keep) {
        return;
    }

    for (size_t i = 0; i < files.size() - keep; ++i) {
        std::error_code ec;
        std::filesystem::remove(files[i], ec);
    }
}

bool FileStorageBase::compressFile(const std::string& path) {
    FILE* in = std::fopen(path.c_str(), "rb");
    if (!in) {
        return false;
    }

    const std::string target = path + ".gz";
    gzFile out = gzopen(target.c_str(), "wb9");
    if (!out) {
        std::fclose(in);
        return false;
    }

    char buffer[8192];
    bool ok = true;
    size_t n;
    while ((n = std::fread(buffer, 1, sizeof(buffer), in)) > 0) {
        if (gzwrite(out, buffer, static_cast<unsigned>(n)) != static_cast<int>(n)) {
            ok = false;
            break;
        }
    }

    std::fclose(in);
    if (gzclose(out) != Z_OK) {
        ok = false;
    }

    std::error_code ec;
    std::filesystem::remove(ok ? path : target, ec);
    return ok;
}

std::string TextStorage::formatEntry(const MetricEntry& entry) {
    std::ostringstream line;
    line << '[' << entry.timestamp << "] [" << levelName(entry.level) << "] [" << entry.category << "] ["
         << entry.operation << "] " << entry.message;

    if (entry.error_code != 0) {
        line << " (Error: " << entry.error_code << ')';
    }
    if (entry.duration_ms > 0) {
        line << " [Duration: " << entry.duration_ms << "ms]";
    }
    if (!entry.data.is_null() && !entry.data.empty()) {
        line << " [Data: " << entry.data.dump() << ']';
    }
    return line.str();
}

nlohmann::json JsonStorage::convertToJson(const MetricEntry& entry) {
    return nlohmann::json{
        {"timestamp", entry.timestamp},
        {"level", levelName(entry.level)},
        {"category", entry.category},
        {"operation", entry.operation},
        {"message", entry.message},
        {"data", entry.data},
        {"error_code", entry.error_code},
        {"duration_ms", entry.duration_ms},
        {"success", entry.success}
    };
}

}
