// src/compression/ArchiveWriter.cpp
#include "utils/archive/compression/ArchiveWriter.hpp"
#include "utils/archive/common/Exceptions.hpp"
#include "utils/archive/io/FileHandler.hpp"
#include <archive_entry.h>
#include <sys/stat.h>
#include <algorithm>
#include <cerrno>
#include <ctime>
#include <filesystem>
#include <vector>

namespace {

// RAII wrapper for archive_entry*
class ArchiveEntryGuard {
public:
    ArchiveEntryGuard() : entry_(archive_entry_new()) {}
    ~ArchiveEntryGuard() { if (entry_) archive_entry_free(entry_); }

    ArchiveEntryGuard(const ArchiveEntryGuard&) = delete;
    ArchiveEntryGuard& operator=(const ArchiveEntryGuard&) = delete;

    struct archive_entry* get() const { return entry_; }

private:
    struct archive_entry* entry_;
};

std::string joinEntryName(const std::string& prefix, const std::string& relative) {
    if (prefix.empty()) {
        return relative;
    }
    std::string base = prefix;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base.empty() ? relative : base + "/" + relative;
}

} // namespace

fileutil::compression::ArchiveWriter::ArchiveWriter(fileutil::common::ArchiveFormat format,
                                                    std::shared_ptr<fileutil::io::OutputStream> sink,
                                                    int level)
    : archive_(nullptr), sink_(std::move(sink)), format_(format), entryCount_(0), finalized_(false) {
    if (!sink_) {
        throw fileutil::common::InvalidArgumentException("ArchiveWriter: sink cannot be null");
    }

    archive_ = archive_write_new();
    if (!archive_) {
        throw fileutil::common::ArchiveException("archive_write_new failed");
    }

    try {
        configure(level);
    } catch (...) {
        archive_write_free(archive_);
        archive_ = nullptr;
        throw;
    }
}

fileutil::compression::ArchiveWriter::~ArchiveWriter() {
    if (archive_) {
        archive_write_free(archive_);
        archive_ = nullptr;
    }
}

void fileutil::compression::ArchiveWriter::configure(int level) {
    std::string options;
    int r = ARCHIVE_OK;

    switch (format_) {
        case fileutil::common::ArchiveFormat::TAR_GZ:
            r = archive_write_set_format_pax_restricted(archive_);
            if (r != ARCHIVE_OK) raise("set tar format");
            r = archive_write_add_filter_gzip(archive_);
            if (r < ARCHIVE_WARN) raise("add gzip filter");
            options = "gzip:compression-level=" + std::to_string(level);
            break;

        case fileutil::common::ArchiveFormat::ZIP:
            r = archive_write_set_format_zip(archive_);
            if (r != ARCHIVE_OK) raise("set zip format");
            options = "zip:compression-level=" + std::to_string(level);
            break;
    }

    r = archive_write_set_options(archive_, options.c_str());
    if (r < ARCHIVE_WARN) raise("set options '" + options + "'");

    // Compressed output must not be padded to the tar block size.
    r = archive_write_set_bytes_in_last_block(archive_, 1);
    if (r != ARCHIVE_OK) raise("set bytes in last block");

    r = archive_write_open(archive_, this, nullptr,
                           &ArchiveWriter::writeCallback, &ArchiveWriter::closeCallback);
    if (r != ARCHIVE_OK) raise("open");
}

void fileutil::compression::ArchiveWriter::appendData(const fileutil::common::Byte* data, size_t size,
                                                      const std::string& entryName) {
    requireWritable("append data");

    ArchiveEntryGuard entry;
    archive_entry_set_pathname(entry.get(), entryName.c_str());
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), fileutil::common::Constants::FILE_PERMISSIONS);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));
    archive_entry_set_mtime(entry.get(), std::time(nullptr), 0);

    writeEntry(entry.get(), entryName);

    if (size > 0) {
        la_ssize_t written = archive_write_data(archive_, data, size);
        if (written < 0) raise("write data '" + entryName + "'");
    }

    ++entryCount_;
}

void fileutil::compression::ArchiveWriter::appendData(const fileutil::common::ByteArray& data,
                                                      const std::string& entryName) {
    appendData(data.data(), data.size(), entryName);
}

void fileutil::compression::ArchiveWriter::appendFile(const std::string& sourcePath,
                                                      const std::string& entryName) {
    requireWritable("append file");

    struct stat st;
    if (stat(sourcePath.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        throw fileutil::common::IOFailureException("not a regular file: '" + sourcePath + "'",
                                                   fileutil::common::ErrorCode::FILE_NOT_FOUND);
    }

    fileutil::io::FileHandler source(sourcePath);
    if (auto ec = source.openForRead()) {
        throw fileutil::common::IOFailureException("open '" + sourcePath + "': " + ec.message(),
                                                   fileutil::common::ErrorCode::FILE_READ_ERROR);
    }

    ArchiveEntryGuard entry;
    archive_entry_set_pathname(entry.get(), entryName.c_str());
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), st.st_mode & 07777);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(st.st_size));
    archive_entry_set_mtime(entry.get(), st.st_mtime, 0);

    writeEntry(entry.get(), entryName);

    fileutil::common::ByteArray chunk;
    while (!source.endOfFile()) {
        if (auto ec = source.read(chunk, fileutil::common::Constants::STREAM_BUFFER_SIZE)) {
            throw fileutil::common::IOFailureException("read '" + sourcePath + "': " + ec.message(),
                                                       fileutil::common::ErrorCode::FILE_READ_ERROR);
        }
        if (chunk.empty()) {
            break;
        }
        la_ssize_t written = archive_write_data(archive_, chunk.data(), chunk.size());
        if (written < 0) raise("write data '" + entryName + "'");
    }

    ++entryCount_;
}

void fileutil::compression::ArchiveWriter::appendDirectory(const std::string& sourceDir,
                                                           const std::string& entryPrefix) {
    namespace fs = std::filesystem;

    requireWritable("append directory");

    std::error_code ec;
    if (!fs::is_directory(sourceDir, ec)) {
        throw fileutil::common::IOFailureException("not a directory: '" + sourceDir + "'",
                                                   fileutil::common::ErrorCode::FILE_NOT_FOUND);
    }

    std::vector<fs::path> paths;
    for (fs::recursive_directory_iterator it(sourceDir, ec), end; !ec && it != end; it.increment(ec)) {
        paths.push_back(it->path());
    }
    if (ec) {
        throw fileutil::common::IOFailureException("walk '" + sourceDir + "': " + ec.message(),
                                                   fileutil::common::ErrorCode::DIRECTORY_ERROR);
    }

    std::sort(paths.begin(), paths.end());

    const fs::path root(sourceDir);
    for (const auto& path : paths) {
        const std::string name = joinEntryName(entryPrefix, path.lexically_relative(root).generic_string());

        if (fs::is_directory(path, ec)) {
            struct stat st;
            time_t mtime = stat(path.c_str(), &st) == 0 ? st.st_mtime : std::time(nullptr);

            ArchiveEntryGuard entry;
            archive_entry_set_pathname(entry.get(), name.c_str());
            archive_entry_set_filetype(entry.get(), AE_IFDIR);
            archive_entry_set_perm(entry.get(), fileutil::common::Constants::DIRECTORY_PERMISSIONS);
            archive_entry_set_size(entry.get(), 0);
            archive_entry_set_mtime(entry.get(), mtime, 0);

            writeEntry(entry.get(), name);
            ++entryCount_;
        } else if (fs::is_regular_file(path, ec)) {
            appendFile(path.string(), name);
        }
    }
}

void fileutil::compression::ArchiveWriter::finalize() {
    requireWritable("finalize");

    int r = archive_write_close(archive_);
    if (r != ARCHIVE_OK) raise("finalize");

    finalized_ = true;
}

std::error_code fileutil::compression::ArchiveWriter::abort() noexcept {
    if (archive_ && !finalized_) {
        archive_write_fail(archive_);
    }
    finalized_ = true;
    return sink_->close();
}

fileutil::common::ArchiveFormat fileutil::compression::ArchiveWriter::parseFormat(const std::string& name) {
    if (name == fileutil::common::Constants::FORMAT_TAR_GZ) {
        return fileutil::common::ArchiveFormat::TAR_GZ;
    }
    if (name == fileutil::common::Constants::FORMAT_ZIP) {
        return fileutil::common::ArchiveFormat::ZIP;
    }
    throw fileutil::common::UnsupportedFormatException(name);
}

std::string fileutil::compression::ArchiveWriter::formatExtension(fileutil::common::ArchiveFormat format) {
    switch (format) {
        case fileutil::common::ArchiveFormat::ZIP:
            return fileutil::common::Constants::FORMAT_ZIP;
        case fileutil::common::ArchiveFormat::TAR_GZ:
        default:
            return fileutil::common::Constants::FORMAT_TAR_GZ;
    }
}

void fileutil::compression::ArchiveWriter::writeEntry(struct archive_entry* entry, const std::string& entryName) {
    int r = archive_write_header(archive_, entry);
    if (r < ARCHIVE_WARN) raise("write header '" + entryName + "'");
}

void fileutil::compression::ArchiveWriter::requireWritable(const char* operation) const {
    if (finalized_ || !archive_) {
        throw fileutil::common::UsageErrorException(std::string(operation) + ": archive already finalized",
                                                    fileutil::common::ErrorCode::SESSION_ALREADY_FINALIZED);
    }
}

void fileutil::compression::ArchiveWriter::raise(const std::string& operation) const {
    if (sink_->failed()) {
        throw fileutil::common::IOFailureException(operation + ": " + sink_->lastErrorMessage(),
                                                   fileutil::common::ErrorCode::STREAM_ERROR);
    }

    const char* detail = archive_ ? archive_error_string(archive_) : nullptr;
    throw fileutil::common::ArchiveException(operation + ": " + (detail ? detail : "unknown libarchive error"));
}

la_ssize_t fileutil::compression::ArchiveWriter::writeCallback(struct archive* a, void* clientData,
                                                               const void* buffer, size_t length) {
    auto* self = static_cast<ArchiveWriter*>(clientData);
    auto ec = self->sink_->write(static_cast<const fileutil::common::Byte*>(buffer), length);
    if (ec) {
        archive_set_error(a, EIO, "%s", self->sink_->lastErrorMessage().c_str());
        return -1;
    }
    return static_cast<la_ssize_t>(length);
}

int fileutil::compression::ArchiveWriter::closeCallback(struct archive* a, void* clientData) {
    auto* self = static_cast<ArchiveWriter*>(clientData);
    auto ec = self->sink_->close();
    if (ec) {
        archive_set_error(a, EIO, "%s", self->sink_->lastErrorMessage().c_str());
        return ARCHIVE_FATAL;
    }
    return ARCHIVE_OK;
}
