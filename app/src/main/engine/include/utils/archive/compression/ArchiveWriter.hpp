// include/compression/ArchiveWriter.hpp
#ifndef FILEUTIL_ARCHIVEWRITER_HPP
#define FILEUTIL_ARCHIVEWRITER_HPP

#include "../common/Types.hpp"
#include "../common/Constants.hpp"
#include "../io/OutputStream.hpp"
#include <archive.h>
#include <memory>
#include <string>

namespace fileutil {
namespace compression {

/**
 * Owns one libarchive write handle whose output is piped into an OutputStream.
 *
 * finalize() writes the container trailer, flushes the compression filter and
 * closes the sink, which fires the sink's close listeners.
 *
 * Failures raise IOFailureException when the sink reported the error, and
 * ArchiveException when libarchive itself failed.
 */
class ArchiveWriter : public common::NonCopyable {
private:
    struct archive* archive_;
    std::shared_ptr<io::OutputStream> sink_;
    common::ArchiveFormat format_;
    size_t entryCount_;
    bool finalized_;

public:
    ArchiveWriter(common::ArchiveFormat format,
                  std::shared_ptr<io::OutputStream> sink,
                  int level = common::Constants::DEFAULT_COMPRESSION_LEVEL);
    ~ArchiveWriter();

    ArchiveWriter(ArchiveWriter&&) = delete;
    ArchiveWriter& operator=(ArchiveWriter&&) = delete;

    void appendData(const common::Byte* data, size_t size, const std::string& entryName);
    void appendData(const common::ByteArray& data, const std::string& entryName);
    void appendFile(const std::string& sourcePath, const std::string& entryName);
    void appendDirectory(const std::string& sourceDir, const std::string& entryPrefix);

    void finalize();
    std::error_code abort() noexcept;

    bool isFinalized() const { return finalized_; }
    size_t getEntryCount() const { return entryCount_; }
    common::ArchiveFormat getFormat() const { return format_; }

    static common::ArchiveFormat parseFormat(const std::string& name);
    static std::string formatExtension(common::ArchiveFormat format);

private:
    void configure(int level);
    void writeEntry(struct archive_entry* entry, const std::string& entryName);
    void requireWritable(const char* operation) const;
    [[noreturn]] void raise(const std::string& operation) const;

    static la_ssize_t writeCallback(struct archive* a, void* clientData,
                                    const void* buffer, size_t length);
    static int closeCallback(struct archive* a, void* clientData);
};

} // namespace compression
} // namespace fileutil

#endif
