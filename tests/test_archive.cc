#include <gtest/gtest.h>

#include <archive.h>
#include <archive_entry.h>

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "test_helpers.hpp"
#include "utils/archive/common/Exceptions.hpp"
#include "utils/archive/io/OutputStream.hpp"
#include "utils/archive/session/ArchiveSessionStack.hpp"
#include "utils/file_engine.hpp"

namespace {

const std::string writeData = "export default class Test\n{\n   constructor() { this.test = true; }\n}\n";

// Entry name -> contents. Directory entries map to "<dir>".
using ArchiveContents = std::map<std::string, std::string>;

ArchiveContents readEntries(struct archive* reader) {
    ArchiveContents contents;
    struct archive_entry* entry = nullptr;
    while (archive_read_next_header(reader, &entry) == ARCHIVE_OK) {
        const std::string name = archive_entry_pathname(entry);
        if (archive_entry_filetype(entry) == AE_IFDIR) {
            contents[name] = "<dir>";
            continue;
        }

        std::string data;
        char buffer[8192];
        la_ssize_t n;
        while ((n = archive_read_data(reader, buffer, sizeof(buffer))) > 0) {
            data.append(buffer, static_cast<size_t>(n));
        }
        contents[name] = data;
    }
    return contents;
}

ArchiveContents readArchive(const fs::path& path) {
    struct archive* reader = archive_read_new();
    archive_read_support_filter_all(reader);
    archive_read_support_format_all(reader);
    if (archive_read_open_filename(reader, path.c_str(), 10240) != ARCHIVE_OK) {
        ADD_FAILURE() << "cannot open " << path << ": " << archive_error_string(reader);
        archive_read_free(reader);
        return {};
    }
    auto contents = readEntries(reader);
    archive_read_free(reader);
    return contents;
}

ArchiveContents readArchiveBytes(const std::string& bytes) {
    struct archive* reader = archive_read_new();
    archive_read_support_filter_all(reader);
    archive_read_support_format_all(reader);
    if (archive_read_open_memory(reader, bytes.data(), bytes.size()) != ARCHIVE_OK) {
        ADD_FAILURE() << "cannot open nested archive: " << archive_error_string(reader);
        archive_read_free(reader);
        return {};
    }
    auto contents = readEntries(reader);
    archive_read_free(reader);
    return contents;
}

std::vector<std::string> tempFilesUnder(const fs::path& dir) {
    std::vector<std::string> temps;
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.path().filename().string().rfind(".temp-", 0) == 0) {
            temps.push_back(entry.path().string());
        }
    }
    return temps;
}

}  // namespace

class ArchiveTest : public ScratchDirTest {
   protected:
    void SetUp() override {
        ScratchDirTest::SetUp();
        out = root / "fixture";
        source = createFile("fixture/test.js", writeData);
        engine = std::make_unique<fileutil::FileEngine>(nlohmann::json{{"relativePath", out.string()}});
    }

    void TearDown() override {
        engine.reset();
        ScratchDirTest::TearDown();
    }

    void fillSession() {
        engine->writeFile(writeData, "test3.js");
        engine->writeFile(writeData, "test4.js");
        engine->copy(source.string(), "test.js");
    }

    fs::path out;
    fs::path source;
    std::unique_ptr<fileutil::FileEngine> engine;
};

TEST_F(ArchiveTest, SingleArchiveRoutesWritesIntoSession) {
    engine->archiveCreate("archive");
    fillSession();
    engine->archiveFinalize().get();

    ASSERT_TRUE(fs::exists(out / "archive.tar.gz"));
    EXPECT_FALSE(fs::exists(out / "test3.js"));
    EXPECT_EQ(engine->archiveDepth(), 0u);

    auto contents = readArchive(out / "archive.tar.gz");
    EXPECT_EQ(contents.size(), 3u);
    EXPECT_EQ(contents["test3.js"], writeData);
    EXPECT_EQ(contents["test4.js"], writeData);
    EXPECT_EQ(contents["test.js"], writeData);
}

TEST_F(ArchiveTest, NestedArchiveFoldsIntoParent) {
    engine->archiveCreate("archive2");
    fillSession();

    engine->archiveCreate("archive");
    fillSession();
    EXPECT_EQ(engine->archiveDepth(), 2u);

    auto child = engine->archiveFinalize();
    auto parent = engine->archiveFinalize();
    child.get();
    parent.get();

    ASSERT_TRUE(fs::exists(out / "archive2.tar.gz"));
    EXPECT_FALSE(fs::exists(out / "archive.tar.gz"));
    EXPECT_TRUE(tempFilesUnder(out).empty());

    auto contents = readArchive(out / "archive2.tar.gz");
    ASSERT_EQ(contents.count("archive.tar.gz"), 1u);
    EXPECT_EQ(contents["test3.js"], writeData);
    EXPECT_EQ(contents["test.js"], writeData);

    auto nested = readArchiveBytes(contents["archive.tar.gz"]);
    EXPECT_EQ(nested.size(), 3u);
    EXPECT_EQ(nested["test4.js"], writeData);
}

TEST_F(ArchiveTest, ThreeLevelsFoldInOrder) {
    engine->archiveCreate("outer");
    engine->writeFile("o", "outer.txt", true);
    engine->archiveCreate("middle");
    engine->writeFile("m", "middle.txt", true);
    engine->archiveCreate("inner");
    engine->writeFile("i", "inner.txt", true);

    engine->archiveFinalize();
    engine->archiveFinalize();
    engine->archiveFinalize().get();

    EXPECT_TRUE(tempFilesUnder(out).empty());
    auto outer = readArchive(out / "outer.tar.gz");
    auto middle = readArchiveBytes(outer["middle.tar.gz"]);
    auto inner = readArchiveBytes(middle["inner.tar.gz"]);
    EXPECT_EQ(outer["outer.txt"], "o");
    EXPECT_EQ(middle["middle.txt"], "m");
    EXPECT_EQ(inner["inner.txt"], "i");
}

TEST_F(ArchiveTest, StandaloneChildStaysOnDisk) {
    engine->archiveCreate("parent");
    engine->archiveCreate("sibling", false);
    engine->writeFile("s", "s.txt", true);
    engine->archiveFinalize().get();
    engine->archiveFinalize().get();

    ASSERT_TRUE(fs::exists(out / "sibling.tar.gz"));
    EXPECT_EQ(readArchive(out / "sibling.tar.gz")["s.txt"], "s");
    EXPECT_EQ(readArchive(out / "parent.tar.gz").count("sibling.tar.gz"), 0u);
}

TEST_F(ArchiveTest, DirectoryCopyAddsEntriesRecursively) {
    createFile("tree/a.txt", "a");
    createFile("tree/sub/b.txt", "b");

    engine->archiveCreate("dirs");
    engine->copy((root / "tree").string(), "assets");
    engine->archiveFinalize().get();

    auto contents = readArchive(out / "dirs.tar.gz");
    EXPECT_EQ(contents["assets/a.txt"], "a");
    EXPECT_EQ(contents["assets/sub/b.txt"], "b");
    // tar writers store directory names with a trailing slash
    EXPECT_EQ(contents.count("assets/sub/") + contents.count("assets/sub"), 1u);
}

TEST_F(ArchiveTest, ZipFormatFromOptions) {
    engine->setOptions({{"compressFormat", "zip"}});
    engine->archiveCreate("bundle");
    engine->writeFile("zipped", "z.txt", true);
    engine->archiveFinalize().get();

    ASSERT_TRUE(fs::exists(out / "bundle.zip"));
    EXPECT_EQ(readArchive(out / "bundle.zip")["z.txt"], "zipped");
}

TEST_F(ArchiveTest, UnsupportedFormatFailsBeforeTouchingDisk) {
    engine->setOptions({{"compressFormat", "rar"}});

    try {
        engine->archiveCreate("broken");
        FAIL() << "expected UnsupportedFormatException";
    } catch (const fileutil::common::UnsupportedFormatException& e) {
        EXPECT_EQ(e.format(), "rar");
        EXPECT_EQ(e.errorCode(), fileutil::common::ErrorCode::UNSUPPORTED_FORMAT);
    }

    EXPECT_EQ(engine->archiveDepth(), 0u);
    EXPECT_FALSE(fs::exists(out / "broken.rar"));
}

TEST_F(ArchiveTest, SecondFinalizeIsResolvedNoOp) {
    engine->archiveCreate("once");
    engine->archiveFinalize().get();

    auto again = engine->archiveFinalize();
    EXPECT_EQ(again.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_NO_THROW(again.get());
}

TEST_F(ArchiveTest, ClosedSessionRejectsFurtherUse) {
    auto session = engine->archiveCreate("closed");
    engine->archiveFinalize().get();

    EXPECT_EQ(session->getState(), fileutil::common::SessionState::Closed);
    EXPECT_THROW(session->appendData(fileutil::common::toBytes("late"), "late.txt"),
                 fileutil::common::UsageErrorException);

    try {
        session->close();
        FAIL() << "expected UsageErrorException";
    } catch (const fileutil::common::UsageErrorException& e) {
        EXPECT_EQ(e.errorCode(), fileutil::common::ErrorCode::SESSION_ALREADY_FINALIZED);
    }
}

TEST_F(ArchiveTest, FailedChildRejectsParentAndRemovesSiblingTemps) {
    using fileutil::common::ArchiveFormat;
    using fileutil::session::ArchiveSession;
    fs::create_directories(out);

    ArchiveSession parent("parent.tar.gz", (out / "parent.tar.gz").string(), ArchiveFormat::TAR_GZ, false);
    auto good = std::make_unique<ArchiveSession>("good.tar.gz", (out / ".temp-0").string(),
                                                 ArchiveFormat::TAR_GZ, true);
    auto bad = std::make_unique<ArchiveSession>("bad.tar.gz", (out / ".temp-1").string(),
                                                ArchiveFormat::TAR_GZ, true);
    good->linkToParent(parent);
    bad->linkToParent(parent);
    EXPECT_EQ(parent.getPendingChildCount(), 2u);

    good->appendData(fileutil::common::toBytes("g"), "g.txt");
    good->close();
    EXPECT_TRUE(fs::exists(out / ".temp-0"));

    // Destroying an unfinished child rejects its completion and drops its temp output.
    bad.reset();
    EXPECT_FALSE(fs::exists(out / ".temp-1"));

    EXPECT_THROW(parent.close(), fileutil::common::UsageErrorException);
    EXPECT_FALSE(fs::exists(out / ".temp-0"));
    EXPECT_EQ(parent.getState(), fileutil::common::SessionState::Closed);
}

TEST_F(ArchiveTest, LinkingToClosedParentIsUsageError) {
    using fileutil::common::ArchiveFormat;
    using fileutil::session::ArchiveSession;
    fs::create_directories(out);

    ArchiveSession parent("parent.tar.gz", (out / "parent.tar.gz").string(), ArchiveFormat::TAR_GZ, false);
    parent.close();

    ArchiveSession child("late.tar.gz", (out / ".temp-9").string(), ArchiveFormat::TAR_GZ, true);
    EXPECT_THROW(child.linkToParent(parent), fileutil::common::UsageErrorException);
    EXPECT_FALSE(child.isLinkedToParent());
}

TEST_F(ArchiveTest, ChildCloseFailureRejectsParentFinalize) {
    if (!fs::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full is not available";
    }

    engine->archiveCreate("parent", false);
    // The child's temporary output lands on a device that fails the flush at close.
    fs::create_symlink("/dev/full", out / ".temp-0");
    auto child = engine->archiveCreate("child", true);
    ASSERT_EQ(child->getResolvedOutputPath(), (out / ".temp-0").string());
    engine->writeFile("small", "small.txt");

    auto childDone = engine->archiveFinalize();
    EXPECT_THROW(childDone.get(), fileutil::common::IOFailureException);
    EXPECT_FALSE(fs::is_symlink(out / ".temp-0"));

    auto parentDone = engine->archiveFinalize();
    EXPECT_EQ(engine->archiveDepth(), 0u);
    try {
        parentDone.get();
        ADD_FAILURE() << "parent finalize should reject";
    } catch (const fileutil::common::IOFailureException& e) {
        EXPECT_NE(std::string(e.what()).find("close"), std::string::npos) << e.what();
    }
    EXPECT_TRUE(tempFilesUnder(out).empty());
}

class OutputStreamTest : public ScratchDirTest {};

TEST_F(OutputStreamTest, CloseFailureFiresErrorBeforeClose) {
    if (!fs::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full is not available";
    }

    fileutil::io::OutputStream stream("/dev/full");
    std::vector<std::string> events;
    stream.onError([&events](const std::error_code&, const std::string&) { events.push_back("error"); });
    stream.onClose([&events]() { events.push_back("close"); });

    ASSERT_FALSE(stream.open());
    const auto bytes = fileutil::common::toBytes("buffered until close");
    EXPECT_FALSE(stream.write(bytes.data(), bytes.size()));

    const std::error_code ec = stream.close();
    EXPECT_EQ(ec, std::error_code(fileutil::common::ErrorCode::FILE_WRITE_ERROR));
    EXPECT_EQ(events, (std::vector<std::string>{"error", "close"}));
    EXPECT_TRUE(stream.failed());
    EXPECT_NE(stream.lastErrorMessage().find("close '/dev/full'"), std::string::npos);

    // Late listeners still see the outcome.
    bool lateError = false;
    bool lateClose = false;
    stream.onError([&lateError](const std::error_code&, const std::string&) { lateError = true; });
    stream.onClose([&lateClose]() { lateClose = true; });
    EXPECT_TRUE(lateError);
    EXPECT_TRUE(lateClose);
}

TEST_F(OutputStreamTest, LifecycleEventsFireOnce) {
    fileutil::io::OutputStream stream((root / "stream.bin").string());
    int errors = 0;
    int closes = 0;
    stream.onError([&errors](const std::error_code&, const std::string&) { ++errors; });
    stream.onClose([&closes]() { ++closes; });

    ASSERT_FALSE(stream.open());
    EXPECT_EQ(stream.open(), std::error_code(fileutil::common::ErrorCode::STREAM_ERROR));
    const auto bytes = fileutil::common::toBytes("abc");
    EXPECT_FALSE(stream.write(bytes.data(), bytes.size()));
    EXPECT_EQ(stream.bytesWritten(), 3u);

    EXPECT_FALSE(stream.close());
    EXPECT_FALSE(stream.close());
    EXPECT_EQ(closes, 1);
    EXPECT_EQ(slurp(root / "stream.bin"), "abc");

    EXPECT_EQ(stream.write(bytes.data(), bytes.size()), std::error_code(fileutil::common::ErrorCode::STREAM_ERROR));
    EXPECT_EQ(errors, 1);

    fileutil::io::OutputStream missing((root / "no" / "such" / "dir.bin").string());
    EXPECT_EQ(missing.open(), std::error_code(fileutil::common::ErrorCode::FILE_WRITE_ERROR));
    EXPECT_TRUE(missing.failed());
}

TEST(ArchiveStackTest, TempCounterStartsAtZeroAndSharesDirectory) {
    const fs::path dir = fs::temp_directory_path() / ("fileutil_stack_" + std::to_string(::getpid()));
    fs::remove_all(dir);

    {
        fileutil::session::ArchiveSessionStack stack;
        auto parent = stack.begin("parent", "tar.gz", dir.string());
        auto child = stack.begin("nested/child", "tar.gz", dir.string());

        EXPECT_EQ(parent->getResolvedOutputPath(), (dir / "parent.tar.gz").string());
        EXPECT_EQ(child->getResolvedOutputPath(), (dir / "nested" / ".temp-0").string());
        EXPECT_EQ(child->getLogicalPath(), "nested/child.tar.gz");
        EXPECT_TRUE(child->foldsIntoParent());
        EXPECT_EQ(stack.getTempCounter(), 1u);

        stack.finalize().get();
        stack.finalize().get();
        EXPECT_TRUE(stack.empty());
    }

    auto contents = readArchive(dir / "parent.tar.gz");
    EXPECT_EQ(contents.count("nested/child.tar.gz"), 1u);
    EXPECT_FALSE(fs::exists(dir / "nested" / ".temp-0"));
    fs::remove_all(dir);
}
