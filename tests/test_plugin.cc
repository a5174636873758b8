#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "file-util.hpp"
#include "test_helpers.hpp"
#include "utils/archive/common/Exceptions.hpp"
#include "utils/event_engine.hpp"

using namespace fileutil::plugin;

class PluginTest : public ScratchDirTest {
   protected:
    void SetUp() override {
        ScratchDirTest::SetUp();
        out = root / "out";
        bus = std::make_shared<EventSystem::EventDispatcher>(std::make_shared<EventSystem::NullLogger>());
        bus->subscribe<LogMessage>("log:info:raw", [this](LogMessage& message) { logs.push_back(message.message); });
        plugin = onPluginLoad(bus, {{"relativePath", out.string()}});
    }

    void TearDown() override {
        plugin.reset();
        bus.reset();
        ScratchDirTest::TearDown();
    }

    fs::path out;
    std::shared_ptr<EventSystem::EventDispatcher> bus;
    std::shared_ptr<FileUtilPlugin> plugin;
    std::vector<std::string> logs;
};

TEST_F(PluginTest, RegistersEveryCommandUnderDefaultPrefix) {
    const std::vector<std::string> suffixes{
        "util:file:hydrate:glob", "util:file:archive:create", "util:file:archive:finalize",
        "util:file:copy",         "util:file:get:options",    "util:file:read:lines",
        "util:file:set:options",  "util:file:write",          "util:file:common:path",
        "util:file:empty:relative:path",
    };
    for (const auto& suffix : suffixes) {
        EXPECT_TRUE(bus->has_handlers("typhonjs:" + suffix)) << suffix;
    }
}

TEST_F(PluginTest, EventPrependChangesTopics) {
    auto other = onPluginLoad(bus, {{"eventPrepend", "custom"}});

    EXPECT_EQ(other->eventPrepend(), "custom");
    EXPECT_TRUE(bus->has_handlers("custom:util:file:write"));

    other.reset();
    EXPECT_FALSE(bus->has_handlers("custom:util:file:write"));
}

TEST_F(PluginTest, WriteCommandWritesAndLogsToBus) {
    WriteCommand write{"hello", "greeting.txt"};
    bus->invoke("typhonjs:util:file:write", write);

    EXPECT_EQ(slurp(out / "greeting.txt"), "hello");
    EXPECT_EQ(logs, std::vector<std::string>{"output: greeting.txt"});
}

TEST_F(PluginTest, LogEventOptionRedirectsNotifications) {
    std::vector<std::string> debug;
    bus->subscribe<LogMessage>("log:debug", [&debug](LogMessage& message) { debug.push_back(message.message); });

    OptionsCommand set;
    set.options = {{"logEvent", "log:debug"}};
    bus->invoke("typhonjs:util:file:set:options", set);

    WriteCommand write{"x", "x.txt"};
    bus->invoke("typhonjs:util:file:write", write);

    EXPECT_TRUE(logs.empty());
    EXPECT_EQ(debug, std::vector<std::string>{"output: x.txt"});
}

TEST_F(PluginTest, OptionsRoundTripThroughBus) {
    OptionsCommand set;
    set.options = {{"compressFormat", "zip"}, {"lockRelative", true}};
    bus->invoke("typhonjs:util:file:set:options", set);

    OptionsCommand get;
    bus->invoke("typhonjs:util:file:get:options", get);
    EXPECT_EQ(get.options["compressFormat"], "zip");
    EXPECT_EQ(get.options["relativePath"], out.string());
    EXPECT_EQ(get.options["lockRelative"], true);

    OptionsCommand bad;
    bad.options = "not an object";
    EXPECT_THROW(bus->invoke("typhonjs:util:file:set:options", bad), fileutil::common::InvalidArgumentException);
}

TEST_F(PluginTest, ArchiveCommandsBuildArchive) {
    ArchiveCreateCommand create;
    create.filePath = "bundle";
    bus->invoke("typhonjs:util:file:archive:create", create);
    EXPECT_EQ(create.logicalPath, "bundle.tar.gz");

    WriteCommand write{"inside", "inside.txt", true};
    bus->invoke("typhonjs:util:file:write", write);

    ArchiveFinalizeCommand finalize;
    bus->invoke("typhonjs:util:file:archive:finalize", finalize);
    ASSERT_TRUE(finalize.completion.valid());
    finalize.completion.get();

    EXPECT_TRUE(fs::exists(out / "bundle.tar.gz"));
    EXPECT_FALSE(fs::exists(out / "inside.txt"));
    EXPECT_EQ(logs.front(), "creating archive: bundle");
    EXPECT_EQ(logs.back(), "finalizing archive: bundle.tar.gz");
}

TEST_F(PluginTest, ReadLinesAndCommonPathCommands) {
    auto path = createFile("lines.txt", "one\ntwo\nthree");

    ReadLinesCommand read;
    read.filePath = path.string();
    read.lineStart = 1;
    read.lineEnd = 3;
    bus->invoke("typhonjs:util:file:read:lines", read);
    EXPECT_EQ(read.lines, (std::vector<std::string>{"2| two", "3| three"}));

    CommonPathCommand common;
    common.paths = {"/a/b/c.js", "/a/b/d/e.js"};
    bus->invoke("typhonjs:util:file:common:path", common);
    EXPECT_EQ(common.result, "/a/b/");

    CommonMappedPathCommand mapped;
    mapped.key = "filePath";
    mapped.records = nlohmann::json::array({{{"filePath", "../x/y.js"}}, {{"filePath", "../x/z.js"}}});
    bus->invoke("typhonjs:util:file:common:mapped:path", mapped);
    EXPECT_EQ(mapped.result, "../x/");
}

TEST_F(PluginTest, HydrateGlobCommand) {
    createFile("g/a.js", "a");
    createFile("g/b.txt", "b");

    HydrateGlobCommand hydrate;
    hydrate.globs = (root / "g" / "*.js").string();
    bus->invoke("typhonjs:util:file:hydrate:glob", hydrate);
    ASSERT_EQ(hydrate.result.files.size(), 1u);
    EXPECT_EQ(fs::path(hydrate.result.files[0]).filename(), "a.js");

    HydrateGlobCommand invalid;
    invalid.globs = true;
    EXPECT_THROW(bus->invoke("typhonjs:util:file:hydrate:glob", invalid), fileutil::common::InvalidArgumentException);
}

TEST_F(PluginTest, EmptyDirectoryCommand) {
    createFile("out/junk.txt", "j");
    ScopedChdir cwd(root);

    EmptyDirectoryCommand empty;
    bus->invoke("typhonjs:util:file:empty:relative:path", empty);
    EXPECT_TRUE(empty.emptied);
    EXPECT_TRUE(fs::is_empty(out));
}

TEST_F(PluginTest, DestroyedPluginStopsHandling) {
    plugin.reset();
    WriteCommand write{"x", "x.txt"};
    EXPECT_THROW(bus->invoke("typhonjs:util:file:write", write), EventSystem::NoHandlersException);
}
