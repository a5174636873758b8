#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "utils/archive/common/Exceptions.hpp"
#include "utils/file_engine.hpp"
#include "utils/file_options.hpp"

using fileutil::FileUtilOptions;

TEST(OptionsTest, DefaultsMatchDocumentedValues) {
    FileUtilOptions options;
    auto j = options.toJson();

    EXPECT_EQ(j["compressFormat"], "tar.gz");
    EXPECT_TRUE(j["relativePath"].is_null());
    EXPECT_EQ(j["lockRelative"], false);
    EXPECT_EQ(j["logEvent"], "log:info:raw");
    EXPECT_EQ(j["encoding"], "utf8");

    EXPECT_TRUE(j["metrics"]["directory"].is_null());
    EXPECT_EQ(j["metrics"]["format"], "text");
    EXPECT_EQ(j["metrics"]["minLevel"], "debug");
    EXPECT_EQ(j["metrics"]["maxFiles"], 5);
    EXPECT_EQ(j["metrics"]["batchSize"], 32);
}

TEST(OptionsTest, MetricsKeyMergesIntoMetricsOptions) {
    FileUtilOptions options;
    options.apply({{"metrics", {{"directory", "/var/log/fileutil"}, {"format", "json"}, {"minLevel", "warning"},
                                {"maxFileSize", 4096}, {"batchSize", 1}, {"compress", false}}}});
    options.apply({{"metrics", {{"maxFiles", -3}, {"batchSize", "many"}}}});

    EXPECT_EQ(options.metrics.directory, "/var/log/fileutil");
    EXPECT_EQ(options.metrics.format, metrics::StorageFormat::JSON);
    EXPECT_EQ(options.metrics.minLevel, metrics::LogLevel::WARNING);
    EXPECT_EQ(options.metrics.maxFileSize, 4096u);
    EXPECT_EQ(options.metrics.maxFiles, 5u);
    EXPECT_EQ(options.metrics.batchSize, 1u);
    EXPECT_FALSE(options.metrics.compress);

    auto config = options.metrics.toStorageConfig();
    EXPECT_EQ(config.base_path, "/var/log/fileutil");
    EXPECT_EQ(config.max_file_size, 4096u);
    EXPECT_EQ(options.toJson()["metrics"]["minLevel"], "warn");
}

TEST(OptionsTest, UnknownMetricsNamesLeaveOptionsUntouched) {
    FileUtilOptions options;
    try {
        options.apply({{"encoding", "hex"}, {"metrics", {{"directory", "/tmp/m"}, {"format", "xml"}}}});
        FAIL() << "expected InvalidArgumentException";
    } catch (const fileutil::common::InvalidArgumentException& e) {
        EXPECT_EQ(e.errorCode(), fileutil::common::ErrorCode::INVALID_OPTIONS);
    }
    EXPECT_THROW(options.apply({{"metrics", {{"minLevel", "verbose"}}}}), fileutil::common::InvalidArgumentException);

    EXPECT_EQ(options.encoding, "utf8");
    EXPECT_TRUE(options.metrics.directory.empty());
    EXPECT_EQ(options.metrics.format, metrics::StorageFormat::TEXT);
    EXPECT_EQ(options.metrics.minLevel, metrics::LogLevel::DEBUG);
}

TEST(OptionsTest, NonObjectIsInvalidArgument) {
    FileUtilOptions options;
    try {
        options.apply(nlohmann::json::array({1, 2}));
        FAIL() << "expected InvalidArgumentException";
    } catch (const fileutil::common::InvalidArgumentException& e) {
        EXPECT_EQ(e.errorCode(), fileutil::common::ErrorCode::INVALID_OPTIONS);
    }
    EXPECT_THROW(options.apply("tar.gz"), fileutil::common::InvalidArgumentException);
}

TEST(OptionsTest, WrongTypedAndUnknownKeysAreIgnored) {
    FileUtilOptions options;
    options.apply({{"compressFormat", 5}, {"encoding", "hex"}, {"colour", "blue"}});

    EXPECT_EQ(options.compressFormat, "tar.gz");
    EXPECT_EQ(options.encoding, "hex");
}

TEST(OptionsTest, LockRelativeFreezesBaseDirectory) {
    FileUtilOptions options;
    options.apply({{"relativePath", "/srv/out"}, {"lockRelative", true}});
    options.apply({{"relativePath", "/elsewhere"}, {"lockRelative", false}, {"logEvent", "log:debug"}});

    EXPECT_EQ(options.relativePath, "/srv/out");
    EXPECT_TRUE(options.lockRelative);
    EXPECT_EQ(options.logEvent, "log:debug");
}

TEST(OptionsTest, EngineReturnsCopyOfOptions) {
    fileutil::FileEngine engine(nlohmann::json{{"compressFormat", "zip"}});
    auto copy = engine.getOptions();
    copy["compressFormat"] = "tar.gz";

    EXPECT_EQ(engine.getOptions()["compressFormat"], "zip");
    EXPECT_THROW(engine.setOptions(nlohmann::json(42)), fileutil::common::InvalidArgumentException);
}

class OptionsFileTest : public ScratchDirTest {};

TEST_F(OptionsFileTest, LoadsJsonConfiguration) {
    auto path = createFile("fileutil.json", R"({"compressFormat": "zip", "relativePath": "/data/out"})");
    auto options = FileUtilOptions::fromFile(path.string());

    EXPECT_EQ(options.compressFormat, "zip");
    EXPECT_EQ(options.relativePath, "/data/out");
}

TEST_F(OptionsFileTest, MissingFileIsIOFailure) {
    EXPECT_THROW(FileUtilOptions::fromFile((root / "nope.json").string()), fileutil::common::IOFailureException);
}

TEST_F(OptionsFileTest, MalformedFileIsInvalidArgument) {
    auto path = createFile("broken.json", "{ not json");
    EXPECT_THROW(FileUtilOptions::fromFile(path.string()), fileutil::common::InvalidArgumentException);
}
