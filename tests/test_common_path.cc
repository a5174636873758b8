#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "utils/archive/common/Exceptions.hpp"
#include "utils/common_path.hpp"

TEST(CommonPathTest, AbsolutePathsShareDirectory) {
    EXPECT_EQ(fileutil::commonPath("/this/is/a/test/path/one/file.js",
                                   "/this/is/a/test/path/one/file2.js",
                                   "/this/is/a/test/path/two/file3.js",
                                   "/this/is/a/test/path/two/file4.js",
                                   "/this/is/a/test/path/three/file5.js"),
              "/this/is/a/test/path/");
}

TEST(CommonPathTest, RelativePathsStopAtFirstDisagreement) {
    std::vector<std::string> paths{
        "../../../this/is/a/test/path/one/file.js",
        "../../../this/is/a/test/path/one/file2.js",
        "../../this/is/a/test/path/two/file3.js",
        "../../this/is/a/test/path/two/file4.js",
        "../../this/is/a/test/path/three/file5.js",
    };
    EXPECT_EQ(fileutil::commonPath(paths), "../../");
}

TEST(CommonPathTest, DegenerateInputs) {
    EXPECT_EQ(fileutil::commonPath(), "");
    EXPECT_EQ(fileutil::commonPath(std::vector<std::string>{}), "");
    EXPECT_EQ(fileutil::commonPath("a/x.js", "b/y.js"), "");
    EXPECT_EQ(fileutil::commonPath("/a", "/b"), "/");
    EXPECT_EQ(fileutil::commonPath("/a/b/c.js"), "/a/b/c.js/");
}

TEST(CommonPathTest, MappedPathSkipsUnusableRecords) {
    nlohmann::json records = nlohmann::json::array({
        {{"filePath", "/a/b/c/x.js"}},
        {{"filePath", "/a/b/d/y.js"}},
        {{"other", "/zzz/ignored.js"}},
        {{"filePath", 17}},
        "not an object",
    });
    EXPECT_EQ(fileutil::commonMappedPath("filePath", records), "/a/b/");
}

TEST(CommonPathTest, MappedPathRequiresArray) {
    EXPECT_THROW(fileutil::commonMappedPath("filePath", nlohmann::json::object()),
                 fileutil::common::InvalidArgumentException);
}
