#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "test_helpers.hpp"
#include "utils/archive/common/Exceptions.hpp"
#include "utils/glob_engine.hpp"

using fileutil::GlobEngine;
using fileutil::HydrateResult;

class GlobTest : public ScratchDirTest {
   protected:
    void SetUp() override {
        ScratchDirTest::SetUp();
        createFile("fixture/test.js", "a");
        createFile("fixture/test2.js", "b");
        createFile("fixture/archive.tar.gz", "c");
        createFile("fixture/sub/deep.js", "d");
        createFile("fixture/.hidden/secret.js", "e");
        createFile("fixture/.dotfile", "f");
        cwd_ = std::make_unique<ScopedChdir>(root);
    }

    void TearDown() override {
        cwd_.reset();
        ScratchDirTest::TearDown();
    }

    // Paths relative to the scratch directory, for stable comparisons.
    static std::vector<std::string> relative(const std::vector<std::string>& files) {
        std::vector<std::string> out;
        for (const auto& file : files) {
            out.push_back(fs::path(file).lexically_relative(fs::current_path()).generic_string());
        }
        return out;
    }

    GlobEngine glob;

   private:
    std::unique_ptr<ScopedChdir> cwd_;
};

TEST_F(GlobTest, BarePathBecomesRecursiveGlob) {
    HydrateResult result = glob.hydrate(nlohmann::json("fixture"));

    EXPECT_EQ(result.globs, std::vector<std::string>{"fixture/**/*"});
    EXPECT_EQ(relative(result.files),
              (std::vector<std::string>{"fixture/archive.tar.gz", "fixture/sub/deep.js", "fixture/test.js",
                                        "fixture/test2.js"}));
}

TEST_F(GlobTest, TrailingSeparatorIsReused) {
    HydrateResult result = glob.hydrate(std::vector<std::string>{"fixture/sub/"});

    EXPECT_EQ(result.globs, std::vector<std::string>{"fixture/sub/**/*"});
    EXPECT_EQ(relative(result.files), std::vector<std::string>{"fixture/sub/deep.js"});
}

TEST_F(GlobTest, PatternsKeepInputOrder) {
    HydrateResult result = glob.hydrate(std::vector<std::string>{"./fixture/*.gz", "./fixture/*.js"});

    EXPECT_EQ(result.globs, (std::vector<std::string>{"./fixture/*.gz", "./fixture/*.js"}));
    EXPECT_EQ(relative(result.files),
              (std::vector<std::string>{"fixture/archive.tar.gz", "fixture/test.js", "fixture/test2.js"}));
}

TEST_F(GlobTest, DirectoriesAreNeverReturned) {
    HydrateResult result = glob.hydrate(std::vector<std::string>{"fixture/*"});

    for (const auto& file : relative(result.files)) {
        EXPECT_NE(file, "fixture/sub");
    }
    EXPECT_EQ(result.files.size(), 3u);
}

TEST_F(GlobTest, LeadingDotsNeedExplicitMatch) {
    HydrateResult hidden = glob.hydrate(std::vector<std::string>{"fixture/**/*.js"});
    for (const auto& file : relative(hidden.files)) {
        EXPECT_EQ(file.find(".hidden"), std::string::npos);
    }

    HydrateResult dotted = glob.hydrate(std::vector<std::string>{"fixture/.*"});
    EXPECT_EQ(relative(dotted.files), std::vector<std::string>{"fixture/.dotfile"});
}

TEST_F(GlobTest, BraceSetsExpandBeforeMatching) {
    HydrateResult result = glob.hydrate(std::vector<std::string>{"fixture/{test2,test}.js"});

    EXPECT_EQ(relative(result.files), (std::vector<std::string>{"fixture/test.js", "fixture/test2.js"}));
}

TEST_F(GlobTest, RejectsInvalidInput) {
    EXPECT_THROW(glob.hydrate(nlohmann::json()), fileutil::common::InvalidArgumentException);
    EXPECT_THROW(glob.hydrate(nlohmann::json(true)), fileutil::common::InvalidArgumentException);
    EXPECT_THROW(glob.hydrate(nlohmann::json::array({"string", true})), fileutil::common::InvalidArgumentException);
    EXPECT_THROW(glob.hydrate(std::vector<std::string>{""}), fileutil::common::InvalidArgumentException);
    EXPECT_THROW(glob.hydrate(std::vector<std::string>{"fixture/{1..999999999}.js"}),
                 fileutil::common::InvalidArgumentException);
}

TEST(GlobSyntaxTest, DetectsWildcards) {
    EXPECT_TRUE(GlobEngine::isGlob("src/*.js"));
    EXPECT_TRUE(GlobEngine::isGlob("file?.txt"));
    EXPECT_TRUE(GlobEngine::isGlob("[ab].c"));
    EXPECT_TRUE(GlobEngine::isGlob("{a,b}"));
    EXPECT_TRUE(GlobEngine::isGlob("+(x|y)"));
    EXPECT_FALSE(GlobEngine::isGlob("./test/fixture"));
    EXPECT_FALSE(GlobEngine::isGlob("escaped\\*star"));
}

TEST(GlobSyntaxTest, RecursiveRewrite) {
    EXPECT_EQ(GlobEngine::toRecursiveGlob("./test/fixture"), "./test/fixture/**/*");
    EXPECT_EQ(GlobEngine::toRecursiveGlob("./test/fixture/"), "./test/fixture/**/*");
    EXPECT_EQ(GlobEngine::toRecursiveGlob("dir\\"), "dir\\**\\*");
}

TEST(GlobSyntaxTest, BraceExpansion) {
    EXPECT_EQ(GlobEngine::expandBraces("a{1..3}b"), (std::vector<std::string>{"a1b", "a2b", "a3b"}));
    EXPECT_EQ(GlobEngine::expandBraces("{x,y{c,d}}"), (std::vector<std::string>{"x", "yc", "yd"}));
    EXPECT_EQ(GlobEngine::expandBraces("plain"), std::vector<std::string>{"plain"});
}

TEST(GlobSyntaxTest, OversizedBraceRangesAreRejected) {
    EXPECT_EQ(GlobEngine::expandBraces("{1..10000}").size(), 10000u);
    EXPECT_EQ(GlobEngine::expandBraces("{10000..1}").back(), "1");

    EXPECT_THROW(GlobEngine::expandBraces("{1..999999999}"), fileutil::common::InvalidArgumentException);
    EXPECT_THROW(GlobEngine::expandBraces("{-5000..5000}"), fileutil::common::InvalidArgumentException);
    EXPECT_THROW(GlobEngine::expandBraces("{1..100}{1..101}"), fileutil::common::InvalidArgumentException);
}
