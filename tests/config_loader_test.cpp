#include "config/config_loader.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

using rev::config::ConfigLoader;

namespace {

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        path_ = ::testing::TempDir() + "rev_config_test.ini";
        std::ofstream out(path_);
        out << "; comment\n"
               "# another\n"
               "[github]\n"
               "uri = https://example.test/graphql\n"
               "use_gh=false\n"
               "timeout_ms=1500\n"
               "\n"
               "[browse]\n"
               "labels= dependencies, , security \n"
               "[pipeline]\n"
               "hard_cap=abc\n";
        ConfigLoader::getInstance().Clear();
    }
    void TearDown() override
    {
        std::remove(path_.c_str());
        ConfigLoader::getInstance().Clear();
    }

    std::string path_;
};

} // namespace

TEST_F(ConfigLoaderTest, ReadsSectionsAndTrimsValues)
{
    auto& cfg = ConfigLoader::getInstance();
    ASSERT_TRUE(cfg.Load(path_));

    EXPECT_EQ(cfg.Get("github", "uri", ""), "https://example.test/graphql");
    EXPECT_EQ(cfg.Get("github", "missing", "def"), "def");
    EXPECT_EQ(cfg.Get("nosection", "uri", "def"), "def");
}

TEST_F(ConfigLoaderTest, TypedGetters)
{
    auto& cfg = ConfigLoader::getInstance();
    ASSERT_TRUE(cfg.Load(path_));

    EXPECT_FALSE(cfg.GetBool("github", "use_gh", true));
    EXPECT_TRUE(cfg.GetBool("github", "missing", true));
    EXPECT_EQ(cfg.GetInt("github", "timeout_ms", 0), 1500);
    EXPECT_EQ(cfg.GetInt("pipeline", "hard_cap", 100), 100);
    EXPECT_EQ(cfg.GetList("browse", "labels"),
              (std::vector<std::string>{"dependencies", "security"}));
    EXPECT_TRUE(cfg.GetList("browse", "missing").empty());
}

TEST_F(ConfigLoaderTest, LoadFirstSkipsMissingFiles)
{
    auto& cfg = ConfigLoader::getInstance();
    EXPECT_FALSE(cfg.Load("/nonexistent/rev.ini"));
    EXPECT_EQ(cfg.LoadFirst({"/nonexistent/rev.ini", path_}), path_);
    EXPECT_EQ(cfg.LoadFirst({"/nonexistent/a.ini", ""}), "");
}
