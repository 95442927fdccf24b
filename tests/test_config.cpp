#include <gtest/gtest.h>
#include <shellwrap/config/config.hpp>
#include <filesystem>
#include <fstream>

using namespace shellwrap;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_home = fs::temp_directory_path() / "shellwrap_cfg_home";
        fs::remove_all(m_home);
        fs::create_directories(m_home);
    }
    void TearDown() override { fs::remove_all(m_home); }
    fs::path m_home;
};

TEST_F(ConfigTest, ParsesKeys) {
    std::ofstream(m_home / ".shellwraprc")
        << "# comment\n"
        << "\n"
        << "default_shell=zsh\n"
        << "root_prefix=/opt/miniconda\r\n"
        << "debug=on\n"
        << "debug_wrapper_scripts=1\n"
        << "dev_mode=false\n"
        << "hash_algorithm=sha256\n"
        << "unknown_key=whatever\n"
        << "no equals sign\n";
    Config cfg = load_config((m_home / ".shellwraprc").string());
    EXPECT_EQ(cfg.default_shell, "zsh");
    EXPECT_EQ(cfg.root_prefix, "/opt/miniconda");
    EXPECT_TRUE(cfg.debug);
    EXPECT_TRUE(cfg.debug_wrapper_scripts);
    EXPECT_FALSE(cfg.dev_mode);
    EXPECT_EQ(cfg.hash_algorithm, "sha256");
    EXPECT_EQ(cfg.cygdrive_prefix, "/cygdrive");
}

TEST_F(ConfigTest, MissingFileGivesDefaults) {
    Config cfg = load_config((m_home / "nope").string());
    EXPECT_TRUE(cfg.default_shell.empty());
    EXPECT_FALSE(cfg.debug);
    EXPECT_EQ(cfg.hash_algorithm, "md5");
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    std::ofstream(m_home / ".shellwraprc") << "default_shell=zsh\nroot_prefix=/a\n";
    auto env = fixed_env({{"HOME", m_home.string()},
                          {"USERPROFILE", m_home.string()},
                          {"SHELLWRAP_SHELL", "fish"},
                          {"SHELLWRAP_DEBUG", "true"}});
    Config cfg = load_user_config(env);
    EXPECT_EQ(cfg.default_shell, "fish");
    EXPECT_EQ(cfg.root_prefix, "/a");
    EXPECT_TRUE(cfg.debug);
}

TEST(ParseBool, Accepted) {
    EXPECT_TRUE(parse_bool("1"));
    EXPECT_TRUE(parse_bool("true"));
    EXPECT_TRUE(parse_bool("on"));
    EXPECT_FALSE(parse_bool("yes"));
    EXPECT_FALSE(parse_bool(""));
}
