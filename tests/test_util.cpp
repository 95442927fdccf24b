#include <gtest/gtest.h>
#include <shellwrap/util/bytes.hpp>
#include <shellwrap/util/env.hpp>
#include <shellwrap/util/hash.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

using namespace shellwrap;
namespace fs = std::filesystem;

TEST(HumanBytes, Thresholds) {
    EXPECT_EQ(human_bytes(0), "0 B");
    EXPECT_EQ(human_bytes(42), "42 B");
    EXPECT_EQ(human_bytes(1023), "1023 B");
    EXPECT_EQ(human_bytes(1024), "1 KB");
    EXPECT_EQ(human_bytes(1042), "1 KB");
    EXPECT_EQ(human_bytes(2560), "2 KB");
    EXPECT_EQ(human_bytes(1024*1024 - 1), "1024 KB");
    EXPECT_EQ(human_bytes(1024*1024), "1.0 MB");
    EXPECT_EQ(human_bytes(10004242), "9.5 MB");
    EXPECT_EQ(human_bytes(100000004242ull), "93.13 GB");
}

class HashTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_file = fs::temp_directory_path() / "shellwrap_hash_input";
        std::ofstream(m_file, std::ios::binary) << "abc";
    }
    void TearDown() override { fs::remove(m_file); }
    fs::path m_file;
};

TEST_F(HashTest, KnownDigests) {
    EXPECT_EQ(md5_file(m_file.string()), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(hashsum_file(m_file.string(), "sha256"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(HashTest, EmptyFile) {
    std::ofstream(m_file, std::ios::binary | std::ios::trunc).flush();
    EXPECT_EQ(md5_file(m_file.string()), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST_F(HashTest, LargerThanOneChunk) {
    {
        std::ofstream out(m_file, std::ios::binary | std::ios::trunc);
        std::string block(100000, 'x');
        for (int i=0;i<6;++i) out << block;
    }
    // 600000 bytes span three 256 KiB reads, the last one partial
    EXPECT_EQ(hashsum_file(m_file.string(), "sha1"), "ad8aeb5f36da21d3f487544298d85f268f881d21");
}

TEST_F(HashTest, Errors) {
    EXPECT_THROW(hashsum_file(m_file.string(), "not-a-digest"), std::invalid_argument);
    EXPECT_THROW(md5_file((m_file.string() + ".missing")), std::system_error);
}

TEST(EnvLookupTest, FixedAndDefault) {
    auto env = fixed_env({{"A", "1"}, {"EMPTY", ""}});
    EXPECT_EQ(env("A").value_or("?"), "1");
    EXPECT_FALSE(env("B").has_value());
    EXPECT_TRUE(env("EMPTY").has_value());
    EXPECT_EQ(getenv_or(env, "B", "dflt"), "dflt");
    EXPECT_EQ(getenv_or(env, "EMPTY", "dflt"), "");
}

TEST(SplitList, KeepsEmptyPieces) {
    EXPECT_EQ(split_list("a::b", ':'), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_EQ(split_list("", ':'), (std::vector<std::string>{""}));
    EXPECT_EQ(split_list("x\n", '\n'), (std::vector<std::string>{"x", ""}));
    EXPECT_EQ(split_list("/bin /usr/bin", ' '), (std::vector<std::string>{"/bin", "/usr/bin"}));
}

TEST(HostFlavour, MatchesBuild) {
#ifdef _WIN32
    EXPECT_TRUE(host_is_windows());
#else
    EXPECT_FALSE(host_is_windows());
#endif
}
