#include <gtest/gtest.h>
#include <shellwrap/wrap/temp_file.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

using namespace shellwrap;
namespace fs = std::filesystem;

TEST(TempFileBasic, OutlivesHandle) {
    fs::path dir = fs::temp_directory_path() / "shellwrap_tempfile_test";
    fs::remove_all(dir); fs::create_directories(dir);
    std::string path;
    {
        TempFile f = TempFile::create((dir / "job-").string(), ".sh");
        f.write("echo hi\n");
        path = f.path();
        EXPECT_TRUE(f.is_open());
    }
    ASSERT_TRUE(fs::exists(path));
    EXPECT_EQ(fs::path(path).parent_path(), dir);
    std::string name = fs::path(path).filename().string();
    EXPECT_EQ(name.rfind("job-", 0), 0u);
    EXPECT_EQ(name.substr(name.size() - 3), ".sh");
    std::ifstream in(path); std::ostringstream oss; oss << in.rdbuf();
    EXPECT_EQ(oss.str(), "echo hi\n");
    fs::remove_all(dir);
}

TEST(TempFileBasic, WriteAfterCloseThrows) {
    fs::path dir = fs::temp_directory_path();
    TempFile f = TempFile::create((dir / "shellwrap_closed_").string());
    f.close();
    EXPECT_FALSE(f.is_open());
    EXPECT_THROW(f.write("x"), std::system_error);
    f.close();
    fs::remove(f.path());
}

TEST(TempFileBasic, MoveKeepsPath) {
    fs::path dir = fs::temp_directory_path();
    TempFile a = TempFile::create((dir / "shellwrap_move_").string());
    std::string p = a.path();
    TempFile b = std::move(a);
    EXPECT_EQ(b.path(), p);
    EXPECT_TRUE(b.is_open());
    b.write("ok");
    b.close();
    fs::remove(p);
}

TEST(TempFileBasic, MissingDirectory) {
    fs::path dir = fs::temp_directory_path() / "shellwrap_no_such_dir" / "deeper";
    EXPECT_THROW(TempFile::create((dir / "x").string()), std::system_error);
}
