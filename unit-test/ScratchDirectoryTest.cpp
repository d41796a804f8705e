#include <sys/stat.h>
#include <filesystem>
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "test/environment.hpp"

using namespace std;
using namespace execjudge;
namespace fs = std::filesystem;

class ScratchDirectoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = test::unique_temp_dir("execjudge-scratch");
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    fs::path dir;
};

TEST_F(ScratchDirectoryTest, Layout) {
    scratch_directory scratch(dir);
    EXPECT_EQ(scratch.path().parent_path(), dir);
    EXPECT_TRUE(fs::is_directory(scratch.box()));
    EXPECT_TRUE(fs::is_directory(scratch.io()));
}

TEST_F(ScratchDirectoryTest, RemovesDirectoriesWithoutPermissions) {
    fs::path path;
    {
        scratch_directory scratch(dir);
        path = scratch.path();
        fs::create_directories(scratch.box() / "d" / "e");
        write_file_content(scratch.box() / "d" / "f", "x");
        write_file_content(scratch.box() / "d" / "e" / "g", "y");
        // 选手程序把自己创建的目录设为不可访问
        ASSERT_EQ(chmod((scratch.box() / "d" / "e").c_str(), 0), 0);
        ASSERT_EQ(chmod((scratch.box() / "d").c_str(), 0), 0);
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(ScratchDirectoryTest, KeepsDirectoryInDebugMode) {
    fs::path path;
    {
        scratch_directory scratch(dir, true);
        path = scratch.path();
    }
    EXPECT_TRUE(fs::is_directory(path / "box"));
}
