#include "pystyle/io/file_system.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace pystyle {

class FileSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "pystyle_file_system_test";
        std::filesystem::create_directories(test_dir_);
        test_file_ = test_dir_ / "module.py";
    }

    void TearDown() override {
        // Clean up test files
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto write_raw(const std::string& content) -> void {
        std::ofstream file(test_file_, std::ios::binary);
        file << content;
    }

    FileSystem filesystem_;
    std::filesystem::path test_dir_;
    std::filesystem::path test_file_;
};

TEST_F(FileSystemTest, ReadPreservesBytes)
{
    write_raw("import os\r\nx = 1   \r\nlast");

    auto content = filesystem_.read_file(test_file_.string());

    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "import os\r\nx = 1   \r\nlast");
}

TEST_F(FileSystemTest, ReadMissingFileReturnsNullopt)
{
    EXPECT_FALSE(filesystem_.read_file((test_dir_ / "absent.py").string()).has_value());
}

TEST_F(FileSystemTest, WriteReplacesContent)
{
    write_raw("x=1\n");

    EXPECT_TRUE(filesystem_.write_file(test_file_.string(), "x = 1\n"));

    auto content = filesystem_.read_file(test_file_.string());
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "x = 1\n");
}

TEST_F(FileSystemTest, WriteLeavesNoTemporaryFile)
{
    EXPECT_TRUE(filesystem_.write_file(test_file_.string(), "y = 2\n"));

    EXPECT_FALSE(std::filesystem::exists(test_file_.string() + ".tmp"));
}

TEST_F(FileSystemTest, WriteIntoMissingDirectoryFails)
{
    auto path = test_dir_ / "no_such_dir" / "module.py";

    EXPECT_FALSE(filesystem_.write_file(path.string(), "z = 3\n"));
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(FileSystemTest, FileExists)
{
    EXPECT_FALSE(filesystem_.file_exists(test_file_.string()));

    write_raw("");

    EXPECT_TRUE(filesystem_.file_exists(test_file_.string()));
    EXPECT_FALSE(filesystem_.file_exists(test_dir_.string()));
}

} // namespace pystyle
