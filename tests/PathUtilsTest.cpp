#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "Utils/PathUtils.h"

using namespace GitCfg;

class PathUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "GitCfgPathUtilsTest";
        std::filesystem::create_directories(tempDir);
    }

    void TearDown() override {
        if (std::filesystem::exists(tempDir)) {
            std::filesystem::remove_all(tempDir);
        }
    }

    std::filesystem::path tempDir;
};

TEST_F(PathUtilsTest, FileAndDirectoryExistence) {
    std::ofstream(tempDir / "file") << "x";

    EXPECT_TRUE(utils::FileExists(tempDir / "file"));
    EXPECT_FALSE(utils::FileExists(tempDir));
    EXPECT_FALSE(utils::FileExists(""));
    EXPECT_TRUE(utils::DirectoryExists(tempDir));
    EXPECT_FALSE(utils::DirectoryExists(tempDir / "file"));
}

TEST_F(PathUtilsTest, CreateFileTree) {
    EXPECT_TRUE(utils::CreateFileTree(tempDir / "a" / "b" / "c"));
    EXPECT_TRUE(utils::DirectoryExists(tempDir / "a" / "b" / "c"));
    EXPECT_TRUE(utils::CreateFileTree(tempDir / "a"));
}

TEST_F(PathUtilsTest, WriteAndReadFile) {
    std::string content = "[core]\n\tbare = false\n";
    ASSERT_TRUE(utils::WriteFile(tempDir / "sub" / "config", content, true));

    std::string readBack;
    ASSERT_TRUE(utils::ReadFile(tempDir / "sub" / "config", readBack, true));
    EXPECT_EQ(content, readBack);

    std::string missing = "unchanged";
    EXPECT_FALSE(utils::ReadFile(tempDir / "missing", missing, false));
}

TEST_F(PathUtilsTest, MoveFileReplacesDestination) {
    ASSERT_TRUE(utils::WriteFile(tempDir / "src", "new", true));
    ASSERT_TRUE(utils::WriteFile(tempDir / "dest", "old", true));

    EXPECT_TRUE(utils::MoveFile(tempDir / "src", tempDir / "dest"));
    EXPECT_FALSE(utils::FileExists(tempDir / "src"));

    std::string content;
    ASSERT_TRUE(utils::ReadFile(tempDir / "dest", content, true));
    EXPECT_EQ("new", content);

    EXPECT_FALSE(utils::MoveFile(tempDir / "src", tempDir / "dest"));
}

TEST_F(PathUtilsTest, DeleteFile) {
    ASSERT_TRUE(utils::WriteFile(tempDir / "file", "x", false));
    EXPECT_TRUE(utils::DeleteFile(tempDir / "file"));
    EXPECT_FALSE(utils::DeleteFile(tempDir / "file"));
}

TEST_F(PathUtilsTest, MakeTempPathStaysInDirectory) {
    std::filesystem::path target = tempDir / "config";
    std::filesystem::path temp = utils::MakeTempPath(target);

    EXPECT_EQ(tempDir, utils::GetDirectory(temp));
    EXPECT_NE(target, temp);
    EXPECT_EQ(0u, temp.filename().string().rfind("config.tmp", 0));
    EXPECT_FALSE(utils::FileExists(temp));
}
