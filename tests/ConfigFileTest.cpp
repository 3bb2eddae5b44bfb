#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdarg>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "GitCfg/ConfigFile.h"

using namespace GitCfg;
using namespace testing;

namespace {
    class CapturingLogger : public ILogger {
    public:
        void Info(const char *fmt, ...) override {
            va_list args;
            va_start(args, fmt);
            Capture(infos, fmt, args);
            va_end(args);
        }

        void Warn(const char *fmt, ...) override {
            va_list args;
            va_start(args, fmt);
            Capture(warnings, fmt, args);
            va_end(args);
        }

        void Error(const char *fmt, ...) override {
            va_list args;
            va_start(args, fmt);
            Capture(errors, fmt, args);
            va_end(args);
        }

        std::vector<std::string> infos;
        std::vector<std::string> warnings;
        std::vector<std::string> errors;

    private:
        static void Capture(std::vector<std::string> &lines, const char *fmt, va_list args) {
            char buffer[1024];
            std::vsnprintf(buffer, sizeof(buffer), fmt, args);
            lines.emplace_back(buffer);
        }
    };
}

class ConfigFileTest : public Test {
protected:
    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "GitCfgConfigFileTest";
        std::filesystem::create_directories(tempDir);
    }

    void TearDown() override {
        if (std::filesystem::exists(tempDir)) {
            std::filesystem::remove_all(tempDir);
        }
    }

    void CreateTestFile(const std::string &filename, const std::string &content) {
        std::ofstream file(tempDir / filename, std::ios::binary);
        file << content;
    }

    std::string ReadTestFile(const std::string &filename) {
        std::ifstream file(tempDir / filename, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    size_t CountFiles() const {
        size_t count = 0;
        for (const auto &entry : std::filesystem::directory_iterator(tempDir)) {
            (void) entry;
            ++count;
        }
        return count;
    }

    std::filesystem::path tempDir;
    CapturingLogger logger;
};

TEST_F(ConfigFileTest, LoadReadsDocument) {
    CreateTestFile("config", "[core]\r\n\tbare = false\r\n[remote \"origin\"]\r\n\tfetch = a\r\n\tfetch = b\r\n");

    ConfigFile file(&logger);
    ASSERT_TRUE(file.Load(tempDir / "config"));
    EXPECT_EQ(tempDir / "config", file.GetPath());
    EXPECT_EQ("false", file.GetDocument().GetString("core", "bare"));
    EXPECT_THAT(file.GetDocument().GetAll("remote \"origin\"", "fetch"), ElementsAre("a", "b"));
    EXPECT_TRUE(file.GetLastError().empty());
    EXPECT_EQ(1u, logger.infos.size());
}

TEST_F(ConfigFileTest, LoadMissingFileFails) {
    ConfigFile file(&logger);
    EXPECT_FALSE(file.Load(tempDir / "missing"));
    EXPECT_EQ(GITCFG_ERROR_IO, file.GetLastErrorCode());
    EXPECT_THAT(file.GetLastError(), HasSubstr("File does not exist"));
    ASSERT_EQ(1u, logger.errors.size());
}

TEST_F(ConfigFileTest, LoadMalformedFileKeepsDocument) {
    CreateTestFile("good", "[core]\n\tbare = false\n");
    CreateTestFile("bad", "[core\n\tbare = false\n");

    ConfigFile file(&logger);
    ASSERT_TRUE(file.Load(tempDir / "good"));
    EXPECT_FALSE(file.Load(tempDir / "bad"));
    EXPECT_EQ(GITCFG_ERROR_FORMAT, file.GetLastErrorCode());
    EXPECT_THAT(file.GetLastError(), HasSubstr("[line 1]"));
    EXPECT_EQ("false", file.GetDocument().GetString("core", "bare"));
    EXPECT_EQ(tempDir / "good", file.GetPath());
}

TEST_F(ConfigFileTest, SaveWritesCanonicalText) {
    CreateTestFile("config", "[user]\n        name = Артём Анисимов\n\n[core]\n    bare = false ; comment\n");

    ConfigFile file(&logger);
    ASSERT_TRUE(file.Load(tempDir / "config"));
    ASSERT_TRUE(file.Save(tempDir / "config"));
    EXPECT_EQ("[user]\n\tname = Артём Анисимов\n[core]\n\tbare = false\n", ReadTestFile("config"));
    // The temp file was renamed over the target
    EXPECT_EQ(1u, CountFiles());
}

TEST_F(ConfigFileTest, SaveCreatesMissingDirectories) {
    ConfigFile file(&logger);
    file.GetDocument().AddSection("core");
    file.GetDocument().Set("core", "bare", "true");

    ASSERT_TRUE(file.Save(tempDir / "nested" / "config", StreamMode::Binary));
    EXPECT_TRUE(ConfigFile::Exists(tempDir / "nested" / "config"));
    EXPECT_EQ("[core]\n\tbare = true\n", ReadTestFile("nested/config"));
}

TEST_F(ConfigFileTest, BinarySaveRejectsInvalidUtf8) {
    ConfigFile file(&logger);
    file.GetDocument().AddSection("user");
    file.GetDocument().Set("user", "name", "\xff");

    EXPECT_FALSE(file.Save(tempDir / "config", StreamMode::Binary));
    EXPECT_EQ(GITCFG_ERROR_ENCODING, file.GetLastErrorCode());
    EXPECT_FALSE(ConfigFile::Exists(tempDir / "config"));
    EXPECT_EQ(0u, CountFiles());
}

TEST_F(ConfigFileTest, BinaryLoadRoundTrips) {
    ConfigFile writer(&logger);
    writer.GetDocument().AddSection("alias");
    writer.GetDocument().Set("alias", "graph", "log --all --decorate --oneline --graph");
    ASSERT_TRUE(writer.Save(tempDir / "config", StreamMode::Binary));

    ConfigFile reader(&logger);
    ASSERT_TRUE(reader.Load(tempDir / "config", StreamMode::Binary));
    EXPECT_EQ(writer.GetDocument(), reader.GetDocument());
}

TEST_F(ConfigFileTest, RemoveDeletesFile) {
    CreateTestFile("config", "[core]\n");

    ConfigFile file(&logger);
    EXPECT_TRUE(ConfigFile::Exists(tempDir / "config"));
    EXPECT_TRUE(file.Remove(tempDir / "config"));
    EXPECT_FALSE(ConfigFile::Exists(tempDir / "config"));

    EXPECT_FALSE(file.Remove(tempDir / "config"));
    EXPECT_EQ(GITCFG_ERROR_IO, file.GetLastErrorCode());
}

TEST_F(ConfigFileTest, SuccessClearsPreviousError) {
    CreateTestFile("config", "[core]\n");

    ConfigFile file(&logger);
    EXPECT_FALSE(file.Load(tempDir / "missing"));
    EXPECT_TRUE(file.Load(tempDir / "config"));
    EXPECT_EQ(GITCFG_OK, file.GetLastErrorCode());
    EXPECT_TRUE(file.GetLastError().empty());
}

TEST_F(ConfigFileTest, DirectoryIsNotAFile) {
    EXPECT_FALSE(ConfigFile::Exists(tempDir));
}
