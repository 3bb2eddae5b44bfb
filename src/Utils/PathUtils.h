#ifndef GITCFG_PATHUTILS_H
#define GITCFG_PATHUTILS_H

#include <filesystem>
#include <string>

namespace GitCfg::utils {
    // Existence checks
    bool FileExists(const std::filesystem::path &file);
    bool DirectoryExists(const std::filesystem::path &dir);

    // Directory creation, including missing parents
    bool CreateFileTree(const std::filesystem::path &dir);

    // File deletion
    bool DeleteFile(const std::filesystem::path &path);

    // File moving/renaming, replacing an existing destination
    bool MoveFile(const std::filesystem::path &path, const std::filesystem::path &dest);

    // Path manipulation
    std::filesystem::path GetDirectory(const std::filesystem::path &path);

    // Unused file name in the same directory as path, e.g. "config.tmp1a2b3c"
    std::filesystem::path MakeTempPath(const std::filesystem::path &path);

    // Whole-file transfer; binary skips any newline translation
    bool ReadFile(const std::filesystem::path &path, std::string &content, bool binary);
    bool WriteFile(const std::filesystem::path &path, const std::string &content, bool binary);
} // namespace GitCfg::utils

#endif // GITCFG_PATHUTILS_H
