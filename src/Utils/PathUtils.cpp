#include "PathUtils.h"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <random>
#include <system_error>

namespace GitCfg::utils {
    bool FileExists(const std::filesystem::path &file) {
        if (file.empty())
            return false;
        std::error_code ec;
        return std::filesystem::is_regular_file(file, ec);
    }

    bool DirectoryExists(const std::filesystem::path &dir) {
        if (dir.empty())
            return false;
        std::error_code ec;
        return std::filesystem::is_directory(dir, ec);
    }

    bool CreateFileTree(const std::filesystem::path &dir) {
        if (dir.empty())
            return false;
        if (DirectoryExists(dir))
            return true;

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        return !ec;
    }

    bool DeleteFile(const std::filesystem::path &path) {
        if (!FileExists(path))
            return false;

        std::error_code ec;
        return std::filesystem::remove(path, ec) && !ec;
    }

    bool MoveFile(const std::filesystem::path &path, const std::filesystem::path &dest) {
        if (!FileExists(path) || dest.empty())
            return false;

        std::error_code ec;
        std::filesystem::rename(path, dest, ec);
        return !ec;
    }

    std::filesystem::path GetDirectory(const std::filesystem::path &path) {
        return path.parent_path();
    }

    std::filesystem::path MakeTempPath(const std::filesystem::path &path) {
        static std::mt19937 rng(static_cast<unsigned>(
            std::chrono::steady_clock::now().time_since_epoch().count()));
        std::uniform_int_distribution<unsigned> dist(0, 0xFFFFFF);

        std::filesystem::path candidate;
        do {
            char suffix[16];
            std::snprintf(suffix, sizeof(suffix), ".tmp%06x", dist(rng));
            candidate = path;
            candidate += suffix;
        } while (FileExists(candidate));
        return candidate;
    }

    bool ReadFile(const std::filesystem::path &path, std::string &content, bool binary) {
        if (!FileExists(path))
            return false;

        std::ifstream file(path, binary ? std::ios::in | std::ios::binary : std::ios::in);
        if (!file.is_open())
            return false;

        content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        return !file.bad();
    }

    bool WriteFile(const std::filesystem::path &path, const std::string &content, bool binary) {
        // Create directory structure if needed
        std::filesystem::path dir = GetDirectory(path);
        if (!dir.empty() && !CreateFileTree(dir))
            return false;

        std::ofstream file(path, binary ? std::ios::out | std::ios::binary | std::ios::trunc
                                        : std::ios::out | std::ios::trunc);
        if (!file.is_open())
            return false;

        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        return file.good();
    }
} // namespace GitCfg::utils
