#include "GitCfg/ConfigFile.h"

#include <sstream>

#include "GitCfg/Logger.h"

#include "Utils/PathUtils.h"

namespace GitCfg {
    ConfigFile::ConfigFile(ILogger *logger, ParseOptions options) : m_Options(options), m_Logger(logger) {}

    bool ConfigFile::Load(const std::filesystem::path &path, StreamMode mode) {
        ClearError();

        if (!utils::FileExists(path)) {
            SetError(GITCFG_ERROR_IO, "File does not exist: " + path.string());
            return false;
        }

        std::string content;
        if (!utils::ReadFile(path, content, mode == StreamMode::Binary)) {
            SetError(GITCFG_ERROR_IO, "Failed to read file: " + path.string());
            return false;
        }

        try {
            m_Document = Parser(m_Options).ParseString(content, path.string());
        } catch (const FormatError &e) {
            SetError(e.code(), e.what());
            return false;
        }

        m_Path = path;
        if (ILogger *logger = GetLogger())
            logger->Info("Loaded %zu section(s) from %s", m_Document.GetSectionCount(), path.string().c_str());
        return true;
    }

    bool ConfigFile::Save(const std::filesystem::path &path, StreamMode mode) {
        ClearError();

        std::ostringstream out;
        try {
            Serializer(mode).Write(m_Document, out);
        } catch (const Exception &e) {
            SetError(e.code(), e.what());
            return false;
        }

        std::filesystem::path tempPath = utils::MakeTempPath(path);
        if (!utils::WriteFile(tempPath, out.str(), mode == StreamMode::Binary)) {
            utils::DeleteFile(tempPath);
            SetError(GITCFG_ERROR_IO, "Failed to write file: " + tempPath.string());
            return false;
        }

        if (!utils::MoveFile(tempPath, path)) {
            utils::DeleteFile(tempPath);
            SetError(GITCFG_ERROR_IO, "Failed to replace file: " + path.string());
            return false;
        }

        m_Path = path;
        if (ILogger *logger = GetLogger())
            logger->Info("Saved %zu section(s) to %s", m_Document.GetSectionCount(), path.string().c_str());
        return true;
    }

    bool ConfigFile::Exists(const std::filesystem::path &path) {
        return utils::FileExists(path);
    }

    bool ConfigFile::Remove(const std::filesystem::path &path) {
        ClearError();

        if (!utils::FileExists(path)) {
            SetError(GITCFG_ERROR_IO, "File does not exist: " + path.string());
            return false;
        }

        if (!utils::DeleteFile(path)) {
            SetError(GITCFG_ERROR_IO, "Failed to delete file: " + path.string());
            return false;
        }
        return true;
    }

    void ConfigFile::ClearError() {
        m_LastError.clear();
        m_LastErrorCode = GITCFG_OK;
    }

    ILogger *ConfigFile::GetLogger() const {
        return m_Logger ? m_Logger : Logger::GetDefault();
    }

    void ConfigFile::SetError(ErrorCode code, const std::string &error) {
        m_LastError = error;
        m_LastErrorCode = code;
        if (ILogger *logger = GetLogger())
            logger->Error("%s", error.c_str());
    }
} // namespace GitCfg
