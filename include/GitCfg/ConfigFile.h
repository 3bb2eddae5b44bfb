#ifndef GITCFG_CONFIGFILE_H
#define GITCFG_CONFIGFILE_H

#include <filesystem>
#include <string>

#include "GitCfg/Defines.h"
#include "GitCfg/Document.h"
#include "GitCfg/ILogger.h"
#include "GitCfg/Parser.h"
#include "GitCfg/Serializer.h"

namespace GitCfg {
    /**
     * A Document bound to files on disk.
     *
     * Owns the file handling the core leaves to its callers: existence
     * checks, text or binary transfer, atomic replacement through a temp
     * file, and deletion. Failures are reported as a false return plus
     * GetLastError(), and logged through the configured logger (or the
     * default logger when none was given).
     */
    class GITCFG_EXPORT ConfigFile {
    public:
        explicit ConfigFile(ILogger *logger = nullptr, ParseOptions options = {});

        // Replaces the document with the contents of the file
        bool Load(const std::filesystem::path &path, StreamMode mode = StreamMode::Text);

        // Writes the document to a temp file next to path, then renames it over path
        bool Save(const std::filesystem::path &path, StreamMode mode = StreamMode::Text);

        static bool Exists(const std::filesystem::path &path);
        bool Remove(const std::filesystem::path &path);

        Document &GetDocument() noexcept { return m_Document; }
        const Document &GetDocument() const noexcept { return m_Document; }

        const std::filesystem::path &GetPath() const noexcept { return m_Path; }

        // Error reporting
        const std::string &GetLastError() const noexcept { return m_LastError; }
        ErrorCode GetLastErrorCode() const noexcept { return m_LastErrorCode; }
        void ClearError();

    private:
        ILogger *GetLogger() const;
        void SetError(ErrorCode code, const std::string &error);

        Document m_Document;
        ParseOptions m_Options;
        ILogger *m_Logger;
        std::filesystem::path m_Path;
        std::string m_LastError;
        ErrorCode m_LastErrorCode = GITCFG_OK;
    };
} // namespace GitCfg

#endif // GITCFG_CONFIGFILE_H
