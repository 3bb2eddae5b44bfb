#ifndef GITCFG_ERRORS_H
#define GITCFG_ERRORS_H

/**
 * @file Errors.h
 * @brief Result codes and the exception hierarchy thrown by the GitCfg core
 *
 * Every exception derives from GitCfg::Exception, which carries one of the
 * result codes below. Callers that only care about "missing" use
 * NoSectionError / NoOptionError for check-then-act and get-with-default
 * patterns; a FormatError aborts a whole parse.
 *
 * Error code ranges:
 *   -    0       : Success
 *   -   -1 to  -99: Generic errors
 *   - -100 to -199: Document lookup errors
 *   - -200 to -299: Parse and encoding errors
 *   - -300 to -399: Pattern errors
 */

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "GitCfg/Defines.h"

namespace GitCfg {
    using ErrorCode = int32_t;

    enum : ErrorCode {
        GITCFG_OK = 0,                            /**< Success */
        GITCFG_ERROR_FAIL = -1,                   /**< Generic failure */
        GITCFG_ERROR_IO = -2,                     /**< File could not be read or written */
        GITCFG_ERROR_INVALID_ARGUMENT = -3,       /**< Key or value cannot be stored */

        GITCFG_ERROR_NO_SECTION = -100,           /**< Section does not exist */
        GITCFG_ERROR_NO_OPTION = -101,            /**< Option does not exist in the section */
        GITCFG_ERROR_DUPLICATE_SECTION = -102,    /**< Section already exists */
        GITCFG_ERROR_INVALID_SECTION_NAME = -103, /**< Section name cannot be represented */

        GITCFG_ERROR_FORMAT = -200,               /**< Input is not a valid config file */
        GITCFG_ERROR_ENCODING = -201,             /**< Text is not valid UTF-8 */

        GITCFG_ERROR_INVALID_PATTERN = -300,      /**< Regular expression failed to compile */
    };

    /**
     * @brief Convert a result code to a static description
     */
    GITCFG_EXPORT const char *GetErrorString(ErrorCode code);

    /**
     * @brief Base class for all GitCfg errors
     *
     * @code
     * try {
     *     doc.Get("core", "bare");
     * } catch (const GitCfg::Exception &e) {
     *     std::cerr << e.what() << " (code: " << e.code() << ")\n";
     * }
     * @endcode
     */
    class GITCFG_EXPORT Exception : public std::runtime_error {
    public:
        Exception(ErrorCode code, const std::string &message)
            : std::runtime_error(message), m_Code(code) {}

        /** @brief Get the result code */
        ErrorCode code() const noexcept { return m_Code; }

    private:
        ErrorCode m_Code;
    };

    class GITCFG_EXPORT NoSectionError : public Exception {
    public:
        explicit NoSectionError(const std::string &section);

        const std::string &section() const noexcept { return m_Section; }

    private:
        std::string m_Section;
    };

    class GITCFG_EXPORT NoOptionError : public Exception {
    public:
        NoOptionError(const std::string &option, const std::string &section);

        const std::string &option() const noexcept { return m_Option; }
        const std::string &section() const noexcept { return m_Section; }

    private:
        std::string m_Option;
        std::string m_Section;
    };

    class GITCFG_EXPORT DuplicateSectionError : public Exception {
    public:
        explicit DuplicateSectionError(const std::string &section);

        const std::string &section() const noexcept { return m_Section; }

    private:
        std::string m_Section;
    };

    class GITCFG_EXPORT InvalidSectionNameError : public Exception {
    public:
        explicit InvalidSectionNameError(const std::string &section);

        const std::string &section() const noexcept { return m_Section; }

    private:
        std::string m_Section;
    };

    /**
     * @brief One offending input line reported by the parser
     */
    struct FormatIssue {
        size_t lineNumber = 0; // 1-based
        std::string line;
        std::string reason;
    };

    /**
     * @brief Raised when a stream cannot be parsed
     *
     * Holds every offending line found in the input, in input order. The
     * message lists them the same way.
     */
    class GITCFG_EXPORT FormatError : public Exception {
    public:
        FormatError(std::string source, std::vector<FormatIssue> issues);

        const std::string &source() const noexcept { return m_Source; }
        const std::vector<FormatIssue> &issues() const noexcept { return m_Issues; }

    private:
        static std::string FormatMessage(const std::string &source, const std::vector<FormatIssue> &issues);

        std::string m_Source;
        std::vector<FormatIssue> m_Issues;
    };

    class GITCFG_EXPORT EncodingError : public Exception {
    public:
        explicit EncodingError(const std::string &message)
            : Exception(GITCFG_ERROR_ENCODING, message) {}
    };

    class GITCFG_EXPORT PatternError : public Exception {
    public:
        PatternError(const std::string &pattern, const std::string &reason);

        const std::string &pattern() const noexcept { return m_Pattern; }

    private:
        std::string m_Pattern;
    };
} // namespace GitCfg

#endif // GITCFG_ERRORS_H
