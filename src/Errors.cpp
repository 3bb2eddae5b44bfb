#include "GitCfg/Errors.h"

#include <utility>

namespace GitCfg {
    const char *GetErrorString(ErrorCode code) {
        switch (code) {
            case GITCFG_OK:
                return "Success";
            case GITCFG_ERROR_FAIL:
                return "Generic failure";
            case GITCFG_ERROR_IO:
                return "I/O error";
            case GITCFG_ERROR_INVALID_ARGUMENT:
                return "Invalid argument";
            case GITCFG_ERROR_NO_SECTION:
                return "No such section";
            case GITCFG_ERROR_NO_OPTION:
                return "No such option";
            case GITCFG_ERROR_DUPLICATE_SECTION:
                return "Section already exists";
            case GITCFG_ERROR_INVALID_SECTION_NAME:
                return "Invalid section name";
            case GITCFG_ERROR_FORMAT:
                return "Invalid config format";
            case GITCFG_ERROR_ENCODING:
                return "Invalid UTF-8 text";
            case GITCFG_ERROR_INVALID_PATTERN:
                return "Invalid regular expression";
            default:
                return "Unknown error";
        }
    }

    NoSectionError::NoSectionError(const std::string &section)
        : Exception(GITCFG_ERROR_NO_SECTION, "No section: '" + section + "'"), m_Section(section) {}

    NoOptionError::NoOptionError(const std::string &option, const std::string &section)
        : Exception(GITCFG_ERROR_NO_OPTION, "No option '" + option + "' in section: '" + section + "'"),
          m_Option(option), m_Section(section) {}

    DuplicateSectionError::DuplicateSectionError(const std::string &section)
        : Exception(GITCFG_ERROR_DUPLICATE_SECTION, "Section '" + section + "' already exists"), m_Section(section) {}

    InvalidSectionNameError::InvalidSectionNameError(const std::string &section)
        : Exception(GITCFG_ERROR_INVALID_SECTION_NAME, "Invalid section name: '" + section + "'"), m_Section(section) {}

    FormatError::FormatError(std::string source, std::vector<FormatIssue> issues)
        : Exception(GITCFG_ERROR_FORMAT, FormatMessage(source, issues)),
          m_Source(std::move(source)), m_Issues(std::move(issues)) {}

    std::string FormatError::FormatMessage(const std::string &source, const std::vector<FormatIssue> &issues) {
        std::string msg = "Source contains parsing errors: " + source;
        for (const auto &issue : issues) {
            msg += "\n\t[line " + std::to_string(issue.lineNumber) + "]: " + issue.reason;
            if (!issue.line.empty())
                msg += ": '" + issue.line + "'";
        }
        return msg;
    }

    PatternError::PatternError(const std::string &pattern, const std::string &reason)
        : Exception(GITCFG_ERROR_INVALID_PATTERN, "Invalid pattern '" + pattern + "': " + reason), m_Pattern(pattern) {}
} // namespace GitCfg
