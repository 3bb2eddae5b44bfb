#ifndef GITCFG_STRINGUTILS_H
#define GITCFG_STRINGUTILS_H

#include <string>
#include <string_view>
#include <vector>

namespace GitCfg::utils {
    // UTF-8 validation
    bool IsValidUtf8(const std::string &str);

    // Whitespace detection for the codepoint at str; advance receives its size in bytes
    bool IsUtf8Whitespace(const char *str, size_t *advance);

    // Trimming of Unicode whitespace
    std::string TrimUtf8(const std::string &str);
    std::string TrimLeftUtf8(const std::string &str);
    std::string TrimRightUtf8(const std::string &str);

    // Indentation is tabs and spaces only
    std::string_view StripIndent(std::string_view str);

    // Case conversion
    std::string ToLowerUtf8(const std::string &str);
    bool EqualsIgnoreCase(std::string_view a, std::string_view b);

    // Line handling
    bool StripUtf8Bom(std::string &str);
    std::string NormalizeLineEndings(std::string_view str);
    std::vector<std::string> SplitLines(const std::string &str);

    inline bool StartsWith(std::string_view str, std::string_view prefix) {
        return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
    }
} // namespace GitCfg::utils

#endif // GITCFG_STRINGUTILS_H
