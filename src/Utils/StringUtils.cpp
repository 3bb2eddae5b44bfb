#include "StringUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

#include <utf8.h>

namespace {
    bool IsAsciiSpaceOrTab(char ch) {
        return ch == ' ' || ch == '\t';
    }

    char AsciiToLower(char ch) {
        return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
    }
}

namespace GitCfg::utils {
    bool IsValidUtf8(const std::string &str) {
        if (str.empty()) return true;

        // utf8valid stops at a NUL, so each NUL-separated run is checked on its own
        size_t start = 0;
        while (start < str.size()) {
            size_t end = str.find('\0', start);
            if (end == std::string::npos)
                end = str.size();
            if (end > start) {
                std::string run = str.substr(start, end - start);
                if (utf8valid((const utf8_int8_t *) run.c_str()) != nullptr) // utf8valid returns NULL for valid strings
                    return false;
            }
            start = end + 1;
        }
        return true;
    }

    bool IsUtf8Whitespace(const char *str, size_t *advance) {
        if (!str || !*str) return false;

        utf8_int32_t codepoint;
        const char *next = (const char *) utf8codepoint((const utf8_int8_t *) str, &codepoint);
        if (!next) return false;

        if (advance) {
            *advance = next - str;
        }

        return (codepoint == 0x20) ||                       // Space
            (codepoint == 0x09) ||                          // Tab
            (codepoint == 0x0A) ||                          // Line Feed
            (codepoint == 0x0D) ||                          // Carriage Return
            (codepoint == 0x0B) ||                          // Vertical Tab
            (codepoint == 0x0C) ||                          // Form Feed
            (codepoint == 0xA0) ||                          // Non-breaking space
            (codepoint >= 0x2000 && codepoint <= 0x200A) || // Various Unicode spaces
            (codepoint == 0x2028) ||                        // Line separator
            (codepoint == 0x2029) ||                        // Paragraph separator
            (codepoint == 0x202F) ||                        // Narrow no-break space
            (codepoint == 0x205F) ||                        // Medium mathematical space
            (codepoint == 0x3000);                          // Ideographic space
    }

    std::string TrimLeftUtf8(const std::string &str) {
        if (str.empty()) return str;

        // Invalid input is only trimmed of ASCII blanks
        if (!IsValidUtf8(str)) {
            size_t start = 0;
            while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start])))
                ++start;
            return str.substr(start);
        }

        const char *start = str.c_str();
        const char *end = start + str.length();
        while (start < end) {
            size_t advance = 0;
            if (!IsUtf8Whitespace(start, &advance))
                break;
            start += advance;
        }

        return std::string(start, end - start);
    }

    std::string TrimRightUtf8(const std::string &str) {
        if (str.empty()) return str;

        if (!IsValidUtf8(str)) {
            size_t end = str.size();
            while (end > 0 && std::isspace(static_cast<unsigned char>(str[end - 1])))
                --end;
            return str.substr(0, end);
        }

        const char *start = str.c_str();
        const char *trimEnd = start + str.length();
        while (trimEnd > start) {
            // Find the start of the last UTF-8 character
            const char *prev = trimEnd - 1;
            while (prev > start && (static_cast<unsigned char>(*prev) & 0xC0) == 0x80) {
                prev--;
            }

            size_t advance = 0;
            if (!IsUtf8Whitespace(prev, &advance))
                break;
            trimEnd = prev;
        }

        return std::string(start, trimEnd - start);
    }

    std::string TrimUtf8(const std::string &str) {
        return TrimRightUtf8(TrimLeftUtf8(str));
    }

    std::string_view StripIndent(std::string_view str) {
        size_t off = 0;
        while (off < str.size() && IsAsciiSpaceOrTab(str[off]))
            ++off;
        return str.substr(off);
    }

    std::string ToLowerUtf8(const std::string &str) {
        if (str.empty()) return str;

        // utf8lwr would stop at an embedded NUL
        if (str.find('\0') != std::string::npos || !IsValidUtf8(str)) {
            std::string result = str;
            std::transform(result.begin(), result.end(), result.begin(), AsciiToLower);
            return result;
        }

        // utf8lwr modifies in place, so we need a copy
        utf8_int8_t *strCopy = utf8dup((const utf8_int8_t *) str.c_str());
        if (!strCopy) return str;

        utf8lwr(strCopy);
        std::string result((char *) strCopy);
        free(strCopy);
        return result;
    }

    bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
        if (a.size() != b.size())
            return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (AsciiToLower(a[i]) != AsciiToLower(b[i]))
                return false;
        }
        return true;
    }

    bool StripUtf8Bom(std::string &str) {
        if (str.size() >= 3 &&
            static_cast<unsigned char>(str[0]) == 0xEF &&
            static_cast<unsigned char>(str[1]) == 0xBB &&
            static_cast<unsigned char>(str[2]) == 0xBF) {
            str.erase(0, 3);
            return true;
        }
        return false;
    }

    std::string NormalizeLineEndings(std::string_view str) {
        std::string result;
        result.reserve(str.size());
        for (size_t i = 0; i < str.size(); ++i) {
            char ch = str[i];
            if (ch == '\r') {
                // CRLF keeps the LF, a standalone CR becomes one
                if (i + 1 < str.size() && str[i + 1] == '\n')
                    continue;
                result += '\n';
            } else {
                result += ch;
            }
        }
        return result;
    }

    std::vector<std::string> SplitLines(const std::string &str) {
        std::vector<std::string> lines;
        std::istringstream stream(str);
        std::string line;
        while (std::getline(stream, line)) {
            lines.push_back(std::move(line));
        }
        return lines;
    }
} // namespace GitCfg::utils
