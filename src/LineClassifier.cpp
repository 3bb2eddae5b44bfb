#include "LineClassifier.h"

#include "Utils/StringUtils.h"

namespace GitCfg {
    namespace {
        bool IsBlank(char ch) {
            return ch == ' ' || ch == '\t';
        }

        // 'rem' comments are only recognized in column 0
        bool IsRemComment(std::string_view line) {
            if (line.empty() || (line[0] != 'r' && line[0] != 'R'))
                return false;

            size_t end = 0;
            while (end < line.size() && !IsBlank(line[end]))
                ++end;
            return utils::EqualsIgnoreCase(line.substr(0, end), "rem");
        }
    }

    bool LineClassifier::IsCommentLine(std::string_view line) {
        std::string_view stripped = utils::StripIndent(line);
        if (!stripped.empty() && (stripped[0] == '#' || stripped[0] == ';'))
            return true;
        return IsRemComment(line);
    }

    bool LineClassifier::ParseSectionHeader(std::string_view line, std::string &header, std::string &error) {
        std::string_view stripped = utils::StripIndent(line);
        if (stripped.empty() || stripped[0] != '[')
            return false;

        // Find the closing bracket, skipping over a quoted subsection so that
        // a ']' or an escaped quote inside it stays part of the name.
        bool inQuotes = false;
        size_t close = std::string_view::npos;
        for (size_t i = 1; i < stripped.size(); ++i) {
            char ch = stripped[i];
            if (inQuotes) {
                if (ch == '\\' && i + 1 < stripped.size()) {
                    ++i;
                } else if (ch == '"') {
                    inQuotes = false;
                }
                continue;
            }
            if (ch == '"') {
                inQuotes = true;
            } else if (ch == ']') {
                close = i;
                break;
            }
        }

        if (close == std::string_view::npos) {
            error = inQuotes ? "unterminated subsection name" : "missing ']' in section header";
            return true;
        }

        header.assign(stripped.substr(1, close - 1));
        if (header.empty())
            error = "empty section name";
        return true;
    }

    ClassifiedLine LineClassifier::Classify(std::string_view line) const {
        ClassifiedLine result;
        result.indented = !line.empty() && IsBlank(line[0]);

        if (utils::TrimUtf8(std::string(line)).empty()) {
            result.kind = LineKind::Blank;
            return result;
        }

        if (IsCommentLine(line)) {
            result.kind = LineKind::Comment;
            return result;
        }

        std::string error;
        if (ParseSectionHeader(line, result.header, error)) {
            if (!error.empty()) {
                result.kind = LineKind::Invalid;
                result.reason = error;
                result.header.clear();
            } else {
                result.kind = LineKind::SectionHeader;
            }
            return result;
        }

        if (ParseOption(utils::StripIndent(line), result)) {
            result.kind = LineKind::Option;
        } else {
            result.kind = LineKind::Invalid;
        }
        return result;
    }

    bool LineClassifier::ParseOption(std::string_view line, ClassifiedLine &out) const {
        size_t sep = line.find_first_of("=:");
        if (sep == 0) {
            out.reason = "missing option name";
            return false;
        }

        if (sep == std::string_view::npos) {
            if (!m_Options.allowNoValue) {
                out.reason = "option has no value";
                return false;
            }
            out.key = utils::TrimRightUtf8(std::string(line));
            out.hasValue = false;
            return true;
        }

        out.key = utils::TrimRightUtf8(std::string(line.substr(0, sep)));
        if (out.key.empty()) {
            out.reason = "missing option name";
            return false;
        }

        out.value = CleanValue(std::string(line.substr(sep + 1)));
        out.hasValue = true;
        return true;
    }

    std::string LineClassifier::CleanValue(const std::string &raw) const {
        std::string value = utils::TrimLeftUtf8(raw);

        // Only the first ';' can start a comment, and only after whitespace
        if (m_Options.stripInlineComments) {
            size_t pos = value.find(';');
            if (pos != std::string::npos && pos > 0 && IsBlank(value[pos - 1]))
                value.erase(pos);
        }

        value = utils::TrimRightUtf8(value);

        // An empty string may be written as a pair of double quotes
        if (value == "\"\"")
            value.clear();

        return value;
    }
} // namespace GitCfg
