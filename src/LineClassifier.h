#ifndef GITCFG_LINECLASSIFIER_H
#define GITCFG_LINECLASSIFIER_H

#include <string>
#include <string_view>

#include "GitCfg/Parser.h"

namespace GitCfg {
    enum class LineKind {
        Blank,
        Comment,
        SectionHeader,
        Option,
        Invalid
    };

    struct ClassifiedLine {
        LineKind kind = LineKind::Blank;
        bool indented = false;   // Line started with a tab or space
        std::string header;      // SectionHeader: text between the brackets, verbatim
        std::string key;         // Option: name as written, edges trimmed
        std::string value;       // Option: literal value, edges trimmed
        bool hasValue = false;   // Option: a '=' or ':' separator was present
        std::string reason;      // Invalid: why the line was rejected
    };

    /**
     * Classifies single lines of git config text.
     *
     * Works on one line at a time and keeps no state between calls; whether
     * an option line is allowed at a given position is the parser's call.
     */
    class LineClassifier {
    public:
        explicit LineClassifier(const ParseOptions &options = {}) : m_Options(options) {}

        ClassifiedLine Classify(std::string_view line) const;

        static bool IsCommentLine(std::string_view line);
        static bool ParseSectionHeader(std::string_view line, std::string &header, std::string &error);

    private:
        bool ParseOption(std::string_view line, ClassifiedLine &out) const;
        std::string CleanValue(const std::string &raw) const;

        ParseOptions m_Options;
    };
} // namespace GitCfg

#endif // GITCFG_LINECLASSIFIER_H
