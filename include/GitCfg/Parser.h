#ifndef GITCFG_PARSER_H
#define GITCFG_PARSER_H

#include <istream>
#include <string>

#include "GitCfg/Defines.h"

namespace GitCfg {
    class Document;

    struct ParseOptions {
        // Reject input that is not valid UTF-8
        bool strictUtf8 = true;
        // Accept option lines without '=' (bare boolean keys)
        bool allowNoValue = true;
        // Drop text after a ';' that follows whitespace in a value
        bool stripInlineComments = true;
    };

    /**
     * Reads git-style config text into a Document.
     *
     * The whole stream is consumed in one pass. Every line that cannot be
     * classified is collected and reported through a single FormatError at
     * the end; the target document is only touched when parsing succeeds.
     */
    class GITCFG_EXPORT Parser {
    public:
        explicit Parser(ParseOptions options = {}) : m_Options(options) {}

        const ParseOptions &GetOptions() const noexcept { return m_Options; }

        Document Parse(std::istream &in, const std::string &source = "<stream>") const;
        Document ParseString(const std::string &content, const std::string &source = "<string>") const;

    private:
        ParseOptions m_Options;
    };
} // namespace GitCfg

#endif // GITCFG_PARSER_H
