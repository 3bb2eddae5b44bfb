#include "GitCfg/Parser.h"

#include <iterator>
#include <sstream>
#include <vector>

#include "GitCfg/Document.h"
#include "GitCfg/Errors.h"

#include "LineClassifier.h"
#include "Utils/StringUtils.h"

namespace GitCfg {
    Document Parser::Parse(std::istream &in, const std::string &source) const {
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad())
            throw Exception(GITCFG_ERROR_IO, "Failed to read " + source);

        utils::StripUtf8Bom(content);
        std::vector<std::string> lines = utils::SplitLines(utils::NormalizeLineEndings(content));

        LineClassifier classifier(m_Options);
        std::vector<FormatIssue> issues;

        Document doc;
        Section *current = nullptr;

        for (size_t i = 0; i < lines.size(); ++i) {
            const std::string &line = lines[i];
            const size_t lineNumber = i + 1;

            // The UTF-8 helpers stop at a NUL, so such a line is never accepted
            if (line.find('\0') != std::string::npos) {
                issues.push_back({lineNumber, line, "embedded NUL byte"});
                continue;
            }

            if (m_Options.strictUtf8 && !utils::IsValidUtf8(line)) {
                issues.push_back({lineNumber, line, "invalid UTF-8"});
                continue;
            }

            ClassifiedLine classified = classifier.Classify(line);
            switch (classified.kind) {
                case LineKind::Blank:
                case LineKind::Comment:
                    break;

                case LineKind::SectionHeader:
                    current = &doc.ObtainSection(classified.header);
                    break;

                case LineKind::Option: {
                    if (!current) {
                        issues.push_back({lineNumber, line, "option before any section header"});
                        break;
                    }

                    OptionKey key(classified.key);
                    if (key.empty()) {
                        issues.push_back({lineNumber, line, "missing option name"});
                        break;
                    }

                    if (classified.hasValue) {
                        current->Add(key, OptionValue::Item{std::move(classified.value), false});
                    } else {
                        current->Add(key, OptionValue::ImplicitItem());
                    }
                    break;
                }

                case LineKind::Invalid:
                    issues.push_back({lineNumber, line, classified.reason.empty() ? "invalid line" : classified.reason});
                    break;
            }
        }

        if (!issues.empty())
            throw FormatError(source, std::move(issues));

        return doc;
    }

    Document Parser::ParseString(const std::string &content, const std::string &source) const {
        std::istringstream in(content);
        return Parse(in, source);
    }
} // namespace GitCfg
