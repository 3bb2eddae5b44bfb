#include "GitCfg/Serializer.h"

#include <sstream>

#include "GitCfg/Document.h"
#include "GitCfg/Errors.h"

#include "Utils/StringUtils.h"

namespace GitCfg {
    namespace {
        void WriteSection(std::ostream &out, const Section &section) {
            out << Serializer::FormatHeader(section.GetName()) << '\n';
            for (const auto &entry : section.GetEntries()) {
                for (const auto &item : entry.value.GetItems()) {
                    out << Serializer::FormatOption(entry.key.str(), item) << '\n';
                }
            }
        }
    }

    std::string Serializer::FormatHeader(const std::string &sectionName) {
        return "[" + sectionName + "]";
    }

    std::string Serializer::FormatOption(const std::string &key, const OptionValue::Item &item) {
        if (item.implicit)
            return "\t" + key;
        return utils::TrimRightUtf8("\t" + key + " = " + item.text);
    }

    void Serializer::Write(const Document &doc, std::ostream &out) const {
        std::string text = ToString(doc);

        if (m_Mode == StreamMode::Binary && !utils::IsValidUtf8(text))
            throw EncodingError("Document contains text that is not valid UTF-8");

        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        if (!out)
            throw Exception(GITCFG_ERROR_IO, "Failed to write config stream");
    }

    std::string Serializer::ToString(const Document &doc) const {
        std::ostringstream out;
        if (!doc.GetDefaults().Empty())
            WriteSection(out, doc.GetDefaults());
        for (const auto &section : doc.GetSections()) {
            WriteSection(out, section);
        }
        return out.str();
    }
} // namespace GitCfg
