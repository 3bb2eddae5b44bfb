#ifndef GITCFG_SERIALIZER_H
#define GITCFG_SERIALIZER_H

#include <ostream>
#include <string>

#include "GitCfg/Defines.h"
#include "GitCfg/OptionValue.h"

namespace GitCfg {
    class Document;

    /**
     * How bytes cross the stream boundary.
     *
     * Text streams receive the document characters unchanged. Binary
     * streams receive UTF-8 bytes, and the text is validated as UTF-8 before
     * anything is written.
     */
    enum class StreamMode {
        Text,
        Binary
    };

    /**
     * Writes a Document in canonical form.
     *
     * Output is always tab-indented with LF line endings, one line per value
     * of a multivar, and no blank lines between sections, whatever the
     * original file looked like.
     */
    class GITCFG_EXPORT Serializer {
    public:
        explicit Serializer(StreamMode mode = StreamMode::Text) : m_Mode(mode) {}

        StreamMode GetMode() const noexcept { return m_Mode; }

        void Write(const Document &doc, std::ostream &out) const;
        std::string ToString(const Document &doc) const;

        static std::string FormatHeader(const std::string &sectionName);
        static std::string FormatOption(const std::string &key, const OptionValue::Item &item);

    private:
        StreamMode m_Mode;
    };
} // namespace GitCfg

#endif // GITCFG_SERIALIZER_H
