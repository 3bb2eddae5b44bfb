#ifndef GITCFG_DOCUMENT_H
#define GITCFG_DOCUMENT_H

#include <istream>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "GitCfg/Defines.h"
#include "GitCfg/Errors.h"
#include "GitCfg/OptionValue.h"
#include "GitCfg/Parser.h"
#include "GitCfg/Section.h"
#include "GitCfg/Serializer.h"

namespace GitCfg {
    /**
     * In-memory git config: ordered sections of ordered options.
     *
     * Lookups of a missing section or option throw NoSectionError /
     * NoOptionError. The section named DEFAULT (or an empty section name) is
     * the defaults section: its options are fallbacks for every section and
     * it is written first.
     *
     * A Document is not synchronized. Callers sharing one across threads must
     * lock around every call.
     */
    class GITCFG_EXPORT Document {
    public:
        using Item = std::pair<std::string, OptionValue>;

        Document();

        // Stream operations
        void Read(std::istream &in, const ParseOptions &options = {}, const std::string &source = "<stream>");
        void ReadString(const std::string &content, const ParseOptions &options = {});
        void Write(std::ostream &out, StreamMode mode = StreamMode::Text) const;
        std::string WriteToString() const;

        // Section operations
        bool HasSection(const std::string &sectionName) const;
        void AddSection(const std::string &sectionName);
        bool RemoveSection(const std::string &sectionName);
        std::vector<std::string> Sections() const;

        const Section *GetSection(const std::string &sectionName) const;
        const Section &GetDefaults() const noexcept { return m_Defaults; }
        const std::vector<Section> &GetSections() const noexcept { return m_Sections; }

        // Option queries
        bool HasOption(const std::string &sectionName, const std::string &key) const;
        std::vector<std::string> Options(const std::string &sectionName) const;
        std::vector<Item> Items(const std::string &sectionName) const;

        const OptionValue &Get(const std::string &sectionName, const std::string &key) const;
        std::vector<std::string> GetAll(const std::string &sectionName, const std::string &key) const;
        std::string GetString(const std::string &sectionName, const std::string &key) const;

        // Option mutations
        void Set(const std::string &sectionName, const std::string &key, const std::string &value = "");
        void SetMultivar(const std::string &sectionName, const std::string &key, const std::string &value);
        void SetMultivar(const std::string &sectionName, const std::string &key, const std::vector<std::string> &values);
        bool RemoveOption(const std::string &sectionName, const std::string &key);
        bool RemoveOptionRegexp(const std::string &sectionName, const std::string &key, const std::string &pattern);

        // Utility
        void Clear();
        bool IsEmpty() const;
        size_t GetSectionCount() const noexcept { return m_Sections.size(); }

        bool operator==(const Document &rhs) const {
            return m_Defaults == rhs.m_Defaults && m_Sections == rhs.m_Sections;
        }

        static bool IsDefaultSectionName(const std::string &sectionName);

    private:
        friend class Parser;

        // Section that receives options for the name; the defaults section
        // for DEFAULT, otherwise the named section, created on first use.
        Section &ObtainSection(const std::string &sectionName);

        Section *FindSection(const std::string &sectionName);
        const Section *FindSection(const std::string &sectionName) const;
        Section &ResolveSection(const std::string &sectionName);
        const Section &ResolveSection(const std::string &sectionName) const;
        void RebuildSectionIndex();

        std::vector<Section> m_Sections;
        std::unordered_map<std::string, size_t> m_SectionIndex; // For O(1) section lookup
        Section m_Defaults;
    };
} // namespace GitCfg

#endif // GITCFG_DOCUMENT_H
