#include "GitCfg/Document.h"

#include <cstddef>
#include <sstream>

#include "LineClassifier.h"
#include "Utils/Regex.h"
#include "Utils/StringUtils.h"

namespace GitCfg {
    namespace {
        const std::string kLineBreakOrNul("\r\n\0", 3);

        void ValidateKey(const std::string &key, const OptionKey &normalized) {
            if (normalized.empty())
                throw Exception(GITCFG_ERROR_INVALID_ARGUMENT, "Option name is empty");

            const std::string &name = normalized.str();
            if (name.find_first_of("=:") != std::string::npos || name.find_first_of(kLineBreakOrNul) != std::string::npos ||
                name[0] == '[' || name[0] == '#' || name[0] == ';')
                throw Exception(GITCFG_ERROR_INVALID_ARGUMENT, "Invalid option name: '" + key + "'");
        }

        // The header written for the name must read back as the same name
        bool IsWritableSectionName(const std::string &name) {
            if (name.empty() || name.find_first_of(kLineBreakOrNul) != std::string::npos)
                return false;

            std::string header;
            std::string error;
            if (!LineClassifier::ParseSectionHeader(Serializer::FormatHeader(name), header, error))
                return false;
            return error.empty() && header == name;
        }

        void ValidateValue(const std::string &value) {
            if (value.find_first_of(kLineBreakOrNul) != std::string::npos)
                throw Exception(GITCFG_ERROR_INVALID_ARGUMENT, "Option value contains a line break or NUL byte");
        }
    }

    Document::Document() : m_Defaults(GITCFG_DEFAULT_SECTION) {}

    void Document::Read(std::istream &in, const ParseOptions &options, const std::string &source) {
        Document parsed = Parser(options).Parse(in, source);
        *this = std::move(parsed);
    }

    void Document::ReadString(const std::string &content, const ParseOptions &options) {
        std::istringstream in(content);
        Read(in, options, "<string>");
    }

    void Document::Write(std::ostream &out, StreamMode mode) const {
        Serializer(mode).Write(*this, out);
    }

    std::string Document::WriteToString() const {
        return Serializer().ToString(*this);
    }

    bool Document::HasSection(const std::string &sectionName) const {
        return FindSection(sectionName) != nullptr;
    }

    void Document::AddSection(const std::string &sectionName) {
        if (!IsWritableSectionName(sectionName) || utils::EqualsIgnoreCase(sectionName, GITCFG_DEFAULT_SECTION))
            throw InvalidSectionNameError(sectionName);

        if (HasSection(sectionName))
            throw DuplicateSectionError(sectionName);

        ObtainSection(sectionName);
    }

    bool Document::RemoveSection(const std::string &sectionName) {
        auto it = m_SectionIndex.find(sectionName);
        if (it == m_SectionIndex.end())
            return false;

        m_Sections.erase(m_Sections.begin() + static_cast<std::ptrdiff_t>(it->second));
        RebuildSectionIndex();
        return true;
    }

    std::vector<std::string> Document::Sections() const {
        std::vector<std::string> names;
        names.reserve(m_Sections.size());
        for (const auto &section : m_Sections) {
            names.push_back(section.GetName());
        }
        return names;
    }

    const Section *Document::GetSection(const std::string &sectionName) const {
        if (IsDefaultSectionName(sectionName))
            return &m_Defaults;
        return FindSection(sectionName);
    }

    bool Document::HasOption(const std::string &sectionName, const std::string &key) const {
        OptionKey optionKey(key);
        if (IsDefaultSectionName(sectionName))
            return m_Defaults.HasOption(optionKey);

        const Section *section = FindSection(sectionName);
        if (!section)
            return false;
        return section->HasOption(optionKey) || m_Defaults.HasOption(optionKey);
    }

    std::vector<std::string> Document::Options(const std::string &sectionName) const {
        const Section &section = ResolveSection(sectionName);
        std::vector<std::string> keys = section.GetKeys();
        if (&section != &m_Defaults) {
            for (const auto &entry : m_Defaults.GetEntries()) {
                if (!section.HasOption(entry.key))
                    keys.push_back(entry.key.str());
            }
        }
        return keys;
    }

    std::vector<Document::Item> Document::Items(const std::string &sectionName) const {
        const Section &section = ResolveSection(sectionName);
        std::vector<Item> items;
        items.reserve(section.Size());
        for (const auto &entry : section.GetEntries()) {
            items.emplace_back(entry.key.str(), entry.value);
        }
        if (&section != &m_Defaults) {
            for (const auto &entry : m_Defaults.GetEntries()) {
                if (!section.HasOption(entry.key))
                    items.emplace_back(entry.key.str(), entry.value);
            }
        }
        return items;
    }

    const OptionValue &Document::Get(const std::string &sectionName, const std::string &key) const {
        const Section &section = ResolveSection(sectionName);
        OptionKey optionKey(key);

        if (const OptionValue *value = section.Find(optionKey))
            return *value;
        if (const OptionValue *value = m_Defaults.Find(optionKey))
            return *value;

        throw NoOptionError(optionKey.str(), section.GetName());
    }

    std::vector<std::string> Document::GetAll(const std::string &sectionName, const std::string &key) const {
        return Get(sectionName, key).AsList();
    }

    std::string Document::GetString(const std::string &sectionName, const std::string &key) const {
        return Get(sectionName, key).GetString();
    }

    void Document::Set(const std::string &sectionName, const std::string &key, const std::string &value) {
        Section &section = ResolveSection(sectionName);
        OptionKey optionKey(key);
        ValidateKey(key, optionKey);
        ValidateValue(value);

        section.Set(optionKey, OptionValue(value));
    }

    void Document::SetMultivar(const std::string &sectionName, const std::string &key, const std::string &value) {
        Section &section = ResolveSection(sectionName);
        OptionKey optionKey(key);
        ValidateKey(key, optionKey);
        ValidateValue(value);

        section.Add(optionKey, OptionValue::Item{value, false});
    }

    void Document::SetMultivar(const std::string &sectionName, const std::string &key, const std::vector<std::string> &values) {
        Section &section = ResolveSection(sectionName);
        OptionKey optionKey(key);
        ValidateKey(key, optionKey);
        for (const auto &value : values) {
            ValidateValue(value);
        }

        if (values.empty()) {
            section.Remove(optionKey);
            return;
        }

        section.Set(optionKey, OptionValue::FromList(values));
    }

    bool Document::RemoveOption(const std::string &sectionName, const std::string &key) {
        return ResolveSection(sectionName).Remove(OptionKey(key));
    }

    bool Document::RemoveOptionRegexp(const std::string &sectionName, const std::string &key, const std::string &pattern) {
        Section &section = ResolveSection(sectionName);
        utils::Regex regex(pattern);

        OptionKey optionKey(key);
        OptionValue *value = section.Find(optionKey);
        if (!value)
            return false;

        size_t removed = value->RemoveIf([&regex](const OptionValue::Item &item) {
            return regex.Search(item.text);
        });
        if (removed == 0)
            return false;

        if (value->Empty())
            section.Remove(optionKey);
        return true;
    }

    void Document::Clear() {
        m_Sections.clear();
        m_SectionIndex.clear();
        m_Defaults.Clear();
    }

    bool Document::IsEmpty() const {
        return m_Sections.empty() && m_Defaults.Empty();
    }

    bool Document::IsDefaultSectionName(const std::string &sectionName) {
        return sectionName.empty() || sectionName == GITCFG_DEFAULT_SECTION;
    }

    Section &Document::ObtainSection(const std::string &sectionName) {
        if (IsDefaultSectionName(sectionName))
            return m_Defaults;

        if (Section *existing = FindSection(sectionName))
            return *existing;

        m_Sections.emplace_back(sectionName);
        m_SectionIndex[sectionName] = m_Sections.size() - 1;
        return m_Sections.back();
    }

    Section *Document::FindSection(const std::string &sectionName) {
        return const_cast<Section *>(static_cast<const Document *>(this)->FindSection(sectionName));
    }

    const Section *Document::FindSection(const std::string &sectionName) const {
        auto it = m_SectionIndex.find(sectionName);
        return (it != m_SectionIndex.end() && it->second < m_Sections.size()) ? &m_Sections[it->second] : nullptr;
    }

    Section &Document::ResolveSection(const std::string &sectionName) {
        return const_cast<Section &>(static_cast<const Document *>(this)->ResolveSection(sectionName));
    }

    const Section &Document::ResolveSection(const std::string &sectionName) const {
        if (IsDefaultSectionName(sectionName))
            return m_Defaults;

        const Section *section = FindSection(sectionName);
        if (!section)
            throw NoSectionError(sectionName);
        return *section;
    }

    void Document::RebuildSectionIndex() {
        m_SectionIndex.clear();
        m_SectionIndex.reserve(m_Sections.size());
        for (size_t i = 0; i < m_Sections.size(); ++i) {
            m_SectionIndex[m_Sections[i].GetName()] = i;
        }
    }
} // namespace GitCfg
