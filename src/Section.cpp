#include "GitCfg/Section.h"

#include <cstddef>

namespace GitCfg {
    void Section::RebuildKeyIndex() const {
        if (!m_KeyIndexDirty) {
            return;
        }

        m_KeyIndex.clear();
        m_KeyIndex.reserve(m_Entries.size());
        for (size_t i = 0; i < m_Entries.size(); ++i) {
            m_KeyIndex[m_Entries[i].key] = i;
        }

        m_KeyIndexDirty = false;
    }

    OptionValue *Section::Find(const OptionKey &key) {
        return const_cast<OptionValue *>(static_cast<const Section *>(this)->Find(key));
    }

    const OptionValue *Section::Find(const OptionKey &key) const {
        RebuildKeyIndex();
        auto it = m_KeyIndex.find(key);
        return (it != m_KeyIndex.end() && it->second < m_Entries.size()) ? &m_Entries[it->second].value : nullptr;
    }

    OptionValue &Section::Set(const OptionKey &key, OptionValue value) {
        if (OptionValue *existing = Find(key)) {
            *existing = std::move(value);
            return *existing;
        }

        m_Entries.push_back(Entry{key, std::move(value)});
        m_KeyIndex[key] = m_Entries.size() - 1;
        return m_Entries.back().value;
    }

    OptionValue &Section::Add(const OptionKey &key, OptionValue::Item item) {
        if (OptionValue *existing = Find(key)) {
            existing->Append(std::move(item));
            return *existing;
        }
        return Set(key, OptionValue(std::move(item)));
    }

    bool Section::Remove(const OptionKey &key) {
        RebuildKeyIndex();
        auto it = m_KeyIndex.find(key);
        if (it == m_KeyIndex.end())
            return false;

        m_Entries.erase(m_Entries.begin() + static_cast<std::ptrdiff_t>(it->second));
        m_KeyIndexDirty = true;
        return true;
    }

    void Section::Clear() {
        m_Entries.clear();
        m_KeyIndex.clear();
        m_KeyIndexDirty = false;
    }

    std::vector<std::string> Section::GetKeys() const {
        std::vector<std::string> keys;
        keys.reserve(m_Entries.size());
        for (const auto &entry : m_Entries) {
            keys.push_back(entry.key.str());
        }
        return keys;
    }
} // namespace GitCfg
