#ifndef GITCFG_SECTION_H
#define GITCFG_SECTION_H

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "GitCfg/Defines.h"
#include "GitCfg/OptionKey.h"
#include "GitCfg/OptionValue.h"

namespace GitCfg {
    /**
     * A named block of options.
     *
     * The name is the header text between the brackets, kept verbatim, so
     * `remote "origin"` and `remote "Origin"` are different sections. Options
     * keep the order in which their keys were first recorded.
     */
    class GITCFG_EXPORT Section {
    public:
        struct Entry {
            OptionKey key;
            OptionValue value;

            bool operator==(const Entry &rhs) const = default;
        };

        Section() = default;
        explicit Section(std::string name) : m_Name(std::move(name)) {}

        const std::string &GetName() const noexcept { return m_Name; }

        bool HasOption(const OptionKey &key) const { return Find(key) != nullptr; }
        OptionValue *Find(const OptionKey &key);
        const OptionValue *Find(const OptionKey &key) const;

        // Inserts the key at the end, or replaces all values of an existing one
        OptionValue &Set(const OptionKey &key, OptionValue value);

        // Records one more value for the key (parse order / multivar append)
        OptionValue &Add(const OptionKey &key, OptionValue::Item item);

        bool Remove(const OptionKey &key);
        void Clear();

        size_t Size() const noexcept { return m_Entries.size(); }
        bool Empty() const noexcept { return m_Entries.empty(); }
        const std::vector<Entry> &GetEntries() const noexcept { return m_Entries; }
        std::vector<std::string> GetKeys() const;

        bool operator==(const Section &rhs) const {
            return m_Name == rhs.m_Name && m_Entries == rhs.m_Entries;
        }

    private:
        void RebuildKeyIndex() const;

        std::string m_Name;
        std::vector<Entry> m_Entries;
        mutable std::unordered_map<OptionKey, size_t> m_KeyIndex; // For O(1) key lookup
        mutable bool m_KeyIndexDirty = true;
    };
} // namespace GitCfg

#endif // GITCFG_SECTION_H
