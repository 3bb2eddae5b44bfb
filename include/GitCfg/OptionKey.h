#ifndef GITCFG_OPTIONKEY_H
#define GITCFG_OPTIONKEY_H

#include <cstddef>
#include <functional>
#include <string>

#include "GitCfg/Defines.h"

namespace GitCfg {
    /**
     * Normalized (case-folded, trimmed) option name.
     *
     * Constructing an OptionKey from user text always normalizes it, so two
     * spellings that differ only in case compare equal and hash the same.
     * Option values never go through this type.
     */
    class GITCFG_EXPORT OptionKey {
    public:
        OptionKey() = default;
        explicit OptionKey(const std::string &name);

        const std::string &str() const noexcept { return m_Name; }
        bool empty() const noexcept { return m_Name.empty(); }

        bool operator==(const OptionKey &rhs) const = default;
        bool operator<(const OptionKey &rhs) const { return m_Name < rhs.m_Name; }

        static std::string Normalize(const std::string &name);

    private:
        std::string m_Name;
    };
} // namespace GitCfg

template <>
struct std::hash<GitCfg::OptionKey> {
    size_t operator()(const GitCfg::OptionKey &key) const noexcept {
        return std::hash<std::string>()(key.str());
    }
};

#endif // GITCFG_OPTIONKEY_H
