#include "GitCfg/OptionKey.h"

#include "Utils/StringUtils.h"

namespace GitCfg {
    OptionKey::OptionKey(const std::string &name) : m_Name(Normalize(name)) {}

    std::string OptionKey::Normalize(const std::string &name) {
        return utils::ToLowerUtf8(utils::TrimUtf8(name));
    }
} // namespace GitCfg
