#ifndef GITCFG_REGEX_H
#define GITCFG_REGEX_H

#include <string>

struct re_pattern_buffer;

namespace GitCfg::utils {
    /**
     * Compiled Oniguruma pattern (UTF-8, Perl syntax).
     *
     * Search() reports whether the pattern matches anywhere in the subject,
     * without anchoring. Construction throws PatternError when the pattern
     * does not compile.
     */
    class Regex {
    public:
        explicit Regex(const std::string &pattern);
        ~Regex();

        Regex(const Regex &) = delete;
        Regex &operator=(const Regex &) = delete;
        Regex(Regex &&other) noexcept;
        Regex &operator=(Regex &&other) noexcept;

        bool Search(const std::string &subject) const;

        const std::string &GetPattern() const noexcept { return m_Pattern; }

    private:
        re_pattern_buffer *m_Regex = nullptr;
        std::string m_Pattern;
    };
} // namespace GitCfg::utils

#endif // GITCFG_REGEX_H
