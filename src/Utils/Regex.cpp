#include "Regex.h"

#include <mutex>
#include <utility>

#include <oniguruma.h>

#include "GitCfg/Errors.h"

namespace {
    std::once_flag g_OnigInitFlag;
    int g_OnigInitResult = ONIG_NORMAL;

    void EnsureOnigInitialized() {
        std::call_once(g_OnigInitFlag, [] {
            OnigEncoding encodings[1] = {ONIG_ENCODING_UTF8};
            g_OnigInitResult = onig_initialize(encodings, sizeof(encodings) / sizeof(encodings[0]));
        });
        if (g_OnigInitResult < 0)
            throw GitCfg::Exception(GitCfg::GITCFG_ERROR_FAIL,
                                    "Failed to initialize regular expression functionality");
    }

    std::string ErrorCodeToString(int code, OnigErrorInfo *einfo) {
        char s[ONIG_MAX_ERROR_MESSAGE_LEN];
        if (einfo)
            onig_error_code_to_str((UChar *) s, code, einfo);
        else
            onig_error_code_to_str((UChar *) s, code);
        return s;
    }
}

namespace GitCfg::utils {
    Regex::Regex(const std::string &pattern) : m_Pattern(pattern) {
        EnsureOnigInitialized();

        const auto *start = (const OnigUChar *) m_Pattern.c_str();
        const auto *end = start + m_Pattern.size();
        OnigErrorInfo einfo;

        int r = onig_new(&m_Regex, start, end,
                         ONIG_OPTION_DEFAULT, ONIG_ENCODING_UTF8, ONIG_SYNTAX_PERL, &einfo);
        if (r != ONIG_NORMAL) {
            m_Regex = nullptr;
            throw PatternError(m_Pattern, ErrorCodeToString(r, &einfo));
        }
    }

    Regex::~Regex() {
        if (m_Regex)
            onig_free(m_Regex);
    }

    Regex::Regex(Regex &&other) noexcept
        : m_Regex(std::exchange(other.m_Regex, nullptr)), m_Pattern(std::move(other.m_Pattern)) {}

    Regex &Regex::operator=(Regex &&other) noexcept {
        if (this != &other) {
            if (m_Regex)
                onig_free(m_Regex);
            m_Regex = std::exchange(other.m_Regex, nullptr);
            m_Pattern = std::move(other.m_Pattern);
        }
        return *this;
    }

    bool Regex::Search(const std::string &subject) const {
        if (!m_Regex)
            return false;

        const auto *start = (const OnigUChar *) subject.c_str();
        const auto *end = start + subject.size();
        const auto *range = end;

        int r = onig_search(m_Regex, start, end, start, range, nullptr, ONIG_OPTION_NONE);
        if (r >= 0)
            return true;
        if (r == ONIG_MISMATCH)
            return false;

        throw Exception(GITCFG_ERROR_INVALID_PATTERN,
                        "Regular expression search failed for '" + m_Pattern + "': " + ErrorCodeToString(r, nullptr));
    }
} // namespace GitCfg::utils
