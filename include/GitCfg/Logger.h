#ifndef GITCFG_LOGGER_H
#define GITCFG_LOGGER_H

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <string>

#include "GitCfg/ILogger.h"

namespace GitCfg {
    enum class LogLevel {
        Info,
        Warn,
        Error,
        Off
    };

    GITCFG_EXPORT const char *GetLogLevelName(LogLevel level);

    /**
     * Leveled logger writing `[MM/DD/YYYY hh:mm:ss.mmm] [name/LEVEL]: message`
     * lines to stderr and, when given, a log file.
     *
     * Messages below the threshold are dropped before formatting. Writes
     * from all loggers are serialized, so lines never interleave.
     */
    class GITCFG_EXPORT Logger : public ILogger {
    public:
        static Logger *GetDefault();
        static void SetDefault(Logger *logger);

        // logFile is borrowed; lines go to stderr when echo is on
        explicit Logger(std::string name, FILE *logFile = nullptr, bool echo = true);

        void Info(const char *fmt, ...) override;
        void Warn(const char *fmt, ...) override;
        void Error(const char *fmt, ...) override;

        void SetLevel(LogLevel level) noexcept { m_Level.store(level, std::memory_order_relaxed); }
        LogLevel GetLevel() const noexcept { return m_Level.load(std::memory_order_relaxed); }
        bool IsEnabled(LogLevel level) const noexcept;

        const std::string &GetName() const noexcept { return m_Name; }

    private:
        void Write(LogLevel level, const char *fmt, va_list args);

        std::string m_Name;
        FILE *m_LogFile;
        bool m_Echo;
        std::atomic<LogLevel> m_Level{LogLevel::Info};
    };
} // namespace GitCfg

#endif // GITCFG_LOGGER_H
