#include "GitCfg/Logger.h"

#include <chrono>
#include <ctime>
#include <mutex>
#include <utility>
#include <vector>

namespace GitCfg {
    namespace {
        std::atomic<Logger *> g_DefaultLogger{nullptr};
        std::mutex g_LogWriteMutex;

        std::string FormatTimestamp() {
            auto now = std::chrono::system_clock::now();
            std::time_t seconds = std::chrono::system_clock::to_time_t(now);
            int millis = static_cast<int>(
                std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);

            std::tm local{};
#if defined(_WIN32)
            localtime_s(&local, &seconds);
#else
            localtime_r(&seconds, &local);
#endif

            char buffer[32];
            std::snprintf(buffer, sizeof(buffer), "%02d/%02d/%d %02d:%02d:%02d.%03d",
                          local.tm_mon + 1, local.tm_mday, local.tm_year + 1900,
                          local.tm_hour, local.tm_min, local.tm_sec, millis);
            return buffer;
        }

        std::string FormatBody(const char *fmt, va_list args) {
            va_list sizing;
            va_copy(sizing, args);
            int length = std::vsnprintf(nullptr, 0, fmt, sizing);
            va_end(sizing);
            if (length <= 0)
                return {};

            std::vector<char> buffer(static_cast<size_t>(length) + 1);
            va_list copy;
            va_copy(copy, args);
            std::vsnprintf(buffer.data(), buffer.size(), fmt, copy);
            va_end(copy);
            return std::string(buffer.data(), static_cast<size_t>(length));
        }
    }

    const char *GetLogLevelName(LogLevel level) {
        switch (level) {
            case LogLevel::Info:
                return "INFO";
            case LogLevel::Warn:
                return "WARN";
            case LogLevel::Error:
                return "ERROR";
            default:
                return "OFF";
        }
    }

    Logger *Logger::GetDefault() {
        return g_DefaultLogger.load(std::memory_order_acquire);
    }

    void Logger::SetDefault(Logger *logger) {
        g_DefaultLogger.store(logger, std::memory_order_release);
    }

    Logger::Logger(std::string name, FILE *logFile, bool echo)
        : m_Name(std::move(name)), m_LogFile(logFile), m_Echo(echo) {}

    bool Logger::IsEnabled(LogLevel level) const noexcept {
        LogLevel threshold = GetLevel();
        return level != LogLevel::Off && threshold != LogLevel::Off &&
               static_cast<int>(level) >= static_cast<int>(threshold);
    }

#define GITCFG_LOGGER_FORWARD(level)  \
    if (!IsEnabled(level))            \
        return;                       \
    va_list args;                     \
    va_start(args, fmt);              \
    Write(level, fmt, args);          \
    va_end(args)

    void Logger::Info(const char *fmt, ...) {
        GITCFG_LOGGER_FORWARD(LogLevel::Info);
    }

    void Logger::Warn(const char *fmt, ...) {
        GITCFG_LOGGER_FORWARD(LogLevel::Warn);
    }

    void Logger::Error(const char *fmt, ...) {
        GITCFG_LOGGER_FORWARD(LogLevel::Error);
    }

#undef GITCFG_LOGGER_FORWARD

    void Logger::Write(LogLevel level, const char *fmt, va_list args) {
        if (!fmt)
            return;

        std::string line = "[" + FormatTimestamp() + "] [" + m_Name + "/" + GetLogLevelName(level) + "]: ";
        line += FormatBody(fmt, args);
        line += '\n';

        FILE *targets[] = {m_Echo ? stderr : nullptr, m_LogFile};

        std::lock_guard lock(g_LogWriteMutex);
        for (FILE *file : targets) {
            if (!file)
                continue;
            std::fwrite(line.data(), 1, line.size(), file);
            std::fflush(file);
        }
    }
} // namespace GitCfg
