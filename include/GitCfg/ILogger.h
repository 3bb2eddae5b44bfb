#ifndef GITCFG_ILOGGER_H
#define GITCFG_ILOGGER_H

#include "GitCfg/Defines.h"

namespace GitCfg {
    class GITCFG_EXPORT ILogger {
    public:
        virtual void Info(const char *fmt, ...) = 0;
        virtual void Warn(const char *fmt, ...) = 0;
        virtual void Error(const char *fmt, ...) = 0;

        virtual ~ILogger() = default;
    };
} // namespace GitCfg

#endif // GITCFG_ILOGGER_H
