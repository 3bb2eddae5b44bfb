#ifndef GITCFG_GITCFG_H
#define GITCFG_GITCFG_H

#include "GitCfg/Defines.h"
#include "GitCfg/Errors.h"
#include "GitCfg/ILogger.h"
#include "GitCfg/Logger.h"
#include "GitCfg/OptionKey.h"
#include "GitCfg/OptionValue.h"
#include "GitCfg/Section.h"
#include "GitCfg/Parser.h"
#include "GitCfg/Serializer.h"
#include "GitCfg/Document.h"
#include "GitCfg/ConfigFile.h"

#endif // GITCFG_GITCFG_H
