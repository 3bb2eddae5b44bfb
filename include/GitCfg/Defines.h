#ifndef GITCFG_DEFINES_H
#define GITCFG_DEFINES_H

#include <stddef.h>
#include <stdint.h>

#define GITCFG_MAJOR_VERSION 0
#define GITCFG_MINOR_VERSION 3
#define GITCFG_PATCH_VERSION 0

#define GITCFG_STRINGIFY_(x) #x
#define GITCFG_STRINGIFY(x) GITCFG_STRINGIFY_(x)

#define GITCFG_VERSION                         \
    GITCFG_STRINGIFY(GITCFG_MAJOR_VERSION) "." \
    GITCFG_STRINGIFY(GITCFG_MINOR_VERSION) "." \
    GITCFG_STRINGIFY(GITCFG_PATCH_VERSION)

#ifndef GITCFG_EXPORT
#if defined(_WIN32) && defined(GITCFG_SHARED)
#ifdef GITCFG_EXPORTS
#define GITCFG_EXPORT __declspec(dllexport)
#else
#define GITCFG_EXPORT __declspec(dllimport)
#endif
#elif defined(__GNUC__) && defined(GITCFG_SHARED)
#define GITCFG_EXPORT __attribute__((visibility("default")))
#else
#define GITCFG_EXPORT
#endif
#endif

// Name of the section whose options every other section falls back to
#define GITCFG_DEFAULT_SECTION "DEFAULT"

// Value reported for an option written without '='
#define GITCFG_IMPLICIT_VALUE "true"

#endif // GITCFG_DEFINES_H
