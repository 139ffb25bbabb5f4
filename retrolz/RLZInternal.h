#ifndef RLZ_INTERNAL_H
#define RLZ_INTERNAL_H

#include "RLZCommon.h"

#include <cstdio>
#include <cstdlib>

RLZ_NAMESPACE_START

enum RLZLogLevel
{
    RLZLOG_ERROR = 0,
    RLZLOG_NORMAL = 1,
    RLZLOG_DEBUG = 2,
    RLZLOG_DETAIL = 3
};

void SetLogLevel(uint8 lvl);
uint8 GetLogLevel(void);

void log(const char *str, ...);      // RLZLOG_NORMAL
void logerror(const char *str, ...); // always, to stderr
void logdebug(const char *str, ...); // RLZLOG_DEBUG
void logdetail(const char *str, ...); // RLZLOG_DETAIL

RLZ_NAMESPACE_END

#ifdef _DEBUG
#  define DEBUG(x) x
#else
#  define DEBUG(x)
#endif

// not compiled out in release builds; used for programming errors only
#define ASSERT(what) \
    do { if(!(what)) { \
        RLZ_NAMESPACE_IMPL logerror("ASSERTION FAILED: %s (%s:%u)", #what, __FILE__, (unsigned int)__LINE__); \
        abort(); } \
    } while(0)

#endif
