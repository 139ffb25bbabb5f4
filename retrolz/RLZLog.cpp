#include "RLZInternal.h"

#include <cstdarg>

RLZ_NAMESPACE_START

static uint8 gLogLevel = RLZLOG_NORMAL;

void SetLogLevel(uint8 lvl)
{
    gLogLevel = lvl;
}

uint8 GetLogLevel(void)
{
    return gLogLevel;
}

static void _vlog(FILE *fh, const char *prefix, const char *str, va_list ap)
{
    if(prefix)
        fputs(prefix, fh);
    vfprintf(fh, str, ap);
    fputc('\n', fh);
    fflush(fh);
}

void log(const char *str, ...)
{
    if(gLogLevel < RLZLOG_NORMAL)
        return;
    va_list ap;
    va_start(ap, str);
    _vlog(stdout, NULL, str, ap);
    va_end(ap);
}

void logerror(const char *str, ...)
{
    va_list ap;
    va_start(ap, str);
    _vlog(stderr, "ERROR: ", str, ap);
    va_end(ap);
}

void logdebug(const char *str, ...)
{
    if(gLogLevel < RLZLOG_DEBUG)
        return;
    va_list ap;
    va_start(ap, str);
    _vlog(stdout, "DEBUG: ", str, ap);
    va_end(ap);
}

void logdetail(const char *str, ...)
{
    if(gLogLevel < RLZLOG_DETAIL)
        return;
    va_list ap;
    va_start(ap, str);
    _vlog(stdout, NULL, str, ap);
    va_end(ap);
}

RLZ_NAMESPACE_END
