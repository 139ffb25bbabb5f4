#include "RLZErrors.h"

#include <cstdio>

RLZ_NAMESPACE_START

static std::string _MakeSizeMessage(uint64 expected, uint64 actual)
{
    char buf[128];
    snprintf(buf, sizeof(buf), "Expected %llu bytes, but produced %llu bytes",
        (unsigned long long)expected, (unsigned long long)actual);
    return buf;
}

DecompressedSizeException::DecompressedSizeException(uint64 expected, uint64 actual)
: CompressionException(_MakeSizeMessage(expected, actual)), _expected(expected), _actual(actual)
{
}

RLZ_NAMESPACE_END
