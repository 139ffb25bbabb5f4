#ifndef RLZ_RLEMATCHFINDER_H
#define RLZ_RLEMATCHFINDER_H

#include "RLZCommon.h"

RLZ_NAMESPACE_START

// Splits input into runs of one repeated byte and literal stretches between them.
class RleMatchFinder
{
public:
    RleMatchFinder(uint32 minMatch = 3, uint32 maxMatch = 127);

    // true: `duration` equal bytes start at offset (minMatch..maxMatch).
    // false: `duration` is the length of the literal stretch starting at offset, up to
    // the next run of at least minMatch bytes, capped at maxMatch.
    bool TryFindMatch(const uint8 *data, uint32 size, uint32 offset, uint32& duration) const;

    uint32 MinMatch(void) const { return _minMatch; }
    uint32 MaxMatch(void) const { return _maxMatch; }

private:
    static uint32 _RunLength(const uint8 *p, uint32 maxlen);

    uint32 _minMatch;
    uint32 _maxMatch;
};

RLZ_NAMESPACE_END

#endif
