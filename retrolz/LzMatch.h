#ifndef RLZ_LZMATCH_H
#define RLZ_LZMATCH_H

#include "RLZCommon.h"

#include <vector>

RLZ_NAMESPACE_START

// at input position `offset`, copy `length` bytes from `offset - distance`.
// length 0 means "no match".
struct LzMatch
{
    LzMatch() : offset(0), distance(0), length(0) {}
    LzMatch(uint32 o, uint32 d, uint32 l) : offset(o), distance(d), length(l) {}

    bool IsValid(void) const { return length != 0; }
    uint32 End(void) const { return offset + length; }

    bool operator==(const LzMatch& m) const
    {
        return offset == m.offset && distance == m.distance && length == m.length;
    }
    bool operator!=(const LzMatch& m) const { return !(*this == m); }

    uint32 offset;
    uint32 distance;
    uint32 length;
};

typedef std::vector<LzMatch> LzMatchList;

RLZ_NAMESPACE_END

#endif
