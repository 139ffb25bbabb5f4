#include "RLZInternal.h"
#include "RleMatchFinder.h"

#include <algorithm>

RLZ_NAMESPACE_START

RleMatchFinder::RleMatchFinder(uint32 minMatch /* = 3 */, uint32 maxMatch /* = 127 */)
: _minMatch(minMatch), _maxMatch(maxMatch)
{
    ASSERT(minMatch >= 1 && minMatch <= maxMatch);
}

uint32 RleMatchFinder::_RunLength(const uint8 *p, uint32 maxlen)
{
    uint32 i = 1;
    while(i < maxlen && p[i] == p[0])
        ++i;
    return i;
}

bool RleMatchFinder::TryFindMatch(const uint8 *data, uint32 size, uint32 offset, uint32& duration) const
{
    ASSERT(offset < size);

    duration = _RunLength(data + offset, std::min(_maxMatch, size - offset));
    if(duration >= _minMatch)
        return true;

    // literal stretch: grow until a run of minMatch starts or the cap is hit
    duration = 0;
    do
    {
        ++duration;
        if(size - offset - duration < _minMatch)
        {
            duration = std::min(size - offset, _maxMatch);
            break;
        }
    }
    while(duration != _maxMatch && _RunLength(data + offset + duration, _minMatch) != _minMatch);

    return false;
}

RLZ_NAMESPACE_END
