#include "RLZInternal.h"
#include "LzProperties.h"

RLZ_NAMESPACE_START

static uint8 _CeilLog2(uint32 v)
{
    uint8 bits = 0;
    while(bits < 32 && (uint64(1) << bits) < v)
        ++bits;
    return bits;
}

LzProperties::LzProperties(uint32 windowSize, uint32 maxLength, uint32 minLength /* = 3 */, uint32 windowStart /* = 0 */)
: _windowSize(windowSize), _maxLength(maxLength), _minLength(minLength), _windowStart(windowStart)
{
    ASSERT(windowSize >= 1);
    ASSERT(minLength >= 1);
    ASSERT(minLength <= maxLength);

    _distanceBits = _CeilLog2(windowSize);
    _lengthBits = _CeilLog2(maxLength - minLength + 1);
}

LzProperties LzProperties::FromBits(uint8 distanceBits, uint8 lengthBits, uint8 threshold /* = 2 */)
{
    ASSERT(distanceBits > 0 && distanceBits < 32);
    ASSERT(lengthBits < 32);

    uint32 windowSize = 1u << distanceBits;
    uint32 lengthRange = 1u << lengthBits;
    ASSERT(windowSize > lengthRange + threshold);

    LzProperties lz(windowSize, lengthRange + threshold, threshold + 1, windowSize - lengthRange - threshold);
    lz._distanceBits = distanceBits;
    lz._lengthBits = lengthBits;
    return lz;
}

LzProperties LzProperties::SetLevel(RLZLevel level) const
{
    LzProperties lz(*this);
    uint32 cap = 0;
    switch(level)
    {
        case RLZLEVEL_FASTEST:
            cap = 0x4000;
            break;
        case RLZLEVEL_OPTIMAL:
            cap = 0x10000;
            break;
        default: // none never searches, smallest uses everything
            break;
    }
    if(cap && lz._windowSize > cap)
        lz._windowSize = cap;
    return lz;
}

RLZ_NAMESPACE_END
