#ifndef RLZ_LZPROPERTIES_H
#define RLZ_LZPROPERTIES_H

#include "RLZCommon.h"

RLZ_NAMESPACE_START

// Per-format bounds for every match search: how far back a match may reach
// and how long it may be. Immutable once constructed.
class LzProperties
{
public:
    LzProperties(uint32 windowSize, uint32 maxLength, uint32 minLength = 3, uint32 windowStart = 0);

    // Okumura style: distanceBits wide ring, lengthBits wide length field,
    // matches shorter than threshold + 1 are not worth encoding.
    static LzProperties FromBits(uint8 distanceBits, uint8 lengthBits, uint8 threshold = 2);

    // same bounds with the window capped for the given effort level
    LzProperties SetLevel(RLZLevel level) const;

    uint32 WindowSize(void) const { return _windowSize; }
    uint32 MinLength(void) const { return _minLength; }
    uint32 MaxLength(void) const { return _maxLength; }
    uint32 WindowStart(void) const { return _windowStart; }
    uint8 DistanceBits(void) const { return _distanceBits; }
    uint8 LengthBits(void) const { return _lengthBits; }

    uint32 WindowMask(void) const { return _windowSize - 1; }
    uint32 LengthMask(void) const { return (1u << _lengthBits) - 1; }

private:
    uint32 _windowSize;
    uint32 _maxLength;
    uint32 _minLength;
    uint32 _windowStart;
    uint8 _distanceBits;
    uint8 _lengthBits;
};

RLZ_NAMESPACE_END

#endif
