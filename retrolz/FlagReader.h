#ifndef RLZ_FLAGREADER_H
#define RLZ_FLAGREADER_H

#include "ByteBuffer.h"

RLZ_NAMESPACE_START

// Pulls decision bits out of flag units (1..4 bytes) stored in the input stream.
// A new unit is read from the source whenever the current one is used up.
class FlagReader
{
public:
    // bitOrder: RLZ_BIG takes the most significant bit of a unit first
    FlagReader(ByteBuffer& src, RLZEndian bitOrder, uint8 flagSize = 1, RLZEndian byteOrder = RLZ_LITTLE);

    bool ReadBit(void);

    // combine `bits` flag bits; the first bit read is the most significant unless lsbFirst
    uint32 ReadInt(uint8 bits, bool lsbFirst = false);

    // drop what is left of the current unit
    void Reset(void) { _bitsLeft = 0; }

    uint8 BitsLeft(void) const { return _bitsLeft; }
    ByteBuffer& Source(void) { return _src; }

private:
    ByteBuffer& _src;
    uint32 _flag;
    uint8 _bitsLeft;
    uint8 _flagSize;
    uint8 _unitBits;
    RLZEndian _bitOrder;
    RLZEndian _byteOrder;
};

RLZ_NAMESPACE_END

#endif
