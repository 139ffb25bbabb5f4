#ifndef RLZ_FLAGWRITER_H
#define RLZ_FLAGWRITER_H

#include "ByteBuffer.h"

RLZ_NAMESPACE_START

// Packs decision bits into flag units of 1..4 bytes.
// Payload bytes belonging to the bits of the current unit go into Payload() first;
// they are appended to the output right after the unit once it is complete.
// Any partial unit is padded with 0 bits and written on Flush() or destruction.
class FlagWriter
{
public:
    FlagWriter(ByteBuffer& dst, RLZEndian bitOrder, uint8 flagSize = 1, RLZEndian byteOrder = RLZ_LITTLE);
    ~FlagWriter();

    void WriteBit(bool bit);
    void WriteInt(uint32 value, uint8 bits, bool lsbFirst = false);

    // move pending payload to the output if no unit is in progress
    void FlushIfNecessary(void);
    // writes pending bytes; call before the object goes away, the destructor can only log failures
    void Flush(void);

    ByteBuffer& Payload(void) { return _payload; }

private:
    ByteBuffer& _dst;
    ByteBuffer _payload;
    uint32 _flag;
    uint8 _bitsLeft;
    uint8 _flagSize;
    uint8 _unitBits;
    RLZEndian _bitOrder;
    RLZEndian _byteOrder;

    FlagWriter(const FlagWriter&);
    FlagWriter& operator=(const FlagWriter&);
};

RLZ_NAMESPACE_END

#endif
