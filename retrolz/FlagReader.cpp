#include "RLZInternal.h"
#include "FlagReader.h"

RLZ_NAMESPACE_START

FlagReader::FlagReader(ByteBuffer& src, RLZEndian bitOrder, uint8 flagSize /* = 1 */, RLZEndian byteOrder /* = RLZ_LITTLE */)
: _src(src), _flag(0), _bitsLeft(0), _flagSize(flagSize), _unitBits(flagSize * 8),
  _bitOrder(bitOrder), _byteOrder(byteOrder)
{
    ASSERT(flagSize >= 1 && flagSize <= 4);
}

bool FlagReader::ReadBit(void)
{
    if(!_bitsLeft)
    {
        _flag = _src.readUInt(_flagSize, _byteOrder);
        _bitsLeft = _unitBits;
    }

    uint8 shift = _bitOrder == RLZ_LITTLE ? _unitBits - _bitsLeft : _bitsLeft - 1;
    --_bitsLeft;
    return (_flag >> shift) & 1;
}

uint32 FlagReader::ReadInt(uint8 bits, bool lsbFirst /* = false */)
{
    uint32 v = 0;
    if(lsbFirst)
    {
        for(uint8 i = 0; i < bits; ++i)
            if(ReadBit())
                v |= 1u << i;
    }
    else
    {
        for(uint8 i = 0; i < bits; ++i)
            v = (v << 1) | uint32(ReadBit());
    }
    return v;
}

RLZ_NAMESPACE_END
