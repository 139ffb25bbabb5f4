#include "RLZInternal.h"
#include "FlagWriter.h"

#include <exception>

RLZ_NAMESPACE_START

FlagWriter::FlagWriter(ByteBuffer& dst, RLZEndian bitOrder, uint8 flagSize /* = 1 */, RLZEndian byteOrder /* = RLZ_LITTLE */)
: _dst(dst), _payload(0x100), _flag(0), _bitsLeft(flagSize * 8), _flagSize(flagSize), _unitBits(flagSize * 8),
  _bitOrder(bitOrder), _byteOrder(byteOrder)
{
    ASSERT(flagSize >= 1 && flagSize <= 4);
}

FlagWriter::~FlagWriter()
{
    try
    {
        Flush();
    }
    catch(std::exception& e)
    {
        logerror("FlagWriter: flush on destruction failed, output is incomplete: %s", e.what());
    }
}

void FlagWriter::WriteBit(bool bit)
{
    if(bit)
    {
        uint8 shift = _bitOrder == RLZ_LITTLE ? _unitBits - _bitsLeft : _bitsLeft - 1;
        _flag |= 1u << shift;
    }

    if(--_bitsLeft == 0)
        Flush();
}

void FlagWriter::WriteInt(uint32 value, uint8 bits, bool lsbFirst /* = false */)
{
    if(lsbFirst)
    {
        for(uint8 i = 0; i < bits; ++i)
            WriteBit((value >> i) & 1);
    }
    else
    {
        for(uint8 i = bits; i > 0; --i)
            WriteBit((value >> (i - 1)) & 1);
    }
}

void FlagWriter::FlushIfNecessary(void)
{
    if(_bitsLeft == _unitBits && _payload.size())
    {
        _dst.append(_payload);
        _payload.clear();
    }
}

void FlagWriter::Flush(void)
{
    if(_bitsLeft != _unitBits)
    {
        _dst.appendUInt(_flag, _flagSize, _byteOrder);
        _flag = 0;
        _bitsLeft = _unitBits;
    }
    if(_payload.size())
    {
        _dst.append(_payload);
        _payload.clear();
    }
}

RLZ_NAMESPACE_END
