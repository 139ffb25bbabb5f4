#include "RLZFormatUtil.h"
#include "LZSSCompressor.h"
#include "LzMatchFinder.h"
#include "LzWindow.h"
#include "FlagReader.h"
#include "FlagWriter.h"

RLZ_NAMESPACE_START

static const uint32 LZSS_HEADER_SIZE = 0x10;

LZSSCompressor::LZSSCompressor()
: _lz(LzProperties::FromBits(12, 4, 2))
{
}

bool LZSSCompressor::IsMatch(const uint8 *data, size_t size)
{
    return MatchMagic(data, size, "LZSS", 4, LZSS_HEADER_SIZE);
}

void LZSSCompressor::Compress(uint8 level /* = RLZ_DEFAULT_LEVEL */)
{
    const uint32 n = (uint32)size();
    const uint8 *src = contents();
    const uint32 windowMask = _lz.WindowMask();
    const uint32 lengthMask = _lz.LengthMask();
    const uint8 lengthBits = _lz.LengthBits();

    ByteBuffer out(n / 2 + LZSS_HEADER_SIZE);
    out.append("LZSS", 4);
    out.appendUInt(n, 4, RLZ_BIG);
    out.appendUInt(0, 4, RLZ_BIG); // compressed size, patched below
    out.appendUInt(0, 4, RLZ_BIG);
    {
        LzMatchFinder finder(src, n, _lz, _lookAhead, ToLevel(level));
        FlagWriter flags(out, RLZ_LITTLE);
        LzMatch m;
        uint32 pos = 0;
        while(pos < n)
        {
            if(finder.TryFindMatch(pos, m))
            {
                uint32 offset = (_lz.WindowStart() + pos - m.distance) & windowMask;
                uint32 word = (offset & 0xFF)
                            | ((offset & 0xFF00) << lengthBits)
                            | (((m.length - _lz.MinLength()) & lengthMask) << 8);
                flags.Payload().appendUInt(word, 2, RLZ_LITTLE);
                pos += m.length;
                flags.WriteBit(false);
            }
            else
            {
                flags.Payload() << src[pos++];
                flags.WriteBit(true);
            }
        }
        flags.Flush();
    }
    out.putUInt(8, uint32(out.size() - LZSS_HEADER_SIZE), 4, RLZ_BIG);
    _SetCompressed(out, n);
}

void LZSSCompressor::Decompress(void)
{
    rpos(0);
    ReadMagic(*this, "LZSS", 4, "LZSS");
    const uint32 realsize = readUInt(4, RLZ_BIG);
    const uint32 packed = readUInt(4, RLZ_BIG);
    rskip(4);
    // informational only, some tools leave it wrong
    if(packed != size() - LZSS_HEADER_SIZE)
        logdetail("LZSS: header claims %u compressed bytes, have %u", packed, uint32(size() - LZSS_HEADER_SIZE));

    const uint8 lengthBits = _lz.LengthBits();
    const uint32 lengthMask = _lz.LengthMask();

    ByteBuffer out(SafeReserve(realsize));
    {
        LzWindow window(out, _lz.WindowSize(), _lz.WindowStart());
        FlagReader flags(*this, RLZ_LITTLE);
        while(window.Position() < realsize)
        {
            if(flags.ReadBit())
            {
                window.WriteByte(read<uint8>());
                continue;
            }
            uint8 b1 = read<uint8>();
            uint8 b2 = read<uint8>();
            uint32 offset = ((b2 >> lengthBits) << 8) | b1;
            window.OffsetCopy(offset, (b2 & lengthMask) + _lz.MinLength());
        }
        window.Flush();
        DecompressedSizeException::ThrowIfMismatch(window.Position(), realsize);
    }
    _SetDecompressed(out);
}

RLZ_NAMESPACE_END
