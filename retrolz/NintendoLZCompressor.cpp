#include "RLZFormatUtil.h"
#include "NintendoLZCompressor.h"
#include "LzMatchFinder.h"
#include "LzWindow.h"
#include "FlagReader.h"
#include "FlagWriter.h"
#include "RleMatchFinder.h"

#include <algorithm>

RLZ_NAMESPACE_START

static const LzProperties s_lz10(0x1000, 18, 3);
static const LzProperties s_lz11(0x1000, 0x10110, 3);

// ---- LZ10 ----

bool LZ10Compressor::IsMatch(const uint8 *data, size_t size)
{
    // the first token must be a literal
    return MatchSizeHeader(data, size, 0x10, 0x80, 0);
}

void LZ10Compressor::Compress(uint8 level /* = RLZ_DEFAULT_LEVEL */)
{
    const uint32 n = (uint32)size();
    const uint8 *src = contents();
    ByteBuffer out(n / 2 + 16);
    WriteSizeHeader(out, 0x10, n);
    {
        LzMatchFinder finder(src, n, s_lz10, _lookAhead, ToLevel(level));
        FlagWriter flags(out, RLZ_BIG);
        LzMatch m;
        uint32 pos = 0;
        while(pos < n)
        {
            if(finder.TryFindMatch(pos, m))
            {
                flags.Payload().appendUInt(((m.length - 3) << 12) | ((m.distance - 1) & 0xFFF), 2, RLZ_BIG);
                pos += m.length;
                flags.WriteBit(true);
            }
            else
            {
                flags.Payload() << src[pos++];
                flags.WriteBit(false);
            }
        }
        flags.Flush();
    }
    DEBUG(logdebug("LZ10: %u -> %u bytes", n, (uint32)out.size()));
    _SetCompressed(out, n);
}

void LZ10Compressor::Decompress(void)
{
    rpos(0);
    const uint32 realsize = ReadSizeHeader(*this, 0x10, "LZ10");
    ByteBuffer out(SafeReserve(realsize));
    {
        LzWindow window(out, s_lz10.WindowSize());
        FlagReader flags(*this, RLZ_BIG);
        while(window.Position() < realsize)
        {
            if(flags.ReadBit())
            {
                uint8 b1 = read<uint8>();
                uint8 b2 = read<uint8>();
                window.BackCopy((((b1 & 0xF) << 8) | b2) + 1, (b1 >> 4) + 3);
            }
            else
                window.WriteByte(read<uint8>());
        }
        window.Flush();
        DecompressedSizeException::ThrowIfMismatch(window.Position(), realsize);
    }
    _SetDecompressed(out);
}

// ---- LZ11 ----

bool LZ11Compressor::IsMatch(const uint8 *data, size_t size)
{
    return MatchSizeHeader(data, size, 0x11, 0x80, 0);
}

void LZ11Compressor::Compress(uint8 level /* = RLZ_DEFAULT_LEVEL */)
{
    const uint32 n = (uint32)size();
    const uint8 *src = contents();
    LzMatchList matches = LzMatchFinder::FindMatchesParallel(src, n, s_lz11, _lookAhead, ToLevel(level));

    ByteBuffer out(n / 2 + 16);
    WriteSizeHeader(out, 0x11, n);
    {
        FlagWriter flags(out, RLZ_BIG);
        ByteBuffer& payload = flags.Payload();
        size_t mi = 0;
        uint32 pos = 0;
        while(pos < n)
        {
            if(mi < matches.size() && matches[mi].offset == pos)
            {
                const LzMatch& m = matches[mi++];
                const uint32 dist = (m.distance - 1) & 0xFFF;
                if(m.length <= 16) // LLLLDDDD DDDDDDDD
                    payload.appendUInt(((m.length - 1) << 12) | dist, 2, RLZ_BIG);
                else if(m.length <= 272) // 0000LLLL LLLLDDDD DDDDDDDD
                    payload.appendUInt(((m.length - 17) << 12) | dist, 3, RLZ_BIG);
                else // 0001LLLL LLLLLLLL LLLLDDDD DDDDDDDD
                    payload.appendUInt(0x10000000 | (((m.length - 273) & 0xFFFF) << 12) | dist, 4, RLZ_BIG);
                pos += m.length;
                flags.WriteBit(true);
            }
            else
            {
                payload << src[pos++];
                flags.WriteBit(false);
            }
        }
        flags.Flush();
    }
    _SetCompressed(out, n);
}

void LZ11Compressor::Decompress(void)
{
    rpos(0);
    const uint32 realsize = ReadSizeHeader(*this, 0x11, "LZ11");
    ByteBuffer out(SafeReserve(realsize));
    {
        LzWindow window(out, s_lz11.WindowSize());
        FlagReader flags(*this, RLZ_BIG);
        while(window.Position() < realsize)
        {
            if(!flags.ReadBit())
            {
                window.WriteByte(read<uint8>());
                continue;
            }

            uint32 distance, length;
            uint8 b1 = read<uint8>();
            uint8 b2 = read<uint8>();
            switch(b1 >> 4)
            {
                case 0: // 17..272
                {
                    uint8 b3 = read<uint8>();
                    distance = ((b2 & 0xF) << 8) | b3;
                    length = (((b1 & 0xF) << 4) | (b2 >> 4)) + 17;
                    break;
                }
                case 1: // 273..65808
                {
                    uint8 b3 = read<uint8>();
                    uint8 b4 = read<uint8>();
                    distance = ((b3 & 0xF) << 8) | b4;
                    length = (((b1 & 0xF) << 12) | (b2 << 4) | (b3 >> 4)) + 273;
                    break;
                }
                default: // 3..16
                    distance = ((b1 & 0xF) << 8) | b2;
                    length = (b1 >> 4) + 1;
            }
            window.BackCopy(distance + 1, length);
        }
        window.Flush();
        DecompressedSizeException::ThrowIfMismatch(window.Position(), realsize);
    }
    _SetDecompressed(out);
}

// ---- RLE30 ----

bool RLE30Compressor::IsMatch(const uint8 *data, size_t size)
{
    // a first packet holding a single literal is rare enough to reject
    return MatchSizeHeader(data, size, 0x30, 0, 0) && !MatchSizeHeader(data, size, 0x30, 0xFF, 0);
}

void RLE30Compressor::Compress(uint8 level /* = RLZ_DEFAULT_LEVEL */)
{
    const uint32 n = (uint32)size();
    const uint8 *src = contents();
    const bool store = ToLevel(level) == RLZLEVEL_NONE;
    ByteBuffer out(n + n / 64 + 16);
    WriteSizeHeader(out, 0x30, n);

    RleMatchFinder finder(3, 0x7F);
    uint32 pos = 0;
    while(pos < n)
    {
        uint32 len;
        if(!store && finder.TryFindMatch(src, n, pos, len))
        {
            out << uint8((len - 3) | 0x80);
            out << src[pos];
        }
        else
        {
            if(store)
                len = std::min<uint32>(n - pos, 0x80);
            out << uint8(len - 1);
            out.append(src + pos, len);
        }
        pos += len;
    }
    _SetCompressed(out, n);
}

void RLE30Compressor::Decompress(void)
{
    rpos(0);
    const uint32 realsize = ReadSizeHeader(*this, 0x30, "RLE30");
    ByteBuffer out(SafeReserve(realsize));
    uint8 tmp[0x82];
    while(out.size() < realsize)
    {
        uint8 flag = read<uint8>();
        uint32 len = (flag & 0x7F) + 1;
        if(flag & 0x80)
        {
            len += 2;
            memset(tmp, read<uint8>(), len);
        }
        else
            read(tmp, len);
        out.append(tmp, len);
    }
    DecompressedSizeException::ThrowIfMismatch(out.size(), realsize);
    _SetDecompressed(out);
}

RLZ_NAMESPACE_END
