#include "RLZFormatUtil.h"
#include "CNX2Compressor.h"
#include "LzMatchFinder.h"
#include "LzWindow.h"
#include "FlagReader.h"
#include "FlagWriter.h"

#include <algorithm>

RLZ_NAMESPACE_START

static const LzProperties s_cnx2(0x800, 0x1F + 4, 4);

static const uint32 CNX2_HEADER_SIZE = 0x10;
static const uint8 CNX2_EXT_PAD = 0x10;

enum CNX2Command
{
    CNX2_SKIP = 0,
    CNX2_LITERAL = 1,
    CNX2_MATCH = 2,
    CNX2_RUN = 3
};

bool CNX2Compressor::IsMatch(const uint8 *data, size_t size)
{
    return MatchMagic(data, size, "CNX\x02", 4, CNX2_HEADER_SIZE);
}

// literal bytes between matches, as single literals or runs of up to 255
static void _WritePlain(FlagWriter& flags, const uint8 *src, uint32 len)
{
    ByteBuffer& payload = flags.Payload();
    while(len)
    {
        uint32 chunk = std::min<uint32>(len, 0xFF);
        if(chunk == 1)
        {
            payload << src[0];
            flags.WriteInt(CNX2_LITERAL, 2, true);
        }
        else
        {
            payload << uint8(chunk);
            payload.append(src, chunk);
            flags.WriteInt(CNX2_RUN, 2, true);
        }
        src += chunk;
        len -= chunk;
    }
}

void CNX2Compressor::Compress(uint8 level /* = RLZ_DEFAULT_LEVEL */)
{
    const uint32 n = (uint32)size();
    const uint8 *src = contents();
    LzMatchList matches = LzMatchFinder::FindMatchesParallel(src, n, s_cnx2, _lookAhead, ToLevel(level));

    ByteBuffer out(n / 2 + CNX2_HEADER_SIZE);
    out.append("CNX\x02", 4);
    uint8 ext[4];
    memset(ext, CNX2_EXT_PAD, sizeof(ext));
    memcpy(ext, _ext.c_str(), std::min<size_t>(_ext.length(), sizeof(ext)));
    out.append(ext, sizeof(ext));
    out.appendUInt(0, 4, RLZ_BIG); // patched below
    out.appendUInt(n, 4, RLZ_BIG);
    {
        FlagWriter flags(out, RLZ_LITTLE);
        uint32 pos = 0;
        for(size_t i = 0; i < matches.size(); ++i)
        {
            const LzMatch& m = matches[i];
            _WritePlain(flags, src + pos, m.offset - pos);
            flags.Payload().appendUInt((((m.distance - 1) & 0x7FF) << 5) | ((m.length - 4) & 0x1F), 2, RLZ_BIG);
            flags.WriteInt(CNX2_MATCH, 2, true);
            pos = m.End();
        }
        _WritePlain(flags, src + pos, n - pos);
        flags.Flush();
    }
    out.putUInt(8, uint32(out.size() - CNX2_HEADER_SIZE), 4, RLZ_BIG);
    _SetCompressed(out, n);
}

void CNX2Compressor::Decompress(void)
{
    rpos(0);
    ReadMagic(*this, "CNX\x02", 4, "CNX2");
    char ext[5] = {0};
    read((uint8*)ext, 4);
    for(uint32 i = 0; i < 4; ++i)
        if(uint8(ext[i]) == CNX2_EXT_PAD)
            ext[i] = 0;
    const uint32 packed = readUInt(4, RLZ_BIG);
    const uint32 realsize = readUInt(4, RLZ_BIG);
    if(packed > size() - CNX2_HEADER_SIZE)
        logdetail("CNX2: header claims %u compressed bytes, have %u", packed, uint32(size() - CNX2_HEADER_SIZE));

    ByteBuffer out(SafeReserve(realsize));
    {
        LzWindow window(out, s_cnx2.WindowSize());
        FlagReader flags(*this, RLZ_LITTLE);
        while(window.Position() < realsize)
        {
            switch(flags.ReadInt(2, true))
            {
                case CNX2_SKIP:
                    rskip(read<uint8>());
                    flags.Reset();
                    break;

                case CNX2_LITERAL:
                    window.WriteByte(read<uint8>());
                    break;

                case CNX2_MATCH:
                {
                    uint32 v = readUInt(2, RLZ_BIG);
                    window.BackCopy((v >> 5) + 1, (v & 0x1F) + 4);
                    break;
                }

                case CNX2_RUN:
                    window.CopyFrom(*this, read<uint8>());
                    break;
            }
        }
        window.Flush();
        DecompressedSizeException::ThrowIfMismatch(window.Position(), realsize);
    }
    _ext = ext;
    _SetDecompressed(out);
}

RLZ_NAMESPACE_END
