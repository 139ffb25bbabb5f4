#include "RLZFormatUtil.h"
#include "PRSCompressor.h"
#include "LzMatchFinder.h"
#include "LzWindow.h"
#include "FlagReader.h"
#include "FlagWriter.h"

RLZ_NAMESPACE_START

static const LzProperties s_prs(0x1FFF, 0x100, 2);

// minimal flag walker over raw memory, for sniffing only
struct PRSProbe
{
    PRSProbe(const uint8 *d, size_t n) : data(d), size(n), pos(0), flag(0), bitsLeft(0) {}

    // false when the input ran out
    bool Bit(bool& b)
    {
        if(!bitsLeft)
        {
            if(pos >= size)
                return false;
            flag = data[pos++];
            bitsLeft = 8;
        }
        b = flag & 1;
        flag >>= 1;
        --bitsLeft;
        return true;
    }

    bool Skip(size_t n)
    {
        if(pos + n > size)
            return false;
        pos += n;
        return true;
    }

    const uint8 *data;
    size_t size;
    size_t pos;
    uint8 flag;
    uint8 bitsLeft;
};

bool PRSCompressor::IsMatch(const uint8 *data, size_t size)
{
    if(size < 9 || !(data[0] & 1))
        return false;

    PRSProbe probe(data, size);
    uint32 literals = 0;
    bool bit;
    for(;;)
    {
        if(!probe.Bit(bit))
            return false;
        if(bit)
        {
            if(!probe.Skip(1))
                return false;
            ++literals;
            continue;
        }

        uint32 distance;
        if(!probe.Bit(bit))
            return false;
        if(bit)
        {
            if(probe.pos + 2 > size)
                return false;
            uint32 v = data[probe.pos] | (data[probe.pos + 1] << 8);
            if(!v) // end marker right after literals
                return false;
            distance = 0x2000 - (v >> 3);
        }
        else
        {
            if(!probe.Bit(bit) || !probe.Bit(bit) || probe.pos >= size)
                return false;
            distance = 0x100 - data[probe.pos];
        }
        return distance <= literals;
    }
}

void PRSCompressor::Compress(uint8 level /* = RLZ_DEFAULT_LEVEL */)
{
    const uint32 n = (uint32)size();
    const uint8 *src = contents();
    ByteBuffer out(n / 2 + 16);
    {
        LzMatchFinder finder(src, n, s_prs, _lookAhead, ToLevel(level));
        FlagWriter flags(out, RLZ_LITTLE);
        ByteBuffer& payload = flags.Payload();
        LzMatch m;
        uint32 pos = 0;
        while(pos < n)
        {
            bool found = finder.FindMatch(pos, m);
            if(!found || (m.length == 2 && m.distance > 0x100))
            {
                finder.AddEntry(pos);
                payload << src[pos++];
                flags.WriteBit(true);
                continue;
            }

            finder.AddEntryRange(pos, m.length);
            pos += m.length;
            flags.WriteBit(false);
            if(m.distance <= 0x100 && m.length <= 5)
            {
                flags.WriteBit(false);
                flags.WriteInt(m.length - 2, 2);
                payload << uint8(0x100 - m.distance);
                flags.FlushIfNecessary();
            }
            else
            {
                const uint32 word = ((0x2000 - m.distance) << 3) & 0xFFFF;
                if(m.length > 9)
                {
                    payload.appendUInt(word, 2, RLZ_LITTLE);
                    payload << uint8(m.length - 1);
                }
                else
                    payload.appendUInt(word | (m.length - 2), 2, RLZ_LITTLE);
                flags.WriteBit(true);
            }
        }

        // end marker: long match with a zero word
        flags.WriteBit(false);
        payload << uint8(0) << uint8(0);
        flags.WriteBit(true);
        flags.Flush();
    }
    DEBUG(logdebug("PRS: %u -> %u bytes", n, (uint32)out.size()));
    _SetCompressed(out, n);
}

void PRSCompressor::Decompress(void)
{
    rpos(0);
    ByteBuffer out(SafeReserve(uint32(size()) * 4));
    {
        LzWindow window(out, s_prs.WindowSize() + 1);
        FlagReader flags(*this, RLZ_LITTLE);
        for(;;)
        {
            if(flags.ReadBit())
            {
                window.WriteByte(read<uint8>());
                continue;
            }

            uint32 distance, length;
            if(flags.ReadBit())
            {
                uint32 v = readUInt(2, RLZ_LITTLE);
                if(!v)
                    break;
                distance = 0x2000 - (v >> 3);
                length = v & 7;
                if(length)
                    length += 2;
                else
                    length = read<uint8>() + 1;
            }
            else
            {
                length = flags.ReadInt(2) + 2;
                distance = 0x100 - read<uint8>();
            }
            window.BackCopy(distance, length);
        }
        window.Flush();
    }
    _SetDecompressed(out);
}

RLZ_NAMESPACE_END
