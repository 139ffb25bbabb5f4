#include "RLZFormatUtil.h"
#include "YazCompressor.h"
#include "LzMatchFinder.h"
#include "LzWindow.h"
#include "FlagReader.h"
#include "FlagWriter.h"

RLZ_NAMESPACE_START

static const LzProperties s_yay(0x1000, 0xFF + 0x12, 3);
static const LzProperties s_mio(0x1000, 18, 3);

static const uint32 SECTION_HEADER_SIZE = 0x10;

// ---- shared token coding ----

static void _EncodeYay(const uint8 *src, uint32 n, bool lookAhead, RLZLevel level,
                       FlagWriter& flags, ByteBuffer& links, ByteBuffer& chunks)
{
    LzMatchFinder finder(src, n, s_yay, lookAhead, level);
    LzMatch m;
    uint32 pos = 0;
    while(pos < n)
    {
        if(finder.TryFindMatch(pos, m))
        {
            if(m.length < 0x12)
                links.appendUInt((m.distance - 1) | ((m.length - 2) << 12), 2, RLZ_BIG);
            else
            {
                // length nibble 0: length follows as a separate byte
                links.appendUInt((m.distance - 1) & 0xFFF, 2, RLZ_BIG);
                chunks << uint8(m.length - 0x12);
            }
            pos += m.length;
            flags.WriteBit(false);
        }
        else
        {
            chunks << src[pos++];
            flags.WriteBit(true);
        }
    }
}

static void _DecodeYay(FlagReader& flags, ByteBuffer& links, ByteBuffer& chunks, ByteBuffer& out, uint32 realsize)
{
    LzWindow window(out, s_yay.WindowSize());
    while(window.Position() < realsize)
    {
        if(flags.ReadBit())
        {
            window.WriteByte(chunks.read<uint8>());
            continue;
        }
        uint8 b1 = links.read<uint8>();
        uint8 b2 = links.read<uint8>();
        uint32 distance = (((b1 & 0xF) << 8) | b2) + 1;
        uint32 length = b1 >> 4;
        if(length)
            length += 2;
        else
            length = chunks.read<uint8>() + 0x12;
        window.BackCopy(distance, length);
    }
    window.Flush();
    DecompressedSizeException::ThrowIfMismatch(window.Position(), realsize);
}

static void _EncodeMio(const uint8 *src, uint32 n, const LzMatchList& matches,
                       FlagWriter& flags, ByteBuffer& links, ByteBuffer& chunks)
{
    size_t mi = 0;
    uint32 pos = 0;
    while(pos < n)
    {
        if(mi < matches.size() && matches[mi].offset == pos)
        {
            const LzMatch& m = matches[mi++];
            links.appendUInt((m.distance - 1) | ((m.length - 3) << 12), 2, RLZ_BIG);
            pos += m.length;
            flags.WriteBit(false);
        }
        else
        {
            chunks << src[pos++];
            flags.WriteBit(true);
        }
    }
}

static void _DecodeMio(FlagReader& flags, ByteBuffer& links, ByteBuffer& chunks, ByteBuffer& out, uint32 realsize)
{
    LzWindow window(out, s_mio.WindowSize());
    while(window.Position() < realsize)
    {
        if(flags.ReadBit())
            window.WriteByte(chunks.read<uint8>());
        else
        {
            uint32 link = links.readUInt(2, RLZ_BIG);
            window.BackCopy((link & 0xFFF) + 1, (link >> 12) + 3);
        }
    }
    window.Flush();
    DecompressedSizeException::ThrowIfMismatch(window.Position(), realsize);
}

// ---- three section containers ----

static void _WriteSections(ByteBuffer& out, const char *magic, uint32 realsize,
                           const ByteBuffer& flagData, const ByteBuffer& links, const ByteBuffer& chunks)
{
    out.append(magic, 4);
    out.appendUInt(realsize, 4, RLZ_BIG);
    out.appendUInt(uint32(SECTION_HEADER_SIZE + flagData.size()), 4, RLZ_BIG);
    out.appendUInt(uint32(SECTION_HEADER_SIZE + flagData.size() + links.size()), 4, RLZ_BIG);
    out.append(flagData);
    out.append(links);
    out.append(chunks);
}

static void _CheckSection(const char *name, uint32 begin, uint32 end, size_t total)
{
    char buf[128];
    if(begin < SECTION_HEADER_SIZE || end < begin)
    {
        snprintf(buf, sizeof(buf), "%s: bad section offsets 0x%X / 0x%X", name, begin, end);
        throw InvalidHeaderException(buf);
    }
    if(end > total)
    {
        snprintf(buf, sizeof(buf), "%s: section ends at 0x%X, but input has only 0x%X bytes", name, end, (uint32)total);
        throw EndOfInputException(buf);
    }
}

static void _CopySection(const ByteBuffer& src, uint32 begin, uint32 end, ByteBuffer& dst)
{
    if(end > begin)
        dst.append(src.contents() + begin, end - begin);
}

// ---- Yaz0 ----

bool Yaz0Compressor::IsMatch(const uint8 *data, size_t size)
{
    return MatchMagic(data, size, "Yaz0", 4, SECTION_HEADER_SIZE);
}

void Yaz0Compressor::Compress(uint8 level /* = RLZ_DEFAULT_LEVEL */)
{
    const uint32 n = (uint32)size();
    ByteBuffer out(n / 2 + SECTION_HEADER_SIZE);
    out.append("Yaz0", 4);
    out.appendUInt(n, 4, RLZ_BIG);
    out.appendUInt(_alignment, 4, RLZ_BIG);
    out.appendUInt(0, 4, RLZ_BIG);
    {
        FlagWriter flags(out, RLZ_BIG);
        _EncodeYay(contents(), n, _lookAhead, ToLevel(level), flags, flags.Payload(), flags.Payload());
        flags.Flush();
    }
    _SetCompressed(out, n);
}

void Yaz0Compressor::Decompress(void)
{
    rpos(0);
    ReadMagic(*this, "Yaz0", 4, "Yaz0");
    const uint32 realsize = readUInt(4, RLZ_BIG);
    const uint32 alignment = readUInt(4, RLZ_BIG);
    rskip(4);

    ByteBuffer out(SafeReserve(realsize));
    FlagReader flags(*this, RLZ_BIG);
    _DecodeYay(flags, *this, *this, out, realsize);
    _alignment = alignment;
    _SetDecompressed(out);
}

// ---- Yay0 ----

bool Yay0Compressor::IsMatch(const uint8 *data, size_t size)
{
    return MatchMagic(data, size, "Yay0", 4, SECTION_HEADER_SIZE);
}

void Yay0Compressor::Compress(uint8 level /* = RLZ_DEFAULT_LEVEL */)
{
    const uint32 n = (uint32)size();
    ByteBuffer flagData(n / 64 + 4), links(n / 4 + 4), chunks(n / 2 + 4);
    {
        FlagWriter flags(flagData, RLZ_BIG);
        _EncodeYay(contents(), n, _lookAhead, ToLevel(level), flags, links, chunks);
        flags.Flush();
    }
    ByteBuffer out(SECTION_HEADER_SIZE + flagData.size() + links.size() + chunks.size());
    _WriteSections(out, "Yay0", n, flagData, links, chunks);
    _SetCompressed(out, n);
}

void Yay0Compressor::Decompress(void)
{
    rpos(0);
    ReadMagic(*this, "Yay0", 4, "Yay0");
    const uint32 realsize = readUInt(4, RLZ_BIG);
    const uint32 linkOffs = readUInt(4, RLZ_BIG);
    const uint32 chunkOffs = readUInt(4, RLZ_BIG);
    _CheckSection("Yay0", linkOffs, chunkOffs, size());

    ByteBuffer flagData, links, chunks;
    _CopySection(*this, SECTION_HEADER_SIZE, linkOffs, flagData);
    _CopySection(*this, linkOffs, chunkOffs, links);
    _CopySection(*this, chunkOffs, (uint32)size(), chunks);

    ByteBuffer out(SafeReserve(realsize));
    FlagReader flags(flagData, RLZ_BIG);
    _DecodeYay(flags, links, chunks, out, realsize);
    _SetDecompressed(out);
}

// ---- MIO0 ----

bool MIO0Compressor::IsMatch(const uint8 *data, size_t size)
{
    return MatchMagic(data, size, "MIO0", 4, SECTION_HEADER_SIZE);
}

void MIO0Compressor::Compress(uint8 level /* = RLZ_DEFAULT_LEVEL */)
{
    const uint32 n = (uint32)size();
    LzMatchList matches = LzMatchFinder::FindMatchesParallel(contents(), n, s_mio, _lookAhead, ToLevel(level));

    ByteBuffer flagData(n / 64 + 4), links(n / 4 + 4), chunks(n / 2 + 4);
    {
        FlagWriter flags(flagData, RLZ_BIG);
        _EncodeMio(contents(), n, matches, flags, links, chunks);
        flags.Flush();
    }
    ByteBuffer out(SECTION_HEADER_SIZE + flagData.size() + links.size() + chunks.size());
    _WriteSections(out, "MIO0", n, flagData, links, chunks);
    _SetCompressed(out, n);
}

void MIO0Compressor::Decompress(void)
{
    rpos(0);
    ReadMagic(*this, "MIO0", 4, "MIO0");
    const uint32 realsize = readUInt(4, RLZ_BIG);
    const uint32 linkOffs = readUInt(4, RLZ_BIG);
    const uint32 chunkOffs = readUInt(4, RLZ_BIG);
    _CheckSection("MIO0", linkOffs, chunkOffs, size());

    ByteBuffer flagData, links, chunks;
    _CopySection(*this, SECTION_HEADER_SIZE, linkOffs, flagData);
    _CopySection(*this, linkOffs, chunkOffs, links);
    _CopySection(*this, chunkOffs, (uint32)size(), chunks);

    ByteBuffer out(SafeReserve(realsize));
    FlagReader flags(flagData, RLZ_BIG);
    _DecodeMio(flags, links, chunks, out, realsize);
    _SetDecompressed(out);
}

// ---- SMSR00 ----

bool SMSR00Compressor::IsMatch(const uint8 *data, size_t size)
{
    return MatchMagic(data, size, "SMSR00", 6, SECTION_HEADER_SIZE);
}

void SMSR00Compressor::Compress(uint8 level /* = RLZ_DEFAULT_LEVEL */)
{
    const uint32 n = (uint32)size();
    LzMatchList matches = LzMatchFinder::FindMatchesParallel(contents(), n, s_mio, _lookAhead, ToLevel(level));

    ByteBuffer codes(n / 4 + 4), chunks(n / 2 + 4);
    {
        FlagWriter flags(codes, RLZ_BIG, 2, RLZ_BIG);
        _EncodeMio(contents(), n, matches, flags, flags.Payload(), chunks);
        flags.Flush();
    }
    ByteBuffer out(SECTION_HEADER_SIZE + codes.size() + chunks.size());
    out.append("SMSR00", 6);
    out.appendUInt(0, 2, RLZ_BIG);
    out.appendUInt(n, 4, RLZ_BIG);
    out.appendUInt(uint32(SECTION_HEADER_SIZE + codes.size()), 4, RLZ_BIG);
    out.append(codes);
    out.append(chunks);
    _SetCompressed(out, n);
}

void SMSR00Compressor::Decompress(void)
{
    rpos(0);
    ReadMagic(*this, "SMSR00", 6, "SMSR00");
    rskip(2);
    const uint32 realsize = readUInt(4, RLZ_BIG);
    const uint32 chunkOffs = readUInt(4, RLZ_BIG);
    _CheckSection("SMSR00", SECTION_HEADER_SIZE, chunkOffs, size());

    ByteBuffer codes, chunks;
    _CopySection(*this, SECTION_HEADER_SIZE, chunkOffs, codes);
    _CopySection(*this, chunkOffs, (uint32)size(), chunks);

    ByteBuffer out(SafeReserve(realsize));
    FlagReader flags(codes, RLZ_BIG, 2, RLZ_BIG);
    _DecodeMio(flags, codes, chunks, out, realsize);
    _SetDecompressed(out);
}

RLZ_NAMESPACE_END
