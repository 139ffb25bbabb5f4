#include "RLZInternal.h"
#include <cstdio>
#include <memory>

#include "RLZTests.h"
#include "RLZFormats.h"
#include "NintendoLZCompressor.h"
#include "LZSSCompressor.h"
#include "YazCompressor.h"
#include "PRSCompressor.h"
#include "CNX2Compressor.h"
#include "DeflateCompressor.h"
#include "BrotliCompressor.h"

#ifdef RLZ_NAMESPACE
  using namespace RLZ_NAMESPACE;
#endif

const char v0[] = "";
const char v1[] = "a";
const char v2[] = "aaaaaaaaaa";
const char v3[] = "aaBaaBaaBBBBBaaaaaBBBBBaaaaaaaaaaBBaaBBBBBBBBBB";
const char v4[] = "Short test string.";
const char v5[] = "Longer test string, longer because the string is longer, and the string is the test";
const char v6[] = "Long test string with many repetitions many repetitions many repetitions many repetitions many repetitions until many repetitions do end.";

const uint8 b1[] =
{
    0,1,2,3,4,5,6,7,8,9,
    9,8,7,6,5,4,3,2,1,0,
    0,1,2,3,4,5,6,7,8,9,
    9,8,7,6,5,4,3,2,1,0,
    0,1,2,3,4,5,6,7,8,9,
    9,8,7,6,5,4,3,2,1,0,
    0,1,2,3,4,5,6,7,8,9,
    9,8,7,6,5,4,3,2,1,0,
    0,1,2,3,4,5,6,7,8,9,
    9,8,7,6,5,4,3,2,1,0,
};

const uint32 i1[] =
{
    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
};

const uint32 i2[] =
{
    0,1,10,100,1000,10000,100000,1000000,
    0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80,
    0x100, 0x200, 0x400, 0x800
};

#define DO_PACK_UNPACK2(mem, compr, lv, la, prn) \
{ \
    uint32 _size = sizeof(mem); \
    compr _c; _c.append((const char*)&mem[0], _size); \
    _c.LookAhead(la); \
    _c.Compress(lv); \
    if(prn) printf("C %s [%s]: %u -> %u\n", #mem, #compr, _c.RealSize(), (uint32)_c.size()); \
    _c.Decompress(); \
    if(_c.size() != _size) return 1; \
    if(memcmp((const char*)&mem[0], _c.contents(), _size)) return 2; \
}

#define DO_PACK_UNPACK(mem, compr) \
{ \
    for(uint8 __i_ = 0; __i_ < RLZLEVEL_MAX; ++__i_) \
        DO_PACK_UNPACK2(mem, compr, __i_, true, false); \
    DO_PACK_UNPACK2(mem, compr, 9, true, true); \
}

#define DO_COMPRESS_RUN(compr) \
{ \
    DO_PACK_UNPACK(v0, compr); \
    DO_PACK_UNPACK(v1, compr); \
    DO_PACK_UNPACK(v2, compr); \
    DO_PACK_UNPACK(v3, compr); \
    DO_PACK_UNPACK(v4, compr); \
    DO_PACK_UNPACK(v5, compr); \
    DO_PACK_UNPACK(v6, compr); \
    DO_PACK_UNPACK(b1, compr); \
    DO_PACK_UNPACK(i1, compr); \
    DO_PACK_UNPACK(i2, compr); \
}

#define EXPECT_THROW(expr, exc, code) \
{ \
    bool _thrown = false; \
    try { expr; } \
    catch(exc&) { _thrown = true; } \
    if(!_thrown) return code; \
}

static const uint8 s_allAlgos[] =
{
    RLZALGO_LZ10, RLZALGO_LZ11, RLZALGO_LZSS, RLZALGO_YAZ0, RLZALGO_YAY0, RLZALGO_MIO0,
    RLZALGO_SMSR00, RLZALGO_PRS, RLZALGO_CNX2, RLZALGO_RLE30,
    RLZALGO_DEFLATE, RLZALGO_ZLIB, RLZALGO_GZIP, RLZALGO_BROTLI
};
static const uint32 s_numAlgos = sizeof(s_allAlgos) / sizeof(s_allAlgos[0]);

// compressed v6 in a fresh compressor of the given algorithm, NULL if not compiled in
static ICompressor *PackV6(uint8 algo)
{
    ICompressor *z = AllocCompressor(algo);
    if(z)
    {
        z->append(v6, sizeof(v6));
        z->Compress(RLZLEVEL_OPTIMAL);
    }
    return z;
}

static void MakeTestData(ByteBuffer& buf, uint32 size)
{
    uint32 x = 1;
    buf.clear();
    while(buf.size() < size)
    {
        x = x * 1103515245u + 12345u;
        if((x >> 24) < 40)
            buf << uint8(x >> 8);
        else
            buf.append(v5 + ((x >> 8) % 40), 4 + ((x >> 16) & 31));
    }
    buf.resize(size);
}

int TestLZ10()
{
    DO_COMPRESS_RUN(LZ10Compressor);
    return 0;
}

int TestLZ11()
{
    DO_COMPRESS_RUN(LZ11Compressor);

    // all three token widths
    ByteBuffer big;
    for(uint32 i = 0; i < 3000; ++i)
        big << uint8(i < 100 ? i : (i < 400 ? 'q' : 'r'));
    LZ11Compressor z;
    z.append(big);
    z.Compress();
    z.Decompress();
    if(z.size() != big.size() || memcmp(z.contents(), big.contents(), big.size()))
        return 3;
    return 0;
}

int TestLZSS()
{
    DO_COMPRESS_RUN(LZSSCompressor);

    LZSSCompressor z;
    z.append(v6, sizeof(v6));
    z.Compress();
    // stored compressed size excludes the 16 byte header
    if(z.readUInt(8, 4, RLZ_BIG) != z.size() - 16)
        return 3;
    if(z.readUInt(4, 4, RLZ_BIG) != sizeof(v6))
        return 4;

    // a wrong compressed size field is reported, not fatal
    z.putUInt(8, 0xDEAD, 4, RLZ_BIG);
    z.Decompress();
    if(z.size() != sizeof(v6) || memcmp(z.contents(), v6, sizeof(v6)))
        return 5;
    return 0;
}

int TestYaz0()
{
    DO_COMPRESS_RUN(Yaz0Compressor);

    // long matches use the extra length byte
    Yaz0Compressor z;
    for(uint32 i = 0; i < 1000; ++i)
        z << uint8('a' + (i % 3));
    z.Alignment(0x80);
    z.Compress();
    if(z.readUInt(8, 4, RLZ_BIG) != 0x80)
        return 3;
    z.Alignment(0);
    z.Decompress();
    if(z.size() != 1000 || z.Alignment() != 0x80)
        return 4;
    for(uint32 i = 0; i < 1000; ++i)
        if(z[i] != 'a' + (i % 3))
            return 5;
    return 0;
}

int TestYay0()
{
    DO_COMPRESS_RUN(Yay0Compressor);
    return 0;
}

int TestMIO0()
{
    DO_COMPRESS_RUN(MIO0Compressor);
    return 0;
}

int TestSMSR00()
{
    DO_COMPRESS_RUN(SMSR00Compressor);
    SMSR00Compressor z;
    if(z.LookAhead())
        return 3;
    return 0;
}

int TestPRS()
{
    DO_COMPRESS_RUN(PRSCompressor);

    // far and long matches take the long arm with the extra length byte
    ByteBuffer data;
    MakeTestData(data, 0x3000);
    for(uint32 i = 0; i < 300; ++i)
        data << uint8('p');
    PRSCompressor z;
    z.append(data);
    z.Compress(RLZLEVEL_SMALLEST);
    z.Decompress();
    if(z.size() != data.size() || memcmp(z.contents(), data.contents(), data.size()))
        return 3;
    return 0;
}

int TestCNX2()
{
    DO_COMPRESS_RUN(CNX2Compressor);

    CNX2Compressor z;
    z.Extension("BIN");
    for(uint32 i = 0; i < 700; ++i) // a literal run longer than 255
        z << uint8(i * 13 + (i >> 8));
    z.append(v6, sizeof(v6));
    ByteBuffer copy(z);
    z.Compress();
    if(memcmp(z.contents() + 4, "BIN\x10", 4))
        return 3;
    if(z.readUInt(8, 4, RLZ_BIG) != z.size() - 16)
        return 4;
    z.Extension("");
    z.Decompress();
    if(z.Extension() != "BIN")
        return 5;
    if(z.size() != copy.size() || memcmp(z.contents(), copy.contents(), copy.size()))
        return 6;
    return 0;
}

int TestRLE30()
{
    DO_COMPRESS_RUN(RLE30Compressor);

    RLE30Compressor z;
    z.append(v2, 10); // one run
    z.Compress();
    // 30 0A 00 00, 0x80 | (10 - 3), 'a'
    if(z.size() != 6 || z[4] != 0x87 || z[5] != 'a')
        return 3;
    return 0;
}

int TestDeflate()
{
#ifdef RLZ_SUPPORT_ZLIB
    DO_COMPRESS_RUN(DeflateCompressor);
#endif
    return 0;
}

int TestZlib()
{
#ifdef RLZ_SUPPORT_ZLIB
    DO_COMPRESS_RUN(ZlibCompressor);
#endif
    return 0;
}

int TestGzip()
{
#ifdef RLZ_SUPPORT_ZLIB
    DO_COMPRESS_RUN(GzipCompressor);
    GzipCompressor z;
    z.append(v5, sizeof(v5));
    z.Compress();
    if(z[0] != 0x1F || z[1] != 0x8B)
        return 3;
    if(z.readUInt(z.size() - 4, 4, RLZ_LITTLE) != sizeof(v5))
        return 4;
#endif
    return 0;
}

int TestBrotli()
{
#ifdef RLZ_SUPPORT_BROTLI
    DO_COMPRESS_RUN(BrotliCompressor);
    std::auto_ptr<ICompressor> z(PackV6(RLZALGO_BROTLI));
    if(!BrotliCompressor::IsMatch(z->contents(), z->size()))
        return 3;
#endif
    return 0;
}

int TestNoLookAhead()
{
    for(uint32 a = 0; a < s_numAlgos; ++a)
    {
        if(!IsSupported(s_allAlgos[a]))
            continue;
        ByteBuffer data;
        MakeTestData(data, 5000);
        for(uint32 i = 0; i < 200; ++i)
            data << uint8('z');
        std::auto_ptr<ICompressor> z(AllocCompressor(s_allAlgos[a]));
        z->append(data);
        z->LookAhead(false);
        z->Compress(RLZLEVEL_SMALLEST);
        z->Decompress();
        if(z->size() != data.size() || memcmp(z->contents(), data.contents(), data.size()))
            return 1 + a;
    }
    return 0;
}

int TestEmptyInput()
{
    for(uint32 a = 0; a < s_numAlgos; ++a)
    {
        std::auto_ptr<ICompressor> z(AllocCompressor(s_allAlgos[a]));
        if(!z.get())
            continue;
        z->Compress();
        if(!z->Compressed() || !z->size())
            return 1 + a;
        z->Decompress();
        if(z->size() || z->Compressed())
            return 100 + a;
    }
    return 0;
}

int TestTruncated()
{
    for(uint32 a = 0; a < s_numAlgos; ++a)
    {
        std::auto_ptr<ICompressor> z(PackV6(s_allAlgos[a]));
        if(!z.get())
            continue;
        z->resize(z->size() - 2);
        EXPECT_THROW(z->Decompress(), EndOfInputException, int(1 + a));
    }
    return 0;
}

// valid LZ10 stream: "ABC" + match (distance 3, length 9)
static const uint8 s_lz10abc[] = { 0x10, 0x0C, 0x00, 0x00, 0x10, 'A', 'B', 'C', 0x60, 0x02 };
// Yaz0: flags 1110 0000, "ABC", (len - 2) << 12 | (distance - 1)
static const uint8 s_yaz0abc[] = { 'Y','a','z','0', 0,0,0,12, 0,0,0,0, 0,0,0,0, 0xE0, 'A','B','C', 0x70, 0x02 };
// PRS: literal 'A', short match distance 1 length 5, end marker
static const uint8 s_prsA6[] = { 0x59, 'A', 0xFF, 0x00, 0x00 };

int TestKnownStreams()
{
    LZ10Compressor lz;
    lz.append(s_lz10abc, sizeof(s_lz10abc));
    lz.Decompress();
    if(lz.size() != 12 || memcmp(lz.contents(), "ABCABCABCABC", 12))
        return 1;

    Yaz0Compressor yaz;
    yaz.append(s_yaz0abc, sizeof(s_yaz0abc));
    yaz.Decompress();
    if(yaz.size() != 12 || memcmp(yaz.contents(), "ABCABCABCABC", 12))
        return 2;

    PRSCompressor prs;
    prs.append(s_prsA6, sizeof(s_prsA6));
    prs.Decompress();
    if(prs.size() != 6 || memcmp(prs.contents(), "AAAAAA", 6))
        return 3;

    // and the encoders produce them
    LZ10Compressor lz2;
    lz2.append("ABCABCABCABC", 12);
    lz2.Compress();
    if(lz2.size() != sizeof(s_lz10abc) || memcmp(lz2.contents(), s_lz10abc, sizeof(s_lz10abc)))
        return 4;

    PRSCompressor prs2;
    prs2.append("AAAAAA", 6);
    prs2.Compress();
    if(prs2.size() != sizeof(s_prsA6) || memcmp(prs2.contents(), s_prsA6, sizeof(s_prsA6)))
        return 5;
    return 0;
}

int TestSizeMismatch()
{
    // header claims 11 bytes, the match runs to 12
    LZ10Compressor lz;
    lz.append(s_lz10abc, sizeof(s_lz10abc));
    lz.put<uint8>(1, 11);
    EXPECT_THROW(lz.Decompress(), DecompressedSizeException, 1);

    Yaz0Compressor yaz;
    yaz.append(s_yaz0abc, sizeof(s_yaz0abc));
    yaz.put<uint8>(7, 10);
    try
    {
        yaz.Decompress();
        return 2;
    }
    catch(DecompressedSizeException& e)
    {
        if(e.Expected() != 10 || e.Actual() != 12)
            return 3;
    }
    return 0;
}

int TestBadHeader()
{
    LZ11Compressor z;
    z.append(s_lz10abc, sizeof(s_lz10abc)); // id 0x10, not 0x11
    EXPECT_THROW(z.Decompress(), InvalidHeaderException, 1);

    Yaz0Compressor yaz;
    yaz.append("Yax0", 4);
    yaz.append(s_yaz0abc + 4, sizeof(s_yaz0abc) - 4);
    EXPECT_THROW(yaz.Decompress(), InvalidHeaderException, 2);

    std::auto_ptr<ICompressor> yay(PackV6(RLZALGO_YAY0));
    yay->putUInt(8, 8, 4, RLZ_BIG); // link section inside the header
    EXPECT_THROW(yay->Decompress(), InvalidHeaderException, 3);

    std::auto_ptr<ICompressor> mio(PackV6(RLZALGO_MIO0));
    mio->putUInt(12, uint32(mio->size() + 1), 4, RLZ_BIG); // chunk section past the end
    EXPECT_THROW(mio->Decompress(), EndOfInputException, 4);

    // match reaching before the start of the output
    const uint8 bad[] = { 0x10, 0x06, 0x00, 0x00, 0x40, 'A', 0x60, 0x05 };
    LZ10Compressor lz;
    lz.append(bad, sizeof(bad));
    EXPECT_THROW(lz.Decompress(), CorruptDataException, 5);

#ifdef RLZ_SUPPORT_ZLIB
    ZlibCompressor zl;
    zl.append(v4, sizeof(v4));
    EXPECT_THROW(zl.Decompress(), CorruptDataException, 6);
#endif
    return 0;
}

int TestUnchangedOnError()
{
    for(uint32 a = 0; a < s_numAlgos; ++a)
    {
        std::auto_ptr<ICompressor> z(PackV6(s_allAlgos[a]));
        if(!z.get())
            continue;
        z->resize(z->size() - 2);
        ByteBuffer copy(*z);
        try
        {
            z->Decompress();
            return 1 + a;
        }
        catch(CompressionException&)
        {
        }
        if(z->size() != copy.size() || memcmp(z->contents(), copy.contents(), copy.size()))
            return 100 + a;
        if(!z->Compressed())
            return 200 + a;
    }
    return 0;
}

int TestDetect()
{
    for(uint32 a = 0; a < s_numAlgos; ++a)
    {
        const uint8 algo = s_allAlgos[a];
        // raw deflate and brotli carry no signature
        if(algo == RLZALGO_DEFLATE || algo == RLZALGO_BROTLI)
            continue;
        std::auto_ptr<ICompressor> z(PackV6(algo));
        if(!z.get())
            continue;
        uint8 found = DetectAlgo(z->contents(), z->size());
        if(found != algo)
        {
            printf("DetectAlgo: %s detected as %s\n", GetAlgoName(algo), GetAlgoName(found));
            return 1 + a;
        }
    }
    if(DetectAlgo(NULL, 0) != RLZALGO_NONE)
        return 100;
    return 0;
}

int TestAlgoNames()
{
    for(uint8 i = RLZALGO_NONE + 1; i < RLZALGO_MAX; ++i)
    {
        const char *name = GetAlgoName(i);
        if(!name || GetAlgoByName(name) != i)
            return 1;
    }
    if(GetAlgoByName("YaZ0") != RLZALGO_YAZ0 || GetAlgoByName("SMSR00") != RLZALGO_SMSR00)
        return 2;
    if(GetAlgoByName("yaz") != RLZALGO_NONE || GetAlgoByName("yaz00") != RLZALGO_NONE || GetAlgoByName(NULL) != RLZALGO_NONE)
        return 3;
    if(GetAlgoName(RLZALGO_MAX))
        return 4;
    if(IsSupported(RLZALGO_NONE) || !IsSupported(RLZALGO_YAZ0))
        return 5;
    if(AllocCompressor(RLZALGO_NONE))
        return 6;
    for(uint8 i = RLZALGO_NONE + 1; i < RLZALGO_MAX; ++i)
    {
        std::auto_ptr<ICompressor> z(AllocCompressor(i));
        if(IsSupported(i) != (z.get() != NULL))
            return 7;
        if(z.get() && z->Algo() != i)
            return 8;
    }
    return 0;
}

int TestLargeInput()
{
    ByteBuffer data;
    MakeTestData(data, 0x40000);
    static const uint8 algos[] = { RLZALGO_LZ11, RLZALGO_MIO0, RLZALGO_YAZ0, RLZALGO_CNX2 };
    for(uint32 a = 0; a < sizeof(algos); ++a)
    {
        std::auto_ptr<ICompressor> z(AllocCompressor(algos[a]));
        z->append(data);
        z->Compress();
        if(z->size() >= data.size())
            return 1 + a;
        if(z->RealSize() != data.size())
            return 10 + a;
        z->Decompress();
        if(z->size() != data.size() || memcmp(z->contents(), data.contents(), data.size()))
            return 20 + a;
    }
    return 0;
}
