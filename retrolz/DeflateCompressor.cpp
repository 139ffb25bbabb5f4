#include "RLZCompileConfig.h"

#ifdef RLZ_SUPPORT_ZLIB

#include <zlib.h>

#include "RLZFormatUtil.h"
#include "DeflateCompressor.h"

RLZ_NAMESPACE_START

// zutil.h is not public; this is its DEF_MEM_LEVEL
static const int RLZ_ZLIB_MEM_LEVEL = 8;

DeflateCompressor::DeflateCompressor()
:   _windowBits(-MAX_WBITS), // negative, because we want a raw deflate stream, and not zlib-wrapped
    _name("Deflate")
{
}

ZlibCompressor::ZlibCompressor()
: DeflateCompressor()
{
    _windowBits = MAX_WBITS; // positive, means we use a zlib-wrapped deflate stream
    _name = "Zlib";
}

GzipCompressor::GzipCompressor()
: DeflateCompressor()
{
    _windowBits = MAX_WBITS + 16; // this makes zlib wrap a minimal gzip header around the stream
    _name = "Gzip";
}

bool ZlibCompressor::IsMatch(const uint8 *data, size_t size)
{
    // CMF: deflate with at most 32K window, FCHECK makes CMF*256+FLG a multiple of 31
    return size >= 6 && (data[0] & 0x0F) == Z_DEFLATED && (data[0] >> 4) <= 7
        && !(data[1] & 0x20) && ((data[0] << 8) | data[1]) % 31 == 0;
}

bool GzipCompressor::IsMatch(const uint8 *data, size_t size)
{
    return size >= 18 && data[0] == 0x1F && data[1] == 0x8B && data[2] == Z_DEFLATED;
}

int DeflateCompressor::ZlibLevel(RLZLevel level)
{
    switch(level)
    {
        case RLZLEVEL_NONE:     return Z_NO_COMPRESSION;
        case RLZLEVEL_FASTEST:  return Z_BEST_SPEED;
        case RLZLEVEL_OPTIMAL:  return 6;
        default:                return Z_BEST_COMPRESSION;
    }
}

void DeflateCompressor::deflateInto(ByteBuffer& out, const uint8 *src, uint32 size, int level, int wbits, const char *name)
{
    z_stream c_stream;
    memset(&c_stream, 0, sizeof(c_stream));
    c_stream.zalloc = (alloc_func)Z_NULL;
    c_stream.zfree = (free_func)Z_NULL;
    c_stream.opaque = (voidpf)Z_NULL;

    char buf[128];
    int err = deflateInit2(&c_stream, level, Z_DEFLATED, wbits, RLZ_ZLIB_MEM_LEVEL, Z_DEFAULT_STRATEGY);
    if(err != Z_OK)
    {
        snprintf(buf, sizeof(buf), "%s: deflateInit failed (zlib error %d)", name, err);
        throw CompressionException(buf);
    }

    uLong bound = deflateBound(&c_stream, size);
    out.resize(bound);

    c_stream.next_in = (Bytef*)src;
    c_stream.avail_in = (uInt)size;
    c_stream.next_out = (Bytef*)out.contents();
    c_stream.avail_out = (uInt)bound;

    err = deflate(&c_stream, Z_FINISH);
    const uLong total = c_stream.total_out;
    deflateEnd(&c_stream);
    if(err != Z_STREAM_END)
    {
        snprintf(buf, sizeof(buf), "%s: deflate did not finish (zlib error %d)", name, err);
        throw CompressionException(buf);
    }
    out.resize(total);
}

void DeflateCompressor::inflateInto(ByteBuffer& out, const uint8 *src, uint32 size, uint32 expected, int wbits, const char *name)
{
    z_stream stream;
    memset(&stream, 0, sizeof(stream));
    stream.next_in = (Bytef*)src;
    stream.avail_in = (uInt)size;
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;

    char buf[160];
    int err = inflateInit2(&stream, wbits);
    if(err != Z_OK)
    {
        snprintf(buf, sizeof(buf), "%s: inflateInit failed (zlib error %d)", name, err);
        throw CompressionException(buf);
    }

    // grow as needed, the size hint is untrusted
    size_t cap = SafeReserve(expected ? expected : size * 4);
    if(cap < 256)
        cap = 256;
    out.resize(cap);
    do
    {
        if(stream.total_out == out.size())
            out.resize(out.size() * 2);
        stream.next_out = (Bytef*)out.contents() + stream.total_out;
        stream.avail_out = (uInt)(out.size() - stream.total_out);
        err = inflate(&stream, Z_NO_FLUSH);
    }
    while(err == Z_OK || (err == Z_BUF_ERROR && !stream.avail_out));

    const uLong total = stream.total_out;
    const uInt leftIn = stream.avail_in;
    const char *msg = stream.msg ? stream.msg : "";
    std::string reason(msg);
    inflateEnd(&stream);

    if(err == Z_BUF_ERROR && !leftIn)
    {
        snprintf(buf, sizeof(buf), "%s: stream ends before its last block (%u bytes inflated)", name, (uint32)total);
        throw EndOfInputException(buf);
    }
    if(err != Z_STREAM_END)
    {
        snprintf(buf, sizeof(buf), "%s: inflate failed (zlib error %d: %s)", name, err, reason.c_str());
        throw CorruptDataException(buf);
    }
    if(leftIn)
        logdetail("%s: ignoring %u trailing bytes", name, (uint32)leftIn);

    out.resize(total);
}

void DeflateCompressor::Compress(uint8 level /* = RLZ_DEFAULT_LEVEL */)
{
    const uint32 oldsize = (uint32)size();
    ByteBuffer out;
    deflateInto(out, contents(), oldsize, ZlibLevel(ToLevel(level)), _windowBits, _name);
    DEBUG(logdebug("%s: %u -> %u bytes", _name, oldsize, (uint32)out.size()));
    _SetCompressed(out, oldsize);
}

void DeflateCompressor::Decompress(void)
{
    uint32 expected = _iscompressed ? _real_size : 0;
    // according to RFC 1952, input size are the last 4 bytes at the end of the file, in little endian
    if(_windowBits > MAX_WBITS && size() >= 4)
        expected = readUInt(size() - 4, 4, RLZ_LITTLE);

    ByteBuffer out;
    inflateInto(out, contents(), (uint32)size(), expected, _windowBits, _name);
    _SetDecompressed(out);
}

RLZ_NAMESPACE_END

#endif // RLZ_SUPPORT_ZLIB
