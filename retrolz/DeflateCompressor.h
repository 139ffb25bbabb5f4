#ifndef DEFLATE_COMPRESSOR_H
#define DEFLATE_COMPRESSOR_H

#include "ICompressor.h"

#ifdef RLZ_SUPPORT_ZLIB

RLZ_NAMESPACE_START

// implements a raw deflate stream, not zlib wrapped, and not checksummed.
class DeflateCompressor : public ICompressor
{
public:
    DeflateCompressor();
    virtual ~DeflateCompressor() {}
    virtual void Compress(uint8 level = RLZ_DEFAULT_LEVEL);
    virtual void Decompress(void);
    virtual uint8 Algo(void) const { return RLZALGO_DEFLATE; }

    // zlib's own level for one of ours
    static int ZlibLevel(RLZLevel level);

protected:
    int _windowBits; // read zlib docs to know what this means
    const char *_name;

private:
    static void deflateInto(ByteBuffer& out, const uint8 *src, uint32 size, int level, int wbits, const char *name);
    static void inflateInto(ByteBuffer& out, const uint8 *src, uint32 size, uint32 expected, int wbits, const char *name);
};

// implements deflate stream, zlib wrapped
class ZlibCompressor : public DeflateCompressor
{
public:
    ZlibCompressor();
    virtual ~ZlibCompressor() {}
    virtual uint8 Algo(void) const { return RLZALGO_ZLIB; }

    static bool IsMatch(const uint8 *data, size_t size);
};

// the output produced by this stream contains a minimal gzip header,
// and can be directly written to a .gz file.
class GzipCompressor : public DeflateCompressor
{
public:
    GzipCompressor();
    virtual ~GzipCompressor() {}
    virtual uint8 Algo(void) const { return RLZALGO_GZIP; }

    static bool IsMatch(const uint8 *data, size_t size);
};

RLZ_NAMESPACE_END

#endif // RLZ_SUPPORT_ZLIB

#endif
