#ifndef BROTLI_COMPRESSOR_H
#define BROTLI_COMPRESSOR_H

#include "ICompressor.h"

#ifdef RLZ_SUPPORT_BROTLI

RLZ_NAMESPACE_START

// raw brotli stream (RFC 7932), no container. The decoded size is not stored.
class BrotliCompressor : public ICompressor
{
public:
    virtual ~BrotliCompressor() {}
    virtual void Compress(uint8 level = RLZ_DEFAULT_LEVEL);
    virtual void Decompress(void);
    virtual uint8 Algo(void) const { return RLZALGO_BROTLI; }

    static int Quality(RLZLevel level);

    // brotli has no magic. Decodes the first bytes and accepts anything that is not
    // rejected as invalid; only used as the last resort of format detection.
    static bool IsMatch(const uint8 *data, size_t size);
};

RLZ_NAMESPACE_END

#endif // RLZ_SUPPORT_BROTLI

#endif
