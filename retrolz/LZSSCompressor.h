#ifndef LZSS_COMPRESSOR_H
#define LZSS_COMPRESSOR_H

#include "ICompressor.h"
#include "LzProperties.h"

RLZ_NAMESPACE_START

// Okumura LZSS in a small container: "LZSS" + BE size + BE compressed size + 0.
// 8 flags per byte, LSB first, 1 = literal. Matches store an absolute ring offset
// biased by the window start instead of a distance.
class LZSSCompressor : public ICompressor
{
public:
    LZSSCompressor();
    explicit LZSSCompressor(const LzProperties& lz) : _lz(lz) {}
    virtual ~LZSSCompressor() {}
    virtual void Compress(uint8 level = RLZ_DEFAULT_LEVEL);
    virtual void Decompress(void);
    virtual uint8 Algo(void) const { return RLZALGO_LZSS; }

    const LzProperties& Properties(void) const { return _lz; }

    static bool IsMatch(const uint8 *data, size_t size);

private:
    LzProperties _lz;
};

RLZ_NAMESPACE_END

#endif
