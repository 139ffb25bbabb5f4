#ifndef NINTENDO_LZ_COMPRESSOR_H
#define NINTENDO_LZ_COMPRESSOR_H

#include "ICompressor.h"

RLZ_NAMESPACE_START

// GBA/DS BIOS style LZ77: id 0x10 + size, 8 flags per byte (MSB first, 1 = match),
// matches are 2 bytes: 4 bit length (3..18), 12 bit distance.
class LZ10Compressor : public ICompressor
{
public:
    virtual ~LZ10Compressor() {}
    virtual void Compress(uint8 level = RLZ_DEFAULT_LEVEL);
    virtual void Decompress(void);
    virtual uint8 Algo(void) const { return RLZALGO_LZ10; }

    static bool IsMatch(const uint8 *data, size_t size);
};

// DS extension of LZ10 with 2, 3 or 4 byte match tokens (length up to 65808)
class LZ11Compressor : public ICompressor
{
public:
    virtual ~LZ11Compressor() {}
    virtual void Compress(uint8 level = RLZ_DEFAULT_LEVEL);
    virtual void Decompress(void);
    virtual uint8 Algo(void) const { return RLZALGO_LZ11; }

    static bool IsMatch(const uint8 *data, size_t size);
};

// id 0x30 + size, packets of either 1..128 literal bytes or a run of 3..130 equal bytes
class RLE30Compressor : public ICompressor
{
public:
    virtual ~RLE30Compressor() {}
    virtual void Compress(uint8 level = RLZ_DEFAULT_LEVEL);
    virtual void Decompress(void);
    virtual uint8 Algo(void) const { return RLZALGO_RLE30; }

    static bool IsMatch(const uint8 *data, size_t size);
};

RLZ_NAMESPACE_END

#endif
