#ifndef PRS_COMPRESSOR_H
#define PRS_COMPRESSOR_H

#include "ICompressor.h"

RLZ_NAMESPACE_START

// SEGA PRS. No header; the stream ends with a long match of distance 0.
// Flags are single bytes read LSB first, little endian match words.
// Short matches (length 2..5, distance up to 0x100) keep their length in two flag bits.
class PRSCompressor : public ICompressor
{
public:
    virtual ~PRSCompressor() {}
    virtual void Compress(uint8 level = RLZ_DEFAULT_LEVEL);
    virtual void Decompress(void);
    virtual uint8 Algo(void) const { return RLZALGO_PRS; }

    // no magic: walks the literals up to the first match and checks that it
    // refers to data already produced
    static bool IsMatch(const uint8 *data, size_t size);
};

RLZ_NAMESPACE_END

#endif
