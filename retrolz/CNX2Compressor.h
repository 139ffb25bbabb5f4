#ifndef CNX2_COMPRESSOR_H
#define CNX2_COMPRESSOR_H

#include "ICompressor.h"

#include <string>

RLZ_NAMESPACE_START

// "CNX\x02" + 4 char file extension + BE compressed size + BE size.
// 2 bit commands packed LSB first into flag bytes:
// 0 = skip to the next block (drops the rest of the flag byte), 1 = one literal,
// 2 = match (distance 1..2048, length 4..35), 3 = verbatim run of up to 255 bytes.
class CNX2Compressor : public ICompressor
{
public:
    CNX2Compressor() : _ext("DEC") {}
    virtual ~CNX2Compressor() {}
    virtual void Compress(uint8 level = RLZ_DEFAULT_LEVEL);
    virtual void Decompress(void);
    virtual uint8 Algo(void) const { return RLZALGO_CNX2; }

    // stored in the header, filled in by Decompress()
    const std::string& Extension(void) const { return _ext; }
    void Extension(const std::string& ext) { _ext = ext; }

    static bool IsMatch(const uint8 *data, size_t size);

private:
    std::string _ext;
};

RLZ_NAMESPACE_END

#endif
