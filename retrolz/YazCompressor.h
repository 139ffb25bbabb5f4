#ifndef YAZ_COMPRESSOR_H
#define YAZ_COMPRESSOR_H

#include "ICompressor.h"

RLZ_NAMESPACE_START

// N64/GameCube family. All of these share one token layout: flags MSB first with
// 1 = literal, 12 bit distance, and a length nibble. They differ in where flags,
// match codes ("links") and literal bytes ("chunks") are stored.

// "Yaz0": flags, links and chunks interleaved in a single stream; lengths 3..273
class Yaz0Compressor : public ICompressor
{
public:
    Yaz0Compressor() : _alignment(0) {}
    virtual ~Yaz0Compressor() {}
    virtual void Compress(uint8 level = RLZ_DEFAULT_LEVEL);
    virtual void Decompress(void);
    virtual uint8 Algo(void) const { return RLZALGO_YAZ0; }

    // memory alignment hint stored in the header; not used for decoding
    uint32 Alignment(void) const { return _alignment; }
    void Alignment(uint32 a) { _alignment = a; }

    static bool IsMatch(const uint8 *data, size_t size);

private:
    uint32 _alignment;
};

// "Yay0": same tokens as Yaz0, but flags, links and chunks in three sections
class Yay0Compressor : public ICompressor
{
public:
    virtual ~Yay0Compressor() {}
    virtual void Compress(uint8 level = RLZ_DEFAULT_LEVEL);
    virtual void Decompress(void);
    virtual uint8 Algo(void) const { return RLZALGO_YAY0; }

    static bool IsMatch(const uint8 *data, size_t size);
};

// "MIO0": three sections like Yay0, fixed 2 byte links with lengths 3..18
class MIO0Compressor : public ICompressor
{
public:
    virtual ~MIO0Compressor() {}
    virtual void Compress(uint8 level = RLZ_DEFAULT_LEVEL);
    virtual void Decompress(void);
    virtual uint8 Algo(void) const { return RLZALGO_MIO0; }

    static bool IsMatch(const uint8 *data, size_t size);
};

// "SMSR00": MIO0 tokens, but 16 bit big endian flag words interleaved with the links,
// literal bytes in a second section. Game loaders for this format do not handle
// overlapping matches, so look-ahead is off by default.
class SMSR00Compressor : public ICompressor
{
public:
    SMSR00Compressor() { _lookAhead = false; }
    virtual ~SMSR00Compressor() {}
    virtual void Compress(uint8 level = RLZ_DEFAULT_LEVEL);
    virtual void Decompress(void);
    virtual uint8 Algo(void) const { return RLZALGO_SMSR00; }

    static bool IsMatch(const uint8 *data, size_t size);
};

RLZ_NAMESPACE_END

#endif
