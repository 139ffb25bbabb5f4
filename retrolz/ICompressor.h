#ifndef RLZ_ICOMPRESSOR_H
#define RLZ_ICOMPRESSOR_H

#include "ByteBuffer.h"
#include "RLZFormats.h"

RLZ_NAMESPACE_START

// A buffer that compresses and decompresses itself in place.
// Compress() turns the contents into a complete container (header + payload),
// Decompress() expects such a container and replaces it with the decoded data.
// Decoding errors are thrown as CompressionException subclasses; the contents are
// left untouched in that case.
class ICompressor : public ByteBuffer
{
public:
    ICompressor(): _iscompressed(false), _real_size(0), _lookAhead(true) {}
    virtual ~ICompressor() {}
    virtual void Compress(uint8 level = RLZ_DEFAULT_LEVEL) = 0;
    virtual void Decompress(void) = 0;
    virtual uint8 Algo(void) const = 0;

    bool Compressed(void) const { return _iscompressed; }
    void Compressed(bool b) { _iscompressed = b; }
    uint32 RealSize(void) const { return _iscompressed ? _real_size : (uint32)size(); }
    void RealSize(uint32 realsize) { _real_size = realsize; }

    // lazy matching and self-overlapping matches; ignored by library backed formats
    bool LookAhead(void) const { return _lookAhead; }
    void LookAhead(bool b) { _lookAhead = b; }

    void clear(void) // not required to be strictly virtual; be careful not to mess up static types!
    {
        ByteBuffer::clear();
        _real_size = 0;
        _iscompressed = false;
    }

    static RLZLevel ToLevel(uint8 level)
    {
        return level < RLZLEVEL_MAX ? RLZLevel(level) : RLZLEVEL_SMALLEST;
    }

protected:
    // take over the encoded container
    void _SetCompressed(ByteBuffer& out, uint32 realsize)
    {
        swap(out);
        rpos(0);
        wpos(size());
        _real_size = realsize;
        _iscompressed = true;
    }
    // take over the decoded data
    void _SetDecompressed(ByteBuffer& out)
    {
        swap(out);
        rpos(0);
        wpos(size());
        _real_size = 0;
        _iscompressed = false;
    }

    bool _iscompressed;
    uint32 _real_size;
    bool _lookAhead;
};

RLZ_NAMESPACE_END


#endif
