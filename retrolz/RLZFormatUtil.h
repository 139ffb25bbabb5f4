#ifndef RLZ_FORMATUTIL_H
#define RLZ_FORMATUTIL_H

#include "RLZInternal.h"
#include "RLZErrors.h"
#include "ByteBuffer.h"

#include <cstdio>

RLZ_NAMESPACE_START

// header fields are untrusted, never reserve more than this up front
#define RLZ_MAX_RESERVE 0x4000000

inline size_t SafeReserve(uint32 n)
{
    return n < RLZ_MAX_RESERVE ? n : RLZ_MAX_RESERVE;
}

// id byte + 24 bit LE size, or id + 0 + 32 bit LE size if that does not fit (or is 0)
inline void WriteSizeHeader(ByteBuffer& out, uint8 id, uint32 size)
{
    if(size && size <= 0xFFFFFF)
        out.appendUInt(id | (size << 8), 4, RLZ_LITTLE);
    else
    {
        out.appendUInt(id, 4, RLZ_LITTLE);
        out.appendUInt(size, 4, RLZ_LITTLE);
    }
}

inline uint32 ReadSizeHeader(ByteBuffer& in, uint8 id, const char *name)
{
    uint8 b = in.read<uint8>();
    if(b != id)
    {
        char buf[96];
        snprintf(buf, sizeof(buf), "%s: expected id byte 0x%02X, got 0x%02X", name, id, b);
        throw InvalidHeaderException(buf);
    }
    uint32 size = in.readUInt(3, RLZ_LITTLE);
    if(!size)
        size = in.readUInt(4, RLZ_LITTLE);
    return size;
}

// id byte, nonzero size, and the first byte after the header passes `mask`
inline bool MatchSizeHeader(const uint8 *data, size_t size, uint8 id, uint8 mask, uint8 expect)
{
    if(size < 5 || data[0] != id)
        return false;
    uint32 hdr = data[1] | (data[2] << 8) | (data[3] << 16);
    size_t next = 4;
    if(!hdr)
    {
        if(size < 9)
            return false;
        hdr = data[4] | (data[5] << 8) | (data[6] << 16) | (uint32(data[7]) << 24);
        next = 8;
    }
    return hdr && (data[next] & mask) == expect;
}

inline void ReadMagic(ByteBuffer& in, const char *magic, uint32 len, const char *name)
{
    char got[8] = {0};
    in.read((uint8*)got, len);
    if(memcmp(got, magic, len))
    {
        char buf[96];
        snprintf(buf, sizeof(buf), "%s: bad magic", name);
        throw InvalidHeaderException(buf);
    }
}

inline bool MatchMagic(const uint8 *data, size_t size, const char *magic, uint32 len, size_t minsize)
{
    return size >= minsize && size >= len && !memcmp(data, magic, len);
}

RLZ_NAMESPACE_END

#endif
