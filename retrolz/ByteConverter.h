#ifndef BYTECONVERTER_H
#define BYTECONVERTER_H

#include "RLZCommon.h"

#include <algorithm>

RLZ_NAMESPACE_START

namespace ByteConverter
{
    template<size_t T> inline void convert(char *val)
    {
        std::swap(*val, *(val + T - 1));
        convert<T - 2>(val + 1);
    }

    template<> inline void convert<0>(char *) {}
    template<> inline void convert<1>(char *) {} // ignore central byte

    template<typename T> inline void apply(T *val)
    {
        convert<sizeof(T)>((char *)(val));
    }

    inline bool IsBigEndianHost(void)
    {
        const uint16 probe = 0x0100;
        return *(const uint8*)&probe == 0x01;
    }

    // convert host order from/to the given order, in place
    template<typename T> inline void ToOrder(T& val, RLZEndian order)
    {
        if((order == RLZ_BIG) != IsBigEndianHost())
            apply<T>(&val);
    }

    // read an unsigned integer of `bytes` width (1..4) from memory in the given order
    inline uint32 ReadUInt(const uint8 *p, uint32 bytes, RLZEndian order)
    {
        uint32 v = 0;
        if(order == RLZ_BIG)
            for(uint32 i = 0; i < bytes; ++i)
                v = (v << 8) | p[i];
        else
            for(uint32 i = bytes; i > 0; --i)
                v = (v << 8) | p[i - 1];
        return v;
    }

    // write the low `bytes` bytes of v to memory in the given order
    inline void WriteUInt(uint8 *p, uint32 v, uint32 bytes, RLZEndian order)
    {
        if(order == RLZ_BIG)
            for(uint32 i = bytes; i > 0; --i, v >>= 8)
                p[i - 1] = uint8(v);
        else
            for(uint32 i = 0; i < bytes; ++i, v >>= 8)
                p[i] = uint8(v);
    }
}

RLZ_NAMESPACE_END

#endif
