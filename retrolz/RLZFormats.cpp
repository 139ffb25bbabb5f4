#include "RLZInternal.h"
#include "RLZFormats.h"
#include "NintendoLZCompressor.h"
#include "LZSSCompressor.h"
#include "YazCompressor.h"
#include "PRSCompressor.h"
#include "CNX2Compressor.h"
#include "DeflateCompressor.h"
#include "BrotliCompressor.h"

#include <ctype.h>

RLZ_NAMESPACE_START

static const char * const s_algoNames[RLZALGO_MAX] =
{
    "none",
    "lz10",
    "lz11",
    "lzss",
    "yaz0",
    "yay0",
    "mio0",
    "smsr00",
    "prs",
    "cnx2",
    "rle30",
    "deflate",
    "zlib",
    "gzip",
    "brotli"
};

ICompressor *AllocCompressor(uint8 algo)
{
    switch(algo)
    {
        case RLZALGO_LZ10:   return new LZ10Compressor;
        case RLZALGO_LZ11:   return new LZ11Compressor;
        case RLZALGO_LZSS:   return new LZSSCompressor;
        case RLZALGO_YAZ0:   return new Yaz0Compressor;
        case RLZALGO_YAY0:   return new Yay0Compressor;
        case RLZALGO_MIO0:   return new MIO0Compressor;
        case RLZALGO_SMSR00: return new SMSR00Compressor;
        case RLZALGO_PRS:    return new PRSCompressor;
        case RLZALGO_CNX2:   return new CNX2Compressor;
        case RLZALGO_RLE30:  return new RLE30Compressor;
#ifdef RLZ_SUPPORT_ZLIB
        case RLZALGO_DEFLATE: return new DeflateCompressor;
        case RLZALGO_ZLIB:    return new ZlibCompressor;
        case RLZALGO_GZIP:    return new GzipCompressor;
#endif
#ifdef RLZ_SUPPORT_BROTLI
        case RLZALGO_BROTLI:  return new BrotliCompressor;
#endif
    }

    DEBUG(logdebug("AllocCompressor(%u): algorithm not available", uint32(algo)));
    return NULL;
}

bool IsSupported(uint8 algo)
{
    switch(algo)
    {
        case RLZALGO_NONE:
        case RLZALGO_MAX:
            return false;
#ifndef RLZ_SUPPORT_ZLIB
        case RLZALGO_DEFLATE:
        case RLZALGO_ZLIB:
        case RLZALGO_GZIP:
            return false;
#endif
#ifndef RLZ_SUPPORT_BROTLI
        case RLZALGO_BROTLI:
            return false;
#endif
        default:
            return algo < RLZALGO_MAX;
    }
}

const char *GetAlgoName(uint8 algo)
{
    return algo < RLZALGO_MAX ? s_algoNames[algo] : NULL;
}

uint8 GetAlgoByName(const char *name)
{
    if(!name)
        return RLZALGO_NONE;
    for(uint8 i = RLZALGO_NONE + 1; i < RLZALGO_MAX; ++i)
    {
        const char *a = s_algoNames[i];
        const char *b = name;
        while(*a && tolower((unsigned char)*b) == *a)
        {
            ++a;
            ++b;
        }
        if(!*a && !*b)
            return i;
    }
    return RLZALGO_NONE;
}

uint8 DetectAlgo(const uint8 *data, size_t size)
{
    if(!data || !size)
        return RLZALGO_NONE;

    // magic numbers first
    if(Yaz0Compressor::IsMatch(data, size))
        return RLZALGO_YAZ0;
    if(Yay0Compressor::IsMatch(data, size))
        return RLZALGO_YAY0;
    if(MIO0Compressor::IsMatch(data, size))
        return RLZALGO_MIO0;
    if(LZSSCompressor::IsMatch(data, size))
        return RLZALGO_LZSS;
    if(SMSR00Compressor::IsMatch(data, size))
        return RLZALGO_SMSR00;
    if(CNX2Compressor::IsMatch(data, size))
        return RLZALGO_CNX2;

#ifdef RLZ_SUPPORT_ZLIB
    if(GzipCompressor::IsMatch(data, size))
        return RLZALGO_GZIP;
    if(ZlibCompressor::IsMatch(data, size))
        return RLZALGO_ZLIB;
#endif

    // a single id byte
    if(LZ10Compressor::IsMatch(data, size))
        return RLZALGO_LZ10;
    if(LZ11Compressor::IsMatch(data, size))
        return RLZALGO_LZ11;
    if(RLE30Compressor::IsMatch(data, size))
        return RLZALGO_RLE30;

    // nothing but plausibility
    if(PRSCompressor::IsMatch(data, size))
        return RLZALGO_PRS;
#ifdef RLZ_SUPPORT_BROTLI
    if(BrotliCompressor::IsMatch(data, size))
        return RLZALGO_BROTLI;
#endif

    return RLZALGO_NONE;
}

RLZ_NAMESPACE_END
