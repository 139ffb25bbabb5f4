#ifndef RLZ_FORMATS_H
#define RLZ_FORMATS_H

#include "RLZCommon.h"

RLZ_NAMESPACE_START

enum RLZAlgos
{
    RLZALGO_NONE = 0,

    // Nintendo style LZ77 containers
    RLZALGO_LZ10,
    RLZALGO_LZ11,
    RLZALGO_LZSS,
    RLZALGO_YAZ0,
    RLZALGO_YAY0,
    RLZALGO_MIO0,

    // other game formats
    RLZALGO_SMSR00,
    RLZALGO_PRS,
    RLZALGO_CNX2,
    RLZALGO_RLE30,

    // library backed
    RLZALGO_DEFLATE,
    RLZALGO_ZLIB,
    RLZALGO_GZIP,
    RLZALGO_BROTLI,

    RLZALGO_MAX
};

#define RLZ_DEFAULT_LEVEL RLZLEVEL_OPTIMAL

// FindMatchesParallel splits its input into blocks of this size.
// Do not make it depend on the thread count, the match list must not change with it.
#define RLZ_MATCH_BLOCK_SIZE 0x8000

class ICompressor;

// returns a new compressor for the given algorithm, or NULL if not compiled in.
// must be deleted by the caller.
ICompressor *AllocCompressor(uint8 algo);

// short lowercase name, e.g. "yaz0"; NULL for unknown ids
const char *GetAlgoName(uint8 algo);

// case-insensitive inverse of GetAlgoName(); RLZALGO_NONE if unknown
uint8 GetAlgoByName(const char *name);

// checks the header of a compressed blob. formats without magic are tried last.
// RLZALGO_NONE if nothing fits.
uint8 DetectAlgo(const uint8 *data, size_t size);

bool IsSupported(uint8 algo);

RLZ_NAMESPACE_END

#endif
