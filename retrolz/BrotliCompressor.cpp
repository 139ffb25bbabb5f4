#include "RLZCompileConfig.h"

#ifdef RLZ_SUPPORT_BROTLI

#include <brotli/encode.h>
#include <brotli/decode.h>

#include "RLZFormatUtil.h"
#include "BrotliCompressor.h"

RLZ_NAMESPACE_START

static const int RLZ_BROTLI_LGWIN = 22;
static const size_t RLZ_BROTLI_PROBE_SIZE = 0x80;

int BrotliCompressor::Quality(RLZLevel level)
{
    switch(level)
    {
        case RLZLEVEL_NONE:     return 0;
        case RLZLEVEL_FASTEST:  return 1;
        case RLZLEVEL_OPTIMAL:  return 4;
        default:                return 10;
    }
}

bool BrotliCompressor::IsMatch(const uint8 *data, size_t size)
{
    if(!size)
        return false;

    BrotliDecoderState *state = BrotliDecoderCreateInstance(NULL, NULL, NULL);
    if(!state)
        return false;

    uint8 probe[0x40];
    size_t availIn = size < RLZ_BROTLI_PROBE_SIZE ? size : RLZ_BROTLI_PROBE_SIZE;
    const uint8 *nextIn = data;
    size_t availOut = sizeof(probe);
    uint8 *nextOut = probe;
    BrotliDecoderResult res = BrotliDecoderDecompressStream(state, &availIn, &nextIn, &availOut, &nextOut, NULL);
    BrotliDecoderDestroyInstance(state);
    return res != BROTLI_DECODER_RESULT_ERROR;
}

void BrotliCompressor::Compress(uint8 level /* = RLZ_DEFAULT_LEVEL */)
{
    const uint32 oldsize = (uint32)size();
    size_t outsize = BrotliEncoderMaxCompressedSize(oldsize);
    if(!outsize) // 0 means the input is too large for the bound
        outsize = oldsize + (oldsize >> 2) + 1024;

    ByteBuffer out;
    out.resize(outsize);
    if(!BrotliEncoderCompress(Quality(ToLevel(level)), RLZ_BROTLI_LGWIN, BROTLI_MODE_GENERIC,
                              oldsize, contents(), &outsize, out.contents()))
    {
        char buf[96];
        snprintf(buf, sizeof(buf), "Brotli: encoder failed on %u bytes", oldsize);
        throw CompressionException(buf);
    }
    out.resize(outsize);
    DEBUG(logdebug("Brotli: %u -> %u bytes", oldsize, (uint32)outsize));
    _SetCompressed(out, oldsize);
}

void BrotliCompressor::Decompress(void)
{
    BrotliDecoderState *state = BrotliDecoderCreateInstance(NULL, NULL, NULL);
    if(!state)
        throw CompressionException("Brotli: can't create decoder");

    size_t availIn = size();
    const uint8 *nextIn = contents();
    ByteBuffer out;
    out.resize(SafeReserve(uint32(size()) * 4 + 256));
    size_t total = 0;
    BrotliDecoderResult res;
    for(;;)
    {
        if(total == out.size())
            out.resize(out.size() * 2);
        size_t availOut = out.size() - total;
        uint8 *nextOut = out.contents() + total;
        res = BrotliDecoderDecompressStream(state, &availIn, &nextIn, &availOut, &nextOut, NULL);
        total = out.size() - availOut;
        if(res != BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT)
            break;
    }

    char buf[160];
    buf[0] = 0;
    if(res == BROTLI_DECODER_RESULT_ERROR)
        snprintf(buf, sizeof(buf), "Brotli: %s", BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state)));
    BrotliDecoderDestroyInstance(state);

    if(res == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT)
    {
        snprintf(buf, sizeof(buf), "Brotli: stream ends early (%u bytes decoded)", (uint32)total);
        throw EndOfInputException(buf);
    }
    if(res != BROTLI_DECODER_RESULT_SUCCESS)
        throw CorruptDataException(buf);
    if(availIn)
        logdetail("Brotli: ignoring %u trailing bytes", (uint32)availIn);

    out.resize(total);
    _SetDecompressed(out);
}

RLZ_NAMESPACE_END

#endif // RLZ_SUPPORT_BROTLI
