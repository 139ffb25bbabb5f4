#include "RLZInternal.h"
#include "LzWindow.h"

#include <algorithm>
#include <exception>

RLZ_NAMESPACE_START

LzWindow::LzWindow(ByteBuffer& sink, uint32 capacity, uint32 windowStart /* = 0 */)
: _sink(sink), _ring(capacity, 0), _pos(0), _flushStart(0), _windowStart(windowStart), _written(0)
{
    ASSERT(capacity > 0);
}

LzWindow::~LzWindow()
{
    try
    {
        Flush();
    }
    catch(std::exception& e)
    {
        logerror("LzWindow: flush on destruction failed, output is incomplete: %s", e.what());
    }
}

// called after _pos was incremented; hands the full ring to the sink on wraparound
inline void LzWindow::_Advance(void)
{
    if(_pos == _ring.size())
    {
        _sink.append(&_ring[_flushStart], _pos - _flushStart);
        _pos = 0;
        _flushStart = 0;
    }
}

void LzWindow::WriteByte(uint8 b)
{
    _ring[_pos++] = b;
    ++_written;
    _Advance();
}

void LzWindow::Write(const uint8 *data, uint32 len)
{
    while(len)
    {
        uint32 n = std::min<uint32>(len, uint32(_ring.size()) - _pos);
        memcpy(&_ring[_pos], data, n);
        _pos += n;
        _written += n;
        data += n;
        len -= n;
        _Advance();
    }
}

void LzWindow::BackCopy(uint32 distance, uint32 len)
{
    const uint32 cap = (uint32)_ring.size();
    if(!distance || distance > cap || distance > _written)
    {
        char buf[128];
        snprintf(buf, sizeof(buf), "LzWindow: back reference distance %u invalid (window %u, produced %llu)",
            distance, cap, (unsigned long long)_written);
        throw CorruptDataException(buf);
    }

    uint32 src = (_pos + cap - distance) % cap;
    // byte by byte on purpose, length may exceed distance
    for(uint32 i = 0; i < len; ++i)
    {
        _ring[_pos++] = _ring[src++];
        if(src == cap)
            src = 0;
        ++_written;
        _Advance();
    }
}

void LzWindow::OffsetCopy(uint32 offset, uint32 len)
{
    const uint32 cap = (uint32)_ring.size();
    uint32 ringOffset = uint32((uint64(offset) + cap - (_windowStart % cap)) % cap);
    uint32 distance = (_pos + cap - ringOffset) % cap;
    if(!distance)
        distance = cap;
    BackCopy(distance, len);
}

void LzWindow::CopyFrom(ByteBuffer& src, uint32 len)
{
    if(src.remaining() < len)
    {
        char buf[128];
        snprintf(buf, sizeof(buf), "LzWindow: verbatim run of %u bytes, but only %u bytes left",
            len, (uint32)src.remaining());
        throw EndOfInputException(buf);
    }

    while(len)
    {
        uint32 n = std::min<uint32>(len, uint32(_ring.size()) - _pos);
        src.read(&_ring[_pos], n);
        _pos += n;
        _written += n;
        len -= n;
        _Advance();
    }
}

void LzWindow::Flush(void)
{
    if(_pos > _flushStart)
    {
        _sink.append(&_ring[_flushStart], _pos - _flushStart);
        _flushStart = _pos;
    }
}

RLZ_NAMESPACE_END
