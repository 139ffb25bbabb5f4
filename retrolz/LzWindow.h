#ifndef RLZ_LZWINDOW_H
#define RLZ_LZWINDOW_H

#include "ByteBuffer.h"

#include <vector>

RLZ_NAMESPACE_START

// Circular view over the most recent `capacity` bytes of decoder output.
// Completed data is appended to the sink; the ring itself never grows.
// The ring starts zero-filled but only bytes actually produced can be referenced.
class LzWindow
{
public:
    // windowStart is the bias of absolute ring offsets used by OffsetCopy()
    LzWindow(ByteBuffer& sink, uint32 capacity, uint32 windowStart = 0);
    ~LzWindow();

    void WriteByte(uint8 b);
    void Write(const uint8 *data, uint32 len);

    // copy len bytes starting distance bytes behind the cursor; may overlap
    void BackCopy(uint32 distance, uint32 len);

    // copy from an absolute ring offset, as stored by Okumura style encoders
    void OffsetCopy(uint32 offset, uint32 len);

    // verbatim run straight from the compressed input
    void CopyFrom(ByteBuffer& src, uint32 len);

    // writes pending bytes; call before the object goes away, the destructor can only log failures
    void Flush(void);

    uint64 Position(void) const { return _written; }
    uint32 Capacity(void) const { return (uint32)_ring.size(); }

private:
    void _Advance(void);

    ByteBuffer& _sink;
    std::vector<uint8> _ring;
    uint32 _pos; // next ring slot to write
    uint32 _flushStart; // first ring slot not yet in the sink
    uint32 _windowStart;
    uint64 _written;

    // no copying
    LzWindow(const LzWindow&);
    LzWindow& operator=(const LzWindow&);
};

RLZ_NAMESPACE_END

#endif
