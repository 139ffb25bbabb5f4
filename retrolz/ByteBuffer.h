#ifndef _BYTEBUFFER_H
#define _BYTEBUFFER_H

#include <vector>
#include <string>
#include <cstdio>

#include "RLZCommon.h"
#include "RLZErrors.h"
#include "ByteConverter.h"

RLZ_NAMESPACE_START

class ByteBufferException : public EndOfInputException
{
public:
    ByteBufferException(bool add, size_t pos, size_t esize, size_t size)
        : EndOfInputException(_MakeMessage(add, pos, esize, size)), _add(add), _pos(pos), _esize(esize), _size(size)
    {
    }
    virtual ~ByteBufferException() throw() {}

    bool IsAppend(void) const { return _add; }
    size_t Pos(void) const { return _pos; }
    size_t ElemSize(void) const { return _esize; }
    size_t Size(void) const { return _size; }

private:
    static std::string _MakeMessage(bool add, size_t pos, size_t esize, size_t size)
    {
        char buf[160];
        snprintf(buf, sizeof(buf), "ByteBuffer: attempted to %s %u bytes at position %u, but size is %u",
            (add ? "put" : "get"), (unsigned int)esize, (unsigned int)pos, (unsigned int)size);
        return buf;
    }

    bool _add;
    size_t _pos;
    size_t _esize;
    size_t _size;
};

// Byte vector with independent read and write cursors.
// Typed operators use little endian; big endian fields go through appendUInt()/readUInt().
class ByteBuffer
{
public:
    const static size_t DEFAULT_SIZE = 0x1000;

    ByteBuffer(): _rpos(0), _wpos(0)
    {
        _storage.reserve(DEFAULT_SIZE);
    }
    ByteBuffer(size_t res): _rpos(0), _wpos(0)
    {
        _storage.reserve(res);
    }
    ByteBuffer(const ByteBuffer &buf): _rpos(buf._rpos), _wpos(buf._wpos), _storage(buf._storage) { }
    virtual ~ByteBuffer() {}

    ByteBuffer& operator=(const ByteBuffer& buf)
    {
        _rpos = buf._rpos;
        _wpos = buf._wpos;
        _storage = buf._storage;
        return *this;
    }

    void clear(void)
    {
        _storage.clear();
        _rpos = _wpos = 0;
    }

    // exchanges contents and cursors, without copying
    void swap(ByteBuffer& other)
    {
        _storage.swap(other._storage);
        std::swap(_rpos, other._rpos);
        std::swap(_wpos, other._wpos);
    }

    template <typename T> void append(T value)
    {
        ByteConverter::ToOrder(value, RLZ_LITTLE);
        append((uint8 *)&value, sizeof(value));
    }

    template <typename T> void put(size_t pos, T value)
    {
        ByteConverter::ToOrder(value, RLZ_LITTLE);
        put(pos, (uint8 *)&value, sizeof(value));
    }

    ByteBuffer &operator<<(bool value)   { append<char>((char)value); return *this; }
    ByteBuffer &operator<<(uint8 value)  { append<uint8>(value); return *this; }
    ByteBuffer &operator<<(uint16 value) { append<uint16>(value); return *this; }
    ByteBuffer &operator<<(uint32 value) { append<uint32>(value); return *this; }
    ByteBuffer &operator<<(uint64 value) { append<uint64>(value); return *this; }
    ByteBuffer &operator<<(int8 value)   { append<int8>(value); return *this; }
    ByteBuffer &operator<<(int16 value)  { append<int16>(value); return *this; }
    ByteBuffer &operator<<(int32 value)  { append<int32>(value); return *this; }
    ByteBuffer &operator<<(int64 value)  { append<int64>(value); return *this; }

    ByteBuffer &operator<<(const std::string &value)
    {
        append((uint8 *)value.c_str(), value.length());
        append((uint8)0);
        return *this;
    }
    ByteBuffer &operator<<(const char *str)
    {
        append((uint8 *)str, strlen(str));
        append((uint8)0);
        return *this;
    }

    ByteBuffer &operator>>(bool &value)   { value = read<char>() > 0; return *this; }
    ByteBuffer &operator>>(uint8 &value)  { value = read<uint8>(); return *this; }
    ByteBuffer &operator>>(uint16 &value) { value = read<uint16>(); return *this; }
    ByteBuffer &operator>>(uint32 &value) { value = read<uint32>(); return *this; }
    ByteBuffer &operator>>(uint64 &value) { value = read<uint64>(); return *this; }
    ByteBuffer &operator>>(int8 &value)   { value = read<int8>(); return *this; }
    ByteBuffer &operator>>(int16 &value)  { value = read<int16>(); return *this; }
    ByteBuffer &operator>>(int32 &value)  { value = read<int32>(); return *this; }
    ByteBuffer &operator>>(int64 &value)  { value = read<int64>(); return *this; }

    ByteBuffer &operator>>(std::string& value)
    {
        value.clear();
        while (true)
        {
            char c = read<char>();
            if (c == 0)
                break;
            value += c;
        }
        return *this;
    }

    uint8 operator[](size_t pos) const
    {
        return read<uint8>(pos);
    }

    size_t rpos() const { return _rpos; }
    size_t rpos(size_t rpos_)
    {
        _rpos = rpos_;
        return _rpos;
    }

    size_t wpos() const { return _wpos; }
    size_t wpos(size_t wpos_)
    {
        _wpos = wpos_;
        return _wpos;
    }

    // bytes left between read cursor and end
    size_t remaining() const { return _rpos < size() ? size() - _rpos : 0; }

    void rskip(size_t bytes)
    {
        if(_rpos + bytes > size())
            throw ByteBufferException(false, _rpos, bytes, size());
        _rpos += bytes;
    }

    template <typename T> T read()
    {
        T r = read<T>(_rpos);
        _rpos += sizeof(T);
        return r;
    }
    template <typename T> T read(size_t pos) const
    {
        if(pos + sizeof(T) > size())
            throw ByteBufferException(false, pos, sizeof(T), size());
        T val;
        memcpy(&val, &_storage[pos], sizeof(T));
        ByteConverter::ToOrder(val, RLZ_LITTLE);
        return val;
    }

    void read(uint8 *dest, size_t len)
    {
        if(_rpos + len > size())
            throw ByteBufferException(false, _rpos, len, size());
        if(len)
            memcpy(dest, &_storage[_rpos], len);
        _rpos += len;
    }

    // unsigned integer of 1..4 bytes in the given order
    uint32 readUInt(uint32 bytes, RLZEndian order)
    {
        if(_rpos + bytes > size())
            throw ByteBufferException(false, _rpos, bytes, size());
        uint32 v = ByteConverter::ReadUInt(&_storage[_rpos], bytes, order);
        _rpos += bytes;
        return v;
    }
    uint32 readUInt(size_t pos, uint32 bytes, RLZEndian order) const
    {
        if(pos + bytes > size())
            throw ByteBufferException(false, pos, bytes, size());
        return ByteConverter::ReadUInt(&_storage[pos], bytes, order);
    }

    const uint8 *contents() const { return _storage.empty() ? NULL : &_storage[0]; }
    uint8 *contents() { return _storage.empty() ? NULL : &_storage[0]; }

    size_t size() const { return _storage.size(); }
    bool empty() const { return _storage.empty(); }

    void resize(size_t newsize)
    {
        _storage.resize(newsize);
        _rpos = 0;
        _wpos = size();
    }
    void reserve(size_t ressize)
    {
        if (ressize > size())
            _storage.reserve(ressize);
    }

    void append(const std::string& str)
    {
        append((const uint8 *)str.c_str(), str.size());
    }
    // string bytes without the terminator; keeps literals away from append<T>()
    void append(const char *str)
    {
        append((const uint8 *)str, strlen(str));
    }
    void append(const char *src, size_t cnt)
    {
        return append((const uint8 *)src, cnt);
    }
    void append(const uint8 *src, size_t cnt)
    {
        if (!cnt)
            return;

        if (_storage.size() < _wpos + cnt)
            _storage.resize(_wpos + cnt);
        memcpy(&_storage[_wpos], src, cnt);
        _wpos += cnt;
    }
    void append(const ByteBuffer& buffer)
    {
        if(buffer.size())
            append(buffer.contents(), buffer.size());
    }

    void appendUInt(uint32 value, uint32 bytes, RLZEndian order)
    {
        uint8 tmp[4];
        ByteConverter::WriteUInt(tmp, value, bytes, order);
        append(tmp, bytes);
    }

    // overwrite already written data, for back-patching header fields
    void put(size_t pos, const uint8 *src, size_t cnt)
    {
        if(pos + cnt > size())
            throw ByteBufferException(true, pos, cnt, size());
        memcpy(&_storage[pos], src, cnt);
    }
    void putUInt(size_t pos, uint32 value, uint32 bytes, RLZEndian order)
    {
        uint8 tmp[4];
        ByteConverter::WriteUInt(tmp, value, bytes, order);
        put(pos, tmp, bytes);
    }

protected:
    size_t _rpos, _wpos;
    std::vector<uint8> _storage;
};

RLZ_NAMESPACE_END

#endif
