#ifndef RLZ_ERRORS_H
#define RLZ_ERRORS_H

#include "RLZCommon.h"

#include <exception>
#include <string>

RLZ_NAMESPACE_START

// base of everything thrown while decoding or encoding a stream
class CompressionException : public std::exception
{
public:
    CompressionException(const std::string& msg) : _msg(msg) {}
    virtual ~CompressionException() throw() {}
    virtual const char *what() const throw() { return _msg.c_str(); }

protected:
    std::string _msg;
};

// the input ran out before the declared amount of output was produced
class EndOfInputException : public CompressionException
{
public:
    EndOfInputException(const std::string& msg) : CompressionException(msg) {}
    virtual ~EndOfInputException() throw() {}
};

// the stream references data that can not exist (distance beyond output, bad token, ...)
class CorruptDataException : public CompressionException
{
public:
    CorruptDataException(const std::string& msg) : CompressionException(msg) {}
    virtual ~CorruptDataException() throw() {}
};

// decoding finished, but the produced size is not the one the header promised
class DecompressedSizeException : public CompressionException
{
public:
    DecompressedSizeException(uint64 expected, uint64 actual);
    virtual ~DecompressedSizeException() throw() {}

    uint64 Expected(void) const { return _expected; }
    uint64 Actual(void) const { return _actual; }

    static void ThrowIfMismatch(uint64 actual, uint64 expected)
    {
        if(actual != expected)
            throw DecompressedSizeException(expected, actual);
    }

private:
    uint64 _expected;
    uint64 _actual;
};

// magic number or header field does not belong to the expected format
class InvalidHeaderException : public CompressionException
{
public:
    InvalidHeaderException(const std::string& msg) : CompressionException(msg) {}
    virtual ~InvalidHeaderException() throw() {}
};

RLZ_NAMESPACE_END

#endif
