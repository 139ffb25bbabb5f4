#ifndef RLZ_TOOLS_H
#define RLZ_TOOLS_H

#include <string>

#include "RLZCommon.h"

RLZ_NAMESPACE_START

class ByteBuffer;

std::string stringToLower(std::string s);
const char *PathToFileName(const char *str);

// whole file into buf (replacing its contents). false if the file can't be read.
bool LoadFile(const char *fn, ByteBuffer& buf);
// false if the file can't be created or not all bytes were written
bool SaveFile(const char *fn, const ByteBuffer& buf);

RLZ_NAMESPACE_END

#endif
