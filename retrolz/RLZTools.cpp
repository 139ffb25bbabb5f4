#include "RLZInternal.h"
#include "RLZTools.h"
#include "ByteBuffer.h"

#include <algorithm>
#include <cctype>

RLZ_NAMESPACE_START

// tolower() takes unsigned char values only
static char _lowerChar(char c)
{
    return (char)tolower((unsigned char)c);
}

std::string stringToLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), _lowerChar);
    return s;
}

// extracts the file name from a given path
const char *PathToFileName(const char *str)
{
    const char *p = strrchr(str, '/');
#ifdef _WIN32
    const char *q = strrchr(str, '\\');
    if(q > p)
        p = q;
#endif
    return p ? p+1 : str;
}

bool LoadFile(const char *fn, ByteBuffer& buf)
{
    FILE *fh = fopen(fn, "rb");
    if(!fh)
    {
        logerror("file not found: '%s'", fn);
        return false;
    }
    fseek(fh, 0, SEEK_END);
    long s = ftell(fh);
    fseek(fh, 0, SEEK_SET);
    if(s < 0)
    {
        logerror("can't determine size of '%s'", fn);
        fclose(fh);
        return false;
    }

    buf.clear();
    buf.resize(size_t(s));
    size_t got = s ? fread(buf.contents(), 1, size_t(s), fh) : 0;
    fclose(fh);
    if(got != size_t(s))
    {
        logerror("short read on '%s': %u of %u bytes", fn, (uint32)got, (uint32)s);
        buf.clear();
        return false;
    }
    logdetail("loaded '%s' (%u bytes)", fn, (uint32)got);
    return true;
}

bool SaveFile(const char *fn, const ByteBuffer& buf)
{
    FILE *fh = fopen(fn, "wb");
    if(!fh)
    {
        logerror("can't open '%s' for writing", fn);
        return false;
    }
    size_t done = buf.size() ? fwrite(buf.contents(), 1, buf.size(), fh) : 0;
    bool ok = done == buf.size();
    if(fclose(fh))
        ok = false;
    if(!ok)
        logerror("error writing '%s'", fn);
    return ok;
}

RLZ_NAMESPACE_END
