#include "RLZInternal.h"
#include "RLZFormats.h"
#include "RLZTools.h"
#include "ICompressor.h"

#include <memory>
#include <vector>
#include <cctype>

#ifdef RLZ_NAMESPACE
using namespace RLZ_NAMESPACE;
#endif

static void dep_authors(void)
{
    puts("** rlzpak uses:"
#ifdef RLZ_SUPPORT_ZLIB
         " - zlib by Jean-loup Gailly and Mark Adler"
#endif
#ifdef RLZ_SUPPORT_BROTLI
         " - Brotli by Jyrki Alakuijala and Zoltan Szabadka"
#endif
         " **");
}

static void usage(void)
{
    puts("rlzpak MODE [-flags] [algo] files ..\n"
           "\n"
           "Modes:\n"
           "  c <algo> <in> <out> - compress\n"
           "  d [algo] <in> <out> - decompress (algo is detected if not given)\n"
           "  i <in>              - show detected format and sizes\n"
           "  l                   - list formats\n"
           "\n"
           "Flags:\n"
           "  -l <LEVEL> - none, fast, optimal (default) or smallest, or 0..3\n"
           "  -n - no look-ahead (no lazy matching, no overlapping matches)\n"
           "  -v - be verbose; -vv for more\n"
           "\n"
           "Examples: rlzpak c yaz0 -l smallest model.bin model.szs\n"
           "          rlzpak d model.szs model.bin\n"
           );
    dep_authors();
}

static bool parseLevel(const char *str, uint8 *level)
{
    if(isdigit(str[0]) && !str[1])
    {
        *level = uint8(str[0] - '0');
        if(*level < RLZLEVEL_MAX)
            return true;
    }
    std::string s = stringToLower(str);
    if(s == "none")          *level = RLZLEVEL_NONE;
    else if(s == "fast")     *level = RLZLEVEL_FASTEST;
    else if(s == "optimal")  *level = RLZLEVEL_OPTIMAL;
    else if(s == "smallest") *level = RLZLEVEL_SMALLEST;
    else
    {
        logerror("invalid compression level: '%s'", str);
        return false;
    }
    return true;
}

struct Options
{
    Options() : level(RLZ_DEFAULT_LEVEL), lookAhead(true), verbosity(0) {}

    uint8 level;
    bool lookAhead;
    uint8 verbosity;
    std::vector<std::string> args; // everything that is not a flag
};

static bool parseArgv(Options& opt, int argc, char **argv)
{
    for(int i = 0; i < argc; ++i)
    {
        const char *a = argv[i];
        if(a[0] != '-' || !a[1])
        {
            opt.args.push_back(a);
            continue;
        }
        switch(a[1])
        {
            case 'l':
                if(a[2])
                {
                    if(!parseLevel(a + 2, &opt.level))
                        return false;
                }
                else if(i + 1 < argc)
                {
                    if(!parseLevel(argv[++i], &opt.level))
                        return false;
                }
                else
                {
                    logerror("-l needs a level");
                    return false;
                }
                break;

            case 'n':
                opt.lookAhead = false;
                break;

            case 'v':
                for(const char *p = a + 1; *p == 'v'; ++p)
                    ++opt.verbosity;
                break;

            default:
                printf("Unknown parameter: '%s'\n", a);
                return false;
        }
    }
    return true;
}

static uint8 parseAlgo(const std::string& name)
{
    uint8 algo = GetAlgoByName(name.c_str());
    if(algo == RLZALGO_NONE)
        logerror("unknown format: '%s' (use 'rlzpak l' to list)", name.c_str());
    else if(!IsSupported(algo))
    {
        logerror("format '%s' was not compiled in", name.c_str());
        algo = RLZALGO_NONE;
    }
    return algo;
}

static float ratio(size_t packed, size_t real)
{
    return real ? float(packed) / float(real) * 100.0f : 100.0f;
}

static int doCompress(const Options& opt)
{
    if(opt.args.size() != 3)
    {
        usage();
        return 2;
    }
    uint8 algo = parseAlgo(opt.args[0]);
    if(algo == RLZALGO_NONE)
        return 2;

    std::auto_ptr<ICompressor> z(AllocCompressor(algo));
    if(!z.get())
        return 1;
    if(!LoadFile(opt.args[1].c_str(), *z))
        return 1;

    z->LookAhead(opt.lookAhead);
    const size_t realsize = z->size();
    try
    {
        z->Compress(opt.level);
    }
    catch(CompressionException& e)
    {
        logerror("compression failed: %s", e.what());
        return 1;
    }

    if(!SaveFile(opt.args[2].c_str(), *z))
        return 1;

    printf("%s: %u -> %u bytes (%.2f%%)\n", GetAlgoName(algo), (uint32)realsize, (uint32)z->size(),
        ratio(z->size(), realsize));
    return 0;
}

static int doDecompress(const Options& opt)
{
    if(opt.args.size() != 2 && opt.args.size() != 3)
    {
        usage();
        return 2;
    }
    const bool detect = opt.args.size() == 2;
    const std::string& infile = opt.args[detect ? 0 : 1];
    const std::string& outfile = opt.args[detect ? 1 : 2];

    ByteBuffer in;
    if(!LoadFile(infile.c_str(), in))
        return 1;

    uint8 algo;
    if(detect)
    {
        algo = DetectAlgo(in.contents(), in.size());
        if(algo == RLZALGO_NONE)
        {
            logerror("decompression failed: '%s' is not in any known format", PathToFileName(infile.c_str()));
            return 1;
        }
        logdebug("detected format: %s", GetAlgoName(algo));
    }
    else if((algo = parseAlgo(opt.args[0])) == RLZALGO_NONE)
        return 2;

    std::auto_ptr<ICompressor> z(AllocCompressor(algo));
    if(!z.get())
        return 1;
    z->append(in);
    z->Compressed(true);
    try
    {
        z->Decompress();
    }
    catch(CompressionException& e)
    {
        logerror("decompression failed: %s", e.what());
        return 1;
    }

    if(!SaveFile(outfile.c_str(), *z))
        return 1;

    printf("%s: %u -> %u bytes\n", GetAlgoName(algo), (uint32)in.size(), (uint32)z->size());
    return 0;
}

static int doInfo(const Options& opt)
{
    if(opt.args.size() != 1)
    {
        usage();
        return 2;
    }
    const char *fn = opt.args[0].c_str();
    std::auto_ptr<ICompressor> z;
    ByteBuffer in;
    if(!LoadFile(fn, in))
        return 1;

    uint8 algo = DetectAlgo(in.contents(), in.size());
    if(algo == RLZALGO_NONE)
    {
        printf("'%s': unknown format (%u bytes)\n", PathToFileName(fn), (uint32)in.size());
        return 1;
    }

    z.reset(AllocCompressor(algo));
    if(!z.get())
        return 1;
    z->append(in);
    z->Compressed(true);
    try
    {
        z->Decompress();
    }
    catch(CompressionException& e)
    {
        printf("'%s': %s, %u bytes, damaged (%s)\n", PathToFileName(fn), GetAlgoName(algo), (uint32)in.size(), e.what());
        return 1;
    }

    printf("'%s': %s, %u -> %u bytes (%.2f%%)\n", PathToFileName(fn), GetAlgoName(algo),
        (uint32)in.size(), (uint32)z->size(), ratio(in.size(), z->size()));
    return 0;
}

static int doList(void)
{
    for(uint8 i = RLZALGO_NONE + 1; i < RLZALGO_MAX; ++i)
        printf("  %-8s%s\n", GetAlgoName(i), IsSupported(i) ? "" : " (not compiled in)");
    return 0;
}

int main(int argc, char *argv[])
{
    // we need at least MODE - that makes 2 with exe name
    if(argc < 2)
    {
        usage();
        return 2;
    }

    char mode = 0;
    if(argv[1][0] && !argv[1][1]) // mode may be 1 single char only, otherwise ignore, and error out
        mode = argv[1][0];

    Options opt;
    if(!parseArgv(opt, argc - 2, argv + 2))
        return 2;

    switch(opt.verbosity)
    {
        case 0:  SetLogLevel(RLZLOG_NORMAL); break;
        case 1:  SetLogLevel(RLZLOG_DEBUG); break;
        default: SetLogLevel(RLZLOG_DETAIL);
    }

    switch(mode)
    {
        case 'c': return doCompress(opt);
        case 'd': return doDecompress(opt);
        case 'i': return doInfo(opt);
        case 'l': return doList();
    }

    logerror("Invalid mode!");
    usage();
    return 2;
}
