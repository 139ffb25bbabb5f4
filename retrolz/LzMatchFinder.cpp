#include "RLZInternal.h"
#include "LzMatchFinder.h"

#include <algorithm>
#include <thread>
#include <system_error>

RLZ_NAMESPACE_START

struct LzMatchFinder::BlockJob
{
    const uint8 *data;
    uint32 size;
    const LzProperties *lz;
    bool lookAhead;
    RLZLevel level;
    uint32 blockSize;
    std::vector<LzMatchList> *results; // one slot per block
};

static uint32 _ChainLimit(RLZLevel level)
{
    switch(level)
    {
        case RLZLEVEL_NONE:     return 0;
        case RLZLEVEL_FASTEST:  return 16;
        case RLZLEVEL_OPTIMAL:  return 256;
        default:                return 0xFFFFFFFF;
    }
}

LzMatchFinder::LzMatchFinder(const uint8 *data, uint32 size, const LzProperties& lz,
                             bool lookAhead /* = true */, RLZLevel level /* = RLZ_DEFAULT_LEVEL */)
: _data(data), _size(size), _lz(lz.SetLevel(level)), _level(level), _lookAhead(lookAhead),
  _base(0), _limit(size)
{
    _Init();
}

LzMatchFinder::LzMatchFinder(const uint8 *data, uint32 size, const LzProperties& lz,
                             bool lookAhead, RLZLevel level, uint32 base, uint32 limit)
: _data(data), _size(size), _lz(lz.SetLevel(level)), _level(level), _lookAhead(lookAhead),
  _base(base), _limit(limit)
{
    _Init();
}

void LzMatchFinder::_Init(void)
{
    ASSERT(_base <= _limit && _limit <= _size);

    _lazy = _lookAhead && _level > RLZLEVEL_FASTEST;
    _maxChain = _ChainLimit(_level);
    _keyLen = std::min<uint32>(_lz.MinLength(), 4);
    _indexed = _base;

    uint32 range = _limit - _base;
    _hashBits = 8;
    while(_hashBits < 16 && (1u << _hashBits) < range)
        ++_hashBits;

    if(_level == RLZLEVEL_NONE)
        return;

    _head.resize(size_t(1) << _hashBits, -1);
    _prev.resize(range, -1);
}

inline uint32 LzMatchFinder::_Hash(uint32 pos) const
{
    uint32 v = 0;
    for(uint32 i = 0; i < _keyLen; ++i)
        v = (v << 8) | _data[pos + i];
    return (v * 2654435761u) >> (32 - _hashBits);
}

void LzMatchFinder::_Insert(uint32 pos)
{
    if(pos + _keyLen <= _size)
    {
        uint32 h = _Hash(pos);
        _prev[pos - _base] = _head[h];
        _head[h] = int32(pos);
    }
    _indexed = pos + 1;
}

void LzMatchFinder::_IndexUpTo(uint32 end)
{
    if(_level == RLZLEVEL_NONE)
        return;
    if(end > _limit)
        end = _limit;
    while(_indexed < end)
        _Insert(_indexed);
}

bool LzMatchFinder::_Search(uint32 pos, LzMatch& match) const
{
    if(_level == RLZLEVEL_NONE || pos >= _limit)
        return false;

    const uint32 minLen = _lz.MinLength();
    const uint32 maxLen = std::min(_lz.MaxLength(), _limit - pos);
    if(maxLen < minLen)
        return false;

    const uint32 window = _lz.WindowSize();
    const uint8 *cur = _data + pos;
    uint32 bestLen = 0, bestDist = 0;
    uint32 chain = _maxChain;

    // newest first, so on equal length the nearest candidate wins
    int32 cand = _head[_Hash(pos)];
    while(cand >= 0 && chain)
    {
        --chain;
        const uint32 c = uint32(cand);
        cand = _prev[c - _base];
        if(c >= pos)
            continue;

        const uint32 dist = pos - c;
        if(dist > window)
            break;

        const uint32 cap = _lookAhead ? maxLen : std::min(maxLen, dist);
        const uint8 *src = _data + c;
        if(cap <= bestLen || src[bestLen] != cur[bestLen])
            continue;

        uint32 len = 0;
        while(len < cap && src[len] == cur[len])
            ++len;

        if(len > bestLen)
        {
            bestLen = len;
            bestDist = dist;
            if(bestLen == maxLen)
                break;
        }
    }

    if(bestLen < minLen)
        return false;

    match = LzMatch(pos, bestDist, bestLen);
    return true;
}

bool LzMatchFinder::TryFindMatch(uint32 pos, LzMatch& match)
{
    _IndexUpTo(pos);
    LzMatch m;
    bool found = _Search(pos, m);
    _IndexUpTo(pos + 1);
    if(!found)
        return false;

    if(_lazy && m.length < _lz.MaxLength())
    {
        LzMatch next;
        if(_Search(pos + 1, next) && next.length > m.length)
            return false;
    }

    match = m;
    return true;
}

bool LzMatchFinder::FindMatch(uint32 pos, LzMatch& match)
{
    _IndexUpTo(pos);
    return _Search(pos, match);
}

void LzMatchFinder::AddEntry(uint32 pos)
{
    _IndexUpTo(pos + 1);
}

void LzMatchFinder::AddEntryRange(uint32 pos, uint32 len)
{
    _IndexUpTo(pos + len);
}

void LzMatchFinder::_FindMatchesInBlock(const uint8 *data, uint32 size, const LzProperties& lz,
    bool lookAhead, RLZLevel level, uint32 start, uint32 end, LzMatchList& out)
{
    // the block may reach back one window into the data before it
    const uint32 window = lz.SetLevel(level).WindowSize();
    const uint32 base = start > window ? start - window : 0;

    LzMatchFinder finder(data, size, lz, lookAhead, level, base, end);
    LzMatch m;
    uint32 pos = start;
    while(pos < end)
    {
        if(finder.TryFindMatch(pos, m))
        {
            out.push_back(m);
            pos += m.length;
        }
        else
            ++pos;
    }
}

void LzMatchFinder::_RunBlocks(const BlockJob *job, uint32 first, uint32 step)
{
    std::vector<LzMatchList>& results = *job->results;
    const uint32 blocks = (uint32)results.size();
    for(uint32 b = first; b < blocks; b += step)
    {
        uint32 start = b * job->blockSize;
        uint32 end = std::min(job->size, start + job->blockSize);
        _FindMatchesInBlock(job->data, job->size, *job->lz, job->lookAhead, job->level, start, end, results[b]);
    }
}

LzMatchList LzMatchFinder::FindMatchesParallel(const uint8 *data, uint32 size, const LzProperties& lz,
    bool lookAhead /* = true */, RLZLevel level /* = RLZ_DEFAULT_LEVEL */,
    uint32 threads /* = 0 */, uint32 blockSize /* = RLZ_MATCH_BLOCK_SIZE */)
{
    LzMatchList result;
    if(level == RLZLEVEL_NONE || !size)
        return result;

    ASSERT(blockSize > 0);
    const uint32 blocks = (uint32)((uint64(size) + blockSize - 1) / blockSize);

    uint32 workers = threads ? threads : std::thread::hardware_concurrency();
    if(!workers)
        workers = 1;
    workers = std::min(workers, blocks);

    std::vector<LzMatchList> perBlock(blocks);
    BlockJob job = { data, size, &lz, lookAhead, level, blockSize, &perBlock };

    // worker w takes blocks w, w + workers, ...; the calling thread is worker 0
    std::vector<std::thread> pool;
    pool.reserve(workers - 1);
    uint32 spawned = 1;
    try
    {
        for( ; spawned < workers; ++spawned)
            pool.push_back(std::thread(&LzMatchFinder::_RunBlocks, &job, spawned, workers));
    }
    catch(std::system_error& e)
    {
        logdebug("FindMatchesParallel: could only start %u of %u workers (%s)", spawned, workers, e.what());
    }

    _RunBlocks(&job, 0, workers);
    // shares whose thread did not start are done here
    for(uint32 w = spawned; w < workers; ++w)
        _RunBlocks(&job, w, workers);

    for(size_t i = 0; i < pool.size(); ++i)
        pool[i].join();

    // concatenate in block order, gluing matches that were cut at a block border
    const uint32 maxLen = lz.MaxLength();
    size_t total = 0;
    for(uint32 b = 0; b < blocks; ++b)
        total += perBlock[b].size();
    result.swap(perBlock[0]);
    result.reserve(total);

    for(uint32 b = 1; b < blocks; ++b)
    {
        const LzMatchList& bl = perBlock[b];
        size_t first = 0;
        if(!result.empty() && !bl.empty())
        {
            LzMatch& last = result.back();
            const LzMatch& next = bl[0];
            uint32 merged = last.length + next.length;
            if(last.distance == next.distance && last.End() == next.offset
                && merged <= maxLen && (lookAhead || merged <= next.distance))
            {
                last.length = merged;
                first = 1;
            }
        }
        result.insert(result.end(), bl.begin() + first, bl.end());
    }

    logdetail("FindMatchesParallel: %u bytes, %u blocks, %u workers -> %u matches",
        size, blocks, workers, (uint32)result.size());
    return result;
}

RLZ_NAMESPACE_END
