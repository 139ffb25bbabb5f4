#ifndef RLZ_LZMATCHFINDER_H
#define RLZ_LZMATCHFINDER_H

#include "RLZFormats.h"
#include "LzMatch.h"
#include "LzProperties.h"

#include <vector>

RLZ_NAMESPACE_START

// Hash chained dictionary over an input buffer.
// Positions are indexed strictly in increasing order; searching at some position
// first indexes everything before it, so callers only have to report skipped ranges
// when they use FindMatch() directly.
//
// lookAhead permits matches that overlap their own source (length > distance),
// and above the fastest level defers a match by one byte if a strictly longer one
// starts there.
class LzMatchFinder
{
public:
    LzMatchFinder(const uint8 *data, uint32 size, const LzProperties& lz,
        bool lookAhead = true, RLZLevel level = RLZ_DEFAULT_LEVEL);

    // greedy step with optional one byte deferral. indexes `pos`.
    // returns false if there is no usable match, or if a longer one starts at pos + 1.
    bool TryFindMatch(uint32 pos, LzMatch& match);

    // plain search, `pos` itself is not indexed
    bool FindMatch(uint32 pos, LzMatch& match);

    void AddEntry(uint32 pos);
    void AddEntryRange(uint32 pos, uint32 len);

    // the constraints in effect, window already capped by the level
    const LzProperties& Properties(void) const { return _lz; }

    // whole buffer search. The input is cut into blocks of blockSize bytes that are
    // searched independently by up to `threads` workers (0: one per CPU).
    // The result is the same for any number of threads.
    static LzMatchList FindMatchesParallel(const uint8 *data, uint32 size, const LzProperties& lz,
        bool lookAhead = true, RLZLevel level = RLZ_DEFAULT_LEVEL,
        uint32 threads = 0, uint32 blockSize = RLZ_MATCH_BLOCK_SIZE);

private:
    // restricted finder: indexes from `base`, matches end at `limit` at the latest
    LzMatchFinder(const uint8 *data, uint32 size, const LzProperties& lz,
        bool lookAhead, RLZLevel level, uint32 base, uint32 limit);

    void _Init(void);
    uint32 _Hash(uint32 pos) const;
    void _Insert(uint32 pos);
    void _IndexUpTo(uint32 end);
    bool _Search(uint32 pos, LzMatch& match) const;

    struct BlockJob;
    static void _RunBlocks(const BlockJob *job, uint32 first, uint32 step);
    static void _FindMatchesInBlock(const uint8 *data, uint32 size, const LzProperties& lz,
        bool lookAhead, RLZLevel level, uint32 start, uint32 end, LzMatchList& out);

    const uint8 *_data;
    uint32 _size;
    LzProperties _lz;
    RLZLevel _level;
    bool _lookAhead;
    bool _lazy;
    uint32 _maxChain;
    uint32 _keyLen;
    uint32 _hashBits;
    uint32 _base;
    uint32 _limit;
    uint32 _indexed; // next position to insert

    std::vector<int32> _head;
    std::vector<int32> _prev; // indexed by pos - _base
};

RLZ_NAMESPACE_END

#endif
