#include "RLZInternal.h"
#include "RLZErrors.h"
#include "RLZTests.h"

#include <cstdio>

#ifdef RLZ_NAMESPACE
  using namespace RLZ_NAMESPACE;
#endif

#define DO_TESTRUN(f) \
{ \
    printf("Running: %s\n", #f); \
    int _r; \
    try { _r = (f); } \
    catch(CompressionException& _e) { printf("Unexpected exception: %s\n", _e.what()); _r = -1; } \
    if(_r) { printf("TEST FAILED: Func %s returned %d\n", #f, _r); return 1; } \
}

int main(int argc, char *argv[])
{
    SetLogLevel(argc > 1 ? RLZLOG_DEBUG : RLZLOG_ERROR);

    DO_TESTRUN(TestByteBufferAppend());
    DO_TESTRUN(TestStringToLower());
    DO_TESTRUN(TestExplicitFlush());
    DO_TESTRUN(TestWindowOverlap());
    DO_TESTRUN(TestWindowBadDistance());
    DO_TESTRUN(TestWindowWrap());
    DO_TESTRUN(TestWindowOffsetCopy());
    DO_TESTRUN(TestWindowCopyFrom());
    DO_TESTRUN(TestFlagRoundTrip());
    DO_TESTRUN(TestFlagInts());
    DO_TESTRUN(TestFlagReset());
    DO_TESTRUN(TestFlagPayloadOrder());
    DO_TESTRUN(TestMatchFinderSimple());
    DO_TESTRUN(TestMatchFinderNoOverlap());
    DO_TESTRUN(TestMatchFinderBounds());
    DO_TESTRUN(TestMatchFinderDeterministic());
    DO_TESTRUN(TestMatchFinderEmpty());
    DO_TESTRUN(TestMatchFinderLazy());
    DO_TESTRUN(TestRleMatchFinder());

    DO_TESTRUN(TestLZ10());
    DO_TESTRUN(TestLZ11());
    DO_TESTRUN(TestLZSS());
    DO_TESTRUN(TestYaz0());
    DO_TESTRUN(TestYay0());
    DO_TESTRUN(TestMIO0());
    DO_TESTRUN(TestSMSR00());
    DO_TESTRUN(TestPRS());
    DO_TESTRUN(TestCNX2());
    DO_TESTRUN(TestRLE30());
#ifdef RLZ_SUPPORT_ZLIB
    DO_TESTRUN(TestDeflate());
    DO_TESTRUN(TestZlib());
    DO_TESTRUN(TestGzip());
#endif
#ifdef RLZ_SUPPORT_BROTLI
    DO_TESTRUN(TestBrotli());
#endif

    DO_TESTRUN(TestKnownStreams());
    DO_TESTRUN(TestNoLookAhead());
    DO_TESTRUN(TestEmptyInput());
    DO_TESTRUN(TestTruncated());
    DO_TESTRUN(TestSizeMismatch());
    DO_TESTRUN(TestBadHeader());
    DO_TESTRUN(TestUnchangedOnError());
    DO_TESTRUN(TestDetect());
    DO_TESTRUN(TestAlgoNames());
    DO_TESTRUN(TestLargeInput());

    printf("All tests successful!\n");

    return 0;
}
