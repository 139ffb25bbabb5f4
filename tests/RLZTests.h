#ifndef TESTS_RLZ_H
#define TESTS_RLZ_H

// window, flag codec, match finders
int TestByteBufferAppend();
int TestStringToLower();
int TestExplicitFlush();
int TestWindowOverlap();
int TestWindowBadDistance();
int TestWindowWrap();
int TestWindowOffsetCopy();
int TestWindowCopyFrom();
int TestFlagRoundTrip();
int TestFlagInts();
int TestFlagReset();
int TestFlagPayloadOrder();
int TestMatchFinderSimple();
int TestMatchFinderNoOverlap();
int TestMatchFinderBounds();
int TestMatchFinderDeterministic();
int TestMatchFinderEmpty();
int TestMatchFinderLazy();
int TestRleMatchFinder();

// containers
int TestLZ10();
int TestLZ11();
int TestLZSS();
int TestYaz0();
int TestYay0();
int TestMIO0();
int TestSMSR00();
int TestPRS();
int TestCNX2();
int TestRLE30();
int TestDeflate();
int TestZlib();
int TestGzip();
int TestBrotli();
int TestNoLookAhead();
int TestEmptyInput();
int TestTruncated();
int TestSizeMismatch();
int TestBadHeader();
int TestUnchangedOnError();
int TestKnownStreams();
int TestDetect();
int TestAlgoNames();
int TestLargeInput();

#endif
