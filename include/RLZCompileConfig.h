#ifndef RLZ_COMPILE_CONFIG
#define RLZ_COMPILE_CONFIG

// choose a namespace name, or comment out this define to disable namespacing (not recommended)
#define RLZ_NAMESPACE rlz

// if not configuring via CMake or setting these externally,
// use these to enable the library-backed algorithms.
// the built-in game formats are always available.
//#define RLZ_SUPPORT_ZLIB
//#define RLZ_SUPPORT_BROTLI


// ------ End of config ------


#ifdef RLZ_NAMESPACE
#  define RLZ_NAMESPACE_START namespace RLZ_NAMESPACE {
#  define RLZ_NAMESPACE_END }
#  define RLZ_NAMESPACE_IMPL RLZ_NAMESPACE::
   namespace RLZ_NAMESPACE {} // predeclare namespace to make compilers happy
#else
#  define RLZ_NAMESPACE_START
#  define RLZ_NAMESPACE_END
#  define RLZ_NAMESPACE_IMPL
#endif


#endif
