#pragma once

/**
 * Symbol visibility for libmping.
 *
 * The core library is built with -fvisibility=hidden and
 * MPING_BUILDING_LIB defined; only declarations marked MPING_API
 * are exported. Consumers (the mping executable, tests) see the
 * macro expand to nothing.
 */
#if defined(__GNUC__) && __GNUC__ >= 4
  #ifdef MPING_BUILDING_LIB
    #define MPING_API   __attribute__((visibility("default")))
  #else
    #define MPING_API
  #endif
  #define MPING_LOCAL __attribute__((visibility("hidden")))
#else
  #define MPING_API
  #define MPING_LOCAL
#endif
