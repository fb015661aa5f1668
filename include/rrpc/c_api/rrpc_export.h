#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(RRPC_EXPORTS)
    #define RRPC_API __declspec(dllexport)
  #elif defined(RRPC_SHARED)
    #define RRPC_API __declspec(dllimport)
  #else
    #define RRPC_API
  #endif
#elif defined(__GNUC__) && __GNUC__ >= 4
  #define RRPC_API __attribute__((visibility("default")))
#else
  #define RRPC_API
#endif
