#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(WITNESSCHAIN_EXPORTS)
    #define WC_API __declspec(dllexport)
  #elif defined(WITNESSCHAIN_SHARED)
    #define WC_API __declspec(dllimport)
  #else
    #define WC_API
  #endif
#elif defined(__GNUC__) && __GNUC__ >= 4
  #define WC_API __attribute__((visibility("default")))
#else
  #define WC_API
#endif
