#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(PHIVAULT_EXPORTS)
    #define PV_API __declspec(dllexport)
  #elif defined(PHIVAULT_SHARED)
    #define PV_API __declspec(dllimport)
  #else
    #define PV_API
  #endif
#elif defined(__GNUC__) && __GNUC__ >= 4
  #define PV_API __attribute__((visibility("default")))
#else
  #define PV_API
#endif
