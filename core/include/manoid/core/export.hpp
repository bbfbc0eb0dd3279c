#pragma once

#if defined(_WIN32) && defined(MANOID_CORE_SHARED)
  #if defined(MANOID_CORE_BUILDING)
    #define MANOID_CORE_API __declspec(dllexport)
  #else
    #define MANOID_CORE_API __declspec(dllimport)
  #endif
#else
  #define MANOID_CORE_API
#endif
