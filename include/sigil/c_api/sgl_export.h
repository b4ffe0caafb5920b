#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(SIGIL_ENGINE_EXPORTS)
    #define SGL_API __declspec(dllexport)
  #elif defined(SIGIL_ENGINE_SHARED)
    #define SGL_API __declspec(dllimport)
  #else
    #define SGL_API
  #endif
#elif defined(__GNUC__) && __GNUC__ >= 4
  #define SGL_API __attribute__((visibility("default")))
#else
  #define SGL_API
#endif
