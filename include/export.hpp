#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(PTG_BUILD)
    #define PTG_API __declspec(dllexport)
  #else
    #define PTG_API __declspec(dllimport)
  #endif
#else
  #define PTG_API __attribute__((visibility("default")))
#endif
