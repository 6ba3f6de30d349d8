#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(NGIN_JNI_STATIC)
    #define NGIN_JNI_API
  #else
    #if defined(NGIN_JNI_EXPORTS)
      #define NGIN_JNI_API __declspec(dllexport)
    #else
      #define NGIN_JNI_API __declspec(dllimport)
    #endif
  #endif
#else
  #define NGIN_JNI_API
#endif
