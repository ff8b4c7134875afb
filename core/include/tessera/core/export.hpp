#pragma once

#if defined(_WIN32) && defined(TESSERA_CORE_SHARED)
  #if defined(TESSERA_CORE_BUILDING)
    #define TESSERA_CORE_API __declspec(dllexport)
  #else
    #define TESSERA_CORE_API __declspec(dllimport)
  #endif
#else
  #define TESSERA_CORE_API
#endif
