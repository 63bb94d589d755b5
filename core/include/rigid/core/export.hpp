#pragma once

#if defined(_WIN32) && defined(RIGID_CORE_SHARED)
  #if defined(RIGID_CORE_BUILDING)
    #define RIGID_CORE_API __declspec(dllexport)
  #else
    #define RIGID_CORE_API __declspec(dllimport)
  #endif
#else
  #define RIGID_CORE_API
#endif
