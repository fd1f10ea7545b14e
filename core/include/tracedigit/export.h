#pragma once

/// \file export.h
/// \brief Visibility/export macros for shared library builds.

#ifdef TRACEDIGIT_STATIC
    #define TRACEDIGIT_API
#elif defined(TRACEDIGIT_BUILDING)
    #if defined(_MSC_VER)
        #define TRACEDIGIT_API __declspec(dllexport)
    #elif defined(__GNUC__) || defined(__clang__)
        #define TRACEDIGIT_API __attribute__((visibility("default")))
    #else
        #define TRACEDIGIT_API
    #endif
#else
    #if defined(_MSC_VER)
        #define TRACEDIGIT_API __declspec(dllimport)
    #else
        #define TRACEDIGIT_API
    #endif
#endif
