#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - PERSPEC_BUILD_SHARED: when building Perspec as shared library
 *   - PERSPEC_USE_SHARED: when using Perspec as shared library
 *   - PERSPEC_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(PERSPEC_BUILD_SHARED)
        #define PERSPEC_API __declspec(dllexport)
    #elif defined(PERSPEC_USE_SHARED)
        #define PERSPEC_API __declspec(dllimport)
    #else
        #define PERSPEC_API
    #endif
    #define PERSPEC_CALL __cdecl
#else
    #if defined(PERSPEC_BUILD_SHARED)
        #define PERSPEC_API __attribute__((visibility("default")))
    #else
        #define PERSPEC_API
    #endif
    #define PERSPEC_CALL
#endif
