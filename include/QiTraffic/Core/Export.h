#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - QITRAFFIC_BUILD_SHARED: when building QiTraffic as shared library
 *   - QITRAFFIC_USE_SHARED: when using QiTraffic as shared library
 *   - QITRAFFIC_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(QITRAFFIC_BUILD_SHARED)
        #define QITRAFFIC_API __declspec(dllexport)
    #elif defined(QITRAFFIC_USE_SHARED)
        #define QITRAFFIC_API __declspec(dllimport)
    #else
        #define QITRAFFIC_API
    #endif
#else
    #if defined(QITRAFFIC_BUILD_SHARED)
        #define QITRAFFIC_API __attribute__((visibility("default")))
    #else
        #define QITRAFFIC_API
    #endif
#endif
