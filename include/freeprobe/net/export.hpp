/**
 * @file export.hpp
 * @brief Symbol visibility macros for freeprobe_net shared library.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#if defined(FREEPROBE_STATIC)
    #define FREEPROBE_NET_API
#elif defined(_WIN32) || defined(_WIN64)
    #if defined(FREEPROBE_NET_BUILD)
        #define FREEPROBE_NET_API __declspec(dllexport)
    #else
        #define FREEPROBE_NET_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(FREEPROBE_NET_BUILD)
        #define FREEPROBE_NET_API __attribute__((visibility("default")))
    #else
        #define FREEPROBE_NET_API
    #endif
#else
    #define FREEPROBE_NET_API
#endif
