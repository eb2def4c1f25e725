/**
 * @file export.hpp
 * @brief Symbol visibility macros for freeprobe_utils shared library.
 *
 * This header provides the FREEPROBE_UTILS_API macro for cross-platform
 * shared library symbol export/import.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#if defined(FREEPROBE_STATIC)
    // Static build - nothing to export
    #define FREEPROBE_UTILS_API
#elif defined(_WIN32) || defined(_WIN64)
    #if defined(FREEPROBE_UTILS_BUILD)
        #define FREEPROBE_UTILS_API __declspec(dllexport)
    #else
        #define FREEPROBE_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(FREEPROBE_UTILS_BUILD)
        #define FREEPROBE_UTILS_API __attribute__((visibility("default")))
    #else
        #define FREEPROBE_UTILS_API
    #endif
#else
    #define FREEPROBE_UTILS_API
#endif
