/**
 * @file export.hpp
 * @brief Symbol visibility macros for freeprobe_core shared library.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#if defined(FREEPROBE_STATIC)
    #define FREEPROBE_CORE_API
#elif defined(_WIN32) || defined(_WIN64)
    #if defined(FREEPROBE_CORE_BUILD)
        #define FREEPROBE_CORE_API __declspec(dllexport)
    #else
        #define FREEPROBE_CORE_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(FREEPROBE_CORE_BUILD)
        #define FREEPROBE_CORE_API __attribute__((visibility("default")))
    #else
        #define FREEPROBE_CORE_API
    #endif
#else
    #define FREEPROBE_CORE_API
#endif
