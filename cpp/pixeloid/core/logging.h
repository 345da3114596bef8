#pragma once

#include <cstdio>

#ifndef PIXELOID_ENABLE_LOGGING
#define PIXELOID_ENABLE_LOGGING 0
#endif

#if PIXELOID_ENABLE_LOGGING
#define PIXELOID_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[pixeloid] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define PIXELOID_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[pixeloid][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define PIXELOID_LOG_DEBUG(...) do { } while (0)
#define PIXELOID_LOG_WARN(...) do { } while (0)
#endif
