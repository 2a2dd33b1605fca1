#pragma once

#include <cstdio>

#ifndef RAILMAP_ENABLE_LOGGING
#define RAILMAP_ENABLE_LOGGING 0
#endif

#if RAILMAP_ENABLE_LOGGING
#define RAILMAP_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[railmap] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define RAILMAP_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[railmap][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define RAILMAP_LOG_DEBUG(...) do { } while (0)
#define RAILMAP_LOG_WARN(...) do { } while (0)
#endif
