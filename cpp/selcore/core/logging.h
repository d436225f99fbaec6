#pragma once

#include <cstdio>

#ifndef SELCORE_ENABLE_LOGGING
#define SELCORE_ENABLE_LOGGING 0
#endif

#if SELCORE_ENABLE_LOGGING
#define SELCORE_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[selcore] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define SELCORE_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[selcore][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define SELCORE_LOG_DEBUG(...) do { } while (0)
#define SELCORE_LOG_WARN(...) do { } while (0)
#endif
