#pragma once

#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef POOLSHOT_ENABLE_DEBUG
#define POOLSHOT_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef POOLSHOT_DEBUG_LEVEL
#define POOLSHOT_DEBUG_LEVEL DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (POOLSHOT_ENABLE_DEBUG && (level) <= POOLSHOT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)
