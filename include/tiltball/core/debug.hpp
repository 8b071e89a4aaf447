#pragma once

#include <iostream>

// Set to 1 (or configure with -DTILTBALL_DEBUG_LOG=ON) to enable debug output
#ifndef TILTBALL_ENABLE_DEBUG
#define TILTBALL_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef TILTBALL_DEBUG_LEVEL
#define TILTBALL_DEBUG_LEVEL DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (TILTBALL_ENABLE_DEBUG && level <= TILTBALL_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)
