#ifndef WAM_LOG_H
#define WAM_LOG_H

#include <iostream>

// ============================================================================
// Logging - g_verbose is set by the CLI (--verbose)
// ============================================================================

extern bool g_verbose;

#define DEBUG_LOG(x) do { \
    if (g_verbose) { \
        std::cout << x << std::endl; \
    } \
} while(0)

#endif // WAM_LOG_H
