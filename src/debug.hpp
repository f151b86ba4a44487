#pragma once

#include <iostream>

// Compile with -DGRIDTSP_DEBUG=1 (the GRIDTSP_DEBUG_LOG CMake option) to trace the
// algorithms on stderr. Release builds print nothing from the core.
#if GRIDTSP_DEBUG
    #define DBG(x) do { std::cerr << "[gridtsp] " << x << std::endl; } while (0)
    #define DBG_NOENDL(x) do { std::cerr << x; } while (0)
#else
    #define DBG(x) do {} while (0)
    #define DBG_NOENDL(x) do {} while (0)
#endif
