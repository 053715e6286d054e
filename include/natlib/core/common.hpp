#pragma once

// -------------------------------------------------------------------------
// 1. PLATFORM DETECTION & SYSTEM HEADERS
// -------------------------------------------------------------------------
#if defined(_WIN32) || defined(_WIN64)
    #define NOMINMAX // avoid std::min/std::max clashes on Windows
    #include <windows.h>
#else
    #include <sys/time.h>
    #include <ctime>
#endif

// -------------------------------------------------------------------------
// 2. STANDARD C++ LIBRARY (commonly used across the project)
// -------------------------------------------------------------------------
// Containers
#include <vector>
#include <string>
#include <utility>    // std::pair
#include <ranges>     // C++20 ranges for convenience
#include <functional> // std::function
#include <any>        // fitness product payload

// Math & Algorithms
#include <cmath>
#include <algorithm>
#include <numeric>    // std::iota, std::accumulate
#include <limits>     // std::numeric_limits

// IO & Strings
#include <format>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <cstdint>
#include <cstddef>

// Randoms
#include <random>
#include <chrono>

#include <memory>     // std::unique_ptr, std::shared_ptr
#include <stdexcept>

// -------------------------------------------------------------------------
// 3. GLOBAL CONSTANTS & MACROS
// -------------------------------------------------------------------------
#define NATLIB_VERSION_MAJOR 1
#define NATLIB_VERSION_MINOR 0

namespace natlib::core {

    inline constexpr double INF = std::numeric_limits<double>::infinity();

    /**
     * Method: get_time_in_seconds
     * Description: monotonic wall clock used by time-based tasks and reports
     */
    double get_time_in_seconds();

} // namespace natlib::core
