#pragma once

// -------------------------------------------------------------------------
// 1. PLATFORM DETECTION & SYSTEM HEADERS
// -------------------------------------------------------------------------
#if defined(_WIN32) || defined(_WIN64)
    #define NOMINMAX // avoid clashes with std::min/std::max on Windows
    #include <windows.h>
#else
    #include <sys/time.h>
    #include <ctime>
#endif

// -------------------------------------------------------------------------
// 2. STANDARD C++ LIBRARY (Commonly used across the project)
// -------------------------------------------------------------------------
// Containers
#include <vector>
#include <string>
#include <map>
#include <optional>
#include <variant>
#include <set>
#include <utility> // std::pair
#include <ranges> // C++20 ranges for convenience
#include <functional> // std::function

// Math & Algorithms
#include <cmath>
#include <algorithm>
#include <numeric> // std::iota, std::accumulate, std::inner_product
#include <limits>  // std::numeric_limits

// IO & Strings
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <cstdint>
#include <stdexcept>
#include <exception>

// Concurrency
#include <atomic>
#include <mutex>
#include <chrono>

#include <memory> // std::shared_ptr, std::unique_ptr

// -------------------------------------------------------------------------
// 3. GLOBAL CONSTANTS & MACROS
// -------------------------------------------------------------------------
#ifndef INFINITY
    #define INFINITY std::numeric_limits<double>::infinity()
#endif

// Largest aggregated violation still considered feasible
#define OPTIMLIB_FEASIBILITY_TOL 1e-8
