#pragma once

#include "shared/core_defines.hpp"
#include <chrono>

namespace RD::Time
{

using Point = std::chrono::high_resolution_clock::time_point;

Point GetTimePoint();

// Returns the number of milliseconds elapsed since Point
f64 GetTimeSince( const Point& point );

// Returns the number of milliseconds between two points
f64 GetElapsedTime( const Point& startPoint, const Point& endPoint );

} // namespace RD::Time
