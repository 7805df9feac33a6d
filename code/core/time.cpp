#include "core/time.hpp"

using namespace std::chrono;
using Clock = high_resolution_clock;

namespace RD::Time
{

Point GetTimePoint() { return Clock::now(); }

f64 GetTimeSince( const Point& point ) { return GetElapsedTime( point, Clock::now() ); }

f64 GetElapsedTime( const Point& startPoint, const Point& endPoint )
{
    return duration_cast<nanoseconds>( endPoint - startPoint ).count() / 1e6;
}

} // namespace RD::Time
