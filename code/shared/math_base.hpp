#pragma once

#include "shared/core_defines.hpp"
#include <algorithm>
#include <cfloat>
#include <cmath>

#define PI 3.14159265358979323846f

inline constexpr f32 Saturate( const f32 x ) { return std::clamp( x, 0.0f, 1.0f ); }

inline constexpr f32 DegToRad( const f32 x ) { return x * ( PI / 180.0f ); }

inline f32 Abs( const f32 x ) { return std::abs( x ); }

template <typename T>
constexpr T Min( const T& a, const T& b )
{
    return std::min( a, b );
}

template <typename T>
constexpr T Max( const T& a, const T& b )
{
    return std::max( a, b );
}

template <typename T>
constexpr T Clamp( const T& a, const T& lower, const T& upper )
{
    return std::clamp( a, lower, upper );
}

// Wraps an angle in degrees into [-180, 180]
inline f32 WrapDegrees( f32 degrees )
{
    f32 wrapped = std::fmod( degrees, 360.0f );
    if ( wrapped > 180.0f )
    {
        wrapped -= 360.0f;
    }
    else if ( wrapped < -180.0f )
    {
        wrapped += 360.0f;
    }

    return wrapped;
}
