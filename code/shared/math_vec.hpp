#pragma once

#define GLM_FORCE_RADIANS
#define GLM_FORCE_XYZW_ONLY
#include "glm/common.hpp"
#include "glm/geometric.hpp"
#include "glm/vec2.hpp"
#include "glm/vec3.hpp"
#include "shared/math_base.hpp"

using vec2 = glm::vec2;
using vec3 = glm::vec3;

using ivec2 = glm::vec<2, i32>;

inline f32 Length( const vec3& v ) { return glm::length( v ); }

inline f32 LengthSquared( const vec3& v ) { return glm::dot( v, v ); }

inline f32 Dot( const vec3& a, const vec3& b ) { return glm::dot( a, b ); }

inline vec3 Cross( const vec3& a, const vec3& b ) { return glm::cross( a, b ); }

// Undefined for zero length vectors, use NormalizeSafe when that can happen
inline vec3 Normalize( const vec3& v ) { return glm::normalize( v ); }

// Zero length vectors are returned unchanged
inline vec3 NormalizeSafe( const vec3& v )
{
    f32 lenSq = LengthSquared( v );
    if ( lenSq == 0 )
    {
        return v;
    }

    return v / std::sqrt( lenSq );
}

// reflects the incident direction I about the normal N
inline vec3 Reflect( const vec3& I, const vec3& N ) { return I - 2.0f * Dot( I, N ) * N; }

inline vec3 Min( const vec3& a, const vec3& b ) { return glm::min( a, b ); }
inline vec3 Max( const vec3& a, const vec3& b ) { return glm::max( a, b ); }
