#pragma once

#include "shared/math_vec.hpp"

namespace RT
{

struct PointLight
{
    PointLight() = default;
    PointLight( const vec3& pos, const vec3& c ) : position( pos ), color( c ) {}

    vec3 position = vec3( 0 );
    vec3 color    = vec3( 1 );
};

} // namespace RT
