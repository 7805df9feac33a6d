#pragma once

#include "shared/math_vec.hpp"

namespace RD
{

class AABB
{
public:
    AABB();
    AABB( const vec3& _min, const vec3& _max );
    ~AABB() = default;

    void Encompass( vec3 point );

    vec3 min;
    vec3 max;
};

} // namespace RD
