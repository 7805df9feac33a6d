#include "core/bounding_box.hpp"

namespace RD
{

AABB::AABB() : min( FLT_MAX ), max( -FLT_MAX ) {}

AABB::AABB( const vec3& _min, const vec3& _max ) : min( _min ), max( _max ) {}

void AABB::Encompass( vec3 point )
{
    min = Min( min, point );
    max = Max( max, point );
}

} // namespace RD
