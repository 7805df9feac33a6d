#pragma once

#include "shared/math_vec.hpp"

namespace RT
{

// offset used to step hit points off of the surface they lie on, so follow up rays don't
// rediscover that surface due to floating point error
constexpr f32 RAY_BIAS = 1e-4f;

struct Ray
{
    Ray() = default;
    Ray( const vec3& o, const vec3& dir ) : origin( o ), direction( dir ) {}

    vec3 Evaluate( f32 t ) const { return origin + t * direction; }

    vec3 origin;
    vec3 direction;
};

struct Material;

struct RayHit
{
    RayHit() = default;
    RayHit( const vec3& pos, const vec3& n, const vec3& inc, const Material* mat ) :
        position( pos ), normal( n ), incident( inc ), material( mat )
    {
    }

    // hits are never modified after creation, this returns a copy moved amount along dir
    RayHit Offset( const vec3& dir, f32 amount ) const
    {
        RayHit copy    = *this;
        copy.position += amount * dir;
        return copy;
    }

    vec3 position;
    vec3 normal;
    vec3 incident;
    const Material* material = nullptr;
};

// Distance used to rank hits along a ray. The hit is nudged back along its incident direction first so
// a surface grazed at the ray origin does not win. Returns false for hits that are not in front of the ray
inline bool BiasedHitDistanceSquared( const Ray& ray, const RayHit& hit, f32& distSq )
{
    vec3 toHit = ( hit.position - RAY_BIAS * hit.incident ) - ray.origin;
    if ( Dot( toHit, ray.direction ) <= 0 )
    {
        return false;
    }

    distSq = LengthSquared( toHit );
    return true;
}

} // namespace RT
