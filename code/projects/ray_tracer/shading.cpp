#include "shading.hpp"
#include "shared/assert.hpp"
#include <cmath>
#include <utility>

namespace RT
{

vec3 ResolveColor( const Scene& scene, const RayHit& hit, i32 depth )
{
    RD_DBG_ASSERT( hit.material );
    switch ( hit.material->type )
    {
    case MaterialType::DIFFUSE: return DiffuseLighting( scene, hit );
    case MaterialType::REFLECTIVE: return ResolveReflection( scene, hit, depth );
    case MaterialType::REFRACTIVE: return ResolveRefraction( scene, hit, depth );
    default: RD_ASSERT( false, "Unknown material type %d", static_cast<i32>( hit.material->type ) ); return vec3( 0 );
    }
}

vec3 DiffuseLighting( const Scene& scene, const RayHit& hit )
{
    const vec3 shadedPos = hit.Offset( hit.normal, RAY_BIAS ).position;
    vec3 color( 0 );
    for ( const PointLight& light : scene.lights )
    {
        vec3 L    = NormalizeSafe( light.position - shadedPos );
        f32 NdotL = Dot( hit.normal, L );
        if ( NdotL <= 0 || !scene.LineOfSight( shadedPos, light.position ) )
        {
            continue;
        }

        color += hit.material->color * light.color * NdotL;
    }

    return color;
}

vec3 ResolveReflection( const Scene& scene, const RayHit& hit, i32 depth )
{
    if ( depth > scene.settings.maxDepth )
    {
        return vec3( 0 );
    }

    Ray reflectedRay( hit.Offset( hit.normal, RAY_BIAS ).position, NormalizeSafe( Reflect( hit.incident, hit.normal ) ) );
    RayHit nextHit;
    if ( !scene.ClosestHit( reflectedRay, &nextHit ) )
    {
        return vec3( 0 );
    }

    return ResolveColor( scene, nextHit, depth + 1 );
}

vec3 ResolveRefraction( const Scene& scene, const RayHit& hit, i32 depth )
{
    if ( depth > scene.settings.maxDepth )
    {
        return vec3( 0 );
    }

    const vec3 I = NormalizeSafe( hit.incident );
    vec3 N       = hit.normal;
    f32 etaI     = 1;
    f32 etaT     = hit.material->refractiveIndex;
    if ( Dot( N, I ) >= 0 )
    {
        // leaving the medium
        N = -N;
        std::swap( etaI, etaT );
    }

    // N now faces the side the ray arrived from
    const RayHit facingHit( hit.position, N, I, hit.material );
    const f32 eta  = etaI / etaT;
    const f32 cosI = Dot( N, -I );
    const f32 k    = 1 - eta * eta * ( 1 - cosI * cosI );
    if ( k < 0 )
    {
        return ResolveReflection( scene, facingHit, depth + 1 );
    }

    vec3 T = NormalizeSafe( eta * I + ( eta * cosI - std::sqrt( k ) ) * N );
    Ray refractedRay( hit.Offset( N, -RAY_BIAS ).position, T );
    vec3 refractedColor( 0 );
    RayHit nextHit;
    if ( scene.ClosestHit( refractedRay, &nextHit ) )
    {
        refractedColor = ResolveColor( scene, nextHit, depth + 1 );
    }

    vec3 reflectedColor = ResolveReflection( scene, facingHit, depth + 1 );
    f32 FR              = Fresnel( etaI, etaT, cosI );

    return ( 1 - FR ) * refractedColor + FR * reflectedColor;
}

f32 Fresnel( f32 etaI, f32 etaT, f32 cosI )
{
    cosI     = Clamp( cosI, -1.0f, 1.0f );
    f32 sinI = std::sqrt( Max( 0.0f, 1 - cosI * cosI ) );
    f32 sinT = etaI / etaT * sinI;
    if ( sinT >= 1 )
    {
        return 1;
    }

    f32 cosT           = std::sqrt( Max( 0.0f, 1 - sinT * sinT ) );
    cosI               = std::abs( cosI );
    f32 rParallel      = ( etaT * cosI - etaI * cosT ) / ( etaT * cosI + etaI * cosT );
    f32 rPerpendicular = ( etaI * cosI - etaT * cosT ) / ( etaI * cosI + etaT * cosT );

    return ( rParallel * rParallel + rPerpendicular * rPerpendicular ) / 2;
}

} // namespace RT
