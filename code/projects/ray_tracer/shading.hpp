#pragma once

#include "rt_scene.hpp"

namespace RT
{

// Color seen along the ray that produced hit. Reflective and refractive materials recurse through
// the scene, returning black once depth exceeds scene.settings.maxDepth
vec3 ResolveColor( const Scene& scene, const RayHit& hit, i32 depth = 0 );

vec3 DiffuseLighting( const Scene& scene, const RayHit& hit );

vec3 ResolveReflection( const Scene& scene, const RayHit& hit, i32 depth );

// Blend of the transmitted and reflected colors, weighted by the Fresnel reflectance. Falls back to
// pure reflection under total internal reflection
vec3 ResolveRefraction( const Scene& scene, const RayHit& hit, i32 depth );

// Unpolarized reflectance at an interface going from a medium with index etaI into one with index etaT.
// cosI is the cosine of the angle between the incoming direction (pointing away from the surface) and the normal
f32 Fresnel( f32 etaI, f32 etaT, f32 cosI );

} // namespace RT
