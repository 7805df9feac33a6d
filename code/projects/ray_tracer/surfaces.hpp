#pragma once

#include "material.hpp"
#include "ray.hpp"
#include <memory>

namespace RT
{

struct Surface
{
    Surface() = default;
    virtual ~Surface() = default;

    virtual const Material* GetMaterial() const = 0;

    // Opaque surfaces only report hits in front of the ray (t > 0). Refractive surfaces also report hits
    // behind the ray and on back faces, so rays travelling inside a refractive volume can find their way out
    virtual bool Intersect( const Ray& ray, RayHit* hit ) const = 0;
};

// infinite plane, only visible from the side its normal points to unless refractive
struct Plane : public Surface
{
    Plane() = default;
    Plane( const vec3& center, const vec3& normal, std::shared_ptr<Material> material );

    const Material* GetMaterial() const override;
    bool Intersect( const Ray& ray, RayHit* hit ) const override;

    vec3 center = vec3( 0 );
    vec3 normal = vec3( 0, 1, 0 );
    std::shared_ptr<Material> material;
};

struct Sphere : public Surface
{
    Sphere() = default;
    Sphere( const vec3& center, f32 radius, std::shared_ptr<Material> material );

    const Material* GetMaterial() const override;
    bool Intersect( const Ray& ray, RayHit* hit ) const override;

    vec3 center = vec3( 0 );
    f32 radius  = 1;
    std::shared_ptr<Material> material;
};

struct Triangle : public Surface
{
    Triangle() = default;
    // flat shaded
    Triangle( const vec3& v0, const vec3& v1, const vec3& v2, std::shared_ptr<Material> material );
    // smooth shaded, the normals are interpolated across the face
    Triangle( const vec3& v0, const vec3& v1, const vec3& v2, const vec3& n0, const vec3& n1, const vec3& n2,
        std::shared_ptr<Material> material );

    const Material* GetMaterial() const override;
    bool Intersect( const Ray& ray, RayHit* hit ) const override;

    vec3 v0, v1, v2;
    vec3 n0, n1, n2;
    bool hasVertexNormals = false;
    std::shared_ptr<Material> material;
};

} // namespace RT
