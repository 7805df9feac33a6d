#include "surfaces.hpp"
#include "intersection_tests.hpp"
#include "shared/assert.hpp"

namespace RT
{

Plane::Plane( const vec3& inCenter, const vec3& inNormal, std::shared_ptr<Material> inMaterial ) :
    center( inCenter ), normal( NormalizeSafe( inNormal ) ), material( inMaterial )
{
    RD_ASSERT( material, "Plane needs a material" );
}

const Material* Plane::GetMaterial() const { return material.get(); }

bool Plane::Intersect( const Ray& ray, RayHit* hit ) const
{
    const bool refractive = material->IsRefractive();
    if ( Dot( normal, ray.direction ) >= 0 && !refractive )
    {
        return false;
    }

    f32 t;
    if ( !intersect::RayPlane( ray.origin, ray.direction, normal, center, t ) )
    {
        return false;
    }
    if ( t <= 0 && !refractive )
    {
        return false;
    }

    *hit = RayHit( ray.Evaluate( t ), normal, ray.direction, material.get() );
    return true;
}

Sphere::Sphere( const vec3& inCenter, f32 inRadius, std::shared_ptr<Material> inMaterial ) :
    center( inCenter ), radius( inRadius ), material( inMaterial )
{
    RD_ASSERT( material, "Sphere needs a material" );
}

const Material* Sphere::GetMaterial() const { return material.get(); }

bool Sphere::Intersect( const Ray& ray, RayHit* hit ) const
{
    f32 t1, t2;
    if ( !intersect::RaySphere( ray.origin, ray.direction, center, radius, t1, t2 ) )
    {
        return false;
    }

    // from inside only the exit point can be seen
    const bool inside = LengthSquared( ray.origin - center ) < radius * radius;
    f32 t             = inside ? t2 : t1;
    if ( t <= 0 && !material->IsRefractive() )
    {
        return false;
    }

    vec3 position = ray.Evaluate( t );
    *hit          = RayHit( position, NormalizeSafe( position - center ), ray.direction, material.get() );
    return true;
}

Triangle::Triangle( const vec3& inV0, const vec3& inV1, const vec3& inV2, std::shared_ptr<Material> inMaterial ) :
    v0( inV0 ), v1( inV1 ), v2( inV2 ), hasVertexNormals( false ), material( inMaterial )
{
    RD_ASSERT( material, "Triangle needs a material" );
    n0 = n1 = n2 = NormalizeSafe( Cross( v1 - v0, v2 - v0 ) );
}

Triangle::Triangle( const vec3& inV0, const vec3& inV1, const vec3& inV2, const vec3& inN0, const vec3& inN1, const vec3& inN2,
    std::shared_ptr<Material> inMaterial ) :
    v0( inV0 ), v1( inV1 ), v2( inV2 ), n0( inN0 ), n1( inN1 ), n2( inN2 ), hasVertexNormals( true ), material( inMaterial )
{
    RD_ASSERT( material, "Triangle needs a material" );
}

const Material* Triangle::GetMaterial() const { return material.get(); }

bool Triangle::Intersect( const Ray& ray, RayHit* hit ) const
{
    f32 t;
    vec3 bary;
    if ( !intersect::RayTriangle( ray.origin, ray.direction, v0, v1, v2, material->IsRefractive(), t, bary ) )
    {
        return false;
    }

    // flat triangles store the face normal in every vertex normal
    vec3 normal = n0;
    if ( hasVertexNormals )
    {
        normal = NormalizeSafe( bary.x * n0 + bary.y * n1 + bary.z * n2 );
    }

    *hit = RayHit( ray.Evaluate( t ), normal, ray.direction, material.get() );
    return true;
}

} // namespace RT
