#include "mesh.hpp"
#include "intersection_tests.hpp"
#include "shared/assert.hpp"
#include <omp.h>

namespace RT
{

Mesh::Mesh( std::vector<Triangle>&& inTriangles, const RD::AABB& inAABB, std::shared_ptr<Material> inMaterial ) :
    triangles( std::move( inTriangles ) ), aabb( inAABB ), material( inMaterial )
{
    RD_ASSERT( material, "Mesh needs a material" );
}

const Material* Mesh::GetMaterial() const { return material.get(); }

bool Mesh::ScansInParallel() const { return !omp_in_parallel() && triangles.size() >= PARALLEL_SCAN_THRESHOLD; }

bool Mesh::Intersect( const Ray& ray, RayHit* hit ) const
{
    const vec3 invDir     = 1.0f / ray.direction;
    const i32 isDirNeg[3] = { invDir.x < 0, invDir.y < 0, invDir.z < 0 };
    if ( !intersect::RayAABB( ray.origin, invDir, isDirNeg, aabb.min, aabb.max ) )
    {
        return false;
    }

    // Each thread finds the closest hit of its share of the triangles, then the per thread results are
    // merged. Ties go to the lowest triangle index so the result does not depend on the thread count
    const i64 numTris  = static_cast<i64>( triangles.size() );
    f32 closestDistSq  = FLT_MAX;
    i64 closestIndex   = -1;
    RayHit closestHit;

#pragma omp parallel if ( ScansInParallel() )
    {
        f32 localDistSq = FLT_MAX;
        i64 localIndex  = -1;
        RayHit localHit;

#pragma omp for schedule( static ) nowait
        for ( i64 triIndex = 0; triIndex < numTris; ++triIndex )
        {
            RayHit candidate;
            f32 distSq;
            if ( triangles[triIndex].Intersect( ray, &candidate ) && BiasedHitDistanceSquared( ray, candidate, distSq ) &&
                 distSq < localDistSq )
            {
                localDistSq = distSq;
                localIndex  = triIndex;
                localHit    = candidate;
            }
        }

#pragma omp critical( RT_MeshClosestHitMerge )
        {
            if ( localIndex != -1 &&
                 ( localDistSq < closestDistSq || ( localDistSq == closestDistSq && localIndex < closestIndex ) ) )
            {
                closestDistSq = localDistSq;
                closestIndex  = localIndex;
                closestHit    = localHit;
            }
        }
    }

    if ( closestIndex == -1 )
    {
        return false;
    }

    *hit = closestHit;
    return true;
}

} // namespace RT
