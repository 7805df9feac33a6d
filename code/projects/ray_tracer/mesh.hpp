#pragma once

#include "core/bounding_box.hpp"
#include "surfaces.hpp"
#include <vector>

namespace RT
{

// A triangle soup behind a single bounding box. Intersect returns the closest triangle hit
struct Mesh : public Surface
{
    // meshes with fewer triangles than this are always scanned on the calling thread
    static constexpr size_t PARALLEL_SCAN_THRESHOLD = 512;

    Mesh() = default;
    Mesh( std::vector<Triangle>&& triangles, const RD::AABB& aabb, std::shared_ptr<Material> material );

    const Material* GetMaterial() const override;
    bool Intersect( const Ray& ray, RayHit* hit ) const override;

    // Large meshes are split across a thread team, unless the caller is already running inside one
    bool ScansInParallel() const;

    std::vector<Triangle> triangles;
    RD::AABB aabb;
    std::shared_ptr<Material> material;
};

} // namespace RT
