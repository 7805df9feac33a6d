#pragma once

#include "camera.hpp"
#include "lights.hpp"
#include "surfaces.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace RT
{

constexpr i32 MAX_RECURSION_DEPTH = 100;

struct RenderSettings
{
    std::string outputImageFilename = "rendered.png";
    ivec2 imageResolution           = ivec2( 400, 400 );
    // recursion depth past which reflective and refractive paths return black
    i32 maxDepth = MAX_RECURSION_DEPTH;
    // each pixel is sampled by an antiAliasMultiplier x antiAliasMultiplier grid
    i32 antiAliasMultiplier = 1;
};

// Clamps maxDepth to [1, MAX_RECURSION_DEPTH] and antiAliasMultiplier to [1, AntiAlias::MAX_GRID_SIZE],
// warning about anything out of range
void ClampRenderSettings( RenderSettings& settings );

// Built once before rendering, then only read while rendering, from all of the render threads
class Scene
{
public:
    Scene() = default;

    bool Load( const std::string& filename );

    // Closest surface hit strictly in front of the ray
    bool ClosestHit( const Ray& ray, RayHit* hit ) const;

    // True if no surface lies between origin and destination
    bool LineOfSight( const vec3& origin, const vec3& destination ) const;

    void AddSurface( std::shared_ptr<Surface> surface );
    void AddLight( const PointLight& light );

    std::vector<std::shared_ptr<Surface>> surfaces;
    std::vector<PointLight> lights;
    std::unordered_map<std::string, std::shared_ptr<Material>> materials;
    Camera camera;
    RenderSettings settings = {};
};

} // namespace RT
