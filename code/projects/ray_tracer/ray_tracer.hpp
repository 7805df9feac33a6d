#pragma once

#include "image.hpp"
#include "rt_scene.hpp"

namespace RT
{

class RayTracer
{
public:
    explicit RayTracer( const Scene& scene );

    // Computes every pixel of the sink, in parallel. The camera's aspect ratio is taken from the sink
    void Render( ImageSink& image ) const;

    // Average color of the anti aliasing samples inside pixel (col, row) of a width x height image
    vec3 RenderPixel( const Camera& camera, u32 col, u32 row, u32 width, u32 height ) const;

private:
    const Scene& m_scene;
};

} // namespace RT
