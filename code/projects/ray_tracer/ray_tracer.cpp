#include "ray_tracer.hpp"
#include "anti_aliasing.hpp"
#include "core/time.hpp"
#include "shading.hpp"
#include "shared/logger.hpp"
#include <atomic>
#include <cmath>
#include <cstdio>

#define PROGRESS_BAR_STR "++++++++++++++++++++++++++++++++++++++++++++++++++++++++++++"
#define PROGRESS_BAR_WIDTH 60

using namespace RD;

namespace RT
{

RayTracer::RayTracer( const Scene& scene ) : m_scene( scene ) {}

vec3 RayTracer::RenderPixel( const Camera& camera, u32 col, u32 row, u32 width, u32 height ) const
{
    // scenes built in code never went through ClampRenderSettings
    const i32 gridSize   = Clamp( m_scene.settings.antiAliasMultiplier, 1, AntiAlias::MAX_GRID_SIZE );
    const i32 iterations = AntiAlias::GetIterations( gridSize );

    vec3 totalColor( 0 );
    for ( i32 iteration = 0; iteration < iterations; ++iteration )
    {
        vec2 offset = AntiAlias::RegularGridOffset( iteration, gridSize );
        f32 x       = ( col + offset.x ) / width;
        f32 y       = ( row + offset.y ) / height;

        RayHit hit;
        if ( m_scene.ClosestHit( camera.GetRay( x, y ), &hit ) )
        {
            totalColor += ResolveColor( m_scene, hit, 0 );
        }
    }

    return totalColor / static_cast<f32>( iterations );
}

void RayTracer::Render( ImageSink& image ) const
{
    const u32 width  = image.Width();
    const u32 height = image.Height();
    if ( width == 0 || height == 0 )
    {
        LOG_WARN( "Nothing to render, image is %u x %u", width, height );
        return;
    }

    const i32 gridSize = Clamp( m_scene.settings.antiAliasMultiplier, 1, AntiAlias::MAX_GRID_SIZE );
    if ( gridSize != m_scene.settings.antiAliasMultiplier )
    {
        LOG_WARN( "antiAliasMultiplier %d is outside of [1, %d], using %d", m_scene.settings.antiAliasMultiplier,
            AntiAlias::MAX_GRID_SIZE, gridSize );
    }
    LOG( "Rendering scene at %u x %u with %d x %d anti aliasing", width, height, gridSize, gridSize );
    auto timeStart = Time::GetTimePoint();

    Camera camera      = m_scene.camera;
    camera.aspectRatio = static_cast<f32>( width ) / static_cast<f32>( height );
    camera.Update();

    std::atomic<i32> renderProgress( 0 );
    const i32 onePercent = static_cast<i32>( std::ceil( height / 100.0f ) );
    const i32 numRows    = static_cast<i32>( height );

#pragma omp parallel for schedule( dynamic )
    for ( i32 row = 0; row < numRows; ++row )
    {
        for ( u32 col = 0; col < width; ++col )
        {
            image.SetPixel( col, static_cast<u32>( row ), RenderPixel( camera, col, static_cast<u32>( row ), width, height ) );
        }

        i32 rowsCompleted = ++renderProgress;
        if ( rowsCompleted % onePercent == 0 || rowsCompleted == numRows )
        {
            f32 progress = rowsCompleted / static_cast<f32>( numRows );
            i32 val      = static_cast<i32>( progress * 100 + 0.5f );
            i32 lpad     = static_cast<i32>( progress * PROGRESS_BAR_WIDTH + 0.5f );
            i32 rpad     = PROGRESS_BAR_WIDTH - lpad;
#pragma omp critical( RT_ProgressBar )
            {
                printf( "\r%3d%% [%.*s%*s]", val, lpad, PROGRESS_BAR_STR, rpad, "" );
                fflush( stdout );
            }
        }
    }

    printf( "\n" );
    LOG( "Rendered scene in %.2f seconds", Time::GetTimeSince( timeStart ) / 1000 );
}

} // namespace RT
