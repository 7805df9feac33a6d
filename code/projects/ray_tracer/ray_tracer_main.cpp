#include "core/init.hpp"
#include "ray_tracer.hpp"
#include "rt_scene.hpp"
#include "shared/filesystem.hpp"
#include "shared/logger.hpp"
#include <cstdlib>
#include <getopt.h>

using namespace RT;
using namespace RD;

static void DisplayHelp()
{
    auto msg =
        "Usage: ray_tracer [options] SCENE_FILE\n"
        "SCENE_FILE is tried as given first, then relative to the assets/scenes/ folder. The .json extension is optional\n"
        "Options override the scene's RenderSettings\n"
        "  --aa N             Sample each pixel with an N x N grid of rays\n"
        "  --depth N          Maximum reflection/refraction recursion depth\n"
        "  --help             Print this message and exit\n"
        "  --output FILE      Image to save. Supports .png, .jpg, .bmp, .tga and .hdr\n"
        "  --resolution WxH   Image resolution, ex: 1280x720\n";

    LOG( "%s", msg );
}

struct CommandLineOverrides
{
    std::string outputFilename;
    ivec2 resolution        = ivec2( 0 );
    i32 antiAliasMultiplier = 0;
    i32 maxDepth            = 0;
    bool helpRequested      = false;
};

static bool ParsePositiveInt( const char* str, i32& value )
{
    char* end = nullptr;
    long v    = strtol( str, &end, 10 );
    if ( end == str || *end != '\0' || v <= 0 || v > INT32_MAX )
    {
        return false;
    }

    value = static_cast<i32>( v );
    return true;
}

static bool ParseCommandLineArgs( int argc, char** argv, std::string& sceneFile, CommandLineOverrides& overrides )
{
    static struct option long_options[] = {
        {"aa",         required_argument, 0, 'a'},
        {"depth",      required_argument, 0, 'd'},
        {"help",       no_argument,       0, 'h'},
        {"output",     required_argument, 0, 'o'},
        {"resolution", required_argument, 0, 'r'},
        {0,            0,                 0, 0  }
    };

    i32 option_index = 0;
    i32 c            = -1;
    while ( ( c = getopt_long( argc, argv, "a:d:ho:r:", long_options, &option_index ) ) != -1 )
    {
        switch ( c )
        {
        case 'a':
            if ( !ParsePositiveInt( optarg, overrides.antiAliasMultiplier ) )
            {
                LOG_ERR( "Invalid anti aliasing multiplier '%s'", optarg );
                return false;
            }
            break;
        case 'd':
            if ( !ParsePositiveInt( optarg, overrides.maxDepth ) )
            {
                LOG_ERR( "Invalid max depth '%s'", optarg );
                return false;
            }
            break;
        case 'h':
            DisplayHelp();
            overrides.helpRequested = true;
            return false;
        case 'o': overrides.outputFilename = optarg; break;
        case 'r':
        {
            std::string res = optarg;
            size_t x        = res.find_first_of( "xX" );
            if ( x == std::string::npos || !ParsePositiveInt( res.substr( 0, x ).c_str(), overrides.resolution.x ) ||
                 !ParsePositiveInt( res.substr( x + 1 ).c_str(), overrides.resolution.y ) )
            {
                LOG_ERR( "Invalid resolution '%s', expected WxH", optarg );
                return false;
            }
            break;
        }
        default: LOG_ERR( "Invalid option, try 'ray_tracer --help' for more information" ); return false;
        }
    }

    if ( optind >= argc )
    {
        LOG_ERR( "No scene file given" );
        DisplayHelp();
        return false;
    }
    sceneFile = argv[optind];

    return true;
}

static void ApplyOverrides( const CommandLineOverrides& overrides, RenderSettings& settings )
{
    if ( !overrides.outputFilename.empty() )
        settings.outputImageFilename = overrides.outputFilename;
    if ( overrides.resolution.x > 0 )
        settings.imageResolution = overrides.resolution;
    if ( overrides.antiAliasMultiplier > 0 )
        settings.antiAliasMultiplier = overrides.antiAliasMultiplier;
    if ( overrides.maxDepth > 0 )
        settings.maxDepth = overrides.maxDepth;

    ClampRenderSettings( settings );
}

int main( int argc, char** argv )
{
    EngineInitInfo initInfo;
    initInfo.logFilename = RD_BIN_DIR "log_ray_tracer.txt";
    if ( !EngineInitialize( initInfo ) )
    {
        LOG_ERR( "Failed to initialize the engine" );
        return 1;
    }

    std::string sceneArg;
    CommandLineOverrides overrides;
    if ( !ParseCommandLineArgs( argc, argv, sceneArg, overrides ) )
    {
        EngineShutdown();
        return overrides.helpRequested ? 0 : 1;
    }

    std::string sceneFile = ResolvePath( sceneArg, "", RD_ASSET_DIR "scenes/" );
    if ( sceneFile.empty() && GetFileExtension( sceneArg ) != ".json" )
    {
        sceneFile = ResolvePath( sceneArg + ".json", "", RD_ASSET_DIR "scenes/" );
    }
    if ( sceneFile.empty() )
    {
        LOG_ERR( "Could not find scene file '%s'", sceneArg.c_str() );
        EngineShutdown();
        return 1;
    }

    Scene scene;
    if ( !scene.Load( sceneFile ) )
    {
        LOG_ERR( "Could not load scene file '%s'", sceneFile.c_str() );
        EngineShutdown();
        return 1;
    }
    ApplyOverrides( overrides, scene.settings );

    const RenderSettings& settings = scene.settings;
    FloatImage2D image( settings.imageResolution.x, settings.imageResolution.y );
    RayTracer rayTracer( scene );
    rayTracer.Render( image );

    i32 ret = 0;
    if ( image.Save( settings.outputImageFilename ) )
    {
        LOG( "Saved ray traced image: %s", settings.outputImageFilename.c_str() );
    }
    else
    {
        ret = 1;
    }

    EngineShutdown();

    return ret;
}
