#include "rt_scene.hpp"
#include "anti_aliasing.hpp"
#include "core/time.hpp"
#include "mesh_loader.hpp"
#include "shared/assert.hpp"
#include "shared/filesystem.hpp"
#include "shared/json_parsing.hpp"
#include "shared/logger.hpp"

using namespace RD;

namespace RT
{

bool Scene::ClosestHit( const Ray& ray, RayHit* hit ) const
{
    f32 closestDistSq = FLT_MAX;
    bool found        = false;
    for ( const auto& surface : surfaces )
    {
        RayHit candidate;
        f32 distSq;
        if ( surface->Intersect( ray, &candidate ) && BiasedHitDistanceSquared( ray, candidate, distSq ) && distSq < closestDistSq )
        {
            closestDistSq = distSq;
            *hit          = candidate;
            found         = true;
        }
    }

    return found;
}

bool Scene::LineOfSight( const vec3& origin, const vec3& destination ) const
{
    // trace from the destination back to the (slightly advanced) origin. Only hits that land on the
    // segment between the two block the view
    vec3 adjustedOrigin = origin + RAY_BIAS * ( destination - origin );
    vec3 segment        = adjustedOrigin - destination;
    f32 segmentLenSq    = LengthSquared( segment );
    Ray ray( destination, NormalizeSafe( segment ) );

    for ( const auto& surface : surfaces )
    {
        RayHit hit;
        if ( !surface->Intersect( ray, &hit ) )
        {
            continue;
        }

        f32 projection = Dot( segment, hit.position - destination );
        if ( projection > 0 && projection < segmentLenSq )
        {
            return false;
        }
    }

    return true;
}

void Scene::AddSurface( std::shared_ptr<Surface> surface )
{
    RD_ASSERT( surface );
    surfaces.push_back( surface );
}

void Scene::AddLight( const PointLight& light ) { lights.push_back( light ); }

void ClampRenderSettings( RenderSettings& settings )
{
    if ( settings.maxDepth < 1 || settings.maxDepth > MAX_RECURSION_DEPTH )
    {
        LOG_WARN( "maxDepth %d is outside of [1, %d], clamping", settings.maxDepth, MAX_RECURSION_DEPTH );
        settings.maxDepth = Clamp( settings.maxDepth, 1, MAX_RECURSION_DEPTH );
    }
    else if ( settings.maxDepth < 5 )
    {
        LOG_WARN( "maxDepth %d is very low, reflections and refractions will be cut short", settings.maxDepth );
    }

    if ( settings.antiAliasMultiplier < 1 || settings.antiAliasMultiplier > AntiAlias::MAX_GRID_SIZE )
    {
        LOG_WARN( "antiAliasMultiplier %d is outside of [1, %d], clamping", settings.antiAliasMultiplier, AntiAlias::MAX_GRID_SIZE );
        settings.antiAliasMultiplier = Clamp( settings.antiAliasMultiplier, 1, AntiAlias::MAX_GRID_SIZE );
    }
}

// clang-format off
static bool ParseRenderSettings( const rapidjson::Value& v, Scene* scene )
{
    static JSONFunctionMapper< RenderSettings& > mapping(
    {
        { "imageResolution",     []( const rapidjson::Value& v, RenderSettings& s ) { s.imageResolution     = ParseIVec2( v ); } },
        { "maxDepth",            []( const rapidjson::Value& v, RenderSettings& s ) { s.maxDepth            = ParseNumber< i32 >( v ); } },
        { "antiAliasMultiplier", []( const rapidjson::Value& v, RenderSettings& s ) { s.antiAliasMultiplier = ParseNumber< i32 >( v ); } },
        { "outputImageFilename", []( const rapidjson::Value& v, RenderSettings& s ) { s.outputImageFilename = ParseString( v ); } },
    });

    RenderSettings& settings = scene->settings;
    mapping.ForEachMember( v, settings );
    if ( settings.imageResolution.x <= 0 || settings.imageResolution.y <= 0 )
    {
        LOG_ERR( "Invalid image resolution %d x %d", settings.imageResolution.x, settings.imageResolution.y );
        return false;
    }

    return true;
}


static bool ParseCamera( const rapidjson::Value& v, Scene* scene )
{
    static JSONFunctionMapper< Camera& > mapping(
    {
        { "position", []( const rapidjson::Value& v, Camera& camera ) { camera.position      = ParseVec3( v ); } },
        { "axis",     []( const rapidjson::Value& v, Camera& camera ) { camera.rotationAxis  = ParseVec3( v ); } },
        { "angle",    []( const rapidjson::Value& v, Camera& camera ) { camera.rotationAngle = ParseNumber< f32 >( v ); } },
        { "vFov",     []( const rapidjson::Value& v, Camera& camera ) { camera.vFov          = DegToRad( ParseNumber< f32 >( v ) ); } },
    });

    Camera& camera = scene->camera;
    mapping.ForEachMember( v, camera );
    if ( camera.vFov <= 0 || camera.vFov >= PI )
    {
        LOG_ERR( "Camera vFov must be between 0 and 180 degrees" );
        return false;
    }

    camera.Update();
    return true;
}


static bool ParseMaterial( const rapidjson::Value& value, Scene* scene )
{
    struct MaterialCreateInfo
    {
        std::string name;
        std::string type = "Diffuse";
        vec3 color = vec3( 1 );
        f32 refractiveIndex = 1.5f;
    };
    static JSONFunctionMapper< MaterialCreateInfo& > mapping(
    {
        { "name",            []( const rapidjson::Value& v, MaterialCreateInfo& m ) { m.name            = ParseString( v ); } },
        { "type",            []( const rapidjson::Value& v, MaterialCreateInfo& m ) { m.type            = ParseString( v ); } },
        { "color",           []( const rapidjson::Value& v, MaterialCreateInfo& m ) { m.color           = ParseVec3( v ); } },
        { "refractiveIndex", []( const rapidjson::Value& v, MaterialCreateInfo& m ) { m.refractiveIndex = ParseNumber< f32 >( v ); } },
    });

    MaterialCreateInfo info;
    mapping.ForEachMember( value, info );
    if ( info.name.empty() )
    {
        LOG_ERR( "Materials need a name" );
        return false;
    }
    if ( scene->materials.find( info.name ) != scene->materials.end() )
    {
        LOG_ERR( "Material '%s' is defined more than once", info.name.c_str() );
        return false;
    }

    auto material = std::make_shared< Material >();
    material->name = info.name;
    material->color = info.color;
    material->refractiveIndex = info.refractiveIndex;
    if ( !MaterialTypeFromString( info.type, material->type ) )
    {
        LOG_ERR( "Material '%s' has unknown type '%s'", info.name.c_str(), info.type.c_str() );
        return false;
    }
    if ( material->IsRefractive() && material->refractiveIndex <= 0 )
    {
        LOG_ERR( "Refractive material '%s' needs a positive refractive index", info.name.c_str() );
        return false;
    }

    scene->materials[info.name] = material;
    return true;
}


static std::shared_ptr< Material > FindMaterial( const Scene* scene, const std::string& name, const char* objectType )
{
    auto it = scene->materials.find( name );
    if ( it == scene->materials.end() )
    {
        LOG_ERR( "%s uses undefined material '%s'. Materials must be defined before use", objectType, name.c_str() );
        return nullptr;
    }

    return it->second;
}


static bool ParsePointLight( const rapidjson::Value& value, Scene* scene )
{
    static JSONFunctionMapper< PointLight& > mapping(
    {
        { "position", []( const rapidjson::Value& v, PointLight& l ) { l.position = ParseVec3( v ); } },
        { "color",    []( const rapidjson::Value& v, PointLight& l ) { l.color    = ParseVec3( v ); } },
    });

    PointLight light;
    mapping.ForEachMember( value, light );
    scene->AddLight( light );
    return true;
}


static bool ParsePlane( const rapidjson::Value& value, Scene* scene )
{
    struct PlaneCreateInfo
    {
        vec3 center = vec3( 0 );
        vec3 normal = vec3( 0, 1, 0 );
        std::string material;
    };
    static JSONFunctionMapper< PlaneCreateInfo& > mapping(
    {
        { "center",   []( const rapidjson::Value& v, PlaneCreateInfo& p ) { p.center   = ParseVec3( v ); } },
        { "normal",   []( const rapidjson::Value& v, PlaneCreateInfo& p ) { p.normal   = ParseVec3( v ); } },
        { "material", []( const rapidjson::Value& v, PlaneCreateInfo& p ) { p.material = ParseString( v ); } },
    });

    PlaneCreateInfo info;
    mapping.ForEachMember( value, info );
    auto material = FindMaterial( scene, info.material, "Plane" );
    if ( !material )
    {
        return false;
    }

    scene->AddSurface( std::make_shared< Plane >( info.center, info.normal, material ) );
    return true;
}


static bool ParseSphere( const rapidjson::Value& value, Scene* scene )
{
    struct SphereCreateInfo
    {
        vec3 center = vec3( 0 );
        f32 radius = 1;
        std::string material;
    };
    static JSONFunctionMapper< SphereCreateInfo& > mapping(
    {
        { "center",   []( const rapidjson::Value& v, SphereCreateInfo& s ) { s.center   = ParseVec3( v ); } },
        { "radius",   []( const rapidjson::Value& v, SphereCreateInfo& s ) { s.radius   = ParseNumber< f32 >( v ); } },
        { "material", []( const rapidjson::Value& v, SphereCreateInfo& s ) { s.material = ParseString( v ); } },
    });

    SphereCreateInfo info;
    mapping.ForEachMember( value, info );
    auto material = FindMaterial( scene, info.material, "Sphere" );
    if ( !material )
    {
        return false;
    }

    scene->AddSurface( std::make_shared< Sphere >( info.center, info.radius, material ) );
    return true;
}


static bool ParseTriangle( const rapidjson::Value& value, Scene* scene )
{
    struct TriangleCreateInfo
    {
        vec3 v[3] = {};
        vec3 n[3] = {};
        i32 numNormals = 0;
        std::string material;
    };
    static JSONFunctionMapper< TriangleCreateInfo& > mapping(
    {
        { "v0",       []( const rapidjson::Value& v, TriangleCreateInfo& t ) { t.v[0] = ParseVec3( v ); } },
        { "v1",       []( const rapidjson::Value& v, TriangleCreateInfo& t ) { t.v[1] = ParseVec3( v ); } },
        { "v2",       []( const rapidjson::Value& v, TriangleCreateInfo& t ) { t.v[2] = ParseVec3( v ); } },
        { "n0",       []( const rapidjson::Value& v, TriangleCreateInfo& t ) { t.n[0] = ParseVec3( v ); ++t.numNormals; } },
        { "n1",       []( const rapidjson::Value& v, TriangleCreateInfo& t ) { t.n[1] = ParseVec3( v ); ++t.numNormals; } },
        { "n2",       []( const rapidjson::Value& v, TriangleCreateInfo& t ) { t.n[2] = ParseVec3( v ); ++t.numNormals; } },
        { "material", []( const rapidjson::Value& v, TriangleCreateInfo& t ) { t.material = ParseString( v ); } },
    });

    TriangleCreateInfo info;
    mapping.ForEachMember( value, info );
    auto material = FindMaterial( scene, info.material, "Triangle" );
    if ( !material )
    {
        return false;
    }

    if ( info.numNormals == 0 )
    {
        scene->AddSurface( std::make_shared< Triangle >( info.v[0], info.v[1], info.v[2], material ) );
    }
    else if ( info.numNormals == 3 )
    {
        scene->AddSurface( std::make_shared< Triangle >( info.v[0], info.v[1], info.v[2], info.n[0], info.n[1], info.n[2], material ) );
    }
    else
    {
        LOG_ERR( "Triangle needs either all three vertex normals or none of them" );
        return false;
    }

    return true;
}
// clang-format on

struct ModelCreateInfo
{
    std::string filename;
    vec3 offset = vec3( 0 );
    f32 scale   = 1;
    std::string material;
};

// model filenames are tried relative to the scene file first, then the asset directory
static std::string s_currentSceneDir;

static bool ParseModel( const rapidjson::Value& value, Scene* scene )
{
    // clang-format off
    static JSONFunctionMapper< ModelCreateInfo& > mapping(
    {
        { "filename", []( const rapidjson::Value& v, ModelCreateInfo& m ) { m.filename = ParseString( v ); } },
        { "offset",   []( const rapidjson::Value& v, ModelCreateInfo& m ) { m.offset   = ParseVec3( v ); } },
        { "scale",    []( const rapidjson::Value& v, ModelCreateInfo& m ) { m.scale    = ParseNumber< f32 >( v ); } },
        { "material", []( const rapidjson::Value& v, ModelCreateInfo& m ) { m.material = ParseString( v ); } },
    });
    // clang-format on

    ModelCreateInfo info;
    mapping.ForEachMember( value, info );
    auto material = FindMaterial( scene, info.material, "Model" );
    if ( !material )
    {
        return false;
    }

    std::string path = ResolvePath( info.filename, s_currentSceneDir, RD_ASSET_DIR );
    if ( path.empty() )
    {
        LOG_ERR( "Could not find model file '%s'", info.filename.c_str() );
        return false;
    }

    std::shared_ptr<Mesh> mesh = LoadMesh( path, info.offset, info.scale, material );
    if ( !mesh )
    {
        return false;
    }

    scene->AddSurface( mesh );
    return true;
}

bool Scene::Load( const std::string& filename )
{
    rapidjson::Document document;
    if ( !ParseJSONFile( filename, document ) )
    {
        LOG_ERR( "Failed to parse scene" );
        return false;
    }
    if ( !document.IsArray() )
    {
        LOG_ERR( "Scene file '%s' must contain an array of objects", filename.c_str() );
        return false;
    }

    static JSONFunctionMapperBoolCheck<Scene*> mapping( {
        {"RenderSettings", ParseRenderSettings},
        {"Camera",         ParseCamera        },
        {"Material",       ParseMaterial      },
        {"PointLight",     ParsePointLight    },
        {"Plane",          ParsePlane         },
        {"Sphere",         ParseSphere        },
        {"Triangle",       ParseTriangle      },
        {"Model",          ParseModel         },
    } );

    auto loadStart    = Time::GetTimePoint();
    s_currentSceneDir = GetParentPath( filename );
    Scene* scene      = this;
    for ( rapidjson::Value::ConstValueIterator itr = document.Begin(); itr != document.End(); ++itr )
    {
        if ( !itr->IsObject() || !mapping.ForEachMember( *itr, scene ) )
        {
            LOG_ERR( "Failed to load scene '%s'", filename.c_str() );
            return false;
        }
    }

    ClampRenderSettings( settings );

    LOG( "Loaded scene '%s' with %zu surfaces and %zu lights in %.2f ms", filename.c_str(), surfaces.size(), lights.size(),
        Time::GetTimeSince( loadStart ) );
    return true;
}

} // namespace RT
