#include "mesh.hpp"
#include "rt_scene.hpp"
#include "test_helpers.hpp"
#include <cmath>

using namespace RT;

TEST_CASE( "Loading a complete scene", "[scene][loading]" )
{
    Scene scene;
    REQUIRE( scene.Load( RD_TEST_DATA_DIR "simple_scene.json" ) );

    SECTION( "render settings" )
    {
        REQUIRE( scene.settings.imageResolution == ivec2( 64, 48 ) );
        REQUIRE( scene.settings.maxDepth == 12 );
        REQUIRE( scene.settings.antiAliasMultiplier == 2 );
        REQUIRE( scene.settings.outputImageFilename == "simple.png" );
    }

    SECTION( "camera" )
    {
        REQUIRE( scene.camera.position == vec3( 0, 1, -5 ) );
        REQUIRE( scene.camera.rotationAngle == Approx( 90 ) );
        REQUIRE( scene.camera.vFov == Approx( DegToRad( 45.0f ) ) );
        REQUIRE( ApproxEqual( scene.camera.GetForwardDir(), vec3( 1, 0, 0 ) ) );
        REQUIRE( scene.camera.GetImagePlaneHeight() == Approx( 2 * std::tan( DegToRad( 22.5f ) ) ) );
    }

    SECTION( "materials" )
    {
        REQUIRE( scene.materials.size() == 3 );
        REQUIRE( scene.materials.at( "white" )->type == MaterialType::DIFFUSE );
        REQUIRE( scene.materials.at( "mirror" )->type == MaterialType::REFLECTIVE );
        REQUIRE( scene.materials.at( "glass" )->type == MaterialType::REFRACTIVE );
        REQUIRE( scene.materials.at( "glass" )->refractiveIndex == Approx( 1.33f ) );
        REQUIRE( scene.materials.at( "white" )->name == "white" );
        REQUIRE( std::string( MaterialTypeToString( scene.materials.at( "glass" )->type ) ) == "Refractive" );
    }

    SECTION( "lights" )
    {
        REQUIRE( scene.lights.size() == 2 );
        REQUIRE( ApproxEqual( scene.lights[0].color, vec3( 0.8f, 0.8f, 0.7f ) ) );
        REQUIRE( scene.lights[1].color == vec3( 1 ) );
        REQUIRE( scene.lights[1].position == vec3( 3, 5, -2 ) );
    }

    SECTION( "surfaces in file order" )
    {
        REQUIRE( scene.surfaces.size() == 5 );

        auto plane = std::dynamic_pointer_cast<Plane>( scene.surfaces[0] );
        REQUIRE( plane );
        REQUIRE( plane->GetMaterial() == scene.materials.at( "white" ).get() );

        auto sphere = std::dynamic_pointer_cast<Sphere>( scene.surfaces[1] );
        REQUIRE( sphere );
        REQUIRE( sphere->radius == Approx( 1 ) );
        REQUIRE( sphere->GetMaterial()->IsRefractive() );

        auto flat = std::dynamic_pointer_cast<Triangle>( scene.surfaces[2] );
        REQUIRE( flat );
        REQUIRE_FALSE( flat->hasVertexNormals );

        auto smooth = std::dynamic_pointer_cast<Triangle>( scene.surfaces[3] );
        REQUIRE( smooth );
        REQUIRE( smooth->hasVertexNormals );

        auto mesh = std::dynamic_pointer_cast<Mesh>( scene.surfaces[4] );
        REQUIRE( mesh );
        REQUIRE( mesh->triangles.size() == 4 );
        REQUIRE( ApproxEqual( mesh->aabb.min, vec3( 2, 0, 2 ) ) );
        REQUIRE( ApproxEqual( mesh->aabb.max, vec3( 2.5f, 0.5f, 2.5f ) ) );
    }
}

TEST_CASE( "Out of range render settings are clamped on load", "[scene][loading]" )
{
    Scene scene;
    REQUIRE( scene.Load( RD_TEST_DATA_DIR "out_of_range_settings.json" ) );
    REQUIRE( scene.settings.maxDepth == MAX_RECURSION_DEPTH );
    REQUIRE( scene.settings.antiAliasMultiplier == 16 );
    REQUIRE( scene.settings.imageResolution == ivec2( 400, 400 ) );
}

TEST_CASE( "Invalid scenes fail to load", "[scene][loading]" )
{
    const char* badScenes[] = {
        "does_not_exist.json",
        "not_an_array.json",
        "undefined_material.json",
        "material_used_before_definition.json",
        "unknown_object.json",
        "unknown_material_type.json",
        "partial_normals.json",
        "missing_model.json",
    };

    for ( const char* name : badScenes )
    {
        INFO( name );
        Scene scene;
        REQUIRE_FALSE( scene.Load( std::string( RD_TEST_DATA_DIR ) + name ) );
    }
}
