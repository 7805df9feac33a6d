#include "camera.hpp"
#include "test_helpers.hpp"
#include <cmath>

using namespace RT;

TEST_CASE( "Default camera", "[camera]" )
{
    Camera camera;
    REQUIRE( ApproxEqual( camera.GetForwardDir(), vec3( 0, 0, 1 ) ) );
    REQUIRE( ApproxEqual( camera.GetRightDir(), vec3( 1, 0, 0 ) ) );
    REQUIRE( ApproxEqual( camera.GetUpDir(), vec3( 0, 1, 0 ) ) );

    f32 halfHeight = std::tan( DegToRad( 30.0f ) );
    REQUIRE( camera.GetImagePlaneHeight() == Approx( 2 * halfHeight ) );
    REQUIRE( camera.GetImagePlaneWidth() == Approx( 2 * halfHeight ) );

    SECTION( "center ray looks down +z" )
    {
        Ray ray = camera.GetRay( 0.5f, 0.5f );
        REQUIRE( ray.origin == camera.position );
        REQUIRE( ApproxEqual( ray.direction, vec3( 0, 0, 1 ) ) );
    }

    SECTION( "top left corner of the image plane" )
    {
        REQUIRE( ApproxEqual( camera.ImagePlanePoint( 0, 0 ), vec3( -halfHeight, halfHeight, 1 ) ) );
        REQUIRE( Length( camera.GetRay( 0, 0 ).direction ) == Approx( 1 ) );
    }

    SECTION( "aspect ratio widens the plane" )
    {
        camera.aspectRatio = 2;
        camera.Update();
        REQUIRE( ApproxEqual( camera.ImagePlanePoint( 1, 0.5f ), vec3( 4 * halfHeight, 0, 1 ) ) );
    }

    SECTION( "position offsets rays" )
    {
        camera.position = vec3( 1, 2, 3 );
        camera.Update();
        REQUIRE( ApproxEqual( camera.ImagePlanePoint( 0.5f, 0.5f ), vec3( 1, 2, 4 ) ) );
    }
}

TEST_CASE( "Camera rotation", "[camera]" )
{
    Camera camera;

    SECTION( "90 degrees around y turns +z into +x" )
    {
        camera.rotationAngle = 90;
        camera.Update();
        REQUIRE( ApproxEqual( camera.GetForwardDir(), vec3( 1, 0, 0 ) ) );
        REQUIRE( ApproxEqual( camera.GetRightDir(), vec3( 0, 0, -1 ) ) );
        REQUIRE( ApproxEqual( camera.GetUpDir(), vec3( 0, 1, 0 ) ) );
        REQUIRE( ApproxEqual( camera.GetRay( 0.5f, 0.5f ).direction, vec3( 1, 0, 0 ) ) );
    }

    SECTION( "negative angles turn the other way" )
    {
        camera.rotationAngle = -90;
        camera.Update();
        REQUIRE( ApproxEqual( camera.GetForwardDir(), vec3( -1, 0, 0 ) ) );
    }

    SECTION( "angles are wrapped before use" )
    {
        camera.rotationAngle = 270;
        camera.Update();
        REQUIRE( ApproxEqual( camera.GetForwardDir(), vec3( -1, 0, 0 ) ) );

        camera.rotationAngle = -270;
        camera.Update();
        REQUIRE( ApproxEqual( camera.GetForwardDir(), vec3( 1, 0, 0 ) ) );

        camera.rotationAngle = 450;
        camera.Update();
        REQUIRE( ApproxEqual( camera.GetForwardDir(), vec3( 1, 0, 0 ) ) );
    }

    SECTION( "zero axis means no rotation" )
    {
        camera.rotationAxis  = vec3( 0 );
        camera.rotationAngle = 45;
        camera.Update();
        REQUIRE( ApproxEqual( camera.GetForwardDir(), vec3( 0, 0, 1 ) ) );
    }

    SECTION( "non unit axes are normalized" )
    {
        camera.rotationAxis  = vec3( 0, 3, 0 );
        camera.rotationAngle = 90;
        camera.Update();
        REQUIRE( ApproxEqual( camera.GetForwardDir(), vec3( 1, 0, 0 ) ) );
    }
}
