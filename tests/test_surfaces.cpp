#include "surfaces.hpp"
#include "test_helpers.hpp"

using namespace RT;

TEST_CASE( "Sphere intersection", "[surfaces][sphere]" )
{
    Sphere sphere( vec3( 0 ), 2, Diffuse() );
    RayHit hit;

    SECTION( "hit from outside returns the near side" )
    {
        REQUIRE( sphere.Intersect( Ray( vec3( 0, 0, -5 ), vec3( 0, 0, 1 ) ), &hit ) );
        REQUIRE( ApproxEqual( hit.position, vec3( 0, 0, -2 ) ) );
        REQUIRE( ApproxEqual( hit.normal, vec3( 0, 0, -1 ) ) );
        REQUIRE( ApproxEqual( hit.incident, vec3( 0, 0, 1 ) ) );
        REQUIRE( hit.material == sphere.GetMaterial() );
    }

    SECTION( "non unit ray directions find the same point" )
    {
        REQUIRE( sphere.Intersect( Ray( vec3( 0, 0, -5 ), vec3( 0, 0, 2 ) ), &hit ) );
        REQUIRE( ApproxEqual( hit.position, vec3( 0, 0, -2 ) ) );
    }

    SECTION( "ray starting inside returns the exit point" )
    {
        REQUIRE( sphere.Intersect( Ray( vec3( 0, 0, 1 ), vec3( 0, 0, 1 ) ), &hit ) );
        REQUIRE( ApproxEqual( hit.position, vec3( 0, 0, 2 ) ) );
        REQUIRE( ApproxEqual( hit.normal, vec3( 0, 0, 1 ) ) );
    }

    SECTION( "miss" ) { REQUIRE_FALSE( sphere.Intersect( Ray( vec3( 5, 0, -5 ), vec3( 0, 0, 1 ) ), &hit ) ); }

    SECTION( "opaque spheres behind the ray are not reported" )
    {
        REQUIRE_FALSE( sphere.Intersect( Ray( vec3( 0, 0, 5 ), vec3( 0, 0, 1 ) ), &hit ) );
    }

    SECTION( "refractive spheres behind the ray are reported" )
    {
        Sphere glass( vec3( 0 ), 2, Glass() );
        REQUIRE( glass.Intersect( Ray( vec3( 0, 0, 5 ), vec3( 0, 0, 1 ) ), &hit ) );
        REQUIRE( ApproxEqual( hit.position, vec3( 0, 0, -2 ) ) );
    }
}

TEST_CASE( "Plane intersection", "[surfaces][plane]" )
{
    Plane plane( vec3( 0 ), vec3( 0, 2, 0 ), Diffuse() );
    RayHit hit;

    SECTION( "normal is stored normalized" ) { REQUIRE( ApproxEqual( plane.normal, vec3( 0, 1, 0 ) ) ); }

    SECTION( "front side hit" )
    {
        REQUIRE( plane.Intersect( Ray( vec3( 1, 5, 2 ), vec3( 0, -1, 0 ) ), &hit ) );
        REQUIRE( ApproxEqual( hit.position, vec3( 1, 0, 2 ) ) );
        REQUIRE( ApproxEqual( hit.normal, vec3( 0, 1, 0 ) ) );
    }

    SECTION( "parallel rays miss" ) { REQUIRE_FALSE( plane.Intersect( Ray( vec3( 0, 1, 0 ), vec3( 1, 0, 0 ) ), &hit ) ); }

    SECTION( "opaque planes are invisible from behind" )
    {
        REQUIRE_FALSE( plane.Intersect( Ray( vec3( 0, -5, 0 ), vec3( 0, 1, 0 ) ), &hit ) );
        REQUIRE_FALSE( plane.Intersect( Ray( vec3( 0, -5, 0 ), vec3( 0, -1, 0 ) ), &hit ) );
    }

    SECTION( "refractive planes are visible from both sides and behind the ray" )
    {
        Plane glass( vec3( 0 ), vec3( 0, 1, 0 ), Glass() );
        REQUIRE( glass.Intersect( Ray( vec3( 0, -5, 0 ), vec3( 0, 1, 0 ) ), &hit ) );
        REQUIRE( ApproxEqual( hit.position, vec3( 0 ) ) );
        REQUIRE( ApproxEqual( hit.normal, vec3( 0, 1, 0 ) ) );

        REQUIRE( glass.Intersect( Ray( vec3( 0, -5, 0 ), vec3( 0, -1, 0 ) ), &hit ) );
        REQUIRE( ApproxEqual( hit.position, vec3( 0 ) ) );
    }
}

TEST_CASE( "Triangle intersection", "[surfaces][triangle]" )
{
    RayHit hit;
    const Ray ray( vec3( 0.25f, 0.25f, -1 ), vec3( 0, 0, 1 ) );

    SECTION( "front face hit" )
    {
        Triangle tri( vec3( 0, 0, 0 ), vec3( 0, 1, 0 ), vec3( 1, 0, 0 ), Diffuse() );
        REQUIRE( tri.Intersect( ray, &hit ) );
        REQUIRE( ApproxEqual( hit.position, vec3( 0.25f, 0.25f, 0 ) ) );
        REQUIRE( ApproxEqual( hit.normal, vec3( 0, 0, -1 ) ) );
    }

    SECTION( "opaque triangles cull back faces" )
    {
        Triangle tri( vec3( 0, 0, 0 ), vec3( 1, 0, 0 ), vec3( 0, 1, 0 ), Diffuse() );
        REQUIRE_FALSE( tri.Intersect( ray, &hit ) );
    }

    SECTION( "refractive triangles report back faces" )
    {
        Triangle tri( vec3( 0, 0, 0 ), vec3( 1, 0, 0 ), vec3( 0, 1, 0 ), Glass() );
        REQUIRE( tri.Intersect( ray, &hit ) );
        REQUIRE( ApproxEqual( hit.position, vec3( 0.25f, 0.25f, 0 ) ) );
        REQUIRE( ApproxEqual( hit.normal, vec3( 0, 0, 1 ) ) );
    }

    SECTION( "miss outside the edges" )
    {
        Triangle tri( vec3( 0, 0, 0 ), vec3( 0, 1, 0 ), vec3( 1, 0, 0 ), Diffuse() );
        REQUIRE_FALSE( tri.Intersect( Ray( vec3( 2, 2, -1 ), vec3( 0, 0, 1 ) ), &hit ) );
    }

    SECTION( "opaque triangles behind the ray are not reported" )
    {
        Triangle tri( vec3( 0, 0, 0 ), vec3( 0, 1, 0 ), vec3( 1, 0, 0 ), Diffuse() );
        REQUIRE_FALSE( tri.Intersect( Ray( vec3( 0.25f, 0.25f, -1 ), vec3( 0, 0, -1 ) ), &hit ) );
    }

    SECTION( "vertex normals are weighted by the matching vertex" )
    {
        Triangle tri( vec3( 0, 0, 0 ), vec3( 0, 1, 0 ), vec3( 1, 0, 0 ), vec3( 1, 0, 0 ), vec3( 0, 1, 0 ), vec3( 0, 0, -1 ), Diffuse() );
        REQUIRE( tri.hasVertexNormals );

        REQUIRE( tri.Intersect( ray, &hit ) );
        REQUIRE( ApproxEqual( hit.normal, Normalize( vec3( 0.5f, 0.25f, -0.25f ) ) ) );

        REQUIRE( tri.Intersect( Ray( vec3( 0.01f, 0.98f, -1 ), vec3( 0, 0, 1 ) ), &hit ) );
        REQUIRE( hit.normal.y > 0.99f );

        REQUIRE( tri.Intersect( Ray( vec3( 0.98f, 0.01f, -1 ), vec3( 0, 0, 1 ) ), &hit ) );
        REQUIRE( hit.normal.z < -0.99f );
    }
}
