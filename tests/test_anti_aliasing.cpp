#include "anti_aliasing.hpp"
#include "test_helpers.hpp"

using namespace RT;

TEST_CASE( "Regular grid anti aliasing", "[anti_aliasing]" )
{
    SECTION( "single sample is the pixel center" )
    {
        REQUIRE( AntiAlias::GetIterations( 1 ) == 1 );
        REQUIRE( AntiAlias::RegularGridOffset( 0, 1 ) == vec2( 0.5f ) );
    }

    SECTION( "2x2 grid is row major from the top left" )
    {
        REQUIRE( AntiAlias::GetIterations( 2 ) == 4 );
        REQUIRE( AntiAlias::RegularGridOffset( 0, 2 ) == vec2( 0.25f, 0.25f ) );
        REQUIRE( AntiAlias::RegularGridOffset( 1, 2 ) == vec2( 0.75f, 0.25f ) );
        REQUIRE( AntiAlias::RegularGridOffset( 2, 2 ) == vec2( 0.25f, 0.75f ) );
        REQUIRE( AntiAlias::RegularGridOffset( 3, 2 ) == vec2( 0.75f, 0.75f ) );
    }

    SECTION( "samples stay inside the pixel" )
    {
        i32 n = AntiAlias::MAX_GRID_SIZE;
        REQUIRE( AntiAlias::GetIterations( n ) == n * n );
        vec2 sum( 0 );
        for ( i32 i = 0; i < AntiAlias::GetIterations( n ); ++i )
        {
            vec2 offset = AntiAlias::RegularGridOffset( i, n );
            REQUIRE( offset.x > 0 );
            REQUIRE( offset.x < 1 );
            REQUIRE( offset.y > 0 );
            REQUIRE( offset.y < 1 );
            sum += offset;
        }
        sum /= static_cast<f32>( n * n );
        REQUIRE( sum.x == Approx( 0.5f ) );
        REQUIRE( sum.y == Approx( 0.5f ) );
    }
}
