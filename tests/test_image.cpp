#include "image.hpp"
#include "test_helpers.hpp"
#include <filesystem>

using namespace RT;
namespace fs = std::filesystem;

TEST_CASE( "Float images", "[image]" )
{
    FloatImage2D image( 3, 2 );
    REQUIRE( image.Width() == 3 );
    REQUIRE( image.Height() == 2 );
    REQUIRE( image.GetPixel( 2, 1 ) == vec3( 0 ) );

    image.SetPixel( 2, 1, vec3( 0.25f, 2.0f, -1.0f ) );
    image.SetPixel( 0, 0, vec3( 1, 0, 0 ) );
    REQUIRE( image.GetPixel( 2, 1 ) == vec3( 0.25f, 2.0f, -1.0f ) );
    REQUIRE( image.GetPixel( 0, 0 ) == vec3( 1, 0, 0 ) );

    const fs::path dir = fs::temp_directory_path();

    SECTION( "saving supported formats" )
    {
        for ( const char* name : { "radiant_test_image.png", "radiant_test_image.hdr", "radiant_test_image.bmp", "radiant_test_image.TGA" } )
        {
            fs::path path = dir / name;
            fs::remove( path );
            REQUIRE( image.Save( path.string() ) );
            REQUIRE( fs::exists( path ) );
            REQUIRE( fs::file_size( path ) > 0 );
            fs::remove( path );
        }
    }

    SECTION( "unknown extensions fail" ) { REQUIRE_FALSE( image.Save( ( dir / "radiant_test_image.xyz" ).string() ) ); }
}
