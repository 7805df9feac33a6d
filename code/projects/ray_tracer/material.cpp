#include "material.hpp"
#include "shared/assert.hpp"

namespace RT
{

static const char* s_materialTypeNames[] = {
    "Diffuse",    // DIFFUSE
    "Reflective", // REFLECTIVE
    "Refractive", // REFRACTIVE
};
static_assert( ARRAY_COUNT( s_materialTypeNames ) == static_cast<i32>( MaterialType::COUNT ), "Forgot to update this" );

bool MaterialTypeFromString( const std::string& str, MaterialType& type )
{
    for ( i32 i = 0; i < static_cast<i32>( MaterialType::COUNT ); ++i )
    {
        if ( str == s_materialTypeNames[i] )
        {
            type = static_cast<MaterialType>( i );
            return true;
        }
    }

    return false;
}

const char* MaterialTypeToString( MaterialType type )
{
    RD_ASSERT( type < MaterialType::COUNT );
    return s_materialTypeNames[static_cast<i32>( type )];
}

} // namespace RT
