#include "shared/json_parsing.hpp"
#include "rapidjson/error/en.h"
#include "rapidjson/error/error.h"
#include "rapidjson/filereadstream.h"
#include <vector>

vec3 ParseVec3( const rapidjson::Value& v )
{
    RD_ASSERT( v.IsArray() && v.Size() == 3 );
    return vec3( ParseNumber<f32>( v[0] ), ParseNumber<f32>( v[1] ), ParseNumber<f32>( v[2] ) );
}

ivec2 ParseIVec2( const rapidjson::Value& v )
{
    RD_ASSERT( v.IsArray() && v.Size() == 2 );
    return ivec2( ParseNumber<i32>( v[0] ), ParseNumber<i32>( v[1] ) );
}

std::string ParseString( const rapidjson::Value& v )
{
    RD_ASSERT( v.IsString() );
    return v.GetString();
}

bool ParseJSONFile( std::string_view filename, rapidjson::Document& document )
{
    std::string name( filename );
    FILE* fp = fopen( name.c_str(), "rb" );
    if ( fp == NULL )
    {
        LOG_ERR( "Could not open json file '%s'", name.c_str() );
        return false;
    }
    fseek( fp, 0L, SEEK_END );
    auto fileSize = ftell( fp ) + 1;
    fseek( fp, 0L, SEEK_SET );
    std::vector<char> buffer( fileSize );
    rapidjson::FileReadStream is( fp, buffer.data(), fileSize );

    rapidjson::ParseResult ok = document.ParseStream( is );
    fclose( fp );
    if ( !ok )
    {
        LOG_ERR( "Failed to parse json file '%s'. Error: '%s' (%zu)", name.c_str(), rapidjson::GetParseError_En( ok.Code() ), ok.Offset() );
        return false;
    }

    return true;
}
