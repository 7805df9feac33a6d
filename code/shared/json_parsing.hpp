#pragma once

#include "rapidjson/document.h"
#include "shared/assert.hpp"
#include "shared/logger.hpp"
#include "shared/math_vec.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

bool ParseJSONFile( std::string_view filename, rapidjson::Document& document );

template <typename T>
T ParseNumber( const rapidjson::Value& v )
{
    RD_ASSERT( v.IsNumber() );
    return v.Get<T>();
}

vec3 ParseVec3( const rapidjson::Value& v );
ivec2 ParseIVec2( const rapidjson::Value& v );
std::string ParseString( const rapidjson::Value& v );

template <typename... Args>
class JSONFunctionMapper
{
public:
    using FunctionType    = std::function<void( const rapidjson::Value&, Args... )>;
    using StringToFuncMap = std::unordered_map<std::string, FunctionType>;

    JSONFunctionMapper( const StringToFuncMap& m ) : mapping( m ) {}

    void ForEachMember( const rapidjson::Value& v, Args&... args ) const
    {
        for ( auto it = v.MemberBegin(); it != v.MemberEnd(); ++it )
        {
            std::string name = it->name.GetString();
            auto funcIt      = mapping.find( name );
            if ( funcIt != mapping.end() )
            {
                funcIt->second( it->value, std::forward<Args>( args )... );
            }
            else
            {
                LOG_WARN( "JSON mapper does not contain key '%s'", name.c_str() );
            }
        }
    }

    StringToFuncMap mapping;
};

template <typename... Args>
class JSONFunctionMapperBoolCheck
{
    using function_type = std::function<bool( const rapidjson::Value&, Args... )>;
    using map_type      = std::unordered_map<std::string, function_type>;

public:
    JSONFunctionMapperBoolCheck( const map_type& m ) : mapping( m ) {}

    // Unknown keys are an error, since they usually mean a typo in an object type
    bool ForEachMember( const rapidjson::Value& v, Args&... args ) const
    {
        for ( auto it = v.MemberBegin(); it != v.MemberEnd(); ++it )
        {
            std::string name = it->name.GetString();
            auto funcIt      = mapping.find( name );
            if ( funcIt == mapping.end() )
            {
                LOG_ERR( "Unknown JSON key '%s'", name.c_str() );
                return false;
            }

            if ( !funcIt->second( it->value, std::forward<Args>( args )... ) )
            {
                return false;
            }
        }

        return true;
    }

    map_type mapping;
};
