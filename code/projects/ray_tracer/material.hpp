#pragma once

#include "shared/math_vec.hpp"
#include <string>

namespace RT
{

enum class MaterialType : u8
{
    DIFFUSE,
    REFLECTIVE,
    REFRACTIVE,

    COUNT
};

// Case sensitive: "Diffuse", "Reflective" or "Refractive". Returns false on unknown names
bool MaterialTypeFromString( const std::string& str, MaterialType& type );

const char* MaterialTypeToString( MaterialType type );

struct Material
{
    Material() = default;
    Material( MaterialType t, const vec3& c, f32 ior = 1.5f ) : type( t ), color( c ), refractiveIndex( ior ) {}

    bool IsRefractive() const { return type == MaterialType::REFRACTIVE; }

    std::string name;
    MaterialType type   = MaterialType::DIFFUSE;
    vec3 color          = vec3( 1 );
    f32 refractiveIndex = 1.5f; // only used by refractive materials
};

} // namespace RT
