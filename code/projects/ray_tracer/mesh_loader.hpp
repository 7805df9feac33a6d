#pragma once

#include "mesh.hpp"
#include <memory>
#include <string>

namespace RT
{

// Loads every mesh in the model file into a single Mesh. Vertices are transformed by scale * v + offset.
// Triangles are smooth shaded when the file has normals and flat shaded otherwise. Returns nullptr on failure
std::shared_ptr<Mesh> LoadMesh( const std::string& filename, const vec3& offset, f32 scale, std::shared_ptr<Material> material );

} // namespace RT
