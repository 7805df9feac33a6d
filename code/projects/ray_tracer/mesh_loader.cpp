#include "mesh_loader.hpp"
#include "assimp/Importer.hpp"
#include "assimp/postprocess.h"
#include "assimp/scene.h"
#include "core/time.hpp"
#include "shared/logger.hpp"

using namespace RD;

namespace RT
{

static vec3 ToVec3( const aiVector3D& v ) { return vec3( v.x, v.y, v.z ); }

std::shared_ptr<Mesh> LoadMesh( const std::string& filename, const vec3& offset, f32 scale, std::shared_ptr<Material> material )
{
    auto loadStart = Time::GetTimePoint();
    Assimp::Importer importer;
    const aiScene* scene = importer.ReadFile( filename.c_str(), aiProcess_Triangulate | aiProcess_JoinIdenticalVertices |
                                                                    aiProcess_SortByPType | aiProcess_FindDegenerates );
    if ( !scene || !scene->mRootNode )
    {
        LOG_ERR( "Error parsing model file '%s': '%s'", filename.c_str(), importer.GetErrorString() );
        return nullptr;
    }

    std::vector<Triangle> triangles;
    AABB aabb;
    u32 numFlatMeshes = 0;
    for ( u32 meshIdx = 0; meshIdx < scene->mNumMeshes; ++meshIdx )
    {
        const aiMesh* paiMesh = scene->mMeshes[meshIdx];
        if ( !( paiMesh->mPrimitiveTypes & aiPrimitiveType_TRIANGLE ) )
        {
            continue;
        }

        std::vector<vec3> positions( paiMesh->mNumVertices );
        for ( u32 vIdx = 0; vIdx < paiMesh->mNumVertices; ++vIdx )
        {
            positions[vIdx] = scale * ToVec3( paiMesh->mVertices[vIdx] ) + offset;
            aabb.Encompass( positions[vIdx] );
        }

        const bool hasNormals = paiMesh->HasNormals();
        numFlatMeshes += hasNormals ? 0 : 1;
        triangles.reserve( triangles.size() + paiMesh->mNumFaces );
        for ( u32 faceIdx = 0; faceIdx < paiMesh->mNumFaces; ++faceIdx )
        {
            const aiFace& face = paiMesh->mFaces[faceIdx];
            if ( face.mNumIndices != 3 )
            {
                continue;
            }

            // a negative scale mirrors the model, which turns it inside out. Reverse the winding and the
            // normals so the faces keep pointing outward
            u32 i0 = face.mIndices[0];
            u32 i1 = face.mIndices[scale < 0 ? 2 : 1];
            u32 i2 = face.mIndices[scale < 0 ? 1 : 2];
            if ( hasNormals )
            {
                f32 sign = scale < 0 ? -1.0f : 1.0f;
                vec3 n0  = sign * ToVec3( paiMesh->mNormals[i0] );
                vec3 n1  = sign * ToVec3( paiMesh->mNormals[i1] );
                vec3 n2  = sign * ToVec3( paiMesh->mNormals[i2] );
                triangles.emplace_back( positions[i0], positions[i1], positions[i2], n0, n1, n2, material );
            }
            else
            {
                triangles.emplace_back( positions[i0], positions[i1], positions[i2], material );
            }
        }
    }

    if ( triangles.empty() )
    {
        LOG_ERR( "Model file '%s' does not contain any triangles", filename.c_str() );
        return nullptr;
    }
    if ( numFlatMeshes )
    {
        LOG_WARN( "%u meshes in '%s' have no normals, using flat shading for them", numFlatMeshes, filename.c_str() );
    }

    LOG( "Loaded model '%s' with %zu triangles in %.2f ms", filename.c_str(), triangles.size(), Time::GetTimeSince( loadStart ) );
    return std::make_shared<Mesh>( std::move( triangles ), aabb, material );
}

} // namespace RT
