#include "pipeline/TransformStage.hpp"

#include <algorithm>

namespace SoftRaster
{
    namespace
    {
        glm::vec3 SafeNormalize( const glm::vec3& v )
        {
            float length = glm::length( v );
            return length > 0.0f ? v / length : glm::vec3( 0.0f );
        }
    } // namespace

    glm::mat3 TransformStage::NormalMatrix( const glm::mat4& model )
    {
        return glm::transpose( glm::inverse( glm::mat3( model ) ) );
    }

    void TransformStage::TransformMesh( const Mesh& mesh, const glm::mat4& model, const glm::mat4& view, const glm::mat4& projection,
                                        TransformedMesh& out )
    {
        const glm::mat4 viewProjection = projection * view;
        const glm::mat3 normalMatrix   = NormalMatrix( model );

        const std::vector<Vertex>& vertices = mesh.GetVertices();
        out.vertices.resize( vertices.size() );

        for( size_t i = 0; i < vertices.size(); ++i )
        {
            const Vertex&      in  = vertices[ i ];
            TransformedVertex& dst = out.vertices[ i ];

            glm::vec4 world = model * glm::vec4( in.position, 1.0f );

            dst.worldPos    = glm::vec3( world );
            dst.clip        = viewProjection * world;
            dst.worldNormal = SafeNormalize( normalMatrix * in.normal );
            dst.color       = in.color;
        }

        const std::vector<Tri>& tris = mesh.GetTris();
        out.faceNormals.resize( tris.size() );
        for( size_t t = 0; t < tris.size(); ++t )
        {
            out.faceNormals[ t ] = SafeNormalize( normalMatrix * tris[ t ].faceNormal );
        }
    }

    void TransformStage::AssembleTriangles( const Mesh& mesh, const TransformedMesh& transformed, RenderMode mode, std::vector<ClipTriangle>& out )
    {
        const std::vector<Tri>&      tris      = mesh.GetTris();
        const std::vector<Material>& materials = mesh.GetMaterials();

        out.reserve( out.size() + tris.size() );
        for( size_t t = 0; t < tris.size(); ++t )
        {
            const Tri&   tri = tris[ t ];
            ClipTriangle clipTri;

            for( int k = 0; k < 3; ++k )
            {
                const TransformedVertex& src = transformed.vertices[ tri.indices[ k ] ];
                ClipVertex&              dst = clipTri.vertices[ k ];

                dst.position = src.clip;
                dst.worldPos = src.worldPos;
                dst.normal   = src.worldNormal;
                dst.color    = src.color;
            }

            clipTri.faceNormal = transformed.faceNormals[ t ];
            clipTri.material   = &materials[ tri.material ];
            clipTri.mode       = mode;
            out.push_back( clipTri );
        }
    }

    void TransformStage::WorldBounds( const Mesh& mesh, const glm::mat4& model, glm::vec3& outCenter, float& outRadius )
    {
        outCenter = glm::vec3( model * glm::vec4( mesh.GetBoundsCenter(), 1.0f ) );

        float scaleX = glm::length( glm::vec3( model[ 0 ] ) );
        float scaleY = glm::length( glm::vec3( model[ 1 ] ) );
        float scaleZ = glm::length( glm::vec3( model[ 2 ] ) );
        outRadius    = mesh.GetBoundsRadius() * std::max( scaleX, std::max( scaleY, scaleZ ) );
    }
} // namespace SoftRaster
