#include "scene/Mesh.h"

#include "core/Log.h"
#include <algorithm>

namespace SoftRaster
{
    Mesh::Mesh( std::string name )
        : m_name( std::move( name ) )
    {
    }

    uint32_t Mesh::AddVertex( const Vertex& vertex )
    {
        m_vertices.push_back( vertex );
        m_finalized = false;
        return static_cast<uint32_t>( m_vertices.size() - 1 );
    }

    uint32_t Mesh::AddMaterial( const Material& material )
    {
        m_materials.push_back( material );
        m_finalized = false;
        return static_cast<uint32_t>( m_materials.size() - 1 );
    }

    void Mesh::AddTri( uint32_t i0, uint32_t i1, uint32_t i2, uint32_t material )
    {
        Tri tri;
        tri.indices[ 0 ] = i0;
        tri.indices[ 1 ] = i1;
        tri.indices[ 2 ] = i2;
        tri.material     = material;
        m_tris.push_back( tri );
        m_finalized = false;
    }

    Result Mesh::Finalize()
    {
        if( m_vertices.empty() )
        {
            SR_ERROR( "Mesh '{}' has no vertices.", m_name );
            return Result::INVALID_ARGS;
        }

        if( m_tris.empty() )
        {
            SR_ERROR( "Mesh '{}' has no triangles.", m_name );
            return Result::INVALID_ARGS;
        }

        if( m_materials.empty() )
        {
            m_materials.emplace_back();
        }

        const uint32_t vertexCount   = static_cast<uint32_t>( m_vertices.size() );
        const uint32_t materialCount = static_cast<uint32_t>( m_materials.size() );

        for( size_t t = 0; t < m_tris.size(); ++t )
        {
            const Tri& tri = m_tris[ t ];
            for( uint32_t index: tri.indices )
            {
                if( index >= vertexCount )
                {
                    SR_ERROR( "Mesh '{}': triangle {} references vertex {} (vertex count {}).", m_name, t, index, vertexCount );
                    return Result::INVALID_ARGS;
                }
            }

            if( tri.material >= materialCount )
            {
                SR_ERROR( "Mesh '{}': triangle {} references material {} (material count {}).", m_name, t, tri.material, materialCount );
                return Result::INVALID_ARGS;
            }
        }

        ComputeFaceNormals();
        ComputeVertexNormals();
        ComputeBounds();

        m_finalized = true;
        return Result::SUCCESS;
    }

    void Mesh::ComputeFaceNormals()
    {
        for( Tri& tri: m_tris )
        {
            const glm::vec3& p0 = m_vertices[ tri.indices[ 0 ] ].position;
            const glm::vec3& p1 = m_vertices[ tri.indices[ 1 ] ].position;
            const glm::vec3& p2 = m_vertices[ tri.indices[ 2 ] ].position;

            // CCW winding faces the viewer
            glm::vec3 n = glm::cross( p1 - p0, p2 - p0 );
            float     l = glm::length( n );

            // Degenerate faces keep a zero normal; the clipper drops them anyway
            tri.faceNormal = l > 0.0f ? n / l : glm::vec3( 0.0f );
        }
    }

    void Mesh::ComputeVertexNormals()
    {
        bool missing = std::any_of( m_vertices.begin(), m_vertices.end(), []( const Vertex& v ) { return glm::dot( v.normal, v.normal ) == 0.0f; } );
        if( !missing )
        {
            for( Vertex& v: m_vertices )
                v.normal = glm::normalize( v.normal );
            return;
        }

        // Area-weighted average of adjacent faces, only for vertices without an authored normal
        std::vector<glm::vec3> accumulated( m_vertices.size(), glm::vec3( 0.0f ) );
        for( const Tri& tri: m_tris )
        {
            const glm::vec3& p0       = m_vertices[ tri.indices[ 0 ] ].position;
            const glm::vec3& p1       = m_vertices[ tri.indices[ 1 ] ].position;
            const glm::vec3& p2       = m_vertices[ tri.indices[ 2 ] ].position;
            glm::vec3        weighted = glm::cross( p1 - p0, p2 - p0 );

            for( uint32_t index: tri.indices )
                accumulated[ index ] += weighted;
        }

        for( size_t i = 0; i < m_vertices.size(); ++i )
        {
            Vertex& v = m_vertices[ i ];
            if( glm::dot( v.normal, v.normal ) == 0.0f )
            {
                float l  = glm::length( accumulated[ i ] );
                v.normal = l > 0.0f ? accumulated[ i ] / l : glm::vec3( 0.0f, 1.0f, 0.0f );
            }
            else
            {
                v.normal = glm::normalize( v.normal );
            }
        }
    }

    void Mesh::ComputeBounds()
    {
        glm::vec3 minP = m_vertices.front().position;
        glm::vec3 maxP = minP;
        for( const Vertex& v: m_vertices )
        {
            minP = glm::min( minP, v.position );
            maxP = glm::max( maxP, v.position );
        }

        m_boundsCenter = ( minP + maxP ) * 0.5f;
        m_boundsRadius = 0.0f;
        for( const Vertex& v: m_vertices )
        {
            m_boundsRadius = std::max( m_boundsRadius, glm::length( v.position - m_boundsCenter ) );
        }
    }
} // namespace SoftRaster
