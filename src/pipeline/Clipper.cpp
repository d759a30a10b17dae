#include "pipeline/Clipper.hpp"

#include <cmath>

namespace SoftRaster
{
    namespace
    {
        // Signed distances to the six clip-space frustum planes. Inside when >= 0.
        inline float PlaneDistance( const glm::vec4& p, int plane )
        {
            switch( plane )
            {
                case 0:
                    return p.w + p.x; // left
                case 1:
                    return p.w - p.x; // right
                case 2:
                    return p.w + p.y; // bottom
                case 3:
                    return p.w - p.y; // top
                case 4:
                    return p.z; // near (depth 0..1)
                default:
                    return p.w - p.z; // far
            }
        }
    } // namespace

    Clipper::Clipper( const ClipperConfig& config )
        : m_config( config )
    {
    }

    void Clipper::SetViewport( uint32_t width, uint32_t height )
    {
        m_config.width  = width;
        m_config.height = height;
    }

    bool Clipper::IsOutsideFrustum( const ClipTriangle& triangle )
    {
        for( int plane = 0; plane < 6; ++plane )
        {
            if( PlaneDistance( triangle.vertices[ 0 ].position, plane ) < 0.0f && PlaneDistance( triangle.vertices[ 1 ].position, plane ) < 0.0f &&
                PlaneDistance( triangle.vertices[ 2 ].position, plane ) < 0.0f )
            {
                return true;
            }
        }
        return false;
    }

    uint32_t Clipper::ClipNear( const ClipTriangle& triangle, std::array<ClipTriangle, 2>& out )
    {
        const float d[ 3 ] = { triangle.vertices[ 0 ].position.z, triangle.vertices[ 1 ].position.z, triangle.vertices[ 2 ].position.z };

        int insideCount = ( d[ 0 ] >= 0.0f ) + ( d[ 1 ] >= 0.0f ) + ( d[ 2 ] >= 0.0f );
        if( insideCount == 0 )
            return 0;

        if( insideCount == 3 )
        {
            out[ 0 ] = triangle;
            return 1;
        }

        // At most 4 vertices: each edge contributes its start (if inside) and a crossing (if any)
        ClipVertex polygon[ 4 ];
        int        count = 0;
        for( int i = 0; i < 3; ++i )
        {
            int j = ( i + 1 ) % 3;

            if( d[ i ] >= 0.0f )
                polygon[ count++ ] = triangle.vertices[ i ];

            if( ( d[ i ] < 0.0f ) != ( d[ j ] < 0.0f ) )
            {
                float t            = d[ i ] / ( d[ i ] - d[ j ] );
                polygon[ count++ ] = ClipVertex::Lerp( triangle.vertices[ i ], triangle.vertices[ j ], t );
            }
        }

        // Fan triangulation keeps the input winding
        uint32_t produced = 0;
        for( int k = 1; k + 1 < count; ++k )
        {
            ClipTriangle& dst  = out[ produced++ ];
            dst                = triangle;
            dst.vertices[ 0 ]  = polygon[ 0 ];
            dst.vertices[ 1 ]  = polygon[ k ];
            dst.vertices[ 2 ]  = polygon[ k + 1 ];
        }
        return produced;
    }

    ScreenVertex Clipper::ProjectVertex( const ClipVertex& vertex ) const
    {
        const float invW = 1.0f / vertex.position.w;
        const float ndcX = vertex.position.x * invW;
        const float ndcY = vertex.position.y * invW;

        ScreenVertex out;
        out.position.x = ( ndcX + 1.0f ) * 0.5f * static_cast<float>( m_config.width );
        out.position.y = ( 1.0f - ndcY ) * 0.5f * static_cast<float>( m_config.height );
        out.depth      = vertex.position.z * invW;
        out.invW       = invW;
        out.worldPos   = vertex.worldPos;
        out.normal     = vertex.normal;
        out.color      = vertex.color;
        return out;
    }

    float Clipper::SignedArea2( const glm::vec2& a, const glm::vec2& b, const glm::vec2& c )
    {
        return ( b.x - a.x ) * ( c.y - a.y ) - ( b.y - a.y ) * ( c.x - a.x );
    }

    uint32_t Clipper::ProcessTriangle( const ClipTriangle& triangle, std::vector<ScreenTriangle>& out, ClipStats* stats ) const
    {
        if( IsOutsideFrustum( triangle ) )
        {
            if( stats )
                stats->culledFrustum++;
            return 0;
        }

        std::array<ClipTriangle, 2> pieces;
        uint32_t                    pieceCount = ClipNear( triangle, pieces );

        const bool split = triangle.vertices[ 0 ].position.z < 0.0f || triangle.vertices[ 1 ].position.z < 0.0f || triangle.vertices[ 2 ].position.z < 0.0f;
        if( stats && split && pieceCount > 0 )
            stats->nearClipped++;

        uint32_t emitted = 0;
        for( uint32_t p = 0; p < pieceCount; ++p )
        {
            const ClipTriangle& piece = pieces[ p ];

            // Projections that put z >= 0 behind the eye would still reach w <= 0 here; never divide those
            if( piece.vertices[ 0 ].position.w <= 0.0f || piece.vertices[ 1 ].position.w <= 0.0f || piece.vertices[ 2 ].position.w <= 0.0f )
            {
                if( stats )
                    stats->culledDegenerate++;
                continue;
            }

            ScreenTriangle screen;
            for( int k = 0; k < 3; ++k )
                screen.vertices[ k ] = ProjectVertex( piece.vertices[ k ] );

            float area2 = SignedArea2( screen.vertices[ 0 ].position, screen.vertices[ 1 ].position, screen.vertices[ 2 ].position );
            if( area2 == 0.0f || !std::isfinite( area2 ) )
            {
                if( stats )
                    stats->culledDegenerate++;
                continue;
            }

            if( m_config.backfaceCulling && area2 > 0.0f )
            {
                if( stats )
                    stats->culledBackface++;
                continue;
            }

            screen.faceNormal = piece.faceNormal;
            screen.centroid   = ( piece.vertices[ 0 ].worldPos + piece.vertices[ 1 ].worldPos + piece.vertices[ 2 ].worldPos ) / 3.0f;
            screen.material   = piece.material;
            screen.mode       = piece.mode;
            out.push_back( screen );
            emitted++;
        }
        return emitted;
    }
} // namespace SoftRaster
