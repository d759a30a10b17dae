#include "pipeline/Rasterizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace SoftRaster
{
    namespace
    {
        // Inclusive pixel rectangle
        struct PixelRect
        {
            int32_t x0 = 0;
            int32_t y0 = 0;
            int32_t x1 = -1;
            int32_t y1 = -1;

            bool IsEmpty() const { return x0 > x1 || y0 > y1; }
        };

        // Pixels whose centers fall inside [minX, maxX] x [minY, maxY], clipped to the chunk
        PixelRect CenterBounds( float minX, float minY, float maxX, float maxY, const Chunk& chunk )
        {
            PixelRect rect;
            if( chunk.width == 0 || chunk.GetRowCount() == 0 )
                return rect;

            // Clamp in float first, the bounds of a near-clipped triangle can exceed the int range
            float fx0 = std::max( std::ceil( minX - 0.5f ), 0.0f );
            float fx1 = std::min( std::floor( maxX - 0.5f ), static_cast<float>( chunk.width - 1 ) );
            float fy0 = std::max( std::ceil( minY - 0.5f ), static_cast<float>( chunk.rowBegin ) );
            float fy1 = std::min( std::floor( maxY - 0.5f ), static_cast<float>( chunk.rowEnd - 1 ) );
            if( !( fx0 <= fx1 && fy0 <= fy1 ) )
                return rect;

            rect.x0 = static_cast<int32_t>( fx0 );
            rect.x1 = static_cast<int32_t>( fx1 );
            rect.y0 = static_cast<int32_t>( fy0 );
            rect.y1 = static_cast<int32_t>( fy1 );
            return rect;
        }

        // Liang-Barsky against [0, width] x [0, height]; narrows [t0, t1]
        bool ClipSegment( const glm::vec2& p0, const glm::vec2& p1, float width, float height, float& t0, float& t1 )
        {
            const glm::vec2 d   = p1 - p0;
            const float     p[ 4 ] = { -d.x, d.x, -d.y, d.y };
            const float     q[ 4 ] = { p0.x, width - p0.x, p0.y, height - p0.y };

            for( int i = 0; i < 4; ++i )
            {
                if( p[ i ] == 0.0f )
                {
                    if( q[ i ] < 0.0f )
                        return false;
                    continue;
                }

                float r = q[ i ] / p[ i ];
                if( p[ i ] < 0.0f )
                {
                    if( r > t1 )
                        return false;
                    t0 = std::max( t0, r );
                }
                else
                {
                    if( r < t0 )
                        return false;
                    t1 = std::min( t1, r );
                }
            }
            return t0 <= t1;
        }

        inline int64_t EdgeFunctionFixed( int64_t ax, int64_t ay, int64_t bx, int64_t by, int64_t px, int64_t py )
        {
            return ( bx - ax ) * ( py - ay ) - ( by - ay ) * ( px - ax );
        }

        inline bool IsTopLeftFixed( int64_t ax, int64_t ay, int64_t bx, int64_t by )
        {
            return ( ay == by && bx > ax ) || by < ay;
        }

        inline bool Inside( float e, bool topLeft ) { return e > 0.0f || ( e == 0.0f && topLeft ); }
        inline bool Inside( int64_t e, bool topLeft ) { return e > 0 || ( e == 0 && topLeft ); }

        // Written relative to the first vertex so that equal inputs give back exactly that value
        inline float Affine( const glm::vec3& bary, float v0, float v1, float v2 )
        {
            return v0 + bary.y * ( v1 - v0 ) + bary.z * ( v2 - v0 );
        }

        // Magnitude limit for doubled fixed point coordinates (vertices and pixel centers).
        // Differences then fit in 31 bits, each edge product in 62 and the edge function in 63.
        constexpr int64_t FIXED_COORD_LIMIT = 1ll << 30;

        // True when every pixel center of the chunk is representable under FIXED_COORD_LIMIT
        inline bool ChunkFitsFixed( const Chunk& chunk, int64_t unit )
        {
            const int64_t extent = std::max<int64_t>( chunk.width, chunk.rowEnd );
            return ( 2 * extent + 1 ) * unit < FIXED_COORD_LIMIT;
        }
    } // namespace

    Rasterizer::Rasterizer( const RasterizerConfig& config )
        : m_config( config )
    {
    }

    float Rasterizer::QuantizeDepth( float depth, uint32_t bits )
    {
        const float scale = static_cast<float>( 1u << bits );
        return std::round( depth * scale ) / scale;
    }

    uint32_t Rasterizer::DrawTriangle( const ScreenTriangle& triangle, const Chunk& chunk, GBuffer& gbuffer ) const
    {
        switch( triangle.mode )
        {
            case RenderMode::SOLID:
                return FillTriangle( triangle, chunk, gbuffer );
            case RenderMode::WIREFRAME:
                return DrawWireframe( triangle, chunk, gbuffer );
            case RenderMode::FIXED_POINT:
                return FillTriangleFixed( triangle, chunk, gbuffer );
            default:
                return 0;
        }
    }

    Fragment Rasterizer::MakeFragment( const ScreenTriangle& triangle, uint32_t x, uint32_t y, const glm::vec3& bary, float depth ) const
    {
        const ScreenVertex& v0 = triangle.vertices[ 0 ];
        const ScreenVertex& v1 = triangle.vertices[ 1 ];
        const ScreenVertex& v2 = triangle.vertices[ 2 ];

        Fragment fragment;
        fragment.x        = x;
        fragment.y        = y;
        fragment.depth    = depth;
        fragment.bary     = bary;
        fragment.material = triangle.material;
        fragment.unlit    = triangle.mode == RenderMode::WIREFRAME;

        // Perspective-correct weights
        glm::vec3 weights = bary;
        float     invW    = Affine( bary, v0.invW, v1.invW, v2.invW );
        if( invW > 0.0f )
            weights = glm::vec3( bary.x * v0.invW, bary.y * v1.invW, bary.z * v2.invW ) / invW;

        fragment.color = weights.x * v0.color + weights.y * v1.color + weights.z * v2.color;

        if( m_config.shadingModel == ShadingModel::FLAT )
        {
            fragment.normal   = triangle.faceNormal;
            fragment.worldPos = triangle.centroid;
        }
        else
        {
            glm::vec3 normal  = weights.x * v0.normal + weights.y * v1.normal + weights.z * v2.normal;
            float     length  = glm::length( normal );
            fragment.normal   = length > 0.0f ? normal / length : triangle.faceNormal;
            fragment.worldPos = weights.x * v0.worldPos + weights.y * v1.worldPos + weights.z * v2.worldPos;
        }
        return fragment;
    }

    uint32_t Rasterizer::FillTriangle( const ScreenTriangle& triangle, const Chunk& chunk, GBuffer& gbuffer ) const
    {
        float area2 = EdgeFunction( triangle.vertices[ 0 ].position, triangle.vertices[ 1 ].position, triangle.vertices[ 2 ].position );
        if( area2 == 0.0f || !std::isfinite( area2 ) )
            return 0;

        // Walk the vertices so the area is positive; barycentrics are mapped back to the original order
        int i1 = 1;
        int i2 = 2;
        if( area2 < 0.0f )
        {
            std::swap( i1, i2 );
            area2 = -area2;
        }

        const glm::vec2& a = triangle.vertices[ 0 ].position;
        const glm::vec2& b = triangle.vertices[ i1 ].position;
        const glm::vec2& c = triangle.vertices[ i2 ].position;

        PixelRect rect = CenterBounds( std::min( { a.x, b.x, c.x } ), std::min( { a.y, b.y, c.y } ), std::max( { a.x, b.x, c.x } ),
                                       std::max( { a.y, b.y, c.y } ), chunk );
        if( rect.IsEmpty() )
            return 0;

        const bool  topLeft0 = IsTopLeft( b, c );
        const bool  topLeft1 = IsTopLeft( c, a );
        const bool  topLeft2 = IsTopLeft( a, b );
        const float invArea  = 1.0f / area2;

        const float d0 = triangle.vertices[ 0 ].depth;
        const float d1 = triangle.vertices[ 1 ].depth;
        const float d2 = triangle.vertices[ 2 ].depth;

        uint32_t written = 0;
        for( int32_t y = rect.y0; y <= rect.y1; ++y )
        {
            for( int32_t x = rect.x0; x <= rect.x1; ++x )
            {
                const glm::vec2 p( static_cast<float>( x ) + 0.5f, static_cast<float>( y ) + 0.5f );

                float e0 = EdgeFunction( b, c, p );
                if( !Inside( e0, topLeft0 ) )
                    continue;
                float e1 = EdgeFunction( c, a, p );
                if( !Inside( e1, topLeft1 ) )
                    continue;
                float e2 = EdgeFunction( a, b, p );
                if( !Inside( e2, topLeft2 ) )
                    continue;

                glm::vec3 bary;
                bary[ 0 ]  = e0 * invArea;
                bary[ i1 ] = e1 * invArea;
                bary[ i2 ] = e2 * invArea;

                Fragment fragment = MakeFragment( triangle, static_cast<uint32_t>( x ), static_cast<uint32_t>( y ), bary, Affine( bary, d0, d1, d2 ) );
                if( gbuffer.TestAndWrite( fragment ) )
                    written++;
            }
        }
        return written;
    }

    uint32_t Rasterizer::FillTriangleFixed( const ScreenTriangle& triangle, const Chunk& chunk, GBuffer& gbuffer ) const
    {
        const double  scale = static_cast<double>( 1u << m_config.subpixelBits );
        const int64_t unit  = static_cast<int64_t>( 1u << m_config.subpixelBits );

        // Out of integer range: huge subpixel precision on a huge chunk, or a vertex far off screen after a near clip
        if( !ChunkFitsFixed( chunk, unit ) )
            return FillTriangle( triangle, chunk, gbuffer );

        // Positions are held at twice the subpixel resolution so pixel centers stay integral even with 0 bits
        const double vertexLimit = static_cast<double>( FIXED_COORD_LIMIT / 2 );
        int64_t      X[ 3 ];
        int64_t      Y[ 3 ];
        for( int i = 0; i < 3; ++i )
        {
            const double qx = static_cast<double>( triangle.vertices[ i ].position.x ) * scale;
            const double qy = static_cast<double>( triangle.vertices[ i ].position.y ) * scale;
            if( !( std::abs( qx ) < vertexLimit - 1.0 && std::abs( qy ) < vertexLimit - 1.0 ) )
                return FillTriangle( triangle, chunk, gbuffer );

            X[ i ] = std::llround( qx ) * 2;
            Y[ i ] = std::llround( qy ) * 2;
        }

        int64_t area2 = EdgeFunctionFixed( X[ 0 ], Y[ 0 ], X[ 1 ], Y[ 1 ], X[ 2 ], Y[ 2 ] );
        if( area2 == 0 )
            return 0;

        int i1 = 1;
        int i2 = 2;
        if( area2 < 0 )
        {
            std::swap( i1, i2 );
            area2 = -area2;
        }

        const int64_t ax = X[ 0 ], ay = Y[ 0 ];
        const int64_t bx = X[ i1 ], by = Y[ i1 ];
        const int64_t cx = X[ i2 ], cy = Y[ i2 ];

        const float toPixels = static_cast<float>( 1.0 / ( 2.0 * scale ) );
        PixelRect   rect     = CenterBounds( static_cast<float>( std::min( { ax, bx, cx } ) ) * toPixels, static_cast<float>( std::min( { ay, by, cy } ) ) * toPixels,
                                             static_cast<float>( std::max( { ax, bx, cx } ) ) * toPixels, static_cast<float>( std::max( { ay, by, cy } ) ) * toPixels, chunk );
        if( rect.IsEmpty() )
            return 0;

        const bool   topLeft0 = IsTopLeftFixed( bx, by, cx, cy );
        const bool   topLeft1 = IsTopLeftFixed( cx, cy, ax, ay );
        const bool   topLeft2 = IsTopLeftFixed( ax, ay, bx, by );
        const double invArea  = 1.0 / static_cast<double>( area2 );

        const float d0 = triangle.vertices[ 0 ].depth;
        const float d1 = triangle.vertices[ 1 ].depth;
        const float d2 = triangle.vertices[ 2 ].depth;

        uint32_t written = 0;
        for( int32_t y = rect.y0; y <= rect.y1; ++y )
        {
            const int64_t py = ( 2 * static_cast<int64_t>( y ) + 1 ) * unit;
            for( int32_t x = rect.x0; x <= rect.x1; ++x )
            {
                const int64_t px = ( 2 * static_cast<int64_t>( x ) + 1 ) * unit;

                int64_t e0 = EdgeFunctionFixed( bx, by, cx, cy, px, py );
                if( !Inside( e0, topLeft0 ) )
                    continue;
                int64_t e1 = EdgeFunctionFixed( cx, cy, ax, ay, px, py );
                if( !Inside( e1, topLeft1 ) )
                    continue;
                int64_t e2 = EdgeFunctionFixed( ax, ay, bx, by, px, py );
                if( !Inside( e2, topLeft2 ) )
                    continue;

                glm::vec3 bary;
                bary[ 0 ]  = static_cast<float>( static_cast<double>( e0 ) * invArea );
                bary[ i1 ] = static_cast<float>( static_cast<double>( e1 ) * invArea );
                bary[ i2 ] = static_cast<float>( static_cast<double>( e2 ) * invArea );

                float    depth    = QuantizeDepth( Affine( bary, d0, d1, d2 ), m_config.depthBits );
                Fragment fragment = MakeFragment( triangle, static_cast<uint32_t>( x ), static_cast<uint32_t>( y ), bary, depth );
                if( gbuffer.TestAndWrite( fragment ) )
                    written++;
            }
        }
        return written;
    }

    uint32_t Rasterizer::DrawWireframe( const ScreenTriangle& triangle, const Chunk& chunk, GBuffer& gbuffer ) const
    {
        uint32_t written = 0;
        written += DrawEdge( triangle, 0, 1, chunk, gbuffer );
        written += DrawEdge( triangle, 1, 2, chunk, gbuffer );
        written += DrawEdge( triangle, 2, 0, chunk, gbuffer );
        return written;
    }

    uint32_t Rasterizer::DrawEdge( const ScreenTriangle& triangle, int a, int b, const Chunk& chunk, GBuffer& gbuffer ) const
    {
        const ScreenVertex& va = triangle.vertices[ a ];
        const ScreenVertex& vb = triangle.vertices[ b ];

        const int32_t width  = static_cast<int32_t>( gbuffer.GetWidth() );
        const int32_t height = static_cast<int32_t>( gbuffer.GetHeight() );
        if( width == 0 || height == 0 )
            return 0;

        // Clip to the screen, not the chunk, so every chunk walks the same pixels
        float t0 = 0.0f;
        float t1 = 1.0f;
        if( !ClipSegment( va.position, vb.position, static_cast<float>( width ), static_cast<float>( height ), t0, t1 ) )
            return 0;

        const glm::vec2 q0 = glm::mix( va.position, vb.position, t0 );
        const glm::vec2 q1 = glm::mix( va.position, vb.position, t1 );

        int32_t x0 = std::clamp( static_cast<int32_t>( std::floor( q0.x ) ), 0, width - 1 );
        int32_t y0 = std::clamp( static_cast<int32_t>( std::floor( q0.y ) ), 0, height - 1 );
        int32_t x1 = std::clamp( static_cast<int32_t>( std::floor( q1.x ) ), 0, width - 1 );
        int32_t y1 = std::clamp( static_cast<int32_t>( std::floor( q1.y ) ), 0, height - 1 );

        if( std::max( y0, y1 ) < static_cast<int32_t>( chunk.rowBegin ) || std::min( y0, y1 ) >= static_cast<int32_t>( chunk.rowEnd ) )
            return 0;

        const float depth0 = va.depth + ( vb.depth - va.depth ) * t0;
        const float depth1 = va.depth + ( vb.depth - va.depth ) * t1;

        const int32_t dx        = std::abs( x1 - x0 );
        const int32_t dy        = -std::abs( y1 - y0 );
        const int32_t sx        = x0 < x1 ? 1 : -1;
        const int32_t sy        = y0 < y1 ? 1 : -1;
        const bool    xMajor    = dx >= -dy;
        const int32_t steps     = xMajor ? dx : -dy;
        int32_t       error     = dx + dy;
        int32_t       x         = x0;
        int32_t       y         = y0;
        uint32_t      written   = 0;

        while( true )
        {
            if( chunk.Contains( x, y ) )
            {
                const int32_t step = xMajor ? std::abs( x - x0 ) : std::abs( y - y0 );
                const float   t    = steps > 0 ? static_cast<float>( step ) / static_cast<float>( steps ) : 0.0f;
                const float   s    = t0 + ( t1 - t0 ) * t; // position along the original edge

                glm::vec3 bary( 0.0f );
                bary[ a ] = 1.0f - s;
                bary[ b ] = s;

                Fragment fragment = MakeFragment( triangle, static_cast<uint32_t>( x ), static_cast<uint32_t>( y ), bary, depth0 + ( depth1 - depth0 ) * t );
                if( gbuffer.TestAndWrite( fragment ) )
                    written++;
            }

            if( x == x1 && y == y1 )
                break;

            const int32_t e2 = 2 * error;
            if( e2 >= dy )
            {
                error += dy;
                x += sx;
            }
            if( e2 <= dx )
            {
                error += dx;
                y += sy;
            }
        }
        return written;
    }
} // namespace SoftRaster
