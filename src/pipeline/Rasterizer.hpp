#pragma once

#include "pipeline/GBuffer.hpp"

namespace SoftRaster
{
    struct RasterizerConfig
    {
        ShadingModel shadingModel = ShadingModel::BLINN_PHONG;

        // FixedPoint render mode: fractional bits of the screen positions and of the depth
        uint32_t subpixelBits = 4;
        uint32_t depthBits    = 16;
    };

    /**
     * @brief Scan-converts screen triangles into the G-Buffer, one chunk at a time.
     *
     * Attribute interpolation contract:
     *  - depth (z / w) is affine in screen space and interpolated with the plain barycentrics;
     *  - world position, normal and color are perspective-correct: attr * invW is interpolated and
     *    divided by the interpolated invW.
     * In Flat shading the face normal and the world-space centroid replace the interpolated normal and position.
     *
     * Coverage uses pixel centers (x + 0.5, y + 0.5) and the top-left fill rule, so two triangles sharing an
     * edge cover each pixel on it exactly once. Edge functions are evaluated per pixel from the triangle
     * vertices, which makes the result independent of the chunk layout.
     *
     * A Rasterizer holds configuration only; DrawTriangle is const and may run on many workers at once as
     * long as each works on a different chunk.
     */
    class Rasterizer
    {
    public:
        Rasterizer() = default;
        explicit Rasterizer( const RasterizerConfig& config );

        void                    SetConfig( const RasterizerConfig& config ) { m_config = config; }
        void                    SetShadingModel( ShadingModel model ) { m_config.shadingModel = model; }
        const RasterizerConfig& GetConfig() const { return m_config; }

        /**
         * @brief Rasterizes the part of a triangle that falls inside the chunk, dispatching on its render mode.
         * @return Number of fragments that passed the depth test.
         */
        uint32_t DrawTriangle( const ScreenTriangle& triangle, const Chunk& chunk, GBuffer& gbuffer ) const;

        uint32_t FillTriangle( const ScreenTriangle& triangle, const Chunk& chunk, GBuffer& gbuffer ) const;
        uint32_t FillTriangleFixed( const ScreenTriangle& triangle, const Chunk& chunk, GBuffer& gbuffer ) const;
        uint32_t DrawWireframe( const ScreenTriangle& triangle, const Chunk& chunk, GBuffer& gbuffer ) const;

        // Edge function E_ab(p) = (b - a) x (p - a)
        static float EdgeFunction( const glm::vec2& a, const glm::vec2& b, const glm::vec2& p )
        {
            return ( b.x - a.x ) * ( p.y - a.y ) - ( b.y - a.y ) * ( p.x - a.x );
        }

        // For triangles with positive area (clockwise on a Y-down screen)
        static bool IsTopLeft( const glm::vec2& a, const glm::vec2& b ) { return ( a.y == b.y && b.x > a.x ) || b.y < a.y; }

        // Rounds depth to the nearest multiple of 2^-bits
        static float QuantizeDepth( float depth, uint32_t bits );

    private:
        // Bresenham walk of one edge between vertices a and b of the triangle
        uint32_t DrawEdge( const ScreenTriangle& triangle, int a, int b, const Chunk& chunk, GBuffer& gbuffer ) const;

        // Builds the fragment from barycentrics given in the triangle's own vertex order
        Fragment MakeFragment( const ScreenTriangle& triangle, uint32_t x, uint32_t y, const glm::vec3& bary, float depth ) const;

    private:
        RasterizerConfig m_config;
    };
} // namespace SoftRaster
