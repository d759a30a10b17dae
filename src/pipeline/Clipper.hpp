#pragma once

#include "pipeline/PipelineTypes.hpp"
#include <array>
#include <vector>

namespace SoftRaster
{
    struct ClipperConfig
    {
        uint32_t width           = 0;
        uint32_t height          = 0;
        bool     backfaceCulling = true;
    };

    struct ClipStats
    {
        uint32_t culledFrustum    = 0;
        uint32_t culledBackface   = 0;
        uint32_t culledDegenerate = 0;
        uint32_t nearClipped      = 0;
    };

    /**
     * @brief Culls and clips clip-space triangles and maps the survivors to screen space.
     *
     * Policy: every frustum plane trivially rejects a triangle whose three vertices are all outside it.
     * Only the near plane (z >= 0) subdivides, producing 0, 1 or 2 triangles; it is the plane that guarantees
     * w > 0 before the divide. Left/right/top/bottom overflow is scissored by the rasterizer's chunk bounds and
     * far overflow by its per-fragment depth range test.
     */
    class Clipper
    {
    public:
        Clipper() = default;
        explicit Clipper( const ClipperConfig& config );

        void SetViewport( uint32_t width, uint32_t height );
        void SetBackfaceCulling( bool enabled ) { m_config.backfaceCulling = enabled; }

        /**
         * @brief Runs cull -> near clip -> divide -> backface/degenerate test for one triangle.
         * @return Number of screen triangles appended to out (0, 1 or 2).
         */
        uint32_t ProcessTriangle( const ClipTriangle& triangle, std::vector<ScreenTriangle>& out, ClipStats* stats = nullptr ) const;

        // True when all three vertices lie outside the same clip-space plane
        static bool IsOutsideFrustum( const ClipTriangle& triangle );

        /**
         * @brief Sutherland-Hodgman clip against the near plane z >= 0.
         * Position, world position, normal and color of a new vertex share one interpolation factor.
         * @return Number of triangles written to out (0, 1 or 2), wound like the input.
         */
        static uint32_t ClipNear( const ClipTriangle& triangle, std::array<ClipTriangle, 2>& out );

        // Perspective divide + viewport mapping. Requires position.w > 0.
        ScreenVertex ProjectVertex( const ClipVertex& vertex ) const;

        // Twice the signed screen-space area, (b - a) x (c - a). Negative = front facing (CCW in NDC, Y flipped).
        static float SignedArea2( const glm::vec2& a, const glm::vec2& b, const glm::vec2& c );

    private:
        ClipperConfig m_config;
    };
} // namespace SoftRaster
