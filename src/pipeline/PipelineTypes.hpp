#pragma once

#include "SoftRasterTypes.h"
#include "scene/Mesh.h"
#include <array>
#include <glm/glm.hpp>

namespace SoftRaster
{
    /**
     * @brief Vertex in homogeneous clip space, before the perspective divide.
     * All attributes are interpolated with the same factor when an edge is clipped.
     */
    struct ClipVertex
    {
        glm::vec4 position = glm::vec4( 0.0f ); // clip space
        glm::vec3 worldPos = glm::vec3( 0.0f );
        glm::vec3 normal   = glm::vec3( 0.0f ); // world space
        glm::vec3 color    = glm::vec3( 1.0f );

        static ClipVertex Lerp( const ClipVertex& a, const ClipVertex& b, float t )
        {
            ClipVertex v;
            v.position = glm::mix( a.position, b.position, t );
            v.worldPos = glm::mix( a.worldPos, b.worldPos, t );
            v.normal   = glm::mix( a.normal, b.normal, t );
            v.color    = glm::mix( a.color, b.color, t );
            return v;
        }
    };

    struct ClipTriangle
    {
        std::array<ClipVertex, 3> vertices;
        glm::vec3                 faceNormal = glm::vec3( 0.0f ); // world space
        const Material*           material   = nullptr;
        RenderMode                mode       = RenderMode::SOLID;
    };

    /**
     * @brief Vertex after the perspective divide and viewport mapping.
     * position is in pixels (origin top-left, +Y down), depth = z / w in [0, 1], invW = 1 / w.
     * worldPos, normal and color are the raw (undivided) attributes; the rasterizer applies invW itself.
     */
    struct ScreenVertex
    {
        glm::vec2 position = glm::vec2( 0.0f );
        float     depth    = 0.0f;
        float     invW     = 1.0f;
        glm::vec3 worldPos = glm::vec3( 0.0f );
        glm::vec3 normal   = glm::vec3( 0.0f );
        glm::vec3 color    = glm::vec3( 1.0f );
    };

    struct ScreenTriangle
    {
        std::array<ScreenVertex, 3> vertices;
        glm::vec3                   faceNormal = glm::vec3( 0.0f ); // world space
        glm::vec3                   centroid   = glm::vec3( 0.0f ); // world space
        const Material*             material   = nullptr;
        RenderMode                  mode       = RenderMode::SOLID;
    };

    /**
     * @brief Per-pixel record produced by the rasterizer and consumed by the G-Buffer write.
     */
    struct Fragment
    {
        uint32_t        x        = 0;
        uint32_t        y        = 0;
        float           depth    = 0.0f;
        glm::vec3       normal   = glm::vec3( 0.0f );
        glm::vec3       worldPos = glm::vec3( 0.0f );
        glm::vec3       color    = glm::vec3( 1.0f );
        glm::vec3       bary     = glm::vec3( 0.0f );
        const Material* material = nullptr;
        bool            unlit    = false;
    };

    /**
     * @brief Horizontal band of the framebuffer owned by one worker during a frame.
     * Rows [rowBegin, rowEnd) map to the contiguous pixel range [rowBegin * width, rowEnd * width).
     */
    struct Chunk
    {
        uint32_t index    = 0;
        uint32_t rowBegin = 0;
        uint32_t rowEnd   = 0;
        uint32_t width    = 0;

        uint32_t GetRowCount() const { return rowEnd - rowBegin; }
        size_t   GetPixelBegin() const { return static_cast<size_t>( rowBegin ) * width; }
        size_t   GetPixelEnd() const { return static_cast<size_t>( rowEnd ) * width; }
        bool     Contains( int32_t x, int32_t y ) const { return x >= 0 && x < static_cast<int32_t>( width ) && y >= static_cast<int32_t>( rowBegin ) && y < static_cast<int32_t>( rowEnd ); }
    };
} // namespace SoftRaster
