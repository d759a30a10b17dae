#pragma once

#include "core/Core.h"
#include <glm/glm.hpp>

namespace SoftRaster
{
    // Per-entity rasterization mode, dispatched once per triangle.
    enum class RenderMode : uint8_t
    {
        SOLID,
        WIREFRAME,
        FIXED_POINT,
    };

    // Global lighting model.
    enum class ShadingModel : uint8_t
    {
        FLAT,
        BLINN_PHONG,
    };

    // Replaces the lit color with a visualization of the G-Buffer.
    enum class DebugView : uint8_t
    {
        NONE,
        NORMALS,
        DEPTH,
    };

    inline const char* toString( RenderMode mode )
    {
        switch( mode )
        {
            case RenderMode::SOLID:
                return "Solid";
            case RenderMode::WIREFRAME:
                return "Wireframe";
            case RenderMode::FIXED_POINT:
                return "FixedPoint";
            default:
                return "Unknown";
        }
    }

    struct SoftRasterConfig
    {
        uint32_t width  = 320;
        uint32_t height = 180;

        // Worker pool
        int32_t workerCount         = -1; // -1 = auto
        bool_t  forceSingleThreaded = false;
        // Number of framebuffer chunks. 0 = one per thread (workers + the waiting main thread).
        uint32_t chunkCount = 0;

        // Capacity limits, checked at allocation and scene admission time
        uint32_t maxWidth             = 3840;
        uint32_t maxHeight            = 2160;
        uint32_t maxTrianglesPerFrame = 1u << 20;

        ShadingModel shadingModel    = ShadingModel::BLINN_PHONG;
        DebugView    debugView       = DebugView::NONE;
        bool_t       backfaceCulling = true;

        // FixedPoint render mode quantization (fractional bits)
        uint32_t fixedPointSubpixelBits = 4;
        uint32_t fixedPointDepthBits    = 16;

        glm::vec3 ambientIntensity = glm::vec3( 0.1f );
        glm::vec3 clearColor       = glm::vec3( 0.0f );

        bool_t logFrameStats = false;
    };

    struct FrameStats
    {
        uint64_t frameIndex        = 0;
        uint32_t entitiesSubmitted = 0;
        uint32_t entitiesCulled    = 0;
        uint32_t trianglesIn       = 0; // Mesh triangles of visible entities
        uint32_t trianglesOut      = 0; // Screen triangles handed to the rasterizer
        uint32_t trianglesClipped  = 0; // Triangles that were split by the near plane
        uint64_t fragmentsWritten  = 0; // Fragments that passed the depth test
        uint32_t chunkCount        = 0;

        float geometryMs = 0.0f;
        float rasterMs   = 0.0f;
        float totalMs    = 0.0f;
    };

    /**
     * @brief Read-only view of the last published frame.
     * Colors are packed 0x00RRGGBB, row-major, top row first.
     */
    struct FrameView
    {
        uint32_t        width      = 0;
        uint32_t        height     = 0;
        const uint32_t* colors     = nullptr;
        const float*    depth      = nullptr;
        uint64_t        frameIndex = 0;

        bool_t IsValid() const { return colors != nullptr; }
    };

    // Bit flags stored per G-Buffer pixel
    enum GBufferFlags : uint8_t
    {
        GBUFFER_FLAG_NONE    = 0,
        GBUFFER_FLAG_COVERED = 1 << 0,
        GBUFFER_FLAG_UNLIT   = 1 << 1,
    };

    /**
     * @brief Read-only view of the G-Buffer of the last rendered frame (debug inspection).
     * All channels are width * height long, row-major. Depth of uncovered pixels is +inf.
     */
    struct GBufferView
    {
        uint32_t         width    = 0;
        uint32_t         height   = 0;
        const float*     depth    = nullptr;
        const glm::vec3* normal   = nullptr; // world space
        const glm::vec3* position = nullptr; // world space
        const glm::vec3* albedo   = nullptr;
        const uint8_t*   flags    = nullptr;

        bool_t IsValid() const { return depth != nullptr; }
    };

} // namespace SoftRaster
