#pragma once

#include "core/jobs/JobSystem.hpp"
#include "pipeline/Clipper.hpp"
#include "pipeline/FrameBuffer.hpp"
#include "pipeline/Rasterizer.hpp"
#include "pipeline/Shading.hpp"
#include "pipeline/TransformStage.hpp"
#include "scene/Scene.h"
#include <vector>

namespace SoftRaster
{
    /**
     * @brief Drives one frame through Transform -> Clip/Cull -> Rasterize -> Shade -> Publish.
     *
     * Two parallel phases per frame, both fed through the JobSystem:
     *  1. geometry: one job per entity, each writing its own screen triangle list;
     *  2. raster + resolve: one job per framebuffer chunk, each clearing, rasterizing every triangle into its
     *     rows and shading those rows.
     * Entity lists are concatenated in entity order between the phases, so the output does not depend on the
     * number of workers or chunks.
     */
    class Pipeline
    {
    public:
        explicit Pipeline( JobSystem* jobSystem );
        ~Pipeline();

        Result Initialize( const SoftRasterConfig& config );
        void   Shutdown();

        // Reallocates the buffers; the previous frame stays visible if this fails
        Result Resize( uint32_t width, uint32_t height );

        /**
         * @brief Renders and publishes one frame.
         * @return INVALID_ARGS for an entity without a finalized mesh, OUT_OF_MEMORY above the triangle limit.
         *         On failure nothing is published.
         */
        Result RenderFrame( const Scene& scene );

        FrameView         GetFrame() const { return m_frameBuffer.GetFront(); }
        GBufferView       GetGBuffer() const { return m_frameBuffer.GetGBufferView(); }
        const FrameStats& GetFrameStats() const { return m_stats; }

        void SetShadingModel( ShadingModel model );
        void SetDebugView( DebugView view ) { m_config.debugView = view; }
        void SetBackfaceCulling( bool enabled );

        const SoftRasterConfig& GetConfig() const { return m_config; }
        const FrameBuffer&      GetFrameBuffer() const { return m_frameBuffer; }
        bool                    IsInitialized() const { return m_initialized; }

    private:
        // Scratch owned by one entity job
        struct EntityWork
        {
            TransformedMesh             transformed;
            std::vector<ClipTriangle>   clipTriangles;
            std::vector<ScreenTriangle> screenTriangles;
            ClipStats                   clipStats;
            uint32_t                    trianglesIn = 0;
            bool                        culled      = false;
        };

        Result   ValidateScene( const Scene& scene ) const;
        void     ProcessEntity( const Scene& scene, uint32_t index, EntityWork& work ) const;
        uint64_t ProcessChunk( const Scene& scene, uint32_t chunkIndex );
        uint32_t ResolveChunkCount() const;

        // Runs count jobs and waits for them; inline when no job system is available
        void ParallelFor( uint32_t count, const std::function<void( uint32_t )>& job );

    private:
        JobSystem*       m_jobSystem = nullptr;
        SoftRasterConfig m_config;
        bool             m_initialized = false;

        FrameBuffer m_frameBuffer;
        Clipper     m_clipper;
        Rasterizer  m_rasterizer;

        std::vector<EntityWork>     m_entityWork;
        std::vector<ScreenTriangle> m_triangles;
        std::vector<uint64_t>       m_chunkFragments;

        FrameStats m_stats;
    };
} // namespace SoftRaster
