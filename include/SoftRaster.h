#pragma once
#include "SoftRasterTypes.h"

#include "core/Core.h"
#include "scene/Scene.h"

namespace SoftRaster
{

    /**
     * @brief Software rasterizer entry point.
     * Owns the worker pool and the render pipeline. Call Initialize() once, then RenderFrame() per frame and
     * read the published image with GetFrame().
     */
    class SR_API SoftRaster
    {
    public:
        SoftRaster();
        ~SoftRaster();

        Result Initialize( const SoftRasterConfig& config );
        void   Shutdown();

        Result Resize( uint32_t width, uint32_t height );

        // Renders the scene snapshot and publishes it. On failure the previous frame stays visible.
        Result RenderFrame( const Scene& scene );

        // Last published frame. Valid until the next RenderFrame() or Resize().
        FrameView         GetFrame() const;
        GBufferView       GetGBuffer() const;
        const FrameStats& GetFrameStats() const;

        void SetShadingModel( ShadingModel model );
        void SetDebugView( DebugView view );
        void SetBackfaceCulling( bool enabled );

        bool IsInitialized() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> m_impl;
    };

} // namespace SoftRaster
