#include "pipeline/Pipeline.hpp"

#include "core/Log.h"
#include "core/Timer.hpp"

namespace SoftRaster
{
    namespace
    {
        constexpr uint32_t MAX_SUBPIXEL_BITS = 16;
        constexpr uint32_t MAX_DEPTH_BITS    = 24;
    } // namespace

    Pipeline::Pipeline( JobSystem* jobSystem )
        : m_jobSystem( jobSystem )
    {
    }

    Pipeline::~Pipeline()
    {
        Shutdown();
    }

    Result Pipeline::Initialize( const SoftRasterConfig& config )
    {
        if( m_initialized )
        {
            SR_CORE_WARN( "Pipeline is already initialized." );
            return Result::SUCCESS;
        }

        if( config.fixedPointSubpixelBits > MAX_SUBPIXEL_BITS || config.fixedPointDepthBits == 0 || config.fixedPointDepthBits > MAX_DEPTH_BITS )
        {
            SR_CORE_ERROR( "Pipeline: invalid fixed point precision (subpixel bits {}, depth bits {}).", config.fixedPointSubpixelBits,
                           config.fixedPointDepthBits );
            return Result::INVALID_ARGS;
        }

        m_config = config;

        m_frameBuffer.SetLimits( m_config.maxWidth, m_config.maxHeight );
        SR_RETURN_IF_FAILED( m_frameBuffer.Allocate( m_config.width, m_config.height, ResolveChunkCount() ) );

        ClipperConfig clipperConfig;
        clipperConfig.width           = m_config.width;
        clipperConfig.height          = m_config.height;
        clipperConfig.backfaceCulling = m_config.backfaceCulling;
        m_clipper                     = Clipper( clipperConfig );

        RasterizerConfig rasterConfig;
        rasterConfig.shadingModel = m_config.shadingModel;
        rasterConfig.subpixelBits = m_config.fixedPointSubpixelBits;
        rasterConfig.depthBits    = m_config.fixedPointDepthBits;
        m_rasterizer.SetConfig( rasterConfig );

        m_stats       = FrameStats{};
        m_initialized = true;
        return Result::SUCCESS;
    }

    void Pipeline::Shutdown()
    {
        if( !m_initialized )
            return;

        m_entityWork.clear();
        m_triangles.clear();
        m_chunkFragments.clear();
        m_initialized = false;
    }

    Result Pipeline::Resize( uint32_t width, uint32_t height )
    {
        if( !m_initialized )
        {
            SR_CORE_ERROR( "Pipeline::Resize called before Initialize." );
            return Result::FAIL;
        }

        if( width == m_config.width && height == m_config.height )
            return Result::SUCCESS;

        SR_RETURN_IF_FAILED( m_frameBuffer.Allocate( width, height, ResolveChunkCount() ) );

        m_config.width  = width;
        m_config.height = height;
        m_clipper.SetViewport( width, height );
        return Result::SUCCESS;
    }

    void Pipeline::SetShadingModel( ShadingModel model )
    {
        m_config.shadingModel = model;
        m_rasterizer.SetShadingModel( model );
    }

    void Pipeline::SetBackfaceCulling( bool enabled )
    {
        m_config.backfaceCulling = enabled;
        m_clipper.SetBackfaceCulling( enabled );
    }

    uint32_t Pipeline::ResolveChunkCount() const
    {
        if( m_config.chunkCount > 0 )
            return m_config.chunkCount;

        // One band per worker plus one for the thread waiting in Wait()
        if( m_jobSystem && m_jobSystem->IsRunning() && !m_jobSystem->IsSingleThreaded() )
            return m_jobSystem->GetWorkerCount() + 1;

        return 1;
    }

    void Pipeline::ParallelFor( uint32_t count, const std::function<void( uint32_t )>& job )
    {
        if( !m_jobSystem )
        {
            for( uint32_t i = 0; i < count; ++i )
                job( i );
            return;
        }

        m_jobSystem->Dispatch( count, job );
        m_jobSystem->Wait();
    }

    Result Pipeline::ValidateScene( const Scene& scene ) const
    {
        SR_RETURN_IF_FAILED( scene.Validate() );

        const uint64_t triangleCount = scene.GetTriangleCount();
        if( triangleCount > m_config.maxTrianglesPerFrame )
        {
            SR_CORE_ERROR( "Scene has {} triangles, the frame limit is {}.", triangleCount, m_config.maxTrianglesPerFrame );
            return Result::OUT_OF_MEMORY;
        }
        return Result::SUCCESS;
    }

    void Pipeline::ProcessEntity( const Scene& scene, uint32_t index, EntityWork& work ) const
    {
        work.clipTriangles.clear();
        work.screenTriangles.clear();
        work.clipStats   = ClipStats{};
        work.trianglesIn = 0;
        work.culled      = false;

        const Entity&   entity = scene.entities[ index ];
        const Mesh&     mesh   = *entity.mesh;
        const glm::mat4 model  = entity.transform.GetMatrix();

        glm::vec3 center;
        float     radius;
        TransformStage::WorldBounds( mesh, model, center, radius );
        if( !scene.camera.IsSphereVisible( center, radius ) )
        {
            work.culled = true;
            return;
        }

        work.trianglesIn = mesh.GetTriCount();

        TransformStage::TransformMesh( mesh, model, scene.camera.GetView(), scene.camera.GetProjection(), work.transformed );
        TransformStage::AssembleTriangles( mesh, work.transformed, entity.renderMode, work.clipTriangles );

        for( const ClipTriangle& triangle: work.clipTriangles )
        {
            m_clipper.ProcessTriangle( triangle, work.screenTriangles, &work.clipStats );
        }
    }

    uint64_t Pipeline::ProcessChunk( const Scene& scene, uint32_t chunkIndex )
    {
        const Chunk& chunk   = m_frameBuffer.GetChunk( chunkIndex );
        GBuffer&     gbuffer = m_frameBuffer.GetGBuffer();

        m_frameBuffer.ClearChunk( chunkIndex, m_config.clearColor );

        uint64_t fragments = 0;
        for( const ScreenTriangle& triangle: m_triangles )
        {
            fragments += m_rasterizer.DrawTriangle( triangle, chunk, gbuffer );
        }

        ShadingConfig shadingConfig;
        shadingConfig.model            = m_config.shadingModel;
        shadingConfig.debugView        = m_config.debugView;
        shadingConfig.ambientIntensity = m_config.ambientIntensity;
        shadingConfig.clearColor       = m_config.clearColor;

        Shading::ResolveRange( gbuffer, chunk.GetPixelBegin(), chunk.GetPixelEnd(), scene.lights, scene.camera.GetPosition(), shadingConfig,
                               m_frameBuffer.GetBackColor() );
        return fragments;
    }

    Result Pipeline::RenderFrame( const Scene& scene )
    {
        if( !m_initialized )
        {
            SR_CORE_ERROR( "Pipeline::RenderFrame called before Initialize." );
            return Result::FAIL;
        }

        SR_RETURN_IF_FAILED( ValidateScene( scene ) );

        Timer total;
        Timer lap;

        FrameStats stats;
        stats.entitiesSubmitted = static_cast<uint32_t>( scene.entities.size() );

        // 1. Geometry, one job per entity
        m_entityWork.resize( scene.entities.size() );
        ParallelFor( stats.entitiesSubmitted, [ this, &scene ]( uint32_t index ) { ProcessEntity( scene, index, m_entityWork[ index ] ); } );

        m_triangles.clear();
        for( const EntityWork& work: m_entityWork )
        {
            if( work.culled )
                stats.entitiesCulled++;
            stats.trianglesIn += work.trianglesIn;
            stats.trianglesClipped += work.clipStats.nearClipped;
            m_triangles.insert( m_triangles.end(), work.screenTriangles.begin(), work.screenTriangles.end() );
        }
        stats.trianglesOut = static_cast<uint32_t>( m_triangles.size() );
        stats.geometryMs   = lap.Lap();

        // 2. Raster + resolve, one job per chunk
        const uint32_t chunkCount = m_frameBuffer.GetChunkCount();
        m_chunkFragments.assign( chunkCount, 0 );
        ParallelFor( chunkCount, [ this, &scene ]( uint32_t chunkIndex ) { m_chunkFragments[ chunkIndex ] = ProcessChunk( scene, chunkIndex ); } );
        stats.rasterMs = lap.Lap();

        // 3. Every chunk is done, make the frame visible
        m_frameBuffer.Publish();

        for( uint64_t fragments: m_chunkFragments )
            stats.fragmentsWritten += fragments;
        stats.chunkCount = chunkCount;
        stats.frameIndex = m_frameBuffer.GetFrameIndex();
        stats.totalMs    = total.ElapsedMillis();
        m_stats          = stats;

        if( m_config.logFrameStats )
        {
            SR_CORE_TRACE( "Frame {}: {} entities ({} culled), {} -> {} triangles ({} near clipped), {} fragments, {} chunks, {:.2f} ms "
                           "(geometry {:.2f}, raster {:.2f})",
                           stats.frameIndex, stats.entitiesSubmitted, stats.entitiesCulled, stats.trianglesIn, stats.trianglesOut, stats.trianglesClipped,
                           stats.fragmentsWritten, stats.chunkCount, stats.totalMs, stats.geometryMs, stats.rasterMs );
        }
        return Result::SUCCESS;
    }
} // namespace SoftRaster
