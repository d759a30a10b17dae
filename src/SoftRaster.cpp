#include "SoftRaster.h"

#include "core/Log.h"
#include "core/jobs/JobSystem.hpp"
#include "pipeline/Pipeline.hpp"

namespace SoftRaster
{

    // Impl
    struct SoftRaster::Impl
    {
        SoftRasterConfig m_config;
        bool             m_initialized;
        Scope<JobSystem> m_jobSystem;
        Scope<Pipeline>  m_pipeline;

        Impl()
            : m_initialized( false )
        {
        }

        Result Initialize( const SoftRasterConfig& config )
        {
            if( m_initialized )
                return Result::SUCCESS;

            // 1. Config
            m_config = config;

            // 2. Logger
            Log::Init();
            SR_INFO( "Initializing SoftRaster ({}x{})...", m_config.width, m_config.height );

            // 3. Job System
            m_jobSystem = CreateScope<JobSystem>();
            JobSystem::Config jobConfig;
            jobConfig.workerCount         = m_config.workerCount;
            jobConfig.forceSingleThreaded = m_config.forceSingleThreaded;
            if( m_jobSystem->Initialize( jobConfig ) != Result::SUCCESS )
            {
                m_jobSystem.reset();
                SR_ERROR( "Failed to initialize JobSystem." );
                return Result::FAIL;
            }

            // 4. Pipeline
            m_pipeline = CreateScope<Pipeline>( m_jobSystem.get() );
            Result result = m_pipeline->Initialize( m_config );
            if( result != Result::SUCCESS )
            {
                m_pipeline.reset();
                m_jobSystem->Shutdown();
                m_jobSystem.reset();
                SR_ERROR( "Failed to initialize Pipeline: {}.", toString( result ) );
                return result;
            }

            m_initialized = true;
            SR_INFO( "SoftRaster initialized with {} workers, {} chunks.", m_jobSystem->GetWorkerCount(),
                     m_pipeline->GetFrameBuffer().GetChunkCount() );
            return Result::SUCCESS;
        }

        void Shutdown()
        {
            if( !m_initialized )
                return;

            SR_INFO( "Shutting down SoftRaster..." );

            // Reverse order of creation
            m_pipeline->Shutdown();
            m_pipeline.reset();

            m_jobSystem->Shutdown();
            m_jobSystem.reset();

            m_initialized = false;
        }
    };

    SoftRaster::SoftRaster()
        : m_impl( CreateScope<Impl>() )
    {
    }

    SoftRaster::~SoftRaster()
    {
        m_impl->Shutdown();
    }

    Result SoftRaster::Initialize( const SoftRasterConfig& config )
    {
        return m_impl->Initialize( config );
    }

    void SoftRaster::Shutdown()
    {
        m_impl->Shutdown();
    }

    Result SoftRaster::Resize( uint32_t width, uint32_t height )
    {
        if( !m_impl->m_initialized )
            return Result::FAIL;
        return m_impl->m_pipeline->Resize( width, height );
    }

    Result SoftRaster::RenderFrame( const Scene& scene )
    {
        if( !m_impl->m_initialized )
        {
            SR_ERROR( "RenderFrame called before Initialize." );
            return Result::FAIL;
        }
        return m_impl->m_pipeline->RenderFrame( scene );
    }

    FrameView SoftRaster::GetFrame() const
    {
        if( !m_impl->m_initialized )
            return FrameView{};
        return m_impl->m_pipeline->GetFrame();
    }

    GBufferView SoftRaster::GetGBuffer() const
    {
        if( !m_impl->m_initialized )
            return GBufferView{};
        return m_impl->m_pipeline->GetGBuffer();
    }

    const FrameStats& SoftRaster::GetFrameStats() const
    {
        static const FrameStats s_empty;
        if( !m_impl->m_initialized )
            return s_empty;
        return m_impl->m_pipeline->GetFrameStats();
    }

    void SoftRaster::SetShadingModel( ShadingModel model )
    {
        if( m_impl->m_initialized )
            m_impl->m_pipeline->SetShadingModel( model );
    }

    void SoftRaster::SetDebugView( DebugView view )
    {
        if( m_impl->m_initialized )
            m_impl->m_pipeline->SetDebugView( view );
    }

    void SoftRaster::SetBackfaceCulling( bool enabled )
    {
        if( m_impl->m_initialized )
            m_impl->m_pipeline->SetBackfaceCulling( enabled );
    }

    bool SoftRaster::IsInitialized() const
    {
        return m_impl->m_initialized;
    }

} // namespace SoftRaster
