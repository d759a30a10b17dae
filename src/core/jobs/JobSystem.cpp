#include "core/jobs/JobSystem.hpp"

#include "core/Log.h"

namespace SoftRaster
{

    JobSystem::JobSystem()
    {
    }

    JobSystem::~JobSystem()
    {
        Shutdown();
    }

    Result JobSystem::Initialize( const Config& config )
    {
        if( m_running )
        {
            SR_WARN( "JobSystem is already initialized." );
            return Result::SUCCESS;
        }

        m_running        = true;
        m_singleThreaded = config.forceSingleThreaded;
        m_mainThreadID   = std::this_thread::get_id();

        if( m_singleThreaded )
        {
            SR_WARN( "JobSystem initialized in FORCE SINGLE THREADED mode." );
            // No workers. Kick() and Dispatch() execute on the calling thread.
            return Result::SUCCESS;
        }

        // Calculate worker count
        uint32_t workerCount;
        if( config.workerCount > 0 )
        {
            workerCount = static_cast<uint32_t>( config.workerCount );
        }
        else
        {
            // Auto-detect: the main thread also works while it waits, so leave one core for it
            unsigned int hardware = std::thread::hardware_concurrency();
            workerCount           = ( hardware > 1 ) ? hardware - 1 : 1;
        }

        SR_INFO( "Initializing JobSystem with {} worker threads.", workerCount );

        m_workers.reserve( workerCount );
        for( uint32_t i = 0; i < workerCount; ++i )
        {
            // Thread index 1..N (0 is reserved for Main Thread)
            uint32_t threadIndex = i + 1;
            m_workers.emplace_back( &JobSystem::WorkerLoop, this, threadIndex );
        }

        return Result::SUCCESS;
    }

    void JobSystem::Shutdown()
    {
        if( !m_running )
            return;

        {
            std::lock_guard<std::mutex> lock( m_queueMutex );
            m_running = false;
        }

        // Wake up all threads so they can drain the queue and exit
        m_queueCv.notify_all();

        for( std::thread& worker: m_workers )
        {
            if( worker.joinable() )
                worker.join();
        }

        m_workers.clear();
        m_jobQueue.clear();
        m_busyJobs       = 0;
        m_singleThreaded = false;
    }

    void JobSystem::Kick( Job job )
    {
        if( m_singleThreaded || !m_running )
        {
            job();
            return;
        }

        // Increment busy counter BEFORE pushing to queue
        m_busyJobs.fetch_add( 1 );

        {
            std::lock_guard<std::mutex> lock( m_queueMutex );
            m_jobQueue.push_back( std::move( job ) );
        }
        m_queueCv.notify_one();
    }

    void JobSystem::Dispatch( uint32_t jobCount, const std::function<void( uint32_t )>& job )
    {
        if( jobCount == 0 )
            return;

        if( m_singleThreaded || !m_running )
        {
            for( uint32_t i = 0; i < jobCount; ++i )
            {
                job( i );
            }
            return;
        }

        m_busyJobs.fetch_add( static_cast<int>( jobCount ) );

        {
            std::lock_guard<std::mutex> lock( m_queueMutex );
            for( uint32_t i = 0; i < jobCount; ++i )
            {
                m_jobQueue.push_back( [ job, i ]() { job( i ); } );
            }
        }
        m_queueCv.notify_all();
    }

    void JobSystem::Wait()
    {
        if( m_singleThreaded || !m_running )
            return; // Jobs already ran inline

        // A job waiting on its own batch would count itself as busy forever
        SR_CORE_ASSERT( IsMainThread(), "JobSystem::Wait called from a worker thread." );

        // Help drain the queue instead of idling
        while( TryRunPendingJob() )
        {
        }

        std::unique_lock<std::mutex> lock( m_waitMutex );
        m_waitCv.wait( lock, [ this ]() { return m_busyJobs.load() == 0; } );
    }

    bool JobSystem::IsMainThread() const
    {
        return std::this_thread::get_id() == m_mainThreadID;
    }

    bool JobSystem::TryRunPendingJob()
    {
        Job job;
        {
            std::lock_guard<std::mutex> lock( m_queueMutex );
            if( m_jobQueue.empty() )
                return false;

            job = std::move( m_jobQueue.front() );
            m_jobQueue.pop_front();
        }

        job();
        FinishJob();
        return true;
    }

    void JobSystem::FinishJob()
    {
        int remaining = m_busyJobs.fetch_sub( 1 ) - 1;
        if( remaining == 0 )
        {
            std::lock_guard<std::mutex> lock( m_waitMutex );
            m_waitCv.notify_all();
        }
    }

    void JobSystem::WorkerLoop( uint32_t threadIndex )
    {
        ( void )threadIndex;

        while( true )
        {
            Job job;
            {
                std::unique_lock<std::mutex> lock( m_queueMutex );

                // Wait until there is a job or we are stopping
                m_queueCv.wait( lock, [ this ]() { return !m_jobQueue.empty() || !m_running; } );

                if( !m_running && m_jobQueue.empty() )
                    break;

                job = std::move( m_jobQueue.front() );
                m_jobQueue.pop_front();
            }

            // Execute the job outside the lock
            job();
            FinishJob();
        }
    }

} // namespace SoftRaster
