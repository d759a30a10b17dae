#pragma once
#include "core/Core.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace SoftRaster
{
    /**
     * @brief Fixed pool of worker threads fed from a single FIFO queue.
     * The renderer uses it once or twice per frame: Dispatch() a batch (entities, chunks), then Wait() as the frame barrier.
     */
    class JobSystem
    {
    public:
        using Job = std::function<void()>;

        struct Config
        {
            int  workerCount         = -1; // -1 = auto
            bool forceSingleThreaded = false;
        };

        JobSystem();
        ~JobSystem();

        /**
         * @brief Initializes the worker threads.
         * @param config setup for the Job System.
         */
        Result Initialize( const Config& config );
        void   Shutdown();

        /**
         * @brief Kick a generic job to be executed by any available worker.
         */
        void Kick( Job job );

        /**
         * @brief Dispatches a loop in parallel.
         * @param jobCount Number of iterations.
         * @param job Function taking the index [0, jobCount).
         */
        void Dispatch( uint32_t jobCount, const std::function<void( uint32_t )>& job );

        /**
         * @brief Blocks the calling thread until all currently kicked jobs are finished.
         * The caller executes queued jobs itself while it waits. Only the thread that initialized the system may wait.
         */
        void Wait();

        /**
         * @brief Checks if the calling thread is the thread that initialized the system.
         */
        bool IsMainThread() const;

        uint32_t GetWorkerCount() const { return static_cast<uint32_t>( m_workers.size() ); }

        bool IsSingleThreaded() const { return m_singleThreaded; }
        bool IsRunning() const { return m_running; }

    private:
        void WorkerLoop( uint32_t threadIndex );
        bool TryRunPendingJob();
        void FinishJob();

    private:
        // Workers
        std::vector<std::thread> m_workers;
        bool                     m_running        = false;
        bool                     m_singleThreaded = false;
        std::thread::id          m_mainThreadID;

        // General Job Queue
        std::deque<Job>         m_jobQueue;
        std::mutex              m_queueMutex;
        std::condition_variable m_queueCv;

        // Synchronization
        // Counts how many jobs are currently running or queued.
        // Wait() blocks until this drops to 0.
        std::atomic<int>        m_busyJobs{ 0 };
        std::condition_variable m_waitCv;
        std::mutex              m_waitMutex;
    };
} // namespace SoftRaster
