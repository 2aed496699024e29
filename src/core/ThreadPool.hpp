#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <numeric>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>


namespace nzbseek
{
/**
 * Runs submitted functions on a bounded number of threads. For this library the thread count is the
 * number of concurrent connections to the article source, not the number of cores, because the
 * workers spend nearly all their time waiting for the network.
 * Threads are spawned lazily so that an idle pool costs nothing. A new thread is spawned whenever
 * the queued tasks outnumber the idle threads, so that a burst of submissions is never serialized
 * onto a thread that was idle before the burst.
 */
class ThreadPool
{
private:
    /**
     * std::function<void()> can not wrap std::packaged_task because the latter is not copy-constructible.
     * This small type-erased wrapper only requires move-construction.
     */
    class PackagedTaskWrapper
    {
    private:
        struct BaseFunctor
        {
            virtual void
            operator()() = 0;

            virtual
            ~BaseFunctor() = default;
        };

        template<class T_Functor>
        struct SpecializedFunctor :
            BaseFunctor
        {
            explicit
            SpecializedFunctor( T_Functor&& functor ) :
                m_functor( std::move( functor ) )
            {}

            void
            operator()() override
            {
                m_functor();
            }

        private:
            T_Functor m_functor;
        };

    public:
        template<class T_Functor, std::enable_if_t<std::is_invocable_v<T_Functor>, void>* = nullptr>
        explicit
        PackagedTaskWrapper( T_Functor&& functor ) :
            m_impl( std::make_unique<SpecializedFunctor<T_Functor> >( std::forward<T_Functor>( functor ) ) )
        {}

        void
        operator()()
        {
            ( *m_impl )();
        }

    private:
        std::unique_ptr<BaseFunctor> m_impl;
    };

public:
    explicit
    ThreadPool( size_t threadCount ) :
        m_threadCount( threadCount )
    {
        m_threads.reserve( m_threadCount );
    }

    ~ThreadPool()
    {
        stop();
    }

    /**
     * Tasks that have not been started yet are dropped. Their futures will report a broken promise.
     */
    void
    stop()
    {
        {
            const std::lock_guard lock( m_mutex );
            m_threadPoolRunning = false;
            m_pingWorkers.notify_all();
        }

        /* Submitting concurrently to stop is not allowed, so m_threads does not change while joining. */
        for ( auto& thread : m_threads ) {
            if ( thread.joinable() ) {
                thread.join();
            }
        }
        m_threads.clear();

        const std::lock_guard lock( m_mutex );
        m_tasks.clear();
    }

    /**
     * @param priority Tasks with a lower value are started first. Prefetches should use a higher
     *        value than the segment a reader is blocking on.
     */
    template<class T_Functor, std::enable_if_t<std::is_invocable_v<T_Functor>, void>* = nullptr>
    std::future<decltype( std::declval<T_Functor>()() )>
    submit( T_Functor&& task,
            int         priority = 0 )
    {
        const std::lock_guard lock( m_mutex );

        if ( m_threadCount == 0 ) {
            return std::async( std::launch::deferred, std::forward<T_Functor>( task ) );
        }

        using ReturnType = decltype( std::declval<T_Functor>()() );
        std::packaged_task<ReturnType()> packagedTask{ std::forward<T_Functor>( task ) };
        auto resultFuture = packagedTask.get_future();
        m_tasks[priority].emplace_back( std::move( packagedTask ) );

        if ( ( m_threads.size() < m_threadCount ) && ( queuedTaskCount() > m_idleThreadCount ) ) {
            spawnThread();
        }

        m_pingWorkers.notify_one();

        return resultFuture;
    }

    [[nodiscard]] size_t
    capacity() const
    {
        return m_threadCount;
    }

    [[nodiscard]] size_t
    size() const
    {
        const std::lock_guard lock( m_mutex );
        return m_threads.size();
    }

    /**
     * @return The number of submitted tasks that no thread has started yet.
     */
    [[nodiscard]] size_t
    unprocessedTasksCount() const
    {
        const std::lock_guard lock( m_mutex );
        return queuedTaskCount();
    }

private:
    /**
     * Does not lock! Only call this while holding m_mutex.
     */
    [[nodiscard]] size_t
    queuedTaskCount() const
    {
        return std::accumulate( m_tasks.begin(), m_tasks.end(), size_t( 0 ),
                                [] ( size_t sum, const auto& tasks ) { return sum + tasks.second.size(); } );
    }

    /**
     * Does not lock! Only call this while holding m_mutex.
     */
    [[nodiscard]] bool
    hasUnprocessedTasks() const
    {
        return std::any_of( m_tasks.begin(), m_tasks.end(),
                            [] ( const auto& tasks ) { return !tasks.second.empty(); } );
    }

    void
    workerMain()
    {
        while ( m_threadPoolRunning )
        {
            std::unique_lock<std::mutex> tasksLock( m_mutex );
            ++m_idleThreadCount;
            m_pingWorkers.wait( tasksLock, [this] () { return hasUnprocessedTasks() || !m_threadPoolRunning; } );
            --m_idleThreadCount;

            if ( !m_threadPoolRunning ) {
                break;
            }

            const auto nonEmptyTasks = std::find_if( m_tasks.begin(), m_tasks.end(),
                                                     [] ( const auto& tasks ) { return !tasks.second.empty(); } );
            if ( nonEmptyTasks != m_tasks.end() ) {
                auto task = std::move( nonEmptyTasks->second.front() );
                nonEmptyTasks->second.pop_front();
                tasksLock.unlock();
                task();
            }
        }
    }

    void
    spawnThread()
    {
        m_threads.emplace_back( [this] () { workerMain(); } );
    }

private:
    std::atomic<bool> m_threadPoolRunning = true;

    const size_t m_threadCount;
    std::atomic<size_t> m_idleThreadCount{ 0 };

    /** Guarded by m_mutex. */
    std::map</* priority */ int, std::deque<PackagedTaskWrapper> > m_tasks;

    /** Necessary for m_tasks AND m_pingWorkers or else the notify_all might go unnoticed! */
    mutable std::mutex m_mutex;
    std::condition_variable m_pingWorkers;

    /** Joined in stop, which the destructor calls before any other member is destroyed. */
    std::vector<std::thread> m_threads;
};
}  // namespace nzbseek
