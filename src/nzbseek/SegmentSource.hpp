#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <core/Cache.hpp>
#include <core/Cancellation.hpp>
#include <core/common.hpp>
#include <core/Error.hpp>
#include <core/ThreadPool.hpp>

#include "Segment.hpp"
#include "SegmentMapper.hpp"


namespace nzbseek
{
/**
 * Wire-level capability: downloads one article and returns its decoded payload.
 * Implementations handle the NNTP connection, yEnc decoding, and retries with backoff themselves.
 * They must be thread-safe because articles are fetched in parallel.
 */
class ArticleFetcher
{
public:
    virtual
    ~ArticleFetcher() = default;

    /**
     * @throws TransportError if the article could not be fetched.
     */
    [[nodiscard]] virtual std::vector<char>
    fetch( const Segment&                  segment,
           const std::vector<std::string>& groups,
           const CancellationToken&        cancel ) = 0;
};


/**
 * Sequential reader over exactly one byte window of one part.
 */
class SegmentRangeReader
{
public:
    virtual
    ~SegmentRangeReader() = default;

    /**
     * @return Number of bytes read. Zero only at the end of the window.
     * @throws TransportError, CancelledError
     */
    [[nodiscard]] virtual size_t
    read( char*  buffer,
          size_t nMaxBytesToRead ) = 0;

    /**
     * @return Number of bytes left until the end of the window.
     */
    [[nodiscard]] virtual uint64_t
    remaining() const = 0;
};


/**
 * Resolves a part's byte window to its segments and returns a sequential reader over it.
 */
class SegmentReaderFactory
{
public:
    virtual
    ~SegmentReaderFactory() = default;

    /**
     * @param offset Part-relative offset of the first byte to read.
     * @param length Number of bytes in the window. The window must lie inside the part.
     * @param workers Maximum number of articles that may be downloaded ahead of the reader.
     */
    [[nodiscard]] virtual std::unique_ptr<SegmentRangeReader>
    open( const Part&              part,
          uint64_t                 offset,
          uint64_t                 length,
          size_t                   workers,
          const CancellationToken& cancel ) = 0;
};


/**
 * Default SegmentReaderFactory on top of an ArticleFetcher. All readers share one bounded pool of
 * download threads, a small LRU cache of decoded articles, and a table of downloads in flight,
 * so that overlapping windows requested by different readers download each article only once.
 */
class PooledSegmentReaderFactory :
    public SegmentReaderFactory,
    public std::enable_shared_from_this<PooledSegmentReaderFactory>
{
public:
    using Payload = std::shared_ptr<const std::vector<char> >;
    using SegmentCache = Cache<std::string, Payload>;

    static constexpr size_t DEFAULT_CACHE_SIZE = 32;

    struct Statistics
    {
    public:
        [[nodiscard]] std::string
        print() const
        {
            std::stringstream out;
            out << "\n    Connections                       : " << parallelization
                << "\n    Readers Opened                    : " << readersOpened
                << "\n    Articles"
                << "\n        Downloaded                    : " << downloads
                << "\n        Downloaded Bytes              : " << formatBytes( downloadedBytes )
                << "\n        Failed                        : " << failedDownloads
                << "\n        Joined In-Flight Downloads    : " << joinedDownloads
                << "\n        Queued For A Connection       : " << queuedDownloads
                << "\n    Cache"
                << "\n        Hits                          : " << cache.hits
                << "\n        Misses                        : " << cache.misses
                << "\n        Evictions                     : " << cache.evictions
                << "\n        Maximum Fill Size             : " << cache.maxSize
                << "\n        Capacity                      : " << cache.capacity
                << "\n    Time spent downloading            : " << downloadTotalTime << " s"
                << "\n    Time spent waiting for downloads  : " << waitTotalTime << " s"
                << "\n";
            return std::move( out ).str();
        }

    public:
        size_t parallelization{ 0 };
        size_t readersOpened{ 0 };
        size_t downloads{ 0 };
        uint64_t downloadedBytes{ 0 };
        size_t failedDownloads{ 0 };
        size_t joinedDownloads{ 0 };
        /** Downloads, including prefetches, that are waiting for a free connection. */
        size_t queuedDownloads{ 0 };
        SegmentCache::Statistics cache;
        double downloadTotalTime{ 0 };
        double waitTotalTime{ 0 };
    };

private:
    class Reader;

public:
    /**
     * @param maxConnections Upper bound for concurrently running downloads of all readers created
     *        by this factory. Use std::make_shared to create instances.
     */
    PooledSegmentReaderFactory( std::shared_ptr<ArticleFetcher> fetcher,
                                std::vector<std::string>        groups,
                                size_t                          maxConnections,
                                size_t                          maxCachedSegments = DEFAULT_CACHE_SIZE ) :
        m_fetcher( std::move( fetcher ) ),
        m_groups( std::move( groups ) ),
        m_cache( maxCachedSegments ),
        m_threadPool( std::max<size_t>( 1, maxConnections ) )
    {
        if ( !m_fetcher ) {
            throw std::invalid_argument( "An article fetcher is required!" );
        }
        m_statistics.parallelization = m_threadPool.capacity();
    }

    ~PooledSegmentReaderFactory() override
    {
        m_threadPool.stop();
        if ( m_showProfileOnDestruction ) {
            std::cerr << ( ThreadSafeOutput() << "[PooledSegmentReaderFactory::~PooledSegmentReaderFactory]"
                           << statistics().print() );
        }
    }

    [[nodiscard]] std::unique_ptr<SegmentRangeReader>
    open( const Part&              part,
          uint64_t                 offset,
          uint64_t                 length,
          size_t                   workers,
          const CancellationToken& cancel ) override;

    [[nodiscard]] Statistics
    statistics() const
    {
        const std::lock_guard lock( m_mutex );
        auto result = m_statistics;
        result.cache = m_cache.statistics();
        result.queuedDownloads = m_threadPool.unprocessedTasksCount();
        return result;
    }

    void
    setShowProfileOnDestruction( bool showProfileOnDestruction )
    {
        m_showProfileOnDestruction = showProfileOnDestruction;
    }

private:
    /**
     * Starts the download of @p segment unless it is already cached or in flight.
     * @return Either the cached payload or a future for it.
     */
    [[nodiscard]] std::pair<Payload, std::shared_future<Payload> >
    request( const Segment&                  segment,
             const std::vector<std::string>& groups,
             const CancellationToken&        cancel,
             int                             priority )
    {
        const std::lock_guard lock( m_mutex );

        if ( auto cached = m_cache.get( segment.id ); cached ) {
            return { std::move( *cached ), {} };
        }

        if ( const auto match = m_inFlight.find( segment.id ); match != m_inFlight.end() ) {
            ++m_statistics.joinedDownloads;
            return { {}, match->second };
        }

        /* Always download the whole article so that it can be cached for any other window. */
        auto future = m_threadPool.submit(
            [this, segment = Segment::whole( segment.id, segment.declaredSize ), groups, cancel] () {
                return download( segment, groups, cancel );
            }, priority ).share();
        m_inFlight.emplace( segment.id, future );
        return { {}, std::move( future ) };
    }

    [[nodiscard]] Payload
    download( const Segment&                  segment,
              const std::vector<std::string>& groups,
              const CancellationToken&        cancel )
    {
        const auto tDownloadStart = now();
        Finally forgetInFlight( [this, &segment] () {
            const std::lock_guard lock( m_mutex );
            m_inFlight.erase( segment.id );
        } );

        try {
            cancel.throwIfCancelled( "Download of article " + segment.id );
            auto payload = std::make_shared<const std::vector<char> >( m_fetcher->fetch( segment, groups, cancel ) );

            const std::lock_guard lock( m_mutex );
            m_cache.insert( segment.id, payload );
            ++m_statistics.downloads;
            m_statistics.downloadedBytes += payload->size();
            m_statistics.downloadTotalTime += duration( tDownloadStart );
            return payload;
        } catch ( const CancelledError& ) {
            throw;
        } catch ( const std::exception& ) {
            const std::lock_guard lock( m_mutex );
            ++m_statistics.failedDownloads;
            throw;
        }
    }

    /**
     * Blocks until the payload for @p segment is available, periodically checking for cancellation.
     * A download cancelled by another reader is restarted for this one.
     */
    [[nodiscard]] Payload
    get( const Segment&                  segment,
         const std::vector<std::string>& groups,
         const CancellationToken&        cancel )
    {
        const auto tWaitStart = now();
        Finally countWaitTime( [this, tWaitStart] () {
            const std::lock_guard lock( m_mutex );
            m_statistics.waitTotalTime += duration( tWaitStart );
        } );

        while ( true ) {
            cancel.throwIfCancelled( "Reading article " + segment.id );

            auto [payload, future] = request( segment, groups, cancel, /* priority */ 0 );
            if ( payload ) {
                return payload;
            }

            while ( future.wait_for( std::chrono::milliseconds( 10 ) ) != std::future_status::ready ) {
                cancel.throwIfCancelled( "Reading article " + segment.id );
            }

            try {
                return future.get();
            } catch ( const CancelledError& ) {
                if ( cancel.cancelled() ) {
                    throw;
                }
                /* Cancelled by the reader that started the download. Try again on our own behalf. */
            } catch ( const std::future_error& exception ) {
                throw TransportError( "Download of article " + segment.id + " was abandoned: " + exception.what() );
            }
        }
    }

    void
    prefetch( const Segment&                  segment,
              const std::vector<std::string>& groups,
              const CancellationToken&        cancel )
    {
        /* Not waited on. A failed download is requested again by get. */
        static_cast<void>( request( segment, groups, cancel, /* priority */ 1 ) );
    }

private:
    const std::shared_ptr<ArticleFetcher> m_fetcher;
    const std::vector<std::string> m_groups;

    mutable std::mutex m_mutex;
    SegmentCache m_cache;
    std::unordered_map<std::string, std::shared_future<Payload> > m_inFlight;
    Statistics m_statistics;
    std::atomic<bool> m_showProfileOnDestruction{ false };

    /** Declared last so that the workers are joined before anything they access is destroyed. */
    ThreadPool m_threadPool;
};


class PooledSegmentReaderFactory::Reader :
    public SegmentRangeReader
{
public:
    Reader( std::shared_ptr<PooledSegmentReaderFactory> factory,
            std::vector<Segment>                        segments,
            std::vector<std::string>                    groups,
            size_t                                      workers,
            CancellationToken                           cancel ) :
        m_factory( std::move( factory ) ),
        m_segments( std::move( segments ) ),
        m_groups( std::move( groups ) ),
        m_workers( workers ),
        m_cancel( std::move( cancel ) ),
        m_remaining( totalLength( m_segments ) )
    {}

    [[nodiscard]] size_t
    read( char*  buffer,
          size_t nMaxBytesToRead ) override
    {
        size_t nBytesRead{ 0 };
        while ( nBytesRead < nMaxBytesToRead ) {
            if ( !m_current || ( m_currentPosition > m_segments[m_currentIndex].endOffset ) ) {
                if ( m_current ) {
                    ++m_currentIndex;
                    m_current.reset();
                }
                if ( m_currentIndex >= m_segments.size() ) {
                    break;
                }
                loadCurrentSegment();
            }

            const auto& segment = m_segments[m_currentIndex];
            const auto nBytesToCopy = std::min<uint64_t>( nMaxBytesToRead - nBytesRead,
                                                          segment.endOffset + 1 - m_currentPosition );
            if ( buffer != nullptr ) {
                std::memcpy( buffer + nBytesRead, m_current->data() + m_currentPosition, nBytesToCopy );
            }
            nBytesRead += nBytesToCopy;
            m_currentPosition += nBytesToCopy;
            m_remaining -= nBytesToCopy;
        }
        return nBytesRead;
    }

    [[nodiscard]] uint64_t
    remaining() const override
    {
        return m_remaining;
    }

private:
    void
    loadCurrentSegment()
    {
        const auto lastPrefetch = std::min( m_segments.size(), m_currentIndex + m_workers );
        for ( auto i = std::max( m_currentIndex + 1, m_nextPrefetch ); i < lastPrefetch; ++i ) {
            m_factory->prefetch( m_segments[i], m_groups, m_cancel );
            m_nextPrefetch = i + 1;
        }

        const auto& segment = m_segments[m_currentIndex];
        m_current = m_factory->get( segment, m_groups, m_cancel );
        if ( m_current->size() <= segment.endOffset ) {
            std::stringstream message;
            message << "Article " << segment.id << " has only " << m_current->size() << " B but "
                    << segment.endOffset + 1 << " B are required";
            throw TransportError( std::move( message ).str() );
        }
        m_currentPosition = segment.startOffset;
    }

private:
    const std::shared_ptr<PooledSegmentReaderFactory> m_factory;
    const std::vector<Segment> m_segments;
    const std::vector<std::string> m_groups;
    const size_t m_workers;
    const CancellationToken m_cancel;

    size_t m_currentIndex{ 0 };
    size_t m_nextPrefetch{ 0 };
    Payload m_current;
    /** Article-relative offset of the next byte to copy out of m_current. */
    uint64_t m_currentPosition{ 0 };
    uint64_t m_remaining{ 0 };
};


inline std::unique_ptr<SegmentRangeReader>
PooledSegmentReaderFactory::open( const Part&              part,
                                  uint64_t                 offset,
                                  uint64_t                 length,
                                  size_t                   workers,
                                  const CancellationToken& cancel )
{
    if ( ( offset > part.size ) || ( length > part.size - offset ) ) {
        std::stringstream message;
        message << "Requested window " << length << "@" << offset << " lies outside of part "
                << part.name << " with size " << part.size;
        throw std::invalid_argument( std::move( message ).str() );
    }

    auto mapped = sliceSegments( part.segments, offset, length );
    if ( mapped.coveredBytes != length ) {
        std::stringstream message;
        message << "Segments of part " << part.name << " only cover " << mapped.coveredBytes << " of the "
                << length << " B requested at offset " << offset;
        throw TransportError( std::move( message ).str() );
    }

    {
        const std::lock_guard lock( m_mutex );
        ++m_statistics.readersOpened;
    }

    auto groups = part.groups.empty() ? m_groups : part.groups;
    return std::make_unique<Reader>( shared_from_this(), std::move( mapped.segments ), std::move( groups ),
                                     std::max<size_t>( 1, workers ), cancel );
}
}  // namespace nzbseek
