#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <core/Cancellation.hpp>
#include <core/common.hpp>
#include <core/Error.hpp>
#include <core/ThreadPool.hpp>

#include "FileSystem.hpp"
#include "PartFileReader.hpp"
#include "Segment.hpp"


namespace nzbseek
{
/**
 * Downloads all parts of an archive into memory in parallel, one part per worker.
 * Small archives are faster to analyze this way than through many small ranged reads.
 * The result is all or nothing: when one part fails, the others are aborted and the first error is rethrown.
 */
class ParallelPreloader
{
public:
    using Buffer = MemoryFileReader::Buffer;

    struct Statistics
    {
        size_t partsDownloaded{ 0 };
        uint64_t bytesDownloaded{ 0 };
        double duration{ 0 };
    };

public:
    ParallelPreloader( std::shared_ptr<SegmentReaderFactory> readerFactory,
                       size_t                                maxConnections,
                       PartReaderConfiguration               configuration = {} ) :
        m_readerFactory( std::move( readerFactory ) ),
        m_maxConnections( std::max<size_t>( 1, maxConnections ) ),
        m_configuration( configuration )
    {}

    /**
     * @return True if the summed size of all parts fits into the memory budget.
     */
    [[nodiscard]] static bool
    fitsBudget( const PartSet& parts,
                uint64_t       memoryBudget )
    {
        return totalSize( parts ) <= memoryBudget;
    }

    /**
     * @return The contents of every part, keyed by part name.
     * @throws The first error of any worker, e.g., TransportError or CancelledError.
     */
    [[nodiscard]] std::map<std::string, Buffer>
    downloadAll( const PartSet&           parts,
                 const CancellationToken& cancel )
    {
        const auto tStart = now();
        cancel.throwIfCancelled( "Preload" );

        /* Child token so that the first failure stops all other downloads without cancelling the caller. */
        const CancellationToken abortToken;
        const auto sharedParts = std::make_shared<const PartSet>( parts );
        const VirtualFileSystem fileSystem( sharedParts, m_readerFactory, abortToken, m_configuration );

        std::vector<Buffer> buffers( sharedParts->size() );
        std::exception_ptr firstFailure;
        std::exception_ptr firstCancellation;
        {
            ThreadPool threadPool( std::min( m_maxConnections, std::max<size_t>( 1, sharedParts->size() ) ) );

            std::vector<std::future<Buffer> > downloads;
            downloads.reserve( sharedParts->size() );
            for ( const auto& part : *sharedParts ) {
                downloads.emplace_back( threadPool.submit( [&fileSystem, &part, &abortToken] () {
                    return downloadPart( fileSystem, part, abortToken );
                } ) );
            }

            /* Wait for all workers before leaving the scope because they reference local objects. */
            for ( size_t i = 0; i < downloads.size(); ++i ) {
                while ( downloads[i].wait_for( std::chrono::milliseconds( 10 ) ) != std::future_status::ready ) {
                    if ( cancel.cancelled() ) {
                        abortToken.cancel();
                    }
                }

                try {
                    buffers[i] = downloads[i].get();
                } catch ( const CancelledError& ) {
                    /* Usually a consequence of another part failing. Only reported if nothing else failed. */
                    if ( !firstCancellation ) {
                        firstCancellation = std::current_exception();
                    }
                    abortToken.cancel();
                } catch ( const std::exception& ) {
                    if ( !firstFailure ) {
                        firstFailure = std::current_exception();
                    }
                    abortToken.cancel();
                }
            }
        }

        m_statistics.duration += duration( tStart );
        if ( firstFailure || firstCancellation ) {
            if ( m_configuration.verbose ) {
                std::cerr << ( ThreadSafeOutput() << "[ParallelPreloader] Aborted preload of" << sharedParts->size()
                               << "parts after" << duration( tStart ) << "s" );
            }
            cancel.throwIfCancelled( "Preload" );
            std::rethrow_exception( firstFailure ? firstFailure : firstCancellation );
        }

        std::map<std::string, Buffer> result;
        for ( size_t i = 0; i < sharedParts->size(); ++i ) {
            m_statistics.partsDownloaded += 1;
            m_statistics.bytesDownloaded += buffers[i]->size();
            result.emplace( ( *sharedParts )[i].name, std::move( buffers[i] ) );
        }

        if ( m_configuration.verbose ) {
            std::cerr << ( ThreadSafeOutput() << "[ParallelPreloader] Preloaded" << result.size() << "parts with"
                           << formatBytes( totalSize( *sharedParts ) ) << "in" << duration( tStart ) << "s" );
        }
        return result;
    }

    [[nodiscard]] const Statistics&
    statistics() const noexcept
    {
        return m_statistics;
    }

private:
    [[nodiscard]] static Buffer
    downloadPart( const VirtualFileSystem& fileSystem,
                  const Part&              part,
                  const CancellationToken& abortToken )
    {
        abortToken.throwIfCancelled( "Preload of " + part.name );

        auto file = fileSystem.openPart( part.name, ReadMode::STREAMING );
        std::vector<char> data( part.size );
        const auto nBytesRead = file->read( data.data(), data.size() );
        if ( nBytesRead != part.size ) {
            std::stringstream message;
            message << "Preloaded " << nBytesRead << " B of part " << part.name << " but expected " << part.size << " B";
            throw TransportError( std::move( message ).str() );
        }
        return std::make_shared<const std::vector<char> >( std::move( data ) );
    }

private:
    const std::shared_ptr<SegmentReaderFactory> m_readerFactory;
    const size_t m_maxConnections;
    const PartReaderConfiguration m_configuration;
    Statistics m_statistics;
};
}  // namespace nzbseek
