#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <core/Cancellation.hpp>
#include <core/common.hpp>
#include <core/Error.hpp>
#include <core/filereader/FileReader.hpp>

#include "Segment.hpp"
#include "SegmentSource.hpp"


namespace nzbseek
{
struct PartReaderConfiguration
{
    /** Size of the first network window opened in analysis mode. */
    uint64_t initialAnalysisWindow{ 256_Ki };
    /** The analysis window doubles up to this size. */
    uint64_t maxAnalysisWindow{ 4_Mi };
    /** The window grows when the read position gets this close to its end. */
    uint64_t windowGrowthThreshold{ 4_Ki };
    /** Recently read bytes kept for backward re-reads in analysis mode. */
    size_t readAheadBufferSize{ 512_Ki };
    size_t analysisFetchParallelism{ 8 };
    size_t streamingFetchParallelism{ 4 };
    bool verbose{ false };
};


enum class ReadMode
{
    /** Small growing windows and a read-ahead buffer for archive header parsing. */
    ANALYSIS,
    /** One window up to the end of the part for bulk reads. */
    STREAMING,
};


[[nodiscard]] inline std::string
toString( ReadMode mode )
{
    return mode == ReadMode::ANALYSIS ? "analysis" : "streaming";
}


/**
 * Random-access file over one part that downloads the article segments it needs on demand.
 *
 * Archive header parsers read small chunks, often jumping backwards near the end of a volume.
 * Fetching each such read separately multiplies the round trips, while fetching the whole volume
 * wastes bandwidth. Therefore, each handle starts in analysis mode, opening network windows of
 * 256 KiB that double up to 4 MiB while reading sequentially, and keeping the last 512 KiB read
 * in a buffer. The first seek to a position that is neither 0 nor buffered is taken as the start
 * of bulk reading and switches the handle permanently into streaming mode.
 *
 * A handle must not be used by more than one thread at a time. Use @ref clone instead.
 */
class PartFileReader :
    public FileReader
{
public:
    struct Statistics
    {
        size_t readersOpened{ 0 };
        size_t windowGrowths{ 0 };
        uint64_t bytesFromBuffer{ 0 };
        uint64_t bytesFromNetwork{ 0 };
        uint64_t bytesSkipped{ 0 };
        uint64_t largestWindow{ 0 };
    };

public:
    PartFileReader( std::shared_ptr<const Part>           part,
                    std::shared_ptr<SegmentReaderFactory> readerFactory,
                    CancellationToken                     cancel,
                    PartReaderConfiguration               configuration = {},
                    ReadMode                              mode = ReadMode::ANALYSIS ) :
        m_part( std::move( part ) ),
        m_readerFactory( std::move( readerFactory ) ),
        m_cancel( std::move( cancel ) ),
        m_configuration( configuration ),
        m_mode( mode ),
        m_analysisWindow( std::max<uint64_t>( 1, configuration.initialAnalysisWindow ) )
    {
        if ( !m_part || !m_readerFactory ) {
            throw std::invalid_argument( "PartFileReader requires a part and a segment reader factory!" );
        }
    }

    [[nodiscard]] UniqueFileReader
    clone() const override
    {
        return std::make_unique<PartFileReader>( m_part, m_readerFactory, m_cancel, m_configuration );
    }

    void
    close() override
    {
        m_closed = true;
        m_reader.reset();
        m_buffer.clear();
        m_buffer.shrink_to_fit();
    }

    [[nodiscard]] bool
    closed() const override
    {
        return m_closed;
    }

    [[nodiscard]] bool
    eof() const override
    {
        return m_position >= m_part->size;
    }

    [[nodiscard]] bool
    seekable() const override
    {
        return true;
    }

    [[nodiscard]] size_t
    read( char*  buffer,
          size_t nMaxBytesToRead ) override
    {
        if ( m_closed ) {
            throw ClosedFileError( "Read from closed part " + m_part->name );
        }
        if ( buffer == nullptr ) {
            return skip( nMaxBytesToRead );
        }

        size_t nBytesRead{ 0 };
        while ( ( nBytesRead < nMaxBytesToRead ) && ( m_position < m_part->size ) ) {
            m_cancel.throwIfCancelled( "Reading " + m_part->name );

            if ( bufferContains( m_position ) ) {
                const auto offsetInBuffer = m_position - m_bufferOffset;
                const auto nBytesToCopy = std::min<uint64_t>( nMaxBytesToRead - nBytesRead,
                                                              m_buffer.size() - offsetInBuffer );
                std::memcpy( buffer + nBytesRead, m_buffer.data() + offsetInBuffer, nBytesToCopy );
                nBytesRead += nBytesToCopy;
                m_position += nBytesToCopy;
                m_statistics.bytesFromBuffer += nBytesToCopy;
                continue;
            }

            prepareReader();

            const auto nBytesToRead = std::min<uint64_t>( nMaxBytesToRead - nBytesRead, m_readerEnd - m_position );
            const auto nBytesFetched = m_reader->read( buffer + nBytesRead, nBytesToRead );
            if ( nBytesFetched == 0 ) {
                std::stringstream message;
                message << "Network reader for " << m_part->name << " ended at offset " << m_position
                        << " before the end of its window at " << m_readerEnd;
                throw TransportError( std::move( message ).str() );
            }

            if ( m_mode == ReadMode::ANALYSIS ) {
                appendToBuffer( m_position, buffer + nBytesRead, nBytesFetched );
            }

            nBytesRead += nBytesFetched;
            m_position += nBytesFetched;
            m_readerPosition += nBytesFetched;
            m_statistics.bytesFromNetwork += nBytesFetched;

            if ( ( m_mode == ReadMode::ANALYSIS ) && ( m_position + m_configuration.windowGrowthThreshold >= m_readerEnd )
                 && ( m_readerEnd < m_part->size ) )
            {
                /* Reopen with a larger window on the next read. */
                m_reader.reset();
                m_analysisWindow = std::min( m_analysisWindow * 2, std::max<uint64_t>( m_configuration.maxAnalysisWindow,
                                                                                       m_analysisWindow ) );
                ++m_statistics.windowGrowths;
            }
        }

        return nBytesRead;
    }

    size_t
    seek( long long int offset,
          int           origin = SEEK_SET ) override
    {
        if ( m_closed ) {
            throw ClosedFileError( "Seek in closed part " + m_part->name );
        }

        const auto newPosition = checkedOffset( offset, origin );
        const auto inBuffer = bufferContains( newPosition );

        if ( ( m_mode == ReadMode::ANALYSIS ) && ( newPosition != 0 ) && !inBuffer ) {
            m_mode = ReadMode::STREAMING;
            if ( m_configuration.verbose ) {
                std::cerr << ( ThreadSafeOutput() << "[PartFileReader] Switching" << m_part->name
                               << "to streaming mode after seek to" << newPosition );
            }
        }

        if ( m_reader && !inBuffer && ( ( newPosition < m_readerPosition ) || ( newPosition >= m_readerEnd ) ) ) {
            m_reader.reset();
        }

        m_position = newPosition;
        return m_position;
    }

    [[nodiscard]] std::optional<size_t>
    size() const override
    {
        return m_part->size;
    }

    [[nodiscard]] size_t
    tell() const override
    {
        return m_position;
    }

    [[nodiscard]] ReadMode
    mode() const noexcept
    {
        return m_mode;
    }

    [[nodiscard]] const Part&
    part() const noexcept
    {
        return *m_part;
    }

    [[nodiscard]] const Statistics&
    statistics() const noexcept
    {
        return m_statistics;
    }

private:
    /**
     * Reads and discards. Going through the regular read path keeps the buffered range contiguous.
     */
    size_t
    skip( size_t nBytesToSkip )
    {
        std::vector<char> discarded( std::min<size_t>( nBytesToSkip, 64_Ki ) );
        size_t nBytesSkipped{ 0 };
        while ( nBytesSkipped < nBytesToSkip ) {
            const auto nBytesRead = read( discarded.data(), std::min( discarded.size(), nBytesToSkip - nBytesSkipped ) );
            if ( nBytesRead == 0 ) {
                break;
            }
            nBytesSkipped += nBytesRead;
        }
        return nBytesSkipped;
    }

    [[nodiscard]] bool
    bufferContains( uint64_t position ) const noexcept
    {
        return !m_buffer.empty() && ( position >= m_bufferOffset ) && ( position < m_bufferOffset + m_buffer.size() );
    }

    /**
     * Keeps the most recently read bytes. Reads that do not continue the buffered range replace it.
     */
    void
    appendToBuffer( uint64_t    position,
                    const char* data,
                    size_t      size )
    {
        const auto capacity = m_configuration.readAheadBufferSize;
        if ( capacity == 0 ) {
            return;
        }

        if ( m_buffer.empty() || ( position != m_bufferOffset + m_buffer.size() ) ) {
            m_buffer.clear();
            m_bufferOffset = position;
        }

        if ( size >= capacity ) {
            m_buffer.assign( data + ( size - capacity ), data + size );
            m_bufferOffset = position + ( size - capacity );
            return;
        }

        m_buffer.insert( m_buffer.end(), data, data + size );
        if ( m_buffer.size() > capacity ) {
            const auto excess = m_buffer.size() - capacity;
            m_buffer.erase( m_buffer.begin(), m_buffer.begin() + excess );
            m_bufferOffset += excess;
        }
    }

    /**
     * Ensures that m_reader delivers the byte at m_position next. Short forward gaps inside the
     * current window are skipped by reading and discarding. Everything else opens a new window.
     */
    void
    prepareReader()
    {
        if ( m_reader && ( m_position >= m_readerPosition ) && ( m_position < m_readerEnd )
             && ( m_position - m_readerPosition <= m_configuration.readAheadBufferSize ) )
        {
            std::vector<char> discarded( std::min<uint64_t>( m_position - m_readerPosition, 64_Ki ) );
            while ( m_readerPosition < m_position ) {
                const auto nBytesToSkip = std::min<uint64_t>( discarded.size(), m_position - m_readerPosition );
                const auto nBytesSkipped = m_reader->read( discarded.data(), nBytesToSkip );
                if ( nBytesSkipped == 0 ) {
                    throw TransportError( "Network reader for " + m_part->name + " ended while skipping forward" );
                }
                m_readerPosition += nBytesSkipped;
                m_statistics.bytesSkipped += nBytesSkipped;
            }
            return;
        }

        m_reader.reset();

        const auto remaining = m_part->size - m_position;
        const auto length = m_mode == ReadMode::ANALYSIS ? std::min( m_analysisWindow, remaining ) : remaining;
        const auto workers = m_mode == ReadMode::ANALYSIS ? m_configuration.analysisFetchParallelism
                                                          : m_configuration.streamingFetchParallelism;

        if ( m_configuration.verbose ) {
            std::cerr << ( ThreadSafeOutput() << "[PartFileReader] Opening" << toString( m_mode ) << "window"
                           << length << "@" << m_position << "of" << m_part->name << "with" << workers << "workers" );
        }

        m_reader = m_readerFactory->open( *m_part, m_position, length, workers, m_cancel );
        m_readerPosition = m_position;
        m_readerEnd = m_position + length;
        ++m_statistics.readersOpened;
        m_statistics.largestWindow = std::max( m_statistics.largestWindow, length );
    }

private:
    const std::shared_ptr<const Part> m_part;
    const std::shared_ptr<SegmentReaderFactory> m_readerFactory;
    const CancellationToken m_cancel;
    const PartReaderConfiguration m_configuration;

    ReadMode m_mode;
    bool m_closed{ false };
    uint64_t m_position{ 0 };

    std::unique_ptr<SegmentRangeReader> m_reader;
    /** Part offset of the next byte m_reader will return. */
    uint64_t m_readerPosition{ 0 };
    /** Exclusive end of the window m_reader was opened for. */
    uint64_t m_readerEnd{ 0 };
    uint64_t m_analysisWindow;

    std::vector<char> m_buffer;
    uint64_t m_bufferOffset{ 0 };

    Statistics m_statistics;
};
}  // namespace nzbseek
