#pragma once

#include <algorithm>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <core/Error.hpp>
#include <core/filereader/FileReader.hpp>

#include "FileSystem.hpp"
#include "Segment.hpp"


namespace nzbseek
{
/**
 * Presents the concatenation of all parts as one flat file, for formats like split 7z archives
 * whose headers use offsets into the joined archive. Reads that straddle a part boundary are
 * split into per-part reads. The parts are opened lazily through the given FileSystem and kept
 * open until this reader is closed, so that their read-ahead buffers stay useful.
 *
 * @ref readAt is thread-safe. The FileReader interface with its single cursor is not.
 */
class MultiPartFileReader :
    public FileReader
{
public:
    MultiPartFileReader( std::shared_ptr<const FileSystem> fileSystem,
                         std::vector<FileInfo>             parts ) :
        m_fileSystem( std::move( fileSystem ) ),
        m_parts( std::move( parts ) ),
        m_handles( m_parts.size() )
    {
        if ( !m_fileSystem ) {
            throw std::invalid_argument( "MultiPartFileReader requires a file system!" );
        }

        m_partOffsets.reserve( m_parts.size() );
        for ( const auto& part : m_parts ) {
            m_partOffsets.push_back( m_size );
            m_size += part.size;
        }
    }

    [[nodiscard]] static std::unique_ptr<MultiPartFileReader>
    fromParts( std::shared_ptr<const FileSystem> fileSystem,
               const PartSet&                    parts )
    {
        std::vector<FileInfo> layout;
        layout.reserve( parts.size() );
        for ( const auto& part : parts ) {
            layout.push_back( FileInfo{ part.name, part.size } );
        }
        return std::make_unique<MultiPartFileReader>( std::move( fileSystem ), std::move( layout ) );
    }

    [[nodiscard]] UniqueFileReader
    clone() const override
    {
        return std::make_unique<MultiPartFileReader>( m_fileSystem, m_parts );
    }

    void
    close() override
    {
        const std::lock_guard lock( m_mutex );
        m_closed = true;
        for ( auto& handle : m_handles ) {
            handle.reset();
        }
    }

    [[nodiscard]] bool
    closed() const override
    {
        const std::lock_guard lock( m_mutex );
        return m_closed;
    }

    [[nodiscard]] bool
    eof() const override
    {
        return m_position >= m_size;
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
        const auto nBytesRead = readAt( buffer, nMaxBytesToRead, m_position );
        m_position += nBytesRead;
        return nBytesRead;
    }

    size_t
    seek( long long int offset,
          int           origin = SEEK_SET ) override
    {
        if ( closed() ) {
            throw ClosedFileError();
        }
        m_position = checkedOffset( offset, origin );
        return m_position;
    }

    [[nodiscard]] std::optional<size_t>
    size() const override
    {
        return m_size;
    }

    [[nodiscard]] size_t
    tell() const override
    {
        return m_position;
    }

    /**
     * Reads up to @p size bytes starting at the logical @p offset. Parts delivering fewer bytes than
     * their declared size end the read early. Errors other than reaching the end of data are rethrown.
     * A null @p buffer skips the bytes.
     * @return Number of bytes read. Zero if @p offset is at or past the end.
     */
    [[nodiscard]] size_t
    readAt( char*    buffer,
            size_t   size,
            uint64_t offset )
    {
        const std::lock_guard lock( m_mutex );
        if ( m_closed ) {
            throw ClosedFileError();
        }

        size_t nBytesRead{ 0 };
        while ( ( nBytesRead < size ) && ( offset < m_size ) ) {
            const auto partIndex = findPart( offset );
            const auto offsetInPart = offset - m_partOffsets[partIndex];
            const auto nBytesToRead = std::min<uint64_t>( size - nBytesRead,
                                                          m_parts[partIndex].size - offsetInPart );

            auto& handle = m_handles[partIndex];
            if ( !handle ) {
                handle = m_fileSystem->open( m_parts[partIndex].name );
            }
            if ( handle->tell() != offsetInPart ) {
                handle->seek( static_cast<long long int>( offsetInPart ) );
            }

            const auto nBytesFromPart = handle->read( buffer == nullptr ? nullptr : buffer + nBytesRead, nBytesToRead );
            if ( nBytesFromPart == 0 ) {
                break;
            }
            nBytesRead += nBytesFromPart;
            offset += nBytesFromPart;
        }

        return nBytesRead;
    }

    [[nodiscard]] const std::vector<FileInfo>&
    parts() const noexcept
    {
        return m_parts;
    }

private:
    [[nodiscard]] size_t
    findPart( uint64_t offset ) const
    {
        /* Skip empty parts by looking for the last part starting at or before the offset. */
        const auto match = std::upper_bound( m_partOffsets.begin(), m_partOffsets.end(), offset );
        return static_cast<size_t>( std::distance( m_partOffsets.begin(), match ) ) - 1;
    }

private:
    const std::shared_ptr<const FileSystem> m_fileSystem;
    const std::vector<FileInfo> m_parts;
    std::vector<uint64_t> m_partOffsets;
    uint64_t m_size{ 0 };

    mutable std::mutex m_mutex;
    std::vector<UniqueFileReader> m_handles;
    bool m_closed{ false };
    uint64_t m_position{ 0 };
};
}  // namespace nzbseek
