#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <core/common.hpp>
#include <core/Error.hpp>


namespace nzbseek
{
class FileReader;

using UniqueFileReader = std::unique_ptr<FileReader>;


/**
 * Read-only, seekable file object. Implementations are virtual part files backed by article segments,
 * in-memory buffers, or the concatenation of several parts. Instances are not thread-safe.
 * Use @ref clone to get an independent handle for another thread.
 */
class FileReader
{
public:
    FileReader() = default;

    virtual
    ~FileReader() = default;

    /* Delete copy constructors and assignments to avoid slicing. */

    FileReader( const FileReader& ) = delete;

    FileReader( FileReader&& ) = delete;

    FileReader&
    operator=( const FileReader& ) = delete;

    FileReader&
    operator=( FileReader&& ) = delete;

    [[nodiscard]] virtual UniqueFileReader
    clone() const = 0;

    virtual void
    close() = 0;

    [[nodiscard]] virtual bool
    closed() const = 0;

    [[nodiscard]] virtual bool
    eof() const = 0;

    [[nodiscard]] virtual bool
    seekable() const = 0;

    /**
     * @return The number of bytes read. Zero means end of file. Fewer than requested bytes are only
     *         returned at the end of file.
     */
    [[nodiscard]] virtual size_t
    read( char*  buffer,
          size_t nMaxBytesToRead ) = 0;

    virtual size_t
    seek( long long int offset,
          int           origin = SEEK_SET ) = 0;

    [[nodiscard]] virtual std::optional<size_t>
    size() const = 0;

    [[nodiscard]] virtual size_t
    tell() const = 0;

    /**
     * Resolves @p offset relative to @p origin without clamping.
     * @throws InvalidSeekError for an unknown origin, a negative result, or a result past the end of file.
     */
    [[nodiscard]] size_t
    checkedOffset( long long int offset,
                   int           origin ) const
    {
        const auto fileSize = size();
        const auto absoluteOffset = [&] () {
            switch ( origin )
            {
            case SEEK_CUR:
                return saturatingAddition( static_cast<long long int>( tell() ), offset );
            case SEEK_SET:
                return offset;
            case SEEK_END:
                if ( fileSize.has_value() ) {
                    return saturatingAddition( static_cast<long long int>( *fileSize ), offset );
                }
                throw InvalidSeekError( "File size is not available to seek from end!" );
            }
            throw InvalidSeekError( "Invalid seek origin supplied: " + std::to_string( origin ) );
        } ();

        if ( absoluteOffset < 0 ) {
            throw InvalidSeekError( "Negative seek position: " + std::to_string( absoluteOffset ) );
        }
        if ( fileSize.has_value() && ( static_cast<size_t>( absoluteOffset ) > *fileSize ) ) {
            throw InvalidSeekError( "Seek position " + std::to_string( absoluteOffset )
                                    + " lies past the end of the file of size " + std::to_string( *fileSize ) );
        }
        return static_cast<size_t>( absoluteOffset );
    }
};
}  // namespace nzbseek
