#pragma once

#include <algorithm>
#include <cstring>
#include <memory>
#include <utility>
#include <vector>

#include "FileReader.hpp"


namespace nzbseek
{
/**
 * Serves a fully downloaded part from memory. The buffer is shared between clones.
 */
class MemoryFileReader :
    public FileReader
{
public:
    using Buffer = std::shared_ptr<const std::vector<char> >;

public:
    explicit
    MemoryFileReader( Buffer data ) :
        m_data( data ? std::move( data ) : std::make_shared<const std::vector<char> >() )
    {}

    explicit
    MemoryFileReader( std::vector<char> data ) :
        m_data( std::make_shared<const std::vector<char> >( std::move( data ) ) )
    {}

    [[nodiscard]] UniqueFileReader
    clone() const override
    {
        return std::make_unique<MemoryFileReader>( m_data );
    }

    void
    close() override
    {
        m_closed = true;
        m_currentPosition = 0;
    }

    [[nodiscard]] bool
    closed() const override
    {
        return m_closed;
    }

    [[nodiscard]] bool
    eof() const override
    {
        return m_currentPosition >= m_data->size();
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
            throw ClosedFileError();
        }

        const auto nBytesRead = std::min( nMaxBytesToRead, m_data->size() - m_currentPosition );
        if ( nBytesRead == 0 ) {
            return 0;
        }

        if ( buffer != nullptr ) {
            std::memcpy( buffer, m_data->data() + m_currentPosition, nBytesRead );
        }

        m_currentPosition += nBytesRead;

        return nBytesRead;
    }

    size_t
    seek( long long int offset,
          int           origin = SEEK_SET ) override
    {
        if ( m_closed ) {
            throw ClosedFileError();
        }

        m_currentPosition = checkedOffset( offset, origin );
        return m_currentPosition;
    }

    [[nodiscard]] std::optional<size_t>
    size() const override
    {
        return m_data->size();
    }

    [[nodiscard]] size_t
    tell() const override
    {
        return m_currentPosition;
    }

private:
    const Buffer m_data;
    bool m_closed{ false };
    size_t m_currentPosition{ 0 };
};
}  // namespace nzbseek
