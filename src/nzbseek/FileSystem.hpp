#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <core/Cancellation.hpp>
#include <core/Error.hpp>
#include <core/filereader/FileReader.hpp>
#include <core/filereader/Memory.hpp>

#include "PartFileReader.hpp"
#include "PartNaming.hpp"
#include "Segment.hpp"
#include "SegmentSource.hpp"


namespace nzbseek
{
struct FileInfo
{
    std::string name;
    uint64_t size{ 0 };
};


/**
 * Read-only open/stat surface over the volumes of one archive, as required by archive readers
 * that locate further volumes by name.
 */
class FileSystem
{
public:
    virtual
    ~FileSystem() = default;

    /**
     * @throws NotFoundError
     */
    [[nodiscard]] virtual UniqueFileReader
    open( std::string_view name ) const = 0;

    /**
     * @throws NotFoundError
     */
    [[nodiscard]] virtual FileInfo
    stat( std::string_view name ) const = 0;

    [[nodiscard]] bool
    exists( std::string_view name ) const
    {
        try {
            static_cast<void>( stat( name ) );
            return true;
        } catch ( const NotFoundError& ) {
            return false;
        }
    }
};


/**
 * Resolves names to part indexes. A name is tried verbatim, then with leading "./" and "/" removed,
 * then by its base name. Exact names take precedence over base names. If several parts share a
 * base name, the first one in part order wins.
 */
class PartIndex
{
public:
    explicit
    PartIndex( const std::vector<std::string>& names )
    {
        for ( size_t i = 0; i < names.size(); ++i ) {
            m_exact.try_emplace( names[i], i );
        }
        for ( size_t i = 0; i < names.size(); ++i ) {
            m_base.try_emplace( std::string( baseName( names[i] ) ), i );
        }
    }

    [[nodiscard]] std::optional<size_t>
    find( std::string_view name ) const
    {
        if ( const auto match = m_exact.find( std::string( name ) ); match != m_exact.end() ) {
            return match->second;
        }

        auto cleaned = name;
        while ( startsWith( cleaned, std::string_view( "./" ) ) ) {
            cleaned.remove_prefix( 2 );
        }
        while ( !cleaned.empty() && ( cleaned.front() == '/' ) ) {
            cleaned.remove_prefix( 1 );
        }
        if ( const auto match = m_exact.find( std::string( cleaned ) ); match != m_exact.end() ) {
            return match->second;
        }

        if ( const auto match = m_base.find( std::string( baseName( name ) ) ); match != m_base.end() ) {
            return match->second;
        }
        return std::nullopt;
    }

private:
    std::map<std::string, size_t, std::less<> > m_exact;
    std::map<std::string, size_t, std::less<> > m_base;
};


/**
 * Exposes every part of a PartSet as a file that is downloaded lazily through a PartFileReader.
 * Each call to @ref open returns an independent handle, so the file system itself may be used
 * from several threads.
 */
class VirtualFileSystem :
    public FileSystem
{
public:
    VirtualFileSystem( std::shared_ptr<const PartSet>        parts,
                       std::shared_ptr<SegmentReaderFactory> readerFactory,
                       CancellationToken                     cancel = {},
                       PartReaderConfiguration               configuration = {} ) :
        m_parts( std::move( parts ) ),
        m_readerFactory( std::move( readerFactory ) ),
        m_cancel( std::move( cancel ) ),
        m_configuration( configuration ),
        m_index( m_parts ? partNames( *m_parts ) : std::vector<std::string>() )
    {
        if ( !m_parts || !m_readerFactory ) {
            throw std::invalid_argument( "VirtualFileSystem requires parts and a segment reader factory!" );
        }
    }

    [[nodiscard]] UniqueFileReader
    open( std::string_view name ) const override
    {
        return openPart( name, ReadMode::ANALYSIS );
    }

    /**
     * Like @ref open but lets the caller choose the initial mode, e.g., streaming for bulk downloads.
     */
    [[nodiscard]] std::unique_ptr<PartFileReader>
    openPart( std::string_view name,
              ReadMode         mode ) const
    {
        const auto index = find( name );
        std::shared_ptr<const Part> part( m_parts, &( *m_parts )[index] );
        return std::make_unique<PartFileReader>( std::move( part ), m_readerFactory, m_cancel, m_configuration,
                                                 mode );
    }

    [[nodiscard]] FileInfo
    stat( std::string_view name ) const override
    {
        const auto& part = ( *m_parts )[find( name )];
        return FileInfo{ part.name, part.size };
    }

    [[nodiscard]] const PartSet&
    parts() const noexcept
    {
        return *m_parts;
    }

private:
    [[nodiscard]] size_t
    find( std::string_view name ) const
    {
        if ( const auto index = m_index.find( name ); index ) {
            return *index;
        }
        throw NotFoundError( std::string( name ) );
    }

    [[nodiscard]] static std::vector<std::string>
    partNames( const PartSet& parts )
    {
        std::vector<std::string> names;
        names.reserve( parts.size() );
        for ( const auto& part : parts ) {
            names.push_back( part.name );
        }
        return names;
    }

private:
    const std::shared_ptr<const PartSet> m_parts;
    const std::shared_ptr<SegmentReaderFactory> m_readerFactory;
    const CancellationToken m_cancel;
    const PartReaderConfiguration m_configuration;
    const PartIndex m_index;
};


/**
 * Serves preloaded parts from memory with the same name lookup as VirtualFileSystem.
 */
class MemoryFileSystem :
    public FileSystem
{
public:
    using Files = std::vector<std::pair<std::string, MemoryFileReader::Buffer> >;

public:
    explicit
    MemoryFileSystem( Files files ) :
        m_files( std::move( files ) ),
        m_index( fileNames( m_files ) )
    {}

    [[nodiscard]] UniqueFileReader
    open( std::string_view name ) const override
    {
        return std::make_unique<MemoryFileReader>( m_files[find( name )].second );
    }

    [[nodiscard]] FileInfo
    stat( std::string_view name ) const override
    {
        const auto& [fileName, data] = m_files[find( name )];
        return FileInfo{ fileName, data ? data->size() : 0 };
    }

private:
    [[nodiscard]] size_t
    find( std::string_view name ) const
    {
        if ( const auto index = m_index.find( name ); index ) {
            return *index;
        }
        throw NotFoundError( std::string( name ) );
    }

    [[nodiscard]] static std::vector<std::string>
    fileNames( const Files& files )
    {
        std::vector<std::string> names;
        names.reserve( files.size() );
        for ( const auto& file : files ) {
            names.push_back( file.first );
        }
        return names;
    }

private:
    const Files m_files;
    const PartIndex m_index;
};
}  // namespace nzbseek
