#pragma once

#include <cstdint>
#include <exception>
#include <functional>
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

#include "ArchiveDecoder.hpp"
#include "FileSystem.hpp"
#include "MultiPartFileReader.hpp"
#include "ParallelPreloader.hpp"
#include "PartNaming.hpp"
#include "Segment.hpp"
#include "SegmentMapper.hpp"
#include "SegmentSource.hpp"


namespace nzbseek
{
/**
 * Default relevance predicate: media files and archives, which might be nested archives.
 */
[[nodiscard]] inline bool
isRelevantEntry( const std::string& internalPath )
{
    return isMediaFile( internalPath ) || isRarFile( internalPath ) || isSevenZipFile( internalPath );
}


struct DiscoveryConfiguration
{
    /** Size of the download thread pool used for preloading. */
    size_t maxConnections{ 8 };
    bool enableMemoryPreload{ true };
    /** Archives up to this size are downloaded completely before they are analyzed. */
    uint64_t memoryPreloadBudget{ 8_Gi };
    /** Entries not matching this predicate are returned without segments. */
    std::function<bool( const std::string& )> isRelevant{ isRelevantEntry };
    bool verbose{ false };
    PartReaderConfiguration partReader;
};


/**
 * Finds the members of an archive posted as a set of parts and maps each member to the article
 * segments holding its bytes.
 *
 * The parts are renamed to one common base name, sorted by volume, and the first volume is selected.
 * Small archives are then preloaded into memory in parallel. Larger ones, and small ones whose preload
 * failed, are read on demand through a VirtualFileSystem.
 *
 * Instances hold no per-pass state, so concurrent discovery of different archives is safe.
 */
class ArchiveDiscovery
{
public:
    /** Return false to stop the discovery after this entry. */
    using EntryCallback = std::function<bool( const ArchiveEntry& )>;

public:
    ArchiveDiscovery( std::shared_ptr<SegmentReaderFactory> readerFactory,
                      std::shared_ptr<ArchiveDecoder>       decoder,
                      DiscoveryConfiguration                configuration = {} ) :
        m_readerFactory( std::move( readerFactory ) ),
        m_decoder( std::move( decoder ) ),
        m_configuration( std::move( configuration ) )
    {
        if ( !m_readerFactory || !m_decoder ) {
            throw std::invalid_argument( "ArchiveDiscovery requires a segment reader factory and a decoder!" );
        }
        if ( !m_configuration.isRelevant ) {
            m_configuration.isRelevant = isRelevantEntry;
        }
    }

    /**
     * @throws NotFoundError if there are no parts or no first volume,
     *         UnsupportedArchiveError if no entries were found,
     *         TransportError if the streaming path fails, CancelledError.
     */
    [[nodiscard]] std::vector<ArchiveEntry>
    discover( PartSet                  parts,
              const CancellationToken& cancel = {} ) const
    {
        const auto tStart = now();
        const auto [canonicalParts, firstPart] = prepare( std::move( parts ) );

        if ( m_configuration.enableMemoryPreload
             && ParallelPreloader::fitsBudget( *canonicalParts, m_configuration.memoryPreloadBudget ) )
        {
            try {
                auto entries = discoverPreloaded( canonicalParts, firstPart, cancel );
                logFinished( entries, firstPart, "memory preload", tStart );
                return entries;
            } catch ( const CancelledError& ) {
                throw;
            } catch ( const std::exception& exception ) {
                std::cerr << ( ThreadSafeOutput() << "[Warning] Memory preload of" << firstPart
                               << "failed, falling back to streaming:" << exception.what() );
            }
        }

        auto entries = discoverStreaming( canonicalParts, firstPart, {}, cancel );
        logFinished( entries, firstPart, "streaming", tStart );
        return entries;
    }

    /**
     * Calls @p onEntry for each entry as soon as it has been mapped. Always reads on demand
     * because waiting for a complete preload would defeat returning early.
     * @return All entries passed to @p onEntry, including the one for which it returned false.
     */
    [[nodiscard]] std::vector<ArchiveEntry>
    discoverProgressive( PartSet                  parts,
                         const EntryCallback&     onEntry,
                         const CancellationToken& cancel = {} ) const
    {
        const auto tStart = now();
        const auto [canonicalParts, firstPart] = prepare( std::move( parts ) );
        auto entries = discoverStreaming( canonicalParts, firstPart, onEntry, cancel );
        logFinished( entries, firstPart, "progressive streaming", tStart );
        return entries;
    }

    /**
     * Maps one raw entry to its segments. Coverage shortfalls are reported as warnings
     * and visible in ArchiveEntry::coveredSize.
     */
    [[nodiscard]] ArchiveEntry
    mapEntry( const RawArchiveEntry& rawEntry,
              const PartSet&         parts ) const
    {
        ArchiveEntry entry;
        entry.internalPath = rawEntry.internalPath;
        entry.displayName = std::string( baseName( rawEntry.internalPath ) );
        entry.logicalSize = rawEntry.logicalSize;
        entry.isDirectory = rawEntry.isDirectory;

        if ( rawEntry.isDirectory || !m_configuration.isRelevant( rawEntry.internalPath ) ) {
            return entry;
        }

        if ( !rawEntry.extents.empty() ) {
            std::vector<std::string> names;
            names.reserve( parts.size() );
            for ( const auto& part : parts ) {
                names.push_back( part.name );
            }
            const PartIndex index( names );

            for ( const auto& extent : rawEntry.extents ) {
                if ( extent.length == 0 ) {
                    continue;
                }

                const auto partIndex = index.find( extent.partName );
                if ( !partIndex ) {
                    std::cerr << ( ThreadSafeOutput() << "[Warning] Volume" << extent.partName << "of"
                                   << rawEntry.internalPath << "is not part of the posting" );
                    continue;
                }

                auto sliced = sliceSegments( parts[*partIndex].segments, extent.offset, extent.length );
                if ( sliced.coveredBytes != extent.length ) {
                    std::cerr << ( ThreadSafeOutput() << "[Warning] Volume" << extent.partName << "only covers"
                                   << sliced.coveredBytes << "of" << extent.length << "B of"
                                   << rawEntry.internalPath << "at offset" << extent.offset );
                }
                entry.coveredSize += sliced.coveredBytes;
                entry.segments.insert( entry.segments.end(),
                                       std::make_move_iterator( sliced.segments.begin() ),
                                       std::make_move_iterator( sliced.segments.end() ) );
            }
        } else if ( rawEntry.archiveOffset ) {
            auto mapped = mapRange( *rawEntry.archiveOffset, rawEntry.logicalSize, computePartWindows( parts ) );
            entry.coveredSize = mapped.coveredBytes;
            entry.segments = std::move( mapped.segments );
        }

        if ( !entry.isComplete() ) {
            std::cerr << ( ThreadSafeOutput() << "[Warning] Segments of" << rawEntry.internalPath << "cover"
                           << entry.coveredSize << "of" << entry.logicalSize << "B" );
        }
        return entry;
    }

    [[nodiscard]] const DiscoveryConfiguration&
    configuration() const noexcept
    {
        return m_configuration;
    }

private:
    [[nodiscard]] std::pair<std::shared_ptr<const PartSet>, std::string>
    prepare( PartSet parts ) const
    {
        if ( parts.empty() ) {
            throw NotFoundError( "no archive parts given" );
        }

        auto canonicalParts = std::make_shared<const PartSet>( canonicalizeParts( std::move( parts ),
                                                                                  m_decoder->format() ) );
        auto firstPart = selectFirstPart( *canonicalParts, m_decoder->format() );

        if ( m_configuration.verbose ) {
            std::cerr << ( ThreadSafeOutput() << "[ArchiveDiscovery] Analyzing" << toString( m_decoder->format() )
                           << "archive" << firstPart << "with" << canonicalParts->size() << "parts and"
                           << formatBytes( totalSize( *canonicalParts ) ) );
        }
        return { std::move( canonicalParts ), std::move( firstPart ) };
    }

    [[nodiscard]] std::vector<ArchiveEntry>
    discoverPreloaded( const std::shared_ptr<const PartSet>& parts,
                       const std::string&                    firstPart,
                       const CancellationToken&              cancel ) const
    {
        ParallelPreloader preloader( m_readerFactory, m_configuration.maxConnections, m_configuration.partReader );
        auto contents = preloader.downloadAll( *parts, cancel );

        MemoryFileSystem::Files files;
        files.reserve( parts->size() );
        for ( const auto& part : *parts ) {
            files.emplace_back( part.name, contents.at( part.name ) );
        }

        return decode( std::make_shared<const MemoryFileSystem>( std::move( files ) ), parts, firstPart, {}, cancel );
    }

    [[nodiscard]] std::vector<ArchiveEntry>
    discoverStreaming( const std::shared_ptr<const PartSet>& parts,
                       const std::string&                    firstPart,
                       const EntryCallback&                  onEntry,
                       const CancellationToken&              cancel ) const
    {
        auto fileSystem = std::make_shared<const VirtualFileSystem>( parts, m_readerFactory, cancel,
                                                                     m_configuration.partReader );
        return decode( std::move( fileSystem ), parts, firstPart, onEntry, cancel );
    }

    [[nodiscard]] std::vector<ArchiveEntry>
    decode( std::shared_ptr<const FileSystem>     fileSystem,
            const std::shared_ptr<const PartSet>& parts,
            const std::string&                    firstPart,
            const EntryCallback&                  onEntry,
            const CancellationToken&              cancel ) const
    {
        cancel.throwIfCancelled( "Archive discovery" );

        ArchiveSource source;
        source.fileSystem = fileSystem;
        source.firstPartName = firstPart;
        for ( const auto& part : *parts ) {
            source.parts.push_back( FileInfo{ part.name, part.size } );
        }
        source.joined = std::make_shared<MultiPartFileReader>( std::move( fileSystem ), source.parts );
        source.cancel = cancel;

        std::vector<ArchiveEntry> entries;
        bool stoppedEarly{ false };

        try {
            m_decoder->listEntries( source, [&] ( RawArchiveEntry rawEntry ) {
                cancel.throwIfCancelled( "Archive discovery" );
                entries.emplace_back( mapEntry( rawEntry, *parts ) );
                if ( onEntry && !onEntry( entries.back() ) ) {
                    stoppedEarly = true;
                    if ( m_configuration.verbose ) {
                        std::cerr << ( ThreadSafeOutput() << "[ArchiveDiscovery] Stopped early after"
                                       << entries.size() << "entries" );
                    }
                    return false;
                }
                return true;
            } );
        } catch ( const ArchiveError& ) {
            throw;
        } catch ( const std::exception& exception ) {
            throw UnsupportedArchiveError( "Failed to list the entries of " + firstPart + ": " + exception.what() );
        }

        if ( entries.empty() && !stoppedEarly ) {
            throw UnsupportedArchiveError( "No valid files found in archive " + firstPart
                                           + ". Compressed or encrypted archives are not supported." );
        }
        return entries;
    }

    void
    logFinished( const std::vector<ArchiveEntry>& entries,
                 const std::string&               firstPart,
                 const char*                      path,
                 decltype( now() )                tStart ) const
    {
        if ( m_configuration.verbose ) {
            std::cerr << ( ThreadSafeOutput() << "[ArchiveDiscovery] Found" << entries.size() << "entries in"
                           << firstPart << "via" << path << "in" << duration( tStart ) << "s" );
        }
    }

private:
    const std::shared_ptr<SegmentReaderFactory> m_readerFactory;
    const std::shared_ptr<ArchiveDecoder> m_decoder;
    DiscoveryConfiguration m_configuration;
};
}  // namespace nzbseek
