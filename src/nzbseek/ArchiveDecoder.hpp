#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <core/Cancellation.hpp>

#include "FileSystem.hpp"
#include "MultiPartFileReader.hpp"
#include "PartNaming.hpp"
#include "Segment.hpp"


namespace nzbseek
{
/**
 * A contiguous run of an entry's stored bytes inside one volume.
 */
struct VolumeExtent
{
    std::string partName;
    uint64_t offset{ 0 };
    uint64_t length{ 0 };
};


/**
 * An archive member as reported by a decoder. The stored bytes are located either by per-volume
 * extents, as for RAR where each volume has its own headers, or by one offset into the concatenation
 * of all volumes, as for split 7z archives.
 */
struct RawArchiveEntry
{
    std::string internalPath;
    /** Number of stored bytes addressed by the extents or starting at archiveOffset. */
    uint64_t logicalSize{ 0 };
    bool isDirectory{ false };
    std::optional<uint64_t> archiveOffset;
    std::vector<VolumeExtent> extents;
};


/**
 * Everything a decoder may read from. All names are the canonicalized part names.
 */
struct ArchiveSource
{
    std::shared_ptr<const FileSystem> fileSystem;
    std::string firstPartName;
    /** Ordered volumes of the archive. */
    std::vector<FileInfo> parts;
    /** The concatenation of all volumes. */
    std::shared_ptr<MultiPartFileReader> joined;
    CancellationToken cancel;
};


/**
 * Lists the members of an archive without decompressing anything. Parsing the container format
 * is left to implementations of this interface, e.g., wrappers around libarchive or unrar.
 */
class ArchiveDecoder
{
public:
    /** Return false to stop the enumeration. */
    using EntryCallback = std::function<bool( RawArchiveEntry )>;

public:
    virtual
    ~ArchiveDecoder() = default;

    [[nodiscard]] virtual ArchiveFormat
    format() const = 0;

    /**
     * Enumerates the archive members in archive order. Multi-volume decoders discover further volumes
     * through @p source.fileSystem, starting at @p source.firstPartName.
     * @throws UnsupportedArchiveError or any read error of the source.
     */
    virtual void
    listEntries( const ArchiveSource&  source,
                 const EntryCallback&  onEntry ) = 0;
};


/**
 * An archive member together with the article segments holding its stored bytes, in archive order.
 */
struct ArchiveEntry
{
    std::string internalPath;
    std::string displayName;
    uint64_t logicalSize{ 0 };
    bool isDirectory{ false };
    std::vector<Segment> segments;
    /** Summed length of segments. Differs from logicalSize if the posting is incomplete. */
    uint64_t coveredSize{ 0 };

    [[nodiscard]] bool
    isComplete() const noexcept
    {
        return coveredSize == logicalSize;
    }

    /**
     * Turns the entry into a part of its own, so that an archive stored inside an archive
     * can be discovered with the same machinery.
     */
    [[nodiscard]] Part
    toPart() const
    {
        auto part = Part::fromSegments( displayName, segments );
        part.sourceName = internalPath;
        return part;
    }
};


inline std::ostream&
operator<<( std::ostream&       out,
            const ArchiveEntry& entry )
{
    out << entry.internalPath << ( entry.isDirectory ? "/" : "" ) << " (" << entry.logicalSize << " B, "
        << entry.segments.size() << " segments)";
    return out;
}
}  // namespace nzbseek
