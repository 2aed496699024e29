#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "Segment.hpp"


namespace nzbseek
{
struct MappedRange
{
    std::vector<Segment> segments;
    /** Sum of the trimmed segment lengths. Less than requested if the segments do not cover the range. */
    uint64_t coveredBytes{ 0 };
};


/**
 * Returns the trimmed copies of @p segments that cover the part-relative byte range
 * [offset, offset + length). Segment i occupies the part bytes directly following segment i-1,
 * i.e., gaps in the segment list are not representable and only lead to a coverage shortfall at the end.
 * Trimmed segments keep their id and declared size. Their offsets stay relative to the article,
 * so already trimmed segments can be sliced again.
 */
[[nodiscard]] inline MappedRange
sliceSegments( const std::vector<Segment>& segments,
               uint64_t                    offset,
               uint64_t                    length )
{
    MappedRange result;
    if ( length == 0 ) {
        return result;
    }

    const auto targetEnd = offset + length;  // exclusive
    uint64_t partPosition{ 0 };
    for ( const auto& segment : segments ) {
        const auto segmentLength = segment.length();
        if ( segmentLength == 0 ) {
            continue;
        }

        const auto segmentBegin = partPosition;
        const auto segmentEnd = partPosition + segmentLength;
        partPosition = segmentEnd;

        if ( segmentEnd <= offset ) {
            continue;
        }
        if ( segmentBegin >= targetEnd ) {
            break;
        }

        const auto overlapBegin = std::max( segmentBegin, offset );
        const auto overlapEnd = std::min( segmentEnd, targetEnd );

        auto trimmed = segment;
        trimmed.startOffset = segment.startOffset + ( overlapBegin - segmentBegin );
        trimmed.endOffset = segment.startOffset + ( overlapEnd - segmentBegin ) - 1;
        result.coveredBytes += trimmed.length();
        result.segments.emplace_back( std::move( trimmed ) );

        if ( overlapEnd == targetEnd ) {
            break;
        }
    }

    return result;
}


/**
 * A part's position inside the logical concatenation of all parts. @ref absoluteEnd is exclusive.
 */
struct PartWindow
{
    const Part* part{ nullptr };
    uint64_t absoluteStart{ 0 };
    uint64_t absoluteEnd{ 0 };
};


/**
 * @note The returned windows point into @p parts, which therefore must outlive them.
 */
[[nodiscard]] inline std::vector<PartWindow>
computePartWindows( const PartSet& parts )
{
    std::vector<PartWindow> windows;
    windows.reserve( parts.size() );

    uint64_t offset{ 0 };
    for ( const auto& part : parts ) {
        windows.push_back( PartWindow{ &part, offset, offset + part.size } );
        offset += part.size;
    }
    return windows;
}


/**
 * Translates the logical archive range [entryOffset, entryOffset + entryLength) into the ordered list
 * of trimmed segments, possibly spanning several parts. Callers must compare @ref MappedRange::coveredBytes
 * against @p entryLength because a shortfall means the data can not be served completely.
 */
[[nodiscard]] inline MappedRange
mapRange( uint64_t                       entryOffset,
          uint64_t                       entryLength,
          const std::vector<PartWindow>& partWindows )
{
    MappedRange result;
    if ( entryLength == 0 ) {
        return result;
    }
    if ( entryOffset > std::numeric_limits<uint64_t>::max() - entryLength ) {
        throw std::invalid_argument( "Entry range exceeds the addressable range!" );
    }

    const auto targetEnd = entryOffset + entryLength;
    for ( const auto& window : partWindows ) {
        if ( ( window.part == nullptr ) || ( window.absoluteEnd <= entryOffset ) ) {
            continue;
        }
        if ( window.absoluteStart >= targetEnd ) {
            break;
        }

        const auto overlapBegin = std::max( window.absoluteStart, entryOffset );
        const auto overlapEnd = std::min( window.absoluteEnd, targetEnd );

        auto sliced = sliceSegments( window.part->segments, overlapBegin - window.absoluteStart,
                                     overlapEnd - overlapBegin );
        result.coveredBytes += sliced.coveredBytes;
        result.segments.insert( result.segments.end(),
                                std::make_move_iterator( sliced.segments.begin() ),
                                std::make_move_iterator( sliced.segments.end() ) );
    }

    return result;
}
}  // namespace nzbseek
