#pragma once

#include <cstdint>
#include <numeric>
#include <ostream>
#include <string>
#include <vector>


namespace nzbseek
{
/**
 * One article contributing a contiguous byte range to a part.
 * The offsets are relative to the decoded article payload and inclusive, i.e., a segment
 * carrying a whole article of 100 bytes has startOffset 0 and endOffset 99.
 * Trimming a segment changes the offsets but keeps the id and the declared article size.
 */
struct Segment
{
    std::string id;
    uint64_t startOffset{ 0 };
    uint64_t endOffset{ 0 };
    uint64_t declaredSize{ 0 };

    [[nodiscard]] static Segment
    whole( std::string messageId,
           uint64_t    size )
    {
        /* An empty article is encoded as the inverted range [1, 0]. */
        return size > 0 ? Segment{ std::move( messageId ), 0, size - 1, size }
                        : Segment{ std::move( messageId ), 1, 0, 0 };
    }

    /**
     * @return Number of bytes this segment contributes. Zero for inverted or empty ranges.
     */
    [[nodiscard]] uint64_t
    length() const noexcept
    {
        return endOffset < startOffset ? 0 : endOffset - startOffset + 1;
    }

    [[nodiscard]] bool
    operator==( const Segment& other ) const noexcept
    {
        return ( id == other.id ) && ( startOffset == other.startOffset ) && ( endOffset == other.endOffset )
               && ( declaredSize == other.declaredSize );
    }

    [[nodiscard]] bool
    operator!=( const Segment& other ) const noexcept
    {
        return !( *this == other );
    }
};


inline std::ostream&
operator<<( std::ostream&  out,
            const Segment& segment )
{
    out << segment.id << "[" << segment.startOffset << "-" << segment.endOffset << "/" << segment.declaredSize << "]";
    return out;
}


[[nodiscard]] inline uint64_t
totalLength( const std::vector<Segment>& segments )
{
    return std::accumulate( segments.begin(), segments.end(), uint64_t( 0 ),
                            [] ( uint64_t sum, const Segment& segment ) { return sum + segment.length(); } );
}


/**
 * One file of an NZB posting, e.g., a single volume of a multi-part archive.
 * The segments are ordered and concatenating their trimmed payloads yields exactly @ref size bytes.
 */
struct Part
{
    std::string name;
    uint64_t size{ 0 };
    std::vector<Segment> segments;
    /** The name as it appeared in the manifest before canonicalization. */
    std::string sourceName;
    std::vector<std::string> groups;
    std::string poster;

    [[nodiscard]] static Part
    fromSegments( std::string          name,
                  std::vector<Segment> segments )
    {
        Part part;
        part.size = totalLength( segments );
        part.sourceName = name;
        part.name = std::move( name );
        part.segments = std::move( segments );
        return part;
    }
};


/**
 * Ordered list of parts forming one logical archive. Concatenating the parts in order
 * reproduces the archive byte stream.
 */
using PartSet = std::vector<Part>;


[[nodiscard]] inline uint64_t
totalSize( const PartSet& parts )
{
    return std::accumulate( parts.begin(), parts.end(), uint64_t( 0 ),
                            [] ( uint64_t sum, const Part& part ) { return sum + part.size; } );
}
}  // namespace nzbseek
