#pragma once

#include <charconv>
#include <cstddef>
#include <iterator>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common.hpp"


namespace nzbseek
{
/**
 * A byte range inside a logical stream, e.g., an archive member, written as "size@offset".
 */
struct FileRange
{
    uint64_t offset{ 0 };
    uint64_t size{ 0 };

    [[nodiscard]] bool
    operator==( const FileRange& other ) const noexcept
    {
        return ( offset == other.offset ) && ( size == other.size );
    }

    [[nodiscard]] bool
    operator!=( const FileRange& other ) const noexcept
    {
        return !( *this == other );
    }
};


inline std::ostream&
operator<<( std::ostream&    out,
            const FileRange& range )
{
    out << range.size << "@" << range.offset;
    return out;
}


[[nodiscard]] inline const char*
skipWhitespaces( const char* const first,
                 const char* const last )
{
    constexpr std::string_view WHITESPACES{ " \t" };
    const std::string_view view{ first, static_cast<size_t>( std::distance( first, last ) ) };
    const auto skippedCount = view.find_first_not_of( WHITESPACES );
    if ( skippedCount < view.size() ) {
        return first + skippedCount;
    }
    return last;
}


/**
 * Parses a number with an optional binary or decimal unit prefix and an optional "B" suffix, e.g., "4 MiB" or "3k".
 */
[[nodiscard]] inline const char*
readNumber( const char* const first,
            const char* const last,
            uint64_t&         value )
{
    const auto result = std::from_chars( first, last, value );
    if ( ( result.ec != std::errc() ) || ( result.ptr == first ) ) {
        throw std::invalid_argument( "Failed to parse number at the start of the remaining expression: "
                                     + std::string( first, last ) );
    }

    static const std::vector<std::pair<std::string_view, uint64_t> > PREFIXES{
        { "Ki", 1ULL << 10U },
        { "Mi", 1ULL << 20U },
        { "Gi", 1ULL << 30U },
        { "Ti", 1ULL << 40U },
        { "k", 1000ULL },
        { "M", 1000'000ULL },
        { "G", 1000'000'000ULL },
        { "T", 1000'000'000'000ULL },
        { "", 1ULL },
    };

    const auto* current = skipWhitespaces( result.ptr, last );
    const std::string_view unitString{ current, static_cast<size_t>( std::distance( current, last ) ) };

    size_t longestMatch{ 0 };
    uint64_t longestMatchFactor{ 1 };
    for ( const auto suffix : { std::string_view( "B" ), std::string_view( "" ) } ) {
        for ( const auto& [prefix, factor] : PREFIXES ) {
            if ( ( prefix.size() + suffix.size() > longestMatch )
                 && startsWith( unitString, prefix )
                 && startsWith( unitString.substr( prefix.size() ), suffix ) )
            {
                longestMatch = prefix.size() + suffix.size();
                longestMatchFactor = factor;
            }
        }
    }

    if ( longestMatch == 0 ) {
        return result.ptr;
    }
    value *= longestMatchFactor;
    return current + longestMatch;
}


/**
 * Parses a comma-separated list of "size@offset" tuples. Whitespace between tokens is ignored.
 * @throws std::invalid_argument for malformed expressions.
 */
[[nodiscard]] inline std::vector<FileRange>
parseFileRanges( const std::string_view expression )
{
    constexpr char OFFSET_PREFIX{ '@' };
    constexpr char SEPARATOR{ ',' };

    /**
     * @verbatim
     *           23           @                      10            ,
     * TUPLE_END -> SIZE_END -> OFFSET_SEPARATOR_END -> OFFSET_END -> TUPLE_END
     * @endverbatim
     */
    enum class State
    {
        TUPLE_END,
        SIZE_END,
        OFFSET_SEPARATOR_END,
        OFFSET_END,
    };

    std::vector<FileRange> ranges;

    const auto* const expressionEnd = expression.data() + expression.size();
    auto state = State::TUPLE_END;
    FileRange range;

    const auto* current = skipWhitespaces( expression.data(), expressionEnd );
    for ( ; current != expressionEnd; current = skipWhitespaces( current, expressionEnd ) ) {
        switch ( state )
        {
        case State::TUPLE_END:
            if ( *current == SEPARATOR ) {
                ++current;
                continue;
            }
            range.size = 0;
            current = readNumber( current, expressionEnd, range.size );
            state = State::SIZE_END;
            break;

        case State::SIZE_END:
            if ( *current != OFFSET_PREFIX ) {
                std::stringstream message;
                message << "Expected " << OFFSET_PREFIX << " after a size at position "
                        << std::distance( expression.data(), current ) << " in expression: " << expression;
                throw std::invalid_argument( std::move( message ).str() );
            }
            state = State::OFFSET_SEPARATOR_END;
            ++current;
            break;

        case State::OFFSET_SEPARATOR_END:
            range.offset = 0;
            current = readNumber( current, expressionEnd, range.offset );
            ranges.emplace_back( range );
            state = State::OFFSET_END;
            break;

        case State::OFFSET_END:
            if ( *current != SEPARATOR ) {
                std::stringstream message;
                message << "Expected " << SEPARATOR << " after a size@offset tuple at position "
                        << std::distance( expression.data(), current ) << " in expression: " << expression;
                throw std::invalid_argument( std::move( message ).str() );
            }
            ++current;
            state = State::TUPLE_END;
            break;
        }
    }

    if ( ( state != State::TUPLE_END ) && ( state != State::OFFSET_END ) ) {
        throw std::invalid_argument( "Incomplete size@offset tuple at end of expression: "
                                     + std::string( expression ) );
    }

    return ranges;
}
}  // namespace nzbseek
