#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <limits>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <core/common.hpp>
#include <core/Error.hpp>

#include "Segment.hpp"


namespace nzbseek
{
enum class ArchiveFormat
{
    RAR,
    SEVEN_ZIP,
};


[[nodiscard]] inline std::string
toString( ArchiveFormat format )
{
    switch ( format )
    {
    case ArchiveFormat::RAR:
        return "RAR";
    case ArchiveFormat::SEVEN_ZIP:
        return "7z";
    }
    return "Unknown";
}


inline std::ostream&
operator<<( std::ostream& out,
            ArchiveFormat format )
{
    out << toString( format );
    return out;
}


/** Volume index assigned to names that follow none of the known schemes. Such parts sort last. */
constexpr size_t UNKNOWN_VOLUME = std::numeric_limits<size_t>::max();


/**
 * @return The part after the last '/' or '\\'.
 */
[[nodiscard]] inline std::string_view
baseName( std::string_view path )
{
    const auto separator = path.find_last_of( "/\\" );
    return separator == std::string_view::npos ? path : path.substr( separator + 1 );
}


/**
 * @return The lower-cased extension of the base name including the dot, or an empty string.
 */
[[nodiscard]] inline std::string
extension( std::string_view path )
{
    const auto name = baseName( path );
    const auto dot = name.rfind( '.' );
    return dot == std::string_view::npos ? std::string() : toLower( name.substr( dot ) );
}


namespace detail
{
[[nodiscard]] inline bool
isDigits( std::string_view text )
{
    return !text.empty() && std::all_of( text.begin(), text.end(),
                                         [] ( unsigned char c ) { return std::isdigit( c ) != 0; } );
}


[[nodiscard]] inline size_t
parseDigits( std::string_view digits )
{
    size_t result{ 0 };
    for ( const auto c : digits ) {
        const auto digit = static_cast<size_t>( c - '0' );
        if ( result > ( std::numeric_limits<size_t>::max() - digit ) / 10U ) {
            return std::numeric_limits<size_t>::max();
        }
        result = result * 10U + digit;
    }
    return result;
}


[[nodiscard]] inline std::string_view
stripLeadingZeros( std::string_view digits )
{
    const auto firstNonZero = digits.find_first_not_of( '0' );
    return firstNonZero == std::string_view::npos ? std::string_view( "0" ) : digits.substr( firstNonZero );
}
}  // namespace detail


/**
 * The naming schemes used for RAR volumes, in the order of preference for choosing the first volume.
 */
enum class RarNamingScheme
{
    /** X.rar, the first volume of the old scheme or a single-volume archive. */
    PLAIN    = 1,
    /** X.partN.rar with any zero padding. */
    PART     = 2,
    /** X.r00, X.r01, ... following X.rar. */
    OLD      = 3,
    /** X.001, X.002, ... as produced by generic file splitters. */
    NUMERIC  = 4,
    UNKNOWN  = 5,
};


struct RarVolumeName
{
    std::string base;
    RarNamingScheme scheme{ RarNamingScheme::UNKNOWN };
    /** The volume number exactly as written in the name. Empty for the plain scheme. */
    std::string digits;

    /**
     * @return 0-based position of the volume inside the archive: X.rar and X.part1.rar are 0,
     *         X.r00 follows X.rar as 1, X.001 is 0.
     */
    [[nodiscard]] size_t
    volumeIndex() const
    {
        const auto number = detail::parseDigits( digits );
        switch ( scheme )
        {
        case RarNamingScheme::PLAIN:
            return 0;
        case RarNamingScheme::PART:
        case RarNamingScheme::NUMERIC:
            return number > 0 ? number - 1 : 0;
        case RarNamingScheme::OLD:
            return number == std::numeric_limits<size_t>::max() ? number : number + 1;
        case RarNamingScheme::UNKNOWN:
            break;
        }
        return UNKNOWN_VOLUME;
    }

    /**
     * @return Whether a RAR reader may start at this volume. For the old scheme, X.r00 qualifies too
     *         because the accompanying X.rar is sometimes missing from a posting.
     */
    [[nodiscard]] bool
    mayBeFirstVolume() const
    {
        switch ( scheme )
        {
        case RarNamingScheme::PLAIN:
            return true;
        case RarNamingScheme::PART:
        case RarNamingScheme::NUMERIC:
            return volumeIndex() == 0;
        case RarNamingScheme::OLD:
            return detail::parseDigits( digits ) == 0;
        case RarNamingScheme::UNKNOWN:
            break;
        }
        return false;
    }

    /**
     * The suffix RAR readers expect when looking for the next volume. Zero padding is removed
     * from the part scheme and kept for all others.
     */
    [[nodiscard]] std::string
    normalizedSuffix() const
    {
        switch ( scheme )
        {
        case RarNamingScheme::PLAIN:
            return ".rar";
        case RarNamingScheme::PART:
            return ".part" + std::string( detail::stripLeadingZeros( digits ) ) + ".rar";
        case RarNamingScheme::OLD:
            return ".r" + digits;
        case RarNamingScheme::NUMERIC:
            return "." + digits;
        case RarNamingScheme::UNKNOWN:
            break;
        }
        return {};
    }
};


[[nodiscard]] inline RarVolumeName
parseRarVolumeName( std::string_view fileName )
{
    const auto name = baseName( fileName );
    const auto lower = toLower( name );
    const std::string_view lowerView{ lower };

    RarVolumeName result;

    /* X.partN.rar */
    if ( endsWith( lowerView, std::string_view( ".rar" ) ) ) {
        const auto stem = lowerView.substr( 0, lowerView.size() - 4 );
        const auto partPosition = stem.rfind( ".part" );
        if ( ( partPosition != std::string_view::npos ) && detail::isDigits( stem.substr( partPosition + 5 ) ) ) {
            result.base = std::string( name.substr( 0, partPosition ) );
            result.scheme = RarNamingScheme::PART;
            result.digits = std::string( stem.substr( partPosition + 5 ) );
            return result;
        }

        result.base = std::string( name.substr( 0, name.size() - 4 ) );
        result.scheme = RarNamingScheme::PLAIN;
        return result;
    }

    const auto dot = lowerView.rfind( '.' );
    if ( ( dot == std::string_view::npos ) || ( dot == 0 ) ) {
        result.base = std::string( name );
        return result;
    }
    const auto suffix = lowerView.substr( dot + 1 );

    /* X.rNN */
    if ( ( suffix.size() >= 3 ) && ( suffix.front() == 'r' ) && detail::isDigits( suffix.substr( 1 ) ) ) {
        result.base = std::string( name.substr( 0, dot ) );
        result.scheme = RarNamingScheme::OLD;
        result.digits = std::string( suffix.substr( 1 ) );
        return result;
    }

    /* X.NNN */
    if ( ( suffix.size() >= 3 ) && detail::isDigits( suffix ) ) {
        result.base = std::string( name.substr( 0, dot ) );
        result.scheme = RarNamingScheme::NUMERIC;
        result.digits = std::string( suffix );
        return result;
    }

    result.base = std::string( name.substr( 0, dot ) );
    return result;
}


struct SevenZipVolumeName
{
    std::string base;
    bool isMultiVolume{ false };
    std::string digits;
    bool known{ false };

    /**
     * @return 0 for X.7z, N for X.7z.N, i.e., X.7z.001 is the first volume of a split archive.
     */
    [[nodiscard]] size_t
    volumeIndex() const
    {
        if ( !known ) {
            return UNKNOWN_VOLUME;
        }
        return isMultiVolume ? detail::parseDigits( digits ) : 0;
    }

    [[nodiscard]] std::string
    normalizedSuffix() const
    {
        if ( !known ) {
            return {};
        }
        return isMultiVolume ? ".7z." + digits : ".7z";
    }
};


[[nodiscard]] inline SevenZipVolumeName
parseSevenZipVolumeName( std::string_view fileName )
{
    const auto name = baseName( fileName );
    const auto lower = toLower( name );
    const std::string_view lowerView{ lower };

    SevenZipVolumeName result;

    if ( endsWith( lowerView, std::string_view( ".7z" ) ) ) {
        result.base = std::string( name.substr( 0, name.size() - 3 ) );
        result.known = true;
        return result;
    }

    const auto dot = lowerView.rfind( '.' );
    if ( ( dot != std::string_view::npos ) && detail::isDigits( lowerView.substr( dot + 1 ) )
         && endsWith( lowerView.substr( 0, dot ), std::string_view( ".7z" ) ) )
    {
        result.base = std::string( name.substr( 0, dot - 3 ) );
        result.isMultiVolume = true;
        result.digits = std::string( lowerView.substr( dot + 1 ) );
        result.known = true;
        return result;
    }

    result.base = dot == std::string_view::npos ? std::string( name ) : std::string( name.substr( 0, dot ) );
    return result;
}


/* Classification */

[[nodiscard]] inline bool
isPar2File( std::string_view name )
{
    return endsWith( toLower( name ), std::string_view( ".par2" ) );
}


/**
 * @return True for X.rar and X.rNN. Plain numeric extensions are only treated as RAR volumes
 *         when they accompany one of these.
 */
[[nodiscard]] inline bool
isRarFile( std::string_view name )
{
    const auto scheme = parseRarVolumeName( name ).scheme;
    return ( scheme == RarNamingScheme::PLAIN ) || ( scheme == RarNamingScheme::PART )
           || ( scheme == RarNamingScheme::OLD );
}


[[nodiscard]] inline bool
isSevenZipFile( std::string_view name )
{
    return parseSevenZipVolumeName( name ).known;
}


[[nodiscard]] inline bool
isVideoFile( std::string_view name )
{
    static constexpr std::array<std::string_view, 14> VIDEO_EXTENSIONS = {
        ".mkv", ".mp4", ".avi", ".mov", ".wmv", ".flv", ".webm",
        ".m4v", ".mpg", ".mpeg", ".m2ts", ".ts", ".vob", ".ogv",
    };
    const auto suffix = extension( name );
    return std::find( VIDEO_EXTENSIONS.begin(), VIDEO_EXTENSIONS.end(), suffix ) != VIDEO_EXTENSIONS.end();
}


/**
 * @return True for video, audio and subtitle files, i.e., everything a player might request.
 */
[[nodiscard]] inline bool
isMediaFile( std::string_view name )
{
    static constexpr std::array<std::string_view, 24> MEDIA_EXTENSIONS = {
        ".mkv", ".mp4", ".avi", ".mov", ".wmv", ".flv", ".webm", ".m4v", ".mpg", ".mpeg", ".ts", ".m2ts",
        ".mp3", ".flac", ".aac", ".ogg", ".wav", ".wma", ".m4a",
        ".srt", ".ass", ".ssa", ".sub", ".idx",
    };
    const auto suffix = extension( name );
    return ( std::find( MEDIA_EXTENSIONS.begin(), MEDIA_EXTENSIONS.end(), suffix ) != MEDIA_EXTENSIONS.end() )
           || isVideoFile( name );
}


struct PartClassification
{
    PartSet rar;
    PartSet sevenZip;
    PartSet par2;
    PartSet other;
};


/**
 * Splits the files of a posting into archive volumes, repair files and everything else.
 * Numeric volumes (X.001) count as RAR volumes only if a RAR volume with the same base name exists.
 */
[[nodiscard]] inline PartClassification
classifyParts( const PartSet& parts )
{
    std::vector<std::string> rarBases;
    for ( const auto& part : parts ) {
        if ( isRarFile( part.name ) ) {
            rarBases.emplace_back( toLower( parseRarVolumeName( part.name ).base ) );
        }
    }

    PartClassification result;
    for ( const auto& part : parts ) {
        if ( isPar2File( part.name ) ) {
            result.par2.push_back( part );
        } else if ( isSevenZipFile( part.name ) ) {
            result.sevenZip.push_back( part );
        } else if ( isRarFile( part.name ) ) {
            result.rar.push_back( part );
        } else if ( const auto volume = parseRarVolumeName( part.name );
                    ( volume.scheme == RarNamingScheme::NUMERIC )
                    && ( std::find( rarBases.begin(), rarBases.end(), toLower( volume.base ) ) != rarBases.end() ) )
        {
            result.rar.push_back( part );
        } else {
            result.other.push_back( part );
        }
    }
    return result;
}


/* Canonicalization */

[[nodiscard]] inline size_t
volumeIndex( std::string_view name,
             ArchiveFormat    format )
{
    return format == ArchiveFormat::RAR ? parseRarVolumeName( name ).volumeIndex()
                                        : parseSevenZipVolumeName( name ).volumeIndex();
}


/**
 * Renames all parts to one common base name followed by the normalized volume suffix and sorts them
 * by volume index. Postings often use differing base names for the volumes of one archive, which
 * confuses archive readers looking for the next volume by name. The common base is taken from the
 * volume with the lowest index. Parts with unknown naming keep their extension and are moved to the end.
 * The original name is kept in @ref Part::sourceName.
 */
[[nodiscard]] inline PartSet
canonicalizeParts( PartSet       parts,
                   ArchiveFormat format )
{
    if ( parts.empty() ) {
        return parts;
    }

    std::vector<std::pair<size_t, Part> > indexed;
    indexed.reserve( parts.size() );
    for ( auto& part : parts ) {
        if ( part.sourceName.empty() ) {
            part.sourceName = part.name;
        }
        const auto index = volumeIndex( part.name, format );
        indexed.emplace_back( index, std::move( part ) );
    }

    std::stable_sort( indexed.begin(), indexed.end(),
                      [] ( const auto& a, const auto& b ) { return a.first < b.first; } );

    const auto& firstName = indexed.front().second.name;
    const auto commonBase = format == ArchiveFormat::RAR ? parseRarVolumeName( firstName ).base
                                                         : parseSevenZipVolumeName( firstName ).base;

    PartSet result;
    result.reserve( indexed.size() );
    for ( auto& [index, part] : indexed ) {
        auto suffix = format == ArchiveFormat::RAR ? parseRarVolumeName( part.name ).normalizedSuffix()
                                                   : parseSevenZipVolumeName( part.name ).normalizedSuffix();
        if ( suffix.empty() ) {
            suffix = extension( part.name );
        }
        part.name = commonBase + suffix;
        result.emplace_back( std::move( part ) );
    }
    return result;
}


/**
 * Chooses the volume an archive reader has to be started with. Only volumes that may be the first
 * one are considered. Among those, the naming scheme decides (X.rar before X.part1.rar before X.r00
 * before X.001) and ties are broken by the lexicographically smaller name.
 * @throws NotFoundError if @p names is empty or contains no candidate.
 */
[[nodiscard]] inline std::string
selectFirstPart( const std::vector<std::string>& names,
                 ArchiveFormat                   format )
{
    if ( names.empty() ) {
        throw NotFoundError( "no " + toString( format ) + " volumes given" );
    }
    if ( names.size() == 1 ) {
        return names.front();
    }

    std::optional<std::pair<int, std::string> > best;
    const auto consider = [&best] ( int priority, const std::string& name ) {
        if ( !best || ( priority < best->first ) || ( ( priority == best->first ) && ( name < best->second ) ) ) {
            best = std::make_pair( priority, name );
        }
    };

    for ( const auto& name : names ) {
        if ( format == ArchiveFormat::RAR ) {
            const auto volume = parseRarVolumeName( name );
            if ( volume.mayBeFirstVolume() ) {
                consider( static_cast<int>( volume.scheme ), name );
            }
        } else {
            const auto volume = parseSevenZipVolumeName( name );
            if ( volume.known && ( volume.volumeIndex() == 0 ) ) {
                consider( volume.isMultiVolume ? 2 : 1, name );
            }
        }
    }

    /* Split 7z archives are numbered starting at 1. */
    if ( !best && ( format == ArchiveFormat::SEVEN_ZIP ) ) {
        for ( const auto& name : names ) {
            const auto volume = parseSevenZipVolumeName( name );
            if ( volume.isMultiVolume && ( volume.volumeIndex() == 1 ) ) {
                consider( 3, name );
            }
        }
    }

    if ( !best ) {
        throw NotFoundError( "no valid first " + toString( format ) + " volume among " + std::to_string( names.size() )
                             + " parts" );
    }
    return best->second;
}


[[nodiscard]] inline std::string
selectFirstPart( const PartSet& parts,
                 ArchiveFormat  format )
{
    std::vector<std::string> names;
    names.reserve( parts.size() );
    for ( const auto& part : parts ) {
        names.push_back( part.name );
    }
    return selectFirstPart( names, format );
}
}  // namespace nzbseek
