#pragma once

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <zlib.h>

#include <core/Error.hpp>

#include "Segment.hpp"


namespace nzbseek
{
/**
 * Contents of an NZB manifest: one Part per posted file with its article segments.
 */
struct NzbManifest
{
    /** The <meta type="..."> entries of the <head> element, e.g., title or password. */
    std::map<std::string, std::string> meta;
    PartSet files;
};


namespace detail
{
using XmlDocument = std::unique_ptr<xmlDoc, decltype( &xmlFreeDoc )>;


[[nodiscard]] inline bool
hasName( const xmlNode* node,
         std::string_view name )
{
    return ( node != nullptr ) && ( node->type == XML_ELEMENT_NODE ) && ( node->name != nullptr )
           && ( std::string_view( reinterpret_cast<const char*>( node->name ) ) == name );
}


[[nodiscard]] inline std::string
attribute( const xmlNode* node,
           const char*    name )
{
    auto* const value = xmlGetProp( node, reinterpret_cast<const xmlChar*>( name ) );
    if ( value == nullptr ) {
        return {};
    }
    std::string result( reinterpret_cast<const char*>( value ) );
    xmlFree( value );
    return result;
}


[[nodiscard]] inline std::string
textContent( const xmlNode* node )
{
    auto* const value = xmlNodeGetContent( node );
    if ( value == nullptr ) {
        return {};
    }
    std::string result( reinterpret_cast<const char*>( value ) );
    xmlFree( value );

    constexpr std::string_view WHITESPACES{ " \t\r\n" };
    const auto first = result.find_first_not_of( WHITESPACES );
    if ( first == std::string::npos ) {
        return {};
    }
    const auto last = result.find_last_not_of( WHITESPACES );
    return result.substr( first, last - first + 1 );
}


template<typename Functor>
void
forEachChild( const xmlNode*   parent,
              std::string_view name,
              Functor          functor )
{
    for ( const auto* child = parent->children; child != nullptr; child = child->next ) {
        if ( hasName( child, name ) ) {
            functor( child );
        }
    }
}


[[nodiscard]] inline uint64_t
parseUnsigned( const std::string& text,
               const char*        what )
{
    uint64_t value{ 0 };
    const auto result = std::from_chars( text.data(), text.data() + text.size(), value );
    if ( ( result.ec != std::errc() ) || ( result.ptr != text.data() + text.size() ) ) {
        throw std::invalid_argument( std::string( "Invalid " ) + what + " in NZB: \"" + text + "\"" );
    }
    return value;
}
}  // namespace detail


/**
 * Posters put the file name in double quotes somewhere in the subject, e.g.,
 * <tt>[1/20] - "Movie.part01.rar" yEnc (1/137)</tt>.
 * @return The first quoted token or the trimmed subject if there is none.
 */
[[nodiscard]] inline std::string
fileNameFromSubject( std::string_view subject )
{
    const auto opening = subject.find( '"' );
    if ( opening != std::string_view::npos ) {
        const auto closing = subject.find( '"', opening + 1 );
        if ( ( closing != std::string_view::npos ) && ( closing > opening + 1 ) ) {
            return std::string( subject.substr( opening + 1, closing - opening - 1 ) );
        }
    }

    constexpr std::string_view WHITESPACES{ " \t\r\n" };
    const auto first = subject.find_first_not_of( WHITESPACES );
    if ( first == std::string_view::npos ) {
        return {};
    }
    const auto last = subject.find_last_not_of( WHITESPACES );
    return std::string( subject.substr( first, last - first + 1 ) );
}


/**
 * @throws std::invalid_argument for malformed XML, missing attributes, or manifests without files.
 */
[[nodiscard]] inline NzbManifest
parseNzb( std::string_view xml )
{
    static const bool parserInitialized = [] () { xmlInitParser(); return true; } ();
    static_cast<void>( parserInitialized );

    const detail::XmlDocument document(
        xmlReadMemory( xml.data(), static_cast<int>( xml.size() ), "manifest.nzb", nullptr,
                       XML_PARSE_NONET | XML_PARSE_NOBLANKS | XML_PARSE_NOERROR | XML_PARSE_NOWARNING ),
        &xmlFreeDoc );
    if ( !document ) {
        throw std::invalid_argument( "Failed to parse NZB manifest as XML!" );
    }

    const auto* const root = xmlDocGetRootElement( document.get() );
    if ( !detail::hasName( root, "nzb" ) ) {
        throw std::invalid_argument( "NZB manifest has no <nzb> root element!" );
    }

    NzbManifest manifest;

    detail::forEachChild( root, "head", [&manifest] ( const xmlNode* head ) {
        detail::forEachChild( head, "meta", [&manifest] ( const xmlNode* meta ) {
            manifest.meta.emplace( detail::attribute( meta, "type" ), detail::textContent( meta ) );
        } );
    } );

    detail::forEachChild( root, "file", [&manifest] ( const xmlNode* file ) {
        const auto subject = detail::attribute( file, "subject" );

        Part part;
        part.name = fileNameFromSubject( subject );
        part.sourceName = part.name;
        part.poster = detail::attribute( file, "poster" );

        detail::forEachChild( file, "groups", [&part] ( const xmlNode* groups ) {
            detail::forEachChild( groups, "group", [&part] ( const xmlNode* group ) {
                part.groups.emplace_back( detail::textContent( group ) );
            } );
        } );

        std::map<uint64_t, Segment> segments;
        detail::forEachChild( file, "segments", [&segments] ( const xmlNode* segmentList ) {
            detail::forEachChild( segmentList, "segment", [&segments] ( const xmlNode* segment ) {
                const auto number = detail::parseUnsigned( detail::attribute( segment, "number" ), "segment number" );
                const auto bytes = detail::parseUnsigned( detail::attribute( segment, "bytes" ), "segment size" );
                /* Reposted segments repeat the number. The first occurrence wins. */
                segments.try_emplace( number, Segment::whole( detail::textContent( segment ), bytes ) );
            } );
        } );

        for ( auto& [number, segment] : segments ) {
            part.segments.emplace_back( std::move( segment ) );
        }
        part.size = totalLength( part.segments );

        if ( part.name.empty() ) {
            throw std::invalid_argument( "NZB file entry without a subject!" );
        }
        manifest.files.emplace_back( std::move( part ) );
    } );

    if ( manifest.files.empty() ) {
        throw std::invalid_argument( "NZB manifest does not contain any files!" );
    }

    return manifest;
}


/**
 * Reads a plain or gzip-compressed NZB file. Compression is detected by zlib.
 * @throws NotFoundError if the file can not be opened.
 */
[[nodiscard]] inline NzbManifest
readNzbFile( const std::string& path )
{
    const std::unique_ptr<gzFile_s, decltype( &gzclose )> file( gzopen( path.c_str(), "rb" ), &gzclose );
    if ( !file ) {
        throw NotFoundError( path );
    }

    std::string contents;
    std::array<char, 64 * 1024> buffer{};
    while ( true ) {
        const auto nBytesRead = gzread( file.get(), buffer.data(), static_cast<unsigned int>( buffer.size() ) );
        if ( nBytesRead < 0 ) {
            int errorCode{ Z_OK };
            const auto* const message = gzerror( file.get(), &errorCode );
            throw std::runtime_error( "Failed to read " + path + ": " + ( message == nullptr ? "" : message ) );
        }
        if ( nBytesRead == 0 ) {
            break;
        }
        contents.append( buffer.data(), static_cast<size_t>( nBytesRead ) );
    }

    return parseNzb( contents );
}
}  // namespace nzbseek
