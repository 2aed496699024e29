#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>
#include <vector>

#include <cxxopts.hpp>

#include <core/common.hpp>
#include <core/Error.hpp>
#include <core/FileRanges.hpp>
#include <nzbseek/nzbseek.hpp>

#include "CLIHelper.hpp"
#include "thirdparty.hpp"


using namespace nzbseek;


struct Arguments
{
    std::string inputFilePath;
    std::optional<ArchiveFormat> format;
    bool verbose{ false };
    bool quiet{ false };
};


void
printNzbseekHelp( const cxxopts::Options& options )
{
    std::cout
    << options.help()
    << "\n"
    << "Inspects the archive volumes posted via an NZB manifest without downloading them.\n"
    << "Gzip-compressed manifests are decompressed transparently.\n"
    << "\n"
    << "Examples:\n"
    << "\n"
    << "List all files of a posting grouped by type:\n"
    << "  nzbseek --list posting.nzb\n"
    << "\n"
    << "Show the volume order an archive reader would see:\n"
    << "  nzbseek --order posting.nzb.gz\n"
    << "\n"
    << "Show the articles needed to read 1 MiB starting at byte offset 4 GiB of the archive:\n"
    << "  nzbseek --map 1Mi@4Gi posting.nzb\n"
    << std::endl;
}


void
printParts( const std::string_view title,
            const PartSet&         parts )
{
    if ( parts.empty() ) {
        return;
    }

    std::cout << title << " (" << parts.size() << " files, " << formatBytes( totalSize( parts ) ) << "):\n";
    for ( const auto& part : parts ) {
        std::cout << "    " << std::setw( 12 ) << part.size << " B  " << std::setw( 5 ) << part.segments.size()
                  << " segments  " << part.name;
        if ( !part.sourceName.empty() && ( part.sourceName != part.name ) ) {
            std::cout << "  (posted as " << part.sourceName << ")";
        }
        std::cout << "\n";
    }
}


/**
 * @return The archive volumes of the requested or detected format in canonical order.
 */
[[nodiscard]] std::pair<ArchiveFormat, PartSet>
archiveParts( const PartClassification& classified,
              const Arguments&          args )
{
    auto format = args.format;
    if ( !format ) {
        if ( !classified.rar.empty() ) {
            format = ArchiveFormat::RAR;
            if ( !classified.sevenZip.empty() && !args.quiet ) {
                std::cerr << ( ThreadSafeOutput() << "[Warning] The posting contains RAR and 7z volumes."
                               << "Will use the RAR volumes. Specify --format to change this." );
            }
        } else if ( !classified.sevenZip.empty() ) {
            format = ArchiveFormat::SEVEN_ZIP;
        } else {
            throw UnsupportedArchiveError( "The posting contains neither RAR nor 7z volumes!" );
        }
    }

    const auto& parts = *format == ArchiveFormat::RAR ? classified.rar : classified.sevenZip;
    if ( parts.empty() ) {
        throw NotFoundError( "any " + toString( *format ) + " volume in " + args.inputFilePath );
    }
    return { *format, canonicalizeParts( parts, *format ) };
}


void
printMappedRanges( const PartSet&                parts,
                   const std::vector<FileRange>& ranges,
                   const Arguments&              args )
{
    const auto windows = computePartWindows( parts );
    const auto archiveSize = totalSize( parts );

    for ( const auto& range : ranges ) {
        const auto mapped = mapRange( range.offset, range.size, windows );

        std::cout << "Range " << range << " (" << formatBytes( range.size ) << " at offset "
                  << formatBytes( range.offset ) << ") needs " << mapped.segments.size() << " segments:\n";
        for ( const auto& segment : mapped.segments ) {
            std::cout << "    " << segment.id << " bytes " << segment.startOffset << "-" << segment.endOffset
                      << " of " << segment.declaredSize << "\n";
        }

        if ( ( mapped.coveredBytes < range.size ) && !args.quiet ) {
            std::cerr << ( ThreadSafeOutput() << "[Warning] The segments only cover" << mapped.coveredBytes
                           << "B of the requested" << range.size << "B. The archive has" << archiveSize << "B." );
        }
    }
}


int
nzbseekCLI( int                  argc,
            char const * const * argv )
{
    Arguments args;

    cxxopts::Options options( "nzbseek",
                              "Random-access inspection of RAR and 7z archives posted to Usenet" );
    options.add_options( "Actions" )
        ( "i,input" , "NZB manifest, optionally gzip-compressed.", cxxopts::value<std::string>() )
        ( "l,list"  , "List all files of the posting with their sizes and segment counts, "
                      "grouped by archive volumes, repair files, and other files." )
        ( "order"   , "Print the archive volumes in canonical order and the volume to start reading with." )
        ( "map"     , "Print the articles needed to read the given byte ranges of the logical archive. "
                      "Ranges are specified as SIZE@OFFSET and may be separated by commas. "
                      "Binary (Ki, Mi, Gi, Ti) and decimal (k, M, G, T) unit prefixes are supported.",
          cxxopts::value<std::string>() );

    options.add_options( "Archive Options" )
        ( "format", "Archive format of the volumes to consider. Possible values: auto, rar, 7z.",
          cxxopts::value<std::string>()->default_value( "auto" ) );

    options.add_options( "Output Options" )
        ( "h,help"   , "Print this help message." )
        ( "q,quiet"  , "Suppress noncritical error messages." )
        ( "v,verbose", "Print debug output and timings." )
        ( "V,version", "Display software version." )
        ( "oss-attributions", "Display open-source software licenses." )
        ( "oss-attributions-yaml", "Display open-source software licenses in YAML format." );

    options.parse_positional( { "input" } );

    const auto parsedArgs = options.parse( argc, argv );

    args.quiet = parsedArgs["quiet"].as<bool>();
    args.verbose = parsedArgs["verbose"].as<bool>();

    /* Check against simple commands like help and version. */

    if ( parsedArgs.count( "help" ) > 0 ) {
        printNzbseekHelp( options );
        return 0;
    }

    if ( parsedArgs.count( "version" ) > 0 ) {
        std::cout << "nzbseek, CLI to the on-demand Usenet archive reading library nzbseek version "
                  << VERSION_STRING << ".\n";
        return 0;
    }

    if ( parsedArgs.count( "oss-attributions" ) > 0 ) {
        std::cout << thirdparty::cxxopts::name << "\n" << thirdparty::cxxopts::license << "\n"
                  << thirdparty::libxml2::name << "\n" << thirdparty::libxml2::license << "\n"
                  << thirdparty::zlib::name << "\n" << thirdparty::zlib::license;
        return 0;
    }

    if ( parsedArgs.count( "oss-attributions-yaml" ) > 0 ) {
        std::cout << "- name: " << thirdparty::cxxopts::name << "\n"
                  << "  url: " << thirdparty::cxxopts::url << "\n"
                  << "  license: " << toYamlString( thirdparty::cxxopts::license ) << "\n"
                  << "- name: " << thirdparty::libxml2::name << "\n"
                  << "  url: " << thirdparty::libxml2::url << "\n"
                  << "  license: " << toYamlString( thirdparty::libxml2::license ) << "\n"
                  << "- name: " << thirdparty::zlib::name << "\n"
                  << "  url: " << thirdparty::zlib::url << "\n"
                  << "  license: " << toYamlString( thirdparty::zlib::license ) << "\n";
        return 0;
    }

    /* Parse input file specifications. */

    args.inputFilePath = getLastValue( parsedArgs, "input" );
    if ( args.inputFilePath.empty() ) {
        std::cerr << "An NZB file must be specified!\n\n";
        printNzbseekHelp( options );
        return 1;
    }

    args.format = parseArchiveFormat( parsedArgs["format"].as<std::string>() );

    const auto listFiles = parsedArgs.count( "list" ) > 0;
    const auto printOrder = parsedArgs.count( "order" ) > 0;
    const auto rangesToMap = parsedArgs.count( "map" ) > 0
                             ? parseFileRanges( getLastValue( parsedArgs, "map" ) )
                             : std::vector<FileRange>{};

    if ( !listFiles && !printOrder && ( parsedArgs.count( "map" ) == 0 ) ) {
        std::cerr << "No suitable arguments were given. Please refer to the help!\n\n";
        printNzbseekHelp( options );
        return 1;
    }

    /* Actually do things as requested. */

    const auto t0 = now();
    const auto manifest = readNzbFile( args.inputFilePath );
    const auto classified = classifyParts( manifest.files );
    if ( args.verbose ) {
        std::cerr << ( ThreadSafeOutput() << "[NZB] Parsed" << manifest.files.size() << "files in"
                       << duration( t0 ) << "s:" << classified.rar.size() << "RAR volumes,"
                       << classified.sevenZip.size() << "7z volumes," << classified.par2.size() << "PAR2 files" );
        for ( const auto& [key, value] : manifest.meta ) {
            std::cerr << ( ThreadSafeOutput() << "[NZB] Meta" << key << "=" << value );
        }
    }

    if ( listFiles ) {
        printParts( "RAR volumes", classified.rar );
        printParts( "7z volumes", classified.sevenZip );
        printParts( "PAR2 files", classified.par2 );
        printParts( "Other files", classified.other );
    }

    if ( printOrder || !rangesToMap.empty() ) {
        const auto [format, parts] = archiveParts( classified, args );

        if ( printOrder ) {
            printParts( toString( format ) + " archive in canonical order", parts );
            std::cout << "First volume: " << selectFirstPart( parts, format ) << "\n";
        }

        printMappedRanges( parts, rangesToMap, args );
    }

    return 0;
}


int
main( int argc, char** argv )
{
    try
    {
        return nzbseekCLI( argc, argv );
    }
    catch ( const std::exception& exception )
    {
        const std::string_view message{ exception.what() };
        if ( message.empty() ) {
            std::cerr << "Caught exception with typeid: " << typeid( exception ).name() << "\n";
        } else {
            std::cerr << "Caught exception: " << message << "\n";
        }
        return 1;
    }

    return 1;
}
