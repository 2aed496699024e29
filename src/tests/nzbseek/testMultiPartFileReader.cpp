#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <core/Error.hpp>
#include <core/TestHelpers.hpp>
#include <nzbseek/MultiPartFileReader.hpp>

#include "SyntheticPosting.hpp"


using namespace nzbseek;


[[nodiscard]] std::shared_ptr<const MemoryFileSystem>
createMemoryFileSystem( const std::vector<std::string>& contents )
{
    MemoryFileSystem::Files files;
    for ( size_t i = 0; i < contents.size(); ++i ) {
        files.emplace_back( "part" + std::to_string( i ),
                            std::make_shared<const std::vector<char> >( contents[i].begin(), contents[i].end() ) );
    }
    return std::make_shared<const MemoryFileSystem>( std::move( files ) );
}


[[nodiscard]] std::string
readAt( MultiPartFileReader& reader,
        size_t               size,
        uint64_t             offset )
{
    std::string result( size, '\0' );
    result.resize( reader.readAt( result.data(), result.size(), offset ) );
    return result;
}


void
testReadAcrossParts()
{
    const auto fileSystem = createMemoryFileSystem( { "0123", "", "4567", "89" } );
    MultiPartFileReader reader( fileSystem, { { "part0", 4 }, { "part1", 0 }, { "part2", 4 }, { "part3", 2 } } );

    REQUIRE_EQUAL( reader.size().value(), 10U );
    REQUIRE_EQUAL( readAt( reader, 10, 0 ), "0123456789" );
    REQUIRE_EQUAL( readAt( reader, 4, 2 ), "2345" );
    REQUIRE_EQUAL( readAt( reader, 100, 7 ), "789" );
    REQUIRE_EQUAL( readAt( reader, 1, 4 ), "4" );
    REQUIRE_EQUAL( readAt( reader, 5, 10 ), "" );
    REQUIRE_EQUAL( readAt( reader, 5, 1000 ), "" );

    /* Sequential interface */
    REQUIRE_EQUAL( reader.seek( 3 ), 3U );
    std::string buffer( 3, '\0' );
    REQUIRE_EQUAL( reader.read( buffer.data(), buffer.size() ), 3U );
    REQUIRE_EQUAL( buffer, "345" );
    REQUIRE_EQUAL( reader.tell(), 6U );
    REQUIRE_EQUAL( reader.seek( -2, SEEK_END ), 8U );
    REQUIRE_EQUAL( reader.read( buffer.data(), buffer.size() ), 2U );
    REQUIRE( reader.eof() );
    REQUIRE_THROWS_AS( reader.seek( 11 ), InvalidSeekError );

    const auto cloned = reader.clone();
    REQUIRE_EQUAL( cloned->tell(), 0U );

    reader.close();
    REQUIRE( reader.closed() );
    REQUIRE_THROWS_AS( readAt( reader, 1, 0 ), ClosedFileError );
    REQUIRE_THROWS_AS( reader.seek( 0 ), ClosedFileError );
}


void
testShortPart()
{
    /* The second part delivers less than its declared size. */
    const auto fileSystem = createMemoryFileSystem( { "abc", "de", "fgh" } );
    MultiPartFileReader reader( fileSystem, { { "part0", 3 }, { "part1", 4 }, { "part2", 3 } } );

    REQUIRE_EQUAL( readAt( reader, 10, 0 ), "abcde" );
    REQUIRE_EQUAL( readAt( reader, 3, 7 ), "fgh" );
}


void
testMissingPart()
{
    const auto fileSystem = createMemoryFileSystem( { "abc" } );
    MultiPartFileReader reader( fileSystem, { { "part0", 3 }, { "missing", 3 } } );

    REQUIRE_EQUAL( readAt( reader, 3, 0 ), "abc" );
    REQUIRE_THROWS_AS( readAt( reader, 6, 0 ), NotFoundError );

    REQUIRE_THROWS_AS( MultiPartFileReader( nullptr, {} ), std::invalid_argument );
}


void
testVirtualParts()
{
    SyntheticPosting posting;
    posting.addPart( "Show.7z.001", { 400, 400 } );
    posting.addPart( "Show.7z.002", { 400, 400 } );
    posting.addPart( "Show.7z.003", { 100 } );
    const auto parts = std::make_shared<const PartSet>( posting.parts );
    const auto fileSystem = std::make_shared<const VirtualFileSystem>( parts, posting.createFactory() );

    const auto reader = MultiPartFileReader::fromParts( fileSystem, *parts );
    const auto expected = posting.concatenated();
    REQUIRE_EQUAL( reader->size().value(), expected.size() );

    std::vector<char> buffer( 300 );
    REQUIRE_EQUAL( reader->readAt( buffer.data(), buffer.size(), 700 ), 300U );
    REQUIRE( buffer == std::vector<char>( expected.begin() + 700, expected.begin() + 1000 ) );

    REQUIRE_EQUAL( reader->readAt( buffer.data(), buffer.size(), 1550 ), 150U );
    REQUIRE( std::equal( expected.begin() + 1550, expected.end(), buffer.begin() ) );

    std::vector<char> all( expected.size() );
    REQUIRE_EQUAL( reader->readAt( all.data(), all.size(), 0 ), expected.size() );
    REQUIRE( all == expected );
}


/**
 * Archive readers skip over stored data by reading into a null buffer. Preloaded and streamed
 * parts have to behave the same.
 */
void
testSkipAcrossParts()
{
    SyntheticPosting posting;
    posting.addPart( "Show.7z.001", { 400, 400 } );
    posting.addPart( "Show.7z.002", { 400, 400 } );
    posting.addPart( "Show.7z.003", { 100 } );
    const auto parts = std::make_shared<const PartSet>( posting.parts );
    const auto expected = posting.concatenated();

    MemoryFileSystem::Files files;
    for ( const auto& part : posting.parts ) {
        const auto& contents = posting.contentsByName.at( part.name );
        files.emplace_back( part.name, std::make_shared<const std::vector<char> >( contents ) );
    }

    const std::vector<std::shared_ptr<const FileSystem> > fileSystems = {
        std::make_shared<const MemoryFileSystem>( std::move( files ) ),
        std::make_shared<const VirtualFileSystem>( parts, posting.createFactory() ),
    };

    for ( const auto& fileSystem : fileSystems ) {
        const auto reader = MultiPartFileReader::fromParts( fileSystem, *parts );

        REQUIRE_EQUAL( reader->readAt( nullptr, 300, 700 ), 300U );
        REQUIRE_EQUAL( reader->readAt( nullptr, 1000, 1200 ), 500U );
        REQUIRE_EQUAL( reader->readAt( nullptr, 10, 1700 ), 0U );

        /* Sequential skipping moves the position like reading does. */
        REQUIRE_EQUAL( reader->read( nullptr, 750 ), 750U );
        REQUIRE_EQUAL( reader->tell(), 750U );
        std::vector<char> buffer( 100 );
        REQUIRE_EQUAL( reader->read( buffer.data(), buffer.size() ), 100U );
        REQUIRE( buffer == std::vector<char>( expected.begin() + 750, expected.begin() + 850 ) );

        REQUIRE_EQUAL( reader->read( nullptr, 1000 ), 850U );
        REQUIRE( reader->eof() );
    }
}


int
main()
{
    testReadAcrossParts();
    testShortPart();
    testMissingPart();
    testVirtualParts();
    testSkipAcrossParts();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
