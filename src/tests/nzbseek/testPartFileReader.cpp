#include <cstdio>
#include <iostream>
#include <memory>
#include <vector>

#include <core/Cancellation.hpp>
#include <core/Error.hpp>
#include <core/TestHelpers.hpp>
#include <nzbseek/PartFileReader.hpp>

#include "SyntheticPosting.hpp"


using namespace nzbseek;


[[nodiscard]] PartReaderConfiguration
smallWindows()
{
    PartReaderConfiguration configuration;
    configuration.initialAnalysisWindow = 1000;
    configuration.maxAnalysisWindow = 4000;
    configuration.windowGrowthThreshold = 100;
    configuration.readAheadBufferSize = 2000;
    configuration.analysisFetchParallelism = 2;
    configuration.streamingFetchParallelism = 2;
    return configuration;
}


struct Fixture
{
    Fixture()
    {
        posting.addPart( "Movie.part1.rar", std::vector<size_t>( 10, 700 ) );
        part = std::make_shared<const Part>( posting.parts.front() );
        contents = posting.contentsByName.at( part->name );
        factory = posting.createFactory();
    }

    [[nodiscard]] std::unique_ptr<PartFileReader>
    open( ReadMode                 mode = ReadMode::ANALYSIS,
          const CancellationToken& cancel = {} ) const
    {
        return std::make_unique<PartFileReader>( part, factory, cancel, smallWindows(), mode );
    }

    [[nodiscard]] std::vector<char>
    expected( size_t offset,
              size_t size ) const
    {
        return { contents.begin() + offset, contents.begin() + offset + size };
    }

    SyntheticPosting posting;
    std::shared_ptr<const Part> part;
    std::vector<char> contents;
    std::shared_ptr<PooledSegmentReaderFactory> factory;
};


[[nodiscard]] std::vector<char>
readBytes( FileReader& file,
           size_t      size )
{
    std::vector<char> result( size );
    result.resize( file.read( result.data(), result.size() ) );
    return result;
}


void
testSequentialAnalysisRead()
{
    const Fixture fixture;
    auto file = fixture.open();

    REQUIRE_EQUAL( file->size().value(), 7000U );
    REQUIRE( file->seekable() );

    std::vector<char> result;
    while ( !file->eof() ) {
        const auto chunk = readBytes( *file, 300 );
        REQUIRE( !chunk.empty() );
        if ( chunk.empty() ) {
            break;
        }
        result.insert( result.end(), chunk.begin(), chunk.end() );
    }

    REQUIRE( result == fixture.contents );
    REQUIRE( file->mode() == ReadMode::ANALYSIS );
    REQUIRE( file->statistics().windowGrowths >= 2 );
    /* The windows grow, so far fewer readers than the 24 reads are needed. */
    REQUIRE( file->statistics().readersOpened < 10 );
    REQUIRE_EQUAL( file->tell(), 7000U );
    REQUIRE_EQUAL( readBytes( *file, 10 ).size(), 0U );
}


void
testBackwardReadFromBuffer()
{
    const Fixture fixture;
    auto file = fixture.open();

    REQUIRE( readBytes( *file, 500 ) == fixture.expected( 0, 500 ) );
    REQUIRE_EQUAL( file->statistics().readersOpened, 1U );

    REQUIRE_EQUAL( file->seek( 100 ), 100U );
    REQUIRE( file->mode() == ReadMode::ANALYSIS );
    REQUIRE( readBytes( *file, 200 ) == fixture.expected( 100, 200 ) );
    REQUIRE_EQUAL( file->statistics().readersOpened, 1U );
    REQUIRE_EQUAL( file->statistics().bytesFromBuffer, 200U );

    /* Continuing past the buffered range resumes the open network window. */
    REQUIRE( readBytes( *file, 400 ) == fixture.expected( 300, 400 ) );
    REQUIRE_EQUAL( file->statistics().readersOpened, 1U );
    REQUIRE_EQUAL( file->statistics().bytesFromBuffer, 400U );

    REQUIRE_EQUAL( file->seek( -300, SEEK_CUR ), 400U );
    REQUIRE( readBytes( *file, 100 ) == fixture.expected( 400, 100 ) );
    REQUIRE( file->mode() == ReadMode::ANALYSIS );
}


void
testSwitchToStreaming()
{
    const Fixture fixture;

    auto file = fixture.open();
    REQUIRE_EQUAL( file->seek( 0 ), 0U );
    REQUIRE( file->mode() == ReadMode::ANALYSIS );

    REQUIRE( readBytes( *file, 100 ) == fixture.expected( 0, 100 ) );
    REQUIRE_EQUAL( file->seek( 5000 ), 5000U );
    REQUIRE( file->mode() == ReadMode::STREAMING );
    REQUIRE( readBytes( *file, 1500 ) == fixture.expected( 5000, 1500 ) );
    REQUIRE_EQUAL( file->statistics().readersOpened, 2U );

    /* The mode change is permanent even when going back to the buffered start. */
    REQUIRE_EQUAL( file->seek( 0 ), 0U );
    REQUIRE( readBytes( *file, 100 ) == fixture.expected( 0, 100 ) );
    REQUIRE( file->mode() == ReadMode::STREAMING );

    /* Seeking to the end of the file and reading returns nothing. */
    REQUIRE_EQUAL( file->seek( 0, SEEK_END ), 7000U );
    REQUIRE( file->eof() );
    REQUIRE_EQUAL( readBytes( *file, 100 ).size(), 0U );

    const auto cloned = file->clone();
    const auto* const clonedPartFile = dynamic_cast<const PartFileReader*>( cloned.get() );
    REQUIRE( clonedPartFile != nullptr );
    if ( clonedPartFile != nullptr ) {
        REQUIRE( clonedPartFile->mode() == ReadMode::ANALYSIS );
        REQUIRE_EQUAL( clonedPartFile->tell(), 0U );
    }
    REQUIRE( readBytes( *cloned, 700 ) == fixture.expected( 0, 700 ) );
}


void
testStreamingForwardSkip()
{
    const Fixture fixture;
    auto file = fixture.open( ReadMode::STREAMING );

    REQUIRE( readBytes( *file, 100 ) == fixture.expected( 0, 100 ) );
    REQUIRE_EQUAL( file->seek( 1100 ), 1100U );
    REQUIRE( readBytes( *file, 100 ) == fixture.expected( 1100, 100 ) );
    REQUIRE_EQUAL( file->statistics().readersOpened, 1U );
    REQUIRE_EQUAL( file->statistics().bytesSkipped, 1000U );

    /* A far jump opens a new window instead of downloading everything in between. */
    REQUIRE_EQUAL( file->seek( 6500 ), 6500U );
    REQUIRE( readBytes( *file, 1000 ) == fixture.expected( 6500, 500 ) );
    REQUIRE_EQUAL( file->statistics().readersOpened, 2U );
}


void
testSkipWithoutOutputBuffer()
{
    const Fixture fixture;

    {
        auto file = fixture.open();
        REQUIRE( readBytes( *file, 100 ) == fixture.expected( 0, 100 ) );
        REQUIRE_EQUAL( file->read( nullptr, 500 ), 500U );
        REQUIRE_EQUAL( file->tell(), 600U );
        REQUIRE( file->mode() == ReadMode::ANALYSIS );

        /* Skipped bytes are buffered like read ones, so going back does not reopen the window. */
        REQUIRE_EQUAL( file->seek( 0 ), 0U );
        REQUIRE( readBytes( *file, 600 ) == fixture.expected( 0, 600 ) );
        REQUIRE_EQUAL( file->statistics().readersOpened, 1U );
        REQUIRE_EQUAL( file->statistics().bytesFromBuffer, 600U );
        REQUIRE( file->mode() == ReadMode::ANALYSIS );
    }

    {
        auto file = fixture.open( ReadMode::STREAMING );
        REQUIRE_EQUAL( file->read( nullptr, 6500 ), 6500U );
        REQUIRE( readBytes( *file, 200 ) == fixture.expected( 6500, 200 ) );
        /* Skipping stops at the end of the part. */
        REQUIRE_EQUAL( file->read( nullptr, 1000 ), 300U );
        REQUIRE( file->eof() );
        REQUIRE_EQUAL( file->read( nullptr, 1000 ), 0U );
        REQUIRE_EQUAL( file->statistics().readersOpened, 1U );
    }
}


void
testDefaultConfiguration()
{
    SyntheticPosting posting;
    posting.addPart( "Big.part1.rar", std::vector<size_t>( 16, 768_Ki ) );
    const auto part = std::make_shared<const Part>( posting.parts.front() );
    const auto& contents = posting.contentsByName.at( part->name );
    const auto factory = posting.createFactory();

    /* Header parsers read small chunks. Going back to the start after up to 512 KiB is served
     * from the read-ahead buffer without downloading anything again. */
    {
        PartFileReader file( part, factory, {} );
        std::vector<char> firstPass;
        while ( firstPass.size() < 512_Ki ) {
            const auto chunk = readBytes( file, 4_Ki );
            REQUIRE_EQUAL( chunk.size(), 4_Ki );
            if ( chunk.empty() ) {
                break;
            }
            firstPass.insert( firstPass.end(), chunk.begin(), chunk.end() );
        }
        REQUIRE( firstPass == std::vector<char>( contents.begin(), contents.begin() + 512_Ki ) );
        REQUIRE_EQUAL( file.statistics().largestWindow, 512_Ki );
        REQUIRE_EQUAL( file.statistics().readersOpened, 2U );

        const auto fetchCount = posting.fetcher->fetchCount();
        const auto readersOpened = file.statistics().readersOpened;

        REQUIRE_EQUAL( file.seek( 0 ), 0U );
        REQUIRE( file.mode() == ReadMode::ANALYSIS );
        std::vector<char> secondPass( 512_Ki );
        REQUIRE_EQUAL( file.read( secondPass.data(), secondPass.size() ), secondPass.size() );
        REQUIRE( secondPass == firstPass );

        REQUIRE_EQUAL( posting.fetcher->fetchCount(), fetchCount );
        REQUIRE_EQUAL( file.statistics().readersOpened, readersOpened );
        REQUIRE_EQUAL( file.statistics().bytesFromBuffer, 512_Ki );
    }

    /* Windows double from 256 KiB while reading sequentially but never exceed 4 MiB. */
    {
        PartFileReader file( part, factory, {} );
        std::vector<char> result;
        while ( !file.eof() ) {
            const auto chunk = readBytes( file, 64_Ki );
            REQUIRE( !chunk.empty() );
            if ( chunk.empty() ) {
                break;
            }
            result.insert( result.end(), chunk.begin(), chunk.end() );
        }
        REQUIRE( result == contents );
        REQUIRE( file.mode() == ReadMode::ANALYSIS );
        REQUIRE_EQUAL( file.statistics().largestWindow, 4_Mi );
        REQUIRE( file.statistics().windowGrowths >= 5 );
    }
}


void
testInvalidUsage()
{
    const Fixture fixture;
    auto file = fixture.open();

    REQUIRE_THROWS_AS( file->seek( 7001 ), InvalidSeekError );
    REQUIRE_THROWS_AS( file->seek( -1 ), InvalidSeekError );
    REQUIRE_THROWS_AS( file->seek( 1, SEEK_END ), InvalidSeekError );
    REQUIRE_THROWS_AS( file->seek( 0, 12345 ), InvalidSeekError );
    REQUIRE_EQUAL( file->tell(), 0U );
    REQUIRE( file->mode() == ReadMode::ANALYSIS );

    file->close();
    REQUIRE( file->closed() );

    char buffer[16];
    REQUIRE_THROWS_AS( file->read( buffer, sizeof( buffer ) ), ClosedFileError );
    REQUIRE_THROWS_AS( file->seek( 0 ), ClosedFileError );
}


void
testNetworkErrors()
{
    {
        Fixture fixture;
        fixture.posting.fetcher->fail( fixture.part->segments.at( 3 ).id );
        auto file = fixture.open( ReadMode::STREAMING );

        REQUIRE( readBytes( *file, 2100 ) == fixture.expected( 0, 2100 ) );
        REQUIRE_THROWS_AS( readBytes( *file, 100 ), TransportError );
    }

    {
        Fixture fixture;
        fixture.posting.fetcher->truncate( fixture.part->segments.at( 0 ).id, 500 );
        auto file = fixture.open();
        REQUIRE_THROWS_AS( readBytes( *file, 600 ), TransportError );
    }

    {
        const Fixture fixture;
        const CancellationToken cancel;
        cancel.cancel();
        auto file = fixture.open( ReadMode::ANALYSIS, cancel );
        REQUIRE_THROWS_AS( readBytes( *file, 100 ), CancelledError );
    }
}


int
main()
{
    testSequentialAnalysisRead();
    testBackwardReadFromBuffer();
    testSwitchToStreaming();
    testStreamingForwardSkip();
    testSkipWithoutOutputBuffer();
    testDefaultConfiguration();
    testInvalidUsage();
    testNetworkErrors();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
