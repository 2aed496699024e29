#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>

#include <core/common.hpp>
#include <core/Error.hpp>
#include <core/TestHelpers.hpp>


using namespace nzbseek;


void
testUnsignedSaturatingAddition()
{
    REQUIRE_EQUAL( saturatingAddition( 0U, 0U ), 0U );
    REQUIRE_EQUAL( saturatingAddition( 1U, 1U ), 2U );

    constexpr auto MAX = std::numeric_limits<uint64_t>::max();
    REQUIRE_EQUAL( saturatingAddition( MAX, uint64_t( 0 ) ), MAX );
    REQUIRE_EQUAL( saturatingAddition( MAX, uint64_t( 1 ) ), MAX );
    REQUIRE_EQUAL( saturatingAddition( uint64_t( 2 ), MAX - 1U ), MAX );
    REQUIRE_EQUAL( saturatingAddition( MAX - 3U, uint64_t( 2 ) ), MAX - 1U );
    REQUIRE_EQUAL( saturatingAddition( MAX, MAX ), MAX );
}


void
testSignedSaturatingAddition()
{
    REQUIRE_EQUAL( saturatingAddition( 0, 0 ), 0 );
    REQUIRE_EQUAL( saturatingAddition( -2, 1 ), -1 );
    REQUIRE_EQUAL( saturatingAddition( -2, -1 ), -3 );

    constexpr auto MAX = std::numeric_limits<long long int>::max();
    constexpr auto MIN = std::numeric_limits<long long int>::min();
    REQUIRE_EQUAL( saturatingAddition( MAX, 1LL ), MAX );
    REQUIRE_EQUAL( saturatingAddition( MAX, -1LL ), MAX - 1 );
    REQUIRE_EQUAL( saturatingAddition( MIN, -1LL ), MIN );
    REQUIRE_EQUAL( saturatingAddition( MIN, MAX ), -1LL );
}


void
testStringHelpers()
{
    using namespace std::literals;

    REQUIRE( startsWith( "./Movie.rar"sv, "./"sv ) );
    REQUIRE( !startsWith( "Movie.rar"sv, "./"sv ) );
    REQUIRE( !startsWith( "."sv, "./"sv ) );
    REQUIRE( endsWith( "Movie.RAR"s, ".rar"s, /* caseSensitive */ false ) );
    REQUIRE( !endsWith( "Movie.RAR"s, ".rar"s ) );
    REQUIRE( !endsWith( "ar"s, ".rar"s ) );
    REQUIRE_EQUAL( toLower( "Movie.Part01.RAR" ), "movie.part01.rar" );
}


void
testFormatBytes()
{
    REQUIRE_EQUAL( formatBytes( 0 ), "0 B" );
    REQUIRE_EQUAL( formatBytes( 1023 ), "1023 B" );
    REQUIRE_EQUAL( formatBytes( 1024 ), "1 KiB" );
    REQUIRE_EQUAL( formatBytes( 3_Mi + 5 ), "3 MiB 5 B" );
    REQUIRE_EQUAL( formatBytes( 8_Gi ), "8 GiB" );
}


void
testThreadSafeOutput()
{
    const auto line = ( ThreadSafeOutput() << "[Component]" << "Opened" << 3 << "readers" ).str();
    REQUIRE( line.find( "[Component] Opened 3 readers\n" ) != std::string::npos );
    REQUIRE( line.front() == '[' );
}


void
testFinally()
{
    int calls{ 0 };
    {
        const Finally increment( [&calls] () { ++calls; } );
        REQUIRE_EQUAL( calls, 0 );
    }
    REQUIRE_EQUAL( calls, 1 );
}


void
testErrors()
{
    REQUIRE_EQUAL( toString( Error::NONE ), "No error." );
    REQUIRE( TransportError( "timeout" ).isRetryable() );
    REQUIRE( !NotFoundError( "a.rar" ).isRetryable() );
    REQUIRE( NotFoundError( "a.rar" ).error() == Error::NOT_FOUND );
    REQUIRE( std::string( NotFoundError( "a.rar" ).what() ).find( "a.rar" ) != std::string::npos );
    REQUIRE( CancelledError().error() == Error::CANCELLED );
    REQUIRE( UnsupportedArchiveError( "encrypted" ).error() == Error::UNSUPPORTED_ARCHIVE );

    const ClosedFileError closedFile;
    const ArchiveError& error = closedFile;
    REQUIRE( error.error() == Error::CLOSED_FILE );
}


int
main()
{
    testUnsignedSaturatingAddition();
    testSignedSaturatingAddition();
    testStringHelpers();
    testFormatBytes();
    testThreadSafeOutput();
    testFinally();
    testErrors();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
