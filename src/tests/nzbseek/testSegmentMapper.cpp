#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include <core/TestHelpers.hpp>
#include <nzbseek/SegmentMapper.hpp>


using namespace nzbseek;

using Segments = std::vector<Segment>;


[[nodiscard]] Part
createPart( const std::string&         name,
            const std::vector<size_t>& segmentSizes )
{
    Segments segments;
    for ( size_t i = 0; i < segmentSizes.size(); ++i ) {
        segments.emplace_back( Segment::whole( name + std::to_string( i ), segmentSizes[i] ) );
    }
    return Part::fromSegments( name, std::move( segments ) );
}


void
testSegmentLength()
{
    REQUIRE_EQUAL( Segment::whole( "a", 100 ).length(), 100U );
    REQUIRE_EQUAL( Segment::whole( "a", 1 ).length(), 1U );
    REQUIRE_EQUAL( Segment::whole( "a", 0 ).length(), 0U );
    REQUIRE_EQUAL( ( Segment{ "a", 10, 19, 100 } ).length(), 10U );
    REQUIRE_EQUAL( ( Segment{ "a", 5, 4, 100 } ).length(), 0U );
}


void
testSliceSegments()
{
    const auto part = createPart( "p", { 100, 100, 50 } );
    REQUIRE_EQUAL( part.size, 250U );

    /* Complete part */
    auto mapped = sliceSegments( part.segments, 0, part.size );
    REQUIRE_EQUAL( mapped.coveredBytes, 250U );
    REQUIRE_EQUAL( mapped.segments, part.segments );

    /* Inner window inside one segment */
    mapped = sliceSegments( part.segments, 110, 20 );
    REQUIRE_EQUAL( mapped.coveredBytes, 20U );
    REQUIRE_EQUAL( mapped.segments, ( Segments{ Segment{ "p1", 10, 29, 100 } } ) );

    /* Window straddling all three segments */
    mapped = sliceSegments( part.segments, 90, 130 );
    REQUIRE_EQUAL( mapped.coveredBytes, 130U );
    REQUIRE_EQUAL( mapped.segments, ( Segments{ Segment{ "p0", 90, 99, 100 }, Segment{ "p1", 0, 99, 100 },
                                                Segment{ "p2", 0, 19, 50 } } ) );

    /* Exactly one segment boundary */
    mapped = sliceSegments( part.segments, 100, 100 );
    REQUIRE_EQUAL( mapped.segments, ( Segments{ Segment{ "p1", 0, 99, 100 } } ) );

    /* Slicing already trimmed segments keeps the article-relative offsets consistent. */
    const auto resliced = sliceSegments( Segments{ Segment{ "p1", 10, 29, 100 } }, 5, 10 );
    REQUIRE_EQUAL( resliced.segments, ( Segments{ Segment{ "p1", 15, 24, 100 } } ) );

    /* Shortfall past the end */
    mapped = sliceSegments( part.segments, 200, 100 );
    REQUIRE_EQUAL( mapped.coveredBytes, 50U );
    REQUIRE_EQUAL( mapped.segments, ( Segments{ Segment{ "p2", 0, 49, 50 } } ) );

    REQUIRE( sliceSegments( part.segments, 300, 10 ).segments.empty() );
    REQUIRE( sliceSegments( part.segments, 10, 0 ).segments.empty() );

    /* Empty articles contribute nothing and are skipped. */
    const auto withEmpty = createPart( "e", { 10, 0, 10 } );
    mapped = sliceSegments( withEmpty.segments, 5, 10 );
    REQUIRE_EQUAL( mapped.segments, ( Segments{ Segment{ "e0", 5, 9, 10 }, Segment{ "e2", 0, 4, 10 } } ) );
}


void
testMapRangeCoversCompleteParts()
{
    const PartSet parts = { createPart( "a", { 400, 400, 200 } ), createPart( "b", { 300, 300 } ) };
    const auto windows = computePartWindows( parts );

    REQUIRE_EQUAL( windows.size(), 2U );
    REQUIRE_EQUAL( windows[0].absoluteStart, 0U );
    REQUIRE_EQUAL( windows[0].absoluteEnd, 1000U );
    REQUIRE_EQUAL( windows[1].absoluteStart, 1000U );
    REQUIRE_EQUAL( windows[1].absoluteEnd, 1600U );

    const auto mapped = mapRange( 0, totalSize( parts ), windows );
    REQUIRE_EQUAL( mapped.coveredBytes, 1600U );
    REQUIRE_EQUAL( mapped.segments.size(), 5U );
    REQUIRE_EQUAL( totalLength( mapped.segments ), 1600U );
}


void
testMapRangeStraddlingParts()
{
    const PartSet parts = { createPart( "A", { 500, 500 } ), createPart( "B", { 500, 500 } ) };

    const auto mapped = mapRange( 900, 200, computePartWindows( parts ) );
    REQUIRE_EQUAL( mapped.coveredBytes, 200U );
    REQUIRE_EQUAL( mapped.segments, ( Segments{ Segment{ "A1", 400, 499, 500 }, Segment{ "B0", 0, 99, 500 } } ) );
}


void
testMapRangeShortfall()
{
    const PartSet parts = { createPart( "A", { 100 } ) };
    const auto windows = computePartWindows( parts );

    const auto mapped = mapRange( 50, 100, windows );
    REQUIRE_EQUAL( mapped.coveredBytes, 50U );
    REQUIRE( mapRange( 100, 10, windows ).segments.empty() );
    REQUIRE_EQUAL( mapRange( 100, 10, windows ).coveredBytes, 0U );
    REQUIRE_EQUAL( mapRange( 10, 0, windows ).coveredBytes, 0U );

    REQUIRE_THROWS_AS( mapRange( std::numeric_limits<uint64_t>::max(), 2, windows ), std::invalid_argument );
}


int
main()
{
    testSegmentLength();
    testSliceSegments();
    testMapRangeCoversCompleteParts();
    testMapRangeStraddlingParts();
    testMapRangeShortfall();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
