#include <iostream>
#include <optional>
#include <string>

#include <core/Cache.hpp>
#include <core/TestHelpers.hpp>


using namespace nzbseek;


void
testLeastRecentlyUsed()
{
    LeastRecentlyUsed<int> strategy;
    REQUIRE( !strategy.nextEviction() );

    strategy.touch( 1 );
    strategy.touch( 2 );
    strategy.touch( 3 );
    REQUIRE_EQUAL( strategy.nextEviction().value_or( -1 ), 1 );

    strategy.touch( 1 );
    REQUIRE_EQUAL( strategy.nextEviction().value_or( -1 ), 2 );

    REQUIRE_EQUAL( strategy.evict().value_or( -1 ), 2 );
    REQUIRE_EQUAL( strategy.evict( 1 ).value_or( -1 ), 1 );
    REQUIRE_EQUAL( strategy.nextEviction().value_or( -1 ), 3 );
    REQUIRE_EQUAL( strategy.evict().value_or( -1 ), 3 );
    REQUIRE( !strategy.evict() );
}


void
testCacheEviction()
{
    Cache<std::string, int> cache( /* capacity */ 2 );

    cache.insert( "<a@x>", 1 );
    cache.insert( "<b@x>", 2 );
    REQUIRE_EQUAL( cache.get( "<a@x>" ).value_or( 0 ), 1 );

    /* "<b@x>" is the least recently used one now. */
    cache.insert( "<c@x>", 3 );
    REQUIRE( cache.test( "<a@x>" ) );
    REQUIRE( !cache.test( "<b@x>" ) );
    REQUIRE( cache.test( "<c@x>" ) );
    REQUIRE_EQUAL( cache.size(), 2U );

    REQUIRE( !cache.get( "<b@x>" ) );

    const auto statistics = cache.statistics();
    REQUIRE_EQUAL( statistics.hits, 1U );
    REQUIRE_EQUAL( statistics.misses, 1U );
    REQUIRE_EQUAL( statistics.evictions, 1U );
    REQUIRE_EQUAL( statistics.capacity, 2U );
    REQUIRE_EQUAL( statistics.maxSize, 2U );
}


void
testCacheReinsertion()
{
    Cache<std::string, int> cache( /* capacity */ 2 );

    cache.insert( "2", 4 );
    cache.insert( "1", 1 );
    /* Replacing an existing key's value must not evict anything. */
    cache.insert( "1", 2 );

    REQUIRE_EQUAL( cache.statistics().evictions, 0U );
    REQUIRE_EQUAL( cache.get( "1" ).value_or( 0 ), 2 );
    REQUIRE_EQUAL( cache.get( "2" ).value_or( 0 ), 4 );
}


void
testCacheShrinkAndClear()
{
    Cache<std::string, int> cache( 4 );
    for ( int i = 0; i < 4; ++i ) {
        cache.insert( std::to_string( i ), i );
    }

    cache.shrinkTo( 1 );
    REQUIRE_EQUAL( cache.size(), 1U );
    REQUIRE( cache.test( "3" ) );

    cache.evict( "3" );
    REQUIRE_EQUAL( cache.size(), 0U );

    cache.insert( "5", 5 );
    cache.clear();
    REQUIRE_EQUAL( cache.size(), 0U );
    REQUIRE( !cache.get( "5" ) );

    Cache<std::string, int> disabled( 0 );
    disabled.insert( "1", 1 );
    REQUIRE_EQUAL( disabled.size(), 0U );
}


int
main()
{
    testLeastRecentlyUsed();
    testCacheEviction();
    testCacheReinsertion();
    testCacheShrinkAndClear();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
