#pragma once

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>


namespace nzbseek
{
/**
 * Orders keys by their last access. The least recently touched key is evicted first.
 */
template<typename Key>
class LeastRecentlyUsed
{
public:
    using Nonce = uint64_t;

public:
    void
    touch( const Key& key )
    {
        ++m_usageNonce;
        auto [match, wasInserted] = m_lastUsage.try_emplace( key, m_usageNonce );
        if ( !wasInserted ) {
            m_sortedKeys.erase( match->second );
            match->second = m_usageNonce;
        }
        m_sortedKeys.emplace( m_usageNonce, key );
    }

    [[nodiscard]] std::optional<Key>
    nextEviction() const
    {
        return m_sortedKeys.empty() ? std::nullopt : std::make_optional( m_sortedKeys.begin()->second );
    }

    /**
     * @param keyToEvict If given, this key is forgotten instead of the least recently used one.
     */
    std::optional<Key>
    evict( std::optional<Key> keyToEvict = {} )
    {
        auto evictedKey = keyToEvict ? std::move( keyToEvict ) : nextEviction();
        if ( evictedKey ) {
            if ( const auto match = m_lastUsage.find( *evictedKey ); match != m_lastUsage.end() ) {
                m_sortedKeys.erase( match->second );
                m_lastUsage.erase( match );
            }
        }
        return evictedKey;
    }

private:
    std::unordered_map<Key, Nonce> m_lastUsage;
    /** Nonces are unique, so no multimap is needed. begin() holds the least recently used key. */
    std::map<Nonce, Key> m_sortedKeys;
    Nonce m_usageNonce{ 0 };
};


/**
 * Bounded key-value cache used for decoded article bodies. It is not thread-safe on its own.
 */
template<
    typename Key,
    typename Value,
    typename CacheStrategy = LeastRecentlyUsed<Key>
>
class Cache
{
public:
    struct Statistics
    {
        size_t hits{ 0 };
        size_t misses{ 0 };
        size_t evictions{ 0 };
        size_t capacity{ 0 };
        size_t maxSize{ 0 };
    };

public:
    explicit
    Cache( size_t maxCacheSize ) :
        m_maxCacheSize( maxCacheSize )
    {}

    [[nodiscard]] std::optional<Value>
    get( const Key& key )
    {
        if ( const auto match = m_cache.find( key ); match != m_cache.end() ) {
            ++m_statistics.hits;
            m_cacheStrategy.touch( key );
            return match->second;
        }

        ++m_statistics.misses;
        return std::nullopt;
    }

    void
    insert( const Key& key,
            Value      value )
    {
        if ( capacity() == 0 ) {
            return;
        }

        /* Do not use try_emplace here because that could temporarily exceed the allotted capacity. */
        if ( const auto existingEntry = m_cache.find( key ); existingEntry == m_cache.end() ) {
            shrinkTo( capacity() - 1 );
            m_cache.emplace( key, std::move( value ) );
            m_statistics.maxSize = std::max( m_statistics.maxSize, m_cache.size() );
        } else {
            existingEntry->second = std::move( value );
        }

        m_cacheStrategy.touch( key );
    }

    [[nodiscard]] bool
    test( const Key& key ) const
    {
        return m_cache.find( key ) != m_cache.end();
    }

    void
    evict( const Key& key )
    {
        m_cacheStrategy.evict( key );
        m_cache.erase( key );
    }

    void
    clear()
    {
        while ( m_cacheStrategy.evict() ) {}
        m_cache.clear();
    }

    void
    shrinkTo( size_t newSize )
    {
        while ( m_cache.size() > newSize ) {
            const auto toEvict = m_cacheStrategy.evict();
            const auto keyToEvict = toEvict ? *toEvict : m_cache.begin()->first;
            m_cache.erase( keyToEvict );
            ++m_statistics.evictions;
        }
    }

    [[nodiscard]] Statistics
    statistics() const
    {
        auto result = m_statistics;
        result.capacity = capacity();
        return result;
    }

    [[nodiscard]] size_t
    capacity() const
    {
        return m_maxCacheSize;
    }

    [[nodiscard]] size_t
    size() const
    {
        return m_cache.size();
    }

private:
    CacheStrategy m_cacheStrategy;
    size_t const m_maxCacheSize;
    std::unordered_map<Key, Value> m_cache;
    Statistics m_statistics;
};
}  // namespace nzbseek
