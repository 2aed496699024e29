#pragma once

#include <chrono>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "common.hpp"


namespace nzbseek
{
int gnTests = 0;  // NOLINT
int gnTestErrors = 0;  // NOLINT


template<typename A,
         typename B>
void
requireEqual( const A&  a,
              const B&  b,
              const int line )
{
    ++gnTests;
    if ( a != b ) {
        ++gnTestErrors;
        std::cerr << "[FAIL on line " << line << "] " << a << " != " << b << "\n";
    }
}


void
require( bool               condition,
         std::string const& conditionString,
         int                line )
{
    ++gnTests;
    if ( !condition ) {
        ++gnTestErrors;
        std::cerr << "[FAIL on line " << line << "] " << conditionString << "\n";
    }
}


#define REQUIRE_EQUAL( a, b ) requireEqual( a, b, __LINE__ )  // NOLINT
#define REQUIRE( condition ) require( condition, #condition, __LINE__ )  // NOLINT
#define REQUIRE_THROWS( condition ) require( [&] () { \
    try { \
        (void)condition; \
    } catch ( const std::exception& ) { \
        return true; \
    } \
    return false; \
} (), #condition, __LINE__ )  // NOLINT
#define REQUIRE_THROWS_AS( condition, ExceptionType ) require( [&] () { \
    try { \
        (void)condition; \
    } catch ( const ExceptionType& ) { \
        return true; \
    } catch ( const std::exception& ) { \
        return false; \
    } \
    return false; \
} (), #condition " throws " #ExceptionType, __LINE__ )  // NOLINT


/**
 * Redirects everything written to the given stream into an internal buffer until destruction.
 * Used to check the warnings that are written to std::cerr.
 */
class StreamInterceptor
{
public:
    explicit
    StreamInterceptor( std::ostream& out ) :
        m_out( out ),
        m_rdbuf( m_out.rdbuf( m_buffer.rdbuf() ) )
    {}

    ~StreamInterceptor()
    {
        close();
    }

    void
    close()
    {
        const std::scoped_lock lock( m_mutex );
        if ( m_rdbuf.has_value() ) {
            m_out.rdbuf( *m_rdbuf );
            m_rdbuf.reset();
        }
    }

    [[nodiscard]] std::string
    str() const
    {
        const std::scoped_lock lock( m_mutex );
        return m_buffer.str();
    }

    StreamInterceptor( const StreamInterceptor& ) = delete;
    StreamInterceptor( StreamInterceptor&& ) = delete;
    StreamInterceptor& operator=( const StreamInterceptor& ) = delete;
    StreamInterceptor& operator=( StreamInterceptor&& ) = delete;

private:
    std::ostream& m_out;
    std::stringstream m_buffer;
    std::optional<std::streambuf*> m_rdbuf;
    mutable std::mutex m_mutex;
};


class TemporaryDirectory
{
public:
    explicit
    TemporaryDirectory( std::filesystem::path path ) :
        m_path( std::move( path ) )
    {}

    TemporaryDirectory( TemporaryDirectory&& ) = default;

    TemporaryDirectory( const TemporaryDirectory& ) = delete;

    TemporaryDirectory&
    operator=( TemporaryDirectory&& ) = default;

    TemporaryDirectory&
    operator=( const TemporaryDirectory& ) = delete;

    ~TemporaryDirectory()
    {
        if ( !m_path.empty() ) {
            std::error_code errorCode;
            std::filesystem::remove_all( m_path, errorCode );
        }
    }

    [[nodiscard]] const std::filesystem::path&
    path() const
    {
        return m_path;
    }

private:
    std::filesystem::path m_path;
};


[[nodiscard]] inline TemporaryDirectory
createTemporaryDirectory( const std::string& title = "tmpTest" )
{
    const auto nanoseconds = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch() ).count();
    const auto path = std::filesystem::temp_directory_path() / ( title + "." + std::to_string( nanoseconds ) );
    std::filesystem::create_directory( path );
    return TemporaryDirectory( path );
}
}  // namespace nzbseek
