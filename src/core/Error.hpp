#pragma once

#include <ostream>
#include <stdexcept>
#include <string>


namespace nzbseek
{
enum class [[nodiscard]] Error
{
    NONE                = 0x00,

    /* The requested file name, part or archive member does not exist. */
    NOT_FOUND           = 0x10,
    /* Operation on a handle that has already been closed. */
    CLOSED_FILE         = 0x11,
    /* Seek before the start or past the end of a part, or with an unknown origin. */
    INVALID_SEEK        = 0x12,

    /* The article source failed or delivered fewer bytes than declared. */
    TRANSPORT           = 0x20,
    CANCELLED           = 0x21,

    /* Only ever reported as a warning. Segment coverage is shorter than the logical entry size. */
    DATA_INTEGRITY      = 0x30,
    /* The archive could not be decoded or no entries were found in it. */
    UNSUPPORTED_ARCHIVE = 0x31,
};


[[nodiscard]] inline std::string
toString( Error error )
{
    switch ( error )
    {
    case Error::NONE:
        return "No error.";
    case Error::NOT_FOUND:
        return "File not found!";
    case Error::CLOSED_FILE:
        return "File has already been closed!";
    case Error::INVALID_SEEK:
        return "Invalid seek position or origin!";
    case Error::TRANSPORT:
        return "Failed to fetch article data!";
    case Error::CANCELLED:
        return "Operation was cancelled!";
    case Error::DATA_INTEGRITY:
        return "Segment coverage does not match the expected size!";
    case Error::UNSUPPORTED_ARCHIVE:
        return "Archive is not supported!";
    }
    return "Unknown error code!";
}


inline std::ostream&
operator<<( std::ostream&  out,
            nzbseek::Error error )
{
    out << toString( error );
    return out;
}


/**
 * Base class of all errors raised by the library. The error category is kept beside the message
 * so that callers, e.g., retry loops, do not have to parse the what() string.
 */
class ArchiveError :
    public std::runtime_error
{
public:
    ArchiveError( Error              error,
                  const std::string& message ) :
        std::runtime_error( message ),
        m_error( error )
    {}

    [[nodiscard]] Error
    error() const noexcept
    {
        return m_error;
    }

    /**
     * Only transport failures are transient. Everything else will fail the same way when repeated.
     */
    [[nodiscard]] bool
    isRetryable() const noexcept
    {
        return m_error == Error::TRANSPORT;
    }

private:
    Error m_error;
};


class NotFoundError :
    public ArchiveError
{
public:
    explicit
    NotFoundError( const std::string& what ) :
        ArchiveError( Error::NOT_FOUND, "File not found: " + what )
    {}
};


class ClosedFileError :
    public ArchiveError
{
public:
    explicit
    ClosedFileError( const std::string& message = toString( Error::CLOSED_FILE ) ) :
        ArchiveError( Error::CLOSED_FILE, message )
    {}
};


class InvalidSeekError :
    public ArchiveError
{
public:
    explicit
    InvalidSeekError( const std::string& message ) :
        ArchiveError( Error::INVALID_SEEK, message )
    {}
};


class TransportError :
    public ArchiveError
{
public:
    explicit
    TransportError( const std::string& message ) :
        ArchiveError( Error::TRANSPORT, message )
    {}
};


class CancelledError :
    public ArchiveError
{
public:
    explicit
    CancelledError( const std::string& message = toString( Error::CANCELLED ) ) :
        ArchiveError( Error::CANCELLED, message )
    {}
};


class UnsupportedArchiveError :
    public ArchiveError
{
public:
    explicit
    UnsupportedArchiveError( const std::string& message ) :
        ArchiveError( Error::UNSUPPORTED_ARCHIVE, message )
    {}
};
}  // namespace nzbseek
