#pragma once
#include <stdexcept>
#include <string>

namespace mcpdiff
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Stream closed, write failure, or the subprocess could not be started
struct TransportError : public Error
{
    using Error::Error;
};

/// No response within the read bound
struct TimeoutError : public Error
{
    using Error::Error;
};

/// Malformed or out-of-order message
struct ProtocolError : public Error
{
    using Error::Error;
};

/// The server answered tools/list with an error
struct ToolListError : public Error
{
    using Error::Error;
};

/// Operation issued in the wrong session lifecycle state
struct SessionError : public Error
{
    using Error::Error;
};

struct ConfigError : public Error
{
    using Error::Error;
};

} // namespace mcpdiff
