#pragma once
#include <stdexcept>
#include <string>

namespace mcplib
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

/// Rejected tool registration (bad name, description, handler or parameter docs).
struct ValidationError : public Error
{
    using Error::Error;
};

/// Lifecycle misuse: processing while stopped, double start, double stop.
struct StateError : public Error
{
    using Error::Error;
};

/// Thrown by a tool handler to report a user-facing failure.
///
/// Not part of the Error hierarchy: the dispatcher turns it into a tool result
/// with isError=true, while every other exception becomes an Internal Error.
struct ToolError : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

} // namespace mcplib
