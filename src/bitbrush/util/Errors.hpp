#pragma once

#include <stdexcept>
#include <string>

namespace bitbrush
{

/**
 * @brief Base class for every error raised by the bitbrush library
 *
 * All errors reflect caller mistakes and are raised at the call that
 * introduces the bad value. Generator sequences never throw while iterating.
 */
class Error : public std::runtime_error
{
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

/// Engine constructed with an unusable width.
class InvalidConfiguration : public Error
{
public:
    explicit InvalidConfiguration(const std::string& message)
        : Error("invalid configuration: " + message)
    {
    }
};

/// Bad per-call parameter (non-positive step, malformed binary text).
class InvalidArgument : public Error
{
public:
    explicit InvalidArgument(const std::string& message)
        : Error("invalid argument: " + message)
    {
    }
};

} // namespace bitbrush
