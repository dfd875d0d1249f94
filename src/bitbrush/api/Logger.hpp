#pragma once

#include <functional>
#include <string>

namespace bitbrush
{

/**
 * @brief Logging callbacks supplied by the host application
 *
 * The library does not link any logging backend. Unset callbacks are skipped.
 */
struct Logger
{
    std::function<void(const std::string&)> info;
    std::function<void(const std::string&)> debug;
    std::function<void(const std::string&)> warn;
    std::function<void(const std::string&)> error;
};

} // namespace bitbrush
