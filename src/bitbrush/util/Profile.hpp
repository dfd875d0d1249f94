#pragma once

#include <chrono>
#include <sstream>
#include <string_view>

// BITBRUSH_PROFILING_LEVEL is set via CMake:
//   0 = Disabled (no profiling)
//   1 = Timer only (std::chrono + bitbrush::Logger)
//   2 = Tracy + Timer (full profiling)

#ifndef BITBRUSH_PROFILING_LEVEL
#define BITBRUSH_PROFILING_LEVEL 0
#endif

#if BITBRUSH_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#endif

#if BITBRUSH_PROFILING_LEVEL >= 1
#include "../api/Logger.hpp"
#endif

namespace bitbrush::profiling
{

#if BITBRUSH_PROFILING_LEVEL >= 1
/// Logger receiving profiling output. Set once at startup, before any engine runs.
inline Logger g_profiling_logger{};

inline void SetProfilingLogger(const Logger& logger) { g_profiling_logger = logger; }

/**
 * @brief RAII scope timer for measuring and logging execution time
 *
 * Logs elapsed time on destruction through the profiling logger's debug callback.
 */
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view name) noexcept
        : name_(name)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer() noexcept
    {
        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start_);

        if (g_profiling_logger.debug)
        {
            std::ostringstream oss;
            oss << "[PROFILE] " << name_ << " took " << duration.count() << " us";
            g_profiling_logger.debug(oss.str());
        }
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;
    ScopeTimer(ScopeTimer&&) = delete;
    ScopeTimer& operator=(ScopeTimer&&) = delete;

private:
    std::string_view name_;
    std::chrono::steady_clock::time_point start_;
};
#endif

} // namespace bitbrush::profiling

#if BITBRUSH_PROFILING_LEVEL == 0
#define PROFILE_SCOPE_FUNCTION() ((void)0)

#elif BITBRUSH_PROFILING_LEVEL == 1
#define PROFILE_SCOPE_FUNCTION() ::bitbrush::profiling::ScopeTimer __profiling_timer(__FUNCTION__)

#elif BITBRUSH_PROFILING_LEVEL >= 2
#define PROFILE_SCOPE_FUNCTION() \
    ZoneScopedN(__FUNCTION__);   \
    ::bitbrush::profiling::ScopeTimer __profiling_timer(__FUNCTION__)

#endif
