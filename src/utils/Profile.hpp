#pragma once

#include <chrono>
#include <string_view>

// STRSCAN_PROFILING_LEVEL is set via CMake:
//   0 = Disabled (no profiling)
//   1 = Scope timers logged through plog to the profiling logger instance

#ifndef STRSCAN_PROFILING_LEVEL
#define STRSCAN_PROFILING_LEVEL 0
#endif

#if STRSCAN_PROFILING_LEVEL >= 1
#include <plog/Log.h>
#endif

namespace profiling
{

#if STRSCAN_PROFILING_LEVEL >= 1
constexpr int kProfilingLogInstance = 2;

namespace detail
{

/**
 * @brief RAII scope timer
 *
 * Captures start time on construction and logs elapsed time on destruction.
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
        PLOG_DEBUG_(profiling::kProfilingLogInstance) << "[PROFILE] " << name_ << " took " << duration.count() << " us";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;
    ScopeTimer(ScopeTimer&&) = delete;
    ScopeTimer& operator=(ScopeTimer&&) = delete;

private:
    std::string_view name_;
    std::chrono::time_point<std::chrono::steady_clock> start_;
};

} // namespace detail
#endif

} // namespace profiling

#if STRSCAN_PROFILING_LEVEL == 0
#define PROFILE_SCOPE_FUNCTION() ((void)0)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))
#else
#define PROFILE_SCOPE_FUNCTION() ::profiling::detail::ScopeTimer __profiling_timer(__FUNCTION__)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ::profiling::detail::ScopeTimer __profiling_timer(nameExpr)
#endif
