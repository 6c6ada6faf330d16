/**
 * @file profile.hpp
 * @brief Lightweight timing of named code sections
 *
 * Each named section aggregates total time, call count and min/max
 * duration. Sections are recorded from RAII guards, so concurrent
 * simulations may time themselves into the same table; the table is
 * guarded by a mutex.
 *
 * Example usage:
 * @code
 * void myFunc() {
 *     PROFILE_SCOPE("MyFunction");  // Automatically times this scope
 *     // ... code ...
 * }  // duration recorded here
 *
 * Profiling::Profiler::printStats();  // Print timing results somewhere in your code
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace Profiling {

/**
 * @brief Manages timing data across the application.
 *
 * This follows a singleton pattern. Use the static methods to record
 * sections and to print/reset the statistics.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Stores aggregated timing statistics for a named scope
     */
    struct ProfileData {
        Duration total_time{0};        ///< Accumulated total time for this scope
        uint64_t call_count{0};        ///< Number of times this scope was recorded
        Duration min_time{Duration::max()};
        Duration max_time{0};
    };

    /**
     * @brief Adds one timed run of a section.
     * @param name Section name, usually a string literal
     * @param duration Time spent in the section
     */
    static void record(const char* name, Duration duration);

    /**
     * @brief Returns the aggregate for a section, if it was ever recorded.
     */
    static std::optional<ProfileData> getStats(const std::string& name);

    /**
     * @brief Print all sections to stdout, slowest first.
     */
    static void printStats();

    /**
     * @brief Reset all recorded profiling data.
     */
    static void reset();

private:
    std::unordered_map<std::string, ProfileData> sections;
    std::mutex mutex;

    // Private constructor for singleton
    Profiler() = default;

    static Profiler& getInstance();
};

/**
 * @brief RAII guard that records the lifetime of a scope.
 *
 * The name is not copied and must outlive the guard. A sample that cannot
 * be stored is reported on stderr and dropped.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(const char* name);
    ~ScopedProfiler();

    // No copy allowed
    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    const char* section_name;
    Profiler::TimePoint start_time;
};

} // namespace Profiling

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Convenience macro for scoping. Creates a local ScopedProfiler
 *        whose destructor records the scope's duration.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
