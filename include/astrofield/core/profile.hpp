/**
 * @file profile.hpp
 * @brief Lightweight scope timer for the field's per-frame systems
 *
 * Example usage:
 * @code
 * void OverlapSolver::solve(...) {
 *     PROFILE_SCOPE("OverlapSolver");
 *     // ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Aggregates scope timings across the process
 *
 * Not thread-safe. Every scope is entered from the frame callback.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    struct ProfileData {
        Duration total_time{0};
        Duration max_time{0};
        uint64_t call_count{0};
        std::string parent_name;   ///< Enclosing scope at first entry
    };

    static void startSection(const std::string& name);
    static void endSection(const std::string& name);

    /**
     * @brief Prints every scope with its parent, sorted by total time
     */
    static void printStats();

    static void reset();

    /** @brief Number of completed entries into a scope, 0 if unknown */
    static uint64_t callCount(const std::string& name);

private:
    struct SectionData {
        TimePoint start_time;
        ProfileData profile_data;
    };

    std::unordered_map<std::string, SectionData> sections;
    std::vector<std::string> scope_stack;

    Profiler() = default;
    static Profiler& getInstance();
};

/**
 * @brief RAII guard timing the enclosing scope
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
};

} // namespace Profiling

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the rest of the enclosing scope under the given name
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
