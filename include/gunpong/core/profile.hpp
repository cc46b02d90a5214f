/**
 * @file profile.hpp
 * @brief Lightweight scope timer for the frame update
 *
 * Sections are identified by name and aggregated across calls (count,
 * total, min, max). Nesting is allowed; each section reports its own
 * inclusive time.
 *
 * Example usage:
 * @code
 * void CollisionSystem::update(FrameContext& ctx) {
 *     PROFILE_SCOPE("CollisionSystem");
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats(std::cout);
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <ostream>
#include <string>

namespace Profiling {

/**
 * @brief Process-wide table of timing data.
 */
class Profiler {
public:
    using Clock    = std::chrono::steady_clock;
    using Duration = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timing statistics for a named scope
     */
    struct SectionStats {
        Duration total_time{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};
        uint64_t call_count{0};
    };

    /**
     * @brief Adds one measured duration to a section.
     */
    static void record(const std::string& name, Duration duration);

    /**
     * @brief Prints one line per section, sorted by name.
     */
    static void printStats(std::ostream& out);

    /**
     * @brief Returns a copy of the statistics for one section (zeroed if unknown).
     */
    static SectionStats stats(const std::string& name);

    /**
     * @brief Forget all recorded sections.
     */
    static void reset();

private:
    std::map<std::string, SectionStats> sections;

    Profiler() = default;

    static Profiler& getInstance();
};

/**
 * @brief RAII guard that measures the lifetime of a scope.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
    Profiler::Clock::time_point start_time;
};

} // namespace Profiling

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the enclosing scope under the given name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
