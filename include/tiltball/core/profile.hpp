/**
 * @file profile.hpp
 * @brief Scope timing for the simulation tick and its systems
 *
 * Each system opens a named scope for the duration of its update. Scopes nest,
 * so a full tick shows up as a tree:
 *
 * @code
 * void PhysicsWorld::step(double dtMs) {
 *     PROFILE_SCOPE("PhysicsWorld::step");
 *     for (auto& system : systems) system->update(registry);  // each opens its own scope
 * }
 *
 * Profiling::Profiler::printStats();  // dump the tree, e.g. when the viewer closes
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <stack>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide collector of scope timings.
 *
 * Accessed only through the static methods; the simulation is single-threaded,
 * so no locking is done.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timings for one named scope
     */
    struct ProfileData {
        Duration total_time{0};        ///< Accumulated wall time inside the scope
        Duration self_time{0};         ///< total_time minus time spent in child scopes
        uint64_t call_count{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};

        std::string parent_name;
        std::vector<std::string> children;
    };

    /**
     * @brief Opens a scope; must be matched by endSection with the same name.
     */
    static void startSection(const std::string& name);

    /**
     * @brief Closes the innermost scope. A mismatched name is reported and ignored.
     */
    static void endSection(const std::string& name);

    /**
     * @brief Prints the scope tree with call counts and time shares to stdout.
     */
    static void printStats();

    /**
     * @brief Prints the scope tree to the given stream.
     */
    static void printStats(std::ostream& out);

    /**
     * @brief Number of completed calls recorded for a scope (0 if never seen).
     */
    static uint64_t callCount(const std::string& name);

    /**
     * @brief Drops all recorded data.
     */
    static void reset();

private:
    struct SectionData {
        TimePoint start_time;
        ProfileData profile_data;
    };

    std::unordered_map<std::string, SectionData> sections;
    std::stack<std::string> scope_stack;

    Profiler() = default;

    static Profiler& getInstance();

    static void printNode(std::ostream& out,
                          const std::string& name,
                          const std::string& prefix,
                          bool is_last,
                          Duration total_program_time);
};

/**
 * @brief RAII guard: starts a scope on construction, ends it on destruction.
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

#define TILTBALL_PROFILE_CONCAT_INNER(a, b) a##b
#define TILTBALL_PROFILE_CONCAT(a, b) TILTBALL_PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the enclosing scope under the given name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler TILTBALL_PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
