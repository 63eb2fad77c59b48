/**
 * @file profile.hpp
 * @brief Scoped timing of simulation phases
 *
 * Nested scopes are recorded as a tree so a report shows, for example,
 * how much of Model::tick goes to the contact scan:
 * @code
 * void Model::tick() {
 *     PROFILE_SCOPE("Model::tick");
 *     // ... systems open their own scopes ...
 * }
 *
 * Profiling::Profiler::printStats(std::cerr);
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace Profiling {

/**
 * @brief Per-thread store of timing data, accessed through static methods.
 *
 * Each thread profiles into its own instance; printStats() reports the
 * calling thread's sections only.
 */
class Profiler {
public:
    using Clock    = std::chrono::steady_clock;
    using Duration = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timings for one named scope
     */
    struct SectionStats {
        Duration total{0};
        Duration longest{0};
        uint64_t calls{0};
        std::string parent;                 ///< Empty for root scopes
        std::vector<std::string> children;  ///< In first-seen order
    };

    /**
     * @brief Opens a scope nested under whichever scope is currently open.
     */
    static void startSection(const std::string& name);

    /**
     * @brief Closes the innermost scope, which must be name.
     *
     * A mismatched name is reported on stderr and nothing is recorded.
     */
    static void endSection(const std::string& name);

    /**
     * @brief Writes the scope tree with call counts and share of root time.
     */
    static void printStats(std::ostream& out);

    /**
     * @brief Returns the stats for one scope, or nullptr if never opened.
     */
    static const SectionStats* find(const std::string& name);

    /** @brief Drops all recorded data */
    static void reset();

private:
    struct OpenScope {
        std::string name;
        Clock::time_point started;
    };

    std::map<std::string, SectionStats> sections;
    std::vector<OpenScope> open;

    Profiler() = default;
    static Profiler& instance();

    static void printSection(std::ostream& out, const std::string& name,
                             const std::string& indent, Duration rootTotal);
};

/**
 * @brief RAII guard that times the enclosing block.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string sectionName;
};

} // namespace Profiling

#define CONTAGION_PROFILE_CONCAT_INNER(a, b) a##b
#define CONTAGION_PROFILE_CONCAT(a, b) CONTAGION_PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the rest of the enclosing block under the given name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler CONTAGION_PROFILE_CONCAT(scopedProfiler_, __LINE__) { name }
