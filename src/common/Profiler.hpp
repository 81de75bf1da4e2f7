#pragma once

#include <string>
#include <chrono>
#include <limits>
#include <unordered_map>
#include <mutex>

namespace ordering {
namespace common {

/**
 * Profiler - agrège les durées des phases du tri (extraction, collation, passes radix)
 */
class Profiler {
public:
    struct Stats {
        size_t count = 0;
        double totalMs = 0.0;
        double minMs = std::numeric_limits<double>::max();
        double maxMs = 0.0;

        double avgMs() const { return count > 0 ? totalMs / count : 0.0; }
    };

    static Profiler& instance();

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

    // Record one measured duration for a phase
    void record(const std::string& phase, double durationMs);

    Stats getStats(const std::string& phase) const;
    std::unordered_map<std::string, Stats> getAllStats() const;
    void reset();

    // Stats table, phases sorted by total time
    std::string formatStats() const;

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    bool m_enabled = false;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Stats> m_stats;
};

/**
 * RAII Scoped timer - enregistre la durée à la destruction
 */
class ScopedTimer {
public:
    explicit ScopedTimer(std::string phase)
        : m_phase(std::move(phase))
        , m_start(std::chrono::steady_clock::now())
    {}

    ~ScopedTimer() {
        stop();
    }

    double stop() {
        if (!m_stopped) {
            m_stopped = true;
            m_duration = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - m_start).count();
            Profiler::instance().record(m_phase, m_duration);
        }
        return m_duration;
    }

private:
    std::string m_phase;
    std::chrono::steady_clock::time_point m_start;
    bool m_stopped = false;
    double m_duration = 0.0;
};

#define ORDERING_PROFILE_CONCAT_(a, b) a##b
#define ORDERING_PROFILE_CONCAT(a, b) ORDERING_PROFILE_CONCAT_(a, b)
#define ORDERING_PROFILE_SCOPE(name) \
    ordering::common::ScopedTimer ORDERING_PROFILE_CONCAT(_ordering_timer_, __LINE__)(name)

} // namespace common
} // namespace ordering
