#include "Profiler.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace ordering {
namespace common {

Profiler& Profiler::instance() {
    static Profiler instance;
    return instance;
}

void Profiler::record(const std::string& phase, double durationMs) {
    if (!m_enabled) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    Stats& stats = m_stats[phase];
    stats.count++;
    stats.totalMs += durationMs;
    stats.minMs = std::min(stats.minMs, durationMs);
    stats.maxMs = std::max(stats.maxMs, durationMs);
}

Profiler::Stats Profiler::getStats(const std::string& phase) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_stats.find(phase);
    if (it != m_stats.end()) {
        return it->second;
    }
    return Stats{};
}

std::unordered_map<std::string, Profiler::Stats> Profiler::getAllStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void Profiler::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats.clear();
}

std::string Profiler::formatStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_stats.empty()) {
        return "No profiling data available.";
    }

    std::ostringstream oss;
    oss << "\n============= ORDERING PHASES =============\n";
    oss << std::left << std::setw(20) << "Phase"
        << std::right << std::setw(10) << "Count"
        << std::setw(12) << "Total(ms)"
        << std::setw(12) << "Avg(ms)"
        << std::setw(12) << "Max(ms)"
        << "\n";
    oss << std::string(66, '-') << "\n";

    std::vector<std::pair<std::string, Stats>> sorted(m_stats.begin(), m_stats.end());
    std::sort(sorted.begin(), sorted.end(),
        [](const auto& a, const auto& b) { return a.second.totalMs > b.second.totalMs; });

    for (const auto& [phase, stats] : sorted) {
        oss << std::left << std::setw(20) << phase
            << std::right << std::setw(10) << stats.count
            << std::setw(12) << std::fixed << std::setprecision(3) << stats.totalMs
            << std::setw(12) << stats.avgMs()
            << std::setw(12) << stats.maxMs
            << "\n";
    }
    oss << std::string(66, '=') << "\n";

    return oss.str();
}

} // namespace common
} // namespace ordering
