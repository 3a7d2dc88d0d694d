#include "server/Profiler.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace inventory {
namespace server {

Profiler& Profiler::instance() {
    static Profiler instance;
    return instance;
}

void Profiler::record(const std::string& name, double durationMs) {
    if (!m_enabled) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    auto& stats = m_stats[name];
    stats.count++;
    stats.totalMs += durationMs;
    stats.minMs = std::min(stats.minMs, durationMs);
    stats.maxMs = std::max(stats.maxMs, durationMs);
}

Profiler::Stats Profiler::getStats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_stats.find(name);
    return it != m_stats.end() ? it->second : Stats{};
}

std::map<std::string, Profiler::Stats> Profiler::getAllStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void Profiler::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats.clear();
}

std::string Profiler::formatStats() const {
    auto stats = getAllStats();

    std::ostringstream oss;
    oss << "=== Profiler ===\n";
    if (stats.empty()) {
        oss << "(no samples)\n";
        return oss.str();
    }

    oss << std::left << std::setw(28) << "operation"
        << std::right << std::setw(8) << "count"
        << std::setw(12) << "avg ms"
        << std::setw(12) << "min ms"
        << std::setw(12) << "max ms" << "\n";

    oss << std::fixed << std::setprecision(2);
    for (const auto& [name, s] : stats) {
        oss << std::left << std::setw(28) << name
            << std::right << std::setw(8) << s.count
            << std::setw(12) << s.avgMs()
            << std::setw(12) << s.minMs
            << std::setw(12) << s.maxMs << "\n";
    }
    return oss.str();
}

} // namespace server
} // namespace inventory
