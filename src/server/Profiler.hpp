#pragma once

#include <string>
#include <atomic>
#include <chrono>
#include <limits>
#include <map>
#include <mutex>

namespace inventory {
namespace server {

/**
 * Profiler - aggregates durations per named operation
 * (HTTP routes, classification passes, chunk commits)
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

    void record(const std::string& name, double durationMs);

    Stats getStats(const std::string& name) const;
    std::map<std::string, Stats> getAllStats() const;

    void reset();

    // One line per operation, sorted by name
    std::string formatStats() const;

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    std::atomic<bool> m_enabled{true};
    mutable std::mutex m_mutex;
    std::map<std::string, Stats> m_stats;
};

/**
 * RAII timer - records into the Profiler when stopped or destroyed
 */
class ScopedTimer {
public:
    explicit ScopedTimer(std::string name)
        : m_name(std::move(name))
        , m_start(std::chrono::steady_clock::now())
    {}

    ~ScopedTimer() {
        stop();
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double stop() {
        if (!m_stopped) {
            m_stopped = true;
            m_duration = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - m_start).count();
            Profiler::instance().record(m_name, m_duration);
        }
        return m_duration;
    }

    double duration() const { return m_duration; }

private:
    std::string m_name;
    std::chrono::steady_clock::time_point m_start;
    bool m_stopped = false;
    double m_duration = 0.0;
};

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)
#define PROFILE_SCOPE(name) inventory::server::ScopedTimer PROFILE_CONCAT(_profiler_, __LINE__)(name)

} // namespace server
} // namespace inventory
