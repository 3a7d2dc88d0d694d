#pragma once

#include "ingest/Types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace inventory {
namespace ingest {

struct ImportCounters {
    size_t created = 0;
    size_t updated = 0;
    size_t skipped = 0;

    size_t written() const { return created + updated; }
};

/**
 * State of one import run on one channel: counters, row errors and the
 * progress high-water mark. Owned by the import controller for the run's
 * duration, never shared between channels.
 */
class ImportSession {
public:
    static constexpr size_t kDefaultChunkSize = 10;
    static constexpr size_t kReportedErrorLimit = 10;

    ImportSession(std::string channelId, size_t totalRows, ResolutionPolicy policy,
                  size_t chunkSize = kDefaultChunkSize);

    const std::string& id() const { return m_id; }
    const std::string& channelId() const { return m_channelId; }
    size_t totalRows() const { return m_totalRows; }
    size_t chunkSize() const { return m_chunkSize; }
    size_t chunkCount() const;
    ResolutionPolicy policy() const { return m_policy; }

    ImportCounters& counters() { return m_counters; }
    const ImportCounters& counters() const { return m_counters; }

    void recordError(std::string message);
    size_t errorCount() const { return m_errors.size(); }
    const std::vector<std::string>& errors() const { return m_errors; }

    /**
     * First kReportedErrorLimit messages
     */
    std::vector<std::string> reportedErrors() const;

    /**
     * Raise the progress to `percent` (clamped to 0-100) unless it is
     * already higher. Returns the resulting progress.
     */
    int advanceProgress(int percent);
    int progress() const { return m_progress; }

    /**
     * {created, updated, skipped, errors}
     */
    nlohmann::json countersJson() const;

    /**
     * {total_rows, created, updated, skipped, errors_count, errors}
     */
    nlohmann::json summaryJson() const;

    /**
     * Random id: imp_<16 hex chars>
     */
    static std::string generateId();

private:
    std::string m_id;
    std::string m_channelId;
    size_t m_totalRows;
    size_t m_chunkSize;
    ResolutionPolicy m_policy;
    ImportCounters m_counters;
    std::vector<std::string> m_errors;
    int m_progress = 0;
};

} // namespace ingest
} // namespace inventory
