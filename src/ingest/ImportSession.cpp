#include "ingest/ImportSession.hpp"
#include <algorithm>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace inventory {
namespace ingest {

ImportSession::ImportSession(std::string channelId, size_t totalRows, ResolutionPolicy policy,
                             size_t chunkSize)
    : m_id(generateId())
    , m_channelId(std::move(channelId))
    , m_totalRows(totalRows)
    , m_chunkSize(chunkSize == 0 ? kDefaultChunkSize : chunkSize)
    , m_policy(policy)
{
}

size_t ImportSession::chunkCount() const {
    return (m_totalRows + m_chunkSize - 1) / m_chunkSize;
}

void ImportSession::recordError(std::string message) {
    m_errors.push_back(std::move(message));
}

std::vector<std::string> ImportSession::reportedErrors() const {
    size_t count = std::min(m_errors.size(), kReportedErrorLimit);
    return std::vector<std::string>(m_errors.begin(), m_errors.begin() + static_cast<std::ptrdiff_t>(count));
}

int ImportSession::advanceProgress(int percent) {
    percent = std::clamp(percent, 0, 100);
    m_progress = std::max(m_progress, percent);
    return m_progress;
}

nlohmann::json ImportSession::countersJson() const {
    return nlohmann::json{
        {"created", m_counters.created},
        {"updated", m_counters.updated},
        {"skipped", m_counters.skipped},
        {"errors", m_errors.size()}
    };
}

nlohmann::json ImportSession::summaryJson() const {
    return nlohmann::json{
        {"total_rows", m_totalRows},
        {"created", m_counters.created},
        {"updated", m_counters.updated},
        {"skipped", m_counters.skipped},
        {"errors_count", m_errors.size()},
        {"errors", reportedErrors()}
    };
}

std::string ImportSession::generateId() {
    static std::mutex mutex;
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint64_t> dis;

    uint64_t value;
    {
        std::lock_guard<std::mutex> lock(mutex);
        value = dis(gen);
    }

    std::stringstream ss;
    ss << "imp_" << std::hex << std::setfill('0') << std::setw(16) << value;
    return ss.str();
}

} // namespace ingest
} // namespace inventory
