#include "server/ConnectionRegistry.hpp"
#include "server/Logger.hpp"
#include <iomanip>
#include <random>
#include <sstream>

namespace inventory {
namespace server {

std::string ConnectionRegistry::generateChannelId() {
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
    ss << "ch_" << std::hex << std::setfill('0') << std::setw(16) << value;
    return ss.str();
}

void ConnectionRegistry::registerChannel(const ChannelPtr& channel) {
    channel->accept();

    size_t total;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_channels[channel->id()] = channel;
        total = m_channels.size();
    }

    LOG_INFO("Channel connected: " + channel->id() + " (total: " + std::to_string(total) + ")");
}

bool ConnectionRegistry::unregisterChannel(const std::string& channelId) {
    size_t total;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_channels.erase(channelId) == 0) {
            return false;
        }
        total = m_channels.size();
    }

    LOG_INFO("Channel disconnected: " + channelId + " (total: " + std::to_string(total) + ")");
    return true;
}

bool ConnectionRegistry::emit(const std::string& channelId, const ingest::ProgressEvent& event) {
    ChannelPtr channel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_channels.find(channelId);
        if (it != m_channels.end()) {
            channel = it->second;
        }
    }

    if (!channel) {
        LOG_DEBUG("Dropping " + event.typeName() + " event for unregistered channel " + channelId);
        return false;
    }

    std::string payload = event.toJson().dump();
    Logger::instance().logChannel(channelId, "->", payload);

    if (!channel->send(std::move(payload))) {
        LOG_DEBUG("Dropping " + event.typeName() + " event for closed channel " + channelId);
        return false;
    }
    return true;
}

bool ConnectionRegistry::contains(const std::string& channelId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channels.find(channelId) != m_channels.end();
}

size_t ConnectionRegistry::connectionCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channels.size();
}

std::vector<std::string> ConnectionRegistry::channelIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> ids;
    ids.reserve(m_channels.size());
    for (const auto& [id, channel] : m_channels) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace server
} // namespace inventory
