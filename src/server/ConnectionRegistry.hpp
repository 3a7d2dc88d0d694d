#pragma once

#include "server/Channel.hpp"
#include "ingest/ProgressEvent.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace inventory {
namespace server {

/**
 * Set of live duplex channels. Pure connection bookkeeping, no import
 * state; safe to share between concurrently running import sessions.
 */
class ConnectionRegistry {
public:
    ConnectionRegistry() = default;
    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /**
     * Confirm the channel's handshake through Channel::accept(), then add
     * it to the live set. If accept() throws, the channel is not added and
     * the exception propagates.
     */
    void registerChannel(const ChannelPtr& channel);

    /**
     * Remove a channel. Unknown ids are ignored; returns whether it was present.
     */
    bool unregisterChannel(const std::string& channelId);

    /**
     * Serialize and send one event to one channel. Delivery to a channel
     * that is no longer registered, or already closed, is a no-op that
     * returns false.
     */
    bool emit(const std::string& channelId, const ingest::ProgressEvent& event);

    bool contains(const std::string& channelId) const;
    size_t connectionCount() const;
    std::vector<std::string> channelIds() const;

    /**
     * Random id: ch_<16 hex chars>
     */
    static std::string generateChannelId();

private:
    std::unordered_map<std::string, ChannelPtr> m_channels;
    mutable std::mutex m_mutex;
};

} // namespace server
} // namespace inventory
