#pragma once

#include <memory>
#include <string>

namespace inventory {
namespace server {

/**
 * A persistent duplex connection to one client
 */
class Channel {
public:
    virtual ~Channel() = default;

    virtual const std::string& id() const = 0;

    /**
     * Called on registration. Throws if the opening handshake did not
     * complete; the channel is open afterwards.
     */
    virtual void accept() = 0;

    /**
     * Queue one text message. Messages are delivered in the order send()
     * is called. Returns false (and drops the message) once the channel
     * is closed.
     */
    virtual bool send(std::string text) = 0;

    virtual bool isOpen() const = 0;
};

using ChannelPtr = std::shared_ptr<Channel>;

} // namespace server
} // namespace inventory
