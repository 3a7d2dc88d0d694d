#pragma once

#include "server/Channel.hpp"
#include "server/ServerContext.hpp"
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <string>

namespace inventory {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

/**
 * WebSocket import channel (/ws/upload).
 *
 * Created from an HTTP upgrade request. Inbound text frames go to the
 * ImportController; send() may be called from any thread and writes are
 * serialized on the connection's strand in call order.
 */
class WebSocketSession : public Channel,
                         public std::enable_shared_from_this<WebSocketSession> {
public:
    WebSocketSession(tcp::socket&& socket,
                     http::request<http::string_body> upgrade,
                     ServerContext& context);

    /**
     * Run the handshake asynchronously, then register with the
     * ConnectionRegistry and start reading
     */
    void run();

    const std::string& id() const override { return m_id; }
    void accept() override;
    bool send(std::string text) override;
    bool isOpen() const override { return m_open; }

private:
    void start();
    void onAccept(beast::error_code ec);
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes_transferred);
    void doWrite();
    void onWrite(beast::error_code ec, std::size_t bytes_transferred);
    void onClosed(const std::string& reason);

    std::string m_id;
    websocket::stream<beast::tcp_stream> m_ws;
    http::request<http::string_body> m_upgrade;
    beast::flat_buffer m_buffer;
    ServerContext& m_context;

    // Only touched on the stream's strand
    std::deque<std::string> m_writeQueue;

    bool m_handshakeDone = false;
    std::atomic<bool> m_open{false};
};

} // namespace server
} // namespace inventory
