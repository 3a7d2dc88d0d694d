#include "server/WebSocketSession.hpp"
#include "server/ConnectionRegistry.hpp"
#include "server/ImportController.hpp"
#include "server/Logger.hpp"
#include <stdexcept>

namespace inventory {
namespace server {

WebSocketSession::WebSocketSession(tcp::socket&& socket,
                                   http::request<http::string_body> upgrade,
                                   ServerContext& context)
    : m_id(ConnectionRegistry::generateChannelId())
    , m_ws(std::move(socket))
    , m_upgrade(std::move(upgrade))
    , m_context(context)
{
}

void WebSocketSession::run() {
    net::dispatch(
        m_ws.get_executor(),
        beast::bind_front_handler(&WebSocketSession::start, shared_from_this()));
}

void WebSocketSession::start() {
    // Imports are long-lived; only the websocket handshake and idle timeouts apply
    beast::get_lowest_layer(m_ws).expires_never();
    m_ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    m_ws.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) {
            res.set(http::field::server, "InventoryServer/1.0");
        }));

    m_ws.async_accept(
        m_upgrade,
        beast::bind_front_handler(&WebSocketSession::onAccept, shared_from_this()));
}

void WebSocketSession::onAccept(beast::error_code ec) {
    if (ec) {
        LOG_WARN("[" + m_id + "] handshake failed: " + ec.message());
        return;
    }

    m_ws.text(true);
    m_handshakeDone = true;

    try {
        m_context.registry.registerChannel(shared_from_this());
    } catch (const std::exception& e) {
        LOG_ERROR("[" + m_id + "] registration failed: " + std::string(e.what()));
        return;
    }

    doRead();
}

void WebSocketSession::accept() {
    if (!m_handshakeDone) {
        throw std::runtime_error("WebSocket handshake has not completed");
    }
    m_open = true;
}

void WebSocketSession::doRead() {
    m_ws.async_read(
        m_buffer,
        beast::bind_front_handler(&WebSocketSession::onRead, shared_from_this()));
}

void WebSocketSession::onRead(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec == websocket::error::closed) {
        return onClosed("closed by client");
    }

    if (ec) {
        return onClosed("read error: " + ec.message());
    }

    std::string text = beast::buffers_to_string(m_buffer.data());
    m_buffer.consume(m_buffer.size());

    m_context.controller.handleMessage(shared_from_this(), text);

    doRead();
}

bool WebSocketSession::send(std::string text) {
    if (!m_open) {
        return false;
    }

    net::post(
        m_ws.get_executor(),
        [self = shared_from_this(), text = std::move(text)]() mutable {
            if (!self->m_open) return;
            self->m_writeQueue.push_back(std::move(text));
            if (self->m_writeQueue.size() == 1) {
                self->doWrite();
            }
        });
    return true;
}

void WebSocketSession::doWrite() {
    m_ws.async_write(
        net::buffer(m_writeQueue.front()),
        beast::bind_front_handler(&WebSocketSession::onWrite, shared_from_this()));
}

void WebSocketSession::onWrite(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        return onClosed("write error: " + ec.message());
    }

    m_writeQueue.pop_front();
    if (!m_writeQueue.empty()) {
        doWrite();
    }
}

void WebSocketSession::onClosed(const std::string& reason) {
    // A write may still be in flight; its buffer stays in the queue until
    // the completion handler reports the error
    m_open = false;

    if (m_context.registry.unregisterChannel(m_id)) {
        m_context.controller.onChannelClosed(m_id);
        LOG_DEBUG("[" + m_id + "] " + reason);
    }
}

} // namespace server
} // namespace inventory
