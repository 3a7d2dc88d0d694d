#pragma once

#include "server/ServerContext.hpp"
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <optional>
#include <string>

namespace inventory {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

/**
 * HTTP session - one client connection. Hands the socket over to a
 * WebSocketSession when the client upgrades on /ws/upload.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    static constexpr const char* kUploadChannelPath = "/ws/upload";

    HttpSession(tcp::socket socket, ServerContext& context);

    void run();

private:
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes_transferred);
    void sendResponse(http::response<http::string_body> response);
    void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void doClose();

    http::response<http::string_body> handleRequest(
        http::request<http::string_body>&& req);
    void upgradeToChannel(http::request<http::string_body>&& req);

    beast::tcp_stream m_stream;
    beast::flat_buffer m_buffer;
    std::optional<http::request_parser<http::string_body>> m_parser;
    ServerContext& m_context;
};

} // namespace server
} // namespace inventory
