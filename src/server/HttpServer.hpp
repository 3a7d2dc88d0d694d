#pragma once

#include "server/ServerContext.hpp"
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <string>

namespace inventory {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

/**
 * HTTP + WebSocket server based on Boost.Beast
 */
class HttpServer {
public:
    HttpServer(net::io_context& ioc, const std::string& address, unsigned short port,
               ServerContext& context);

    void run();
    void stop();

    unsigned short port() const;

private:
    void doAccept();

    net::io_context& m_ioc;
    tcp::acceptor m_acceptor;
    ServerContext& m_context;
    bool m_running;
};

} // namespace server
} // namespace inventory
