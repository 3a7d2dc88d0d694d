#include "server/HttpServer.hpp"
#include "server/HttpSession.hpp"
#include "server/Logger.hpp"

namespace inventory {
namespace server {

HttpServer::HttpServer(net::io_context& ioc, const std::string& address, unsigned short port,
                       ServerContext& context)
    : m_ioc(ioc)
    , m_acceptor(net::make_strand(ioc))
    , m_context(context)
    , m_running(false)
{
    beast::error_code ec;

    auto endpoint = tcp::endpoint(net::ip::make_address(address, ec), port);
    if (ec) {
        throw std::runtime_error("Invalid address '" + address + "': " + ec.message());
    }

    m_acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open acceptor: " + ec.message());
    }

    m_acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        throw std::runtime_error("Failed to set reuse_address: " + ec.message());
    }

    m_acceptor.bind(endpoint, ec);
    if (ec) {
        throw std::runtime_error("Failed to bind: " + ec.message());
    }

    m_acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        throw std::runtime_error("Failed to listen: " + ec.message());
    }

    LOG_INFO("Server listening on http://" + address + ":" + std::to_string(this->port()) +
             " (import channel at ws://" + address + ":" + std::to_string(this->port()) + "/ws/upload)");
}

unsigned short HttpServer::port() const {
    beast::error_code ec;
    auto endpoint = m_acceptor.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void HttpServer::run() {
    m_running = true;
    doAccept();
}

void HttpServer::stop() {
    m_running = false;
    beast::error_code ec;
    m_acceptor.close(ec);
}

void HttpServer::doAccept() {
    if (!m_running) return;

    m_acceptor.async_accept(
        net::make_strand(m_ioc),
        [this](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec != net::error::operation_aborted) {
                    LOG_WARN("Accept failed: " + ec.message());
                }
            } else {
                std::make_shared<HttpSession>(std::move(socket), m_context)->run();
            }

            if (m_running) {
                doAccept();
            }
        });
}

} // namespace server
} // namespace inventory
