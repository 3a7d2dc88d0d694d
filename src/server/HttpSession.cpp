#include "server/HttpSession.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"
#include "server/RequestHandler.hpp"
#include "server/WebSocketSession.hpp"
#include <boost/beast/websocket.hpp>

namespace inventory {
namespace server {

namespace {

void setCommonHeaders(http::response<http::string_body>& res) {
    res.set(http::field::server, "InventoryServer/1.0");
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
}

// JSON body with CORS headers, logged against the request id
http::response<http::string_body> makeJsonResponse(
    http::status status,
    const json& body,
    unsigned version,
    bool keepAlive,
    uint64_t requestId)
{
    http::response<http::string_body> res{status, version};
    setCommonHeaders(res);
    res.set(http::field::content_type, "application/json");
    res.set(http::field::cache_control, "no-store");
    res.keep_alive(keepAlive);
    res.body() = body.dump();
    res.prepare_payload();

    Logger::instance().logResponse(requestId, static_cast<int>(status), res.body(), res.body().size());

    return res;
}

} // anonymous namespace

HttpSession::HttpSession(tcp::socket socket, ServerContext& context)
    : m_stream(std::move(socket))
    , m_context(context)
{
}

void HttpSession::run() {
    net::dispatch(
        m_stream.get_executor(),
        beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
    m_parser.emplace();
    // Headroom above the upload limit so oversized uploads get a JSON 400
    // from the handler instead of a dropped connection
    m_parser->body_limit(m_context.handler.maxUploadBytes() * 2 + 64 * 1024);
    m_stream.expires_after(std::chrono::seconds(30));

    http::async_read(
        m_stream,
        m_buffer,
        *m_parser,
        beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec == http::error::end_of_stream) {
        return doClose();
    }

    if (ec == http::error::body_limit) {
        uint64_t requestId = Logger::instance().logRequest("?", "(body too large)");
        auto res = makeJsonResponse(
            http::status::payload_too_large,
            json{{"status", "error"}, {"message", "Request body too large"}},
            11, false, requestId);
        return sendResponse(std::move(res));
    }

    if (ec) {
        LOG_ERROR("Read error: " + ec.message());
        return;
    }

    auto req = m_parser->release();

    if (beast::websocket::is_upgrade(req)) {
        return upgradeToChannel(std::move(req));
    }

    sendResponse(handleRequest(std::move(req)));
}

void HttpSession::upgradeToChannel(http::request<http::string_body>&& req) {
    std::string target(req.target());
    auto path = RequestHandler::splitTarget(target).first;

    if (path != kUploadChannelPath) {
        uint64_t requestId = Logger::instance().logRequest("UPGRADE", target);
        return sendResponse(makeJsonResponse(
            http::status::not_found,
            json{{"status", "error"}, {"message", "No channel at " + target}},
            req.version(), false, requestId));
    }

    std::make_shared<WebSocketSession>(m_stream.release_socket(), std::move(req), m_context)->run();
}

void HttpSession::sendResponse(http::response<http::string_body> response) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(response));
    bool needEof = sp->need_eof();

    http::async_write(
        m_stream,
        *sp,
        [self = shared_from_this(), sp, needEof](beast::error_code ec, std::size_t bytes) {
            self->onWrite(needEof, ec, bytes);
        });
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        LOG_ERROR("Write error: " + ec.message());
        return;
    }

    if (close) {
        return doClose();
    }

    doRead();
}

void HttpSession::doClose() {
    beast::error_code ec;
    m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

http::response<http::string_body> HttpSession::handleRequest(
    http::request<http::string_body>&& req)
{
    auto& logger = Logger::instance();
    std::string target(req.target());
    std::string method(req.method_string());

    uint64_t requestId = logger.logRequest(method, target, req.body());

    // CORS preflight
    if (req.method() == http::verb::options) {
        http::response<http::string_body> res{http::status::ok, req.version()};
        setCommonHeaders(res);
        res.keep_alive(req.keep_alive());
        res.prepare_payload();
        logger.logResponse(requestId, 200, "", 0);
        return res;
    }

    std::string contentType;
    auto it = req.find(http::field::content_type);
    if (it != req.end()) {
        contentType = std::string(it->value());
    }

    try {
        PROFILE_SCOPE("http.request");
        auto [code, body] = m_context.handler.route(method, target, req.body(), contentType);
        return makeJsonResponse(
            static_cast<http::status>(code), body,
            req.version(), req.keep_alive(), requestId);

    } catch (const std::exception& e) {
        LOG_ERROR("Unhandled error on " + method + " " + target + ": " + e.what());
        return makeJsonResponse(
            http::status::internal_server_error,
            json{{"status", "error"}, {"message", e.what()}},
            req.version(),
            req.keep_alive(),
            requestId);
    }
}

} // namespace server
} // namespace inventory
