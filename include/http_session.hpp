#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "server_config.hpp"
#include "handlers/health_handler.hpp"
#include "handlers/sync_handler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace tether {

class MessageRelay;
class RedisManager;

// Services shared by every HTTP connection.
struct HttpServices {
    const ServerConfig& config;
    ConnectionManager& connections;
    PresenceRegistry& presence;
    MessageRelay& relay;
    RedisManager& redis;
};

/**
 * One accepted TCP connection. Serves /health, /stats, /metrics and the /v1 cloud
 * API with keep-alive, and hands a websocket upgrade on /ws to a WebSocketSession
 * wired to the relay.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    using TlsSocket = beast::ssl_stream<beast::tcp_stream>;
    using PlainSocket = beast::tcp_stream;

    HttpSession(TlsSocket&& socket, HttpServices services, std::shared_ptr<void> slot);
    HttpSession(PlainSocket&& socket, HttpServices services, std::shared_ptr<void> slot);

    void run();

private:
    template<class F>
    decltype(auto) with_stream(F&& f) {
        return std::visit(std::forward<F>(f), stream_);
    }

    void read_request();
    void on_request(beast::error_code ec);
    http::response<http::string_body> route(const http::request<http::string_body>& req);
    void reply(http::response<http::string_body>&& res);
    void upgrade();

    bool admin_allowed(const http::request<http::string_body>& req);
    void decorate(http::response<http::string_body>& res) const;

    std::variant<TlsSocket, PlainSocket> stream_;
    HttpServices services_;
    HealthHandler health_;
    SyncHandler sync_;

    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    http::request<http::string_body> req_;

    std::string remote_addr_;
    std::shared_ptr<void> slot_;
};

}
