#include "http_session.hpp"
#include "websocket_session.hpp"
#include "connection_manager.hpp"
#include "message_relay.hpp"
#include "redis_manager.hpp"
#include "relay_protocol.hpp"
#include "logger.hpp"
#include "metrics.hpp"

#include <boost/beast/websocket.hpp>
#include <string_view>

namespace tether {

namespace {

std::string peer_of(beast::tcp_stream& s) {
    beast::error_code ec;
    auto ep = s.socket().remote_endpoint(ec);
    return ec ? "unknown" : ep.address().to_string();
}

std::string_view path_only(std::string_view target) {
    return target.substr(0, target.find('?'));
}

bool is_loopback(const std::string& addr) {
    return addr == "127.0.0.1" || addr == "::1";
}

}

HttpSession::HttpSession(TlsSocket&& socket, HttpServices services, std::shared_ptr<void> slot)
    : stream_(std::in_place_index<0>, std::move(socket)),
      services_(services),
      health_(services.config, services.connections, services.presence),
      sync_(services.config, services.redis, services.redis, services.redis),
      slot_(std::move(slot)) {
    remote_addr_ = peer_of(beast::get_lowest_layer(std::get<0>(stream_)));
}

HttpSession::HttpSession(PlainSocket&& socket, HttpServices services, std::shared_ptr<void> slot)
    : stream_(std::in_place_index<1>, std::move(socket)),
      services_(services),
      health_(services.config, services.connections, services.presence),
      sync_(services.config, services.redis, services.redis, services.redis),
      slot_(std::move(slot)) {
    remote_addr_ = peer_of(std::get<1>(stream_));
}

void HttpSession::run() {
    if (stream_.index() == 1) {
        read_request();
        return;
    }

    auto& tls = std::get<0>(stream_);
    beast::get_lowest_layer(tls).expires_after(std::chrono::seconds(services_.config.connection_timeout_sec));
    tls.async_handshake(ssl::stream_base::server, [self = shared_from_this()](beast::error_code ec) {
        if (ec) {
            Logger::log(Logger::Level::DEBUG, Logger::EventType::CONNECTION, self->remote_addr_,
                        "TLS handshake failed: " + ec.message());
            return;
        }
        self->read_request();
    });
}

void HttpSession::read_request() {
    parser_.emplace();
    parser_->body_limit(services_.config.max_message_size);

    with_stream([self = shared_from_this()](auto& s) {
        beast::get_lowest_layer(s).expires_after(std::chrono::seconds(self->services_.config.connection_timeout_sec));
        http::async_read(s, self->buffer_, *self->parser_,
                         [self](beast::error_code ec, std::size_t) { self->on_request(ec); });
    });
}

void HttpSession::on_request(beast::error_code ec) {
    if (ec == http::error::body_limit) {
        MetricsRegistry::instance().increment_counter("tether_http_oversized_total");
        reply(make_error_response(http::status::payload_too_large, 11, "Request body too large"));
        return;
    }
    if (ec) return;  // end_of_stream, timeout or reset

    req_ = parser_->release();
    MetricsRegistry::instance().increment_counter("tether_http_requests_total");

    if (beast::websocket::is_upgrade(req_)) {
        std::string_view target(req_.target().data(), req_.target().size());
        if (path_only(target) == "/ws") {
            upgrade();
        } else {
            reply(make_error_response(http::status::not_found, req_.version(), "Not Found"));
        }
        return;
    }
    reply(route(req_));
}

http::response<http::string_body> HttpSession::route(const http::request<http::string_body>& req) {
    std::string_view path = path_only(std::string_view(req.target().data(), req.target().size()));
    const bool get = req.method() == http::verb::get;

    if (req.method() == http::verb::options) {
        http::response<http::string_body> res{http::status::no_content, req.version()};
        res.prepare_payload();
        return res;
    }
    if (path == "/health" && get) {
        return health_.handle_health(req.version(), services_.redis.is_connected());
    }
    if (path == "/stats" && get && admin_allowed(req)) {
        return health_.handle_stats(req);
    }
    if (path == "/metrics" && get && admin_allowed(req)) {
        return health_.handle_metrics(req.version());
    }
    if (path.substr(0, 4) == "/v1/") {
        return sync_.handle(req);
    }
    // Operator endpoints answer 404 rather than 403 to unauthorized callers.
    return make_error_response(http::status::not_found, req.version(), "Not Found");
}

bool HttpSession::admin_allowed(const http::request<http::string_body>& req) {
    return is_loopback(remote_addr_) || health_.verify_admin_request(req);
}

void HttpSession::decorate(http::response<http::string_body>& res) const {
    res.set(http::field::server, "tether-relay");
    res.set("X-Content-Type-Options", "nosniff");
    res.set("Referrer-Policy", "no-referrer");
    res.set("Content-Security-Policy", "default-src 'none'; frame-ancestors 'none'");
    if (services_.config.enable_tls) {
        res.set("Strict-Transport-Security", "max-age=31536000; includeSubDomains");
    }

    auto origin_it = req_.find(http::field::origin);
    if (origin_it == req_.end()) return;
    std::string origin(origin_it->value());
    for (const auto& allowed : services_.config.allowed_origins) {
        if (allowed == "*" || allowed == origin) {
            res.set(http::field::access_control_allow_origin, origin);
            res.set(http::field::access_control_allow_methods, "GET, POST, DELETE, OPTIONS");
            res.set(http::field::access_control_allow_headers,
                    "Content-Type, Authorization, X-Device-Id, X-Admin-Token");
            res.set(http::field::vary, "Origin");
            return;
        }
    }
}

void HttpSession::reply(http::response<http::string_body>&& res) {
    decorate(res);
    res.keep_alive(req_.keep_alive());

    auto msg = std::make_shared<http::response<http::string_body>>(std::move(res));
    with_stream([self = shared_from_this(), msg](auto& s) {
        http::async_write(s, *msg, [self, msg](beast::error_code ec, std::size_t) {
            if (ec) {
                Logger::log(Logger::Level::DEBUG, Logger::EventType::CONNECTION, self->remote_addr_,
                            "HTTP write failed: " + ec.message());
                return;
            }
            if (msg->need_eof()) {
                self->with_stream([](auto& stream) {
                    beast::error_code ignored;
                    beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_send, ignored);
                });
                return;
            }
            self->read_request();
        });
    });
}

// The socket moves into a WebSocketSession; this HttpSession ends afterwards.
void HttpSession::upgrade() {
    auto ws = std::visit(
        [this](auto& s) { return std::make_shared<WebSocketSession>(std::move(s), services_.config); }, stream_);
    ws->hold(std::move(slot_));

    MessageRelay* relay = &services_.relay;
    ws->on_frame([relay](const std::shared_ptr<WebSocketSession>& session, const std::string& text) {
        try {
            relay->handle_frame(session, text);
        } catch (const std::exception& e) {
            Logger::log(Logger::Level::ERROR, Logger::EventType::SYSTEM, session->remote_address(),
                        std::string("Frame handling failed: ") + e.what());
            session->send_text(make_error_frame(error_code::VALIDATION_FAILED, "Internal error"));
        }
    });
    ws->on_closed([relay](WebSocketSession* session) { relay->on_disconnect(session, "disconnected"); });

    parser_.reset();
    ws->start(std::move(req_));
}

}
