#include "websocket_session.hpp"
#include "relay_protocol.hpp"
#include "logger.hpp"
#include "metrics.hpp"

namespace tether {

WebSocketSession::WebSocketSession(TlsSocket&& socket, const ServerConfig& config)
    : ws_(std::in_place_index<0>, std::move(socket)), config_(config) {
    configure();
}

// Plaintext, behind a TLS-terminating proxy or in development.
WebSocketSession::WebSocketSession(PlainSocket&& socket, const ServerConfig& config)
    : ws_(std::in_place_index<1>, std::move(socket)), config_(config) {
    configure();
}

WebSocketSession::~WebSocketSession() {
    closed();
}

void WebSocketSession::configure() {
    with_stream([this](auto& ws) {
        beast::error_code ec;
        auto ep = beast::get_lowest_layer(ws).socket().remote_endpoint(ec);
        remote_addr_ = ec ? "unknown" : ep.address().to_string();

        // Presence eviction is driven by the relay sweep. This timeout only
        // reaps sockets that stopped answering pings.
        websocket::stream_base::timeout opt{};
        opt.handshake_timeout = std::chrono::seconds(15);
        opt.idle_timeout = std::chrono::seconds(config_.connection_timeout_sec * 5);
        opt.keep_alive_pings = true;
        ws.set_option(opt);
        beast::get_lowest_layer(ws).expires_never();

        ws.read_message_max(config_.max_message_size);
        ws.text(true);
    });
}

void WebSocketSession::start(http::request<http::string_body>&& upgrade) {
    auto req = std::make_shared<http::request<http::string_body>>(std::move(upgrade));
    with_stream([self = shared_from_this(), req](auto& ws) {
        ws.async_accept(*req, [self, req](beast::error_code ec) {
            if (ec) {
                Logger::log(Logger::Level::WARNING, Logger::EventType::CONNECTION, self->remote_addr_,
                            "WebSocket accept failed: " + ec.message());
                self->closed();
                return;
            }
            self->touch();
            self->read_next();
        });
    });
}

void WebSocketSession::read_next() {
    with_stream([self = shared_from_this()](auto& ws) {
        ws.async_read(self->buffer_, [self](beast::error_code ec, std::size_t bytes) {
            self->on_read(ec, bytes);
        });
    });
}

void WebSocketSession::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec) {
        if (ec != websocket::error::closed && ec != net::error::operation_aborted) {
            Logger::log(Logger::Level::DEBUG, Logger::EventType::CONNECTION, remote_addr_,
                        "Read ended: " + ec.message());
        }
        closed();
        return;
    }

    touch();
    bool binary = with_stream([](auto& ws) { return ws.got_binary(); });
    std::string text = beast::buffers_to_string(beast::buffers_prefix(bytes, buffer_.data()));
    buffer_.consume(bytes);

    if (binary) {
        MetricsRegistry::instance().increment_counter("tether_frame_errors_total");
        send_text(make_error_frame(error_code::VALIDATION_FAILED, "Binary frames are not supported"));
    } else if (frame_handler_) {
        frame_handler_(shared_from_this(), text);
    }

    if (!closing_) read_next();
}

void WebSocketSession::send_text(const std::string& message) {
    if (closing_) return;

    auto executor = with_stream([](auto& ws) { return ws.get_executor(); });
    net::post(executor, [self = shared_from_this(), message] {
        self->outbox_.push_back(message);
        if (!self->writing_) self->write_next();
    });
}

void WebSocketSession::write_next() {
    if (outbox_.empty()) {
        writing_ = false;
        if (closing_) finish_close();
        return;
    }

    writing_ = true;
    with_stream([self = shared_from_this()](auto& ws) {
        ws.async_write(net::buffer(self->outbox_.front()), [self](beast::error_code ec, std::size_t) {
            self->outbox_.pop_front();
            if (ec) {
                Logger::log(Logger::Level::WARNING, Logger::EventType::CONNECTION, self->remote_addr_,
                            "Write failed: " + ec.message());
                self->writing_ = false;
                self->closed();
                return;
            }
            self->write_next();
        });
    });
}

// Frames already queued (AUTH_FAILED, ERROR) are flushed before the close handshake.
void WebSocketSession::close() {
    if (closing_.exchange(true)) return;

    auto executor = with_stream([](auto& ws) { return ws.get_executor(); });
    net::post(executor, [self = shared_from_this()] {
        if (!self->writing_) self->finish_close();
    });
}

void WebSocketSession::finish_close() {
    with_stream([self = shared_from_this()](auto& ws) {
        ws.async_close(websocket::close_code::normal, [self](beast::error_code ec) {
            if (ec && ec != net::error::operation_aborted) {
                Logger::log(Logger::Level::DEBUG, Logger::EventType::CONNECTION, self->remote_addr_,
                            "Close failed: " + ec.message());
            }
            self->closed();
        });
    });
}

void WebSocketSession::closed() {
    if (closed_.exchange(true)) return;
    if (closed_handler_) closed_handler_(this);
    frame_handler_ = nullptr;
    closed_handler_ = nullptr;
}

}
