#pragma once

#include "server_config.hpp"
#include "relay_peer.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/ssl.hpp>
#include <memory>
#include <string>
#include <functional>
#include <deque>
#include <variant>
#include <atomic>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace tether {

/**
 * Relay-side transport of one device. Text frames go to the frame handler; writes
 * are queued on the stream executor so send_text() may be called from any thread.
 * The closed handler runs exactly once, whichever side ends the connection.
 */
class WebSocketSession : public RelayPeer, public std::enable_shared_from_this<WebSocketSession> {
public:
    using FrameHandler = std::function<void(const std::shared_ptr<WebSocketSession>&, const std::string&)>;
    using ClosedHandler = std::function<void(WebSocketSession*)>;

    using TlsSocket = beast::ssl_stream<beast::tcp_stream>;
    using PlainSocket = beast::tcp_stream;

    WebSocketSession(TlsSocket&& socket, const ServerConfig& config);
    WebSocketSession(PlainSocket&& socket, const ServerConfig& config);
    ~WebSocketSession() override;

    // Completes the upgrade, then starts reading. Failure runs the closed handler.
    void start(http::request<http::string_body>&& upgrade);

    void send_text(const std::string& message) override;
    void close() override;
    std::string remote_address() const override { return remote_addr_; }

    void on_frame(FrameHandler handler) { frame_handler_ = std::move(handler); }
    void on_closed(ClosedHandler handler) { closed_handler_ = std::move(handler); }

    // Held until the session ends; releases the listener's socket slot.
    void hold(std::shared_ptr<void> slot) { slot_ = std::move(slot); }

private:
    using Ws = std::variant<websocket::stream<TlsSocket>, websocket::stream<PlainSocket>>;

    template<class F>
    decltype(auto) with_stream(F&& f) {
        return std::visit(std::forward<F>(f), ws_);
    }

    void configure();
    void read_next();
    void on_read(beast::error_code ec, std::size_t bytes);
    void write_next();
    void finish_close();
    void closed();

    Ws ws_;
    const ServerConfig& config_;
    std::string remote_addr_;

    beast::flat_buffer buffer_;
    std::deque<std::string> outbox_;  // executor-only
    bool writing_ = false;

    std::atomic<bool> closing_{false};
    std::atomic<bool> closed_{false};

    FrameHandler frame_handler_;
    ClosedHandler closed_handler_;
    std::shared_ptr<void> slot_;
};

}
