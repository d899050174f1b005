#include "relay_client.hpp"
#include "crypto.hpp"
#include "input_validator.hpp"
#include "logger.hpp"

#include <algorithm>
#include <deque>
#include <type_traits>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
namespace json = boost::json;
using tcp = net::ip::tcp;

namespace tether {

namespace {

using PlainStream = websocket::stream<beast::tcp_stream>;
using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

// One websocket connection attempt. A fresh link is created for every connect
// and reconnect; it never outlives its first close.
template <class Ws>
class WebSocketLink : public RelayLink, public std::enable_shared_from_this<WebSocketLink<Ws>> {
public:
    static constexpr bool secure = std::is_same_v<Ws, TlsStream>;

    template <class... StreamArgs>
    WebSocketLink(RelayClient::Strand& strand, const RelayClientConfig& config, Events events,
                  StreamArgs&&... args)
        : config_(config),
          events_(std::move(events)),
          resolver_(strand),
          ws_(strand, std::forward<StreamArgs>(args)...) {
        ws_.text(true);
    }

    void start() override {
        resolver_.async_resolve(config_.host, std::to_string(config_.port),
                                beast::bind_front_handler(&WebSocketLink::on_resolve, this->shared_from_this()));
    }

    void send(std::string frame) override {
        if (finished_ || closing_) return;
        queue_.push_back(std::move(frame));
        if (open_ && queue_.size() == 1) {
            do_write();
        }
    }

    void close() override {
        if (finished_ || closing_) return;
        closing_ = true;
        resolver_.cancel();
        if (!open_) {
            beast::get_lowest_layer(ws_).cancel();
            finish("closed before open");
            return;
        }
        // Pending frames such as LEAVE_SESSION go out before the close frame.
        if (queue_.empty()) {
            do_close();
        }
    }

private:
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail("resolve", ec);

        beast::get_lowest_layer(ws_).expires_after(config_.auth_timeout);
        beast::get_lowest_layer(ws_).async_connect(
            results, beast::bind_front_handler(&WebSocketLink::on_connect, this->shared_from_this()));
    }

    void on_connect(beast::error_code ec, const tcp::resolver::results_type::endpoint_type&) {
        if (ec) return fail("connect", ec);

        if constexpr (secure) {
            if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), config_.host.c_str())) {
                beast::error_code sni{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                return fail("sni", sni);
            }
            if (config_.verify_tls) {
                ws_.next_layer().set_verify_callback(ssl::host_name_verification(config_.host));
            }
            ws_.next_layer().async_handshake(
                ssl::stream_base::client,
                beast::bind_front_handler(&WebSocketLink::on_tls_handshake, this->shared_from_this()));
        } else {
            upgrade();
        }
    }

    void on_tls_handshake(beast::error_code ec) {
        if (ec) return fail("tls_handshake", ec);
        upgrade();
    }

    void upgrade() {
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, std::string("tether-agent/") + BOOST_BEAST_VERSION_STRING);
        }));

        ws_.async_handshake(config_.host + ":" + std::to_string(config_.port), config_.path,
                            beast::bind_front_handler(&WebSocketLink::on_handshake, this->shared_from_this()));
    }

    void on_handshake(beast::error_code ec) {
        if (ec) return fail("ws_handshake", ec);
        if (closing_) {
            do_close();
            return;
        }

        open_ = true;
        if (events_.on_open) events_.on_open();
        if (!queue_.empty()) do_write();
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&WebSocketLink::on_read, this->shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec == websocket::error::closed) {
                finish("closed by relay");
                return;
            }
            return fail("read", ec);
        }

        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        if (events_.on_message) events_.on_message(text);

        if (!finished_) do_read();
    }

    void do_write() {
        ws_.async_write(net::buffer(queue_.front()),
                        beast::bind_front_handler(&WebSocketLink::on_write, this->shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) return fail("write", ec);

        queue_.pop_front();
        if (!queue_.empty()) {
            do_write();
        } else if (closing_) {
            do_close();
        }
    }

    void do_close() {
        ws_.async_close(websocket::close_code::normal,
                        beast::bind_front_handler(&WebSocketLink::on_close, this->shared_from_this()));
    }

    void on_close(beast::error_code ec) {
        if (ec && ec != net::error::operation_aborted) {
            Logger::log(Logger::Level::DEBUG, Logger::EventType::CONNECTION, config_.host,
                        "Close handshake incomplete: " + ec.message());
        }
        finish("closed");
    }

    void fail(const char* what, beast::error_code ec) {
        if (finished_) return;
        if (ec != net::error::operation_aborted) {
            Logger::log(Logger::Level::WARNING, Logger::EventType::CONNECTION, config_.host,
                        std::string("Relay ") + what + " failed: " + ec.message());
        }
        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
        finish(std::string(what) + ": " + ec.message());
    }

    void finish(const std::string& reason) {
        if (finished_) return;
        finished_ = true;
        queue_.clear();
        if (events_.on_closed) events_.on_closed(reason);
    }

    RelayClientConfig config_;
    Events events_;
    tcp::resolver resolver_;
    Ws ws_;
    beast::flat_buffer buffer_;
    std::deque<std::string> queue_;
    bool open_ = false;
    bool closing_ = false;
    bool finished_ = false;
};

std::shared_ptr<RelayLink> make_websocket_link(RelayClient::Strand& strand, const RelayClientConfig& config,
                                               ssl::context& ssl_ctx, RelayLink::Events events) {
    if (config.use_tls) {
        return std::make_shared<WebSocketLink<TlsStream>>(strand, config, std::move(events), ssl_ctx);
    }
    return std::make_shared<WebSocketLink<PlainStream>>(strand, config, std::move(events));
}

const json::object& payload_of(const json::object& body) {
    static const json::object empty;
    auto it = body.find("payload");
    if (it == body.end() || !it->value().is_object()) return empty;
    return it->value().get_object();
}

}

const char* relay_error_name(RelayErrorCode code) {
    switch (code) {
        case RelayErrorCode::AuthFailed: return "AuthFailed";
        case RelayErrorCode::MaxReconnectExceeded: return "MaxReconnectExceeded";
        case RelayErrorCode::ConnectionTimeout: return "ConnectionTimeout";
        case RelayErrorCode::PermissionDenied: return "PermissionDenied";
        case RelayErrorCode::NotConnected: return "NotConnected";
        case RelayErrorCode::Validation: return "Validation";
        case RelayErrorCode::SessionNotFound: return "SessionNotFound";
        case RelayErrorCode::NotJoined: return "NotJoined";
        case RelayErrorCode::DeviceOffline: return "DeviceOffline";
    }
    return "Unknown";
}

RelayErrorCode relay_error_from_wire(std::string_view code) {
    if (code == error_code::AUTH_FAILED) return RelayErrorCode::AuthFailed;
    if (code == error_code::NOT_AUTHENTICATED) return RelayErrorCode::NotConnected;
    if (code == error_code::SESSION_NOT_FOUND) return RelayErrorCode::SessionNotFound;
    if (code == error_code::NOT_JOINED) return RelayErrorCode::NotJoined;
    if (code == error_code::PERMISSION_DENIED) return RelayErrorCode::PermissionDenied;
    if (code == error_code::DEVICE_OFFLINE) return RelayErrorCode::DeviceOffline;
    return RelayErrorCode::Validation;
}

RelayClient::RelayClient(net::io_context& ioc, RelayClientConfig config, LinkFactory factory)
    : strand_(net::make_strand(ioc)),
      config_(std::move(config)),
      factory_(std::move(factory)),
      ssl_ctx_(ssl::context::tls_client),
      fsm_(config_.max_reconnect_attempts),
      heartbeat_timer_(strand_),
      auth_timer_(strand_),
      reconnect_timer_(strand_) {
    if (config_.use_tls) {
        if (config_.verify_tls) {
            try {
                ssl_ctx_.set_default_verify_paths();
                ssl_ctx_.set_verify_mode(ssl::verify_peer);
            } catch (const std::exception& e) {
                Logger::log(Logger::Level::WARNING, Logger::EventType::CONNECTION, config_.host,
                            std::string("TLS trust store unavailable: ") + e.what());
            }
        } else {
            ssl_ctx_.set_verify_mode(ssl::verify_none);
        }
    }

    if (!factory_) {
        factory_ = [this](Strand& strand, RelayLink::Events events) {
            return make_websocket_link(strand, config_, ssl_ctx_, std::move(events));
        };
    }
}

RelayClient::~RelayClient() {
    if (link_) {
        net::post(strand_, [link = link_] { link->close(); });
    }
}

std::string RelayClient::device_id() const {
    std::lock_guard<std::mutex> lock(membership_mutex_);
    return device_id_;
}

std::vector<Participant> RelayClient::participants(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(membership_mutex_);
    auto it = memberships_.find(session_id);
    if (it == memberships_.end()) return {};
    return it->second.participants;
}

std::optional<Permission> RelayClient::permission(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(membership_mutex_);
    auto it = memberships_.find(session_id);
    if (it == memberships_.end()) return std::nullopt;
    return it->second.own_permission;
}

bool RelayClient::is_joined(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(membership_mutex_);
    return memberships_.count(session_id) > 0;
}

// --- Public API: everything is forwarded to the strand ---

void RelayClient::connect(const std::string& device_id, const std::string& device_token) {
    net::dispatch(strand_, [self = shared_from_this(), device_id, device_token] {
        std::string fingerprint = Crypto::sha256_hex(device_id + ":" + device_token);
        if (!self->fsm_.on_connect(fingerprint)) {
            if (self->fsm_.credential_rejected() && self->fsm_.state() != ConnectionState::Connecting &&
                self->fsm_.state() != ConnectionState::Authenticating &&
                self->fsm_.state() != ConnectionState::Connected) {
                self->report(RelayError(RelayErrorCode::AuthFailed, "credential was rejected by the relay"));
            } else {
                Logger::log(Logger::Level::DEBUG, Logger::EventType::CONNECTION, device_id,
                            "Connect ignored, connection already in progress");
            }
            return;
        }

        {
            std::lock_guard<std::mutex> lock(self->membership_mutex_);
            self->device_id_ = device_id;
        }
        self->device_token_ = device_token;
        self->stop_timers();
        self->do_connect();
    });
}

void RelayClient::disconnect() {
    net::dispatch(strand_, [self = shared_from_this()] {
        self->desired_.clear();
        self->do_disconnect();
    });
}

void RelayClient::join_session(const std::string& session_id, DeviceRole role, std::optional<Permission> permission) {
    net::dispatch(strand_, [self = shared_from_this(), session_id, role, permission] {
        self->desired_[session_id] = DesiredSession{role, permission};
        if (self->fsm_.state() == ConnectionState::Connected) {
            self->send_frame(make_join_session_frame(session_id, role, permission));
        }
    });
}

void RelayClient::leave_session(const std::string& session_id) {
    net::dispatch(strand_, [self = shared_from_this(), session_id] { self->do_leave(session_id); });
}

void RelayClient::send_envelope(const EncryptedEnvelope& envelope, const std::string& target_device_id) {
    if (state() != ConnectionState::Connected) {
        throw RelayError(RelayErrorCode::NotConnected, "relay connection is not authenticated", envelope.session_id);
    }
    net::post(strand_, [self = shared_from_this(), frame = make_stream_chunk_frame(envelope, target_device_id)] {
        self->send_frame(frame);
    });
}

void RelayClient::send_remote_control(const std::string& session_id, RemoteAction action,
                                      const json::object& extra) {
    if (state() != ConnectionState::Connected) {
        throw RelayError(RelayErrorCode::NotConnected, "relay connection is not authenticated", session_id);
    }
    if (action == RemoteAction::Unknown) {
        throw RelayError(RelayErrorCode::Validation, "unknown remote action", session_id);
    }
    auto own = permission(session_id);
    if (!own) {
        throw RelayError(RelayErrorCode::NotJoined, "not a member of the session", session_id);
    }
    if (!RemoteControlPolicy::can_send(*own, action, config_.allow_view_only_input)) {
        throw RelayError(RelayErrorCode::PermissionDenied,
                         std::string(permission_name(*own)) + " may not send " + action_name(action), session_id);
    }

    net::post(strand_, [self = shared_from_this(), frame = make_remote_control_frame(session_id, action, extra)] {
        self->send_frame(frame);
    });
}

void RelayClient::send_remote_control_ack(const std::string& session_id, RemoteAction action) {
    if (state() != ConnectionState::Connected) {
        throw RelayError(RelayErrorCode::NotConnected, "relay connection is not authenticated", session_id);
    }
    net::post(strand_, [self = shared_from_this(),
                        frame = make_remote_control_ack_frame(session_id, action, device_id())] {
        self->send_frame(frame);
    });
}

// --- Strand-only ---

void RelayClient::do_connect() {
    const uint64_t generation = ++generation_;
    std::weak_ptr<RelayClient> weak = weak_from_this();

    RelayLink::Events events;
    events.on_open = [weak, generation] {
        if (auto self = weak.lock()) self->handle_open(generation);
    };
    events.on_message = [weak, generation](const std::string& text) {
        if (auto self = weak.lock()) self->handle_message(generation, text);
    };
    events.on_closed = [weak, generation](const std::string& reason) {
        if (auto self = weak.lock()) self->handle_closed(generation, reason);
    };

    link_ = factory_(strand_, std::move(events));
    publish_state();

    Logger::log(Logger::Level::INFO, Logger::EventType::CONNECTION, device_id(),
                "Connecting to relay " + config_.host + ":" + std::to_string(config_.port));
    link_->start();
}

void RelayClient::do_disconnect() {
    stop_timers();
    {
        std::lock_guard<std::mutex> lock(membership_mutex_);
        memberships_.clear();
    }

    if (link_) {
        auto link = std::move(link_);
        ++generation_;
        link->close();
    }

    // Keeps a rejected credential on record.
    fsm_.reset();
    publish_state();
    Logger::log(Logger::Level::INFO, Logger::EventType::CONNECTION, device_id(), "Disconnected from relay");
}

void RelayClient::do_leave(const std::string& session_id) {
    bool was_desired = desired_.erase(session_id) > 0;
    bool was_member = false;
    {
        std::lock_guard<std::mutex> lock(membership_mutex_);
        was_member = memberships_.erase(session_id) > 0;
    }

    if (was_member && fsm_.state() == ConnectionState::Connected) {
        send_frame(make_leave_session_frame(session_id));
    }

    if (was_desired && desired_.empty()) {
        do_disconnect();
    }
}

void RelayClient::send_frame(std::string frame) {
    if (link_) link_->send(std::move(frame));
}

void RelayClient::handle_open(uint64_t generation) {
    if (generation != generation_) return;

    fsm_.on_transport_open();
    publish_state();
    send_frame(make_auth_frame(device_token_, device_id()));
    arm_auth_timer(generation);
}

void RelayClient::handle_closed(uint64_t generation, const std::string& reason) {
    if (generation != generation_) return;

    link_.reset();
    heartbeat_timer_.cancel();
    auth_timer_.cancel();
    {
        std::lock_guard<std::mutex> lock(membership_mutex_);
        memberships_.clear();
    }

    CloseAction action = fsm_.on_transport_closed(false);
    publish_state();
    Logger::log(Logger::Level::WARNING, Logger::EventType::CONNECTION, device_id(),
                "Relay connection lost: " + reason);

    switch (action) {
        case CloseAction::Reconnect:
            schedule_reconnect();
            break;
        case CloseAction::GiveUp:
            report(RelayError(RelayErrorCode::MaxReconnectExceeded,
                              "gave up after " + std::to_string(fsm_.attempts()) + " reconnect attempts"));
            break;
        case CloseAction::None:
            break;
    }
}

void RelayClient::handle_message(uint64_t generation, const std::string& text) {
    if (generation != generation_) return;

    Frame frame;
    try {
        frame = parse_frame(text);
    } catch (const ProtocolError& e) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::INVALID_INPUT, "relay", e.what());
        return;
    }

    const std::string session_id(InputValidator::string_field(frame.body, "sessionId"));

    switch (frame.type) {
        case FrameType::AuthSuccess:
            handle_auth_success(frame.body);
            break;
        case FrameType::AuthFailed:
            handle_auth_failed(frame.body);
            break;
        case FrameType::Subscribed:
            handle_subscribed(session_id, frame.body);
            break;
        case FrameType::Unsubscribed: {
            {
                std::lock_guard<std::mutex> lock(membership_mutex_);
                memberships_.erase(session_id);
            }
            PresenceEvent event;
            event.kind = PresenceEvent::Kind::Unsubscribed;
            event.session_id = session_id;
            notify_presence(event);
            break;
        }
        case FrameType::MemberJoined:
            handle_member_joined(session_id, frame.body);
            break;
        case FrameType::MemberLeft:
            handle_member_left(session_id, frame.body);
            break;
        case FrameType::StreamChunk:
            handle_stream_chunk(frame.body);
            break;
        case FrameType::RemoteControl:
        case FrameType::RemoteControlAck:
            if (control_listener_) control_listener_(frame.type, session_id, payload_of(frame.body));
            break;
        case FrameType::Heartbeat:
            send_frame(make_heartbeat_ack_frame());
            break;
        case FrameType::HeartbeatAck:
            break;
        case FrameType::Error:
            handle_error(frame.body);
            break;
        case FrameType::DeliveryFailed: {
            std::string target(InputValidator::string_field(frame.body, "targetDeviceId"));
            std::string error(InputValidator::string_field(frame.body, "error"));
            report(RelayError(RelayErrorCode::DeviceOffline,
                              "delivery to " + target + " failed: " + error, session_id));
            break;
        }
        default:
            Logger::log(Logger::Level::DEBUG, Logger::EventType::INVALID_INPUT, "relay",
                        "Ignoring frame " + frame.tag);
            break;
    }
}

void RelayClient::handle_auth_success(const json::object& body) {
    auth_timer_.cancel();
    fsm_.on_auth_success();
    user_id_ = std::string(InputValidator::string_field(payload_of(body), "userId"));
    publish_state();

    Logger::log(Logger::Level::INFO, Logger::EventType::AUTH_SUCCESS, device_id(), "Authenticated with relay");

    arm_heartbeat(generation_);
    for (const auto& [session_id, desired] : desired_) {
        send_frame(make_join_session_frame(session_id, desired.role, desired.permission));
    }
}

void RelayClient::handle_auth_failed(const json::object& body) {
    auth_timer_.cancel();
    fsm_.on_auth_failed();
    publish_state();

    std::string reason(InputValidator::string_field(body, "error"));
    if (reason.empty()) reason = "authentication failed";
    report(RelayError(RelayErrorCode::AuthFailed, reason));

    if (auto link = link_) link->close();
}

void RelayClient::handle_subscribed(const std::string& session_id, const json::object& body) {
    PresenceEvent event;
    event.kind = PresenceEvent::Kind::Subscribed;
    event.session_id = session_id;

    const auto& payload = payload_of(body);
    if (auto it = payload.find("participants"); it != payload.end() && it->value().is_array()) {
        for (const auto& item : it->value().get_array()) {
            if (item.is_object()) event.participants.push_back(participant_from_json(item.get_object()));
        }
    }

    {
        std::lock_guard<std::mutex> lock(membership_mutex_);
        Membership& membership = memberships_[session_id];
        membership.participants = event.participants;
        membership.own_permission.reset();
        for (const auto& p : event.participants) {
            if (p.device_id == device_id_) membership.own_permission = p.permission;
        }
    }
    notify_presence(event);
}

void RelayClient::handle_member_joined(const std::string& session_id, const json::object& body) {
    const auto& payload = payload_of(body);
    auto it = payload.find("participant");
    if (it == payload.end() || !it->value().is_object()) return;

    PresenceEvent event;
    event.kind = PresenceEvent::Kind::MemberJoined;
    event.session_id = session_id;
    event.participant = participant_from_json(it->value().get_object());

    {
        std::lock_guard<std::mutex> lock(membership_mutex_);
        auto m = memberships_.find(session_id);
        if (m != memberships_.end()) {
            auto& list = m->second.participants;
            list.erase(std::remove_if(list.begin(), list.end(),
                                      [&](const Participant& p) { return p.device_id == event.participant.device_id; }),
                       list.end());
            list.push_back(event.participant);
        }
    }
    notify_presence(event);
}

void RelayClient::handle_member_left(const std::string& session_id, const json::object& body) {
    const auto& payload = payload_of(body);

    PresenceEvent event;
    event.kind = PresenceEvent::Kind::MemberLeft;
    event.session_id = session_id;
    event.participant.device_id = std::string(InputValidator::string_field(payload, "deviceId"));
    event.participant.role = parse_role(InputValidator::string_field(payload, "role")).value_or(DeviceRole::Viewer);
    event.reason = std::string(InputValidator::string_field(payload, "reason"));
    if (auto it = payload.find("sessionEnded"); it != payload.end() && it->value().is_bool()) {
        event.session_ended = it->value().get_bool();
    }

    {
        std::lock_guard<std::mutex> lock(membership_mutex_);
        auto m = memberships_.find(session_id);
        if (m != memberships_.end()) {
            auto& list = m->second.participants;
            list.erase(std::remove_if(list.begin(), list.end(),
                                      [&](const Participant& p) { return p.device_id == event.participant.device_id; }),
                       list.end());
        }
    }

    if (event.session_ended) {
        Logger::log(Logger::Level::INFO, Logger::EventType::PRESENCE, session_id,
                    "Executor left, session ended");
    }
    notify_presence(event);
}

void RelayClient::handle_stream_chunk(const json::object& body) {
    EncryptedEnvelope envelope;
    try {
        envelope = envelope_from_json(body);
    } catch (const EnvelopeError& e) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::INVALID_INPUT, "relay",
                    std::string("Dropping malformed envelope: ") + e.what());
        return;
    }
    if (envelope_listener_) envelope_listener_(envelope);
}

void RelayClient::handle_error(const json::object& body) {
    std::string code(InputValidator::string_field(body, "code"));
    std::string message(InputValidator::string_field(body, "error"));
    std::string session_id(InputValidator::string_field(body, "sessionId"));
    report(RelayError(relay_error_from_wire(code), code + ": " + message, session_id));
}

void RelayClient::arm_auth_timer(uint64_t generation) {
    auth_timer_.expires_after(config_.auth_timeout);
    auth_timer_.async_wait([weak = weak_from_this(), generation](beast::error_code ec) {
        if (ec) return;
        auto self = weak.lock();
        if (!self || generation != self->generation_) return;
        if (self->fsm_.state() != ConnectionState::Authenticating) return;

        self->report(RelayError(RelayErrorCode::ConnectionTimeout, "relay did not answer AUTH in time"));
        // The close is reported through on_closed and takes the reconnect path.
        if (auto link = self->link_) link->close();
    });
}

void RelayClient::arm_heartbeat(uint64_t generation) {
    heartbeat_timer_.expires_after(config_.heartbeat_interval);
    heartbeat_timer_.async_wait([weak = weak_from_this(), generation](beast::error_code ec) {
        if (ec) return;
        auto self = weak.lock();
        if (!self || generation != self->generation_) return;
        if (self->fsm_.state() != ConnectionState::Connected) return;

        self->send_frame(make_heartbeat_frame());
        self->arm_heartbeat(generation);
    });
}

void RelayClient::schedule_reconnect() {
    reconnect_pending_ = true;
    reconnect_timer_.expires_after(config_.reconnect_delay);
    reconnect_timer_.async_wait([weak = weak_from_this()](beast::error_code ec) {
        if (ec) return;
        auto self = weak.lock();
        if (!self || !self->reconnect_pending_) return;
        self->reconnect_pending_ = false;
        if (self->fsm_.state() != ConnectionState::Disconnected) return;

        int attempt = self->fsm_.on_reconnect_attempt();
        Logger::log(Logger::Level::INFO, Logger::EventType::CONNECTION, self->device_id(),
                    "Reconnect attempt " + std::to_string(attempt) + "/" +
                        std::to_string(self->config_.max_reconnect_attempts));
        self->do_connect();
    });
}

void RelayClient::stop_timers() {
    heartbeat_timer_.cancel();
    auth_timer_.cancel();
    reconnect_timer_.cancel();
    reconnect_pending_ = false;
}

void RelayClient::publish_state() {
    ConnectionState current = fsm_.state();
    attempts_ = fsm_.attempts();
    ConnectionState previous = state_.exchange(current);
    if (previous != current && state_listener_) {
        state_listener_(current);
    }
}

void RelayClient::report(const RelayError& error) {
    Logger::log(error.terminal() ? Logger::Level::ERROR : Logger::Level::WARNING,
                error.code() == RelayErrorCode::AuthFailed ? Logger::EventType::AUTH_FAILURE
                                                           : Logger::EventType::CONNECTION,
                error.session_id().empty() ? device_id() : error.session_id(),
                std::string(relay_error_name(error.code())) + ": " + error.what());
    if (error_listener_) error_listener_(error);
}

void RelayClient::notify_presence(const PresenceEvent& event) {
    if (presence_listener_) presence_listener_(event);
}

}
