#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <mutex>
#include <memory>
#include <atomic>
#include <optional>
#include <functional>
#include <stdexcept>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/json.hpp>

#include "connection_state.hpp"
#include "envelope.hpp"
#include "relay_protocol.hpp"
#include "server_config.hpp"

namespace tether {

enum class RelayErrorCode {
    AuthFailed,            // terminal for the credential
    MaxReconnectExceeded,  // terminal until the next manual connect
    ConnectionTimeout,
    PermissionDenied,
    NotConnected,
    Validation,
    SessionNotFound,
    NotJoined,
    DeviceOffline
};

const char* relay_error_name(RelayErrorCode code);

// Maps an ERROR.code from the relay to the client taxonomy.
RelayErrorCode relay_error_from_wire(std::string_view code);

class RelayError : public std::runtime_error {
public:
    RelayError(RelayErrorCode code, const std::string& what, std::string session_id = "")
        : std::runtime_error(what), code_(code), session_id_(std::move(session_id)) {}

    RelayErrorCode code() const { return code_; }
    const std::string& session_id() const { return session_id_; }
    bool terminal() const {
        return code_ == RelayErrorCode::AuthFailed || code_ == RelayErrorCode::MaxReconnectExceeded;
    }

private:
    RelayErrorCode code_;
    std::string session_id_;
};

struct PresenceEvent {
    enum class Kind {
        Subscribed,
        Unsubscribed,
        MemberJoined,
        MemberLeft
    };

    Kind kind = Kind::Subscribed;
    std::string session_id;
    Participant participant;                // MemberJoined, MemberLeft
    std::vector<Participant> participants;  // Subscribed
    std::string reason;                     // MemberLeft
    bool session_ended = false;             // MemberLeft of the executor
};

// Transport under a RelayClient. Every callback runs on the client's strand.
class RelayLink {
public:
    struct Events {
        std::function<void()> on_open;
        std::function<void(const std::string&)> on_message;
        std::function<void(const std::string& reason)> on_closed;  // fires once
    };

    virtual ~RelayLink() = default;

    // Resolve, connect and upgrade. Failure is reported through on_closed.
    virtual void start() = 0;
    virtual void send(std::string frame) = 0;
    virtual void close() = 0;
};

/**
 * Device side of the relay protocol: connects, authenticates, keeps the
 * heartbeat going, rejoins sessions after a reconnect and reports presence,
 * envelopes and errors to listeners. All state changes happen on one strand;
 * listeners are invoked from it and must be set before connect().
 */
class RelayClient : public std::enable_shared_from_this<RelayClient> {
public:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;
    using LinkFactory = std::function<std::shared_ptr<RelayLink>(Strand&, RelayLink::Events)>;

    using EnvelopeListener = std::function<void(const EncryptedEnvelope&)>;
    using PresenceListener = std::function<void(const PresenceEvent&)>;
    using ControlListener = std::function<void(FrameType, const std::string& session_id,
                                               const boost::json::object& payload)>;
    using ErrorListener = std::function<void(const RelayError&)>;
    using StateListener = std::function<void(ConnectionState)>;

    // An empty factory selects the Beast websocket transport.
    RelayClient(boost::asio::io_context& ioc, RelayClientConfig config, LinkFactory factory = {});
    ~RelayClient();

    RelayClient(const RelayClient&) = delete;
    RelayClient& operator=(const RelayClient&) = delete;

    void on_envelope(EnvelopeListener listener) { envelope_listener_ = std::move(listener); }
    void on_presence(PresenceListener listener) { presence_listener_ = std::move(listener); }
    void on_control(ControlListener listener) { control_listener_ = std::move(listener); }
    void on_error(ErrorListener listener) { error_listener_ = std::move(listener); }
    void on_state(StateListener listener) { state_listener_ = std::move(listener); }

    // Manual connect. A credential the relay already rejected is reported as
    // AuthFailed without touching the network.
    void connect(const std::string& device_id, const std::string& device_token);

    // Clean close; stops the heartbeat and any pending reconnect. Like every
    // control call it runs on the strand: inline when already there, otherwise
    // queued behind work that is already pending.
    void disconnect();

    // Remembered and replayed after every reconnect until left.
    void join_session(const std::string& session_id, DeviceRole role,
                      std::optional<Permission> permission = std::nullopt);

    // Leaving the last joined session also ends the connection. Timers are
    // cancelled when the strand runs the leave, not before this returns.
    void leave_session(const std::string& session_id);

    // Throws RelayError(NotConnected) unless authenticated.
    void send_envelope(const EncryptedEnvelope& envelope, const std::string& target_device_id = "");

    // Gated locally by RemoteControlPolicy before anything is sent.
    void send_remote_control(const std::string& session_id, RemoteAction action,
                             const boost::json::object& extra = {});
    void send_remote_control_ack(const std::string& session_id, RemoteAction action);

    ConnectionState state() const { return state_.load(); }
    std::string device_id() const;

    std::vector<Participant> participants(const std::string& session_id) const;
    std::optional<Permission> permission(const std::string& session_id) const;
    bool is_joined(const std::string& session_id) const;
    int reconnect_attempts() const { return attempts_.load(); }

private:
    struct DesiredSession {
        DeviceRole role = DeviceRole::Viewer;
        std::optional<Permission> permission;
    };

    struct Membership {
        std::vector<Participant> participants;
        std::optional<Permission> own_permission;
    };

    void do_connect();
    void do_disconnect();
    void do_leave(const std::string& session_id);
    void send_frame(std::string frame);

    void handle_open(uint64_t generation);
    void handle_message(uint64_t generation, const std::string& text);
    void handle_closed(uint64_t generation, const std::string& reason);

    void handle_auth_success(const boost::json::object& body);
    void handle_auth_failed(const boost::json::object& body);
    void handle_subscribed(const std::string& session_id, const boost::json::object& body);
    void handle_member_joined(const std::string& session_id, const boost::json::object& body);
    void handle_member_left(const std::string& session_id, const boost::json::object& body);
    void handle_stream_chunk(const boost::json::object& body);
    void handle_error(const boost::json::object& body);

    void arm_auth_timer(uint64_t generation);
    void arm_heartbeat(uint64_t generation);
    void schedule_reconnect();
    void stop_timers();

    void publish_state();
    void report(const RelayError& error);
    void notify_presence(const PresenceEvent& event);

    Strand strand_;
    RelayClientConfig config_;
    LinkFactory factory_;
    boost::asio::ssl::context ssl_ctx_;

    // strand-only state
    ConnectionStateMachine fsm_;
    std::shared_ptr<RelayLink> link_;
    uint64_t generation_ = 0;  // bumped per link; stale callbacks are dropped
    bool reconnect_pending_ = false;
    std::string device_token_;
    std::string user_id_;
    std::map<std::string, DesiredSession> desired_;
    boost::asio::steady_timer heartbeat_timer_;
    boost::asio::steady_timer auth_timer_;
    boost::asio::steady_timer reconnect_timer_;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<int> attempts_{0};

    mutable std::mutex membership_mutex_;
    std::string device_id_;
    std::map<std::string, Membership> memberships_;

    EnvelopeListener envelope_listener_;
    PresenceListener presence_listener_;
    ControlListener control_listener_;
    ErrorListener error_listener_;
    StateListener state_listener_;
};

}
