#pragma once

#include <string>

#include "relay_protocol.hpp"

namespace tether {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Authenticating,
    Connected,
    Error
};

const char* connection_state_name(ConnectionState state);

// What the client should do after the transport went away.
enum class CloseAction {
    None,       // clean close or a rejected credential
    Reconnect,  // schedule the next attempt after the fixed delay
    GiveUp      // attempt cap reached; surface MaxReconnectExceeded
};

/**
 * Client-side connection lifecycle, free of any I/O:
 * disconnected -> connecting -> authenticating -> connected -> (error | disconnected).
 */
class ConnectionStateMachine {
public:
    explicit ConnectionStateMachine(int max_reconnect_attempts = 10)
        : max_attempts_(max_reconnect_attempts) {}

    ConnectionState state() const { return state_; }
    int attempts() const { return attempts_; }
    bool credential_rejected() const { return !rejected_credential_.empty(); }
    bool max_reconnect_exceeded() const { return max_exceeded_; }

    /**
     * Manual connect with a credential fingerprint. Refused (false) while a
     * connection is in progress or when this exact credential was rejected.
     */
    bool on_connect(const std::string& credential_fingerprint);

    void on_transport_open();
    void on_auth_success();

    // The server rejected the credential: terminal for that credential.
    void on_auth_failed();

    CloseAction on_transport_closed(bool clean);

    // Moves to connecting for a scheduled retry; returns the attempt number.
    int on_reconnect_attempt();

    void on_error();

    // Back to disconnected with the reconnect attempt count reset.
    void reset();

private:
    ConnectionState state_ = ConnectionState::Disconnected;
    int max_attempts_;
    int attempts_ = 0;
    bool max_exceeded_ = false;
    std::string credential_;
    std::string rejected_credential_;
};

// Local gate applied before a REMOTE_CONTROL frame is sent, and again by the relay.
class RemoteControlPolicy {
public:
    static bool can_send(Permission permission, RemoteAction action, bool allow_view_only_input);
};

}
