#include "connection_state.hpp"

namespace tether {

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Authenticating: return "authenticating";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Error: return "error";
    }
    return "disconnected";
}

bool ConnectionStateMachine::on_connect(const std::string& credential_fingerprint) {
    if (state_ == ConnectionState::Connecting || state_ == ConnectionState::Authenticating ||
        state_ == ConnectionState::Connected) {
        return false;
    }
    if (!rejected_credential_.empty() && rejected_credential_ == credential_fingerprint) {
        return false;
    }

    if (credential_fingerprint != rejected_credential_) {
        rejected_credential_.clear();
    }
    credential_ = credential_fingerprint;
    attempts_ = 0;
    max_exceeded_ = false;
    state_ = ConnectionState::Connecting;
    return true;
}

void ConnectionStateMachine::on_transport_open() {
    if (state_ == ConnectionState::Connecting) {
        state_ = ConnectionState::Authenticating;
    }
}

void ConnectionStateMachine::on_auth_success() {
    if (state_ == ConnectionState::Authenticating) {
        state_ = ConnectionState::Connected;
        attempts_ = 0;
    }
}

void ConnectionStateMachine::on_auth_failed() {
    rejected_credential_ = credential_;
    state_ = ConnectionState::Error;
}

CloseAction ConnectionStateMachine::on_transport_closed(bool clean) {
    if (clean) {
        state_ = ConnectionState::Disconnected;
        return CloseAction::None;
    }
    if (credential_rejected()) {
        // Keep the error state; retrying the same credential is pointless.
        return CloseAction::None;
    }
    if (attempts_ >= max_attempts_) {
        max_exceeded_ = true;
        state_ = ConnectionState::Disconnected;
        return CloseAction::GiveUp;
    }
    state_ = ConnectionState::Disconnected;
    return CloseAction::Reconnect;
}

int ConnectionStateMachine::on_reconnect_attempt() {
    ++attempts_;
    state_ = ConnectionState::Connecting;
    return attempts_;
}

void ConnectionStateMachine::on_error() {
    state_ = ConnectionState::Error;
}

void ConnectionStateMachine::reset() {
    state_ = ConnectionState::Disconnected;
    attempts_ = 0;
    max_exceeded_ = false;
}

bool RemoteControlPolicy::can_send(Permission permission, RemoteAction action, bool allow_view_only_input) {
    if (action == RemoteAction::Unknown) return false;
    switch (permission) {
        case Permission::FullControl:
        case Permission::Interact:
            return true;
        case Permission::ViewOnly:
            return action == RemoteAction::Input && allow_view_only_input;
    }
    return false;
}

}
