#include "message_relay.hpp"
#include "relay_peer.hpp"
#include "connection_state.hpp"
#include "envelope.hpp"
#include "input_validator.hpp"
#include "logger.hpp"
#include "metrics.hpp"

#include <chrono>

namespace json = boost::json;

namespace tether {

namespace {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

const json::object* object_field(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_object()) return nullptr;
    return &it->value().get_object();
}

}

MessageRelay::MessageRelay(const ServerConfig& config, ConnectionManager& conn_manager,
                           PresenceRegistry& presence, DeviceRegistry& devices)
    : config_(config), conn_manager_(conn_manager), presence_(presence), devices_(devices) {}

void MessageRelay::handle_frame(const std::shared_ptr<RelayPeer>& peer, const std::string& text) {
    peer->touch();

    if (!validate_message_size(text.size())) {
        MetricsRegistry::instance().increment_counter("tether_frame_errors_total");
        peer->send_text(make_error_frame(error_code::VALIDATION_FAILED, "Frame exceeds size limit"));
        return;
    }

    Frame frame;
    try {
        frame = parse_frame(text, config_.max_json_depth);
    } catch (const ProtocolError& e) {
        MetricsRegistry::instance().increment_counter("tether_frame_errors_total");
        Logger::log(Logger::Level::WARNING, Logger::EventType::INVALID_INPUT, peer->remote_address(), e.what());
        peer->send_text(make_error_frame(error_code::VALIDATION_FAILED, e.what()));
        return;
    }

    MetricsRegistry::instance().increment_counter("tether_frames_total");

    if (frame.type == FrameType::Auth) {
        handle_auth(peer, frame.body);
        return;
    }

    auto device = peer->identity();
    if (!device) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::AUTH_FAILURE, peer->remote_address(),
                    "Frame before authentication: " + frame.tag);
        peer->send_text(make_error_frame(error_code::NOT_AUTHENTICATED, "Authenticate first"));
        peer->close();
        return;
    }

    switch (frame.type) {
        case FrameType::JoinSession:
            handle_join(peer, *device, frame.body);
            break;
        case FrameType::LeaveSession:
            handle_leave(peer, *device, frame.body);
            break;
        case FrameType::StreamChunk:
            handle_stream_chunk(peer, *device, frame.body, text);
            break;
        case FrameType::RemoteControl:
            handle_remote_control(peer, *device, frame.body, text);
            break;
        case FrameType::RemoteControlAck:
            handle_remote_control_ack(peer, *device, frame.body, text);
            break;
        case FrameType::Heartbeat:
            peer->send_text(make_heartbeat_ack_frame());
            break;
        case FrameType::HeartbeatAck:
            break;
        default:
            // Server-to-client tags and tags from newer clients.
            peer->send_text(make_error_frame(error_code::UNKNOWN_TYPE, "Unsupported frame type: " +
                                             InputValidator::sanitize_field(frame.tag, 64)));
            break;
    }
}

void MessageRelay::handle_auth(const std::shared_ptr<RelayPeer>& peer, const json::object& frame) {
    const json::object* payload = object_field(frame, "payload");
    std::string device_id, token;
    if (payload) {
        device_id = std::string(InputValidator::string_field(*payload, "deviceId"));
        token = std::string(InputValidator::string_field(*payload, "deviceToken"));
    }

    auto reject = [&](const std::string& reason) {
        MetricsRegistry::instance().increment_counter("tether_auth_failures_total");
        Logger::log(Logger::Level::WARNING, Logger::EventType::AUTH_FAILURE, peer->remote_address(), reason);
        peer->send_text(make_auth_failed_frame(reason));
        peer->close();
    };

    if (!InputValidator::is_valid_id(device_id) || token.empty()) {
        reject("Missing or malformed credentials");
        return;
    }

    auto current = peer->device_id();
    if (!current.empty() && current != device_id) {
        peer->send_text(make_error_frame(error_code::VALIDATION_FAILED, "Connection already bound to another device"));
        return;
    }

    std::optional<DeviceRecord> device;
    try {
        device = devices_.authenticate(device_id, token);
    } catch (const std::exception& e) {
        Logger::log(Logger::Level::ERROR, Logger::EventType::SYSTEM, device_id,
                    std::string("Device registry unavailable: ") + e.what());
        reject("Device registry unavailable");
        return;
    }
    if (!device) {
        reject("Invalid device credentials");
        return;
    }

    auto added = conn_manager_.add_connection(device->device_id, peer, peer->remote_address(),
                                              config_.max_connections_per_ip);
    if (!added.accepted) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::CONNECTION, peer->remote_address(),
                    "Connection limit exceeded for address");
        peer->send_text(make_error_frame("connection_limit", "Too many connections from your address"));
        peer->close();
        return;
    }

    peer->set_identity(*device);

    if (added.replaced) {
        // The old connection's memberships end now; its close handler later finds itself superseded.
        Logger::log(Logger::Level::INFO, Logger::EventType::CONNECTION, device->device_id,
                    "Replacing existing connection");
        leave_sessions(device->device_id, "replaced");
        added.replaced->close();
    }

    Logger::log(Logger::Level::INFO, Logger::EventType::AUTH_SUCCESS, device->device_id, "Device authenticated");
    peer->send_text(make_auth_success_frame(device->device_id, device->user_id, device->role));
}

void MessageRelay::handle_join(const std::shared_ptr<RelayPeer>& peer, const DeviceRecord& device,
                               const json::object& frame) {
    std::string session_id(InputValidator::string_field(frame, "sessionId"));
    if (!InputValidator::is_valid_id(session_id)) {
        peer->send_text(make_error_frame(error_code::VALIDATION_FAILED, "Missing or malformed sessionId"));
        return;
    }

    Participant participant;
    participant.device_id = device.device_id;
    participant.device_name = device.name;
    participant.user_id = device.user_id;
    participant.role = device.role;
    participant.joined_at = now_ms();

    std::optional<Permission> requested;
    if (const json::object* payload = object_field(frame, "payload")) {
        // The registered role is kept unless the device asks to join as a viewer.
        auto role = parse_role(InputValidator::string_field(*payload, "role"));
        if (role && *role != device.role) {
            if (*role == DeviceRole::Viewer) {
                participant.role = DeviceRole::Viewer;
            } else {
                Logger::log(Logger::Level::WARNING, Logger::EventType::INVALID_INPUT, device.device_id,
                            std::string("Requested role ") + role_name(*role) + " exceeds registered role");
            }
        }
        requested = parse_permission(InputValidator::string_field(*payload, "permission"));
    }

    // A device never holds more than its registered role allows.
    Permission ceiling = default_permission(device.role);
    Permission permission = requested.value_or(default_permission(participant.role));
    participant.permission = static_cast<int>(permission) > static_cast<int>(ceiling) ? ceiling : permission;

    auto result = presence_.join(session_id, participant);
    if (result.rejected) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::PRESENCE, device.device_id,
                    "Join refused for session owned by another account");
        peer->send_text(make_error_frame(error_code::PERMISSION_DENIED, "Session belongs to another account",
                                         session_id));
        return;
    }

    peer->send_text(make_subscribed_frame(session_id, result.participants));

    if (result.added) {
        MetricsRegistry::instance().increment_gauge("tether_session_members");
        Logger::log(Logger::Level::INFO, Logger::EventType::PRESENCE, session_id,
                    "Device " + device.device_id + " joined as " + role_name(result.participant.role));
        broadcast(session_id, make_member_joined_frame(session_id, result.participant), device.device_id);
    }
}

void MessageRelay::handle_leave(const std::shared_ptr<RelayPeer>& peer, const DeviceRecord& device,
                                const json::object& frame) {
    std::string session_id(InputValidator::string_field(frame, "sessionId"));
    if (session_id.empty()) {
        peer->send_text(make_error_frame(error_code::VALIDATION_FAILED, "Missing sessionId"));
        return;
    }

    auto removed = presence_.leave(session_id, device.device_id);
    if (!removed) {
        peer->send_text(make_error_frame(error_code::NOT_JOINED, "Not a member of this session", session_id));
        return;
    }

    peer->send_text(make_unsubscribed_frame(session_id));
    announce_left(session_id, *removed, "left");
}

std::optional<Participant> MessageRelay::require_member(const std::shared_ptr<RelayPeer>& peer,
                                                        const std::string& session_id,
                                                        const std::string& device_id) {
    auto member = presence_.find(session_id, device_id);
    if (member) return member;

    if (presence_.participants(session_id).empty()) {
        peer->send_text(make_error_frame(error_code::SESSION_NOT_FOUND, "No such session", session_id));
    } else {
        peer->send_text(make_error_frame(error_code::NOT_JOINED, "Join the session first", session_id));
    }
    return std::nullopt;
}

void MessageRelay::handle_stream_chunk(const std::shared_ptr<RelayPeer>& peer, const DeviceRecord& device,
                                       const json::object& frame, const std::string& text) {
    std::string problem = validate_envelope_shape(frame);
    if (!problem.empty()) {
        MetricsRegistry::instance().increment_counter("tether_frame_errors_total");
        peer->send_text(make_error_frame(error_code::VALIDATION_FAILED, problem,
                                         std::string(InputValidator::string_field(frame, "sessionId"))));
        return;
    }

    std::string session_id(InputValidator::string_field(frame, "sessionId"));
    std::string event_id(InputValidator::string_field(frame, "eventId"));

    auto sender = InputValidator::string_field(frame, "senderDeviceId");
    if (!sender.empty() && sender != device.device_id) {
        peer->send_text(make_error_frame(error_code::VALIDATION_FAILED, "senderDeviceId does not match connection",
                                         session_id));
        return;
    }

    if (!require_member(peer, session_id, device.device_id)) return;

    std::string target(InputValidator::string_field(frame, "targetDeviceId"));
    if (target.empty()) {
        broadcast(session_id, text, device.device_id);
        return;
    }

    ConnectionManager::PeerPtr recipient;
    if (presence_.is_member(session_id, target)) {
        recipient = conn_manager_.get_connection(target);
    }
    if (!recipient) {
        MetricsRegistry::instance().increment_counter("tether_delivery_failed_total");
        Logger::log(Logger::Level::INFO, Logger::EventType::DELIVERY, session_id,
                    "Target device is not reachable: " + InputValidator::sanitize_field(target, 128));
        peer->send_text(make_delivery_failed_frame(session_id, event_id, target, "Target device is offline"));
        return;
    }
    recipient->send_text(text);
}

void MessageRelay::handle_remote_control(const std::shared_ptr<RelayPeer>& peer, const DeviceRecord& device,
                                         const json::object& frame, const std::string& text) {
    std::string session_id(InputValidator::string_field(frame, "sessionId"));
    if (session_id.empty()) {
        peer->send_text(make_error_frame(error_code::VALIDATION_FAILED, "Missing sessionId"));
        return;
    }

    RemoteAction action = RemoteAction::Unknown;
    if (const json::object* payload = object_field(frame, "payload")) {
        action = parse_action(InputValidator::string_field(*payload, "action"));
    }
    if (action == RemoteAction::Unknown) {
        peer->send_text(make_error_frame(error_code::VALIDATION_FAILED, "Unknown remote action", session_id));
        return;
    }

    auto member = require_member(peer, session_id, device.device_id);
    if (!member) return;

    if (!RemoteControlPolicy::can_send(member->permission, action, config_.allow_view_only_input)) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::AUTH_FAILURE, device.device_id,
                    std::string("Remote action refused: ") + action_name(action));
        peer->send_text(make_error_frame(error_code::PERMISSION_DENIED,
                                         std::string("Permission ") + permission_name(member->permission) +
                                             " cannot send " + action_name(action),
                                         session_id));
        return;
    }

    size_t delivered = 0;
    for (const auto& p : presence_.participants(session_id)) {
        if (p.role != DeviceRole::Executor || p.device_id == device.device_id) continue;
        if (auto executor = conn_manager_.get_connection(p.device_id)) {
            executor->send_text(text);
            ++delivered;
        }
    }

    if (delivered == 0) {
        MetricsRegistry::instance().increment_counter("tether_delivery_failed_total");
        peer->send_text(make_error_frame(error_code::DEVICE_OFFLINE, "No executor is connected", session_id));
    }
}

// Executors confirm a control action; the confirmation fans out to the session.
void MessageRelay::handle_remote_control_ack(const std::shared_ptr<RelayPeer>& peer, const DeviceRecord& device,
                                             const json::object& frame, const std::string& text) {
    std::string session_id(InputValidator::string_field(frame, "sessionId"));
    if (session_id.empty()) {
        peer->send_text(make_error_frame(error_code::VALIDATION_FAILED, "Missing sessionId"));
        return;
    }
    if (!require_member(peer, session_id, device.device_id)) return;
    broadcast(session_id, text, device.device_id);
}

size_t MessageRelay::broadcast(const std::string& session_id, const std::string& frame,
                               const std::string& except_device_id) {
    size_t reached = 0;
    for (const auto& p : presence_.participants(session_id)) {
        if (p.device_id == except_device_id) continue;
        if (auto member = conn_manager_.get_connection(p.device_id)) {
            member->send_text(frame);
            ++reached;
        }
    }
    return reached;
}

void MessageRelay::announce_left(const std::string& session_id, const Participant& participant,
                                 const std::string& reason) {
    bool session_ended = participant.role == DeviceRole::Executor;
    MetricsRegistry::instance().decrement_gauge("tether_session_members");
    Logger::log(Logger::Level::INFO, Logger::EventType::PRESENCE, session_id,
                "Device " + participant.device_id + " left (" + reason + ")");
    broadcast(session_id,
              make_member_left_frame(session_id, participant.device_id, participant.role, reason, session_ended),
              participant.device_id);
}

void MessageRelay::leave_sessions(const std::string& device_id, const std::string& reason) {
    for (const auto& [session_id, participant] : presence_.leave_all(device_id)) {
        announce_left(session_id, participant, reason);
    }
}

void MessageRelay::on_disconnect(RelayPeer* peer, const std::string& reason) {
    if (!peer) return;

    std::string device_id = peer->device_id();
    if (device_id.empty()) {
        conn_manager_.remove_peer(peer);
        return;
    }

    // A newer connection of the same device owns the memberships now.
    auto current = conn_manager_.get_connection(device_id);
    bool superseded = current && current.get() != peer;

    conn_manager_.remove_peer(peer);
    if (!superseded) {
        leave_sessions(device_id, reason);
    }
}

size_t MessageRelay::evict_idle(std::chrono::steady_clock::time_point now) {
    const auto timeout = std::chrono::seconds(config_.idle_timeout_sec);
    size_t evicted = 0;

    for (const auto& peer : conn_manager_.snapshot()) {
        if (now - peer->last_activity() < timeout) continue;

        Logger::log(Logger::Level::INFO, Logger::EventType::PRESENCE, peer->device_id(), "Evicting idle device");
        on_disconnect(peer.get(), "idle_timeout");
        peer->close();
        ++evicted;
    }

    if (evicted > 0) {
        MetricsRegistry::instance().increment_counter("tether_idle_evictions_total", static_cast<double>(evicted));
    }
    return evicted;
}

}
