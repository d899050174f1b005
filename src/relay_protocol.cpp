#include "relay_protocol.hpp"
#include "input_validator.hpp"

#include <array>
#include <chrono>
#include <utility>

namespace json = boost::json;

namespace tether {

namespace {

constexpr std::array<std::pair<FrameType, const char*>, 16> FRAME_NAMES{{
    {FrameType::Auth, "AUTH"},
    {FrameType::AuthSuccess, "AUTH_SUCCESS"},
    {FrameType::AuthFailed, "AUTH_FAILED"},
    {FrameType::JoinSession, "JOIN_SESSION"},
    {FrameType::LeaveSession, "LEAVE_SESSION"},
    {FrameType::Subscribed, "SUBSCRIBED"},
    {FrameType::Unsubscribed, "UNSUBSCRIBED"},
    {FrameType::MemberJoined, "MEMBER_JOINED"},
    {FrameType::MemberLeft, "MEMBER_LEFT"},
    {FrameType::StreamChunk, "STREAM_CHUNK"},
    {FrameType::RemoteControl, "REMOTE_CONTROL"},
    {FrameType::RemoteControlAck, "REMOTE_CONTROL_ACK"},
    {FrameType::Heartbeat, "HEARTBEAT"},
    {FrameType::HeartbeatAck, "HEARTBEAT_ACK"},
    {FrameType::Error, "ERROR"},
    {FrameType::DeliveryFailed, "DELIVERY_FAILED"},
}};

json::object typed(FrameType type) {
    json::object obj;
    obj["type"] = frame_type_name(type);
    return obj;
}

std::string serialize(const json::object& obj) {
    return json::serialize(obj);
}

}

const char* frame_type_name(FrameType type) {
    for (const auto& [t, name] : FRAME_NAMES) {
        if (t == type) return name;
    }
    return "UNKNOWN";
}

FrameType parse_frame_type(std::string_view tag) {
    for (const auto& [t, name] : FRAME_NAMES) {
        if (tag == name) return t;
    }
    return FrameType::Unknown;
}

const char* role_name(DeviceRole role) {
    switch (role) {
        case DeviceRole::Controller: return "controller";
        case DeviceRole::Executor: return "executor";
        case DeviceRole::Viewer: return "viewer";
    }
    return "viewer";
}

std::optional<DeviceRole> parse_role(std::string_view name) {
    if (name == "controller") return DeviceRole::Controller;
    if (name == "executor") return DeviceRole::Executor;
    if (name == "viewer") return DeviceRole::Viewer;
    return std::nullopt;
}

const char* permission_name(Permission permission) {
    switch (permission) {
        case Permission::ViewOnly: return "view_only";
        case Permission::Interact: return "interact";
        case Permission::FullControl: return "full_control";
    }
    return "view_only";
}

std::optional<Permission> parse_permission(std::string_view name) {
    if (name == "view_only") return Permission::ViewOnly;
    if (name == "interact") return Permission::Interact;
    if (name == "full_control") return Permission::FullControl;
    return std::nullopt;
}

const char* action_name(RemoteAction action) {
    switch (action) {
        case RemoteAction::Pause: return "pause";
        case RemoteAction::Resume: return "resume";
        case RemoteAction::Stop: return "stop";
        case RemoteAction::Input: return "input";
        case RemoteAction::Unknown: return "unknown";
    }
    return "unknown";
}

RemoteAction parse_action(std::string_view name) {
    if (name == "pause") return RemoteAction::Pause;
    if (name == "resume") return RemoteAction::Resume;
    if (name == "stop") return RemoteAction::Stop;
    if (name == "input") return RemoteAction::Input;
    return RemoteAction::Unknown;
}

Permission default_permission(DeviceRole role) {
    switch (role) {
        case DeviceRole::Controller: return Permission::FullControl;
        case DeviceRole::Executor: return Permission::Interact;
        case DeviceRole::Viewer: return Permission::ViewOnly;
    }
    return Permission::ViewOnly;
}

json::object participant_to_json(const Participant& participant) {
    json::object obj;
    obj["deviceId"] = participant.device_id;
    obj["deviceName"] = participant.device_name;
    obj["role"] = role_name(participant.role);
    obj["permission"] = permission_name(participant.permission);
    obj["joinedAt"] = participant.joined_at;
    return obj;
}

Participant participant_from_json(const json::object& obj) {
    Participant p;
    p.device_id = std::string(InputValidator::string_field(obj, "deviceId"));
    p.device_name = std::string(InputValidator::string_field(obj, "deviceName"));
    p.role = parse_role(InputValidator::string_field(obj, "role")).value_or(DeviceRole::Viewer);
    p.permission = parse_permission(InputValidator::string_field(obj, "permission"))
                       .value_or(default_permission(p.role));
    if (auto it = obj.find("joinedAt"); it != obj.end() && it->value().is_int64()) {
        p.joined_at = it->value().get_int64();
    }
    return p;
}

Frame parse_frame(std::string_view text, size_t max_depth) {
    json::value value;
    try {
        value = InputValidator::safe_parse_json(text, max_depth);
    } catch (const std::exception& e) {
        throw ProtocolError(std::string("malformed frame: ") + e.what());
    }
    if (!value.is_object()) {
        throw ProtocolError("frame is not an object");
    }

    Frame frame;
    frame.body = std::move(value.as_object());
    auto tag = InputValidator::string_field(frame.body, "type");
    if (tag.empty()) {
        throw ProtocolError("frame has no type");
    }
    frame.tag = std::string(tag);
    frame.type = parse_frame_type(tag);
    return frame;
}

std::string make_auth_frame(const std::string& device_token, const std::string& device_id) {
    auto obj = typed(FrameType::Auth);
    json::object payload;
    payload["deviceToken"] = device_token;
    payload["deviceId"] = device_id;
    obj["payload"] = std::move(payload);
    return serialize(obj);
}

std::string make_auth_success_frame(const std::string& device_id, const std::string& user_id, DeviceRole role) {
    auto obj = typed(FrameType::AuthSuccess);
    json::object payload;
    payload["deviceId"] = device_id;
    payload["userId"] = user_id;
    payload["role"] = role_name(role);
    obj["payload"] = std::move(payload);
    return serialize(obj);
}

std::string make_auth_failed_frame(const std::string& reason) {
    auto obj = typed(FrameType::AuthFailed);
    obj["code"] = error_code::AUTH_FAILED;
    obj["error"] = reason;
    return serialize(obj);
}

std::string make_join_session_frame(const std::string& session_id, DeviceRole role,
                                    std::optional<Permission> permission) {
    auto obj = typed(FrameType::JoinSession);
    obj["sessionId"] = session_id;
    json::object payload;
    payload["role"] = role_name(role);
    if (permission) payload["permission"] = permission_name(*permission);
    obj["payload"] = std::move(payload);
    return serialize(obj);
}

std::string make_leave_session_frame(const std::string& session_id) {
    auto obj = typed(FrameType::LeaveSession);
    obj["sessionId"] = session_id;
    return serialize(obj);
}

std::string make_subscribed_frame(const std::string& session_id, const std::vector<Participant>& participants) {
    auto obj = typed(FrameType::Subscribed);
    obj["sessionId"] = session_id;
    json::array list;
    for (const auto& p : participants) {
        list.push_back(participant_to_json(p));
    }
    json::object payload;
    payload["participants"] = std::move(list);
    obj["payload"] = std::move(payload);
    return serialize(obj);
}

std::string make_unsubscribed_frame(const std::string& session_id) {
    auto obj = typed(FrameType::Unsubscribed);
    obj["sessionId"] = session_id;
    return serialize(obj);
}

std::string make_member_joined_frame(const std::string& session_id, const Participant& participant) {
    auto obj = typed(FrameType::MemberJoined);
    obj["sessionId"] = session_id;
    json::object payload;
    payload["participant"] = participant_to_json(participant);
    obj["payload"] = std::move(payload);
    return serialize(obj);
}

std::string make_member_left_frame(const std::string& session_id, const std::string& device_id,
                                   DeviceRole role, const std::string& reason, bool session_ended) {
    auto obj = typed(FrameType::MemberLeft);
    obj["sessionId"] = session_id;
    json::object payload;
    payload["deviceId"] = device_id;
    payload["role"] = role_name(role);
    payload["reason"] = reason;
    payload["sessionEnded"] = session_ended;
    obj["payload"] = std::move(payload);
    return serialize(obj);
}

std::string make_stream_chunk_frame(const EncryptedEnvelope& envelope, const std::string& target_device_id) {
    auto obj = envelope_to_json(envelope);
    obj["type"] = frame_type_name(FrameType::StreamChunk);
    if (!target_device_id.empty()) {
        obj["targetDeviceId"] = target_device_id;
    }
    return serialize(obj);
}

std::string make_remote_control_frame(const std::string& session_id, RemoteAction action,
                                      const json::object& extra) {
    auto obj = typed(FrameType::RemoteControl);
    obj["sessionId"] = session_id;
    json::object payload = extra;
    payload["action"] = action_name(action);
    obj["payload"] = std::move(payload);
    return serialize(obj);
}

std::string make_remote_control_ack_frame(const std::string& session_id, RemoteAction action,
                                          const std::string& from_device_id) {
    auto obj = typed(FrameType::RemoteControlAck);
    obj["sessionId"] = session_id;
    json::object payload;
    payload["action"] = action_name(action);
    payload["fromDeviceId"] = from_device_id;
    obj["payload"] = std::move(payload);
    return serialize(obj);
}

std::string make_heartbeat_frame() {
    return serialize(typed(FrameType::Heartbeat));
}

std::string make_heartbeat_ack_frame() {
    auto obj = typed(FrameType::HeartbeatAck);
    obj["serverTime"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return serialize(obj);
}

std::string make_error_frame(const std::string& code, const std::string& message,
                             const std::string& session_id) {
    auto obj = typed(FrameType::Error);
    obj["code"] = code;
    obj["error"] = message;
    if (!session_id.empty()) obj["sessionId"] = session_id;
    return serialize(obj);
}

std::string make_delivery_failed_frame(const std::string& session_id, const std::string& event_id,
                                       const std::string& target_device_id, const std::string& reason) {
    auto obj = typed(FrameType::DeliveryFailed);
    obj["sessionId"] = session_id;
    obj["eventId"] = event_id;
    obj["targetDeviceId"] = target_device_id;
    obj["code"] = error_code::DEVICE_OFFLINE;
    obj["error"] = reason;
    return serialize(obj);
}

}
