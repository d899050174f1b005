#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <stdexcept>
#include <cstdint>
#include <boost/json.hpp>

#include "envelope.hpp"

namespace tether {

// Closed set of relay frame tags. Unknown covers tags introduced by newer peers.
enum class FrameType {
    Auth,
    AuthSuccess,
    AuthFailed,
    JoinSession,
    LeaveSession,
    Subscribed,
    Unsubscribed,
    MemberJoined,
    MemberLeft,
    StreamChunk,
    RemoteControl,
    RemoteControlAck,
    Heartbeat,
    HeartbeatAck,
    Error,
    DeliveryFailed,
    Unknown
};

enum class DeviceRole {
    Controller,
    Executor,
    Viewer
};

enum class Permission {
    ViewOnly,
    Interact,
    FullControl
};

enum class RemoteAction {
    Pause,
    Resume,
    Stop,
    Input,
    Unknown
};

// ERROR.code values sent by the relay.
namespace error_code {
constexpr const char* AUTH_FAILED = "auth_failed";
constexpr const char* NOT_AUTHENTICATED = "not_authenticated";
constexpr const char* VALIDATION_FAILED = "validation_failed";
constexpr const char* SESSION_NOT_FOUND = "session_not_found";
constexpr const char* NOT_JOINED = "not_joined";
constexpr const char* PERMISSION_DENIED = "permission_denied";
constexpr const char* UNKNOWN_TYPE = "unknown_type";
constexpr const char* DEVICE_OFFLINE = "device_offline";
}

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

const char* frame_type_name(FrameType type);
FrameType parse_frame_type(std::string_view tag);

const char* role_name(DeviceRole role);
std::optional<DeviceRole> parse_role(std::string_view name);

const char* permission_name(Permission permission);
std::optional<Permission> parse_permission(std::string_view name);

const char* action_name(RemoteAction action);
RemoteAction parse_action(std::string_view name);

// Role-derived permission when a joiner does not request one.
Permission default_permission(DeviceRole role);

struct Participant {
    std::string device_id;
    std::string device_name;
    DeviceRole role = DeviceRole::Viewer;
    Permission permission = Permission::ViewOnly;
    int64_t joined_at = 0;
    std::string user_id;  // owning account; relay-internal, never serialized
};

boost::json::object participant_to_json(const Participant& participant);
Participant participant_from_json(const boost::json::object& obj);

struct Frame {
    FrameType type = FrameType::Unknown;
    std::string tag;            // raw "type" value
    boost::json::object body;   // whole frame
};

// Throws ProtocolError for malformed JSON, non-object frames or a missing type tag.
Frame parse_frame(std::string_view text, size_t max_depth = 16);

// --- Frame builders (serialized JSON text) ---
std::string make_auth_frame(const std::string& device_token, const std::string& device_id);
std::string make_auth_success_frame(const std::string& device_id, const std::string& user_id, DeviceRole role);
std::string make_auth_failed_frame(const std::string& reason);
std::string make_join_session_frame(const std::string& session_id, DeviceRole role,
                                    std::optional<Permission> permission = std::nullopt);
std::string make_leave_session_frame(const std::string& session_id);
std::string make_subscribed_frame(const std::string& session_id, const std::vector<Participant>& participants);
std::string make_unsubscribed_frame(const std::string& session_id);
std::string make_member_joined_frame(const std::string& session_id, const Participant& participant);
std::string make_member_left_frame(const std::string& session_id, const std::string& device_id,
                                   DeviceRole role, const std::string& reason, bool session_ended);
std::string make_stream_chunk_frame(const EncryptedEnvelope& envelope, const std::string& target_device_id = "");
std::string make_remote_control_frame(const std::string& session_id, RemoteAction action,
                                      const boost::json::object& extra = {});
std::string make_remote_control_ack_frame(const std::string& session_id, RemoteAction action,
                                          const std::string& from_device_id);
std::string make_heartbeat_frame();
std::string make_heartbeat_ack_frame();
std::string make_error_frame(const std::string& code, const std::string& message,
                             const std::string& session_id = "");
std::string make_delivery_failed_frame(const std::string& session_id, const std::string& event_id,
                                       const std::string& target_device_id, const std::string& reason);

}
