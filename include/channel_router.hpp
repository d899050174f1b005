#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <boost/json.hpp>

namespace tether {

// Logical streams an envelope can travel on.
enum class Channel {
    ChatSecret,     // pairing and key-exchange traffic only
    Communication,  // live bidirectional session traffic
    Conversation    // default stream
};

enum class Plane {
    Handshake,
    Session,
    Unknown
};

enum class SessionEventType {
    RemoteCommand,
    ExecutorUpdate,
    LocalExecutionCommand,
    Unknown
};

// Outbound event shape as seen by the router. Payload contents are irrelevant here.
struct RoutableEvent {
    Plane plane = Plane::Unknown;
    std::optional<SessionEventType> session_event_type;
    std::string type;  // e.g. PAIR_REQUEST, OUTPUT_CHUNK
};

/**
 * Maps an event to its channel. Returns nullopt for local-only events, which must
 * never leave the originating device. Unknown shapes fall back to Conversation.
 */
std::optional<Channel> route(const RoutableEvent& event);

const char* channel_name(Channel channel);
std::optional<Channel> parse_channel(std::string_view name);

Plane parse_plane(std::string_view tag);
SessionEventType parse_session_event_type(std::string_view tag);

// Reads {plane, sessionEventType, type} from a JSON event. Missing fields map to Unknown.
RoutableEvent routable_event_from_json(const boost::json::object& obj);

}
