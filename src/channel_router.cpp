#include "channel_router.hpp"
#include "input_validator.hpp"

namespace tether {

std::optional<Channel> route(const RoutableEvent& event) {
    switch (event.plane) {
        case Plane::Handshake:
            return Channel::ChatSecret;
        case Plane::Session:
            if (!event.session_event_type) return Channel::Conversation;
            switch (*event.session_event_type) {
                case SessionEventType::RemoteCommand:
                case SessionEventType::ExecutorUpdate:
                    return Channel::Communication;
                case SessionEventType::LocalExecutionCommand:
                    return std::nullopt;
                case SessionEventType::Unknown:
                    return Channel::Conversation;
            }
            return Channel::Conversation;
        case Plane::Unknown:
            return Channel::Conversation;
    }
    return Channel::Conversation;
}

const char* channel_name(Channel channel) {
    switch (channel) {
        case Channel::ChatSecret: return "chatSecret";
        case Channel::Communication: return "communication";
        case Channel::Conversation: return "conversation";
    }
    return "conversation";
}

std::optional<Channel> parse_channel(std::string_view name) {
    if (name == "chatSecret") return Channel::ChatSecret;
    if (name == "communication") return Channel::Communication;
    if (name == "conversation") return Channel::Conversation;
    return std::nullopt;
}

Plane parse_plane(std::string_view tag) {
    if (tag == "HANDSHAKE") return Plane::Handshake;
    if (tag == "SESSION") return Plane::Session;
    return Plane::Unknown;
}

SessionEventType parse_session_event_type(std::string_view tag) {
    if (tag == "REMOTE_COMMAND") return SessionEventType::RemoteCommand;
    if (tag == "EXECUTOR_UPDATE") return SessionEventType::ExecutorUpdate;
    if (tag == "LOCAL_EXECUTION_COMMAND") return SessionEventType::LocalExecutionCommand;
    return SessionEventType::Unknown;
}

RoutableEvent routable_event_from_json(const boost::json::object& obj) {
    RoutableEvent event;
    event.plane = parse_plane(InputValidator::string_field(obj, "plane"));
    auto set = InputValidator::string_field(obj, "sessionEventType");
    if (!set.empty()) {
        event.session_event_type = parse_session_event_type(set);
    }
    event.type = std::string(InputValidator::string_field(obj, "type"));
    return event;
}

}
