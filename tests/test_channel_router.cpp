#include <gtest/gtest.h>
#include "channel_router.hpp"

using namespace tether;

namespace {

RoutableEvent session_event(SessionEventType type) {
    RoutableEvent event;
    event.plane = Plane::Session;
    event.session_event_type = type;
    return event;
}

}

TEST(ChannelRouterTest, HandshakeGoesToChatSecret) {
    RoutableEvent event;
    event.plane = Plane::Handshake;
    event.type = "PAIR_REQUEST";
    EXPECT_EQ(route(event), Channel::ChatSecret);

    // The session event type is irrelevant on the handshake plane.
    event.session_event_type = SessionEventType::RemoteCommand;
    EXPECT_EQ(route(event), Channel::ChatSecret);
}

TEST(ChannelRouterTest, LiveSessionTrafficGoesToCommunication) {
    EXPECT_EQ(route(session_event(SessionEventType::RemoteCommand)), Channel::Communication);
    EXPECT_EQ(route(session_event(SessionEventType::ExecutorUpdate)), Channel::Communication);
}

TEST(ChannelRouterTest, LocalExecutionNeverLeavesTheDevice) {
    EXPECT_FALSE(route(session_event(SessionEventType::LocalExecutionCommand)).has_value());
}

TEST(ChannelRouterTest, UnknownShapesFallBackToConversation) {
    RoutableEvent plain;
    EXPECT_EQ(route(plain), Channel::Conversation);

    RoutableEvent no_type;
    no_type.plane = Plane::Session;
    EXPECT_EQ(route(no_type), Channel::Conversation);

    EXPECT_EQ(route(session_event(SessionEventType::Unknown)), Channel::Conversation);
}

TEST(ChannelRouterTest, ChannelNames) {
    EXPECT_STREQ(channel_name(Channel::ChatSecret), "chatSecret");
    EXPECT_STREQ(channel_name(Channel::Communication), "communication");
    EXPECT_STREQ(channel_name(Channel::Conversation), "conversation");

    EXPECT_EQ(parse_channel("communication"), Channel::Communication);
    EXPECT_FALSE(parse_channel("Communication").has_value());
    EXPECT_FALSE(parse_channel("").has_value());
}

TEST(ChannelRouterTest, EventFromJson) {
    auto remote = routable_event_from_json(
        boost::json::parse(R"({"plane":"SESSION","sessionEventType":"REMOTE_COMMAND","type":"PAUSE"})").as_object());
    EXPECT_EQ(remote.plane, Plane::Session);
    ASSERT_TRUE(remote.session_event_type.has_value());
    EXPECT_EQ(*remote.session_event_type, SessionEventType::RemoteCommand);
    EXPECT_EQ(remote.type, "PAUSE");
    EXPECT_EQ(route(remote), Channel::Communication);

    auto local = routable_event_from_json(
        boost::json::parse(R"({"plane":"SESSION","sessionEventType":"LOCAL_EXECUTION_COMMAND"})").as_object());
    EXPECT_FALSE(route(local).has_value());

    auto garbage = routable_event_from_json(boost::json::parse(R"({"plane":42})").as_object());
    EXPECT_EQ(garbage.plane, Plane::Unknown);
    EXPECT_FALSE(garbage.session_event_type.has_value());
    EXPECT_EQ(route(garbage), Channel::Conversation);
}
