#include <gtest/gtest.h>
#include "message_relay.hpp"
#include "relay_peer.hpp"
#include "metrics.hpp"

#include <map>
#include <thread>

using namespace tether;
namespace json = boost::json;

namespace {

class FakePeer : public RelayPeer {
public:
    explicit FakePeer(std::string ip = "10.0.0.1") : ip_(std::move(ip)) {}

    void send_text(const std::string& message) override { sent.push_back(message); }
    void close() override { ++closes; }
    std::string remote_address() const override { return ip_; }

    std::vector<Frame> frames(FrameType type) const {
        std::vector<Frame> out;
        for (const auto& text : sent) {
            auto frame = parse_frame(text);
            if (frame.type == type) out.push_back(std::move(frame));
        }
        return out;
    }

    size_t count(FrameType type) const { return frames(type).size(); }

    std::string last_error_code() const {
        auto errors = frames(FrameType::Error);
        if (errors.empty()) return "";
        return std::string(errors.back().body.at("code").as_string());
    }

    std::vector<std::string> sent;
    int closes = 0;

private:
    std::string ip_;
};

class FakeRegistry : public DeviceRegistry {
public:
    void add(const std::string& id, const std::string& user, DeviceRole role, const std::string& token) {
        DeviceRecord d;
        d.device_id = id;
        d.user_id = user;
        d.name = id + "-name";
        d.role = role;
        devices[id] = {d, token};
    }

    std::optional<DeviceRecord> authenticate(const std::string& device_id, const std::string& token) override {
        auto it = devices.find(device_id);
        if (it == devices.end() || it->second.second != token) return std::nullopt;
        return it->second.first;
    }

    std::optional<DeviceRecord> get_device(const std::string& device_id) override {
        auto it = devices.find(device_id);
        if (it == devices.end()) return std::nullopt;
        return it->second.first;
    }

    bool register_device(const DeviceRecord& device, const std::string& token) override {
        devices[device.device_id] = {device, token};
        return true;
    }

    std::vector<DeviceRecord> list_user_devices(const std::string& user_id) override {
        std::vector<DeviceRecord> out;
        for (const auto& [id, entry] : devices) {
            if (entry.first.user_id == user_id) out.push_back(entry.first);
        }
        return out;
    }

    std::map<std::string, std::pair<DeviceRecord, std::string>> devices;
};

EncryptedEnvelope envelope(const std::string& session, const std::string& sender, const std::string& event_id) {
    EncryptedEnvelope env;
    env.session_id = session;
    env.channel = Channel::Communication;
    env.event_id = event_id;
    env.sequence_number = 1;
    env.sender_device_id = sender;
    env.created_at = 1;
    env.nonce = "AAAAAAAAAAAAAAAA";
    env.ciphertext = "b3BhcXVl";
    return env;
}

}

class MessageRelayTest : public ::testing::Test {
protected:
    void SetUp() override {
        MetricsRegistry::instance().reset();
        registry.add("laptop", "alice", DeviceRole::Executor, "tok-laptop");
        registry.add("phone", "alice", DeviceRole::Controller, "tok-phone");
        registry.add("tv", "alice", DeviceRole::Viewer, "tok-tv");
        registry.add("intruder", "mallory", DeviceRole::Controller, "tok-mallory");
    }

    std::shared_ptr<FakePeer> connect(const std::string& device, const std::string& token) {
        auto peer = std::make_shared<FakePeer>();
        relay.handle_frame(peer, make_auth_frame(token, device));
        return peer;
    }

    std::shared_ptr<FakePeer> join(const std::string& device, const std::string& token, const std::string& session,
                                   DeviceRole role) {
        auto peer = connect(device, token);
        relay.handle_frame(peer, make_join_session_frame(session, role));
        return peer;
    }

    ServerConfig config;
    ConnectionManager conn_manager{"test_salt"};
    PresenceRegistry presence{4};
    FakeRegistry registry;
    MessageRelay relay{config, conn_manager, presence, registry};
};

TEST_F(MessageRelayTest, FrameBeforeAuthIsRejected) {
    auto peer = std::make_shared<FakePeer>();
    relay.handle_frame(peer, make_join_session_frame("s1", DeviceRole::Viewer));
    EXPECT_EQ(peer->last_error_code(), "not_authenticated");
    EXPECT_EQ(peer->closes, 1);
}

TEST_F(MessageRelayTest, BadCredentialsFailAuth) {
    auto peer = connect("phone", "wrong");
    ASSERT_EQ(peer->count(FrameType::AuthFailed), 1u);
    EXPECT_EQ(peer->closes, 1);
    EXPECT_FALSE(conn_manager.is_online("phone"));
    EXPECT_EQ(MetricsRegistry::instance().get_counter("tether_auth_failures_total"), 1.0);

    auto unknown = connect("nobody", "tok");
    EXPECT_EQ(unknown->count(FrameType::AuthFailed), 1u);
}

TEST_F(MessageRelayTest, AuthSuccess) {
    auto peer = connect("phone", "tok-phone");
    auto ok = peer->frames(FrameType::AuthSuccess);
    ASSERT_EQ(ok.size(), 1u);
    const auto& payload = ok[0].body.at("payload").as_object();
    EXPECT_EQ(payload.at("deviceId").as_string(), "phone");
    EXPECT_EQ(payload.at("userId").as_string(), "alice");
    EXPECT_EQ(payload.at("role").as_string(), "controller");
    EXPECT_TRUE(conn_manager.is_online("phone"));
}

TEST_F(MessageRelayTest, MalformedAndUnknownFrames) {
    auto peer = connect("phone", "tok-phone");
    relay.handle_frame(peer, "{oops");
    EXPECT_EQ(peer->last_error_code(), "validation_failed");

    relay.handle_frame(peer, R"({"type":"WARP_DRIVE"})");
    EXPECT_EQ(peer->last_error_code(), "unknown_type");

    config.max_message_size = 16;
    relay.handle_frame(peer, make_heartbeat_frame() + std::string(32, ' '));
    EXPECT_EQ(peer->last_error_code(), "validation_failed");
    EXPECT_EQ(peer->closes, 0);
}

TEST_F(MessageRelayTest, HeartbeatIsAcknowledged) {
    auto peer = connect("phone", "tok-phone");
    relay.handle_frame(peer, make_heartbeat_frame());
    EXPECT_EQ(peer->count(FrameType::HeartbeatAck), 1u);
}

TEST_F(MessageRelayTest, JoinAnnouncesExactlyOnce) {
    auto laptop = join("laptop", "tok-laptop", "s1", DeviceRole::Executor);
    auto subscribed = laptop->frames(FrameType::Subscribed);
    ASSERT_EQ(subscribed.size(), 1u);
    EXPECT_EQ(subscribed[0].body.at("payload").as_object().at("participants").as_array().size(), 1u);

    auto phone = join("phone", "tok-phone", "s1", DeviceRole::Controller);
    EXPECT_EQ(laptop->count(FrameType::MemberJoined), 1u);
    EXPECT_EQ(phone->count(FrameType::MemberJoined), 0u);

    auto phone_view = phone->frames(FrameType::Subscribed);
    ASSERT_EQ(phone_view.size(), 1u);
    EXPECT_EQ(phone_view[0].body.at("payload").as_object().at("participants").as_array().size(), 2u);

    // Rejoining is idempotent: a fresh snapshot, no second announcement.
    relay.handle_frame(phone, make_join_session_frame("s1", DeviceRole::Controller));
    EXPECT_EQ(phone->count(FrameType::Subscribed), 2u);
    EXPECT_EQ(laptop->count(FrameType::MemberJoined), 1u);
}

TEST_F(MessageRelayTest, JoinWithInvalidSessionId) {
    auto phone = connect("phone", "tok-phone");
    relay.handle_frame(phone, make_join_session_frame("bad session!", DeviceRole::Controller));
    EXPECT_EQ(phone->last_error_code(), "validation_failed");
}

TEST_F(MessageRelayTest, OtherAccountCannotJoin) {
    auto laptop = join("laptop", "tok-laptop", "s1", DeviceRole::Executor);
    auto intruder = join("intruder", "tok-mallory", "s1", DeviceRole::Controller);
    EXPECT_EQ(intruder->last_error_code(), "permission_denied");
    EXPECT_EQ(intruder->count(FrameType::Subscribed), 0u);
    EXPECT_EQ(laptop->count(FrameType::MemberJoined), 0u);
}

TEST_F(MessageRelayTest, PermissionIsClampedToRegisteredRole) {
    auto tv = connect("tv", "tok-tv");
    relay.handle_frame(tv, make_join_session_frame("s1", DeviceRole::Viewer, Permission::FullControl));
    auto member = presence.find("s1", "tv");
    ASSERT_TRUE(member.has_value());
    EXPECT_EQ(member->permission, Permission::ViewOnly);

    auto phone = connect("phone", "tok-phone");
    relay.handle_frame(phone, make_join_session_frame("s1", DeviceRole::Controller, Permission::Interact));
    EXPECT_EQ(presence.find("s1", "phone")->permission, Permission::Interact);
}

TEST_F(MessageRelayTest, RoleIsClampedToRegisteredRole) {
    auto laptop = join("laptop", "tok-laptop", "s1", DeviceRole::Executor);
    auto tv = join("tv", "tok-tv", "s1", DeviceRole::Executor);
    ASSERT_EQ(tv->count(FrameType::Subscribed), 1u);
    EXPECT_EQ(presence.find("s1", "tv")->role, DeviceRole::Viewer);
    EXPECT_EQ(presence.find("s1", "tv")->permission, Permission::ViewOnly);

    // A promoted viewer would receive this; it must not.
    auto phone = join("phone", "tok-phone", "s1", DeviceRole::Controller);
    relay.handle_frame(phone, make_remote_control_frame("s1", RemoteAction::Pause));
    EXPECT_EQ(laptop->count(FrameType::RemoteControl), 1u);
    EXPECT_EQ(tv->count(FrameType::RemoteControl), 0u);

    // Nor does its departure end the session.
    relay.on_disconnect(tv.get(), "closed");
    auto left = phone->frames(FrameType::MemberLeft);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_FALSE(left[0].body.at("payload").as_object().at("sessionEnded").as_bool());

    // Stepping down to viewer is allowed.
    relay.handle_frame(phone, make_leave_session_frame("s1"));
    relay.handle_frame(phone, make_join_session_frame("s1", DeviceRole::Viewer));
    EXPECT_EQ(presence.find("s1", "phone")->role, DeviceRole::Viewer);
}

TEST_F(MessageRelayTest, StreamChunkFansOutToOthers) {
    auto laptop = join("laptop", "tok-laptop", "s1", DeviceRole::Executor);
    auto phone = join("phone", "tok-phone", "s1", DeviceRole::Controller);
    auto tv = join("tv", "tok-tv", "s1", DeviceRole::Viewer);

    relay.handle_frame(laptop, make_stream_chunk_frame(envelope("s1", "laptop", "e1")));
    EXPECT_EQ(phone->count(FrameType::StreamChunk), 1u);
    EXPECT_EQ(tv->count(FrameType::StreamChunk), 1u);
    EXPECT_EQ(laptop->count(FrameType::StreamChunk), 0u);

    // Forwarded verbatim.
    auto chunk = phone->frames(FrameType::StreamChunk)[0];
    EXPECT_EQ(chunk.body.at("payload").as_object().at("ciphertext").as_string(), "b3BhcXVl");
}

TEST_F(MessageRelayTest, TargetedChunk) {
    auto laptop = join("laptop", "tok-laptop", "s1", DeviceRole::Executor);
    auto phone = join("phone", "tok-phone", "s1", DeviceRole::Controller);
    auto tv = join("tv", "tok-tv", "s1", DeviceRole::Viewer);

    relay.handle_frame(laptop, make_stream_chunk_frame(envelope("s1", "laptop", "e1"), "phone"));
    EXPECT_EQ(phone->count(FrameType::StreamChunk), 1u);
    EXPECT_EQ(tv->count(FrameType::StreamChunk), 0u);
}

TEST_F(MessageRelayTest, TargetOfflineYieldsDeliveryFailed) {
    auto laptop = join("laptop", "tok-laptop", "s1", DeviceRole::Executor);
    relay.handle_frame(laptop, make_stream_chunk_frame(envelope("s1", "laptop", "e7"), "phone"));

    auto failed = laptop->frames(FrameType::DeliveryFailed);
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].body.at("eventId").as_string(), "e7");
    EXPECT_EQ(failed[0].body.at("targetDeviceId").as_string(), "phone");
    EXPECT_EQ(MetricsRegistry::instance().get_counter("tether_delivery_failed_total"), 1.0);
}

TEST_F(MessageRelayTest, ChunkRequiresMembership) {
    auto laptop = join("laptop", "tok-laptop", "s1", DeviceRole::Executor);
    auto phone = connect("phone", "tok-phone");

    relay.handle_frame(phone, make_stream_chunk_frame(envelope("s1", "phone", "e1")));
    EXPECT_EQ(phone->last_error_code(), "not_joined");

    relay.handle_frame(phone, make_stream_chunk_frame(envelope("ghost", "phone", "e2")));
    EXPECT_EQ(phone->last_error_code(), "session_not_found");
    EXPECT_EQ(laptop->count(FrameType::StreamChunk), 0u);
}

TEST_F(MessageRelayTest, ChunkSenderMustMatchConnection) {
    auto laptop = join("laptop", "tok-laptop", "s1", DeviceRole::Executor);
    auto phone = join("phone", "tok-phone", "s1", DeviceRole::Controller);

    relay.handle_frame(phone, make_stream_chunk_frame(envelope("s1", "laptop", "e1")));
    EXPECT_EQ(phone->last_error_code(), "validation_failed");
    EXPECT_EQ(laptop->count(FrameType::StreamChunk), 0u);
}

TEST_F(MessageRelayTest, MalformedEnvelopeIsRejected) {
    auto laptop = join("laptop", "tok-laptop", "s1", DeviceRole::Executor);
    auto phone = join("phone", "tok-phone", "s1", DeviceRole::Controller);

    auto env = envelope("s1", "laptop", "e1");
    env.ciphertext = "not base64!";
    relay.handle_frame(laptop, make_stream_chunk_frame(env));
    EXPECT_EQ(laptop->last_error_code(), "validation_failed");
    EXPECT_EQ(phone->count(FrameType::StreamChunk), 0u);
}

TEST_F(MessageRelayTest, RemoteControlReachesExecutorsOnly) {
    auto laptop = join("laptop", "tok-laptop", "s1", DeviceRole::Executor);
    auto phone = join("phone", "tok-phone", "s1", DeviceRole::Controller);
    auto tv = join("tv", "tok-tv", "s1", DeviceRole::Viewer);

    relay.handle_frame(phone, make_remote_control_frame("s1", RemoteAction::Pause));
    EXPECT_EQ(laptop->count(FrameType::RemoteControl), 1u);
    EXPECT_EQ(tv->count(FrameType::RemoteControl), 0u);

    relay.handle_frame(laptop, make_remote_control_ack_frame("s1", RemoteAction::Pause, "laptop"));
    EXPECT_EQ(phone->count(FrameType::RemoteControlAck), 1u);
    EXPECT_EQ(tv->count(FrameType::RemoteControlAck), 1u);
}

TEST_F(MessageRelayTest, ViewOnlyCannotControl) {
    auto laptop = join("laptop", "tok-laptop", "s1", DeviceRole::Executor);
    auto tv = join("tv", "tok-tv", "s1", DeviceRole::Viewer);

    relay.handle_frame(tv, make_remote_control_frame("s1", RemoteAction::Stop));
    EXPECT_EQ(tv->last_error_code(), "permission_denied");
    relay.handle_frame(tv, make_remote_control_frame("s1", RemoteAction::Input));
    EXPECT_EQ(tv->last_error_code(), "permission_denied");
    EXPECT_EQ(laptop->count(FrameType::RemoteControl), 0u);

    config.allow_view_only_input = true;
    relay.handle_frame(tv, make_remote_control_frame("s1", RemoteAction::Input));
    EXPECT_EQ(laptop->count(FrameType::RemoteControl), 1u);
}

TEST_F(MessageRelayTest, RemoteControlWithoutExecutor) {
    auto phone = join("phone", "tok-phone", "s1", DeviceRole::Controller);
    relay.handle_frame(phone, make_remote_control_frame("s1", RemoteAction::Pause));
    EXPECT_EQ(phone->last_error_code(), "device_offline");

    relay.handle_frame(phone, R"({"type":"REMOTE_CONTROL","sessionId":"s1","payload":{"action":"reboot"}})");
    EXPECT_EQ(phone->last_error_code(), "validation_failed");
}

TEST_F(MessageRelayTest, LeaveAnnouncesDeparture) {
    auto laptop = join("laptop", "tok-laptop", "s1", DeviceRole::Executor);
    auto phone = join("phone", "tok-phone", "s1", DeviceRole::Controller);

    relay.handle_frame(phone, make_leave_session_frame("s1"));
    EXPECT_EQ(phone->count(FrameType::Unsubscribed), 1u);
    auto left = laptop->frames(FrameType::MemberLeft);
    ASSERT_EQ(left.size(), 1u);
    const auto& payload = left[0].body.at("payload").as_object();
    EXPECT_EQ(payload.at("deviceId").as_string(), "phone");
    EXPECT_EQ(payload.at("reason").as_string(), "left");
    EXPECT_FALSE(payload.at("sessionEnded").as_bool());

    relay.handle_frame(phone, make_leave_session_frame("s1"));
    EXPECT_EQ(phone->last_error_code(), "not_joined");
}

TEST_F(MessageRelayTest, ExecutorDepartureEndsSession) {
    auto laptop = join("laptop", "tok-laptop", "s1", DeviceRole::Executor);
    auto phone = join("phone", "tok-phone", "s1", DeviceRole::Controller);

    relay.on_disconnect(laptop.get(), "closed");
    auto left = phone->frames(FrameType::MemberLeft);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_TRUE(left[0].body.at("payload").as_object().at("sessionEnded").as_bool());
    EXPECT_FALSE(conn_manager.is_online("laptop"));
}

TEST_F(MessageRelayTest, IdleEvictionThenCloseLeavesOnce) {
    config.idle_timeout_sec = 1;
    auto laptop = join("laptop", "tok-laptop", "s1", DeviceRole::Executor);
    auto phone = join("phone", "tok-phone", "s1", DeviceRole::Controller);

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    relay.handle_frame(laptop, make_heartbeat_frame());

    EXPECT_EQ(relay.evict_idle(std::chrono::steady_clock::now()), 1u);
    EXPECT_EQ(phone->closes, 1);
    EXPECT_EQ(laptop->closes, 0);

    // The socket close that follows the eviction must not announce again.
    relay.on_disconnect(phone.get(), "closed");
    relay.on_disconnect(phone.get(), "closed");

    auto left = laptop->frames(FrameType::MemberLeft);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].body.at("payload").as_object().at("reason").as_string(), "idle_timeout");
    EXPECT_FALSE(presence.is_member("s1", "phone"));
}

TEST_F(MessageRelayTest, ReconnectReplacesOldConnection) {
    auto laptop = join("laptop", "tok-laptop", "s1", DeviceRole::Executor);
    auto old_phone = join("phone", "tok-phone", "s1", DeviceRole::Controller);
    auto new_phone = connect("phone", "tok-phone");

    EXPECT_EQ(old_phone->closes, 1);
    EXPECT_EQ(conn_manager.get_connection("phone"), new_phone);
    ASSERT_EQ(laptop->count(FrameType::MemberLeft), 1u);

    // The late close of the superseded socket changes nothing.
    relay.on_disconnect(old_phone.get(), "closed");
    EXPECT_TRUE(conn_manager.is_online("phone"));
    EXPECT_EQ(laptop->count(FrameType::MemberLeft), 1u);

    relay.handle_frame(new_phone, make_join_session_frame("s1", DeviceRole::Controller));
    EXPECT_EQ(laptop->count(FrameType::MemberJoined), 2u);
}

TEST_F(MessageRelayTest, SessionMemberGauge) {
    auto laptop = join("laptop", "tok-laptop", "s1", DeviceRole::Executor);
    auto phone = join("phone", "tok-phone", "s1", DeviceRole::Controller);
    EXPECT_EQ(MetricsRegistry::instance().get_gauge("tether_session_members"), 2.0);

    relay.on_disconnect(phone.get(), "closed");
    EXPECT_EQ(MetricsRegistry::instance().get_gauge("tether_session_members"), 1.0);
}
