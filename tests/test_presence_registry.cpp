#include <gtest/gtest.h>
#include "presence_registry.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace tether;

namespace {

Participant member(const std::string& device, DeviceRole role, const std::string& user = "alice") {
    Participant p;
    p.device_id = device;
    p.device_name = device;
    p.role = role;
    p.permission = default_permission(role);
    p.user_id = user;
    p.joined_at = 1;
    return p;
}

}

class PresenceRegistryTest : public ::testing::Test {
protected:
    PresenceRegistry presence{8};
};

TEST_F(PresenceRegistryTest, JoinReturnsFullMembership) {
    auto first = presence.join("s1", member("exec", DeviceRole::Executor));
    EXPECT_TRUE(first.added);
    EXPECT_EQ(first.participants.size(), 1u);

    auto second = presence.join("s1", member("phone", DeviceRole::Controller));
    EXPECT_TRUE(second.added);
    EXPECT_EQ(second.participants.size(), 2u);
    EXPECT_EQ(second.participant.role, DeviceRole::Controller);
    EXPECT_EQ(presence.session_count(), 1u);
}

TEST_F(PresenceRegistryTest, JoinIsIdempotent) {
    presence.join("s1", member("phone", DeviceRole::Controller));
    auto again = presence.join("s1", member("phone", DeviceRole::Viewer));
    EXPECT_FALSE(again.added);
    // The first record wins.
    EXPECT_EQ(again.participant.role, DeviceRole::Controller);
    EXPECT_EQ(presence.participants("s1").size(), 1u);
}

TEST_F(PresenceRegistryTest, SessionsAreSingleAccount) {
    presence.join("s1", member("exec", DeviceRole::Executor, "alice"));
    auto intruder = presence.join("s1", member("mallory-phone", DeviceRole::Viewer, "mallory"));
    EXPECT_TRUE(intruder.rejected);
    EXPECT_FALSE(intruder.added);
    EXPECT_FALSE(presence.is_member("s1", "mallory-phone"));
}

TEST_F(PresenceRegistryTest, LeaveReturnsRecordOnce) {
    presence.join("s1", member("phone", DeviceRole::Controller));
    auto removed = presence.leave("s1", "phone");
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->device_id, "phone");

    EXPECT_FALSE(presence.leave("s1", "phone").has_value());
    EXPECT_FALSE(presence.leave("nope", "phone").has_value());
    EXPECT_EQ(presence.session_count(), 0u);
}

TEST_F(PresenceRegistryTest, LeaveAllCoversEverySession) {
    presence.join("s1", member("phone", DeviceRole::Controller));
    presence.join("s2", member("phone", DeviceRole::Viewer));
    presence.join("s2", member("exec", DeviceRole::Executor));

    EXPECT_EQ(presence.sessions_of("phone").size(), 2u);
    auto removed = presence.leave_all("phone");
    EXPECT_EQ(removed.size(), 2u);
    EXPECT_TRUE(presence.sessions_of("phone").empty());
    EXPECT_TRUE(presence.is_member("s2", "exec"));

    EXPECT_TRUE(presence.leave_all("phone").empty());
}

TEST_F(PresenceRegistryTest, Find) {
    presence.join("s1", member("phone", DeviceRole::Viewer));
    auto found = presence.find("s1", "phone");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->permission, Permission::ViewOnly);
    EXPECT_FALSE(presence.find("s1", "exec").has_value());
}

TEST_F(PresenceRegistryTest, ZeroShardsIsClampedToOne) {
    PresenceRegistry single{0};
    EXPECT_EQ(single.shard_count(), 1u);
    single.join("s1", member("a", DeviceRole::Viewer));
    EXPECT_TRUE(single.is_member("s1", "a"));
}

TEST_F(PresenceRegistryTest, ConcurrentJoinLeave) {
    std::vector<std::thread> threads;
    std::atomic<int> removed{0};
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, t, &removed]() {
            std::string device = "dev" + std::to_string(t);
            for (int i = 0; i < 100; ++i) {
                presence.join("s" + std::to_string(i % 10), member(device, DeviceRole::Viewer));
            }
            removed += static_cast<int>(presence.leave_all(device).size());
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(removed.load(), 80);
    EXPECT_EQ(presence.session_count(), 0u);
}
