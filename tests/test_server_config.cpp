#include <gtest/gtest.h>
#include "server_config.hpp"

#include <cstdlib>

using namespace tether;

namespace {

// Sets a variable for the lifetime of the guard.
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) { setenv(name, value, 1); }
    ~EnvGuard() { unsetenv(name_); }

private:
    const char* name_;
};

}

TEST(ServerConfigTest, DefaultValues) {
    ServerConfig config;
    EXPECT_EQ(config.address, "0.0.0.0");
    EXPECT_EQ(config.port, 8080);
    EXPECT_FALSE(config.enable_tls);
    EXPECT_EQ(config.max_message_size, 1024 * 1024);
    EXPECT_EQ(config.idle_timeout_sec, 90);
    EXPECT_FALSE(config.allow_view_only_input);
    EXPECT_EQ(config.secret_salt, "tether_default_deployment_salt");

    RelayClientConfig client;
    EXPECT_EQ(client.reconnect_delay, std::chrono::milliseconds(2000));
    EXPECT_EQ(client.max_reconnect_attempts, 10);
    EXPECT_TRUE(client.verify_tls);

    SyncWorkerConfig sync;
    EXPECT_EQ(sync.batch_size, 50u);
    EXPECT_EQ(sync.backoff_base, std::chrono::seconds(2));
    EXPECT_EQ(sync.backoff_max, std::chrono::seconds(300));
    EXPECT_EQ(sync.backoff_steps, 7);
}

TEST(ServerConfigTest, EnvOverrides) {
    EnvGuard port("TETHER_PORT", "9443");
    EnvGuard tls("TETHER_TLS", "true");
    EnvGuard origins("TETHER_ALLOWED_ORIGINS", "https://a.example,,https://b.example");
    EnvGuard shards("TETHER_PRESENCE_SHARDS", "0");

    ServerConfig config;
    apply_env_overrides(config);
    EXPECT_EQ(config.port, 9443);
    EXPECT_TRUE(config.enable_tls);
    ASSERT_EQ(config.allowed_origins.size(), 2u);
    EXPECT_EQ(config.allowed_origins[1], "https://b.example");
    EXPECT_EQ(config.presence_shards, 1u);
}

TEST(ServerConfigTest, MalformedValuesAreIgnored) {
    EnvGuard port("TETHER_PORT", "not-a-port");
    EnvGuard idle("TETHER_IDLE_TIMEOUT", "");

    ServerConfig config;
    apply_env_overrides(config);
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.idle_timeout_sec, 90);
}

TEST(ServerConfigTest, ClientOverrides) {
    EnvGuard verify("TETHER_TLS_VERIFY", "0");
    EnvGuard delay("TETHER_RECONNECT_DELAY_MS", "250");
    EnvGuard timeout("TETHER_API_TIMEOUT_MS", "5000");

    RelayClientConfig relay;
    apply_env_overrides(relay);
    EXPECT_FALSE(relay.verify_tls);
    EXPECT_EQ(relay.reconnect_delay, std::chrono::milliseconds(250));

    ApiClientConfig api;
    apply_env_overrides(api);
    EXPECT_FALSE(api.verify_tls);
    EXPECT_EQ(api.request_timeout, std::chrono::milliseconds(5000));
}

TEST(ServerConfigTest, SyncOverrides) {
    EnvGuard batch("TETHER_SYNC_BATCH_SIZE", "0");
    EnvGuard flush("TETHER_SYNC_FLUSH_MS", "100");
    EnvGuard path("TETHER_OUTBOX_PATH", "/tmp/outbox.db");

    SyncWorkerConfig config;
    apply_env_overrides(config);
    EXPECT_EQ(config.batch_size, 1u);
    EXPECT_EQ(config.flush_interval, std::chrono::milliseconds(100));
    EXPECT_EQ(config.outbox_path, "/tmp/outbox.db");
}

TEST(ServerConfigTest, SplitList) {
    EXPECT_TRUE(split_list("").empty());
    EXPECT_EQ(split_list("a").size(), 1u);
    auto items = split_list(",a,,b,");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0], "a");
    EXPECT_EQ(items[1], "b");
}
