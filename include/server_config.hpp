#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <chrono>

namespace tether {

// Relay server configuration and deployment policy.
struct ServerConfig {
    // --- Network & Infrastructure ---
    std::string address = "0.0.0.0";
    uint16_t port = 8080;
    std::string redis_url = "tcp://127.0.0.1:6379";
    int thread_count = 0;  // 0 defaults to hardware concurrency

    // --- Transport Layer Security (TLS) ---
    bool enable_tls = false;
    std::string cert_path = "certs/server.crt";
    std::string key_path = "certs/server.key";

    // --- Connection & Resource Management ---
    size_t max_message_size = 1024 * 1024;  // 1MB
    size_t max_connections_per_ip = 10;
    size_t max_global_connections = 100000;
    int connection_timeout_sec = 60;

    // --- Presence ---
    int idle_timeout_sec = 90;          // no traffic for this long evicts the device
    int idle_sweep_interval_sec = 15;
    size_t presence_shards = 64;
    bool allow_view_only_input = false; // session policy for REMOTE_CONTROL "input" from viewers

    // --- Cloud sync & grant store ---
    size_t max_batch_messages = 500;
    int grant_ttl_sec = 7 * 24 * 3600;
    int message_ttl_sec = 30 * 24 * 3600;

    // --- Identity & Secrets ---
    std::string secret_salt = "tether_default_deployment_salt"; // MUST be overridden via ENV in production
    std::string admin_token = ""; // Used for privileged stats/metrics access

    // --- Cross-Origin Resource Sharing (CORS) ---
    std::vector<std::string> allowed_origins = {};

    // --- Protocol Constraints ---
    size_t max_json_depth = 16;
};

// Device-side relay connection settings.
struct RelayClientConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8080;
    std::string path = "/ws";
    bool use_tls = false;
    bool verify_tls = true;

    std::chrono::milliseconds heartbeat_interval{30000};
    std::chrono::milliseconds reconnect_delay{2000};  // fixed, not exponential
    int max_reconnect_attempts = 10;
    std::chrono::milliseconds auth_timeout{10000};

    bool allow_view_only_input = false;
};

// Cloud endpoint used by the sync worker, grant store and device directory.
struct ApiClientConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8080;
    bool use_tls = false;
    bool verify_tls = true;
    std::chrono::milliseconds request_timeout{15000};
};

struct SyncWorkerConfig {
    size_t batch_size = 50;
    std::chrono::milliseconds flush_interval{500};
    std::chrono::seconds backoff_base{2};
    std::chrono::seconds backoff_max{300};
    int backoff_steps = 7;  // doubling attempts before the delay pins at backoff_max; 0 disables
    int max_retries = 20;  // reaching this marks the entry failed; it is never deleted
    std::string outbox_path = "tether_outbox.db";
};

// Applies TETHER_* environment variables on top of the given defaults.
void apply_env_overrides(ServerConfig& config);
void apply_env_overrides(RelayClientConfig& config);
void apply_env_overrides(ApiClientConfig& config);
void apply_env_overrides(SyncWorkerConfig& config);

// Splits a comma separated list, dropping empty items.
std::vector<std::string> split_list(const std::string& value);

}
