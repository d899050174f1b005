#include "server_config.hpp"
#include "logger.hpp"

#include <cstdlib>
#include <stdexcept>

namespace tether {

namespace {

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

bool env_flag(const char* value) {
    std::string v(value);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

// Numeric parse that reports the offending variable instead of a bare stoi error.
template <typename T, typename Parse>
void parse_into(const char* name, T& out, Parse parse) {
    const char* v = env(name);
    if (!v) return;
    try {
        out = static_cast<T>(parse(std::string(v)));
    } catch (const std::exception&) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::SYSTEM, "internal",
                    std::string("Ignoring malformed ") + name);
    }
}

long long to_ll(const std::string& s) { return std::stoll(s); }

}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= value.size()) {
        size_t pos = value.find(',', start);
        if (pos == std::string::npos) pos = value.size();
        if (pos > start) out.push_back(value.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

void apply_env_overrides(ServerConfig& config) {
    if (const char* e = env("TETHER_ADDR")) config.address = e;
    parse_into("TETHER_PORT", config.port, to_ll);
    if (const char* e = env("TETHER_REDIS_URL")) config.redis_url = e;
    parse_into("TETHER_THREADS", config.thread_count, to_ll);
    if (const char* e = env("TETHER_TLS")) config.enable_tls = env_flag(e);
    if (const char* e = env("TETHER_CERT")) config.cert_path = e;
    if (const char* e = env("TETHER_KEY")) config.key_path = e;
    if (const char* e = env("TETHER_SECRET_SALT")) config.secret_salt = e;
    if (const char* e = env("TETHER_ADMIN_TOKEN")) config.admin_token = e;
    parse_into("TETHER_MAX_CONNS_PER_IP", config.max_connections_per_ip, to_ll);
    parse_into("TETHER_IDLE_TIMEOUT", config.idle_timeout_sec, to_ll);
    parse_into("TETHER_IDLE_SWEEP", config.idle_sweep_interval_sec, to_ll);
    parse_into("TETHER_PRESENCE_SHARDS", config.presence_shards, to_ll);
    if (const char* e = env("TETHER_ALLOW_VIEW_ONLY_INPUT")) config.allow_view_only_input = env_flag(e);
    if (const char* e = env("TETHER_ALLOWED_ORIGINS")) config.allowed_origins = split_list(e);

    if (config.presence_shards == 0) config.presence_shards = 1;
}

void apply_env_overrides(RelayClientConfig& config) {
    if (const char* e = env("TETHER_RELAY_HOST")) config.host = e;
    parse_into("TETHER_RELAY_PORT", config.port, to_ll);
    if (const char* e = env("TETHER_RELAY_PATH")) config.path = e;
    if (const char* e = env("TETHER_RELAY_TLS")) config.use_tls = env_flag(e);
    if (const char* e = env("TETHER_TLS_VERIFY")) config.verify_tls = env_flag(e);

    long long ms = -1;
    parse_into("TETHER_HEARTBEAT_MS", ms, to_ll);
    if (ms > 0) config.heartbeat_interval = std::chrono::milliseconds(ms);
    ms = -1;
    parse_into("TETHER_RECONNECT_DELAY_MS", ms, to_ll);
    if (ms >= 0) config.reconnect_delay = std::chrono::milliseconds(ms);
    parse_into("TETHER_MAX_RECONNECT", config.max_reconnect_attempts, to_ll);
    if (const char* e = env("TETHER_ALLOW_VIEW_ONLY_INPUT")) config.allow_view_only_input = env_flag(e);
}

void apply_env_overrides(ApiClientConfig& config) {
    if (const char* e = env("TETHER_API_HOST")) config.host = e;
    parse_into("TETHER_API_PORT", config.port, to_ll);
    if (const char* e = env("TETHER_API_TLS")) config.use_tls = env_flag(e);
    if (const char* e = env("TETHER_TLS_VERIFY")) config.verify_tls = env_flag(e);
    long long ms = -1;
    parse_into("TETHER_API_TIMEOUT_MS", ms, to_ll);
    if (ms > 0) config.request_timeout = std::chrono::milliseconds(ms);
}

void apply_env_overrides(SyncWorkerConfig& config) {
    parse_into("TETHER_SYNC_BATCH_SIZE", config.batch_size, to_ll);
    long long v = -1;
    parse_into("TETHER_SYNC_FLUSH_MS", v, to_ll);
    if (v > 0) config.flush_interval = std::chrono::milliseconds(v);
    parse_into("TETHER_SYNC_MAX_RETRIES", config.max_retries, to_ll);
    if (const char* e = env("TETHER_OUTBOX_PATH")) config.outbox_path = e;

    if (config.batch_size == 0) config.batch_size = 1;
}

}
