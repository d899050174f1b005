#pragma once

#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <optional>
#include <sw/redis++/redis++.h>

#include "key_storage.hpp"
#include "envelope.hpp"

namespace tether {

struct ServerConfig;

// Redis-backed registry and cloud store for the relay.
//   device:<deviceId>        hash {user_id, role, name, public_key, token_sha256}
//   user_devices:<userId>    set of deviceIds
//   grant:<sessionId>:<deviceId>  grant JSON, expires after grant_ttl_sec
//   event:<eventId>          envelope JSON, SET NX for idempotency
//   session_events:<sessionId>    zset of eventIds scored by sequence number
class RedisManager : public DeviceRegistry, public GrantStore, public EnvelopeStore {
public:
    explicit RedisManager(const ServerConfig& config);
    ~RedisManager() override = default;

    bool is_connected() const { return connected_; }

    // --- DeviceRegistry ---
    std::optional<DeviceRecord> authenticate(const std::string& device_id,
                                             const std::string& device_token) override;
    std::optional<DeviceRecord> get_device(const std::string& device_id) override;
    bool register_device(const DeviceRecord& device, const std::string& device_token) override;
    std::vector<DeviceRecord> list_user_devices(const std::string& user_id) override;

    bool remove_device(const std::string& device_id);

    // --- GrantStore ---
    bool store_grants(const std::vector<SecretGrant>& grants) override;
    std::optional<SecretGrant> fetch_grant(const std::string& session_id, const std::string& device_id) override;
    bool delete_grant(const std::string& session_id, const std::string& device_id) override;

    // --- EnvelopeStore ---
    StoreOutcome store_envelope(const EncryptedEnvelope& envelope, const std::string& serialized) override;

    // Stored eventIds of a session in sequence order.
    std::vector<std::string> session_event_ids(const std::string& session_id);

    // Removes every stored envelope of a session.
    void purge_session(const std::string& session_id);

private:
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> connected_{false};
    int grant_ttl_sec_;
    int message_ttl_sec_;

    sw::redis::Redis& require();
};

}
