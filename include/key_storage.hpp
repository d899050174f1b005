#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <boost/json.hpp>

#include "relay_protocol.hpp"

namespace tether {

// Registered device as known to the device/session registry.
struct DeviceRecord {
    std::string device_id;
    std::string user_id;
    std::string name;
    DeviceRole role = DeviceRole::Viewer;
    std::string public_key;  // base64 X25519, may be empty for devices that never uploaded one
};

// Session key wrapped for exactly one recipient device.
struct SecretGrant {
    std::string session_id;
    std::string recipient_device_id;
    std::string ephemeral_public_key;   // base64, 32 bytes
    std::string encrypted_session_key;  // base64 nonce(12) || ciphertext || tag(16)
    int64_t created_at = 0;             // ms since epoch
};

boost::json::object device_to_json(const DeviceRecord& device);
DeviceRecord device_from_json(const boost::json::object& obj);

boost::json::object grant_to_json(const SecretGrant& grant);
// Throws std::invalid_argument when a required field is missing.
SecretGrant grant_from_json(const boost::json::object& obj);

// Read side of the registry: the devices owned by a user.
class DeviceDirectory {
public:
    virtual ~DeviceDirectory() = default;

    /**
     * Lists every device registered to a user, including the caller's own.
     * Throws on transport/storage failure; an unknown user yields an empty list.
     */
    virtual std::vector<DeviceRecord> list_user_devices(const std::string& user_id) = 0;
};

// Wire store for SecretGrants. Grants are consumed (deleted) once the recipient
// has unwrapped them.
class GrantStore {
public:
    virtual ~GrantStore() = default;

    // Stores all grants or none. Throws on transport failure.
    virtual bool store_grants(const std::vector<SecretGrant>& grants) = 0;

    // nullopt when no grant exists for the pair. Throws on transport failure.
    virtual std::optional<SecretGrant> fetch_grant(const std::string& session_id,
                                                   const std::string& device_id) = 0;

    virtual bool delete_grant(const std::string& session_id, const std::string& device_id) = 0;
};

// Server-side registry used to authenticate relay connections.
class DeviceRegistry : public DeviceDirectory {
public:
    /**
     * Validates a bearer credential for a device.
     * @return the device record on success, nullopt for unknown device or bad token.
     */
    virtual std::optional<DeviceRecord> authenticate(const std::string& device_id,
                                                     const std::string& device_token) = 0;

    virtual std::optional<DeviceRecord> get_device(const std::string& device_id) = 0;

    virtual bool register_device(const DeviceRecord& device, const std::string& device_token) = 0;
};

}
