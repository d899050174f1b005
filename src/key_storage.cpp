#include "key_storage.hpp"
#include "input_validator.hpp"

#include <stdexcept>

namespace json = boost::json;

namespace tether {

json::object device_to_json(const DeviceRecord& device) {
    json::object obj;
    obj["deviceId"] = device.device_id;
    obj["userId"] = device.user_id;
    obj["name"] = device.name;
    obj["role"] = role_name(device.role);
    obj["publicKey"] = device.public_key;
    return obj;
}

DeviceRecord device_from_json(const json::object& obj) {
    DeviceRecord device;
    device.device_id = std::string(InputValidator::string_field(obj, "deviceId"));
    device.user_id = std::string(InputValidator::string_field(obj, "userId"));
    device.name = std::string(InputValidator::string_field(obj, "name"));
    device.role = parse_role(InputValidator::string_field(obj, "role")).value_or(DeviceRole::Viewer);
    device.public_key = std::string(InputValidator::string_field(obj, "publicKey"));
    return device;
}

json::object grant_to_json(const SecretGrant& grant) {
    json::object obj;
    obj["sessionId"] = grant.session_id;
    obj["recipientDeviceId"] = grant.recipient_device_id;
    obj["ephemeralPublicKey"] = grant.ephemeral_public_key;
    obj["encryptedSessionKey"] = grant.encrypted_session_key;
    obj["createdAt"] = grant.created_at;
    return obj;
}

SecretGrant grant_from_json(const json::object& obj) {
    SecretGrant grant;
    grant.session_id = std::string(InputValidator::string_field(obj, "sessionId"));
    grant.recipient_device_id = std::string(InputValidator::string_field(obj, "recipientDeviceId"));
    grant.ephemeral_public_key = std::string(InputValidator::string_field(obj, "ephemeralPublicKey"));
    grant.encrypted_session_key = std::string(InputValidator::string_field(obj, "encryptedSessionKey"));
    if (auto it = obj.find("createdAt"); it != obj.end() && it->value().is_int64()) {
        grant.created_at = it->value().get_int64();
    }

    if (grant.session_id.empty() || grant.recipient_device_id.empty() ||
        grant.ephemeral_public_key.empty() || grant.encrypted_session_key.empty()) {
        throw std::invalid_argument("incomplete secret grant");
    }
    return grant;
}

}
