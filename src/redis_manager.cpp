#include "redis_manager.hpp"
#include "server_config.hpp"
#include "input_validator.hpp"
#include "logger.hpp"
#include "crypto.hpp"

#include <openssl/crypto.h>
#include <chrono>
#include <iterator>
#include <unordered_map>
#include <unordered_set>
#include <stdexcept>

namespace json = boost::json;

namespace tether {

namespace {

std::string device_key(const std::string& device_id) { return "device:" + device_id; }
std::string user_devices_key(const std::string& user_id) { return "user_devices:" + user_id; }
std::string grant_key(const std::string& session_id, const std::string& device_id) {
    return "grant:" + session_id + ":" + device_id;
}

DeviceRecord record_from_hash(const std::string& device_id,
                              const std::unordered_map<std::string, std::string>& fields) {
    auto field = [&](const char* name) -> std::string {
        auto it = fields.find(name);
        return it == fields.end() ? std::string() : it->second;
    };

    DeviceRecord device;
    device.device_id = device_id;
    device.user_id = field("user_id");
    device.name = field("name");
    device.role = parse_role(field("role")).value_or(DeviceRole::Viewer);
    device.public_key = field("public_key");
    return device;
}

}

RedisManager::RedisManager(const ServerConfig& config)
    : grant_ttl_sec_(config.grant_ttl_sec), message_ttl_sec_(config.message_ttl_sec) {
    try {
        redis_ = std::make_unique<sw::redis::Redis>(config.redis_url);
        redis_->ping();
        connected_ = true;
        Logger::log(Logger::Level::INFO, Logger::EventType::SYSTEM, "redis", "Registry connected");
    } catch (const std::exception& e) {
        Logger::log(Logger::Level::ERROR, Logger::EventType::SYSTEM, "redis",
                    std::string("Registry connection failed: ") + e.what());
        connected_ = false;
    }
}

sw::redis::Redis& RedisManager::require() {
    if (!connected_ || !redis_) {
        throw std::runtime_error("device registry is not connected");
    }
    return *redis_;
}

// Tokens are stored as SHA-256 and compared in constant time.
std::optional<DeviceRecord> RedisManager::authenticate(const std::string& device_id,
                                                       const std::string& device_token) {
    if (device_id.empty() || device_token.empty()) return std::nullopt;

    std::unordered_map<std::string, std::string> fields;
    require().hgetall(device_key(device_id), std::inserter(fields, fields.begin()));
    if (fields.empty()) return std::nullopt;

    auto stored = fields.find("token_sha256");
    if (stored == fields.end()) return std::nullopt;

    std::string presented = Crypto::sha256_hex(device_token);
    if (stored->second.size() != presented.size() ||
        CRYPTO_memcmp(stored->second.data(), presented.data(), presented.size()) != 0) {
        return std::nullopt;
    }
    return record_from_hash(device_id, fields);
}

std::optional<DeviceRecord> RedisManager::get_device(const std::string& device_id) {
    std::unordered_map<std::string, std::string> fields;
    require().hgetall(device_key(device_id), std::inserter(fields, fields.begin()));
    if (fields.empty()) return std::nullopt;
    return record_from_hash(device_id, fields);
}

// A device id belongs to one account for its whole life.
bool RedisManager::register_device(const DeviceRecord& device, const std::string& device_token) {
    if (!InputValidator::is_valid_id(device.device_id) || !InputValidator::is_valid_id(device.user_id) ||
        device_token.empty()) {
        return false;
    }

    try {
        auto& redis = require();
        auto owner = redis.hget(device_key(device.device_id), "user_id");
        if (owner && *owner != device.user_id) {
            Logger::log(Logger::Level::WARNING, Logger::EventType::AUTH_FAILURE, device.device_id,
                        "Registration refused: device belongs to another account");
            return false;
        }

        std::unordered_map<std::string, std::string> fields = {
            {"user_id", device.user_id},
            {"role", role_name(device.role)},
            {"name", device.name},
            {"public_key", device.public_key},
            {"token_sha256", Crypto::sha256_hex(device_token)},
        };

        auto tx = redis.transaction();
        tx.hset(device_key(device.device_id), fields.begin(), fields.end())
          .sadd(user_devices_key(device.user_id), device.device_id);
        tx.exec();
        return true;
    } catch (const std::exception& e) {
        Logger::log(Logger::Level::ERROR, Logger::EventType::SYSTEM, device.device_id,
                    std::string("Device registration failed: ") + e.what());
        return false;
    }
}

std::vector<DeviceRecord> RedisManager::list_user_devices(const std::string& user_id) {
    auto& redis = require();

    std::unordered_set<std::string> ids;
    redis.smembers(user_devices_key(user_id), std::inserter(ids, ids.begin()));

    std::vector<DeviceRecord> devices;
    devices.reserve(ids.size());
    for (const auto& id : ids) {
        std::unordered_map<std::string, std::string> fields;
        redis.hgetall(device_key(id), std::inserter(fields, fields.begin()));
        if (fields.empty()) {
            // Stale index entry
            redis.srem(user_devices_key(user_id), id);
            continue;
        }
        devices.push_back(record_from_hash(id, fields));
    }
    return devices;
}

bool RedisManager::remove_device(const std::string& device_id) {
    try {
        auto& redis = require();
        auto owner = redis.hget(device_key(device_id), "user_id");
        auto tx = redis.transaction();
        tx.del(device_key(device_id));
        if (owner) {
            tx.srem(user_devices_key(*owner), device_id);
        }
        tx.exec();
        return static_cast<bool>(owner);
    } catch (const std::exception& e) {
        Logger::log(Logger::Level::ERROR, Logger::EventType::SYSTEM, device_id,
                    std::string("Device removal failed: ") + e.what());
        return false;
    }
}

// MULTI/EXEC keeps the batch all-or-nothing.
bool RedisManager::store_grants(const std::vector<SecretGrant>& grants) {
    if (grants.empty()) return true;

    auto tx = require().transaction();
    for (const auto& grant : grants) {
        tx.set(grant_key(grant.session_id, grant.recipient_device_id),
               json::serialize(grant_to_json(grant)),
               std::chrono::seconds(grant_ttl_sec_));
    }
    tx.exec();
    return true;
}

std::optional<SecretGrant> RedisManager::fetch_grant(const std::string& session_id, const std::string& device_id) {
    auto value = require().get(grant_key(session_id, device_id));
    if (!value) return std::nullopt;

    try {
        auto parsed = InputValidator::safe_parse_json(*value);
        if (!parsed.is_object()) return std::nullopt;
        return grant_from_json(parsed.get_object());
    } catch (const std::exception& e) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::CRYPTO, session_id,
                    std::string("Discarding unreadable grant: ") + e.what());
        return std::nullopt;
    }
}

bool RedisManager::delete_grant(const std::string& session_id, const std::string& device_id) {
    return require().del(grant_key(session_id, device_id)) > 0;
}

StoreOutcome RedisManager::store_envelope(const EncryptedEnvelope& envelope, const std::string& serialized) {
    auto& redis = require();
    auto ttl = std::chrono::seconds(message_ttl_sec_);

    bool stored = redis.set("event:" + envelope.event_id, serialized, ttl, sw::redis::UpdateType::NOT_EXIST);
    if (!stored) {
        return StoreOutcome::Duplicate;
    }

    std::string index = "session_events:" + envelope.session_id;
    redis.zadd(index, envelope.event_id, static_cast<double>(envelope.sequence_number));
    redis.expire(index, ttl);
    return StoreOutcome::Stored;
}

std::vector<std::string> RedisManager::session_event_ids(const std::string& session_id) {
    std::vector<std::string> ids;
    require().zrange("session_events:" + session_id, 0, -1, std::back_inserter(ids));
    return ids;
}

void RedisManager::purge_session(const std::string& session_id) {
    auto& redis = require();
    for (const auto& id : session_event_ids(session_id)) {
        redis.del("event:" + id);
    }
    redis.del("session_events:" + session_id);
}

}
