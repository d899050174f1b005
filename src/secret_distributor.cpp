#include "secret_distributor.hpp"
#include "logger.hpp"
#include "metrics.hpp"

#include <chrono>

namespace tether {

namespace {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Returns an empty vector when the key is missing or not a 32-byte X25519 key.
std::vector<unsigned char> decode_public_key(const std::string& b64) {
    if (b64.empty()) return {};
    try {
        auto key = Crypto::base64_decode(b64);
        if (key.size() != Crypto::X25519_KEY_SIZE) return {};
        return key;
    } catch (const CryptoError&) {
        return {};
    }
}

}

const char* secret_error_name(SecretErrorCode code) {
    switch (code) {
        case SecretErrorCode::NotAuthenticated: return "NotAuthenticated";
        case SecretErrorCode::NoDeviceIdentity: return "NoDeviceIdentity";
        case SecretErrorCode::SessionNotFound: return "SessionNotFound";
        case SecretErrorCode::Encryption: return "Encryption";
        case SecretErrorCode::Storage: return "Storage";
    }
    return "Unknown";
}

SecretDistributor::SecretDistributor(DeviceDirectory& directory, GrantStore& grants, KeyCache& cache)
    : directory_(directory), grants_(grants), cache_(cache) {}

void SecretDistributor::set_user(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    user_id_ = user_id;
}

void SecretDistributor::set_device_identity(const std::string& device_id, SecureBytes private_key) {
    auto public_key = Crypto::x25519_public_from_private(private_key);
    std::lock_guard<std::mutex> lock(mutex_);
    device_id_ = device_id;
    private_key_ = std::move(private_key);
    public_key_ = std::move(public_key);
}

void SecretDistributor::clear() {
    std::string user;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        user = user_id_;
        user_id_.clear();
        device_id_.clear();
        private_key_.clear();
        public_key_.clear();
        pending_.clear();
    }
    if (!user.empty()) {
        cache_.clear_user(user);
    }
}

void SecretDistributor::require_identity(std::string& user_id, std::string& device_id, SecureBytes& private_key,
                                         std::vector<unsigned char>* public_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (user_id_.empty()) {
        throw SecretError(SecretErrorCode::NotAuthenticated, "no user context");
    }
    if (device_id_.empty() || private_key_.empty()) {
        throw SecretError(SecretErrorCode::NoDeviceIdentity, "local device is not registered");
    }
    user_id = user_id_;
    device_id = device_id_;
    private_key = private_key_;
    if (public_key) *public_key = public_key_;
}

SecretGrant SecretDistributor::wrap_for_recipient(const std::string& session_id, const SecureBytes& session_key,
                                                  const std::string& recipient_device_id,
                                                  const std::vector<unsigned char>& recipient_public_key) {
    // The ephemeral private key and every derived secret are wiped when this scope ends.
    X25519KeyPair ephemeral = Crypto::generate_x25519_keypair();
    SecureBytes shared = Crypto::x25519_shared_secret(ephemeral.private_key, recipient_public_key);
    SecureBytes wrapping_key = Crypto::hkdf_sha256(shared, session_id, SESSION_SECRET_INFO, Crypto::KEY_SIZE);
    auto sealed = Crypto::aead_seal(wrapping_key, session_key.data(), session_key.size());

    SecretGrant grant;
    grant.session_id = session_id;
    grant.recipient_device_id = recipient_device_id;
    grant.ephemeral_public_key = Crypto::base64_encode(ephemeral.public_key);
    grant.encrypted_session_key = Crypto::base64_encode(sealed);
    grant.created_at = now_ms();
    return grant;
}

SecureBytes SecretDistributor::unwrap_grant(const SecretGrant& grant, const SecureBytes& recipient_private_key) {
    auto ephemeral_public = Crypto::base64_decode(grant.ephemeral_public_key);
    if (ephemeral_public.size() != Crypto::X25519_KEY_SIZE) {
        throw CryptoError("grant ephemeral key has wrong length");
    }
    SecureBytes shared = Crypto::x25519_shared_secret(recipient_private_key, ephemeral_public);
    SecureBytes wrapping_key = Crypto::hkdf_sha256(shared, grant.session_id, SESSION_SECRET_INFO, Crypto::KEY_SIZE);

    auto sealed = Crypto::base64_decode(grant.encrypted_session_key);
    SecureBytes session_key = Crypto::aead_open(wrapping_key, sealed);
    if (session_key.size() != Crypto::KEY_SIZE) {
        throw CryptoError("unwrapped session key has wrong length");
    }
    return session_key;
}

std::vector<SecretGrant> SecretDistributor::distribute_secret(const std::string& session_id,
                                                              const SecureBytes& session_key) {
    std::string user_id, device_id;
    SecureBytes private_key;
    std::vector<unsigned char> own_public;
    require_identity(user_id, device_id, private_key, &own_public);

    if (session_key.size() != Crypto::KEY_SIZE) {
        throw SecretError(SecretErrorCode::Encryption, "session key must be 32 bytes");
    }

    std::vector<SecretGrant> grants;

    // Local device first: a failure here is fatal, the owner could never read its own session.
    try {
        grants.push_back(wrap_for_recipient(session_id, session_key, device_id, own_public));
    } catch (const CryptoError& e) {
        throw SecretError(SecretErrorCode::Encryption, e.what());
    }

    std::vector<DeviceRecord> devices;
    try {
        devices = directory_.list_user_devices(user_id);
    } catch (const std::exception& e) {
        throw SecretError(SecretErrorCode::Storage, std::string("device lookup failed: ") + e.what());
    }

    for (const auto& device : devices) {
        if (device.device_id == device_id) continue;

        auto public_key = decode_public_key(device.public_key);
        if (public_key.empty()) {
            Logger::log(Logger::Level::WARNING, Logger::EventType::CRYPTO, device.device_id,
                        "Skipping device without a valid public key");
            continue;
        }

        try {
            grants.push_back(wrap_for_recipient(session_id, session_key, device.device_id, public_key));
        } catch (const CryptoError& e) {
            throw SecretError(SecretErrorCode::Encryption,
                              "wrapping for " + device.device_id + " failed: " + e.what());
        }
    }

    try {
        if (!grants_.store_grants(grants)) {
            throw SecretError(SecretErrorCode::Storage, "grant store rejected the batch");
        }
    } catch (const SecretError&) {
        throw;
    } catch (const std::exception& e) {
        throw SecretError(SecretErrorCode::Storage, e.what());
    }

    // The distributing device already holds the plaintext key.
    cache_.put(user_id, session_id, session_key);

    MetricsRegistry::instance().increment_counter("tether_secret_grants_total", static_cast<double>(grants.size()));
    Logger::log(Logger::Level::INFO, Logger::EventType::CRYPTO, session_id,
                "Distributed session secret to " + std::to_string(grants.size()) + " device(s)");
    return grants;
}

SecureBytes SecretDistributor::open_grant(const SecretGrant& grant) const {
    std::string user_id, device_id;
    SecureBytes private_key;
    require_identity(user_id, device_id, private_key);

    if (grant.recipient_device_id != device_id) {
        throw SecretError(SecretErrorCode::Encryption, "grant is addressed to another device");
    }
    try {
        return unwrap_grant(grant, private_key);
    } catch (const CryptoError& e) {
        throw SecretError(SecretErrorCode::Encryption, e.what());
    }
}

void SecretDistributor::accept_grant(const SecretGrant& grant) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_[grant.session_id] = grant;
}

SecureBytes SecretDistributor::session_key(const std::string& session_id) {
    std::string user_id, device_id;
    SecureBytes private_key;
    require_identity(user_id, device_id, private_key);

    if (auto cached = cache_.get(user_id, session_id)) {
        return std::move(*cached);
    }

    std::optional<SecretGrant> grant;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(session_id);
        if (it != pending_.end()) grant = it->second;
    }

    if (!grant) {
        try {
            grant = grants_.fetch_grant(session_id, device_id);
        } catch (const std::exception& e) {
            throw SecretError(SecretErrorCode::Storage, std::string("grant fetch failed: ") + e.what());
        }
        if (!grant) {
            throw SecretError(SecretErrorCode::SessionNotFound, "no grant for session " + session_id);
        }
    }

    SecureBytes key = open_grant(*grant);
    cache_.put(user_id, session_id, key);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(session_id);
    }

    try {
        if (!grants_.delete_grant(session_id, device_id)) {
            Logger::log(Logger::Level::WARNING, Logger::EventType::CRYPTO, session_id,
                        "Consumed grant could not be removed from the store");
        }
    } catch (const std::exception& e) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::CRYPTO, session_id,
                    std::string("Grant removal failed: ") + e.what());
    }
    return key;
}

}
