#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <stdexcept>

#include "crypto.hpp"
#include "key_cache.hpp"
#include "key_storage.hpp"

namespace tether {

constexpr const char* SESSION_SECRET_INFO = "tether-session-secret-v1";

enum class SecretErrorCode {
    NotAuthenticated,   // no user context
    NoDeviceIdentity,   // local device not registered / no long-term key
    SessionNotFound,    // no grant exists for this device and session
    Encryption,         // ECDH, KDF or AEAD failure
    Storage             // directory or grant store failure
};

const char* secret_error_name(SecretErrorCode code);

class SecretError : public std::runtime_error {
public:
    SecretError(SecretErrorCode code, const std::string& what)
        : std::runtime_error(std::string(secret_error_name(code)) + ": " + what), code_(code) {}

    SecretErrorCode code() const { return code_; }

private:
    SecretErrorCode code_;
};

// Resolves the symmetric key of a session for the signed-in user.
class SessionKeyProvider {
public:
    virtual ~SessionKeyProvider() = default;

    // Throws SecretError when the key cannot be obtained.
    virtual SecureBytes session_key(const std::string& session_id) = 0;
};

// Hybrid-encryption fan-out of session keys to a user's devices, and the
// recipient-side unwrap that populates the KeyCache.
class SecretDistributor : public SessionKeyProvider {
public:
    SecretDistributor(DeviceDirectory& directory, GrantStore& grants, KeyCache& cache);

    void set_user(const std::string& user_id);
    void set_device_identity(const std::string& device_id, SecureBytes private_key);

    // Logout: forgets the identity and wipes this user's cached keys.
    void clear();

    /**
     * Wraps session_key for the local device and every other device of the user.
     * Devices whose public key is missing or malformed are skipped with a warning.
     * The grants are stored through the GrantStore before returning.
     */
    std::vector<SecretGrant> distribute_secret(const std::string& session_id, const SecureBytes& session_key);

    // Recipient-side unwrap with the local long-term key.
    SecureBytes open_grant(const SecretGrant& grant) const;

    // Holds a grant delivered out of band until the session key is first needed.
    void accept_grant(const SecretGrant& grant);

    // Cache hit, else local pending grant, else the grant store.
    SecureBytes session_key(const std::string& session_id) override;

    // Stateless halves, used by both sides and by tests.
    static SecretGrant wrap_for_recipient(const std::string& session_id, const SecureBytes& session_key,
                                          const std::string& recipient_device_id,
                                          const std::vector<unsigned char>& recipient_public_key);
    static SecureBytes unwrap_grant(const SecretGrant& grant, const SecureBytes& recipient_private_key);

private:
    DeviceDirectory& directory_;
    GrantStore& grants_;
    KeyCache& cache_;

    mutable std::mutex mutex_;
    std::string user_id_;
    std::string device_id_;
    SecureBytes private_key_;
    std::vector<unsigned char> public_key_;
    std::map<std::string, SecretGrant> pending_;  // session_id -> grant for this device

    void require_identity(std::string& user_id, std::string& device_id, SecureBytes& private_key,
                          std::vector<unsigned char>* public_key = nullptr) const;
};

}
