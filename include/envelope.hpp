#pragma once

#include <string>
#include <cstdint>
#include <stdexcept>
#include <boost/json.hpp>

#include "channel_router.hpp"
#include "crypto.hpp"

namespace tether {

constexpr const char* ENVELOPE_ALGORITHM = "chacha20-poly1305";
constexpr int ENVELOPE_SCHEMA_VERSION = 1;

class EnvelopeError : public std::runtime_error {
public:
    explicit EnvelopeError(const std::string& what) : std::runtime_error(what) {}
};

// Sealed unit of transport and storage. nonce and ciphertext are base64 and opaque
// to everything but the holder of the session key.
struct EncryptedEnvelope {
    std::string session_id;
    Channel channel = Channel::Conversation;
    std::string event_id;
    int64_t sequence_number = 0;
    std::string sender_device_id;
    int64_t created_at = 0;  // ms since epoch
    std::string alg = ENVELOPE_ALGORITHM;
    std::string nonce;
    std::string ciphertext;
    int schema_version = ENVELOPE_SCHEMA_VERSION;
};

// Frame body: {sessionId, channel, eventId, sequenceNumber, senderDeviceId, createdAt,
//              payload:{alg, nonce, ciphertext}, meta:{clientTs, schemaVersion}}
boost::json::object envelope_to_json(const EncryptedEnvelope& envelope);

// Throws EnvelopeError when the structure is invalid.
EncryptedEnvelope envelope_from_json(const boost::json::object& obj);

/**
 * Structural validation only; the ciphertext is never decoded beyond checking
 * it is well-formed base64.
 * @return empty string when valid, otherwise the reason.
 */
std::string validate_envelope_shape(const boost::json::object& obj);

// Additional data bound into the AEAD tag so an envelope cannot be replayed
// under a different session, event or channel.
std::string envelope_aad(const std::string& session_id, const std::string& event_id, Channel channel);

// Seals plaintext for the given header. The header's nonce/ciphertext are filled in.
EncryptedEnvelope seal_envelope(EncryptedEnvelope header, const std::string& plaintext,
                                const SecureBytes& session_key);

// Throws CryptoError if the key is wrong or the envelope was tampered with.
std::string open_envelope(const EncryptedEnvelope& envelope, const SecureBytes& session_key);

enum class StoreOutcome {
    Stored,
    Duplicate
};

// Cloud-side persistence of sealed envelopes, idempotent per eventId.
class EnvelopeStore {
public:
    virtual ~EnvelopeStore() = default;

    // Throws on storage failure.
    virtual StoreOutcome store_envelope(const EncryptedEnvelope& envelope, const std::string& serialized) = 0;
};

}
