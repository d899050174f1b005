#include "envelope.hpp"
#include "input_validator.hpp"

namespace json = boost::json;

namespace tether {

namespace {

int64_t int_field(const json::object& obj, const char* key, int64_t fallback) {
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (it->value().is_int64()) return it->value().get_int64();
    if (it->value().is_uint64()) return static_cast<int64_t>(it->value().get_uint64());
    return fallback;
}

bool is_integer(const json::value& v) {
    return v.is_int64() || v.is_uint64();
}

}

json::object envelope_to_json(const EncryptedEnvelope& envelope) {
    json::object payload;
    payload["alg"] = envelope.alg;
    payload["nonce"] = envelope.nonce;
    payload["ciphertext"] = envelope.ciphertext;

    json::object meta;
    meta["clientTs"] = envelope.created_at;
    meta["schemaVersion"] = envelope.schema_version;

    json::object obj;
    obj["sessionId"] = envelope.session_id;
    obj["channel"] = channel_name(envelope.channel);
    obj["eventId"] = envelope.event_id;
    obj["sequenceNumber"] = envelope.sequence_number;
    obj["senderDeviceId"] = envelope.sender_device_id;
    obj["createdAt"] = envelope.created_at;
    obj["payload"] = std::move(payload);
    obj["meta"] = std::move(meta);
    return obj;
}

std::string validate_envelope_shape(const json::object& obj) {
    auto session_id = InputValidator::string_field(obj, "sessionId");
    if (!InputValidator::is_valid_id(session_id)) return "invalid sessionId";

    if (!parse_channel(InputValidator::string_field(obj, "channel"))) return "invalid channel";

    auto event_id = InputValidator::string_field(obj, "eventId");
    if (!InputValidator::is_valid_id(event_id)) return "invalid eventId";

    auto payload_it = obj.find("payload");
    if (payload_it == obj.end() || !payload_it->value().is_object()) return "missing payload";
    const auto& payload = payload_it->value().get_object();

    if (InputValidator::string_field(payload, "alg").empty()) return "missing payload.alg";
    if (!InputValidator::is_valid_base64(InputValidator::string_field(payload, "nonce"))) {
        return "invalid payload.nonce";
    }
    if (!InputValidator::is_valid_base64(InputValidator::string_field(payload, "ciphertext"))) {
        return "invalid payload.ciphertext";
    }

    if (auto it = obj.find("meta"); it != obj.end()) {
        if (!it->value().is_object()) return "invalid meta";
        const auto& meta = it->value().get_object();
        if (auto ts = meta.find("clientTs"); ts != meta.end() && !is_integer(ts->value())) {
            return "invalid meta.clientTs";
        }
        if (auto sv = meta.find("schemaVersion"); sv != meta.end() && !is_integer(sv->value())) {
            return "invalid meta.schemaVersion";
        }
    }

    if (auto it = obj.find("sequenceNumber"); it != obj.end()) {
        if (!is_integer(it->value()) || int_field(obj, "sequenceNumber", -1) < 0) {
            return "invalid sequenceNumber";
        }
    }

    if (auto it = obj.find("senderDeviceId"); it != obj.end()) {
        if (!it->value().is_string() || !InputValidator::is_valid_id(InputValidator::string_field(obj, "senderDeviceId"))) {
            return "invalid senderDeviceId";
        }
    }
    return "";
}

EncryptedEnvelope envelope_from_json(const json::object& obj) {
    std::string reason = validate_envelope_shape(obj);
    if (!reason.empty()) {
        throw EnvelopeError(reason);
    }

    const auto& payload = obj.at("payload").get_object();

    EncryptedEnvelope envelope;
    envelope.session_id = std::string(InputValidator::string_field(obj, "sessionId"));
    envelope.channel = *parse_channel(InputValidator::string_field(obj, "channel"));
    envelope.event_id = std::string(InputValidator::string_field(obj, "eventId"));
    envelope.sequence_number = int_field(obj, "sequenceNumber", 0);
    envelope.sender_device_id = std::string(InputValidator::string_field(obj, "senderDeviceId"));
    envelope.alg = std::string(InputValidator::string_field(payload, "alg"));
    envelope.nonce = std::string(InputValidator::string_field(payload, "nonce"));
    envelope.ciphertext = std::string(InputValidator::string_field(payload, "ciphertext"));

    int64_t client_ts = 0;
    if (auto it = obj.find("meta"); it != obj.end()) {
        const auto& meta = it->value().get_object();
        client_ts = int_field(meta, "clientTs", 0);
        envelope.schema_version = static_cast<int>(int_field(meta, "schemaVersion", ENVELOPE_SCHEMA_VERSION));
    }
    envelope.created_at = int_field(obj, "createdAt", client_ts);
    return envelope;
}

std::string envelope_aad(const std::string& session_id, const std::string& event_id, Channel channel) {
    return session_id + "|" + event_id + "|" + channel_name(channel);
}

EncryptedEnvelope seal_envelope(EncryptedEnvelope header, const std::string& plaintext,
                                const SecureBytes& session_key) {
    auto nonce = Crypto::random_bytes(Crypto::NONCE_SIZE);
    auto ct = Crypto::aead_encrypt(session_key, nonce,
                                   reinterpret_cast<const unsigned char*>(plaintext.data()), plaintext.size(),
                                   envelope_aad(header.session_id, header.event_id, header.channel));
    header.alg = ENVELOPE_ALGORITHM;
    header.nonce = Crypto::base64_encode(nonce);
    header.ciphertext = Crypto::base64_encode(ct);
    return header;
}

std::string open_envelope(const EncryptedEnvelope& envelope, const SecureBytes& session_key) {
    if (envelope.alg != ENVELOPE_ALGORITHM) {
        throw CryptoError("Unsupported envelope algorithm: " + envelope.alg);
    }
    auto nonce = Crypto::base64_decode(envelope.nonce);
    auto ct = Crypto::base64_decode(envelope.ciphertext);
    auto pt = Crypto::aead_decrypt(session_key, nonce, ct,
                                   envelope_aad(envelope.session_id, envelope.event_id, envelope.channel));
    return std::string(reinterpret_cast<const char*>(pt.data()), pt.size());
}

}
