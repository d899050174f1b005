#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <stdexcept>
#include <cstdint>

namespace tether {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& what) : std::runtime_error(what) {}
};

// Byte buffer for key material. Contents are wiped with OPENSSL_cleanse when the
// buffer is destroyed or overwritten.
class SecureBytes {
public:
    SecureBytes() = default;
    explicit SecureBytes(size_t size);
    SecureBytes(const unsigned char* data, size_t size);
    explicit SecureBytes(std::vector<unsigned char>&& data);
    ~SecureBytes();

    SecureBytes(const SecureBytes& other);
    SecureBytes& operator=(const SecureBytes& other);
    SecureBytes(SecureBytes&& other) noexcept;
    SecureBytes& operator=(SecureBytes&& other) noexcept;

    unsigned char* data() { return data_.data(); }
    const unsigned char* data() const { return data_.data(); }
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    // Constant-time comparison.
    bool equals(const unsigned char* other, size_t size) const;
    bool operator==(const SecureBytes& other) const { return equals(other.data(), other.size()); }

    void clear();

private:
    std::vector<unsigned char> data_;
};

struct X25519KeyPair {
    SecureBytes private_key;               // 32 bytes
    std::vector<unsigned char> public_key; // 32 bytes
};

// OpenSSL-backed primitives used by envelope sealing and secret distribution.
class Crypto {
public:
    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;
    static constexpr size_t X25519_KEY_SIZE = 32;

    static std::vector<unsigned char> random_bytes(size_t size);
    static SecureBytes random_key();

    static X25519KeyPair generate_x25519_keypair();
    static std::vector<unsigned char> x25519_public_from_private(const SecureBytes& private_key);
    static SecureBytes x25519_shared_secret(const SecureBytes& private_key,
                                            const std::vector<unsigned char>& peer_public_key);

    static SecureBytes hkdf_sha256(const SecureBytes& ikm, std::string_view salt,
                                   std::string_view info, size_t length);

    /**
     * ChaCha20-Poly1305 with a fresh random nonce.
     * Output layout: nonce(12) || ciphertext || tag(16).
     */
    static std::vector<unsigned char> aead_seal(const SecureBytes& key,
                                                const unsigned char* plaintext, size_t length,
                                                std::string_view aad = {});

    // Opens nonce || ciphertext || tag. Throws CryptoError on a bad tag or short input.
    static SecureBytes aead_open(const SecureBytes& key,
                                 const std::vector<unsigned char>& sealed,
                                 std::string_view aad = {});

    // Variant with the nonce carried separately, as in envelope payloads.
    static std::vector<unsigned char> aead_encrypt(const SecureBytes& key,
                                                   const std::vector<unsigned char>& nonce,
                                                   const unsigned char* plaintext, size_t length,
                                                   std::string_view aad);
    static SecureBytes aead_decrypt(const SecureBytes& key,
                                    const std::vector<unsigned char>& nonce,
                                    const std::vector<unsigned char>& ciphertext_and_tag,
                                    std::string_view aad);

    static std::string base64_encode(const unsigned char* data, size_t size);
    static std::string base64_encode(const std::vector<unsigned char>& data) {
        return base64_encode(data.data(), data.size());
    }
    // Throws CryptoError on malformed input.
    static std::vector<unsigned char> base64_decode(std::string_view encoded);

    static std::string sha256_hex(std::string_view data);

    // Time-sortable identifier (RFC 9562 version 7).
    static std::string uuid_v7();
};

}
