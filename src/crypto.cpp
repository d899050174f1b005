#include "crypto.hpp"
#include "input_validator.hpp"

#include <boost/beast/core/detail/base64.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <chrono>
#include <iomanip>
#include <limits>
#include <memory>
#include <sstream>

namespace tether {

namespace {

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using KdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;

void check(int rc, const char* what) {
    if (rc != 1) {
        throw CryptoError(what);
    }
}

int checked_int(size_t size, const char* label) {
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw CryptoError(std::string(label) + " too large");
    }
    return static_cast<int>(size);
}

const unsigned char* bytes(std::string_view s) {
    return reinterpret_cast<const unsigned char*>(s.data());
}

}

// ---------------------------------------------------------------------------
// SecureBytes
// ---------------------------------------------------------------------------

SecureBytes::SecureBytes(size_t size) : data_(size, 0) {}

SecureBytes::SecureBytes(const unsigned char* data, size_t size) : data_(data, data + size) {}

SecureBytes::SecureBytes(std::vector<unsigned char>&& data) : data_(std::move(data)) {}

SecureBytes::~SecureBytes() {
    clear();
}

SecureBytes::SecureBytes(const SecureBytes& other) : data_(other.data_) {}

SecureBytes& SecureBytes::operator=(const SecureBytes& other) {
    if (this != &other) {
        clear();
        data_ = other.data_;
    }
    return *this;
}

SecureBytes::SecureBytes(SecureBytes&& other) noexcept : data_(std::move(other.data_)) {
    other.data_.clear();
}

SecureBytes& SecureBytes::operator=(SecureBytes&& other) noexcept {
    if (this != &other) {
        clear();
        data_ = std::move(other.data_);
        other.data_.clear();
    }
    return *this;
}

bool SecureBytes::equals(const unsigned char* other, size_t size) const {
    if (size != data_.size()) return false;
    if (size == 0) return true;
    return CRYPTO_memcmp(data_.data(), other, size) == 0;
}

void SecureBytes::clear() {
    if (!data_.empty()) {
        OPENSSL_cleanse(data_.data(), data_.size());
    }
    data_.clear();
}

// ---------------------------------------------------------------------------
// Randomness
// ---------------------------------------------------------------------------

std::vector<unsigned char> Crypto::random_bytes(size_t size) {
    std::vector<unsigned char> out(size);
    if (size > 0) {
        check(RAND_bytes(out.data(), checked_int(size, "random length")), "CSPRNG failure");
    }
    return out;
}

SecureBytes Crypto::random_key() {
    SecureBytes key(KEY_SIZE);
    check(RAND_bytes(key.data(), static_cast<int>(KEY_SIZE)), "CSPRNG failure");
    return key;
}

// ---------------------------------------------------------------------------
// X25519
// ---------------------------------------------------------------------------

X25519KeyPair Crypto::generate_x25519_keypair() {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr), EVP_PKEY_CTX_free);
    if (!ctx) throw CryptoError("X25519 context allocation failed");
    check(EVP_PKEY_keygen_init(ctx.get()), "X25519 keygen init failed");

    EVP_PKEY* raw = nullptr;
    check(EVP_PKEY_keygen(ctx.get(), &raw), "X25519 keygen failed");
    PkeyPtr pkey(raw, EVP_PKEY_free);

    X25519KeyPair pair;
    pair.private_key = SecureBytes(X25519_KEY_SIZE);
    size_t priv_len = X25519_KEY_SIZE;
    check(EVP_PKEY_get_raw_private_key(pkey.get(), pair.private_key.data(), &priv_len),
          "X25519 private key export failed");

    pair.public_key.resize(X25519_KEY_SIZE);
    size_t pub_len = X25519_KEY_SIZE;
    check(EVP_PKEY_get_raw_public_key(pkey.get(), pair.public_key.data(), &pub_len),
          "X25519 public key export failed");
    return pair;
}

std::vector<unsigned char> Crypto::x25519_public_from_private(const SecureBytes& private_key) {
    if (private_key.size() != X25519_KEY_SIZE) throw CryptoError("X25519 private key must be 32 bytes");

    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr,
                                              private_key.data(), private_key.size()),
                 EVP_PKEY_free);
    if (!pkey) throw CryptoError("Invalid X25519 private key");

    std::vector<unsigned char> pub(X25519_KEY_SIZE);
    size_t len = X25519_KEY_SIZE;
    check(EVP_PKEY_get_raw_public_key(pkey.get(), pub.data(), &len), "X25519 public key export failed");
    return pub;
}

SecureBytes Crypto::x25519_shared_secret(const SecureBytes& private_key,
                                         const std::vector<unsigned char>& peer_public_key) {
    if (private_key.size() != X25519_KEY_SIZE) throw CryptoError("X25519 private key must be 32 bytes");
    if (peer_public_key.size() != X25519_KEY_SIZE) throw CryptoError("X25519 public key must be 32 bytes");

    PkeyPtr own(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr,
                                             private_key.data(), private_key.size()),
                EVP_PKEY_free);
    PkeyPtr peer(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr,
                                             peer_public_key.data(), peer_public_key.size()),
                 EVP_PKEY_free);
    if (!own || !peer) throw CryptoError("Invalid X25519 key");

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(own.get(), nullptr), EVP_PKEY_CTX_free);
    if (!ctx) throw CryptoError("ECDH context allocation failed");
    check(EVP_PKEY_derive_init(ctx.get()), "ECDH init failed");
    check(EVP_PKEY_derive_set_peer(ctx.get(), peer.get()), "ECDH peer rejected");

    size_t len = 0;
    check(EVP_PKEY_derive(ctx.get(), nullptr, &len), "ECDH length query failed");
    SecureBytes secret(len);
    check(EVP_PKEY_derive(ctx.get(), secret.data(), &len), "ECDH derive failed");
    return secret;
}

// ---------------------------------------------------------------------------
// HKDF-SHA256
// ---------------------------------------------------------------------------

SecureBytes Crypto::hkdf_sha256(const SecureBytes& ikm, std::string_view salt,
                                std::string_view info, size_t length) {
    if (ikm.empty()) throw CryptoError("HKDF input key material cannot be empty");

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "HKDF", nullptr);
    if (!kdf) throw CryptoError("Failed to fetch HKDF algorithm");
    KdfCtxPtr kctx(EVP_KDF_CTX_new(kdf), EVP_KDF_CTX_free);
    EVP_KDF_free(kdf);
    if (!kctx) throw CryptoError("Failed to create HKDF context");

    OSSL_PARAM params[5];
    int idx = 0;
    params[idx++] = OSSL_PARAM_construct_utf8_string("digest", const_cast<char*>("SHA256"), 0);
    params[idx++] = OSSL_PARAM_construct_octet_string(
        "key", const_cast<unsigned char*>(ikm.data()), ikm.size());
    if (!salt.empty()) {
        params[idx++] = OSSL_PARAM_construct_octet_string(
            "salt", const_cast<unsigned char*>(bytes(salt)), salt.size());
    }
    if (!info.empty()) {
        params[idx++] = OSSL_PARAM_construct_octet_string(
            "info", const_cast<unsigned char*>(bytes(info)), info.size());
    }
    params[idx] = OSSL_PARAM_construct_end();

    SecureBytes out(length);
    check(EVP_KDF_derive(kctx.get(), out.data(), out.size(), params), "HKDF derive failed");
    return out;
}

// ---------------------------------------------------------------------------
// ChaCha20-Poly1305
// ---------------------------------------------------------------------------

std::vector<unsigned char> Crypto::aead_encrypt(const SecureBytes& key,
                                                const std::vector<unsigned char>& nonce,
                                                const unsigned char* plaintext, size_t length,
                                                std::string_view aad) {
    if (key.size() != KEY_SIZE) throw CryptoError("AEAD key must be 32 bytes");
    if (nonce.size() != NONCE_SIZE) throw CryptoError("AEAD nonce must be 12 bytes");

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) throw CryptoError("Cipher context allocation failed");

    check(EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr),
          "AEAD init failed");
    check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr),
          "AEAD nonce length rejected");
    check(EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()), "AEAD key setup failed");

    int len = 0;
    if (!aad.empty()) {
        check(EVP_EncryptUpdate(ctx.get(), nullptr, &len, bytes(aad), checked_int(aad.size(), "aad")),
              "AEAD aad failed");
    }

    std::vector<unsigned char> out(length + TAG_SIZE);
    int written = 0;
    if (length > 0) {
        check(EVP_EncryptUpdate(ctx.get(), out.data(), &len, plaintext, checked_int(length, "plaintext")),
              "AEAD encrypt failed");
        written = len;
    }
    check(EVP_EncryptFinal_ex(ctx.get(), out.data() + written, &len), "AEAD finalize failed");
    written += len;

    check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(TAG_SIZE),
                              out.data() + written),
          "AEAD tag export failed");
    out.resize(static_cast<size_t>(written) + TAG_SIZE);
    return out;
}

SecureBytes Crypto::aead_decrypt(const SecureBytes& key,
                                 const std::vector<unsigned char>& nonce,
                                 const std::vector<unsigned char>& ciphertext_and_tag,
                                 std::string_view aad) {
    if (key.size() != KEY_SIZE) throw CryptoError("AEAD key must be 32 bytes");
    if (nonce.size() != NONCE_SIZE) throw CryptoError("AEAD nonce must be 12 bytes");
    if (ciphertext_and_tag.size() < TAG_SIZE) throw CryptoError("Ciphertext too short");

    const size_t ct_len = ciphertext_and_tag.size() - TAG_SIZE;
    const unsigned char* tag = ciphertext_and_tag.data() + ct_len;

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) throw CryptoError("Cipher context allocation failed");

    check(EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr),
          "AEAD init failed");
    check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr),
          "AEAD nonce length rejected");
    check(EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()), "AEAD key setup failed");

    int len = 0;
    if (!aad.empty()) {
        check(EVP_DecryptUpdate(ctx.get(), nullptr, &len, bytes(aad), checked_int(aad.size(), "aad")),
              "AEAD aad failed");
    }

    SecureBytes out(ct_len);
    int written = 0;
    if (ct_len > 0) {
        check(EVP_DecryptUpdate(ctx.get(), out.data(), &len, ciphertext_and_tag.data(),
                                checked_int(ct_len, "ciphertext")),
              "AEAD decrypt failed");
        written = len;
    }

    check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(TAG_SIZE),
                              const_cast<unsigned char*>(tag)),
          "AEAD tag import failed");

    unsigned char final_block[16];
    if (EVP_DecryptFinal_ex(ctx.get(), final_block, &len) != 1) {
        throw CryptoError("Authentication tag mismatch");
    }
    if (written != static_cast<int>(ct_len)) {
        throw CryptoError("AEAD length mismatch");
    }
    return out;
}

std::vector<unsigned char> Crypto::aead_seal(const SecureBytes& key,
                                             const unsigned char* plaintext, size_t length,
                                             std::string_view aad) {
    auto nonce = random_bytes(NONCE_SIZE);
    auto body = aead_encrypt(key, nonce, plaintext, length, aad);

    std::vector<unsigned char> out;
    out.reserve(nonce.size() + body.size());
    out.insert(out.end(), nonce.begin(), nonce.end());
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

SecureBytes Crypto::aead_open(const SecureBytes& key,
                              const std::vector<unsigned char>& sealed,
                              std::string_view aad) {
    if (sealed.size() < NONCE_SIZE + TAG_SIZE) {
        throw CryptoError("Sealed data too short");
    }
    std::vector<unsigned char> nonce(sealed.begin(), sealed.begin() + NONCE_SIZE);
    std::vector<unsigned char> body(sealed.begin() + NONCE_SIZE, sealed.end());
    return aead_decrypt(key, nonce, body, aad);
}

// ---------------------------------------------------------------------------
// Encoding helpers
// ---------------------------------------------------------------------------

std::string Crypto::base64_encode(const unsigned char* data, size_t size) {
    namespace b64 = boost::beast::detail::base64;
    std::string out(b64::encoded_size(size), '\0');
    auto n = b64::encode(out.data(), data, size);
    out.resize(n);
    return out;
}

std::vector<unsigned char> Crypto::base64_decode(std::string_view encoded) {
    namespace b64 = boost::beast::detail::base64;
    if (!InputValidator::is_valid_base64(encoded)) {
        throw CryptoError("Malformed base64");
    }
    std::vector<unsigned char> out(b64::decoded_size(encoded.size()));
    auto result = b64::decode(out.data(), encoded.data(), encoded.size());
    out.resize(result.first);
    return out;
}

std::string Crypto::sha256_hex(std::string_view data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(bytes(data), data.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return ss.str();
}

std::string Crypto::uuid_v7() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    auto b = random_bytes(16);
    uint64_t ts = static_cast<uint64_t>(ms);
    for (int i = 0; i < 6; ++i) {
        b[i] = static_cast<unsigned char>((ts >> (8 * (5 - i))) & 0xff);
    }
    b[6] = static_cast<unsigned char>((b[6] & 0x0f) | 0x70);  // version 7
    b[8] = static_cast<unsigned char>((b[8] & 0x3f) | 0x80);  // RFC 4122 variant

    std::stringstream ss;
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
    }
    return ss.str();
}

}
