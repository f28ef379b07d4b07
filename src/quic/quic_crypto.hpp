// src/quic/quic_crypto.hpp
// Packet protection and key schedule primitives over OpenSSL libcrypto
//
// - HKDF-SHA256 extract / expand / expand-label ("tls13 " prefix)
// - Initial secrets from the client's original destination CID
// - AES-128-GCM packet protection, nonce = iv XOR packet number
// - 1-RTT packet keys from secrets exported by the TLS 1.3 handshake
//
// Setup helpers return false on any libcrypto failure; AeadKey::seal/open
// are called per packet and never allocate.

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

#include "quic_types.hpp"

namespace afterburner::quic {

constexpr size_t SECRET_LEN = 32;    // SHA-256 output
constexpr size_t AEAD_KEY_LEN = 16;  // AES-128
constexpr size_t AEAD_IV_LEN = 12;

// RFC 9001 version 1 Initial salt
constexpr uint8_t INITIAL_SALT[20] = {
    0x38, 0x76, 0x2c, 0xf7, 0xf5, 0x59, 0x34, 0xb3, 0x4d, 0x17,
    0x9a, 0xe6, 0xa4, 0xc8, 0x0c, 0xad, 0xcc, 0xbb, 0x7f, 0x0a
};

struct PacketKeys {
    uint8_t key[AEAD_KEY_LEN] = {};
    uint8_t iv[AEAD_IV_LEN] = {};
};

// ============================================================================
// Hashes and KDF
// ============================================================================

inline bool random_bytes(uint8_t* out, size_t n) {
    return RAND_bytes(out, static_cast<int>(n)) == 1;
}

inline bool random_connection_id(ConnectionId* cid) {
    cid->len = CID_LEN;
    return random_bytes(cid->bytes, CID_LEN);
}

namespace detail {

// Owns one EVP_PKEY_CTX for an HKDF derive
class HkdfContext {
public:
    HkdfContext() : ctx_(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr)) {}
    ~HkdfContext() { if (ctx_) EVP_PKEY_CTX_free(ctx_); }
    HkdfContext(const HkdfContext&) = delete;
    HkdfContext& operator=(const HkdfContext&) = delete;

    EVP_PKEY_CTX* get() { return ctx_; }

private:
    EVP_PKEY_CTX* ctx_;
};

}  // namespace detail

inline bool hkdf_extract(const uint8_t* salt, size_t salt_len,
                         const uint8_t* ikm, size_t ikm_len, uint8_t out[SECRET_LEN]) {
    detail::HkdfContext hkdf;
    EVP_PKEY_CTX* ctx = hkdf.get();
    size_t out_len = SECRET_LEN;
    return ctx != nullptr &&
           EVP_PKEY_derive_init(ctx) == 1 &&
           EVP_PKEY_CTX_set_hkdf_mode(ctx, EVP_PKEY_HKDEF_MODE_EXTRACT_ONLY) == 1 &&
           EVP_PKEY_CTX_set_hkdf_md(ctx, EVP_sha256()) == 1 &&
           EVP_PKEY_CTX_set1_hkdf_salt(ctx, salt, static_cast<int>(salt_len)) == 1 &&
           EVP_PKEY_CTX_set1_hkdf_key(ctx, ikm, static_cast<int>(ikm_len)) == 1 &&
           EVP_PKEY_derive(ctx, out, &out_len) == 1 &&
           out_len == SECRET_LEN;
}

inline bool hkdf_expand(const uint8_t prk[SECRET_LEN], const uint8_t* info, size_t info_len,
                        uint8_t* out, size_t out_len) {
    detail::HkdfContext hkdf;
    EVP_PKEY_CTX* ctx = hkdf.get();
    size_t len = out_len;
    return ctx != nullptr &&
           EVP_PKEY_derive_init(ctx) == 1 &&
           EVP_PKEY_CTX_set_hkdf_mode(ctx, EVP_PKEY_HKDEF_MODE_EXPAND_ONLY) == 1 &&
           EVP_PKEY_CTX_set_hkdf_md(ctx, EVP_sha256()) == 1 &&
           EVP_PKEY_CTX_set1_hkdf_key(ctx, prk, static_cast<int>(SECRET_LEN)) == 1 &&
           EVP_PKEY_CTX_add1_hkdf_info(ctx, info, static_cast<int>(info_len)) == 1 &&
           EVP_PKEY_derive(ctx, out, &len) == 1 &&
           len == out_len;
}

/**
 * HKDF-Expand-Label (RFC 8446 section 7.1)
 *
 * HkdfLabel = uint16 length || opaque label<7..255> ("tls13 " + label)
 *             || opaque context<0..255>
 */
inline bool hkdf_expand_label(const uint8_t secret[SECRET_LEN], const char* label,
                              const uint8_t* context, size_t context_len,
                              uint8_t* out, size_t out_len) {
    static const char PREFIX[] = "tls13 ";
    size_t label_len = strlen(label);
    size_t full_label_len = sizeof(PREFIX) - 1 + label_len;
    if (full_label_len > 255 || context_len > 255 || out_len > 0xFFFF) {
        return false;
    }

    uint8_t info[2 + 1 + 255 + 1 + 255];
    size_t pos = 0;
    info[pos++] = static_cast<uint8_t>(out_len >> 8);
    info[pos++] = static_cast<uint8_t>(out_len);
    info[pos++] = static_cast<uint8_t>(full_label_len);
    memcpy(info + pos, PREFIX, sizeof(PREFIX) - 1);
    pos += sizeof(PREFIX) - 1;
    memcpy(info + pos, label, label_len);
    pos += label_len;
    info[pos++] = static_cast<uint8_t>(context_len);
    if (context_len > 0) {
        memcpy(info + pos, context, context_len);
        pos += context_len;
    }
    return hkdf_expand(secret, info, pos, out, out_len);
}

inline bool derive_packet_keys(const uint8_t secret[SECRET_LEN], PacketKeys* keys) {
    return hkdf_expand_label(secret, "quic key", nullptr, 0, keys->key, AEAD_KEY_LEN) &&
           hkdf_expand_label(secret, "quic iv", nullptr, 0, keys->iv, AEAD_IV_LEN);
}

/**
 * Initial packet keys for both directions
 * Both endpoints derive the same pair from the client's first DCID.
 */
inline bool derive_initial_keys(const ConnectionId& original_dcid,
                                PacketKeys* client_keys, PacketKeys* server_keys) {
    uint8_t initial_secret[SECRET_LEN];
    uint8_t client_secret[SECRET_LEN];
    uint8_t server_secret[SECRET_LEN];
    return hkdf_extract(INITIAL_SALT, sizeof(INITIAL_SALT),
                        original_dcid.bytes, original_dcid.len, initial_secret) &&
           hkdf_expand_label(initial_secret, "client in", nullptr, 0, client_secret, SECRET_LEN) &&
           hkdf_expand_label(initial_secret, "server in", nullptr, 0, server_secret, SECRET_LEN) &&
           derive_packet_keys(client_secret, client_keys) &&
           derive_packet_keys(server_secret, server_keys);
}

// ============================================================================
// AEAD packet protection
// ============================================================================

/**
 * One direction of AES-128-GCM protection
 *
 * The key schedule runs once in install(); each packet only resets the
 * nonce. A key is either a sealing key or an opening key, never both.
 */
class AeadKey {
public:
    AeadKey() = default;
    ~AeadKey() { reset(); }

    AeadKey(const AeadKey&) = delete;
    AeadKey& operator=(const AeadKey&) = delete;

    // @throws std::runtime_error if libcrypto cannot set up the context
    void install(const PacketKeys& keys, bool sealing) {
        reset();
        ctx_ = EVP_CIPHER_CTX_new();
        if (!ctx_) {
            throw std::runtime_error("AeadKey: EVP_CIPHER_CTX_new failed");
        }
        sealing_ = sealing;
        int ok = sealing
            ? EVP_EncryptInit_ex(ctx_, EVP_aes_128_gcm(), nullptr, nullptr, nullptr)
            : EVP_DecryptInit_ex(ctx_, EVP_aes_128_gcm(), nullptr, nullptr, nullptr);
        if (ok != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx_, EVP_CTRL_GCM_SET_IVLEN, AEAD_IV_LEN, nullptr) != 1) {
            reset();
            throw std::runtime_error("AeadKey: AES-128-GCM init failed");
        }
        ok = sealing
            ? EVP_EncryptInit_ex(ctx_, nullptr, nullptr, keys.key, nullptr)
            : EVP_DecryptInit_ex(ctx_, nullptr, nullptr, keys.key, nullptr);
        if (ok != 1) {
            reset();
            throw std::runtime_error("AeadKey: key schedule failed");
        }
        memcpy(iv_, keys.iv, AEAD_IV_LEN);
    }

    void reset() {
        if (ctx_) {
            EVP_CIPHER_CTX_free(ctx_);
            ctx_ = nullptr;
        }
        memset(iv_, 0, sizeof(iv_));
    }

    bool installed() const { return ctx_ != nullptr; }

    /**
     * Encrypt plaintext into out and append the 16-byte tag
     * out may equal plaintext. out must hold len + AEAD_TAG_LEN bytes.
     */
    bool seal(uint64_t pn, const uint8_t* aad, size_t aad_len,
              const uint8_t* plaintext, size_t len, uint8_t* out) {
        if (!ctx_ || !sealing_) return false;
        uint8_t nonce[AEAD_IV_LEN];
        make_nonce(pn, nonce);
        int n = 0;
        int final_len = 0;
        if (EVP_EncryptInit_ex(ctx_, nullptr, nullptr, nullptr, nonce) != 1 ||
            EVP_EncryptUpdate(ctx_, nullptr, &n, aad, static_cast<int>(aad_len)) != 1 ||
            EVP_EncryptUpdate(ctx_, out, &n, plaintext, static_cast<int>(len)) != 1 ||
            EVP_EncryptFinal_ex(ctx_, out + n, &final_len) != 1) {
            return false;
        }
        return EVP_CIPHER_CTX_ctrl(ctx_, EVP_CTRL_GCM_GET_TAG, AEAD_TAG_LEN,
                                   out + static_cast<size_t>(n) + static_cast<size_t>(final_len)) == 1;
    }

    /**
     * Decrypt ciphertext (len includes the tag) into out
     * @return false on authentication failure
     */
    bool open(uint64_t pn, const uint8_t* aad, size_t aad_len,
              const uint8_t* ciphertext, size_t len, uint8_t* out) {
        if (!ctx_ || sealing_ || len < AEAD_TAG_LEN) return false;
        size_t body_len = len - AEAD_TAG_LEN;
        uint8_t tag[AEAD_TAG_LEN];
        memcpy(tag, ciphertext + body_len, AEAD_TAG_LEN);
        uint8_t nonce[AEAD_IV_LEN];
        make_nonce(pn, nonce);
        int n = 0;
        int final_len = 0;
        return EVP_DecryptInit_ex(ctx_, nullptr, nullptr, nullptr, nonce) == 1 &&
               EVP_DecryptUpdate(ctx_, nullptr, &n, aad, static_cast<int>(aad_len)) == 1 &&
               EVP_DecryptUpdate(ctx_, out, &n, ciphertext, static_cast<int>(body_len)) == 1 &&
               EVP_CIPHER_CTX_ctrl(ctx_, EVP_CTRL_GCM_SET_TAG, AEAD_TAG_LEN, tag) == 1 &&
               EVP_DecryptFinal_ex(ctx_, out + n, &final_len) == 1;
    }

private:
    void make_nonce(uint64_t pn, uint8_t nonce[AEAD_IV_LEN]) const {
        memcpy(nonce, iv_, AEAD_IV_LEN);
        for (int i = 0; i < 8; i++) {
            nonce[AEAD_IV_LEN - 1 - i] ^= static_cast<uint8_t>(pn >> (8 * i));
        }
    }

    EVP_CIPHER_CTX* ctx_ = nullptr;
    bool sealing_ = false;
    uint8_t iv_[AEAD_IV_LEN] = {};
};

} // namespace afterburner::quic
