// src/quic/handshake.hpp
// TLS 1.3 handshake over the CRYPTO stream (OpenSSL, memory BIOs)
//
// The SSL object never touches a socket. CRYPTO bytes from the peer are
// written into the read BIO, SSL_do_handshake() runs, and whatever OpenSSL
// wrote into the write BIO becomes outbound CRYPTO data.
//
// Flight 1 (client):  ClientHello
// Flight 2 (server):  ServerHello, EncryptedExtensions, Certificate,
//                     CertificateVerify, Finished
// Flight 3 (client):  Finished
//
// Transport parameters travel in a private TLS extension on ClientHello and
// EncryptedExtensions. 1-RTT packet secrets come from the TLS exporter:
//   client secret = Exporter("EXPORTER-afterburner client 1rtt", 32)
//   server secret = Exporter("EXPORTER-afterburner server 1rtt", 32)
//
// Identity: the server presents a certificate loaded from PEM files or
// self-issued at startup. The client records its SHA-256 fingerprint and,
// when one is configured, rejects any other certificate.

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/x509.h>

#include "quic_types.hpp"
#include "quic_crypto.hpp"
#include "varint.hpp"

namespace afterburner::quic {

// Private codepoint (pre-RFC QUIC drafts) for the transport parameters extension
constexpr unsigned int TRANSPORT_PARAMS_EXT = 0xffa5;

// Bytes of the CRYPTO stream buffered ahead of the handshake
constexpr size_t MAX_CRYPTO_BUFFER = 16384;

constexpr size_t FINGERPRINT_LEN = 32;

struct TlsOptions {
    std::string alpn = "solana-tpu";
    std::string cert_file;        // Server: PEM chain; empty = self-issued
    std::string key_file;         // Server: PEM private key
    std::string pinned_sha256;    // Client: hex certificate fingerprint; empty = any
};

// Lowercase hex SHA-256 of the DER certificate, empty on failure
inline std::string certificate_sha256(X509* cert) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (!cert || X509_digest(cert, EVP_sha256(), md, &len) != 1 || len != FINGERPRINT_LEN) {
        return std::string();
    }
    static const char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; i++) {
        out.push_back(HEX[md[i] >> 4]);
        out.push_back(HEX[md[i] & 0x0F]);
    }
    return out;
}

inline std::string openssl_error_string(const char* what) {
    char err_buf[256];
    ERR_error_string_n(ERR_get_error(), err_buf, sizeof(err_buf));
    return std::string(what) + ": " + err_buf;
}

// ============================================================================
// TlsContext: one SSL_CTX per endpoint, shared by its connections
// ============================================================================

class TlsContext {
public:
    /**
     * @throws std::runtime_error if OpenSSL setup, certificate loading or
     *         certificate generation fails
     */
    TlsContext(Role role, const TlsOptions& options);

    ~TlsContext() {
        if (ctx_) {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }

    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    static std::shared_ptr<TlsContext> create(Role role, const TlsOptions& options) {
        return std::make_shared<TlsContext>(role, options);
    }

    SSL_CTX* get() const { return ctx_; }
    Role role() const { return role_; }
    const std::string& alpn() const { return options_.alpn; }
    // Server: own certificate. Client: empty.
    const std::string& fingerprint() const { return fingerprint_; }
    const std::string& pinned() const { return options_.pinned_sha256; }

private:
    void use_certificate_files() {
        if (SSL_CTX_use_certificate_chain_file(ctx_, options_.cert_file.c_str()) != 1) {
            throw std::runtime_error(openssl_error_string(("cannot load " + options_.cert_file).c_str()));
        }
        if (SSL_CTX_use_PrivateKey_file(ctx_, options_.key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
            throw std::runtime_error(openssl_error_string(("cannot load " + options_.key_file).c_str()));
        }
        if (SSL_CTX_check_private_key(ctx_) != 1) {
            throw std::runtime_error("Private key does not match " + options_.cert_file);
        }
    }

    // P-256 key and a one-year certificate signed by itself
    void use_self_issued_certificate() {
        EVP_PKEY* key = EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", "P-256");
        if (!key) {
            throw std::runtime_error(openssl_error_string("EC key generation failed"));
        }
        X509* cert = X509_new();
        long serial = 0;
        bool ok = cert != nullptr &&
                  RAND_bytes(reinterpret_cast<unsigned char*>(&serial), sizeof(serial)) == 1;
        serial &= 0x7FFFFFFFL;
        ok = ok && X509_set_version(cert, 2) == 1 &&
             ASN1_INTEGER_set(X509_get_serialNumber(cert), serial) == 1 &&
             X509_gmtime_adj(X509_getm_notBefore(cert), 0) != nullptr &&
             X509_gmtime_adj(X509_getm_notAfter(cert), 365L * 24 * 3600) != nullptr &&
             X509_set_pubkey(cert, key) == 1;
        if (ok) {
            X509_NAME* name = X509_get_subject_name(cert);
            ok = X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                            reinterpret_cast<const unsigned char*>("afterburner"),
                                            -1, -1, 0) == 1 &&
                 X509_set_issuer_name(cert, name) == 1 &&
                 X509_sign(cert, key, EVP_sha256()) > 0 &&
                 SSL_CTX_use_certificate(ctx_, cert) == 1 &&
                 SSL_CTX_use_PrivateKey(ctx_, key) == 1;
        }
        std::string err = ok ? std::string() : openssl_error_string("Self-issued certificate failed");
        if (cert) X509_free(cert);
        EVP_PKEY_free(key);
        if (!ok) {
            throw std::runtime_error(err);
        }
    }

    static int select_alpn(SSL*, const unsigned char** out, unsigned char* outlen,
                           const unsigned char* in, unsigned int inlen, void* arg) {
        TlsContext* tls = static_cast<TlsContext*>(arg);
        unsigned char* selected = nullptr;
        if (SSL_select_next_proto(&selected, outlen, tls->alpn_wire_.data(),
                                  static_cast<unsigned int>(tls->alpn_wire_.size()),
                                  in, inlen) != OPENSSL_NPN_NEGOTIATED) {
            return SSL_TLSEXT_ERR_ALERT_FATAL;    // no_application_protocol
        }
        *out = selected;
        return SSL_TLSEXT_ERR_OK;
    }

    // Replaces chain building: self-issued certificates are expected
    static int verify_certificate(X509_STORE_CTX* store, void* arg);

    Role role_;
    TlsOptions options_;
    SSL_CTX* ctx_ = nullptr;
    std::vector<unsigned char> alpn_wire_;     // length-prefixed protocol list
    std::string fingerprint_;
};

// ============================================================================
// Handshake: one SSL object per connection
// ============================================================================

enum class HandshakeStatus : uint8_t {
    InProgress = 0,
    KeysReady,      // Client: TLS finished, 1-RTT keys derived
    Complete,       // Server: client Finished verified, 1-RTT keys derived
    Failed,         // alert() holds the TLS alert
};

class Handshake {
public:
    /**
     * Never throws: an SSL allocation failure leaves the handshake Failed
     * with internal_error, reported on the first start()/on_crypto_data()
     */
    Handshake(Role role, std::shared_ptr<TlsContext> tls, const TransportParams& local)
        : role_(role)
        , tls_(std::move(tls))
    {
        uint8_t buf[256];
        BufferWriter w(buf, sizeof(buf));
        if (!local.encode(w)) {
            fail(error::ALERT_INTERNAL_ERROR, "transport parameters do not encode");
            return;
        }
        local_params_wire_.assign(buf, buf + w.position());

        ssl_ = tls_ ? SSL_new(tls_->get()) : nullptr;
        if (!ssl_) {
            fail(error::ALERT_INTERNAL_ERROR, "SSL_new() failed");
            return;
        }
        BIO* rbio = BIO_new(BIO_s_mem());
        BIO* wbio = BIO_new(BIO_s_mem());
        if (!rbio || !wbio) {
            if (rbio) BIO_free(rbio);
            if (wbio) BIO_free(wbio);
            fail(error::ALERT_INTERNAL_ERROR, "BIO_new() failed");
            return;
        }
        SSL_set_bio(ssl_, rbio, wbio);     // SSL owns both BIOs
        bio_in_ = rbio;
        bio_out_ = wbio;
        SSL_set_app_data(ssl_, this);
        SSL_set_info_callback(ssl_, on_info);
        if (role_ == Role::Client) {
            SSL_set_connect_state(ssl_);
        } else {
            SSL_set_accept_state(ssl_);
        }
    }

    ~Handshake() {
        if (ssl_) {
            SSL_free(ssl_);
            ssl_ = nullptr;
        }
    }

    Handshake(const Handshake&) = delete;
    Handshake& operator=(const Handshake&) = delete;

    // Client: append the ClientHello flight to out
    bool start(std::vector<uint8_t>* out) {
        if (role_ != Role::Client || status_ != HandshakeStatus::InProgress || started_) {
            return false;
        }
        started_ = true;
        return drive(out) == HandshakeStatus::InProgress;
    }

    /**
     * Feed in-order CRYPTO stream bytes (any fragmentation)
     * Replies are appended to out. Failed is sticky.
     */
    HandshakeStatus on_crypto_data(const uint8_t* data, size_t len, std::vector<uint8_t>* out) {
        if (status_ == HandshakeStatus::Failed) {
            return status_;
        }
        if (status_ != HandshakeStatus::InProgress) {
            return status_;    // No post-handshake messages are expected
        }
        if (len > 0 && BIO_write(bio_in_, data, static_cast<int>(len)) != static_cast<int>(len)) {
            return fail(error::ALERT_INTERNAL_ERROR, "BIO_write() failed");
        }
        started_ = true;
        return drive(out);
    }

    HandshakeStatus status() const { return status_; }
    bool keys_ready() const {
        return status_ == HandshakeStatus::KeysReady || status_ == HandshakeStatus::Complete;
    }
    uint64_t alert() const { return alert_; }
    const std::string& error() const { return error_; }

    const PacketKeys& send_keys() const { return role_ == Role::Client ? client_keys_ : server_keys_; }
    const PacketKeys& recv_keys() const { return role_ == Role::Client ? server_keys_ : client_keys_; }

    const TransportParams& peer_params() const { return peer_params_; }
    // Negotiated protocol, set once keys are ready
    const std::string& alpn() const { return alpn_; }
    // Client: the server certificate's SHA-256, set when it arrives
    const std::string& peer_fingerprint() const { return peer_fingerprint_; }

private:
    friend class TlsContext;

    static Handshake* from(const SSL* ssl) {
        return static_cast<Handshake*>(SSL_get_app_data(ssl));
    }

    HandshakeStatus drive(std::vector<uint8_t>* out) {
        ERR_clear_error();
        int ret = SSL_do_handshake(ssl_);
        if (ret != 1) {
            int err = SSL_get_error(ssl_, ret);
            if (err != SSL_ERROR_WANT_READ) {
                return fail(error::ALERT_HANDSHAKE_FAILURE, nullptr);
            }
            flush(out);
            return status_;
        }
        if (!finish()) {
            return status_;
        }
        flush(out);
        return status_;
    }

    // Checks the negotiated result and derives 1-RTT keys
    bool finish() {
        const unsigned char* proto = nullptr;
        unsigned int proto_len = 0;
        SSL_get0_alpn_selected(ssl_, &proto, &proto_len);
        if (proto_len == 0) {
            fail(error::ALERT_NO_APPLICATION_PROTOCOL, "no application protocol negotiated");
            return false;
        }
        if (!peer_params_received_) {
            fail(error::ALERT_MISSING_EXTENSION, "peer sent no transport parameters");
            return false;
        }

        uint8_t client_secret[SECRET_LEN];
        uint8_t server_secret[SECRET_LEN];
        if (!export_secret("EXPORTER-afterburner client 1rtt", client_secret) ||
            !export_secret("EXPORTER-afterburner server 1rtt", server_secret) ||
            !derive_packet_keys(client_secret, &client_keys_) ||
            !derive_packet_keys(server_secret, &server_keys_)) {
            fail(error::ALERT_INTERNAL_ERROR, "key export failed");
            return false;
        }
        OPENSSL_cleanse(client_secret, sizeof(client_secret));
        OPENSSL_cleanse(server_secret, sizeof(server_secret));

        alpn_.assign(reinterpret_cast<const char*>(proto), proto_len);
        status_ = (role_ == Role::Client) ? HandshakeStatus::KeysReady : HandshakeStatus::Complete;
        return true;
    }

    bool export_secret(const char* label, uint8_t out[SECRET_LEN]) {
        return SSL_export_keying_material(ssl_, out, SECRET_LEN, label, strlen(label),
                                          nullptr, 0, 0) == 1;
    }

    // Move everything OpenSSL wrote into the outbound CRYPTO stream
    void flush(std::vector<uint8_t>* out) {
        uint8_t buf[4096];
        while (BIO_ctrl_pending(bio_out_) > 0) {
            int n = BIO_read(bio_out_, buf, sizeof(buf));
            if (n <= 0) {
                break;
            }
            out->insert(out->end(), buf, buf + n);
        }
    }

    // Alert records stay in the write BIO; the connection reports the
    // alert in CONNECTION_CLOSE instead
    HandshakeStatus fail(uint64_t fallback_alert, const char* what) {
        status_ = HandshakeStatus::Failed;
        if (alert_ == 0) {
            alert_ = fallback_alert;
        }
        if (what) {
            error_ = what;
        } else if (ERR_peek_error() != 0) {
            error_ = openssl_error_string("SSL_do_handshake() failed");
        } else {
            error_ = "SSL_do_handshake() failed";
        }
        return status_;
    }

    static void on_info(const SSL* ssl, int where, int ret) {
        if (!(where & SSL_CB_ALERT) || !(where & SSL_CB_WRITE)) {
            return;
        }
        Handshake* hs = from(ssl);
        if (hs && (ret >> 8) == SSL3_AL_FATAL && hs->alert_ == 0) {
            hs->alert_ = static_cast<uint64_t>(ret & 0xFF);
        }
    }

    static int add_params(SSL* ssl, unsigned int, unsigned int, const unsigned char** out,
                          size_t* outlen, X509*, size_t, int* al, void*) {
        Handshake* hs = from(ssl);
        if (!hs) {
            *al = SSL_AD_INTERNAL_ERROR;
            return -1;
        }
        *out = hs->local_params_wire_.data();
        *outlen = hs->local_params_wire_.size();
        return 1;
    }

    static int parse_params(SSL* ssl, unsigned int, unsigned int, const unsigned char* in,
                            size_t inlen, X509*, size_t, int* al, void*) {
        Handshake* hs = from(ssl);
        BufferReader r(in, inlen);
        if (!hs || !hs->peer_params_.decode(r)) {
            *al = SSL_AD_DECODE_ERROR;
            return 0;
        }
        hs->peer_params_received_ = true;
        return 1;
    }

    Role role_;
    std::shared_ptr<TlsContext> tls_;
    SSL* ssl_ = nullptr;
    BIO* bio_in_ = nullptr;     // Owned by ssl_
    BIO* bio_out_ = nullptr;    // Owned by ssl_
    HandshakeStatus status_ = HandshakeStatus::InProgress;
    bool started_ = false;
    uint64_t alert_ = 0;
    std::string error_;

    std::vector<uint8_t> local_params_wire_;
    TransportParams peer_params_;
    bool peer_params_received_ = false;
    std::string alpn_;
    std::string peer_fingerprint_;

    PacketKeys client_keys_;
    PacketKeys server_keys_;
};

// ============================================================================
// TlsContext (needs the Handshake callbacks)
// ============================================================================

inline TlsContext::TlsContext(Role role, const TlsOptions& options)
    : role_(role)
    , options_(options)
{
    if (options_.alpn.empty() || options_.alpn.size() > 255) {
        throw std::runtime_error("ALPN must be 1..255 bytes");
    }
    alpn_wire_.push_back(static_cast<unsigned char>(options_.alpn.size()));
    alpn_wire_.insert(alpn_wire_.end(), options_.alpn.begin(), options_.alpn.end());

    ctx_ = SSL_CTX_new(role_ == Role::Client ? TLS_client_method() : TLS_server_method());
    if (!ctx_) {
        throw std::runtime_error("SSL_CTX_new() failed");
    }
    // A throwing constructor never runs the destructor
    try {
        SSL_CTX_set_min_proto_version(ctx_, TLS1_3_VERSION);
        SSL_CTX_set_max_proto_version(ctx_, TLS1_3_VERSION);
        SSL_CTX_clear_options(ctx_, SSL_OP_ENABLE_MIDDLEBOX_COMPAT);
        SSL_CTX_set_options(ctx_, SSL_OP_NO_TICKET);
        SSL_CTX_set_num_tickets(ctx_, 0);
        SSL_CTX_set_session_cache_mode(ctx_, SSL_SESS_CACHE_OFF);

        unsigned int ext_context = SSL_EXT_TLS_ONLY | SSL_EXT_TLS1_3_ONLY |
                                   SSL_EXT_CLIENT_HELLO | SSL_EXT_TLS1_3_ENCRYPTED_EXTENSIONS;
        if (SSL_CTX_add_custom_ext(ctx_, TRANSPORT_PARAMS_EXT, ext_context,
                                   &Handshake::add_params, nullptr, nullptr,
                                   &Handshake::parse_params, nullptr) != 1) {
            throw std::runtime_error(openssl_error_string("SSL_CTX_add_custom_ext() failed"));
        }

        if (role_ == Role::Client) {
            if (SSL_CTX_set_alpn_protos(ctx_, alpn_wire_.data(),
                                        static_cast<unsigned int>(alpn_wire_.size())) != 0) {
                throw std::runtime_error("SSL_CTX_set_alpn_protos() failed");
            }
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_cert_verify_callback(ctx_, verify_certificate, this);
        } else {
            SSL_CTX_set_alpn_select_cb(ctx_, select_alpn, this);
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
            if (options_.cert_file.empty()) {
                use_self_issued_certificate();
            } else {
                use_certificate_files();
            }
            fingerprint_ = certificate_sha256(SSL_CTX_get0_certificate(ctx_));
        }
    } catch (const std::runtime_error&) {
        SSL_CTX_free(ctx_);
        ctx_ = nullptr;
        throw;
    }
}

inline int TlsContext::verify_certificate(X509_STORE_CTX* store, void* arg) {
    TlsContext* tls = static_cast<TlsContext*>(arg);
    SSL* ssl = static_cast<SSL*>(X509_STORE_CTX_get_ex_data(store, SSL_get_ex_data_X509_STORE_CTX_idx()));
    Handshake* hs = ssl ? Handshake::from(ssl) : nullptr;

    std::string fp = certificate_sha256(X509_STORE_CTX_get0_cert(store));
    if (hs) {
        hs->peer_fingerprint_ = fp;
    }
    if (fp.empty() || (!tls->pinned().empty() && fp != tls->pinned())) {
        X509_STORE_CTX_set_error(store, X509_V_ERR_CERT_REJECTED);
        return 0;
    }
    return 1;
}

} // namespace afterburner::quic
