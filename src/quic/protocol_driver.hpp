// src/quic/protocol_driver.hpp
// Connection lifecycle for one endpoint role
//
// Client: connects to the configured peer and reconnects with bounded
//         exponential backoff after retryable failures.
// Server: listens on the service port and adopts the first peer whose
//         Initial packet establishes a handshake; other peers are ignored
//         while that connection is alive.
//
// One TLS context per driver: the server certificate (loaded or
// self-issued) stays the same across connections so clients can pin it.

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <memory>

#include "quic_connection.hpp"
#include "../engine_config.hpp"
#include "../stack/stack_types.hpp"

namespace afterburner::quic {

struct DriverStats {
    uint64_t connections_started = 0;
    uint64_t handshakes_completed = 0;
    uint64_t connections_closed = 0;
    uint64_t reconnect_attempts = 0;
    uint64_t datagrams_ignored = 0;      // Foreign peer or no connection to feed
};

class ProtocolDriver {
public:
    /**
     * @throws std::runtime_error if the TLS context cannot be set up
     */
    ProtocolDriver(Role role, const EngineConfig& config)
        : role_(role)
        , conn_config_(ConnectionConfig::from(config))
        , peer_(config.peer)
        , backoff_base_ms_(config.reconnect_base_ms)
        , backoff_max_ms_(config.reconnect_max_ms)
        , max_attempts_(config.reconnect_max_attempts)
    {
        TlsOptions options;
        options.alpn = config.alpn;
        options.cert_file = config.cert_file;
        options.key_file = config.key_file;
        options.pinned_sha256 = config.peer_cert_sha256;
        conn_config_.tls = TlsContext::create(role, options);
        if (role_ == Role::Server) {
            printf("[QUIC] Server certificate sha256=%s\n", conn_config_.tls->fingerprint().c_str());
        } else if (!options.pinned_sha256.empty()) {
            printf("[QUIC] Pinned server certificate sha256=%s\n", options.pinned_sha256.c_str());
        }
    }

    ProtocolDriver(const ProtocolDriver&) = delete;
    ProtocolDriver& operator=(const ProtocolDriver&) = delete;

    // Client: open the first connection. No-op for a server.
    bool start(uint64_t now) {
        if (role_ != Role::Client) {
            return true;
        }
        return open_client(now);
    }

    StreamEvents on_datagram(const uint8_t* data, size_t len, const stack::Endpoint& from, uint64_t now) {
        StreamEvents ev;
        if (role_ == Role::Server && (!conn_ || conn_->state() == ConnectionState::Closed)) {
            // Only a long-header packet can open a connection
            if (len == 0 || (data[0] & 0x80) == 0) {
                stats_.datagrams_ignored++;
                return ev;
            }
            conn_ = std::make_unique<QuicConnection>(Role::Server, conn_config_, from, now);
            closed_reported_ = false;
            ev = conn_->on_datagram(data, len, now);
            if (conn_->state() == ConnectionState::Initial) {
                conn_.reset();
                stats_.datagrams_ignored++;
                return ev;
            }
            stats_.connections_started++;
            char ip[16];
            printf("[QUIC] Accepted %s:%u\n", stack::format_ipv4(from.ip, ip, sizeof(ip)), from.port);
        } else {
            if (!conn_ || !from.same_address(conn_->peer())) {
                stats_.datagrams_ignored++;
                return ev;
            }
            ev = conn_->on_datagram(data, len, now);
        }
        observe(ev, now);
        return ev;
    }

    /**
     * Timers, reconnects and outbound datagrams
     * @return Datagrams written to out
     */
    size_t drain_egress(uint64_t now, Datagram* out, size_t max) {
        if (role_ == Role::Client && reconnect_at_ != 0 && now >= reconnect_at_) {
            reconnect_at_ = 0;
            stats_.reconnect_attempts++;
            open_client(now);
        }
        if (!conn_) {
            return 0;
        }
        size_t n = conn_->drain_egress(now, out, max);
        StreamEvents none;
        observe(none, now);
        return n;
    }

    // ========================================================================
    // Streams (forwarded to the live connection)
    // ========================================================================

    StreamStatus open_stream(uint64_t id) {
        if (!conn_) return StreamStatus::NotEstablished;
        return conn_->open_stream(id);
    }

    StreamStatus write_stream(uint64_t id, const uint8_t* data, size_t len, size_t* accepted) {
        *accepted = 0;
        if (!conn_) return StreamStatus::NotEstablished;
        return conn_->write_stream(id, data, len, accepted);
    }

    StreamStatus read_stream(uint64_t id, uint8_t* buf, size_t cap, size_t* n) {
        *n = 0;
        if (!conn_) return StreamStatus::NoData;
        return conn_->read_stream(id, buf, cap, n);
    }

    size_t send_capacity(uint64_t id) {
        return conn_ ? conn_->send_capacity(id) : 0;
    }

    // Application shutdown: close without reconnecting
    void close(uint64_t now) {
        reconnect_at_ = 0;
        stopping_ = true;
        if (conn_) {
            conn_->close(now);
        }
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    bool is_established() const { return conn_ && conn_->is_established(); }

    ConnectionState state() const {
        return conn_ ? conn_->state() : ConnectionState::Closed;
    }

    QuicConnection* connection() { return conn_.get(); }
    const QuicConnection* connection() const { return conn_.get(); }
    Role role() const { return role_; }
    const TlsContext& tls() const { return *conn_config_.tls; }
    bool gave_up() const { return gave_up_; }
    uint64_t reconnect_at() const { return reconnect_at_; }
    uint32_t attempt() const { return attempt_; }
    const DriverStats& stats() const { return stats_; }

    // Delay before reconnect attempt n (0-based)
    uint64_t backoff_ms(uint32_t attempt) const {
        uint64_t delay = backoff_base_ms_;
        for (uint32_t i = 0; i < attempt && delay < backoff_max_ms_; i++) {
            delay *= 2;
        }
        return delay < backoff_max_ms_ ? delay : backoff_max_ms_;
    }

private:
    bool open_client(uint64_t now) {
        conn_ = std::make_unique<QuicConnection>(Role::Client, conn_config_, peer_, now);
        closed_reported_ = false;
        stats_.connections_started++;
        if (!conn_->connect(now)) {
            observe(StreamEvents(), now);
            return false;
        }
        char ip[16];
        printf("[QUIC] Connecting to %s:%u (attempt %u)\n",
               stack::format_ipv4(peer_.ip, ip, sizeof(ip)), peer_.port, attempt_ + 1);
        return true;
    }

    // Track lifecycle transitions after every call into the connection
    void observe(const StreamEvents& ev, uint64_t now) {
        if (ev.handshake_completed) {
            stats_.handshakes_completed++;
            attempt_ = 0;
            if (role_ == Role::Client && conn_) {
                printf("[QUIC] Handshake complete (client) alpn=%s server sha256=%s\n",
                       conn_->handshake().alpn().c_str(), conn_->handshake().peer_fingerprint().c_str());
            } else {
                printf("[QUIC] Handshake complete (server)\n");
            }
        }
        if (!conn_ || conn_->state() != ConnectionState::Closed || closed_reported_) {
            return;
        }
        closed_reported_ = true;
        stats_.connections_closed++;
        const CloseInfo& info = conn_->close_info();
        printf("[QUIC] Connection closed: %s code=0x%lx\n", close_reason_name(info.reason), info.error_code);

        if (role_ != Role::Client || stopping_ || !info.retryable) {
            return;
        }
        if (max_attempts_ != 0 && attempt_ >= max_attempts_) {
            gave_up_ = true;
            fprintf(stderr, "[QUIC] Giving up after %u reconnect attempts\n", attempt_);
            return;
        }
        uint64_t delay = backoff_ms(attempt_);
        attempt_++;
        reconnect_at_ = now + delay * 1000000ULL;
        printf("[QUIC] Reconnecting in %lums\n", delay);
    }

    Role role_;
    ConnectionConfig conn_config_;
    stack::Endpoint peer_;
    std::unique_ptr<QuicConnection> conn_;

    uint64_t backoff_base_ms_;
    uint64_t backoff_max_ms_;
    uint32_t max_attempts_;
    uint32_t attempt_ = 0;
    uint64_t reconnect_at_ = 0;
    bool gave_up_ = false;
    bool stopping_ = false;
    bool closed_reported_ = false;

    DriverStats stats_;
};

} // namespace afterburner::quic
