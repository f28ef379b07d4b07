// src/quic/quic_types.hpp
// Core types of the secure stream transport: states, ids, errors, parameters

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>

#include "varint.hpp"

namespace afterburner::quic {

// "AB" + version 1. Not an IANA QUIC version: this transport is only
// interoperable with itself.
constexpr uint32_t QUIC_VERSION = 0x41420001;

constexpr size_t CID_LEN = 8;                  // Length of every CID we issue
constexpr size_t MAX_CID_LEN = 20;
constexpr size_t MAX_DATAGRAM_SIZE = 1350;     // UDP payload we emit
constexpr size_t MIN_INITIAL_DATAGRAM = 1200;  // Client Initials are padded to this
constexpr size_t AEAD_TAG_LEN = 16;
constexpr size_t PN_LEN = 4;                   // Packet numbers always sent in 4 bytes

// Client-initiated bidirectional stream ids used by the application
constexpr uint64_t APP_STREAM_IDS[4] = {0, 4, 8, 12};
constexpr size_t APP_STREAM_COUNT = 4;

inline bool is_client_initiated(uint64_t stream_id) { return (stream_id & 0x1) == 0; }
inline bool is_bidirectional(uint64_t stream_id) { return (stream_id & 0x2) == 0; }
inline uint64_t stream_index(uint64_t stream_id) { return stream_id >> 2; }

// ============================================================================
// States
// ============================================================================

enum class ConnectionState : uint8_t {
    Initial = 0,     // Created, nothing exchanged yet
    Handshaking,     // Hello sent/received, waiting for Finished
    Established,     // 1-RTT keys installed, streams usable
    Closing,         // CONNECTION_CLOSE sent or received, draining
    Closed,          // Terminal; the driver may replace the connection
};

inline const char* connection_state_name(ConnectionState s) {
    switch (s) {
        case ConnectionState::Initial:     return "Initial";
        case ConnectionState::Handshaking: return "Handshaking";
        case ConnectionState::Established: return "Established";
        case ConnectionState::Closing:     return "Closing";
        case ConnectionState::Closed:      return "Closed";
    }
    return "?";
}

enum class Role : uint8_t { Client, Server };

// Packet number spaces. Handshake messages travel in Initial packets;
// everything after the handshake uses Application (1-RTT) packets.
enum class PacketSpace : uint8_t { Initial = 0, Application = 1 };
constexpr size_t PACKET_SPACE_COUNT = 2;

inline size_t space_index(PacketSpace s) { return static_cast<size_t>(s); }

// ============================================================================
// Errors
// ============================================================================

namespace error {
constexpr uint64_t NO_ERROR = 0x0;
constexpr uint64_t INTERNAL_ERROR = 0x1;
constexpr uint64_t CONNECTION_REFUSED = 0x2;
constexpr uint64_t FLOW_CONTROL_ERROR = 0x3;
constexpr uint64_t STREAM_LIMIT_ERROR = 0x4;
constexpr uint64_t STREAM_STATE_ERROR = 0x5;
constexpr uint64_t FINAL_SIZE_ERROR = 0x6;
constexpr uint64_t FRAME_ENCODING_ERROR = 0x7;
constexpr uint64_t TRANSPORT_PARAMETER_ERROR = 0x8;
constexpr uint64_t PROTOCOL_VIOLATION = 0xA;
constexpr uint64_t CRYPTO_ERROR_BASE = 0x100;   // + TLS alert

// TLS alert descriptions seen in CRYPTO_ERROR codes
constexpr uint64_t ALERT_UNEXPECTED_MESSAGE = 10;
constexpr uint64_t ALERT_BAD_RECORD_MAC = 20;
constexpr uint64_t ALERT_HANDSHAKE_FAILURE = 40;
constexpr uint64_t ALERT_BAD_CERTIFICATE = 42;
constexpr uint64_t ALERT_DECODE_ERROR = 50;
constexpr uint64_t ALERT_INTERNAL_ERROR = 80;
constexpr uint64_t ALERT_MISSING_EXTENSION = 109;
constexpr uint64_t ALERT_NO_APPLICATION_PROTOCOL = 120;
}  // namespace error

enum class CloseReason : uint8_t {
    None = 0,
    IdleTimeout,
    HandshakeTimeout,
    HandshakeFailed,     // TLS alert: ALPN mismatch, certificate rejected, bad record
    ProtocolError,       // Frame/flow-control/stream violation
    PeerClosed,          // CONNECTION_CLOSE received
    LocalClose,          // close() called by the application
};

inline const char* close_reason_name(CloseReason r) {
    switch (r) {
        case CloseReason::None:             return "none";
        case CloseReason::IdleTimeout:      return "idle_timeout";
        case CloseReason::HandshakeTimeout: return "handshake_timeout";
        case CloseReason::HandshakeFailed:  return "handshake_failed";
        case CloseReason::ProtocolError:    return "protocol_error";
        case CloseReason::PeerClosed:       return "peer_closed";
        case CloseReason::LocalClose:       return "local_close";
    }
    return "?";
}

struct CloseInfo {
    CloseReason reason = CloseReason::None;
    uint64_t error_code = error::NO_ERROR;
    bool retryable = false;    // Connection-level failure; the client may reconnect
};

// ============================================================================
// Connection IDs
// ============================================================================

struct ConnectionId {
    uint8_t len = 0;
    uint8_t bytes[MAX_CID_LEN] = {};

    bool operator==(const ConnectionId& o) const {
        return len == o.len && memcmp(bytes, o.bytes, len) == 0;
    }
    bool operator!=(const ConnectionId& o) const { return !(*this == o); }

    void assign(const uint8_t* data, size_t n) {
        len = static_cast<uint8_t>(n > MAX_CID_LEN ? MAX_CID_LEN : n);
        memcpy(bytes, data, len);
    }
};

// ============================================================================
// Transport parameters (RFC 9000 section 18 ids)
// ============================================================================

struct TransportParams {
    uint64_t max_idle_timeout_ms = 30000;
    uint64_t max_udp_payload_size = MAX_DATAGRAM_SIZE;
    uint64_t initial_max_data = 0;
    uint64_t initial_max_stream_data_bidi_local = 0;
    uint64_t initial_max_stream_data_bidi_remote = 0;
    uint64_t initial_max_streams_bidi = 0;
    uint64_t ack_delay_exponent = 0;
    uint64_t max_ack_delay_ms = 0;

    static constexpr uint64_t ID_MAX_IDLE_TIMEOUT = 0x01;
    static constexpr uint64_t ID_MAX_UDP_PAYLOAD_SIZE = 0x03;
    static constexpr uint64_t ID_INITIAL_MAX_DATA = 0x04;
    static constexpr uint64_t ID_INITIAL_MAX_STREAM_DATA_BIDI_LOCAL = 0x05;
    static constexpr uint64_t ID_INITIAL_MAX_STREAM_DATA_BIDI_REMOTE = 0x06;
    static constexpr uint64_t ID_INITIAL_MAX_STREAMS_BIDI = 0x08;
    static constexpr uint64_t ID_ACK_DELAY_EXPONENT = 0x0a;
    static constexpr uint64_t ID_MAX_ACK_DELAY = 0x0b;

    bool encode(BufferWriter& w) const {
        return put(w, ID_MAX_IDLE_TIMEOUT, max_idle_timeout_ms) &&
               put(w, ID_MAX_UDP_PAYLOAD_SIZE, max_udp_payload_size) &&
               put(w, ID_INITIAL_MAX_DATA, initial_max_data) &&
               put(w, ID_INITIAL_MAX_STREAM_DATA_BIDI_LOCAL, initial_max_stream_data_bidi_local) &&
               put(w, ID_INITIAL_MAX_STREAM_DATA_BIDI_REMOTE, initial_max_stream_data_bidi_remote) &&
               put(w, ID_INITIAL_MAX_STREAMS_BIDI, initial_max_streams_bidi) &&
               put(w, ID_ACK_DELAY_EXPONENT, ack_delay_exponent) &&
               put(w, ID_MAX_ACK_DELAY, max_ack_delay_ms);
    }

    // Unknown ids are skipped. Returns false on truncation or invalid values.
    bool decode(BufferReader& r) {
        while (!r.empty()) {
            uint64_t id, len;
            if (!r.read_varint(&id) || !r.read_varint(&len) || len > r.remaining()) {
                return false;
            }
            BufferReader value(r.current(), static_cast<size_t>(len));
            r.skip(static_cast<size_t>(len));

            uint64_t v = 0;
            bool known = true;
            switch (id) {
                case ID_MAX_IDLE_TIMEOUT:
                case ID_MAX_UDP_PAYLOAD_SIZE:
                case ID_INITIAL_MAX_DATA:
                case ID_INITIAL_MAX_STREAM_DATA_BIDI_LOCAL:
                case ID_INITIAL_MAX_STREAM_DATA_BIDI_REMOTE:
                case ID_INITIAL_MAX_STREAMS_BIDI:
                case ID_ACK_DELAY_EXPONENT:
                case ID_MAX_ACK_DELAY:
                    if (!value.read_varint(&v) || !value.empty()) return false;
                    break;
                default:
                    known = false;
                    break;
            }
            if (!known) continue;

            switch (id) {
                case ID_MAX_IDLE_TIMEOUT: max_idle_timeout_ms = v; break;
                case ID_MAX_UDP_PAYLOAD_SIZE:
                    if (v < MIN_INITIAL_DATAGRAM) return false;
                    max_udp_payload_size = v;
                    break;
                case ID_INITIAL_MAX_DATA: initial_max_data = v; break;
                case ID_INITIAL_MAX_STREAM_DATA_BIDI_LOCAL: initial_max_stream_data_bidi_local = v; break;
                case ID_INITIAL_MAX_STREAM_DATA_BIDI_REMOTE: initial_max_stream_data_bidi_remote = v; break;
                case ID_INITIAL_MAX_STREAMS_BIDI: initial_max_streams_bidi = v; break;
                case ID_ACK_DELAY_EXPONENT:
                    if (v > 20) return false;
                    ack_delay_exponent = v;
                    break;
                case ID_MAX_ACK_DELAY:
                    if (v >= (1ULL << 14)) return false;
                    max_ack_delay_ms = v;
                    break;
            }
        }
        return true;
    }

private:
    static bool put(BufferWriter& w, uint64_t id, uint64_t v) {
        return w.write_varint(id) && w.write_varint(varint_size(v)) && w.write_varint(v);
    }
};

} // namespace afterburner::quic
