// src/quic/quic_frame.hpp
// Frame encoding and parsing (RFC 9000 section 19 subset)

#pragma once

#include <cstdint>
#include <cstddef>

#include "quic_types.hpp"
#include "varint.hpp"

namespace afterburner::quic {

namespace frame_type {
constexpr uint64_t PADDING = 0x00;
constexpr uint64_t PING = 0x01;
constexpr uint64_t ACK = 0x02;
constexpr uint64_t ACK_ECN = 0x03;
constexpr uint64_t CRYPTO = 0x06;
constexpr uint64_t STREAM = 0x08;          // 0x08..0x0f
constexpr uint64_t STREAM_MAX = 0x0f;
constexpr uint64_t STREAM_FIN_BIT = 0x01;
constexpr uint64_t STREAM_LEN_BIT = 0x02;
constexpr uint64_t STREAM_OFF_BIT = 0x04;
constexpr uint64_t MAX_DATA = 0x10;
constexpr uint64_t MAX_STREAM_DATA = 0x11;
constexpr uint64_t DATA_BLOCKED = 0x14;
constexpr uint64_t STREAM_DATA_BLOCKED = 0x15;
constexpr uint64_t CONNECTION_CLOSE = 0x1c;
constexpr uint64_t CONNECTION_CLOSE_APP = 0x1d;
constexpr uint64_t HANDSHAKE_DONE = 0x1e;
}  // namespace frame_type

constexpr size_t MAX_ACK_RANGES = 32;

struct AckRange {
    uint64_t smallest;
    uint64_t largest;
};

// Ranges are ordered from the largest packet number down
struct AckFrame {
    uint64_t ack_delay = 0;      // Microseconds (exponent 0)
    size_t range_count = 0;
    AckRange ranges[MAX_ACK_RANGES];

    uint64_t largest() const { return range_count ? ranges[0].largest : 0; }

    bool contains(uint64_t pn) const {
        for (size_t i = 0; i < range_count; i++) {
            if (pn >= ranges[i].smallest && pn <= ranges[i].largest) return true;
        }
        return false;
    }
};

struct StreamFrame {
    uint64_t stream_id = 0;
    uint64_t offset = 0;
    const uint8_t* data = nullptr;
    size_t len = 0;
    bool fin = false;
};

struct CryptoFrame {
    uint64_t offset = 0;
    const uint8_t* data = nullptr;
    size_t len = 0;
};

struct CloseFrame {
    uint64_t error_code = 0;
    uint64_t frame_type = 0;      // Transport close only
    bool application = false;
    const uint8_t* reason = nullptr;
    size_t reason_len = 0;
};

// One parsed frame. Only the member matching type is meaningful; byte
// pointers reference the decrypted packet buffer.
struct Frame {
    uint64_t type = frame_type::PADDING;
    AckFrame ack;
    StreamFrame stream;
    CryptoFrame crypto;
    CloseFrame close;
    uint64_t stream_id = 0;       // MAX_STREAM_DATA, STREAM_DATA_BLOCKED
    uint64_t value = 0;           // MAX_DATA, MAX_STREAM_DATA, *_BLOCKED limits

    bool is_stream() const { return type >= frame_type::STREAM && type <= frame_type::STREAM_MAX; }

    bool ack_eliciting() const {
        return type != frame_type::ACK && type != frame_type::ACK_ECN &&
               type != frame_type::PADDING &&
               type != frame_type::CONNECTION_CLOSE && type != frame_type::CONNECTION_CLOSE_APP;
    }
};

// ============================================================================
// Parsing
// ============================================================================

inline bool parse_ack(BufferReader& r, AckFrame* ack, bool ecn) {
    uint64_t largest, delay, range_count, first_range;
    if (!r.read_varint(&largest) || !r.read_varint(&delay) ||
        !r.read_varint(&range_count) || !r.read_varint(&first_range) ||
        first_range > largest) {
        return false;
    }
    ack->ack_delay = delay;
    ack->range_count = 1;
    ack->ranges[0].largest = largest;
    ack->ranges[0].smallest = largest - first_range;

    uint64_t smallest = ack->ranges[0].smallest;
    for (uint64_t i = 0; i < range_count; i++) {
        uint64_t gap, len;
        if (!r.read_varint(&gap) || !r.read_varint(&len)) {
            return false;
        }
        if (smallest < gap + 2) {
            return false;
        }
        uint64_t range_largest = smallest - gap - 2;
        if (len > range_largest) {
            return false;
        }
        smallest = range_largest - len;
        // Older ranges beyond what we track only matter for already-acked packets
        if (ack->range_count < MAX_ACK_RANGES) {
            ack->ranges[ack->range_count].largest = range_largest;
            ack->ranges[ack->range_count].smallest = smallest;
            ack->range_count++;
        }
    }

    if (ecn) {
        uint64_t ect0, ect1, ce;
        if (!r.read_varint(&ect0) || !r.read_varint(&ect1) || !r.read_varint(&ce)) {
            return false;
        }
    }
    return true;
}

/**
 * Parse the next frame from r
 * @return false on unknown type or malformed encoding (FRAME_ENCODING_ERROR)
 */
inline bool parse_frame(BufferReader& r, Frame* f) {
    uint64_t type;
    if (!r.read_varint(&type)) {
        return false;
    }
    f->type = type;

    switch (type) {
        case frame_type::PADDING:
            // Consecutive padding collapses into one frame
            while (!r.empty() && *r.current() == 0) {
                r.skip(1);
            }
            return true;

        case frame_type::PING:
        case frame_type::HANDSHAKE_DONE:
            return true;

        case frame_type::ACK:
        case frame_type::ACK_ECN:
            return parse_ack(r, &f->ack, type == frame_type::ACK_ECN);

        case frame_type::CRYPTO: {
            uint64_t offset, len;
            if (!r.read_varint(&offset) || !r.read_varint(&len) ||
                len > r.remaining() || !r.read_bytes(&f->crypto.data, static_cast<size_t>(len))) {
                return false;
            }
            f->crypto.offset = offset;
            f->crypto.len = static_cast<size_t>(len);
            return offset + len <= VARINT_MAX;
        }

        case frame_type::MAX_DATA:
        case frame_type::DATA_BLOCKED:
            return r.read_varint(&f->value);

        case frame_type::MAX_STREAM_DATA:
        case frame_type::STREAM_DATA_BLOCKED:
            return r.read_varint(&f->stream_id) && r.read_varint(&f->value);

        case frame_type::CONNECTION_CLOSE:
        case frame_type::CONNECTION_CLOSE_APP: {
            CloseFrame& c = f->close;
            c.application = (type == frame_type::CONNECTION_CLOSE_APP);
            c.frame_type = 0;
            if (!r.read_varint(&c.error_code)) return false;
            if (!c.application && !r.read_varint(&c.frame_type)) return false;
            uint64_t reason_len;
            if (!r.read_varint(&reason_len) || reason_len > r.remaining()) return false;
            c.reason_len = static_cast<size_t>(reason_len);
            return r.read_bytes(&c.reason, c.reason_len);
        }

        default:
            break;
    }

    if (type >= frame_type::STREAM && type <= frame_type::STREAM_MAX) {
        StreamFrame& s = f->stream;
        s.fin = (type & frame_type::STREAM_FIN_BIT) != 0;
        s.offset = 0;
        if (!r.read_varint(&s.stream_id)) return false;
        if ((type & frame_type::STREAM_OFF_BIT) && !r.read_varint(&s.offset)) return false;
        uint64_t len;
        if (type & frame_type::STREAM_LEN_BIT) {
            if (!r.read_varint(&len) || len > r.remaining()) return false;
        } else {
            len = r.remaining();
        }
        s.len = static_cast<size_t>(len);
        if (!r.read_bytes(&s.data, s.len)) return false;
        return s.offset + len <= VARINT_MAX;
    }

    return false;
}

// ============================================================================
// Writing
// ============================================================================

inline bool write_padding(BufferWriter& w, size_t n) {
    if (w.remaining() < n) return false;
    for (size_t i = 0; i < n; i++) {
        w.write_u8(0);
    }
    return true;
}

inline bool write_ping(BufferWriter& w) {
    return w.write_varint(frame_type::PING);
}

inline bool write_handshake_done(BufferWriter& w) {
    return w.write_varint(frame_type::HANDSHAKE_DONE);
}

inline bool write_ack(BufferWriter& w, const AckFrame& ack) {
    if (ack.range_count == 0) return false;
    const AckRange& first = ack.ranges[0];
    if (!w.write_varint(frame_type::ACK) ||
        !w.write_varint(first.largest) ||
        !w.write_varint(ack.ack_delay) ||
        !w.write_varint(ack.range_count - 1) ||
        !w.write_varint(first.largest - first.smallest)) {
        return false;
    }
    uint64_t prev_smallest = first.smallest;
    for (size_t i = 1; i < ack.range_count; i++) {
        const AckRange& rg = ack.ranges[i];
        if (!w.write_varint(prev_smallest - rg.largest - 2) ||
            !w.write_varint(rg.largest - rg.smallest)) {
            return false;
        }
        prev_smallest = rg.smallest;
    }
    return true;
}

inline size_t crypto_frame_overhead(uint64_t offset, size_t len) {
    return 1 + varint_size(offset) + varint_size(len);
}

inline bool write_crypto(BufferWriter& w, uint64_t offset, const uint8_t* data, size_t len) {
    return w.write_varint(frame_type::CRYPTO) && w.write_varint(offset) &&
           w.write_varint(len) && w.write_bytes(data, len);
}

inline size_t stream_frame_overhead(uint64_t stream_id, uint64_t offset, size_t len) {
    return 1 + varint_size(stream_id) + (offset ? varint_size(offset) : 0) + varint_size(len);
}

// Always carries an explicit length so more frames can follow
inline bool write_stream(BufferWriter& w, uint64_t stream_id, uint64_t offset,
                         const uint8_t* data, size_t len, bool fin) {
    uint64_t type = frame_type::STREAM | frame_type::STREAM_LEN_BIT;
    if (offset) type |= frame_type::STREAM_OFF_BIT;
    if (fin) type |= frame_type::STREAM_FIN_BIT;
    return w.write_varint(type) && w.write_varint(stream_id) &&
           (offset == 0 || w.write_varint(offset)) &&
           w.write_varint(len) && w.write_bytes(data, len);
}

inline bool write_max_data(BufferWriter& w, uint64_t max) {
    return w.write_varint(frame_type::MAX_DATA) && w.write_varint(max);
}

inline bool write_max_stream_data(BufferWriter& w, uint64_t stream_id, uint64_t max) {
    return w.write_varint(frame_type::MAX_STREAM_DATA) && w.write_varint(stream_id) &&
           w.write_varint(max);
}

inline bool write_data_blocked(BufferWriter& w, uint64_t limit) {
    return w.write_varint(frame_type::DATA_BLOCKED) && w.write_varint(limit);
}

inline bool write_stream_data_blocked(BufferWriter& w, uint64_t stream_id, uint64_t limit) {
    return w.write_varint(frame_type::STREAM_DATA_BLOCKED) && w.write_varint(stream_id) &&
           w.write_varint(limit);
}

inline bool write_connection_close(BufferWriter& w, uint64_t error_code, uint64_t offending_type,
                                   const char* reason, size_t reason_len) {
    return w.write_varint(frame_type::CONNECTION_CLOSE) && w.write_varint(error_code) &&
           w.write_varint(offending_type) && w.write_varint(reason_len) &&
           w.write_bytes(reason, reason_len);
}

} // namespace afterburner::quic
