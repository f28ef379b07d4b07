// src/quic/quic_packet.hpp
// Packet headers and AEAD packet protection
//
// Long header (Initial only):
//   [0xC3][version 4][dcid_len 1][dcid][scid_len 1][scid][token_len=0 1]
//   [length 2-byte varint][pn 4][ciphertext + tag]
// Short header (1-RTT):
//   [0x43][dcid 8][pn 4][ciphertext + tag]
//
// The whole header is the AEAD associated data. Packet numbers travel in
// four bytes and are not header-protected.

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>

#include "quic_types.hpp"
#include "quic_crypto.hpp"
#include "varint.hpp"

namespace afterburner::quic {

constexpr uint8_t HEADER_FORM_LONG = 0x80;
constexpr uint8_t HEADER_FIXED_BIT = 0x40;
constexpr uint8_t LONG_TYPE_MASK = 0x30;       // Initial = 0
constexpr uint8_t PN_LEN_MASK = 0x03;

constexpr uint8_t LONG_HEADER_INITIAL = HEADER_FORM_LONG | HEADER_FIXED_BIT | (PN_LEN - 1);  // 0xC3
constexpr uint8_t SHORT_HEADER = HEADER_FIXED_BIT | (PN_LEN - 1);                            // 0x43

struct PacketHeader {
    bool is_long = false;
    uint32_t version = 0;
    ConnectionId dcid;
    ConnectionId scid;            // Long header only
    uint64_t packet_number = 0;   // Truncated on parse, full on build
    size_t header_len = 0;        // Bytes through the packet number (the AAD)
    size_t packet_len = 0;        // Header + ciphertext + tag

    PacketSpace space() const { return is_long ? PacketSpace::Initial : PacketSpace::Application; }
};

inline size_t long_header_len(const ConnectionId& dcid, const ConnectionId& scid) {
    return 1 + 4 + 1 + dcid.len + 1 + scid.len + 1 + 2 + PN_LEN;
}

inline size_t short_header_len() {
    return 1 + CID_LEN + PN_LEN;
}

// Largest plaintext that fits one datagram under the given header
inline size_t max_plaintext(size_t header_len) {
    return MAX_DATAGRAM_SIZE - header_len - AEAD_TAG_LEN;
}

/**
 * Parse the unprotected header of the packet at data
 *
 * Short headers take the rest of the datagram; long headers are bounded by
 * their Length field so coalesced packets can follow.
 * @return false if the header is malformed or truncated
 */
inline bool parse_packet_header(const uint8_t* data, size_t len, PacketHeader* hdr) {
    BufferReader r(data, len);
    uint8_t first;
    if (!r.read_u8(&first) || (first & HEADER_FIXED_BIT) == 0 ||
        (first & PN_LEN_MASK) != PN_LEN - 1) {
        return false;
    }

    if (first & HEADER_FORM_LONG) {
        hdr->is_long = true;
        if ((first & LONG_TYPE_MASK) != 0) {
            return false;   // Only Initial packets use the long header here
        }
        uint8_t dcid_len, scid_len;
        const uint8_t* p;
        if (!r.read_u32(&hdr->version) ||
            !r.read_u8(&dcid_len) || dcid_len > MAX_CID_LEN || !r.read_bytes(&p, dcid_len)) {
            return false;
        }
        hdr->dcid.assign(p, dcid_len);
        if (!r.read_u8(&scid_len) || scid_len > MAX_CID_LEN || !r.read_bytes(&p, scid_len)) {
            return false;
        }
        hdr->scid.assign(p, scid_len);

        uint64_t token_len, length;
        if (!r.read_varint(&token_len) || !r.skip(static_cast<size_t>(token_len)) ||
            !r.read_varint(&length)) {
            return false;
        }
        if (length < PN_LEN + AEAD_TAG_LEN || length > r.remaining()) {
            return false;
        }
        size_t pn_offset = r.position();
        uint32_t pn;
        if (!r.read_u32(&pn)) {
            return false;
        }
        hdr->packet_number = pn;
        hdr->header_len = r.position();
        hdr->packet_len = pn_offset + static_cast<size_t>(length);
        return true;
    }

    hdr->is_long = false;
    hdr->version = 0;
    hdr->scid.len = 0;
    const uint8_t* p;
    uint32_t pn;
    if (!r.read_bytes(&p, CID_LEN) || !r.read_u32(&pn)) {
        return false;
    }
    hdr->dcid.assign(p, CID_LEN);
    hdr->packet_number = pn;
    hdr->header_len = r.position();
    hdr->packet_len = len;
    if (hdr->packet_len < hdr->header_len + AEAD_TAG_LEN) {
        return false;
    }
    return true;
}

/**
 * Recover a full packet number from its truncated encoding
 * (RFC 9000 appendix A.3)
 *
 * @param largest_pn Largest packet number processed in the space, or
 *                   UINT64_MAX if none yet
 */
inline uint64_t decode_packet_number(uint64_t largest_pn, uint64_t truncated_pn, size_t pn_nbits = 32) {
    uint64_t expected = (largest_pn == UINT64_MAX) ? 0 : largest_pn + 1;
    uint64_t win = 1ULL << pn_nbits;
    uint64_t hwin = win / 2;
    uint64_t mask = win - 1;
    uint64_t candidate = (expected & ~mask) | truncated_pn;
    if (candidate + hwin <= expected && candidate < (1ULL << 62) - win) {
        return candidate + win;
    }
    if (candidate > expected + hwin && candidate >= win) {
        return candidate - win;
    }
    return candidate;
}

/**
 * Write the header and protected payload of one packet into out
 *
 * @param hdr     is_long, dcid, scid (long only) and the full packet number
 * @param frames  Plaintext frame bytes
 * @return Bytes written, 0 if it does not fit or sealing failed
 */
inline size_t seal_packet(const PacketHeader& hdr, const uint8_t* frames, size_t frames_len,
                          AeadKey& key, uint8_t* out, size_t capacity) {
    BufferWriter w(out, capacity);
    bool ok;
    if (hdr.is_long) {
        ok = w.write_u8(LONG_HEADER_INITIAL) &&
             w.write_u32(QUIC_VERSION) &&
             w.write_u8(hdr.dcid.len) && w.write_bytes(hdr.dcid.bytes, hdr.dcid.len) &&
             w.write_u8(hdr.scid.len) && w.write_bytes(hdr.scid.bytes, hdr.scid.len) &&
             w.write_varint(0) &&
             w.write_varint_fixed(PN_LEN + frames_len + AEAD_TAG_LEN, 2);
    } else {
        ok = w.write_u8(SHORT_HEADER) && w.write_bytes(hdr.dcid.bytes, CID_LEN);
    }
    if (!ok || !w.write_u32(static_cast<uint32_t>(hdr.packet_number))) {
        return 0;
    }

    size_t header_len = w.position();
    if (w.remaining() < frames_len + AEAD_TAG_LEN) {
        return 0;
    }
    if (!key.seal(hdr.packet_number, out, header_len, frames, frames_len, out + header_len)) {
        return 0;
    }
    return header_len + frames_len + AEAD_TAG_LEN;
}

/**
 * Authenticate and decrypt one packet whose header was parsed
 *
 * @param out     Receives the plaintext frames
 * @param out_cap Size of out; a longer plaintext is rejected before decrypting
 * @return false on authentication failure or when the plaintext does not fit
 */
inline bool open_packet(const uint8_t* data, const PacketHeader& hdr, uint64_t full_pn,
                        AeadKey& key, uint8_t* out, size_t out_cap, size_t* out_len) {
    size_t protected_len = hdr.packet_len - hdr.header_len;
    if (protected_len < AEAD_TAG_LEN || protected_len - AEAD_TAG_LEN > out_cap) {
        return false;
    }
    if (!key.open(full_pn, data, hdr.header_len, data + hdr.header_len, protected_len, out)) {
        return false;
    }
    *out_len = protected_len - AEAD_TAG_LEN;
    return true;
}

} // namespace afterburner::quic
