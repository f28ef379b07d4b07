// app/probe_message.hpp
// Round-trip probe payloads carried on the flood streams
//
// Wire layout (little-endian):
//   [0]      magic 0xA5
//   [1..3)   content length
//   [3..11)  send timestamp, monotonic ns
//   [11..19) sequence number
//   [19..)   mock transaction content
//
// The content imitates a Solana transaction: one signature, a message
// header, 2-4 account keys, a recent blockhash and one instruction whose
// 4-byte data ends in a rotating counter byte.
#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>

namespace afterburner::app {

constexpr uint8_t PROBE_MAGIC = 0xA5;
constexpr size_t PROBE_HEADER_LEN = 19;

constexpr size_t SIGNATURE_LEN = 64;
constexpr size_t ACCOUNT_KEY_LEN = 32;
constexpr size_t BLOCKHASH_LEN = 32;
constexpr uint8_t MIN_ACCOUNTS = 2;
constexpr uint8_t MAX_ACCOUNTS = 4;

struct ProbeHeader {
    uint16_t content_len = 0;
    uint64_t send_ts_ns = 0;
    uint64_t seq = 0;
};

namespace detail {

inline void put_le(uint8_t* p, uint64_t v, size_t n) {
    for (size_t i = 0; i < n; i++) {
        p[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

inline uint64_t get_le(const uint8_t* p, size_t n) {
    uint64_t v = 0;
    for (size_t i = 0; i < n; i++) {
        v |= static_cast<uint64_t>(p[i]) << (8 * i);
    }
    return v;
}

inline size_t content_len_for(uint8_t accounts) {
    return 1 + SIGNATURE_LEN          // signatures
         + 3                          // message header
         + 1 + accounts * ACCOUNT_KEY_LEN
         + BLOCKHASH_LEN
         + 3                          // instruction count, program index, account count
         + 1 + 4;                     // data length + data
}

}  // namespace detail

inline size_t min_probe_size() {
    return PROBE_HEADER_LEN + detail::content_len_for(MIN_ACCOUNTS);
}

/**
 * Build probe seq into out
 *
 * The account count rotates with seq and shrinks until the message fits
 * max_payload; content is truncated as a last resort.
 * @return Message length, 0 if max_payload or cap cannot hold the header
 */
inline size_t build_probe(uint64_t seq, uint64_t send_ts_ns, size_t max_payload,
                          uint8_t* out, size_t cap) {
    size_t limit = (max_payload < cap) ? max_payload : cap;
    if (limit < PROBE_HEADER_LEN) {
        return 0;
    }

    uint8_t accounts = static_cast<uint8_t>(MIN_ACCOUNTS + seq % (MAX_ACCOUNTS - MIN_ACCOUNTS + 1));
    while (accounts > 0 && PROBE_HEADER_LEN + detail::content_len_for(accounts) > limit) {
        accounts--;
    }

    uint8_t* c = out + PROBE_HEADER_LEN;
    size_t room = limit - PROBE_HEADER_LEN;
    size_t pos = 0;
    auto put = [&](uint8_t b) {
        if (pos < room) c[pos] = b;
        pos++;
    };
    auto fill = [&](uint8_t b, size_t n) {
        for (size_t i = 0; i < n; i++) put(b);
    };

    put(1);
    fill(0xAA, SIGNATURE_LEN);
    put(1); put(0); put(1);
    put(accounts);
    for (uint8_t i = 0; i < accounts; i++) {
        fill((i & 1) ? 0xCC : 0xBB, ACCOUNT_KEY_LEN);
    }
    fill(0xDD, BLOCKHASH_LEN);
    put(1); put(0); put(0);
    put(4);
    put(0xCA); put(0xFE); put(0xBA);
    put(static_cast<uint8_t>(seq));

    size_t content_len = (pos < room) ? pos : room;
    out[0] = PROBE_MAGIC;
    detail::put_le(out + 1, content_len, 2);
    detail::put_le(out + 3, send_ts_ns, 8);
    detail::put_le(out + 11, seq, 8);
    return PROBE_HEADER_LEN + content_len;
}

inline bool parse_probe_header(const uint8_t* data, size_t len, ProbeHeader* hdr) {
    if (len < PROBE_HEADER_LEN || data[0] != PROBE_MAGIC) {
        return false;
    }
    hdr->content_len = static_cast<uint16_t>(detail::get_le(data + 1, 2));
    hdr->send_ts_ns = detail::get_le(data + 3, 8);
    hdr->seq = detail::get_le(data + 11, 8);
    return true;
}

// Counter byte of a complete message, -1 if the content was truncated
inline int probe_counter(const uint8_t* msg, size_t len) {
    ProbeHeader hdr;
    if (!parse_probe_header(msg, len, &hdr) || hdr.content_len < detail::content_len_for(0) ||
        PROBE_HEADER_LEN + hdr.content_len > len) {
        return -1;
    }
    const uint8_t* content = msg + PROBE_HEADER_LEN;
    uint8_t accounts = content[1 + SIGNATURE_LEN + 3];
    if (hdr.content_len != detail::content_len_for(accounts)) {
        return -1;
    }
    return content[hdr.content_len - 1];
}

// ============================================================================
// Reassembly of probe messages from a stream byte sequence
// ============================================================================

class MessageAssembler {
public:
    void feed(const uint8_t* data, size_t len) {
        buf_.insert(buf_.end(), data, data + len);
    }

    /**
     * Extract the next complete message
     *
     * Bytes that cannot start a message are discarded one at a time and
     * counted as framing errors.
     * @param msg Optional copy of the whole message (header + content)
     */
    bool next(ProbeHeader* hdr, std::vector<uint8_t>* msg = nullptr) {
        while (buf_.size() - head_ >= PROBE_HEADER_LEN) {
            const uint8_t* p = buf_.data() + head_;
            if (!parse_probe_header(p, PROBE_HEADER_LEN, hdr)) {
                head_++;
                framing_errors_++;
                continue;
            }
            size_t total = PROBE_HEADER_LEN + hdr->content_len;
            if (buf_.size() - head_ < total) {
                break;
            }
            if (msg) {
                msg->assign(p, p + total);
            }
            head_ += total;
            compact();
            return true;
        }
        compact();
        return false;
    }

    size_t buffered() const { return buf_.size() - head_; }
    uint64_t framing_errors() const { return framing_errors_; }

    void reset() {
        buf_.clear();
        head_ = 0;
    }

private:
    void compact() {
        if (head_ == buf_.size()) {
            buf_.clear();
            head_ = 0;
        } else if (head_ > 4096) {
            buf_.erase(buf_.begin(), buf_.begin() + static_cast<long>(head_));
            head_ = 0;
        }
    }

    std::vector<uint8_t> buf_;
    size_t head_ = 0;
    uint64_t framing_errors_ = 0;
};

} // namespace afterburner::app
