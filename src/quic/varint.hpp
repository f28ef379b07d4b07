// src/quic/varint.hpp
// Bounds-checked big-endian reader/writer with QUIC variable-length integers
//
// Every read/write returns false instead of running off the buffer; callers
// treat false as a malformed packet or a full output buffer.
//
// Varint encoding (RFC 9000 section 16): the two high bits of the first byte
// select a 1, 2, 4 or 8 byte big-endian value of 6, 14, 30 or 62 bits.

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>

namespace afterburner::quic {

constexpr uint64_t VARINT_MAX = (1ULL << 62) - 1;

inline size_t varint_size(uint64_t v) {
    if (v < (1ULL << 6)) return 1;
    if (v < (1ULL << 14)) return 2;
    if (v < (1ULL << 30)) return 4;
    return 8;
}

class BufferWriter {
public:
    BufferWriter(uint8_t* buf, size_t capacity) : buf_(buf), cap_(capacity), pos_(0) {}

    bool write_u8(uint8_t v) {
        if (remaining() < 1) return false;
        buf_[pos_++] = v;
        return true;
    }

    bool write_u16(uint16_t v) {
        if (remaining() < 2) return false;
        buf_[pos_++] = static_cast<uint8_t>(v >> 8);
        buf_[pos_++] = static_cast<uint8_t>(v);
        return true;
    }

    bool write_u24(uint32_t v) {
        if (remaining() < 3 || v > 0xFFFFFF) return false;
        buf_[pos_++] = static_cast<uint8_t>(v >> 16);
        buf_[pos_++] = static_cast<uint8_t>(v >> 8);
        buf_[pos_++] = static_cast<uint8_t>(v);
        return true;
    }

    bool write_u32(uint32_t v) {
        if (remaining() < 4) return false;
        for (int shift = 24; shift >= 0; shift -= 8) {
            buf_[pos_++] = static_cast<uint8_t>(v >> shift);
        }
        return true;
    }

    bool write_u64(uint64_t v) {
        if (remaining() < 8) return false;
        for (int shift = 56; shift >= 0; shift -= 8) {
            buf_[pos_++] = static_cast<uint8_t>(v >> shift);
        }
        return true;
    }

    bool write_bytes(const void* src, size_t n) {
        if (remaining() < n) return false;
        if (n > 0) {
            memcpy(buf_ + pos_, src, n);
            pos_ += n;
        }
        return true;
    }

    bool write_varint(uint64_t v) {
        return write_varint_fixed(v, varint_size(v));
    }

    // Encode v in exactly size bytes (1, 2, 4 or 8); used for length fields
    // that are reserved before the value is known
    bool write_varint_fixed(uint64_t v, size_t size) {
        if (v > VARINT_MAX || remaining() < size) return false;
        switch (size) {
            case 1:
                if (v >= (1ULL << 6)) return false;
                buf_[pos_++] = static_cast<uint8_t>(v);
                return true;
            case 2:
                if (v >= (1ULL << 14)) return false;
                return write_u16(static_cast<uint16_t>(0x4000 | v));
            case 4:
                if (v >= (1ULL << 30)) return false;
                return write_u32(static_cast<uint32_t>(0x80000000UL | v));
            case 8:
                return write_u64(0xC000000000000000ULL | v);
            default:
                return false;
        }
    }

    // Overwrite a previously reserved 2-byte varint at offset
    bool patch_varint2(size_t offset, uint64_t v) {
        if (offset + 2 > pos_ || v >= (1ULL << 14)) return false;
        buf_[offset] = static_cast<uint8_t>(0x40 | (v >> 8));
        buf_[offset + 1] = static_cast<uint8_t>(v);
        return true;
    }

    uint8_t* data() { return buf_; }
    uint8_t* current() { return buf_ + pos_; }
    size_t position() const { return pos_; }
    size_t remaining() const { return cap_ - pos_; }
    size_t capacity() const { return cap_; }

    bool advance(size_t n) {
        if (remaining() < n) return false;
        pos_ += n;
        return true;
    }

private:
    uint8_t* buf_;
    size_t cap_;
    size_t pos_;
};

class BufferReader {
public:
    BufferReader(const uint8_t* data, size_t len) : data_(data), len_(len), pos_(0) {}

    bool read_u8(uint8_t* v) {
        if (remaining() < 1) return false;
        *v = data_[pos_++];
        return true;
    }

    bool read_u16(uint16_t* v) {
        if (remaining() < 2) return false;
        *v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return true;
    }

    bool read_u24(uint32_t* v) {
        if (remaining() < 3) return false;
        *v = (static_cast<uint32_t>(data_[pos_]) << 16) |
             (static_cast<uint32_t>(data_[pos_ + 1]) << 8) | data_[pos_ + 2];
        pos_ += 3;
        return true;
    }

    bool read_u32(uint32_t* v) {
        if (remaining() < 4) return false;
        uint32_t r = 0;
        for (int i = 0; i < 4; i++) {
            r = (r << 8) | data_[pos_++];
        }
        *v = r;
        return true;
    }

    bool read_u64(uint64_t* v) {
        if (remaining() < 8) return false;
        uint64_t r = 0;
        for (int i = 0; i < 8; i++) {
            r = (r << 8) | data_[pos_++];
        }
        *v = r;
        return true;
    }

    bool read_varint(uint64_t* v) {
        if (remaining() < 1) return false;
        size_t size = static_cast<size_t>(1) << (data_[pos_] >> 6);
        if (remaining() < size) return false;
        uint64_t r = data_[pos_] & 0x3F;
        for (size_t i = 1; i < size; i++) {
            r = (r << 8) | data_[pos_ + i];
        }
        pos_ += size;
        *v = r;
        return true;
    }

    // Point *out at the next n bytes without copying
    bool read_bytes(const uint8_t** out, size_t n) {
        if (remaining() < n) return false;
        *out = data_ + pos_;
        pos_ += n;
        return true;
    }

    bool copy_bytes(void* dst, size_t n) {
        if (remaining() < n) return false;
        if (n > 0) {
            memcpy(dst, data_ + pos_, n);
            pos_ += n;
        }
        return true;
    }

    bool skip(size_t n) {
        if (remaining() < n) return false;
        pos_ += n;
        return true;
    }

    const uint8_t* data() const { return data_; }
    const uint8_t* current() const { return data_ + pos_; }
    size_t position() const { return pos_; }
    size_t remaining() const { return len_ - pos_; }
    bool empty() const { return pos_ >= len_; }

private:
    const uint8_t* data_;
    size_t len_;
    size_t pos_;
};

} // namespace afterburner::quic
