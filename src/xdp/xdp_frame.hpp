// src/xdp/xdp_frame.hpp
// Frame reference structure for zero-copy UMEM operations
// Enables direct access to arena frames without memcpy

#ifndef AFTERBURNER_XDP_FRAME_HPP
#define AFTERBURNER_XDP_FRAME_HPP

#include <cstdint>
#include <cstddef>
#include <cstring>

namespace afterburner {
namespace xdp {

/**
 * @brief Reference to a frame in the arena
 *
 * Zero-copy view into one UMEM frame held by the application. Only the
 * offset (addr) identifies the frame across the ring boundary; the data
 * pointer is a userspace convenience derived from it.
 *
 * Memory layout:
 * ┌─────────────────────────┬─────────────────────────────┐
 * │ Headroom (256 bytes)    │  Data (starting at 'data')  │
 * │                         │  Length: 'len'              │
 * └─────────────────────────┴─────────────────────────────┘
 * ^                         ^
 * addr (frame base)         data pointer
 */
struct XDPFrame {
    uint64_t addr;           ///< Frame base offset in the arena
    uint8_t* data;           ///< Pointer to usable data (post-headroom)
    uint32_t len;            ///< Current data length
    uint32_t capacity;       ///< Maximum data capacity (frame_size - headroom)
    uint32_t offset;         ///< Data start relative to addr (headroom)
    bool owned;              ///< True while held by the application

    // False (length untouched) if new_len exceeds capacity
    bool set_length(uint32_t new_len) {
        if (new_len > capacity) {
            return false;
        }
        len = new_len;
        return true;
    }

    void clear() {
        addr = 0;
        data = nullptr;
        len = 0;
        offset = 0;
        owned = false;
    }
};

} // namespace xdp
} // namespace afterburner

#endif // AFTERBURNER_XDP_FRAME_HPP
