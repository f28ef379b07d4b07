// pipeline/pipeline_config.hpp
// Compile-time configuration constants, UMEM layout defaults, and validation helpers
// C++20, single-thread busy-poll focus
#pragma once

#include <cstdint>
#include <cstddef>
#include <cstdio>

namespace afterburner::pipeline {

// ============================================================================
// Compile-time Configuration (override via CMake -D flags)
// ============================================================================

#ifndef NIC_MTU
#define NIC_MTU 1500
#endif

// Cache line size (configurable for different architectures)
#ifndef CACHE_LINE_SIZE
#define CACHE_LINE_SIZE 64
#endif

// Hot-path logging - enable with -DDEBUG
#ifdef DEBUG
#define AB_DEBUG_LOG(...) do { printf(__VA_ARGS__); fflush(stdout); } while(0)
#else
#define AB_DEBUG_LOG(...) ((void)0)
#endif

constexpr bool is_power_of_two(uint64_t v) {
    return v != 0 && (v & (v - 1)) == 0;
}

// ============================================================================
// UMEM Defaults
// ============================================================================
//
// 8 MiB arena / 4096-byte frames = 2048 frames. 4096 is the minimum frame size
// for igc zero-copy: with 2048-byte frames the hardware RX buffer register
// truncates to 1024 bytes after headroom and full-MTU frames get cut.
inline constexpr uint32_t DEFAULT_FRAME_SIZE = 4096;
inline constexpr size_t   DEFAULT_ARENA_SIZE = 8 * 1024 * 1024;
inline constexpr uint32_t DEFAULT_RING_CAPACITY = 2048;

// Headroom in front of packet data inside every frame. 256 is the largest
// value igc accepts in XDP_ZEROCOPY mode.
inline constexpr uint32_t FRAME_HEADROOM = 256;

// Frames handed to the Fill ring at startup; the remainder stays in the free
// pool for TX. Half of the arena by default.
inline constexpr uint32_t DEFAULT_FILL_TARGET = 1024;

// Descriptors processed per poll_rx() / reap_completions() call
inline constexpr uint32_t DEFAULT_RX_BATCH = 64;

// Page size for UMEM alignment (must be page-aligned for mmap)
inline constexpr size_t PAGE_SIZE = 4096;

// ============================================================================
// Datagram Limits
// ============================================================================

// Ethernet(14) + IPv4(20) + UDP(8)
inline constexpr uint32_t L2_L4_HEADER_LEN = 14 + 20 + 8;

// Largest UDP payload that fits in one MTU-sized frame
inline constexpr uint32_t MAX_UDP_PAYLOAD = NIC_MTU - 20 - 8;

static_assert(DEFAULT_ARENA_SIZE % DEFAULT_FRAME_SIZE == 0,
              "Arena must be a whole number of frames");
static_assert(is_power_of_two(DEFAULT_RING_CAPACITY), "Ring capacity must be a power of 2");
static_assert(is_power_of_two(DEFAULT_FRAME_SIZE), "Frame size must be a power of 2");
static_assert(FRAME_HEADROOM + L2_L4_HEADER_LEN + MAX_UDP_PAYLOAD <= DEFAULT_FRAME_SIZE,
              "MTU-sized frame must fit after headroom");

}  // namespace afterburner::pipeline
