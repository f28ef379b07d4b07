// src/xdp/frame_arena.hpp
// UMEM frame arena: one mmap'd region cut into fixed-size frames
//
// The arena owns frame memory for the whole process lifetime. Frames are
// identified by their byte offset (the address AF_XDP descriptors carry).
// A per-frame state table tracks custody so leaks and double returns are
// caught at the point they happen instead of as a slowly shrinking pool.

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <vector>
#include <string>
#include <stdexcept>
#include <sys/mman.h>

#include "../pipeline/pipeline_config.hpp"

namespace afterburner::xdp {

// Custody of one frame. Ring residency is derived from ring cursors;
// the arena tracks who may legally touch the frame next.
enum class FrameState : uint8_t {
    Free = 0,      // In the free pool
    Held,          // Application owns it inside one loop iteration
    KernelRx,      // Posted to Fill; returns through RX
    KernelTx,      // Submitted to TX; returns through Completion
};

constexpr size_t FRAME_STATE_COUNT = 4;

inline const char* frame_state_name(FrameState s) {
    switch (s) {
        case FrameState::Free:     return "Free";
        case FrameState::Held:     return "Held";
        case FrameState::KernelRx: return "KernelRx";
        case FrameState::KernelTx: return "KernelTx";
    }
    return "?";
}

class FrameArena {
public:
    FrameArena() = default;

    ~FrameArena() {
        if (base_ != nullptr) {
            munmap(base_, size_);
        }
    }

    FrameArena(const FrameArena&) = delete;
    FrameArena& operator=(const FrameArena&) = delete;

    /**
     * Map the arena and put every frame in the free pool
     *
     * @param arena_size Total bytes; must be a multiple of frame_size
     * @param frame_size Power of two, at least 2048
     * @param try_hugepages Attempt MAP_HUGETLB first, fall back to 4K pages
     * @throws std::runtime_error on bad geometry or mmap failure
     */
    void init(size_t arena_size, uint32_t frame_size, bool try_hugepages = true) {
        if (base_ != nullptr) {
            throw std::runtime_error("FrameArena: already initialized");
        }
        if (!pipeline::is_power_of_two(frame_size) || frame_size < 2048) {
            throw std::runtime_error("FrameArena: frame size must be a power of 2 >= 2048");
        }
        if (arena_size == 0 || arena_size % frame_size != 0 || arena_size % pipeline::PAGE_SIZE != 0) {
            throw std::runtime_error("FrameArena: arena size must be a non-zero multiple of frame and page size");
        }

        void* area = MAP_FAILED;
        if (try_hugepages) {
            area = mmap(nullptr, arena_size, PROT_READ | PROT_WRITE,
                        MAP_PRIVATE | MAP_ANONYMOUS | MAP_HUGETLB, -1, 0);
        }
        if (area == MAP_FAILED) {
            // Fallback to regular pages if huge pages fail
            area = mmap(nullptr, arena_size, PROT_READ | PROT_WRITE,
                        MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
        }
        if (area == MAP_FAILED) {
            throw std::runtime_error(std::string("FrameArena: mmap failed: ") + strerror(errno));
        }

        base_ = static_cast<uint8_t*>(area);
        size_ = arena_size;
        frame_size_ = frame_size;
        frame_count_ = static_cast<uint32_t>(arena_size / frame_size);
        frame_shift_ = static_cast<uint32_t>(__builtin_ctz(frame_size));

        states_.assign(frame_count_, FrameState::Free);
        for (auto& c : counts_) c = 0;
        counts_[static_cast<size_t>(FrameState::Free)] = frame_count_;

        // LIFO free pool, seeded so that frame 0 is handed out first
        free_.clear();
        free_.reserve(frame_count_);
        for (uint32_t i = frame_count_; i > 0; i--) {
            free_.push_back(static_cast<uint64_t>(i - 1) << frame_shift_);
        }

        printf("[XDP] Arena: %zu bytes, %u frames x %u bytes\n", size_, frame_count_, frame_size_);
    }

    // Take a frame from the free pool (Free -> Held). False = Exhausted.
    bool take(uint64_t* addr) {
        if (free_.empty()) {
            return false;
        }
        uint64_t a = free_.back();
        free_.pop_back();
        set_state(frame_index(a), FrameState::Held);
        *addr = a;
        return true;
    }

    /**
     * Return a frame to the free pool from any userspace custody
     *
     * Addresses are masked to their frame base. A foreign address, or a
     * frame that is already Free, is counted and ignored so the pool never
     * holds duplicates.
     */
    bool give_back(uint64_t addr) {
        if (!owns(addr)) {
            violations_++;
            return false;
        }
        uint64_t base = frame_base(addr);
        uint32_t idx = frame_index(base);
        if (states_[idx] == FrameState::Free) {
            violations_++;
            return false;
        }
        set_state(idx, FrameState::Free);
        free_.push_back(base);
        return true;
    }

    // Return a frame to the free pool only if it is currently in state from
    bool reclaim(uint64_t addr, FrameState from) {
        if (!owns(addr)) {
            violations_++;
            return false;
        }
        uint64_t base = frame_base(addr);
        uint32_t idx = frame_index(base);
        if (states_[idx] != from || from == FrameState::Free) {
            violations_++;
            return false;
        }
        set_state(idx, FrameState::Free);
        free_.push_back(base);
        return true;
    }

    // Move a frame between non-Free states, checking the expected source state
    bool transition(uint64_t addr, FrameState from, FrameState to) {
        if (!owns(addr)) {
            violations_++;
            return false;
        }
        uint32_t idx = frame_index(frame_base(addr));
        if (states_[idx] != from) {
            violations_++;
            return false;
        }
        set_state(idx, to);
        return true;
    }

    bool owns(uint64_t addr) const {
        return base_ != nullptr && addr < size_;
    }

    uint64_t frame_base(uint64_t addr) const {
        return addr & ~static_cast<uint64_t>(frame_size_ - 1);
    }

    uint32_t frame_index(uint64_t addr) const {
        return static_cast<uint32_t>(addr >> frame_shift_);
    }

    FrameState state(uint64_t addr) const {
        return states_[frame_index(frame_base(addr))];
    }

    uint8_t* data(uint64_t addr) { return base_ + addr; }
    const uint8_t* data(uint64_t addr) const { return base_ + addr; }

    uint8_t* base() { return base_; }
    size_t size() const { return size_; }
    uint32_t frame_size() const { return frame_size_; }
    uint32_t frame_count() const { return frame_count_; }
    uint32_t free_count() const { return static_cast<uint32_t>(free_.size()); }
    uint32_t count(FrameState s) const { return counts_[static_cast<size_t>(s)]; }
    uint64_t violations() const { return violations_; }

private:
    void set_state(uint32_t idx, FrameState to) {
        counts_[static_cast<size_t>(states_[idx])]--;
        counts_[static_cast<size_t>(to)]++;
        states_[idx] = to;
    }

    uint8_t* base_ = nullptr;
    size_t size_ = 0;
    uint32_t frame_size_ = 0;
    uint32_t frame_count_ = 0;
    uint32_t frame_shift_ = 0;

    std::vector<uint64_t> free_;
    std::vector<FrameState> states_;
    uint32_t counts_[FRAME_STATE_COUNT] = {};
    uint64_t violations_ = 0;
};

} // namespace afterburner::xdp
