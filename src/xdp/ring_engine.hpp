// src/xdp/ring_engine.hpp
// Zero-copy ring engine: frame custody across Fill, RX, TX and Completion
// C++20, policy-based design, single-thread busy-poll focus
//
// The engine is the only userspace party touching the four rings. All
// operations are non-blocking and return an explicit "nothing available"
// outcome. The kernel side is a policy (KernelPortConcept): XskPort for a
// real AF_XDP socket, SimPort for the in-process simulator.
//
// Frame lifecycle (userspace view):
//
//   Free --allocate--> Held --post_fill--> KernelRx --poll_rx--> Held
//     ^                  |                                        |
//     |                  +--submit_tx--> KernelTx --reap------+   |
//     +---------------------------------------------------------+-+ recycle
#pragma once

#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <concepts>
#include <linux/if_xdp.h>

#include "frame_ring.hpp"
#include "frame_arena.hpp"
#include "xdp_frame.hpp"
#include "../pipeline/pipeline_config.hpp"

namespace afterburner::xdp {

// ============================================================================
// Kernel port policy
// ============================================================================
//
// A port exposes the four libxdp rings of one socket bound to the arena and
// knows how to wake the kernel when it asks for it.

template<typename T>
concept KernelPortConcept = requires(T& port) {
    { port.fill_ring() } -> std::same_as<struct xsk_ring_prod*>;
    { port.rx_ring() } -> std::same_as<struct xsk_ring_cons*>;
    { port.tx_ring() } -> std::same_as<struct xsk_ring_prod*>;
    { port.completion_ring() } -> std::same_as<struct xsk_ring_cons*>;
    { port.headroom() } -> std::convertible_to<uint32_t>;
    { port.kick_tx() } -> std::same_as<void>;
    { port.kick_rx() } -> std::same_as<void>;
};

enum class TxStatus : uint8_t {
    Ok = 0,
    RingFull,     // TX ring has no free slot; frame stays with the caller
    Invalid,      // Frame not Held or length exceeds capacity; frame stays with the caller
};

// Snapshot of where every frame is. total() == frame_count at quiescent points.
struct RingAccounting {
    uint32_t free;
    uint32_t fill;
    uint32_t rx;
    uint32_t tx;
    uint32_t completion;
    uint32_t held;
    uint32_t in_kernel;    // Taken off a ring by the kernel but not yet on the next one

    uint32_t total() const {
        return free + fill + rx + tx + completion + held + in_kernel;
    }
};

struct EngineCounters {
    uint64_t rx_packets = 0;
    uint64_t tx_packets = 0;
    uint64_t completions = 0;
    uint64_t tx_ring_full = 0;
    uint64_t alloc_exhausted = 0;
    uint64_t fill_ring_full = 0;
    uint64_t tx_kicks = 0;
    uint64_t rx_kicks = 0;
    uint64_t state_violations = 0;
};

template<KernelPortConcept Port>
class RingEngine {
public:
    /**
     * @param fill_target Frames kept posted for RX; the rest of the arena is the TX pool
     * @param batch Max descriptors per poll_rx() / reap_completions() call
     */
    RingEngine(FrameArena& arena, Port& port, uint32_t fill_target, uint32_t batch)
        : arena_(arena), port_(port), fill_target_(fill_target), batch_(batch) {}

    RingEngine(const RingEngine&) = delete;
    RingEngine& operator=(const RingEngine&) = delete;

    // Attach to the port's rings and post the initial Fill frames
    // @throws std::runtime_error on bad ring geometry
    void prime() {
        fill_.attach(port_.fill_ring(), "fill");
        rx_.attach(port_.rx_ring(), "rx");
        tx_.attach(port_.tx_ring(), "tx");
        comp_.attach(port_.completion_ring(), "completion");
        headroom_ = port_.headroom();

        if (fill_target_ > fill_.size()) {
            fill_target_ = fill_.size();
        }
        if (fill_target_ >= arena_.frame_count()) {
            throw std::runtime_error("RingEngine: fill target leaves no frames for TX");
        }

        uint32_t posted = replenish_fill();
        printf("[XDP] FILL ring primed with %u frames (%u left for TX)\n",
               posted, arena_.free_count());
    }

    // ========================================================================
    // Allocation
    // ========================================================================

    // Take a Free frame for TX encoding. False = Exhausted (recoverable).
    bool allocate(XDPFrame* out) {
        uint64_t addr;
        if (!arena_.take(&addr)) {
            counters_.alloc_exhausted++;
            return false;
        }
        out->addr = addr;
        out->data = arena_.data(addr) + headroom_;
        out->len = 0;
        out->capacity = arena_.frame_size() - headroom_;
        out->offset = headroom_;
        out->owned = true;
        return true;
    }

    // Return a Held frame to Free (error paths, shutdown)
    void release(XDPFrame& frame) {
        if (!frame.owned) {
            return;
        }
        if (!arena_.reclaim(frame.addr, FrameState::Held)) {
            counters_.state_violations++;
        }
        frame.clear();
    }

    // RX frames go straight back to Free after their payload is consumed
    void recycle(XDPFrame& frame) {
        release(frame);
    }

    // ========================================================================
    // RX path
    // ========================================================================

    // Post one Held frame to the Fill ring. False = ring full, frame stays Held.
    // A reserved slot cannot be given back, so custody is checked first.
    bool post_fill(uint64_t addr) {
        uint64_t base = arena_.frame_base(addr);
        if (!arena_.owns(base) || arena_.state(base) != FrameState::Held) {
            counters_.state_violations++;
            return false;
        }
        uint32_t idx;
        if (fill_.reserve(1, &idx) != 1) {
            counters_.fill_ring_full++;
            return false;
        }
        if (!arena_.transition(base, FrameState::Held, FrameState::KernelRx)) {
            counters_.state_violations++;
        }
        fill_.at(idx) = base;
        fill_.submit(1);
        return true;
    }

    /**
     * Top the Fill ring up to fill_target frames in kernel RX custody
     *
     * Frames recycled from RX or Completion are at the top of the free pool,
     * so they are the first ones posted back.
     * @return Frames posted
     */
    uint32_t replenish_fill() {
        uint32_t posted = 0;
        while (arena_.count(FrameState::KernelRx) < fill_target_) {
            uint64_t addr;
            if (!arena_.take(&addr)) {
                break;
            }
            if (!post_fill(addr)) {
                arena_.reclaim(addr, FrameState::Held);
                break;
            }
            posted++;
        }
        if (posted > 0 && fill_.needs_wakeup()) {
            counters_.rx_kicks++;
            port_.kick_rx();
        }
        return posted;
    }

    /**
     * Consume up to max received frames
     *
     * Each returned frame is Held by the caller and must be handed back
     * with recycle() within the same iteration.
     * @return Number of frames written to out
     */
    uint32_t poll_rx(XDPFrame* out, uint32_t max) {
        if (max > batch_) {
            max = batch_;
        }
        uint32_t idx;
        uint32_t n = rx_.peek(max, &idx);
        if (n == 0) {
            if (fill_.needs_wakeup()) {
                counters_.rx_kicks++;
                port_.kick_rx();
            }
            return 0;
        }

        uint32_t produced = 0;
        for (uint32_t i = 0; i < n; i++) {
            const struct xdp_desc& desc = rx_.at(idx + i);
            uint64_t base = arena_.frame_base(desc.addr);
            if (!arena_.transition(base, FrameState::KernelRx, FrameState::Held)) {
                counters_.state_violations++;
                continue;
            }
            XDPFrame& f = out[produced++];
            f.addr = base;
            f.data = arena_.data(desc.addr);
            f.offset = static_cast<uint32_t>(desc.addr - base);
            f.capacity = arena_.frame_size() - f.offset;
            f.len = 0;
            if (!f.set_length(desc.len)) {
                f.len = f.capacity;
            }
            f.owned = true;
        }
        rx_.release(n);
        counters_.rx_packets += produced;
        return produced;
    }

    // ========================================================================
    // TX path
    // ========================================================================

    /**
     * Queue a Held frame holding len bytes at frame.data for transmission
     *
     * On Ok the frame moves to kernel custody and the caller's handle is
     * cleared. Descriptors are published immediately; flush_tx() wakes the
     * kernel once per batch.
     */
    TxStatus submit_tx(XDPFrame& frame, uint32_t len) {
        if (!frame.owned || len == 0 || len > frame.capacity) {
            return TxStatus::Invalid;
        }
        if (!arena_.owns(frame.addr) || arena_.state(frame.addr) != FrameState::Held) {
            counters_.state_violations++;
            return TxStatus::Invalid;
        }
        uint32_t idx;
        if (tx_.reserve(1, &idx) != 1) {
            counters_.tx_ring_full++;
            return TxStatus::RingFull;
        }
        if (!arena_.transition(frame.addr, FrameState::Held, FrameState::KernelTx)) {
            counters_.state_violations++;
        }
        struct xdp_desc& desc = tx_.at(idx);
        desc.addr = frame.addr + frame.offset;
        desc.len = len;
        desc.options = 0;
        tx_.submit(1);

        counters_.tx_packets++;
        frame.clear();
        return TxStatus::Ok;
    }

    // Wake the kernel TX path if it asked for it
    void flush_tx() {
        if (tx_.occupancy() > 0 && tx_.needs_wakeup()) {
            counters_.tx_kicks++;
            port_.kick_tx();
        }
    }

    /**
     * Drain the Completion ring, returning every transmitted frame to Free
     *
     * @param out Optional; receives the reaped frame addresses
     * @return Frames reaped
     */
    uint32_t reap_completions(uint64_t* out = nullptr, uint32_t max = 0) {
        uint32_t limit = (max == 0 || max > batch_) ? batch_ : max;
        uint32_t idx;
        uint32_t n = comp_.peek(limit, &idx);
        uint32_t reaped = 0;
        for (uint32_t i = 0; i < n; i++) {
            uint64_t addr = arena_.frame_base(comp_.at(idx + i));
            if (!arena_.reclaim(addr, FrameState::KernelTx)) {
                counters_.state_violations++;
                continue;
            }
            if (out) {
                out[reaped] = addr;
            }
            reaped++;
        }
        if (n > 0) {
            comp_.release(n);
            counters_.completions += reaped;
        }
        return reaped;
    }

    // Return every Held frame to Free. Used on shutdown.
    uint32_t release_all_held() {
        uint32_t released = 0;
        for (uint32_t i = 0; i < arena_.frame_count(); i++) {
            uint64_t addr = static_cast<uint64_t>(i) * arena_.frame_size();
            if (arena_.state(addr) == FrameState::Held && arena_.reclaim(addr, FrameState::Held)) {
                released++;
            }
        }
        return released;
    }

    // ========================================================================
    // Accounting
    // ========================================================================

    RingAccounting accounting() const {
        RingAccounting a;
        a.free = arena_.free_count();
        a.fill = fill_.occupancy();
        a.rx = rx_.occupancy();
        a.tx = tx_.occupancy();
        a.completion = comp_.occupancy();
        a.held = arena_.count(FrameState::Held);
        uint32_t kernel = arena_.count(FrameState::KernelRx) + arena_.count(FrameState::KernelTx);
        uint32_t on_rings = a.fill + a.rx + a.tx + a.completion;
        a.in_kernel = (kernel > on_rings) ? kernel - on_rings : 0;
        return a;
    }

    uint64_t ring_violations() const {
        return fill_.overrun_violations() + rx_.overrun_violations() +
               tx_.overrun_violations() + comp_.overrun_violations();
    }

    const EngineCounters& counters() const { return counters_; }
    FrameArena& arena() { return arena_; }
    const FrameArena& arena() const { return arena_; }
    Port& port() { return port_; }
    uint32_t fill_target() const { return fill_target_; }
    uint32_t headroom() const { return headroom_; }

private:
    FrameArena& arena_;
    Port& port_;
    uint32_t fill_target_;
    uint32_t batch_;
    uint32_t headroom_ = 0;

    FillRing fill_;
    RxRing rx_;
    TxRing tx_;
    CompletionRing comp_;

    EngineCounters counters_;
};

} // namespace afterburner::xdp
