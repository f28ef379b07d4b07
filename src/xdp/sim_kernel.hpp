// src/xdp/sim_kernel.hpp
// In-process stand-in for the kernel side of an AF_XDP socket
//
// SimKernel owns the four ring memories, hands userspace libxdp ring structs
// over them, and plays the kernel's role on them:
// deliver() runs the same classifier as the XDP program and moves a Fill
// frame to RX; transmit() drains TX into a wire and posts Completion.
// Two SimKernels can be linked back-to-back so a client and a server engine
// talk to each other without a NIC or privileges.
//
// Usage:
//   FrameArena arena; arena.init(8 << 20, 4096);
//   SimKernel kernel(arena, 2048, 256, 8003);
//   SimPort port(kernel);
//   RingEngine<SimPort> engine(arena, port, 1024, 64);
//   engine.prime();
//   kernel.deliver(frame_bytes, len);   // classifier + RX
//   engine.poll_rx(...);

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>
#include <arpa/inet.h>
#include <linux/if_xdp.h>

#include "frame_ring.hpp"
#include "frame_arena.hpp"
#include "bpf/classifier_logic.h"
#include "../pipeline/pipeline_config.hpp"

namespace afterburner::xdp {

struct SimKernelStats {
    uint64_t total = 0;             // Packets seen by the classifier
    uint64_t redirected = 0;        // Delivered to the RX ring
    uint64_t passed = 0;            // Left to the (absent) kernel stack
    uint64_t parse_errors = 0;
    uint64_t dropped_no_frame = 0;  // Redirect failed: Fill ring empty
    uint64_t dropped_rx_full = 0;   // Redirect failed: RX ring full
    uint64_t transmitted = 0;       // Descriptors drained from TX
    uint64_t wire_dropped = 0;      // Lost on the wire by injection
};

class SimKernel {
public:
    SimKernel(FrameArena& arena, uint32_t ring_size, uint32_t headroom, uint16_t service_port)
        : arena_(arena), headroom_(headroom), service_port_be_(htons(service_port)),
          fill_mem_(ring_size), rx_mem_(ring_size), tx_mem_(ring_size), comp_mem_(ring_size) {
        // Like a copy-mode driver: TX is only driven by an explicit kick
        tx_mem_.flags = XDP_RING_NEED_WAKEUP;

        // What xsk_umem__create / xsk_socket__create hand to userspace
        fill_user_ = fill_mem_.producer_view();
        rx_user_ = rx_mem_.consumer_view();
        tx_user_ = tx_mem_.producer_view();
        comp_user_ = comp_mem_.consumer_view();

        // Kernel side: consumes Fill and TX, produces RX and Completion
        fill_kernel_ = fill_mem_.consumer_view();
        rx_kernel_ = rx_mem_.producer_view();
        tx_kernel_ = tx_mem_.consumer_view();
        comp_kernel_ = comp_mem_.producer_view();
        fill_.attach(&fill_kernel_, "sim-fill");
        rx_.attach(&rx_kernel_, "sim-rx");
        tx_.attach(&tx_kernel_, "sim-tx");
        comp_.attach(&comp_kernel_, "sim-completion");
    }

    SimKernel(const SimKernel&) = delete;
    SimKernel& operator=(const SimKernel&) = delete;

    // Userspace views of the rings
    struct xsk_ring_prod* fill_ring() { return &fill_user_; }
    struct xsk_ring_cons* rx_ring() { return &rx_user_; }
    struct xsk_ring_prod* tx_ring() { return &tx_user_; }
    struct xsk_ring_cons* completion_ring() { return &comp_user_; }
    uint32_t headroom() const { return headroom_; }

    // Frames leaving transmit() are delivered to peer instead of being captured
    void link(SimKernel* peer) { peer_ = peer; }

    void set_service_port(uint16_t port) { service_port_be_ = htons(port); }

    // Lose the next n transmitted frames on the wire
    void drop_next_tx(uint32_t n) { drop_next_ = n; }

    // While stalled, transmit() leaves every descriptor on the TX ring
    void stall_tx(bool on) { tx_stalled_ = on; }

    /**
     * Present one packet arriving from the wire
     *
     * Runs the classifier; on REDIRECT takes a Fill frame, copies the packet
     * behind the headroom and publishes an RX descriptor.
     * @return REDIRECT if delivered, PASS if not ours, DROP if redirect failed
     */
    enum ab_verdict deliver(const uint8_t* pkt, uint32_t len) {
        stats_.total++;
        int parse_error = 0;
        enum ab_verdict verdict = ab_classify(pkt, pkt + len, service_port_be_, &parse_error);
        if (parse_error) {
            stats_.parse_errors++;
        }
        if (verdict != AB_VERDICT_REDIRECT) {
            stats_.passed++;
            if (capture_passed_) {
                passed_.emplace_back(pkt, pkt + len);
            }
            return AB_VERDICT_PASS;
        }

        if (rx_.free_slots(1) == 0) {
            stats_.dropped_rx_full++;
            return AB_VERDICT_DROP;
        }

        uint32_t fill_idx;
        if (fill_.peek(1, &fill_idx) != 1) {
            stats_.dropped_no_frame++;
            return AB_VERDICT_DROP;
        }
        uint64_t base = arena_.frame_base(fill_.at(fill_idx));
        fill_.release(1);

        uint32_t room = arena_.frame_size() - headroom_;
        uint32_t copy_len = (len < room) ? len : room;
        std::memcpy(arena_.data(base + headroom_), pkt, copy_len);

        uint32_t rx_idx;
        rx_.reserve(1, &rx_idx);
        struct xdp_desc& desc = rx_.at(rx_idx);
        desc.addr = base + headroom_;
        desc.len = copy_len;
        desc.options = 0;
        rx_.submit(1);

        stats_.redirected++;
        return AB_VERDICT_REDIRECT;
    }

    /**
     * Drain the TX ring onto the wire and post Completions
     *
     * Stops early when the Completion ring is full; the rest stays on TX.
     * @return Descriptors transmitted
     */
    uint32_t transmit() {
        uint32_t sent = 0;
        while (!tx_stalled_) {
            if (comp_.free_slots(1) == 0) {
                break;
            }
            uint32_t tx_idx;
            if (tx_.peek(1, &tx_idx) != 1) {
                break;
            }
            struct xdp_desc desc = tx_.at(tx_idx);

            const uint8_t* bytes = arena_.data(desc.addr);
            if (drop_next_ > 0) {
                drop_next_--;
                stats_.wire_dropped++;
            } else if (peer_ != nullptr) {
                peer_->deliver(bytes, desc.len);
            } else {
                wire_.emplace_back(bytes, bytes + desc.len);
            }

            tx_.release(1);
            uint32_t comp_idx;
            comp_.reserve(1, &comp_idx);
            comp_.at(comp_idx) = desc.addr;
            comp_.submit(1);

            stats_.transmitted++;
            sent++;
        }
        return sent;
    }

    // Frames transmitted while unlinked, oldest first
    std::vector<std::vector<uint8_t>>& wire() { return wire_; }

    // Keep copies of PASSed packets (what the kernel stack would have seen)
    void capture_passed(bool on) { capture_passed_ = on; }
    std::vector<std::vector<uint8_t>>& passed() { return passed_; }

    const SimKernelStats& stats() const { return stats_; }

private:
    FrameArena& arena_;
    uint32_t headroom_;
    uint16_t service_port_be_;

    RingMemory<uint64_t> fill_mem_;
    RingMemory<struct xdp_desc> rx_mem_;
    RingMemory<struct xdp_desc> tx_mem_;
    RingMemory<uint64_t> comp_mem_;

    struct xsk_ring_prod fill_user_ = {};
    struct xsk_ring_cons rx_user_ = {};
    struct xsk_ring_prod tx_user_ = {};
    struct xsk_ring_cons comp_user_ = {};

    struct xsk_ring_cons fill_kernel_ = {};
    struct xsk_ring_prod rx_kernel_ = {};
    struct xsk_ring_cons tx_kernel_ = {};
    struct xsk_ring_prod comp_kernel_ = {};

    ConsumerRing<uint64_t> fill_;
    ProducerRing<struct xdp_desc> rx_;
    ConsumerRing<struct xdp_desc> tx_;
    ProducerRing<uint64_t> comp_;

    SimKernel* peer_ = nullptr;
    uint32_t drop_next_ = 0;
    bool tx_stalled_ = false;
    bool capture_passed_ = false;
    std::vector<std::vector<uint8_t>> wire_;
    std::vector<std::vector<uint8_t>> passed_;
    SimKernelStats stats_;
};

// KernelPortConcept binding over a SimKernel
class SimPort {
public:
    explicit SimPort(SimKernel& kernel) : kernel_(kernel) {}

    struct xsk_ring_prod* fill_ring() { return kernel_.fill_ring(); }
    struct xsk_ring_cons* rx_ring() { return kernel_.rx_ring(); }
    struct xsk_ring_prod* tx_ring() { return kernel_.tx_ring(); }
    struct xsk_ring_cons* completion_ring() { return kernel_.completion_ring(); }
    uint32_t headroom() const { return kernel_.headroom(); }

    void kick_tx() {
        kernel_.transmit();
    }

    void kick_rx() {}

    SimKernel& kernel() { return kernel_; }

private:
    SimKernel& kernel_;
};

} // namespace afterburner::xdp
