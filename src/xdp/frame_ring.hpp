// src/xdp/frame_ring.hpp
// Checked views over the libxdp single-producer / single-consumer rings
//
// A ring is a struct xsk_ring_prod or xsk_ring_cons as filled in by
// xsk_umem__create() / xsk_socket__create() (or by SimKernel over heap
// memory). Cursor arithmetic, the cached cursors and the acquire/release
// ordering all come from the xsk.h inline API; these wrappers add the
// overrun check before every publish and count violations.
//
// Fill and TX rings are produced by userspace (ProducerRing); RX and
// Completion rings are consumed by userspace (ConsumerRing). SimKernel
// uses the same classes for the kernel side with roles reversed.

#pragma once

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>
#include <linux/if_xdp.h>
#include <xdp/xsk.h>

#include "../pipeline/pipeline_config.hpp"

namespace afterburner::xdp {

template<typename Ring>
inline void validate_ring(const Ring* r, const char* name) {
    if (!r || !r->producer || !r->consumer || !r->ring) {
        throw std::runtime_error(std::string("FrameRing: ") + name + " ring is not mapped");
    }
    if (!pipeline::is_power_of_two(r->size) || r->mask != r->size - 1) {
        throw std::runtime_error(std::string("FrameRing: ") + name +
                                 " ring size " + std::to_string(r->size) + " is not a power of 2");
    }
}

// Published and not yet consumed, read from the shared cursors
template<typename Ring>
inline uint32_t ring_occupancy(const Ring* r) {
    uint32_t prod = __atomic_load_n(r->producer, __ATOMIC_ACQUIRE);
    uint32_t cons = __atomic_load_n(r->consumer, __ATOMIC_ACQUIRE);
    return prod - cons;
}

// ============================================================================
// ProducerRing - this side owns the producer cursor
// ============================================================================

template<typename Desc>
class ProducerRing {
    static_assert(std::is_same_v<Desc, uint64_t> || std::is_same_v<Desc, struct xdp_desc>,
                  "ring descriptors are frame addresses or xdp_desc");

public:
    void attach(struct xsk_ring_prod* r, const char* name) {
        validate_ring(r, name);
        ring_ = r;
        reserved_ = 0;
    }

    // Free slots; xsk_prod_nb_free refreshes the consumer cursor only when short
    uint32_t free_slots(uint32_t wanted) {
        return xsk_prod_nb_free(ring_, wanted);
    }

    /**
     * Reserve n slots for writing (all or nothing)
     *
     * @param idx Set to the cursor of the first reserved slot
     * @return n, or 0 when fewer than n slots are free
     */
    uint32_t reserve(uint32_t n, uint32_t* idx) {
        uint32_t got = xsk_ring_prod__reserve(ring_, n, idx);
        reserved_ += got;
        return got;
    }

    Desc& at(uint32_t idx) {
        if constexpr (std::is_same_v<Desc, uint64_t>) {
            return *reinterpret_cast<uint64_t*>(xsk_ring_prod__fill_addr(ring_, idx));
        } else {
            return *xsk_ring_prod__tx_desc(ring_, idx);
        }
    }

    /**
     * Publish n reserved descriptors to the consumer
     *
     * Checks producer - consumer <= size before the release store; a
     * violation leaves the cursor untouched and is counted.
     */
    bool submit(uint32_t n) {
        if (n > reserved_) {
            overrun_violations_++;
            return false;
        }
        uint32_t prod = __atomic_load_n(ring_->producer, __ATOMIC_RELAXED);
        uint32_t cons = __atomic_load_n(ring_->consumer, __ATOMIC_ACQUIRE);
        if (prod + n - cons > ring_->size) {
            overrun_violations_++;
            return false;
        }
        xsk_ring_prod__submit(ring_, n);
        reserved_ -= n;
        return true;
    }

    uint32_t occupancy() const { return ring_occupancy(ring_); }

    bool needs_wakeup() const {
        return ring_->flags && xsk_ring_prod__needs_wakeup(ring_);
    }

    uint32_t size() const { return ring_->size; }
    uint64_t overrun_violations() const { return overrun_violations_; }

private:
    struct xsk_ring_prod* ring_ = nullptr;
    uint32_t reserved_ = 0;
    uint64_t overrun_violations_ = 0;
};

// ============================================================================
// ConsumerRing - this side owns the consumer cursor
// ============================================================================

template<typename Desc>
class ConsumerRing {
    static_assert(std::is_same_v<Desc, uint64_t> || std::is_same_v<Desc, struct xdp_desc>,
                  "ring descriptors are frame addresses or xdp_desc");

public:
    void attach(struct xsk_ring_cons* r, const char* name) {
        validate_ring(r, name);
        ring_ = r;
        peeked_ = 0;
    }

    /**
     * Peek up to n filled descriptors
     *
     * @param idx Set to the cursor of the first descriptor
     * @return Number available (0 when the ring is empty)
     */
    uint32_t peek(uint32_t n, uint32_t* idx) {
        uint32_t got = xsk_ring_cons__peek(ring_, n, idx);
        peeked_ += got;
        return got;
    }

    const Desc& at(uint32_t idx) const {
        if constexpr (std::is_same_v<Desc, uint64_t>) {
            return *reinterpret_cast<const uint64_t*>(xsk_ring_cons__comp_addr(ring_, idx));
        } else {
            return *xsk_ring_cons__rx_desc(ring_, idx);
        }
    }

    /**
     * Hand n peeked slots back to the producer
     *
     * Checks that the consumer cursor never passes the producer cursor.
     */
    bool release(uint32_t n) {
        uint32_t prod = __atomic_load_n(ring_->producer, __ATOMIC_ACQUIRE);
        uint32_t cons = __atomic_load_n(ring_->consumer, __ATOMIC_RELAXED);
        if (n > peeked_ || n > prod - cons) {
            overrun_violations_++;
            return false;
        }
        xsk_ring_cons__release(ring_, n);
        peeked_ -= n;
        return true;
    }

    uint32_t occupancy() const { return ring_occupancy(ring_); }

    uint32_t size() const { return ring_->size; }
    uint64_t overrun_violations() const { return overrun_violations_; }

private:
    struct xsk_ring_cons* ring_ = nullptr;
    uint32_t peeked_ = 0;
    uint64_t overrun_violations_ = 0;
};

// Descriptor types: Fill/Completion carry a frame address, RX/TX a full xdp_desc
using FillRing = ProducerRing<uint64_t>;
using TxRing = ProducerRing<struct xdp_desc>;
using RxRing = ConsumerRing<struct xdp_desc>;
using CompletionRing = ConsumerRing<uint64_t>;

// ============================================================================
// RingMemory - heap-backed ring with the kernel's mmap layout
// ============================================================================
//
// Cursors sit on their own cache lines like the kernel's ring map. Views
// are initialised the way libxdp initialises a freshly mapped ring.

template<typename Desc>
struct RingMemory {
    alignas(CACHE_LINE_SIZE) uint32_t producer = 0;
    alignas(CACHE_LINE_SIZE) uint32_t consumer = 0;
    uint32_t flags = 0;
    std::vector<Desc> descs;

    explicit RingMemory(uint32_t size, uint32_t start = 0)
        : producer(start), consumer(start), descs(size) {}

    RingMemory(const RingMemory&) = delete;
    RingMemory& operator=(const RingMemory&) = delete;

    struct xsk_ring_prod producer_view() {
        struct xsk_ring_prod r = {};
        fill_view(r);
        r.cached_prod = producer;
        r.cached_cons = consumer + r.size;
        return r;
    }

    struct xsk_ring_cons consumer_view() {
        struct xsk_ring_cons r = {};
        fill_view(r);
        r.cached_prod = producer;
        r.cached_cons = consumer;
        return r;
    }

private:
    template<typename Ring>
    void fill_view(Ring& r) {
        r.size = static_cast<uint32_t>(descs.size());
        r.mask = r.size - 1;
        r.producer = &producer;
        r.consumer = &consumer;
        r.flags = &flags;
        r.ring = descs.data();
    }
};

} // namespace afterburner::xdp
