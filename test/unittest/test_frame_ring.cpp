// test/unittest/test_frame_ring.cpp
// Unit tests for the checked libxdp ring views (cursor arithmetic, wrap, overrun checks)

#include "../../src/xdp/frame_ring.hpp"
#include <iostream>
#include <vector>
#include <stdexcept>

using namespace afterburner::xdp;

int tests_passed = 0;
int tests_failed = 0;

#define TEST(name) \
    std::cout << "Testing " << name << "... "; \
    try {

#define END_TEST \
        std::cout << "✅ PASS" << std::endl; \
        tests_passed++; \
    } catch (const std::exception& e) { \
        std::cout << "❌ FAIL: " << e.what() << std::endl; \
        tests_failed++; \
    }

#define ASSERT(condition, msg) \
    if (!(condition)) throw std::runtime_error(msg);

// One ring shared by a producer and a consumer, each with its own libxdp view
struct RingPair {
    RingMemory<uint64_t> mem;
    struct xsk_ring_prod prod_view;
    struct xsk_ring_cons cons_view;
    ProducerRing<uint64_t> prod;
    ConsumerRing<uint64_t> cons;

    explicit RingPair(uint32_t size, uint32_t start = 0) : mem(size, start) {
        prod_view = mem.producer_view();
        cons_view = mem.consumer_view();
        prod.attach(&prod_view, "test");
        cons.attach(&cons_view, "test");
    }
};

void test_produce_consume() {
    TEST("Produce then consume preserves order")
        RingPair r(8);

        uint32_t idx;
        ASSERT(r.prod.reserve(4, &idx) == 4, "Should reserve 4 slots");
        for (uint32_t i = 0; i < 4; i++) {
            r.prod.at(idx + i) = 100 + i;
        }
        ASSERT(r.prod.submit(4), "Submit should succeed");
        ASSERT(r.mem.producer == 4, "Producer cursor should be published");
        ASSERT(r.prod.occupancy() == 4, "Occupancy should be 4");

        uint32_t cidx;
        ASSERT(r.cons.peek(8, &cidx) == 4, "Consumer should see 4 descriptors");
        for (uint32_t i = 0; i < 4; i++) {
            ASSERT(r.cons.at(cidx + i) == 100 + i, "Descriptor order mismatch");
        }
        ASSERT(r.cons.release(4), "Release should succeed");
        ASSERT(r.mem.consumer == 4, "Consumer cursor should be published");
        ASSERT(r.cons.occupancy() == 0, "Ring should be empty");
    END_TEST
}

void test_full_ring() {
    TEST("Reserve is all or nothing against free space")
        RingPair r(4);

        uint32_t idx;
        ASSERT(r.prod.reserve(3, &idx) == 3, "Should reserve 3");
        ASSERT(r.prod.submit(3), "Submit 3");
        ASSERT(r.prod.reserve(4, &idx) == 0, "Only 1 slot left, 4 refused");
        ASSERT(r.prod.reserve(1, &idx) == 1, "The last slot");
        ASSERT(r.prod.submit(1), "Submit 1");
        ASSERT(r.prod.reserve(1, &idx) == 0, "Full ring reserves nothing");
        ASSERT(r.prod.free_slots(1) == 0, "No free slots");

        // Consumer frees two slots; producer sees them after refreshing
        uint32_t cidx;
        ASSERT(r.cons.peek(2, &cidx) == 2, "Peek 2");
        ASSERT(r.cons.release(2), "Release 2");
        ASSERT(r.prod.reserve(2, &idx) == 2, "Two slots freed by consumer");
        ASSERT(idx == 4, "Reservation continues at the producer cursor");
    END_TEST
}

void test_submit_unreserved() {
    TEST("Submitting more than was reserved is refused")
        RingPair r(8);

        uint32_t idx;
        ASSERT(r.prod.reserve(2, &idx) == 2, "Reserve 2");
        ASSERT(!r.prod.submit(3), "Submit 3 refused");
        ASSERT(r.prod.overrun_violations() == 1, "Violation counted");
        ASSERT(r.mem.producer == 0, "Cursor untouched");
        ASSERT(r.prod.submit(2), "Submit the 2 reserved slots");
        ASSERT(r.mem.producer == 2, "Both published");
    END_TEST
}

void test_cursor_wrap() {
    TEST("Cursors wrap around 2^32")
        RingPair r(8, 0xFFFFFFFCu);

        for (uint64_t round = 0; round < 4; round++) {
            uint32_t idx;
            ASSERT(r.prod.reserve(6, &idx) == 6, "Reserve 6");
            for (uint32_t i = 0; i < 6; i++) {
                r.prod.at(idx + i) = round * 10 + i;
            }
            ASSERT(r.prod.submit(6), "Submit 6");
            ASSERT(r.prod.occupancy() == 6, "Occupancy across wrap");

            uint32_t cidx;
            ASSERT(r.cons.peek(6, &cidx) == 6, "Peek 6");
            for (uint32_t i = 0; i < 6; i++) {
                ASSERT(r.cons.at(cidx + i) == round * 10 + i, "Descriptor mismatch after wrap");
            }
            ASSERT(r.cons.release(6), "Release 6");
        }
        ASSERT(r.mem.producer == r.mem.consumer, "Ring drained");
        ASSERT(r.mem.producer < 0xFFFFFFFCu, "Cursor wrapped");
    END_TEST
}

void test_consumer_overrun() {
    TEST("Consumer cannot release more than it peeked")
        RingPair r(8);

        uint32_t idx;
        ASSERT(r.prod.reserve(2, &idx) == 2, "Reserve 2");
        ASSERT(r.prod.submit(2), "Submit 2");

        uint32_t cidx;
        ASSERT(r.cons.peek(1, &cidx) == 1, "Peek 1");
        ASSERT(!r.cons.release(2), "Releasing unpeeked slot must fail");
        ASSERT(r.cons.overrun_violations() == 1, "Violation counted");
        ASSERT(r.mem.consumer == 0, "Cursor untouched on violation");
        ASSERT(r.cons.release(1), "Release the peeked slot");
        ASSERT(r.mem.consumer == 1, "Cursor advanced by 1");
    END_TEST
}

void test_producer_overrun() {
    TEST("Producer never passes consumer + size")
        RingPair r(4);

        uint32_t idx;
        ASSERT(r.prod.reserve(4, &idx) == 4, "Reserve all");
        // A misbehaving consumer cursor moved backwards
        r.mem.consumer = static_cast<uint32_t>(-2);
        ASSERT(!r.prod.submit(4), "Submit must detect the overrun");
        ASSERT(r.prod.overrun_violations() == 1, "Violation counted");
        ASSERT(r.mem.producer == 0, "Producer cursor untouched");
    END_TEST
}

void test_xdp_desc_ring() {
    TEST("TX and RX descriptors travel through an xdp_desc ring")
        RingMemory<struct xdp_desc> mem(4);
        struct xsk_ring_prod tx_view = mem.producer_view();
        struct xsk_ring_cons rx_view = mem.consumer_view();
        TxRing tx;
        RxRing rx;
        tx.attach(&tx_view, "tx");
        rx.attach(&rx_view, "rx");

        uint32_t idx;
        ASSERT(tx.reserve(1, &idx) == 1, "Reserve");
        tx.at(idx).addr = 4096 + 256;
        tx.at(idx).len = 60;
        tx.at(idx).options = 0;
        ASSERT(tx.submit(1), "Submit");
        ASSERT(mem.descs[0].addr == 4096 + 256, "Descriptor written into ring memory");

        uint32_t cidx;
        ASSERT(rx.peek(4, &cidx) == 1, "One descriptor");
        ASSERT(rx.at(cidx).addr == 4096 + 256 && rx.at(cidx).len == 60, "Descriptor read back");
        ASSERT(rx.release(1), "Release");
    END_TEST
}

void test_bad_geometry() {
    TEST("Attach rejects unmapped or non power-of-2 rings")
        RingMemory<uint64_t> mem(6);
        struct xsk_ring_prod view = mem.producer_view();
        ProducerRing<uint64_t> prod;
        bool threw = false;
        try {
            prod.attach(&view, "odd");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT(threw, "Size 6 should be rejected");

        struct xsk_ring_prod empty = {};
        threw = false;
        try {
            prod.attach(&empty, "empty");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT(threw, "Unmapped ring should be rejected");

        threw = false;
        try {
            prod.attach(nullptr, "null");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT(threw, "Missing ring should be rejected");
    END_TEST
}

void test_need_wakeup() {
    TEST("NEED_WAKEUP flag is read through the ring flags")
        RingPair r(4);
        ASSERT(!r.prod.needs_wakeup(), "Flag clear initially");
        r.mem.flags = XDP_RING_NEED_WAKEUP;
        ASSERT(r.prod.needs_wakeup(), "Producer sees flag");
        r.prod_view.flags = nullptr;
        ASSERT(!r.prod.needs_wakeup(), "Ring without a flags word never asks");
    END_TEST
}

int main() {
    std::cout << "╔════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║   Afterburner: Frame Ring Unit Tests           ║" << std::endl;
    std::cout << "╚════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;

    test_produce_consume();
    test_full_ring();
    test_submit_unreserved();
    test_cursor_wrap();
    test_consumer_overrun();
    test_producer_overrun();
    test_xdp_desc_ring();
    test_bad_geometry();
    test_need_wakeup();

    std::cout << std::endl;
    std::cout << "════════════════════════════════════════════════" << std::endl;
    std::cout << "Tests passed: " << tests_passed << std::endl;
    std::cout << "Tests failed: " << tests_failed << std::endl;
    std::cout << "════════════════════════════════════════════════" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
