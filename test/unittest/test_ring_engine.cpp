// test/unittest/test_ring_engine.cpp
// Unit tests for frame custody across Fill, RX, TX and Completion
// Runs the engine against SimKernel; no NIC or privileges needed.

#include "../../src/xdp/ring_engine.hpp"
#include "../../src/xdp/sim_kernel.hpp"
#include <iostream>
#include <cstring>
#include <vector>
#include <memory>
#include <arpa/inet.h>

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

constexpr size_t ARENA_SIZE = 64 * 4096;
constexpr uint32_t FRAME_SIZE = 4096;
constexpr uint32_t RING_SIZE = 32;
constexpr uint32_t HEADROOM = 256;
constexpr uint32_t FILL_TARGET = 16;
constexpr uint32_t BATCH = 8;
constexpr uint16_t PORT = 8003;

// Minimal Ethernet/IPv4/UDP frame; the classifier ignores checksums
std::vector<uint8_t> make_udp_frame(uint16_t dst_port, size_t payload_len, uint8_t fill) {
    std::vector<uint8_t> pkt(14 + 20 + 8 + payload_len, 0);
    pkt[12] = 0x08; pkt[13] = 0x00;               // IPv4
    pkt[14] = 0x45;                               // Version 4, IHL 5
    uint16_t tot = htons(static_cast<uint16_t>(20 + 8 + payload_len));
    std::memcpy(&pkt[16], &tot, 2);
    pkt[22] = 64;                                 // TTL
    pkt[23] = 17;                                 // UDP
    uint16_t dport = htons(dst_port);
    std::memcpy(&pkt[36], &dport, 2);
    uint16_t ulen = htons(static_cast<uint16_t>(8 + payload_len));
    std::memcpy(&pkt[38], &ulen, 2);
    std::memset(&pkt[42], fill, payload_len);
    return pkt;
}

// One arena + simulated kernel + engine
struct Rig {
    FrameArena arena;
    std::unique_ptr<SimKernel> kernel;
    std::unique_ptr<SimPort> port;
    std::unique_ptr<RingEngine<SimPort>> engine;

    Rig() {
        arena.init(ARENA_SIZE, FRAME_SIZE, false);
        kernel = std::make_unique<SimKernel>(arena, RING_SIZE, HEADROOM, PORT);
        port = std::make_unique<SimPort>(*kernel);
        engine = std::make_unique<RingEngine<SimPort>>(arena, *port, FILL_TARGET, BATCH);
        engine->prime();
    }

    uint32_t reap_all() {
        uint32_t total = 0;
        uint32_t n;
        while ((n = engine->reap_completions()) > 0) {
            total += n;
        }
        return total;
    }
};

void test_prime() {
    TEST("Prime posts fill_target frames")
        Rig rig;
        RingAccounting a = rig.engine->accounting();
        ASSERT(a.fill == FILL_TARGET, "Fill ring should hold fill_target frames");
        ASSERT(a.free == 64 - FILL_TARGET, "Rest of the arena stays Free");
        ASSERT(a.total() == 64, "Every frame accounted for");
        ASSERT(rig.arena.count(FrameState::KernelRx) == FILL_TARGET, "Posted frames are KernelRx");
    END_TEST
}

void test_rx_path() {
    TEST("RX: deliver, poll, recycle, replenish")
        Rig rig;
        auto pkt = make_udp_frame(PORT, 100, 0xAB);
        ASSERT(rig.kernel->deliver(pkt.data(), static_cast<uint32_t>(pkt.size())) == AB_VERDICT_REDIRECT,
               "Service port traffic should be redirected");

        XDPFrame frames[BATCH];
        uint32_t n = rig.engine->poll_rx(frames, BATCH);
        ASSERT(n == 1, "One frame received");
        ASSERT(frames[0].len == pkt.size(), "Length preserved");
        ASSERT(std::memcmp(frames[0].data, pkt.data(), pkt.size()) == 0, "Bytes preserved");
        ASSERT(rig.arena.state(frames[0].addr) == FrameState::Held, "Polled frame is Held");

        RingAccounting a = rig.engine->accounting();
        ASSERT(a.held == 1, "One frame held");
        ASSERT(a.fill == FILL_TARGET - 1, "Fill ring lost one frame");
        ASSERT(a.total() == 64, "Conservation while held");

        rig.engine->recycle(frames[0]);
        ASSERT(!frames[0].owned, "Handle cleared after recycle");
        ASSERT(rig.engine->replenish_fill() == 1, "One frame reposted");
        a = rig.engine->accounting();
        ASSERT(a.fill == FILL_TARGET && a.held == 0, "Back to steady state");
        ASSERT(a.total() == 64, "Conservation after recycle");
    END_TEST
}

void test_rx_empty() {
    TEST("RX: empty ring returns nothing")
        Rig rig;
        XDPFrame frames[BATCH];
        ASSERT(rig.engine->poll_rx(frames, BATCH) == 0, "Nothing to poll");
    END_TEST
}

void test_classifier_pass() {
    TEST("RX: other ports are passed, not redirected")
        Rig rig;
        auto pkt = make_udp_frame(53, 32, 0);
        ASSERT(rig.kernel->deliver(pkt.data(), static_cast<uint32_t>(pkt.size())) == AB_VERDICT_PASS,
               "DNS traffic should pass");
        XDPFrame frames[BATCH];
        ASSERT(rig.engine->poll_rx(frames, BATCH) == 0, "Passed packet never reaches RX");
        ASSERT(rig.kernel->stats().passed == 1, "Counted as passed");
    END_TEST
}

void test_tx_path() {
    TEST("TX: allocate, submit, transmit, reap")
        Rig rig;
        XDPFrame f;
        ASSERT(rig.engine->allocate(&f), "Allocate a frame");
        ASSERT(f.capacity == FRAME_SIZE - HEADROOM, "Capacity excludes headroom");
        auto pkt = make_udp_frame(9000, 64, 0x5A);
        std::memcpy(f.data, pkt.data(), pkt.size());
        uint64_t addr = f.addr;

        ASSERT(rig.engine->submit_tx(f, static_cast<uint32_t>(pkt.size())) == TxStatus::Ok, "Submit Ok");
        ASSERT(!f.owned, "Handle cleared on submit");
        ASSERT(rig.arena.state(addr) == FrameState::KernelTx, "Frame in kernel TX custody");

        rig.engine->flush_tx();
        ASSERT(rig.kernel->stats().transmitted == 1, "Kernel drained TX on kick");
        ASSERT(rig.kernel->wire().size() == 1, "Frame on the wire");
        ASSERT(rig.kernel->wire()[0] == pkt, "Wire bytes match");

        ASSERT(rig.reap_all() == 1, "One completion");
        ASSERT(rig.arena.state(addr) == FrameState::Free, "Frame Free after completion");
        ASSERT(rig.engine->accounting().total() == 64, "Conservation after TX");
    END_TEST
}

void test_tx_invalid() {
    TEST("TX: invalid length keeps the frame with the caller")
        Rig rig;
        XDPFrame f;
        ASSERT(rig.engine->allocate(&f), "Allocate");
        ASSERT(rig.engine->submit_tx(f, 0) == TxStatus::Invalid, "Zero length rejected");
        ASSERT(rig.engine->submit_tx(f, FRAME_SIZE) == TxStatus::Invalid, "Oversize rejected");
        ASSERT(f.owned, "Caller still owns the frame");
        rig.engine->release(f);
        ASSERT(rig.engine->accounting().held == 0, "Released");
    END_TEST
}

void test_tx_ring_full() {
    TEST("TX: full ring reports RingFull")
        Rig rig;
        for (uint32_t i = 0; i < RING_SIZE; i++) {
            XDPFrame f;
            ASSERT(rig.engine->allocate(&f), "Allocate");
            ASSERT(rig.engine->submit_tx(f, 60) == TxStatus::Ok, "Submit within capacity");
        }
        XDPFrame extra;
        ASSERT(rig.engine->allocate(&extra), "Allocate extra");
        ASSERT(rig.engine->submit_tx(extra, 60) == TxStatus::RingFull, "Ring full");
        ASSERT(extra.owned, "Frame stays with the caller");
        ASSERT(rig.engine->counters().tx_ring_full == 1, "Counted");
        rig.engine->release(extra);

        rig.engine->flush_tx();
        ASSERT(rig.reap_all() == RING_SIZE, "Every submitted frame completes");
        RingAccounting a = rig.engine->accounting();
        ASSERT(a.free == 64 - FILL_TARGET, "All TX frames back to Free");
        ASSERT(a.total() == 64, "Conservation");
    END_TEST
}

void test_tx_wrong_custody() {
    TEST("TX: a frame already in kernel custody is refused without using a slot")
        Rig rig;
        XDPFrame f;
        ASSERT(rig.engine->allocate(&f), "Allocate");
        XDPFrame stale = f;
        ASSERT(rig.engine->submit_tx(f, 60) == TxStatus::Ok, "First submit");
        ASSERT(rig.engine->submit_tx(stale, 60) == TxStatus::Invalid, "Second submit refused");
        ASSERT(rig.engine->counters().state_violations == 1, "Violation counted");
        ASSERT(rig.engine->accounting().tx == 1, "No TX slot published for the refused frame");
        ASSERT(rig.engine->ring_violations() == 0, "Ring cursors consistent");

        rig.engine->flush_tx();
        ASSERT(rig.reap_all() == 1, "Only the real submission completes");
        ASSERT(rig.engine->accounting().total() == 64, "Conservation");
    END_TEST
}

void test_exhaustion() {
    TEST("Allocate reports exhaustion and recovers")
        Rig rig;
        std::vector<XDPFrame> held;
        XDPFrame f;
        while (rig.engine->allocate(&f)) {
            held.push_back(f);
        }
        ASSERT(held.size() == 64 - FILL_TARGET, "Every Free frame handed out");
        ASSERT(rig.engine->counters().alloc_exhausted == 1, "Exhaustion counted");
        ASSERT(rig.engine->accounting().total() == 64, "Conservation at exhaustion");

        ASSERT(rig.engine->release_all_held() == held.size(), "Shutdown releases every held frame");
        ASSERT(rig.arena.free_count() == 64 - FILL_TARGET, "Pool restored");
        ASSERT(rig.engine->allocate(&f), "Allocation works again");
        rig.engine->release(f);
    END_TEST
}

void test_fill_starvation() {
    TEST("Redirect without a Fill frame is dropped")
        Rig rig;
        auto pkt = make_udp_frame(PORT, 10, 1);
        for (uint32_t i = 0; i < FILL_TARGET; i++) {
            ASSERT(rig.kernel->deliver(pkt.data(), static_cast<uint32_t>(pkt.size())) == AB_VERDICT_REDIRECT,
                   "Redirect while Fill frames remain");
        }
        ASSERT(rig.kernel->deliver(pkt.data(), static_cast<uint32_t>(pkt.size())) == AB_VERDICT_DROP,
               "No Fill frame left");
        ASSERT(rig.kernel->stats().dropped_no_frame == 1, "Counted");

        XDPFrame frames[BATCH];
        uint32_t received = 0;
        uint32_t n;
        while ((n = rig.engine->poll_rx(frames, BATCH)) > 0) {
            for (uint32_t i = 0; i < n; i++) {
                rig.engine->recycle(frames[i]);
            }
            received += n;
        }
        ASSERT(received == FILL_TARGET, "Every redirected frame delivered");
        rig.engine->replenish_fill();
        ASSERT(rig.kernel->deliver(pkt.data(), static_cast<uint32_t>(pkt.size())) == AB_VERDICT_REDIRECT,
               "Delivery resumes after replenish");
    END_TEST
}

void test_double_return() {
    TEST("Arena rejects a double return")
        Rig rig;
        XDPFrame f;
        ASSERT(rig.engine->allocate(&f), "Allocate");
        uint64_t addr = f.addr;
        rig.engine->release(f);
        ASSERT(!rig.arena.give_back(addr), "Second return rejected");
        ASSERT(rig.arena.violations() == 1, "Violation counted");
        ASSERT(rig.arena.free_count() == 64 - FILL_TARGET, "Pool holds no duplicate");
    END_TEST
}

void test_wire_loss() {
    TEST("Frames lost on the wire still complete")
        Rig rig;
        rig.kernel->drop_next_tx(1);
        for (int i = 0; i < 2; i++) {
            XDPFrame f;
            ASSERT(rig.engine->allocate(&f), "Allocate");
            ASSERT(rig.engine->submit_tx(f, 60) == TxStatus::Ok, "Submit");
        }
        rig.engine->flush_tx();
        ASSERT(rig.kernel->stats().wire_dropped == 1, "One frame lost");
        ASSERT(rig.kernel->wire().size() == 1, "One frame on the wire");
        ASSERT(rig.reap_all() == 2, "Both frames completed");
    END_TEST
}

int main() {
    std::cout << "╔════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║   Afterburner: Ring Engine Unit Tests          ║" << std::endl;
    std::cout << "╚════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;

    test_prime();
    test_rx_path();
    test_rx_empty();
    test_classifier_pass();
    test_tx_path();
    test_tx_invalid();
    test_tx_ring_full();
    test_tx_wrong_custody();
    test_exhaustion();
    test_fill_starvation();
    test_double_return();
    test_wire_loss();

    std::cout << std::endl;
    std::cout << "════════════════════════════════════════════════" << std::endl;
    std::cout << "Tests passed: " << tests_passed << std::endl;
    std::cout << "Tests failed: " << tests_failed << std::endl;
    std::cout << "════════════════════════════════════════════════" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
