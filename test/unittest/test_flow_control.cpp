// test/unittest/test_flow_control.cpp
// Unit tests for flow-control credit, receive windows and stream reassembly

#include "../../src/quic/flow_controller.hpp"
#include "../../src/quic/quic_stream.hpp"
#include <iostream>
#include <cstring>
#include <string>
#include <stdexcept>

using namespace afterburner::quic;

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

const uint8_t* bytes(const char* s) {
    return reinterpret_cast<const uint8_t*>(s);
}

std::string read_all(QuicStream& s) {
    uint8_t buf[256];
    size_t n = s.read(buf, sizeof(buf));
    return std::string(reinterpret_cast<const char*>(buf), n);
}

void test_send_credit() {
    TEST("Send credit is consumed and raised by the peer")
        SendCredit c(100);
        ASSERT(c.available() == 100, "Initial credit");
        c.consume(60);
        ASSERT(c.available() == 40 && c.used() == 60, "Consumed");

        ASSERT(!c.update_limit(90), "Lower limit ignored");
        ASSERT(!c.update_limit(100), "Same limit ignored");
        ASSERT(c.update_limit(150), "Raised");
        ASSERT(c.available() == 90 && c.limit() == 150, "New credit");
    END_TEST
}

void test_blocked_signalled_once() {
    TEST("BLOCKED is signalled once per limit")
        SendCredit c(100);
        ASSERT(!c.should_signal_blocked(), "Credit left");
        c.consume(100);
        ASSERT(c.should_signal_blocked(), "Exhausted");
        c.mark_blocked_signalled();
        ASSERT(!c.should_signal_blocked(), "Already signalled at this limit");

        c.update_limit(200);
        ASSERT(!c.should_signal_blocked(), "Credit again");
        c.consume(100);
        ASSERT(c.should_signal_blocked(), "Blocked at the new limit");
    END_TEST
}

void test_receive_window() {
    TEST("Receive window enforces and slides its limit")
        ReceiveWindow w(100);
        ASSERT(w.on_received(100), "Up to the limit");
        ASSERT(!w.on_received(101), "Past the limit");
        ASSERT(w.highest() == 100, "Highest offset");
        ASSERT(w.on_received(40), "Older data is fine");
        ASSERT(w.highest() == 100, "Highest does not move back");

        ASSERT(!w.should_update(), "Nothing consumed");
        w.on_consumed(51);
        ASSERT(w.should_update(), "Less than half a window left");
        ASSERT(w.advance() == 151, "Limit slides to consumed + window");
        ASSERT(!w.should_update(), "Fresh window");

        ASSERT(w.on_received_delta(51), "Delta up to the new limit");
        ASSERT(!w.on_received_delta(1), "One byte too many");
    END_TEST
}

void test_stream_in_order() {
    TEST("In-order data becomes readable")
        QuicStream s(0, 1000, 100);
        uint64_t delta;
        bool readable;
        ASSERT(s.on_frame(0, bytes("hello"), 5, false, &delta, &readable) == StreamFrameResult::Ok, "Frame 1");
        ASSERT(delta == 5 && readable, "Readable, 5 new bytes");
        ASSERT(s.on_frame(5, bytes("world"), 5, true, &delta, &readable) == StreamFrameResult::Ok, "Frame 2");
        ASSERT(delta == 5 && readable, "Readable again");
        ASSERT(!s.recv_finished(), "Data still unread");

        ASSERT(read_all(s) == "helloworld", "Contents");
        ASSERT(s.recv_finished(), "Finished once read");
        ASSERT(s.window().consumed() == 10, "Consumption credited to the window");
    END_TEST
}

void test_stream_out_of_order() {
    TEST("Out-of-order segments are held until the gap fills")
        QuicStream s(4, 1000, 100);
        uint64_t delta;
        bool readable;
        ASSERT(s.on_frame(5, bytes("world"), 5, false, &delta, &readable) == StreamFrameResult::Ok, "Later segment");
        ASSERT(delta == 10 && !readable, "Charged but not readable");
        ASSERT(s.readable_bytes() == 0, "Nothing contiguous");

        ASSERT(s.on_frame(0, bytes("hello"), 5, false, &delta, &readable) == StreamFrameResult::Ok, "Gap filled");
        ASSERT(delta == 0 && readable, "No new window use");
        ASSERT(s.readable_bytes() == 10, "Both segments readable");
        ASSERT(read_all(s) == "helloworld", "Reassembled");
    END_TEST
}

void test_stream_overlap_and_duplicate() {
    TEST("Overlapping and duplicate segments")
        QuicStream s(8, 1000, 100);
        uint64_t delta;
        bool readable;
        s.on_frame(0, bytes("hello"), 5, false, &delta, &readable);
        ASSERT(s.on_frame(2, bytes("llowo"), 5, false, &delta, &readable) == StreamFrameResult::Ok, "Overlap");
        ASSERT(readable && delta == 2, "Only the new tail counts");
        ASSERT(s.readable_bytes() == 7, "hellowo");

        ASSERT(s.on_frame(0, bytes("hel"), 3, false, &delta, &readable) == StreamFrameResult::Ok, "Duplicate");
        ASSERT(!readable && delta == 0, "Duplicate adds nothing");
        ASSERT(read_all(s) == "hellowo", "No duplicated bytes");
    END_TEST
}

void test_stream_flow_control_error() {
    TEST("Data past the stream window is a flow control error")
        QuicStream s(0, 1000, 100);
        uint64_t delta;
        bool readable;
        ASSERT(s.on_frame(96, bytes("12345"), 5, false, &delta, &readable) == StreamFrameResult::FlowControlError,
               "Ends at 101");
        ASSERT(delta == 0 && !readable, "Nothing applied");
        ASSERT(s.on_frame(95, bytes("12345"), 5, false, &delta, &readable) == StreamFrameResult::Ok,
               "Ends exactly at the limit");
    END_TEST
}

void test_stream_final_size() {
    TEST("Final size violations")
        uint64_t delta;
        bool readable;

        QuicStream a(0, 1000, 100);
        ASSERT(a.on_frame(0, bytes("abc"), 3, true, &delta, &readable) == StreamFrameResult::Ok, "FIN at 3");
        ASSERT(a.on_frame(3, bytes("d"), 1, false, &delta, &readable) == StreamFrameResult::FinalSizeError,
               "Data past the final size");
        ASSERT(a.on_frame(0, bytes("ab"), 2, true, &delta, &readable) == StreamFrameResult::FinalSizeError,
               "Changed final size");
        ASSERT(a.on_frame(0, bytes("abc"), 3, true, &delta, &readable) == StreamFrameResult::Ok,
               "Repeated FIN at the same size");

        QuicStream b(4, 1000, 100);
        b.on_frame(10, bytes("xxxxx"), 5, false, &delta, &readable);
        ASSERT(b.on_frame(0, bytes("yyyyy"), 5, true, &delta, &readable) == StreamFrameResult::FinalSizeError,
               "FIN below data already received");
    END_TEST
}

void test_stream_bare_fin() {
    TEST("A bare FIN is reported readable once")
        QuicStream s(0, 1000, 100);
        uint64_t delta;
        bool readable;
        s.on_frame(0, bytes("ab"), 2, false, &delta, &readable);
        ASSERT(read_all(s) == "ab", "Data");
        ASSERT(!s.recv_finished(), "No FIN yet");

        ASSERT(s.on_frame(2, nullptr, 0, true, &delta, &readable) == StreamFrameResult::Ok, "Bare FIN");
        ASSERT(readable, "FIN makes the stream readable");
        ASSERT(s.recv_finished(), "Finished");

        s.on_frame(2, nullptr, 0, true, &delta, &readable);
        ASSERT(!readable, "Reported only once");
    END_TEST
}

void test_stream_send_side() {
    TEST("Send buffer chunks and FIN")
        QuicStream s(0, 1000, 100);
        ASSERT(!s.has_pending_send(), "Empty");
        s.queue_send(bytes("0123456789"), 10);
        ASSERT(s.has_pending_send() && s.unsent_bytes() == 10, "Queued");

        uint64_t off;
        const uint8_t* data;
        bool fin;
        size_t n = s.peek_send(4, &off, &data, &fin);
        ASSERT(n == 4 && off == 0 && !fin, "First chunk");
        ASSERT(std::memcmp(data, "0123", 4) == 0, "First chunk bytes");
        s.mark_sent(n, fin);

        s.finish();
        n = s.peek_send(100, &off, &data, &fin);
        ASSERT(n == 6 && off == 4 && fin, "Last chunk carries FIN");
        ASSERT(std::memcmp(data, "456789", 6) == 0, "Last chunk bytes");
        s.mark_sent(n, fin);

        ASSERT(s.fin_sent() && !s.has_pending_send(), "All sent");
        ASSERT(s.send_offset() == 10 && s.unsent_bytes() == 0, "Offset advanced");
    END_TEST
}

void test_stream_send_bare_fin() {
    TEST("FIN with no data is still pending")
        QuicStream s(0, 1000, 100);
        s.finish();
        ASSERT(s.fin_queued() && s.has_pending_send(), "FIN pending");
        uint64_t off;
        const uint8_t* data;
        bool fin;
        ASSERT(s.peek_send(100, &off, &data, &fin) == 0 && fin, "Empty chunk with FIN");
        s.mark_sent(0, true);
        ASSERT(!s.has_pending_send(), "Done");
    END_TEST
}

int main() {
    std::cout << "╔════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║   Afterburner: Flow Control Unit Tests         ║" << std::endl;
    std::cout << "╚════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;

    test_send_credit();
    test_blocked_signalled_once();
    test_receive_window();
    test_stream_in_order();
    test_stream_out_of_order();
    test_stream_overlap_and_duplicate();
    test_stream_flow_control_error();
    test_stream_final_size();
    test_stream_bare_fin();
    test_stream_send_side();
    test_stream_send_bare_fin();

    std::cout << std::endl;
    std::cout << "════════════════════════════════════════════════" << std::endl;
    std::cout << "Tests passed: " << tests_passed << std::endl;
    std::cout << "Tests failed: " << tests_failed << std::endl;
    std::cout << "════════════════════════════════════════════════" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
