// test/unittest/test_event_loop.cpp
// Unit tests for the event loop: a flood client and an echo server running
// back-to-back over two linked SimKernels, plus frame exhaustion, TX ring
// backpressure, echo backlog limits and shutdown

#include "../../src/pipeline/event_loop.hpp"
#include "../../src/xdp/sim_kernel.hpp"
#include <iostream>
#include <cstring>
#include <vector>
#include <memory>
#include <stdexcept>
#include <arpa/inet.h>

using namespace afterburner;
using namespace afterburner::pipeline;

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

constexpr uint64_t T0 = 1'000'000'000ULL;
constexpr uint64_t STEP_NS = 20'000;
constexpr uint32_t CLIENT_IP = 0x0A00000A;   // 10.0.0.10
constexpr uint32_t SERVER_IP = 0x0A00000B;   // 10.0.0.11
constexpr uint32_t HEADROOM = 256;

stack::Endpoint endpoint(uint32_t ip) {
    stack::Endpoint e;
    e.ip = ip;
    e.port = 8003;
    e.mac[5] = static_cast<uint8_t>(ip);
    return e;
}

EngineConfig make_config(uint32_t local_ip, uint32_t peer_ip) {
    EngineConfig c;
    c.frame_size = 4096;
    c.arena_size = 256 * 4096;
    c.ring_capacity = 256;
    c.fill_target = 64;
    c.rx_batch = 64;
    c.local = endpoint(local_ip);
    c.peer = endpoint(peer_ip);
    c.max_pending_egress = 64;
    return c;
}

// Arena + simulated kernel + engine + driver + application + loop for one side
template<typename App>
struct Node {
    EngineConfig config;
    xdp::FrameArena arena;
    std::unique_ptr<xdp::SimKernel> kernel;
    std::unique_ptr<xdp::SimPort> port;
    std::unique_ptr<xdp::RingEngine<xdp::SimPort>> engine;
    std::unique_ptr<quic::ProtocolDriver> driver;
    std::unique_ptr<App> app;
    std::unique_ptr<EventLoop<xdp::SimPort, App>> loop;
    LoopStats stats;

    Node(const EngineConfig& cfg, quic::Role role, std::unique_ptr<App> a)
        : config(cfg), app(std::move(a)) {
        arena.init(config.arena_size, config.frame_size, false);
        kernel = std::make_unique<xdp::SimKernel>(arena, config.ring_capacity, HEADROOM, config.service_port);
        port = std::make_unique<xdp::SimPort>(*kernel);
        engine = std::make_unique<xdp::RingEngine<xdp::SimPort>>(arena, *port, config.fill_target, config.rx_batch);
        engine->prime();
        driver = std::make_unique<quic::ProtocolDriver>(role, config);
        loop = std::make_unique<EventLoop<xdp::SimPort, App>>(config, *engine, *driver, *app);
    }

    void step(uint64_t now) { loop->run_once(now, stats); }

    bool conserved() const {
        return engine->accounting().total() == arena.frame_count();
    }
};

using ClientNode = Node<FloodClientApp>;
using ServerNode = Node<EchoServerApp>;

std::unique_ptr<ClientNode> make_client(const EngineConfig& cfg) {
    return std::make_unique<ClientNode>(cfg, quic::Role::Client, std::make_unique<FloodClientApp>(cfg));
}

std::unique_ptr<ServerNode> make_server(const EngineConfig& cfg) {
    return std::make_unique<ServerNode>(cfg, quic::Role::Server, std::make_unique<EchoServerApp>(cfg));
}

// Client and server wired back-to-back
struct Pair {
    std::unique_ptr<ClientNode> client;
    std::unique_ptr<ServerNode> server;
    uint64_t now = T0;

    Pair() : Pair(make_config(CLIENT_IP, SERVER_IP), make_config(SERVER_IP, CLIENT_IP)) {}

    Pair(const EngineConfig& client_cfg, const EngineConfig& server_cfg)
        : client(make_client(client_cfg))
        , server(make_server(server_cfg)) {
        client->kernel->link(server->kernel.get());
        server->kernel->link(client->kernel.get());
    }

    void step() {
        now += STEP_NS;
        client->step(now);
        server->step(now);
    }

    void establish() {
        if (!client->driver->start(now)) {
            throw std::runtime_error("client start failed");
        }
        for (int i = 0; i < 50; i++) {
            step();
            if (client->driver->is_established() && server->driver->is_established()) {
                return;
            }
        }
        throw std::runtime_error("handshake did not complete");
    }
};

// Ethernet/IPv4/UDP frame to the service port with a zero IP checksum
std::vector<uint8_t> make_bad_checksum_frame() {
    std::vector<uint8_t> pkt(14 + 20 + 8 + 16, 0);
    pkt[12] = 0x08; pkt[13] = 0x00;
    pkt[14] = 0x45;
    uint16_t tot = htons(20 + 8 + 16);
    std::memcpy(&pkt[16], &tot, 2);
    pkt[22] = 64;
    pkt[23] = 17;
    uint32_t src = htonl(SERVER_IP);
    uint32_t dst = htonl(CLIENT_IP);
    std::memcpy(&pkt[26], &src, 4);
    std::memcpy(&pkt[30], &dst, 4);
    uint16_t p = htons(8003);
    std::memcpy(&pkt[34], &p, 2);
    std::memcpy(&pkt[36], &p, 2);
    uint16_t ulen = htons(8 + 16);
    std::memcpy(&pkt[38], &ulen, 2);
    return pkt;
}

void test_handshake_over_rings() {
    TEST("Client and server establish over linked rings")
        Pair p;
        p.establish();
        ASSERT(p.client->stats.tx_datagrams > 0 && p.server->stats.tx_datagrams > 0, "Both sides transmitted");
        ASSERT(p.server->stats.rx_delivered > 0, "Server decoded the Initial");
        ASSERT(p.client->stats.malformed == 0 && p.server->stats.malformed == 0, "No malformed frames");
        ASSERT(p.client->conserved() && p.server->conserved(), "Every frame accounted for");
        ASSERT(p.client->engine->accounting().held == 0, "No frame held across iterations");
        ASSERT(p.client->driver->stats().handshakes_completed == 1, "One handshake");
        ASSERT(p.client->driver->stats().reconnect_attempts == 0, "Established without a reconnect");
        ASSERT(p.client->stats.streams_opened == 4, "Application streams opened");
    END_TEST
}

void test_default_geometry() {
    TEST("Default geometry: 8 MiB arena, 2048 frames, 2048-entry rings")
        EngineConfig client_cfg = make_config(CLIENT_IP, SERVER_IP);
        EngineConfig server_cfg = make_config(SERVER_IP, CLIENT_IP);
        for (EngineConfig* c : {&client_cfg, &server_cfg}) {
            c->arena_size = 8 * 1024 * 1024;
            c->frame_size = 4096;
            c->ring_capacity = 2048;
            c->fill_target = 1024;
            c->max_pending_egress = 256;
        }
        Pair p(client_cfg, server_cfg);
        ASSERT(p.client->arena.frame_count() == 2048, "2048 frames");
        p.establish();
        ASSERT(p.client->driver->stats().reconnect_attempts == 0, "No reconnect");

        for (int i = 0; i < 500; i++) {
            p.step();
        }
        const LoopStats& cs = p.client->stats;
        const LoopStats& ss = p.server->stats;
        ASSERT(ss.rx_frames == p.server->kernel->stats().redirected, "Server RX matches redirects");

        // Client only: pick up what the server sent in the last step
        p.now += STEP_NS;
        p.client->step(p.now);

        ASSERT(cs.flood_sent >= 400, "Client flooded every step");
        ASSERT(cs.latency.count() > 0, "Round trips measured");
        ASSERT(cs.latency.losses() == 0, "Nothing lost");
        ASSERT(cs.rx_frames == p.client->kernel->stats().redirected, "Client RX matches redirects");
        for (const auto* k : {p.client->kernel.get(), p.server->kernel.get()}) {
            ASSERT(k->stats().dropped_no_frame == 0 && k->stats().dropped_rx_full == 0, "No redirect failed");
        }
        ASSERT(cs.tx_ring_full == 0 && cs.pending_overflow == 0, "Client never backed up");
        ASSERT(p.client->engine->ring_violations() == 0 && p.server->engine->ring_violations() == 0,
               "Ring cursors consistent");
        ASSERT(p.client->conserved() && p.server->conserved(), "Frame conservation");
    END_TEST
}

void test_flood_and_echo() {
    TEST("Flood probes are echoed and timed")
        Pair p;
        p.establish();
        for (int i = 0; i < 200; i++) {
            p.step();
        }

        const LoopStats& cs = p.client->stats;
        const LoopStats& ss = p.server->stats;
        ASSERT(cs.flood_sent > 0, "Client flooded");
        ASSERT(ss.echoes > 0, "Server echoed");
        ASSERT(cs.latency.count() > 0, "Round trips measured");
        ASSERT(cs.latency.losses() == 0, "No probe expired");
        ASSERT(p.client->app->tracker().outstanding() <= cs.flood_sent, "Outstanding bounded by sent");

        // Server only: everything it sent is now on the client's RX ring
        p.now += STEP_NS;
        p.client->step(p.now);
        ASSERT(p.client->stats.rx_frames == p.client->kernel->stats().redirected, "Client consumed every redirect");
        ASSERT(p.client->stats.rx_delivered == p.client->stats.rx_frames, "Every client frame decoded");
        ASSERT(p.client->conserved() && p.server->conserved(), "Frame conservation after the flood");
    END_TEST
}

void test_malformed_frame_dropped() {
    TEST("A frame the codec rejects is counted, recycled and ignored")
        Pair p;
        p.establish();
        for (int i = 0; i < 20; i++) {
            p.step();
        }

        uint64_t malformed = p.client->stats.malformed;
        uint64_t losses = p.client->stats.latency.losses();

        std::vector<uint8_t> bad = make_bad_checksum_frame();
        ASSERT(p.client->kernel->deliver(bad.data(), static_cast<uint32_t>(bad.size())) == AB_VERDICT_REDIRECT,
               "Classifier redirects by port alone");
        p.now += STEP_NS;
        p.client->step(p.now);

        ASSERT(p.client->stats.malformed == malformed + 1, "Counted once");
        ASSERT(p.client->stats.malformed_by_reason[static_cast<size_t>(stack::DecodeStatus::BadIpChecksum)] == 1,
               "Counted under the checksum reason");
        ASSERT(p.client->stats.latency.losses() == losses, "No probe lost");
        ASSERT(p.client->driver->is_established(), "Connection unaffected");
        ASSERT(p.client->engine->accounting().held == 0, "Frame recycled");
        ASSERT(p.client->conserved(), "Frame conservation");

        for (int i = 0; i < 20; i++) {
            p.step();
        }
        ASSERT(p.client->stats.latency.count() > 0, "Flood continues");
    END_TEST
}

void test_frame_exhaustion() {
    TEST("Persistent frame exhaustion raises FrameLeakError")
        EngineConfig cfg = make_config(CLIENT_IP, SERVER_IP);
        cfg.max_exhausted_iterations = 3;
        std::unique_ptr<ClientNode> c = make_client(cfg);
        ASSERT(c->driver->start(T0), "Client start");

        std::vector<xdp::XDPFrame> held;
        xdp::XDPFrame f;
        while (c->engine->allocate(&f)) {
            held.push_back(f);
        }
        ASSERT(!held.empty(), "Free frames taken");

        bool thrown = false;
        uint64_t now = T0;
        for (int i = 0; i < 10 && !thrown; i++) {
            now += STEP_NS;
            try {
                c->step(now);
            } catch (const FrameLeakError& e) {
                thrown = true;
                ASSERT(std::string(e.what()).find("held=") != std::string::npos, "Accounting in the message");
            }
        }
        ASSERT(thrown, "Raised");
        ASSERT(c->stats.exhausted_streak == 4, "Raised after the limit");
        ASSERT(c->stats.tx_exhausted >= 4, "Allocation failures counted");
        ASSERT(c->loop->pending().size() >= 1, "Initial parked");
        ASSERT(c->stats.tx_datagrams == 0, "Nothing sent");

        for (xdp::XDPFrame& h : held) {
            c->engine->release(h);
        }
        now += STEP_NS;
        c->step(now);
        ASSERT(c->stats.exhausted_streak == 0, "Streak reset");
        ASSERT(c->stats.tx_datagrams >= 1, "Parked Initial sent");
        ASSERT(c->loop->pending().empty(), "Pending drained");
        ASSERT(c->kernel->wire().size() >= 1, "Initial on the wire");
        ASSERT(c->conserved(), "Frame conservation");
    END_TEST
}

void test_tx_ring_full_parks_egress() {
    TEST("A full TX ring parks datagrams that a later iteration sends")
        EngineConfig client_cfg = make_config(CLIENT_IP, SERVER_IP);
        client_cfg.ring_capacity = 16;
        client_cfg.fill_target = 8;
        client_cfg.rx_batch = 16;
        client_cfg.flood_interval_ns = 1'000'000'000ULL;
        Pair p(client_cfg, make_config(SERVER_IP, CLIENT_IP));
        p.establish();

        p.client->kernel->stall_tx(true);
        std::vector<uint8_t> zeros(30000, 0);
        size_t accepted = 0;
        ASSERT(p.client->driver->write_stream(16, zeros.data(), zeros.size(), &accepted) == quic::StreamStatus::Ok,
               "Write accepted");
        ASSERT(accepted == zeros.size(), "Whole buffer accepted");

        uint64_t sent_before = p.client->stats.tx_datagrams;
        uint64_t redirected_before = p.server->kernel->stats().redirected;
        p.now += STEP_NS;
        p.client->step(p.now);

        const LoopStats& cs = p.client->stats;
        ASSERT(cs.tx_ring_full >= 1, "Ring filled");
        ASSERT(cs.pending_queued >= 1, "Datagrams parked");
        ASSERT(!p.client->loop->pending().empty(), "Pending holds the overflow");
        ASSERT(p.client->engine->accounting().tx == 16, "TX ring full of stalled descriptors");
        ASSERT(p.server->kernel->stats().redirected == redirected_before, "Nothing left the client");
        ASSERT(cs.pending_overflow == 0, "Pending did not overflow");

        p.client->kernel->stall_tx(false);
        for (int i = 0; i < 20 && !p.client->loop->pending().empty(); i++) {
            p.step();
        }
        ASSERT(p.client->loop->pending().empty(), "Parked datagrams drained");
        ASSERT(cs.tx_datagrams - sent_before >= 23, "Every datagram of the write transmitted");
        ASSERT(p.server->kernel->stats().redirected - redirected_before >= 23, "Server received them");

        for (int i = 0; i < 50; i++) {
            p.step();
        }
        ASSERT(p.client->driver->is_established() && p.server->driver->is_established(), "Connection intact");
        ASSERT(p.client->engine->ring_violations() == 0, "Ring cursors consistent");
        ASSERT(p.client->conserved() && p.server->conserved(), "Frame conservation");
    END_TEST
}

void test_oversize_datagram_dropped() {
    TEST("A UDP payload above the datagram limit is dropped by the connection")
        Pair p;
        p.establish();
        for (int i = 0; i < 10; i++) {
            p.step();
        }

        std::vector<uint8_t> payload(quic::MAX_DATAGRAM_SIZE + 50, 0x40);
        std::vector<uint8_t> frame(4096 - HEADROOM);
        stack::PacketCodec server_codec(endpoint(SERVER_IP));
        size_t len = server_codec.encode(payload.data(), payload.size(), endpoint(CLIENT_IP),
                                         frame.data(), frame.size());
        ASSERT(len > 0, "Frame encoded");
        ASSERT(p.client->kernel->deliver(frame.data(), static_cast<uint32_t>(len)) == AB_VERDICT_REDIRECT,
               "Redirected");

        uint64_t delivered = p.client->stats.rx_delivered;
        p.now += STEP_NS;
        p.client->step(p.now);

        ASSERT(p.client->stats.rx_delivered >= delivered + 1, "Codec accepted the frame");
        ASSERT(p.client->driver->connection()->stats().oversize == 1, "Connection dropped it");
        ASSERT(p.client->driver->connection()->stats().decrypt_failures == 0, "Never reached decryption");
        ASSERT(p.client->driver->is_established(), "Connection unaffected");
        ASSERT(p.client->conserved(), "Frame recycled");
    END_TEST
}

void test_echo_backlog_cap() {
    TEST("Echo backlog per stream is capped and overflow is counted")
        EngineConfig client_cfg = make_config(CLIENT_IP, SERVER_IP);
        client_cfg.flood_interval_ns = 1'000'000'000ULL;
        EngineConfig server_cfg = make_config(SERVER_IP, CLIENT_IP);
        server_cfg.max_echo_pending = 1;
        Pair p(client_cfg, server_cfg);
        p.establish();

        // Eight messages in one write reach the server together
        std::vector<uint8_t> burst;
        uint8_t msg[256];
        for (uint64_t seq = 1000; seq < 1008; seq++) {
            size_t n = app::build_probe(seq, p.now, sizeof(msg), msg, sizeof(msg));
            ASSERT(n > 0, "Message built");
            burst.insert(burst.end(), msg, msg + n);
        }
        size_t accepted = 0;
        ASSERT(p.client->driver->write_stream(16, burst.data(), burst.size(), &accepted) == quic::StreamStatus::Ok,
               "Write accepted");
        ASSERT(accepted == burst.size(), "Burst accepted");

        for (int i = 0; i < 100; i++) {
            p.step();
        }

        const LoopStats& ss = p.server->stats;
        ASSERT(ss.echo_dropped >= 1, "Overflow dropped");
        ASSERT(ss.echoes >= 2, "Flood message and at least one burst message echoed");
        ASSERT(ss.echoes + ss.echo_dropped == 9, "Every message echoed or dropped");
        ASSERT(p.server->app->pending_echoes() == 0, "Nothing left waiting");
        ASSERT(p.client->driver->is_established(), "Connection intact");
    END_TEST
}

void test_pending_egress() {
    TEST("Pending egress is a bounded FIFO")
        PendingEgress q(2);
        quic::Datagram d;
        d.len = 1;

        d.bytes[0] = 1;
        ASSERT(q.push(d), "First");
        d.bytes[0] = 2;
        ASSERT(q.push(d), "Second");
        d.bytes[0] = 3;
        ASSERT(!q.push(d), "Full");
        ASSERT(q.size() == 2 && q.capacity() == 2, "Size");

        ASSERT(q.front().bytes[0] == 1, "FIFO order");
        q.pop();
        d.bytes[0] = 4;
        ASSERT(q.push(d), "Slot reused");
        ASSERT(q.front().bytes[0] == 2, "Second next");
        q.pop();
        ASSERT(q.front().bytes[0] == 4, "Wrapped slot");
        q.pop();
        ASSERT(q.empty(), "Empty");
    END_TEST
}

void test_shutdown() {
    TEST("Shutdown closes the connection and returns held frames")
        Pair p;
        p.establish();

        xdp::XDPFrame a, b;
        ASSERT(p.client->engine->allocate(&a) && p.client->engine->allocate(&b), "Two frames held");
        ASSERT(p.client->engine->accounting().held == 2, "Held");

        uint64_t before = p.client->stats.tx_datagrams;
        p.client->loop->shutdown(p.now, p.client->stats);
        ASSERT(p.client->engine->accounting().held == 0, "Held frames released");
        ASSERT(p.client->stats.tx_datagrams > before, "CONNECTION_CLOSE transmitted");
        ASSERT(!p.client->driver->is_established(), "Client closing");
        ASSERT(p.client->conserved(), "Frame conservation");

        p.now += STEP_NS;
        p.server->step(p.now);
        ASSERT(!p.server->driver->is_established(), "Server saw the close");
    END_TEST
}

int main() {
    std::cout << "╔════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║   Afterburner: Event Loop Unit Tests           ║" << std::endl;
    std::cout << "╚════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;

    test_handshake_over_rings();
    test_default_geometry();
    test_flood_and_echo();
    test_malformed_frame_dropped();
    test_frame_exhaustion();
    test_tx_ring_full_parks_egress();
    test_oversize_datagram_dropped();
    test_echo_backlog_cap();
    test_pending_egress();
    test_shutdown();

    std::cout << std::endl;
    std::cout << "════════════════════════════════════════════════" << std::endl;
    std::cout << "Tests passed: " << tests_passed << std::endl;
    std::cout << "Tests failed: " << tests_failed << std::endl;
    std::cout << "════════════════════════════════════════════════" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
