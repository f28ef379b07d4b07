// examples/afterburner_client.cpp
// Flood client: AF_XDP socket, QUIC-like connection, round-trip probes
//
// Usage: afterburner_client [interface]
//   AB_LOCAL_IP / AB_LOCAL_MAC   this host
//   AB_PEER_IP / AB_PEER_MAC     server (next-hop MAC)
//   AB_PEER_PORT                 server port (default: service port)
//   AB_BPF_OBJECT                path to service_filter.bpf.o
#include "../src/engine_config.hpp"
#include "../src/core/timing.hpp"
#include "../src/xdp/frame_arena.hpp"
#include "../src/xdp/ring_engine.hpp"
#include "../src/xdp/xsk_port.hpp"
#include "../src/quic/protocol_driver.hpp"
#include "../src/pipeline/event_loop.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <stdexcept>

using namespace afterburner;

static std::atomic<bool> g_stop{false};

static void signal_handler(int) {
    g_stop.store(true, std::memory_order_release);
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        EngineConfig config;
        if (argc > 1) {
            config.interface = argv[1];
        }
        config.apply_env();
        if (config.peer.port == 0) {
            config.peer.port = config.service_port;
        }
        config.validate();
        if (config.peer.ip == 0) {
            throw std::runtime_error("client needs AB_PEER_IP");
        }
        config.print();
        pin_to_core(config.cpu_core);

        xdp::FrameArena arena;
        arena.init(config.arena_size, config.frame_size);

        xdp::XskPort port;
        port.open(config, arena);

        xdp::RingEngine<xdp::XskPort> engine(arena, port, config.fill_target, config.rx_batch);
        engine.prime();

        quic::ProtocolDriver driver(quic::Role::Client, config);
        pipeline::FloodClientApp app(config);
        pipeline::EventLoop<xdp::XskPort, pipeline::FloodClientApp> loop(config, engine, driver, app);

        driver.start(get_monotonic_timestamp_ns());
        pipeline::LoopStats stats = loop.run(g_stop);

        pipeline::print_stats_line(pipeline::make_snapshot(stats, get_monotonic_timestamp_ns(),
                                                           driver.is_established()));
        pipeline::print_malformed_breakdown(stats);
        printf("[STATS] probes sent=%lu skipped=%lu outstanding=%zu handshakes=%lu reconnects=%lu\n",
               stats.flood_sent, stats.flood_skipped, app.tracker().outstanding(),
               driver.stats().handshakes_completed, driver.stats().reconnect_attempts);
        if (driver.gave_up()) {
            return 1;
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "[FATAL] %s\n", e.what());
        return 1;
    }
    return 0;
}
