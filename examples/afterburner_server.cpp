// examples/afterburner_server.cpp
// Echo responder: accepts one client at a time and echoes every probe
// back on the stream it arrived on
//
// Usage: afterburner_server [interface]
//   AB_LOCAL_IP / AB_LOCAL_MAC   this host
//   AB_SERVICE_PORT              listening UDP port (default 8003)
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
        config.validate();
        config.print();
        pin_to_core(config.cpu_core);

        xdp::FrameArena arena;
        arena.init(config.arena_size, config.frame_size);

        xdp::XskPort port;
        port.open(config, arena);

        xdp::RingEngine<xdp::XskPort> engine(arena, port, config.fill_target, config.rx_batch);
        engine.prime();

        quic::ProtocolDriver driver(quic::Role::Server, config);
        pipeline::EchoServerApp app(config);
        pipeline::EventLoop<xdp::XskPort, pipeline::EchoServerApp> loop(config, engine, driver, app);

        printf("[ENGINE] Listening on UDP port %u (%s)\n", config.service_port,
               port.zero_copy_active() ? "zero-copy" : "copy mode");
        pipeline::LoopStats stats = loop.run(g_stop);

        pipeline::print_malformed_breakdown(stats);
        printf("[STATS] rx=%lu tx=%lu echoes=%lu echo_blocked=%lu echo_dropped=%lu connections=%lu ignored=%lu\n",
               stats.rx_frames, stats.tx_datagrams, stats.echoes, stats.echo_blocked, stats.echo_dropped,
               driver.stats().connections_started, driver.stats().datagrams_ignored);
    } catch (const std::exception& e) {
        fprintf(stderr, "[FATAL] %s\n", e.what());
        return 1;
    }
    return 0;
}
