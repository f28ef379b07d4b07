// examples/afterburner_loopback.cpp
// Client and server engines wired back to back through two simulated
// kernels in one thread; no NIC or privileges needed
//
// Usage: afterburner_loopback [seconds]
#include "../src/engine_config.hpp"
#include "../src/core/timing.hpp"
#include "../src/pipeline/pipeline_config.hpp"
#include "../src/xdp/frame_arena.hpp"
#include "../src/xdp/ring_engine.hpp"
#include "../src/xdp/sim_kernel.hpp"
#include "../src/quic/protocol_driver.hpp"
#include "../src/pipeline/event_loop.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>

using namespace afterburner;

static std::atomic<bool> g_stop{false};

static void signal_handler(int) {
    g_stop.store(true, std::memory_order_release);
}

static void set_endpoint(stack::Endpoint& ep, const char* ip, const char* mac, uint16_t port) {
    if (!stack::parse_ipv4(ip, &ep.ip) || !stack::parse_mac(mac, ep.mac)) {
        throw std::runtime_error(std::string("bad endpoint ") + ip);
    }
    ep.port = port;
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    uint64_t seconds = (argc > 1) ? strtoull(argv[1], nullptr, 10) : 5;

    try {
        EngineConfig client_cfg;
        client_cfg.apply_env();
        set_endpoint(client_cfg.local, "10.0.0.10", "02:00:00:00:00:0a", client_cfg.service_port);
        set_endpoint(client_cfg.peer, "10.0.0.11", "02:00:00:00:00:0b", client_cfg.service_port);
        client_cfg.validate();

        EngineConfig server_cfg = client_cfg;
        server_cfg.local = client_cfg.peer;
        server_cfg.peer = stack::Endpoint();
        server_cfg.validate();
        client_cfg.print();

        xdp::FrameArena client_arena, server_arena;
        client_arena.init(client_cfg.arena_size, client_cfg.frame_size, false);
        server_arena.init(server_cfg.arena_size, server_cfg.frame_size, false);

        xdp::SimKernel client_kernel(client_arena, client_cfg.ring_capacity, pipeline::FRAME_HEADROOM,
                                     client_cfg.service_port);
        xdp::SimKernel server_kernel(server_arena, server_cfg.ring_capacity, pipeline::FRAME_HEADROOM,
                                     server_cfg.service_port);
        client_kernel.link(&server_kernel);
        server_kernel.link(&client_kernel);

        xdp::SimPort client_port(client_kernel), server_port(server_kernel);
        xdp::RingEngine<xdp::SimPort> client_engine(client_arena, client_port,
                                                    client_cfg.fill_target, client_cfg.rx_batch);
        xdp::RingEngine<xdp::SimPort> server_engine(server_arena, server_port,
                                                    server_cfg.fill_target, server_cfg.rx_batch);
        client_engine.prime();
        server_engine.prime();

        quic::ProtocolDriver client(quic::Role::Client, client_cfg);
        quic::ProtocolDriver server(quic::Role::Server, server_cfg);
        pipeline::FloodClientApp flood(client_cfg);
        pipeline::EchoServerApp echo(server_cfg);
        pipeline::EventLoop<xdp::SimPort, pipeline::FloodClientApp> client_loop(client_cfg, client_engine,
                                                                                client, flood);
        pipeline::EventLoop<xdp::SimPort, pipeline::EchoServerApp> server_loop(server_cfg, server_engine,
                                                                               server, echo);

        pipeline::LoopStats client_stats, server_stats;
        uint64_t now = get_monotonic_timestamp_ns();
        uint64_t end = now + seconds * 1000000000ULL;
        uint64_t next_report = now + client_cfg.report_interval_ns;
        client.start(now);

        while (!g_stop.load(std::memory_order_acquire) && now < end && !client.gave_up()) {
            now = get_monotonic_timestamp_ns();
            client_loop.run_once(now, client_stats);
            server_loop.run_once(now, server_stats);
            if (now >= next_report) {
                pipeline::print_stats_line(pipeline::make_snapshot(client_stats, now, client.is_established()));
                next_report = now + client_cfg.report_interval_ns;
            }
        }

        now = get_monotonic_timestamp_ns();
        client_loop.shutdown(now, client_stats);
        server_loop.shutdown(now, server_stats);

        pipeline::print_stats_line(pipeline::make_snapshot(client_stats, now, client.is_established()));
        printf("[STATS] probes sent=%lu echoed=%lu completed=%lu lost=%lu\n",
               client_stats.flood_sent, server_stats.echoes, client_stats.latency.count(),
               client_stats.latency.losses());
        xdp::RingAccounting a = client_engine.accounting();
        printf("[XDP] client frames: free=%u fill=%u rx=%u tx=%u completion=%u held=%u total=%u/%u\n",
               a.free, a.fill, a.rx, a.tx, a.completion, a.held, a.total(), client_arena.frame_count());
    } catch (const std::exception& e) {
        fprintf(stderr, "[FATAL] %s\n", e.what());
        return 1;
    }
    return 0;
}
