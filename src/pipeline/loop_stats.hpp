// pipeline/loop_stats.hpp
// Event loop counters and the periodic stats snapshot
#pragma once

#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <functional>

#include "../core/latency_stats.hpp"
#include "../stack/stack_types.hpp"

namespace afterburner::pipeline {

// Owned by the event loop; one instance per run
struct LoopStats {
    uint64_t iterations = 0;

    // RX
    uint64_t rx_frames = 0;             // Frames taken off the RX ring
    uint64_t rx_delivered = 0;          // Valid payloads handed to the driver
    uint64_t malformed = 0;             // Dropped by the codec (NotForUs included)
    uint64_t malformed_by_reason[stack::DECODE_STATUS_COUNT] = {};

    // TX
    uint64_t tx_datagrams = 0;          // Frames submitted to the TX ring
    uint64_t tx_ring_full = 0;
    uint64_t tx_exhausted = 0;          // No Free frame to encode into
    uint64_t encode_failures = 0;
    uint64_t pending_queued = 0;        // Datagrams parked for the next iteration
    uint64_t pending_overflow = 0;      // Datagrams dropped because the pending buffer was full
    uint64_t completions = 0;

    // Application
    uint64_t flood_sent = 0;
    uint64_t flood_skipped = 0;
    uint64_t echoes = 0;                // Server: messages echoed back
    uint64_t echo_blocked = 0;          // Server: echo deferred for lack of credit
    uint64_t echo_dropped = 0;          // Server: stream backlog full, message discarded
    uint64_t streams_opened = 0;        // Client: application streams opened per handshake

    // Frame exhaustion
    uint64_t exhausted_streak = 0;      // Consecutive iterations without a Free frame
    uint64_t exhausted_streak_max = 0;

    LatencyStats latency;

    void count_malformed(stack::DecodeStatus reason) {
        malformed++;
        malformed_by_reason[static_cast<size_t>(reason)]++;
    }
};

struct StatsSnapshot {
    uint64_t timestamp_ns = 0;
    double avg_latency_us = 0.0;
    double min_latency_us = 0.0;
    double max_latency_us = 0.0;
    uint64_t samples = 0;
    uint64_t rx_packets = 0;
    uint64_t losses = 0;
    uint64_t tx_packets = 0;
    uint64_t malformed = 0;
    uint64_t tx_ring_full = 0;
    uint64_t tx_exhausted = 0;
    uint64_t pending_overflow = 0;
    uint64_t flood_skipped = 0;
    bool established = false;
};

using StatsReporter = std::function<void(const StatsSnapshot&)>;

inline StatsSnapshot make_snapshot(const LoopStats& s, uint64_t now_ns, bool established) {
    StatsSnapshot snap;
    snap.timestamp_ns = now_ns;
    snap.avg_latency_us = s.latency.avg_us();
    snap.min_latency_us = s.latency.min_us();
    snap.max_latency_us = s.latency.max_us();
    snap.samples = s.latency.count();
    snap.rx_packets = s.rx_frames;
    snap.losses = s.latency.losses();
    snap.tx_packets = s.tx_datagrams;
    snap.malformed = s.malformed;
    snap.tx_ring_full = s.tx_ring_full;
    snap.tx_exhausted = s.tx_exhausted;
    snap.pending_overflow = s.pending_overflow;
    snap.flood_skipped = s.flood_skipped;
    snap.established = established;
    return snap;
}

// Default reporter: one line per interval
inline void print_stats_line(const StatsSnapshot& s) {
    printf("[STATS] %s lat avg=%.2fus min=%.2fus max=%.2fus n=%lu | rx=%lu tx=%lu loss=%lu "
           "malformed=%lu | ring_full=%lu exhausted=%lu overflow=%lu skipped=%lu\n",
           s.established ? "UP  " : "DOWN",
           s.avg_latency_us, s.min_latency_us, s.max_latency_us, s.samples,
           s.rx_packets, s.tx_packets, s.losses, s.malformed,
           s.tx_ring_full, s.tx_exhausted, s.pending_overflow, s.flood_skipped);
}

// Final per-reason malformed breakdown
inline void print_malformed_breakdown(const LoopStats& s) {
    for (size_t i = 1; i < stack::DECODE_STATUS_COUNT; i++) {
        if (s.malformed_by_reason[i] == 0) continue;
        printf("[STATS]   dropped %-16s %lu\n",
               stack::decode_status_name(static_cast<stack::DecodeStatus>(i)),
               s.malformed_by_reason[i]);
    }
}

} // namespace afterburner::pipeline
