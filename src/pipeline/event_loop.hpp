// pipeline/event_loop.hpp
// Single-threaded busy-poll loop: RX -> codec -> driver -> codec -> TX
//
// Per iteration:
//   1. poll_rx(), decode, feed valid payloads to the driver, recycle every frame
//   2. drain_egress() on the driver (unconditionally: timers live there)
//   3. encode + submit_tx; pending datagrams from the last iteration go first,
//      RingFull / Exhausted park the rest in a bounded pending buffer
//   4. application tick (flood generator / echo responder)
//   5. reap_completions(), replenish_fill()
//   6. expire overdue probes
//
// No frame is held across iterations.
#pragma once

#include <atomic>
#include <concepts>
#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <deque>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "pipeline_config.hpp"
#include "loop_stats.hpp"
#include "../core/timing.hpp"
#include "../engine_config.hpp"
#include "../stack/packet_codec.hpp"
#include "../xdp/xdp_frame.hpp"
#include "../xdp/ring_engine.hpp"
#include "../quic/protocol_driver.hpp"
#include "../app/probe_message.hpp"
#include "../app/flood_generator.hpp"
#include "../app/probe_tracker.hpp"

namespace afterburner::pipeline {

// The arena stayed empty for too many consecutive iterations
class FrameLeakError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

template<typename T>
concept LoopApplicationConcept = requires(T& app, quic::ProtocolDriver& driver,
                                          const quic::StreamEvents& ev, uint64_t now, LoopStats& stats) {
    { app.on_events(driver, ev, now, stats) } -> std::same_as<void>;
    { app.on_tick(driver, now, stats) } -> std::same_as<void>;
    { app.expire(now, stats) } -> std::same_as<void>;
};

// ============================================================================
// Pending egress: fixed-capacity FIFO of datagrams that could not be sent
// ============================================================================

class PendingEgress {
public:
    explicit PendingEgress(size_t capacity) : slots_(capacity) {}

    bool push(const quic::Datagram& dg) {
        if (count_ == slots_.size()) {
            return false;
        }
        quic::Datagram& slot = slots_[(head_ + count_) % slots_.size()];
        memcpy(slot.bytes, dg.bytes, dg.len);
        slot.len = dg.len;
        slot.peer = dg.peer;
        count_++;
        return true;
    }

    const quic::Datagram& front() const { return slots_[head_]; }

    void pop() {
        head_ = (head_ + 1) % slots_.size();
        count_--;
    }

    void clear() { head_ = 0; count_ = 0; }
    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    size_t capacity() const { return slots_.size(); }

private:
    std::vector<quic::Datagram> slots_;
    size_t head_ = 0;
    size_t count_ = 0;
};

// ============================================================================
// Applications
// ============================================================================

// Client: flood probes over streams {0,4,8,12} and time their echoes
class FloodClientApp {
public:
    explicit FloodClientApp(const EngineConfig& config)
        : flood_(config.max_payload, config.flood_interval_ns)
        , tracker_(config.probe_deadline_ns) {}

    void on_events(quic::ProtocolDriver& driver, const quic::StreamEvents& ev, uint64_t now, LoopStats& stats) {
        if (ev.handshake_completed) {
            for (uint64_t id : quic::APP_STREAM_IDS) {
                quic::StreamStatus st = driver.open_stream(id);
                if (st == quic::StreamStatus::Ok) {
                    stats.streams_opened++;
                } else {
                    fprintf(stderr, "[LOOP] Cannot open stream %lu: %s\n", id, quic::stream_status_name(st));
                }
            }
        }
        for (size_t i = 0; i < ev.readable_count; i++) {
            uint64_t id = ev.readable[i];
            app::MessageAssembler& asm_ = assemblers_[id];
            size_t n;
            while (driver.read_stream(id, buf_, sizeof(buf_), &n) == quic::StreamStatus::Ok) {
                asm_.feed(buf_, n);
            }
            app::ProbeHeader hdr;
            while (asm_.next(&hdr)) {
                tracker_.on_echo(hdr.seq, now, stats.latency);
            }
        }
        if (ev.connection_closed) {
            assemblers_.clear();
        }
    }

    void on_tick(quic::ProtocolDriver& driver, uint64_t now, LoopStats& stats) {
        if (!driver.is_established() || !flood_.due(now)) {
            return;
        }
        app::SentProbe probe;
        switch (flood_.step(driver, now, &probe)) {
            case app::FloodResult::Sent:
                tracker_.on_sent(probe.seq, probe.send_ts_ns, stats.latency);
                stats.flood_sent++;
                break;
            case app::FloodResult::Skipped:
                stats.flood_skipped++;
                break;
            default:
                break;
        }
    }

    void expire(uint64_t now, LoopStats& stats) {
        tracker_.expire(now, stats.latency);
    }

    const app::FloodGenerator& flood() const { return flood_; }
    const app::ProbeTracker& tracker() const { return tracker_; }

private:
    app::FloodGenerator flood_;
    app::ProbeTracker tracker_;
    std::map<uint64_t, app::MessageAssembler> assemblers_;
    uint8_t buf_[16384];
};

// Server: echo every complete probe message back on the stream it came from
// At most max_echo_pending replies wait per stream; the rest are dropped.
class EchoServerApp {
public:
    explicit EchoServerApp(const EngineConfig& config)
        : max_pending_(config.max_echo_pending) {}

    void on_events(quic::ProtocolDriver& driver, const quic::StreamEvents& ev, uint64_t now, LoopStats& stats) {
        if (ev.connection_closed) {
            streams_.clear();
            return;
        }
        for (size_t i = 0; i < ev.readable_count; i++) {
            uint64_t id = ev.readable[i];
            StreamState& s = streams_[id];
            size_t n;
            while (driver.read_stream(id, buf_, sizeof(buf_), &n) == quic::StreamStatus::Ok) {
                s.assembler.feed(buf_, n);
            }
            app::ProbeHeader hdr;
            std::vector<uint8_t> msg;
            while (s.assembler.next(&hdr, &msg)) {
                if (s.pending.size() >= max_pending_) {
                    stats.echo_dropped++;
                    continue;
                }
                s.pending.push_back(std::move(msg));
            }
        }
        on_tick(driver, now, stats);
    }

    void on_tick(quic::ProtocolDriver& driver, uint64_t, LoopStats& stats) {
        if (!driver.is_established()) {
            return;
        }
        for (auto& kv : streams_) {
            auto& pending = kv.second.pending;
            while (!pending.empty()) {
                const std::vector<uint8_t>& msg = pending.front();
                if (driver.send_capacity(kv.first) < msg.size()) {
                    stats.echo_blocked++;
                    break;
                }
                size_t accepted = 0;
                if (driver.write_stream(kv.first, msg.data(), msg.size(), &accepted) != quic::StreamStatus::Ok) {
                    stats.echo_blocked++;
                    break;
                }
                stats.echoes++;
                pending.pop_front();
            }
        }
    }

    void expire(uint64_t, LoopStats&) {}

    size_t pending_echoes() const {
        size_t n = 0;
        for (const auto& kv : streams_) n += kv.second.pending.size();
        return n;
    }

private:
    struct StreamState {
        app::MessageAssembler assembler;
        std::deque<std::vector<uint8_t>> pending;
    };

    size_t max_pending_;
    std::map<uint64_t, StreamState> streams_;
    uint8_t buf_[16384];
};

// ============================================================================
// Event loop
// ============================================================================

constexpr size_t EGRESS_BATCH = 64;

template<xdp::KernelPortConcept Port, LoopApplicationConcept App>
class EventLoop {
public:
    EventLoop(const EngineConfig& config, xdp::RingEngine<Port>& engine,
              quic::ProtocolDriver& driver, App& app)
        : engine_(engine)
        , driver_(driver)
        , app_(app)
        , codec_(config.local)
        , pending_(config.max_pending_egress)
        , rx_batch_(config.rx_batch)
        , report_interval_ns_(config.report_interval_ns)
        , max_exhausted_iterations_(config.max_exhausted_iterations)
        , rx_frames_(config.rx_batch)
        , egress_(EGRESS_BATCH)
    {}

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * One iteration
     * @throws FrameLeakError after max_exhausted_iterations consecutive
     *         iterations without a Free frame for TX
     */
    void run_once(uint64_t now, LoopStats& stats) {
        exhausted_ = false;
        stats.iterations++;

        // 1. RX
        uint32_t n = engine_.poll_rx(rx_frames_.data(), rx_batch_);
        for (uint32_t i = 0; i < n; i++) {
            xdp::XDPFrame& f = rx_frames_[i];
            stats.rx_frames++;
            stack::DecodedPacket pkt;
            stack::DecodeStatus st = codec_.decode(f.data, f.len, &pkt);
            if (st == stack::DecodeStatus::Ok) {
                stats.rx_delivered++;
                quic::StreamEvents ev = driver_.on_datagram(pkt.payload, pkt.payload_len, pkt.peer, now);
                app_.on_events(driver_, ev, now, stats);
            } else {
                stats.count_malformed(st);
                AB_DEBUG_LOG("[LOOP] Drop frame: %s\n", stack::decode_status_name(st));
            }
            engine_.recycle(f);
        }

        // 2 + 3. Egress, parked datagrams first
        while (!pending_.empty()) {
            if (!transmit(pending_.front(), stats)) break;
            pending_.pop();
        }
        size_t out = driver_.drain_egress(now, egress_.data(), egress_.size());
        for (size_t i = 0; i < out; i++) {
            if (pending_.empty() && transmit(egress_[i], stats)) {
                continue;
            }
            if (pending_.push(egress_[i])) {
                stats.pending_queued++;
            } else {
                stats.pending_overflow++;
            }
        }
        engine_.flush_tx();

        // 4. Application
        app_.on_tick(driver_, now, stats);

        // 5. Recycle transmitted frames, resupply RX
        stats.completions += engine_.reap_completions();
        engine_.replenish_fill();

        // 6. Probe deadlines
        app_.expire(now, stats);

        if (exhausted_) {
            stats.exhausted_streak++;
            if (stats.exhausted_streak > stats.exhausted_streak_max) {
                stats.exhausted_streak_max = stats.exhausted_streak;
            }
            if (stats.exhausted_streak > max_exhausted_iterations_) {
                xdp::RingAccounting a = engine_.accounting();
                throw FrameLeakError("Frame arena exhausted for " + std::to_string(stats.exhausted_streak) +
                                     " iterations (free=" + std::to_string(a.free) +
                                     " fill=" + std::to_string(a.fill) + " rx=" + std::to_string(a.rx) +
                                     " tx=" + std::to_string(a.tx) +
                                     " completion=" + std::to_string(a.completion) +
                                     " held=" + std::to_string(a.held) + ")");
            }
        } else {
            stats.exhausted_streak = 0;
        }
    }

    /**
     * Busy-poll until stop is set (or the client driver gives up)
     * @return Final stats
     */
    LoopStats run(const std::atomic<bool>& stop, const StatsReporter& reporter = print_stats_line) {
        LoopStats stats;
        uint64_t now = get_monotonic_timestamp_ns();
        uint64_t next_report = now + report_interval_ns_;
        printf("[LOOP] Running (rx_batch=%u pending=%zu)\n", rx_batch_, pending_.capacity());

        while (!stop.load(std::memory_order_acquire)) {
            now = get_monotonic_timestamp_ns();
            run_once(now, stats);
            if (reporter && report_interval_ns_ != 0 && now >= next_report) {
                reporter(make_snapshot(stats, now, driver_.is_established()));
                next_report = now + report_interval_ns_;
            }
            if (driver_.gave_up()) {
                fprintf(stderr, "[LOOP] Driver gave up reconnecting, stopping\n");
                break;
            }
        }

        shutdown(get_monotonic_timestamp_ns(), stats);
        return stats;
    }

    // Close the connection, flush its final datagrams and return every held frame
    void shutdown(uint64_t now, LoopStats& stats) {
        driver_.close(now);
        size_t out = driver_.drain_egress(now, egress_.data(), egress_.size());
        for (size_t i = 0; i < out; i++) {
            if (!transmit(egress_[i], stats)) break;
        }
        engine_.flush_tx();
        pending_.clear();
        uint32_t released = engine_.release_all_held();
        printf("[LOOP] Shutdown after %lu iterations (released %u held frames)\n",
               stats.iterations, released);
    }

    const PendingEgress& pending() const { return pending_; }
    const stack::PacketCodec& codec() const { return codec_; }

private:
    // false = retry later (ring full or no frame); the datagram is not consumed
    bool transmit(const quic::Datagram& dg, LoopStats& stats) {
        xdp::XDPFrame f;
        if (!engine_.allocate(&f)) {
            stats.tx_exhausted++;
            exhausted_ = true;
            return false;
        }
        size_t len = codec_.encode(dg.bytes, dg.len, dg.peer, f.data, f.capacity);
        if (len == 0) {
            stats.encode_failures++;
            engine_.release(f);
            return true;
        }
        switch (engine_.submit_tx(f, static_cast<uint32_t>(len))) {
            case xdp::TxStatus::Ok:
                stats.tx_datagrams++;
                return true;
            case xdp::TxStatus::RingFull:
                stats.tx_ring_full++;
                engine_.release(f);
                return false;
            case xdp::TxStatus::Invalid:
                break;
        }
        stats.encode_failures++;
        engine_.release(f);
        return true;
    }

    xdp::RingEngine<Port>& engine_;
    quic::ProtocolDriver& driver_;
    App& app_;
    stack::PacketCodec codec_;
    PendingEgress pending_;
    uint32_t rx_batch_;
    uint64_t report_interval_ns_;
    uint64_t max_exhausted_iterations_;
    bool exhausted_ = false;

    std::vector<xdp::XDPFrame> rx_frames_;
    std::vector<quic::Datagram> egress_;
};

} // namespace afterburner::pipeline
