// app/flood_generator.hpp
// Outbound probe flood, strict round-robin over the application streams
//
// Each invocation produces exactly one payload for the next stream in the
// rotation {0, 4, 8, 12}. A stream without flow-control credit for the whole
// payload is skipped for this cycle (counted); the rotation still advances
// so one blocked stream never starves the others.
#pragma once

#include <cstdint>
#include <cstddef>
#include <concepts>

#include "probe_message.hpp"
#include "../quic/quic_types.hpp"
#include "../quic/quic_connection.hpp"

namespace afterburner::app {

// Anything that accepts stream writes (ProtocolDriver, QuicConnection, mocks)
template<typename T>
concept StreamSinkConcept = requires(T& sink, uint64_t id, const uint8_t* data, size_t len, size_t* accepted) {
    { sink.write_stream(id, data, len, accepted) } -> std::same_as<quic::StreamStatus>;
    { sink.send_capacity(id) } -> std::convertible_to<size_t>;
    { sink.is_established() } -> std::convertible_to<bool>;
};

enum class FloodResult : uint8_t {
    Sent = 0,
    Skipped,        // Stream had no credit (WouldBlock)
    NotReady,       // Connection not established; rotation unchanged
    Error,          // Stream rejected the write
};

struct FloodStats {
    uint64_t sent = 0;
    uint64_t skipped = 0;
    uint64_t errors = 0;
    uint64_t bytes = 0;
    uint64_t per_stream[quic::APP_STREAM_COUNT] = {};
};

// What was sent, for probe tracking
struct SentProbe {
    uint64_t stream_id = 0;
    uint64_t seq = 0;
    uint64_t send_ts_ns = 0;
    size_t len = 0;
};

class FloodGenerator {
public:
    FloodGenerator(size_t max_payload, uint64_t interval_ns)
        : max_payload_(max_payload), interval_ns_(interval_ns) {}

    // The configured interval has elapsed since the last send
    bool due(uint64_t now) const {
        return !started_ || now >= last_send_ns_ + interval_ns_;
    }

    template<StreamSinkConcept Sink>
    FloodResult step(Sink& sink, uint64_t now, SentProbe* sent) {
        if (!sink.is_established()) {
            return FloodResult::NotReady;
        }
        uint64_t id = quic::APP_STREAM_IDS[next_];
        size_t len = build_probe(seq_, now, max_payload_, buf_, sizeof(buf_));
        if (len == 0) {
            stats_.errors++;
            return FloodResult::Error;
        }

        size_t capacity = sink.send_capacity(id);
        size_t accepted = 0;
        quic::StreamStatus st = (capacity >= len)
            ? sink.write_stream(id, buf_, len, &accepted)
            : quic::StreamStatus::WouldBlock;

        if (st == quic::StreamStatus::NotEstablished) {
            return FloodResult::NotReady;
        }

        size_t slot = next_;
        next_ = (next_ + 1) % quic::APP_STREAM_COUNT;
        started_ = true;
        last_send_ns_ = now;

        if (st == quic::StreamStatus::WouldBlock) {
            stats_.skipped++;
            return FloodResult::Skipped;
        }
        if (st != quic::StreamStatus::Ok || accepted != len) {
            stats_.errors++;
            return FloodResult::Error;
        }

        if (sent) {
            sent->stream_id = id;
            sent->seq = seq_;
            sent->send_ts_ns = now;
            sent->len = len;
        }
        seq_++;
        stats_.sent++;
        stats_.bytes += len;
        stats_.per_stream[slot]++;
        return FloodResult::Sent;
    }

    uint64_t next_stream() const { return quic::APP_STREAM_IDS[next_]; }
    uint64_t next_seq() const { return seq_; }
    const FloodStats& stats() const { return stats_; }
    uint64_t interval_ns() const { return interval_ns_; }

private:
    size_t max_payload_;
    uint64_t interval_ns_;
    size_t next_ = 0;
    uint64_t seq_ = 0;
    uint64_t last_send_ns_ = 0;
    bool started_ = false;
    FloodStats stats_;
    uint8_t buf_[quic::MAX_DATAGRAM_SIZE];
};

} // namespace afterburner::app
