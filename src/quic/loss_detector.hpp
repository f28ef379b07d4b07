// src/quic/loss_detector.hpp
// RTT estimation, sent-packet bookkeeping, loss detection and PTO
// (RFC 9002 without congestion control)
//
// Every ack-eliciting packet is remembered with copies of its retransmittable
// frames. When a packet is declared lost its frames are handed back to the
// connection to be sent again in a new packet; packets themselves are never
// retransmitted.

#pragma once

#include <cstdint>
#include <cstddef>
#include <deque>
#include <vector>
#include <algorithm>

#include "quic_types.hpp"
#include "quic_frame.hpp"

namespace afterburner::quic {

constexpr uint64_t INITIAL_RTT_NS = 10'000'000;      // 10 ms, LAN deployment
constexpr uint64_t TIMER_GRANULARITY_NS = 1'000'000; // 1 ms
constexpr uint64_t PACKET_THRESHOLD = 3;
constexpr uint32_t MAX_PTO_BACKOFF = 16;             // 2^16 cap on the PTO multiplier

// ============================================================================
// RTT
// ============================================================================

class RttEstimator {
public:
    void update(uint64_t latest_ns, uint64_t ack_delay_ns, bool handshake_confirmed) {
        latest_ = latest_ns;
        if (!has_sample_) {
            min_ = latest_ns;
            smoothed_ = latest_ns;
            var_ = latest_ns / 2;
            has_sample_ = true;
            return;
        }
        min_ = std::min(min_, latest_ns);
        if (handshake_confirmed) {
            ack_delay_ns = std::min(ack_delay_ns, max_ack_delay_ns_);
        }
        uint64_t adjusted = latest_ns;
        if (latest_ns >= min_ + ack_delay_ns) {
            adjusted = latest_ns - ack_delay_ns;
        }
        uint64_t diff = (smoothed_ > adjusted) ? smoothed_ - adjusted : adjusted - smoothed_;
        var_ = (3 * var_ + diff) / 4;
        smoothed_ = (7 * smoothed_ + adjusted) / 8;
    }

    // PTO without backoff and without max_ack_delay
    uint64_t pto_base() const {
        return smoothed_ + std::max(4 * var_, TIMER_GRANULARITY_NS);
    }

    void set_max_ack_delay(uint64_t ns) { max_ack_delay_ns_ = ns; }
    uint64_t max_ack_delay() const { return max_ack_delay_ns_; }

    uint64_t latest() const { return latest_; }
    uint64_t smoothed() const { return smoothed_; }
    uint64_t rttvar() const { return var_; }
    uint64_t min_rtt() const { return min_; }
    bool has_sample() const { return has_sample_; }

private:
    uint64_t latest_ = 0;
    uint64_t smoothed_ = INITIAL_RTT_NS;
    uint64_t var_ = INITIAL_RTT_NS / 2;
    uint64_t min_ = 0;
    uint64_t max_ack_delay_ns_ = 0;
    bool has_sample_ = false;
};

// ============================================================================
// Sent packets
// ============================================================================

enum class SentFrameKind : uint8_t {
    Crypto,
    Stream,
    MaxData,
    MaxStreamData,
    DataBlocked,
    StreamDataBlocked,
    HandshakeDone,
    Ping,
};

// Retransmittable content of one frame. Data is copied so it survives the
// stream send buffer.
struct SentFrame {
    SentFrameKind kind = SentFrameKind::Ping;
    uint64_t stream_id = 0;
    uint64_t offset = 0;
    bool fin = false;
    std::vector<uint8_t> data;
};

struct SentPacket {
    uint64_t packet_number = 0;
    uint64_t time_sent = 0;
    size_t bytes = 0;
    std::vector<SentFrame> frames;
};

struct LossStats {
    uint64_t packets_sent = 0;       // Ack-eliciting packets recorded
    uint64_t packets_acked = 0;
    uint64_t packets_lost = 0;
    uint64_t pto_fired = 0;
};

enum class TimerAction : uint8_t {
    None = 0,
    LossDetected,      // Lost frames were returned
    Probe,             // PTO: send an ack-eliciting probe in probe_space
};

class LossDetector {
public:
    LossDetector() {
        for (size_t i = 0; i < PACKET_SPACE_COUNT; i++) {
            largest_acked_[i] = UINT64_MAX;
            loss_time_[i] = 0;
            last_eliciting_time_[i] = 0;
            discarded_[i] = false;
        }
    }

    void on_packet_sent(PacketSpace space, SentPacket&& pkt) {
        size_t s = space_index(space);
        last_eliciting_time_[s] = pkt.time_sent;
        sent_[s].push_back(std::move(pkt));
        stats_.packets_sent++;
    }

    /**
     * Process an ACK frame
     *
     * Acknowledged packets are forgotten; packets the ACK proves lost have
     * their frames appended to lost.
     * @return Number of newly acknowledged packets
     */
    size_t on_ack_received(PacketSpace space, const AckFrame& ack, uint64_t now,
                           bool handshake_confirmed, std::vector<SentFrame>* lost) {
        size_t s = space_index(space);
        uint64_t largest = ack.largest();
        if (largest_acked_[s] == UINT64_MAX || largest > largest_acked_[s]) {
            largest_acked_[s] = largest;
        }

        size_t newly_acked = 0;
        bool largest_newly_acked = false;
        uint64_t largest_time_sent = 0;

        auto& sent = sent_[s];
        for (auto it = sent.begin(); it != sent.end();) {
            if (ack.contains(it->packet_number)) {
                if (it->packet_number == largest) {
                    largest_newly_acked = true;
                    largest_time_sent = it->time_sent;
                }
                newly_acked++;
                it = sent.erase(it);
            } else {
                ++it;
            }
        }

        if (newly_acked == 0) {
            return 0;
        }
        stats_.packets_acked += newly_acked;

        // Only a newly acknowledged largest packet yields an RTT sample
        if (largest_newly_acked && now >= largest_time_sent) {
            uint64_t ack_delay_ns = ack.ack_delay * 1000;
            if (space == PacketSpace::Initial) {
                ack_delay_ns = 0;
            }
            rtt_.update(now - largest_time_sent, ack_delay_ns, handshake_confirmed);
        }

        pto_count_ = 0;
        detect_lost(space, now, lost);
        return newly_acked;
    }

    /**
     * Earliest loss or PTO deadline, 0 if no timer is armed
     *
     * @param app_ready Application space probes are allowed
     */
    uint64_t next_timeout(bool app_ready) const {
        uint64_t earliest = 0;
        for (size_t s = 0; s < PACKET_SPACE_COUNT; s++) {
            if (loss_time_[s] != 0 && (earliest == 0 || loss_time_[s] < earliest)) {
                earliest = loss_time_[s];
            }
        }
        if (earliest != 0) {
            return earliest;
        }

        for (size_t s = 0; s < PACKET_SPACE_COUNT; s++) {
            if (sent_[s].empty()) continue;
            if (s == space_index(PacketSpace::Application) && !app_ready) continue;
            uint64_t t = last_eliciting_time_[s] + pto_duration(static_cast<PacketSpace>(s));
            if (earliest == 0 || t < earliest) {
                earliest = t;
            }
        }
        return earliest;
    }

    /**
     * Service the loss/PTO timer
     *
     * On Probe the oldest outstanding packet of probe_space is taken out of
     * flight and its frames are appended to lost, so the probe carries them.
     */
    TimerAction on_timeout(uint64_t now, bool app_ready, std::vector<SentFrame>* lost,
                           PacketSpace* probe_space) {
        // Time-threshold loss first
        for (size_t s = 0; s < PACKET_SPACE_COUNT; s++) {
            if (loss_time_[s] != 0 && now >= loss_time_[s]) {
                size_t before = lost->size();
                detect_lost(static_cast<PacketSpace>(s), now, lost);
                if (lost->size() > before || loss_time_[s] == 0) {
                    return TimerAction::LossDetected;
                }
            }
        }

        uint64_t deadline = next_timeout(app_ready);
        if (deadline == 0 || now < deadline) {
            return TimerAction::None;
        }

        // Space whose PTO expired first
        size_t best = PACKET_SPACE_COUNT;
        uint64_t best_time = 0;
        for (size_t s = 0; s < PACKET_SPACE_COUNT; s++) {
            if (sent_[s].empty()) continue;
            if (s == space_index(PacketSpace::Application) && !app_ready) continue;
            uint64_t t = last_eliciting_time_[s] + pto_duration(static_cast<PacketSpace>(s));
            if (best == PACKET_SPACE_COUNT || t < best_time) {
                best = s;
                best_time = t;
            }
        }
        if (best == PACKET_SPACE_COUNT) {
            return TimerAction::None;
        }

        SentPacket& oldest = sent_[best].front();
        for (SentFrame& f : oldest.frames) {
            lost->push_back(std::move(f));
        }
        sent_[best].pop_front();

        if (pto_count_ < MAX_PTO_BACKOFF) {
            pto_count_++;
        }
        stats_.pto_fired++;
        // The probe re-arms the timer from now
        last_eliciting_time_[best] = now;
        *probe_space = static_cast<PacketSpace>(best);
        return TimerAction::Probe;
    }

    // Forget all state of a space whose keys were dropped
    void discard_space(PacketSpace space) {
        size_t s = space_index(space);
        sent_[s].clear();
        loss_time_[s] = 0;
        discarded_[s] = true;
        pto_count_ = 0;
    }

    uint64_t pto_duration(PacketSpace space) const {
        uint64_t pto = rtt_.pto_base();
        if (space == PacketSpace::Application) {
            pto += rtt_.max_ack_delay();
        }
        return pto << pto_count_;
    }

    // Highest packet number acknowledged in the space, UINT64_MAX if none
    uint64_t largest_acked(PacketSpace space) const { return largest_acked_[space_index(space)]; }

    size_t in_flight(PacketSpace space) const { return sent_[space_index(space)].size(); }
    bool discarded(PacketSpace space) const { return discarded_[space_index(space)]; }
    uint32_t pto_count() const { return pto_count_; }
    RttEstimator& rtt() { return rtt_; }
    const RttEstimator& rtt() const { return rtt_; }
    const LossStats& stats() const { return stats_; }

private:
    void detect_lost(PacketSpace space, uint64_t now, std::vector<SentFrame>* lost) {
        size_t s = space_index(space);
        loss_time_[s] = 0;
        if (largest_acked_[s] == UINT64_MAX) {
            return;
        }

        uint64_t base = std::max(rtt_.latest(), rtt_.smoothed());
        uint64_t loss_delay = std::max(base * 9 / 8, TIMER_GRANULARITY_NS);
        uint64_t lost_send_time = (now > loss_delay) ? now - loss_delay : 0;

        auto& sent = sent_[s];
        for (auto it = sent.begin(); it != sent.end();) {
            if (it->packet_number > largest_acked_[s]) {
                ++it;
                continue;
            }
            if (it->time_sent <= lost_send_time ||
                largest_acked_[s] >= it->packet_number + PACKET_THRESHOLD) {
                for (SentFrame& f : it->frames) {
                    lost->push_back(std::move(f));
                }
                stats_.packets_lost++;
                it = sent.erase(it);
            } else {
                uint64_t t = it->time_sent + loss_delay;
                if (loss_time_[s] == 0 || t < loss_time_[s]) {
                    loss_time_[s] = t;
                }
                ++it;
            }
        }
    }

    RttEstimator rtt_;
    std::deque<SentPacket> sent_[PACKET_SPACE_COUNT];   // Ordered by packet number
    uint64_t largest_acked_[PACKET_SPACE_COUNT];
    uint64_t loss_time_[PACKET_SPACE_COUNT];
    uint64_t last_eliciting_time_[PACKET_SPACE_COUNT];
    bool discarded_[PACKET_SPACE_COUNT];
    uint32_t pto_count_ = 0;
    LossStats stats_;
};

} // namespace afterburner::quic
