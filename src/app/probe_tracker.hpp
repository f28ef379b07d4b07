// app/probe_tracker.hpp
// Outstanding round-trip probes: completion on echo, loss on deadline
#pragma once

#include <cstdint>
#include <cstddef>
#include <deque>

#include "../core/latency_stats.hpp"

namespace afterburner::app {

class ProbeTracker {
public:
    explicit ProbeTracker(uint64_t deadline_ns, size_t max_outstanding = 65536)
        : deadline_ns_(deadline_ns), max_outstanding_(max_outstanding) {}

    // Sequence numbers must be registered in increasing order
    void on_sent(uint64_t seq, uint64_t send_ns, LatencyStats& stats) {
        if (pending_.size() >= max_outstanding_) {
            pop_front_as_lost(stats);
        }
        pending_.push_back({seq, send_ns, false});
        live_++;
    }

    /**
     * An echo of probe seq arrived
     * @return false for unknown, already completed or expired probes
     */
    bool on_echo(uint64_t seq, uint64_t recv_ns, LatencyStats& stats) {
        if (pending_.empty() || seq < pending_.front().seq || seq > pending_.back().seq) {
            unknown_echoes_++;
            return false;
        }
        // Sequence numbers are dense within the window
        size_t idx = static_cast<size_t>(seq - pending_.front().seq);
        if (idx >= pending_.size() || pending_[idx].seq != seq) {
            idx = find(seq);
        }
        if (idx == pending_.size() || pending_[idx].done) {
            unknown_echoes_++;
            return false;
        }
        pending_[idx].done = true;
        live_--;
        stats.record(pending_[idx].send_ns, recv_ns);
        trim_completed();
        return true;
    }

    // Declare probes past their deadline lost; returns how many
    size_t expire(uint64_t now, LatencyStats& stats) {
        size_t lost = 0;
        while (!pending_.empty()) {
            const Pending& p = pending_.front();
            if (!p.done && now < p.send_ns + deadline_ns_) {
                break;
            }
            if (!p.done) {
                lost++;
            }
            pop_front_as_lost(stats);
        }
        return lost;
    }

    size_t outstanding() const { return live_; }
    uint64_t unknown_echoes() const { return unknown_echoes_; }
    uint64_t deadline_ns() const { return deadline_ns_; }

private:
    struct Pending {
        uint64_t seq;
        uint64_t send_ns;
        bool done;
    };

    size_t find(uint64_t seq) const {
        size_t lo = 0, hi = pending_.size();
        while (lo < hi) {
            size_t mid = lo + (hi - lo) / 2;
            if (pending_[mid].seq < seq) lo = mid + 1;
            else hi = mid;
        }
        return (lo < pending_.size() && pending_[lo].seq == seq) ? lo : pending_.size();
    }

    void pop_front_as_lost(LatencyStats& stats) {
        if (!pending_.front().done) {
            stats.record_loss();
            live_--;
        }
        pending_.pop_front();
    }

    void trim_completed() {
        while (!pending_.empty() && pending_.front().done) {
            pending_.pop_front();
        }
    }

    uint64_t deadline_ns_;
    size_t max_outstanding_;
    std::deque<Pending> pending_;
    size_t live_ = 0;
    uint64_t unknown_echoes_ = 0;
};

} // namespace afterburner::app
