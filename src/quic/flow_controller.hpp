// src/quic/flow_controller.hpp
// Credit-based flow control for one direction of a stream or connection
//
// SendCredit:    what the peer allows us to send (raised by MAX_DATA /
//                MAX_STREAM_DATA)
// ReceiveWindow: what we allow the peer to send; enforced on every frame and
//                advanced once half the window has been consumed

#pragma once

#include <cstdint>
#include <cstddef>

namespace afterburner::quic {

class SendCredit {
public:
    SendCredit() = default;
    explicit SendCredit(uint64_t limit) : limit_(limit) {}

    uint64_t available() const { return limit_ - used_; }

    void consume(uint64_t n) { used_ += n; }

    // Peer raised the limit. Lower values are ignored (frames may be reordered).
    bool update_limit(uint64_t limit) {
        if (limit <= limit_) return false;
        limit_ = limit;
        return true;
    }

    // A BLOCKED frame is sent once per limit value
    bool should_signal_blocked() const { return available() == 0 && blocked_signalled_at_ != limit_ + 1; }
    void mark_blocked_signalled() { blocked_signalled_at_ = limit_ + 1; }

    uint64_t limit() const { return limit_; }
    uint64_t used() const { return used_; }

private:
    uint64_t limit_ = 0;
    uint64_t used_ = 0;
    uint64_t blocked_signalled_at_ = 0;   // limit + 1 at the last BLOCKED; 0 = never
};

class ReceiveWindow {
public:
    ReceiveWindow() = default;
    explicit ReceiveWindow(uint64_t window) : window_(window), limit_(window) {}

    /**
     * Peer data now reaches end_offset (stream) or total bytes (connection)
     * @return false if that exceeds the advertised limit (FLOW_CONTROL_ERROR)
     */
    bool on_received(uint64_t end) {
        if (end > limit_) return false;
        if (end > highest_) highest_ = end;
        return true;
    }

    // Extend by delta bytes of newly received data (connection level)
    bool on_received_delta(uint64_t delta) {
        return on_received(highest_ + delta);
    }

    void on_consumed(uint64_t n) { consumed_ += n; }

    // Less than half the window left before the limit
    bool should_update() const {
        return limit_ - consumed_ < window_ / 2;
    }

    // Slide the limit to consumed + window; returns the new limit
    uint64_t advance() {
        limit_ = consumed_ + window_;
        return limit_;
    }

    uint64_t limit() const { return limit_; }
    uint64_t highest() const { return highest_; }
    uint64_t consumed() const { return consumed_; }
    uint64_t window() const { return window_; }

private:
    uint64_t window_ = 0;
    uint64_t limit_ = 0;
    uint64_t highest_ = 0;
    uint64_t consumed_ = 0;
};

} // namespace afterburner::quic
