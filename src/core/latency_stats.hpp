// core/latency_stats.hpp
// Running round-trip aggregation: min / max / average / sample count
#pragma once

#include <cstdint>
#include <cstddef>

namespace afterburner {

class LatencyStats {
public:
    // One completed probe; timestamps in nanoseconds
    void record(uint64_t send_ns, uint64_t recv_ns) {
        uint64_t rtt = (recv_ns > send_ns) ? recv_ns - send_ns : 0;
        if (count_ == 0 || rtt < min_ns_) min_ns_ = rtt;
        if (rtt > max_ns_) max_ns_ = rtt;
        sum_ns_ += rtt;
        count_++;
    }

    void record_loss() { losses_++; }
    void record_losses(uint64_t n) { losses_ += n; }

    uint64_t count() const { return count_; }
    uint64_t losses() const { return losses_; }
    uint64_t min_ns() const { return count_ ? min_ns_ : 0; }
    uint64_t max_ns() const { return max_ns_; }
    uint64_t sum_ns() const { return sum_ns_; }

    double avg_ns() const {
        return count_ ? static_cast<double>(sum_ns_) / static_cast<double>(count_) : 0.0;
    }

    double avg_us() const { return avg_ns() / 1000.0; }
    double min_us() const { return static_cast<double>(min_ns()) / 1000.0; }
    double max_us() const { return static_cast<double>(max_ns_) / 1000.0; }

    void reset() {
        count_ = 0;
        losses_ = 0;
        min_ns_ = 0;
        max_ns_ = 0;
        sum_ns_ = 0;
    }

private:
    uint64_t count_ = 0;
    uint64_t losses_ = 0;
    uint64_t min_ns_ = 0;
    uint64_t max_ns_ = 0;
    uint64_t sum_ns_ = 0;
};

} // namespace afterburner
