// src/quic/ack_tracker.hpp
// Received packet numbers of one packet-number space, as ACK ranges

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

#include "quic_frame.hpp"

namespace afterburner::quic {

class AckTracker {
public:
    // ack_delay_ns == 0: every ack-eliciting packet is acknowledged at once
    explicit AckTracker(uint64_t ack_delay_ns = 0) : ack_delay_ns_(ack_delay_ns) {
        ranges_.reserve(MAX_ACK_RANGES + 1);
    }

    void set_ack_delay(uint64_t ack_delay_ns) { ack_delay_ns_ = ack_delay_ns; }

    // True if pn was already received (or is too old to tell)
    bool is_duplicate(uint64_t pn) const {
        if (pn < floor_) {
            return true;
        }
        for (const AckRange& r : ranges_) {
            if (pn >= r.smallest && pn <= r.largest) return true;
            if (pn > r.largest) return false;
        }
        return false;
    }

    /**
     * Record a processed packet
     *
     * Ranges stay sorted from the largest down and are merged when they touch.
     * Only the newest MAX_ACK_RANGES ranges are kept.
     */
    void on_packet_received(uint64_t pn, bool ack_eliciting, uint64_t now) {
        if (largest_ == UINT64_MAX || pn > largest_) {
            largest_ = pn;
            largest_time_ = now;
        }
        insert(pn);

        if (ack_eliciting) {
            if (unacked_eliciting_ == 0) {
                first_unacked_time_ = now;
            }
            unacked_eliciting_++;
        }
    }

    /**
     * An ACK should go out now
     *
     * Immediately when the delay is zero, otherwise after two ack-eliciting
     * packets or once the delay has passed since the first unacknowledged one.
     */
    bool ack_due(uint64_t now) const {
        if (unacked_eliciting_ == 0) return false;
        if (ack_delay_ns_ == 0 || unacked_eliciting_ >= 2) return true;
        return now >= first_unacked_time_ + ack_delay_ns_;
    }

    // Deadline of a delayed ACK, 0 if none pending
    uint64_t ack_deadline() const {
        if (unacked_eliciting_ == 0) return 0;
        return first_unacked_time_ + ack_delay_ns_;
    }

    bool has_ranges() const { return !ranges_.empty(); }

    void build(AckFrame* ack, uint64_t now) const {
        ack->range_count = 0;
        for (const AckRange& r : ranges_) {
            if (ack->range_count == MAX_ACK_RANGES) break;
            ack->ranges[ack->range_count++] = r;
        }
        ack->ack_delay = (now > largest_time_) ? (now - largest_time_) / 1000 : 0;
    }

    void on_ack_sent() {
        unacked_eliciting_ = 0;
        first_unacked_time_ = 0;
    }

    uint64_t largest() const { return largest_; }   // UINT64_MAX if nothing received
    size_t range_count() const { return ranges_.size(); }

    void reset() {
        ranges_.clear();
        largest_ = UINT64_MAX;
        largest_time_ = 0;
        floor_ = 0;
        unacked_eliciting_ = 0;
        first_unacked_time_ = 0;
    }

private:
    void insert(uint64_t pn) {
        size_t i = 0;
        while (i < ranges_.size() && ranges_[i].smallest > pn + 1) {
            i++;
        }
        if (i == ranges_.size()) {
            ranges_.push_back({pn, pn});
        } else {
            AckRange& r = ranges_[i];
            if (pn >= r.smallest && pn <= r.largest) {
                return;
            }
            if (pn == r.largest + 1) {
                r.largest = pn;
                // May now touch the newer range before it
                if (i > 0 && ranges_[i - 1].smallest == pn + 1) {
                    ranges_[i - 1].smallest = r.smallest;
                    ranges_.erase(ranges_.begin() + static_cast<long>(i));
                }
            } else if (pn + 1 == r.smallest) {
                r.smallest = pn;
                if (i + 1 < ranges_.size() && ranges_[i + 1].largest + 1 == pn) {
                    r.smallest = ranges_[i + 1].smallest;
                    ranges_.erase(ranges_.begin() + static_cast<long>(i + 1));
                }
            } else {
                ranges_.insert(ranges_.begin() + static_cast<long>(i), AckRange{pn, pn});
            }
        }

        if (ranges_.size() > MAX_ACK_RANGES) {
            floor_ = ranges_.back().largest + 1;
            ranges_.pop_back();
        }
    }

    uint64_t ack_delay_ns_;
    std::vector<AckRange> ranges_;
    uint64_t largest_ = UINT64_MAX;
    uint64_t largest_time_ = 0;
    uint64_t floor_ = 0;               // Everything below was forgotten
    uint32_t unacked_eliciting_ = 0;
    uint64_t first_unacked_time_ = 0;
};

} // namespace afterburner::quic
