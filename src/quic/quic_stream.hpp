// src/quic/quic_stream.hpp
// One bidirectional stream: ordered send buffer and reassembling receive buffer

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <map>
#include <vector>

#include "flow_controller.hpp"

namespace afterburner::quic {

enum class StreamFrameResult : uint8_t {
    Ok = 0,
    FlowControlError,
    FinalSizeError,
};

class QuicStream {
public:
    QuicStream(uint64_t id, uint64_t send_limit, uint64_t recv_window)
        : id_(id), credit_(send_limit), window_(recv_window) {}

    uint64_t id() const { return id_; }

    // ========================================================================
    // Send side
    // ========================================================================

    SendCredit& credit() { return credit_; }
    const SendCredit& credit() const { return credit_; }

    // Buffer bytes already covered by flow-control credit
    void queue_send(const uint8_t* data, size_t len) {
        send_buf_.insert(send_buf_.end(), data, data + len);
    }

    void finish() { fin_queued_ = true; }

    bool has_pending_send() const {
        return send_head_ < send_buf_.size() || (fin_queued_ && !fin_sent_);
    }

    /**
     * Next chunk of unsent data, at most max bytes
     * @return Chunk length (may be 0 for a bare FIN)
     */
    size_t peek_send(size_t max, uint64_t* offset, const uint8_t** data, bool* fin) const {
        size_t pending = send_buf_.size() - send_head_;
        size_t n = (pending < max) ? pending : max;
        *offset = send_offset_;
        *data = send_buf_.data() + send_head_;
        *fin = fin_queued_ && !fin_sent_ && n == pending;
        return n;
    }

    void mark_sent(size_t len, bool fin) {
        send_head_ += len;
        send_offset_ += len;
        if (fin) fin_sent_ = true;
        if (send_head_ == send_buf_.size()) {
            send_buf_.clear();
            send_head_ = 0;
        } else if (send_head_ > 4096 && send_head_ > send_buf_.size() / 2) {
            send_buf_.erase(send_buf_.begin(), send_buf_.begin() + static_cast<long>(send_head_));
            send_head_ = 0;
        }
    }

    size_t unsent_bytes() const { return send_buf_.size() - send_head_; }
    uint64_t send_offset() const { return send_offset_; }
    bool fin_queued() const { return fin_queued_; }
    bool fin_sent() const { return fin_sent_; }

    // ========================================================================
    // Receive side
    // ========================================================================

    /**
     * Apply a received STREAM frame
     *
     * @param highest_delta Growth of the highest received offset, charged to
     *                      the connection window by the caller
     * @param readable      New bytes (or the FIN) became readable
     */
    StreamFrameResult on_frame(uint64_t offset, const uint8_t* data, size_t len, bool fin,
                               uint64_t* highest_delta, bool* readable) {
        uint64_t end = offset + len;
        uint64_t highest_before = window_.highest();
        *highest_delta = 0;
        *readable = false;

        if (final_size_known_ && end > final_size_) {
            return StreamFrameResult::FinalSizeError;
        }
        if (fin) {
            if ((final_size_known_ && end != final_size_) || end < highest_before) {
                return StreamFrameResult::FinalSizeError;
            }
        }
        if (!window_.on_received(end)) {
            return StreamFrameResult::FlowControlError;
        }
        *highest_delta = window_.highest() - highest_before;

        if (fin && !final_size_known_) {
            final_size_known_ = true;
            final_size_ = end;
        }

        size_t before = recv_buf_.size();
        if (end > recv_next_) {
            if (offset <= recv_next_) {
                size_t skip = static_cast<size_t>(recv_next_ - offset);
                recv_buf_.insert(recv_buf_.end(), data + skip, data + len);
                recv_next_ = end;
                drain_out_of_order();
            } else {
                std::vector<uint8_t>& slot = out_of_order_[offset];
                if (slot.size() < len) {
                    slot.assign(data, data + len);
                }
            }
        }

        bool fin_now_reachable = final_size_known_ && recv_next_ == final_size_ && !fin_reported_;
        if (fin_now_reachable) {
            fin_reported_ = true;
        }
        *readable = recv_buf_.size() > before || fin_now_reachable;
        return StreamFrameResult::Ok;
    }

    // Copy up to cap contiguous bytes out; returns bytes copied
    size_t read(uint8_t* buf, size_t cap) {
        size_t avail = recv_buf_.size() - recv_head_;
        size_t n = (avail < cap) ? avail : cap;
        if (n == 0) return 0;
        memcpy(buf, recv_buf_.data() + recv_head_, n);
        recv_head_ += n;
        if (recv_head_ == recv_buf_.size()) {
            recv_buf_.clear();
            recv_head_ = 0;
        } else if (recv_head_ > 4096 && recv_head_ > recv_buf_.size() / 2) {
            recv_buf_.erase(recv_buf_.begin(), recv_buf_.begin() + static_cast<long>(recv_head_));
            recv_head_ = 0;
        }
        window_.on_consumed(n);
        return n;
    }

    size_t readable_bytes() const { return recv_buf_.size() - recv_head_; }

    // Peer finished and everything was read
    bool recv_finished() const {
        return final_size_known_ && recv_next_ == final_size_ && readable_bytes() == 0;
    }

    ReceiveWindow& window() { return window_; }
    const ReceiveWindow& window() const { return window_; }

    // MAX_STREAM_DATA / STREAM_DATA_BLOCKED waiting for the next packet
    bool max_stream_data_pending = false;
    bool blocked_pending = false;

private:
    void drain_out_of_order() {
        auto it = out_of_order_.begin();
        while (it != out_of_order_.end() && it->first <= recv_next_) {
            uint64_t seg_end = it->first + it->second.size();
            if (seg_end > recv_next_) {
                size_t skip = static_cast<size_t>(recv_next_ - it->first);
                recv_buf_.insert(recv_buf_.end(), it->second.begin() + static_cast<long>(skip),
                                 it->second.end());
                recv_next_ = seg_end;
            }
            it = out_of_order_.erase(it);
        }
    }

    uint64_t id_;

    // Send
    SendCredit credit_;
    std::vector<uint8_t> send_buf_;
    size_t send_head_ = 0;
    uint64_t send_offset_ = 0;         // Stream offset of send_buf_[send_head_]
    bool fin_queued_ = false;
    bool fin_sent_ = false;

    // Receive
    ReceiveWindow window_;
    std::vector<uint8_t> recv_buf_;
    size_t recv_head_ = 0;
    uint64_t recv_next_ = 0;           // Offset after the last contiguous byte
    std::map<uint64_t, std::vector<uint8_t>> out_of_order_;
    bool final_size_known_ = false;
    uint64_t final_size_ = 0;
    bool fin_reported_ = false;
};

} // namespace afterburner::quic
