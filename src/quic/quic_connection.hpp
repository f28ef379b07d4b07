// src/quic/quic_connection.hpp
// One secure stream-multiplexed connection over datagrams
//
// State machine:
//
//   Initial --connect()/first Initial--> Handshaking --TLS finished--> Established
//      Established --close()/peer CLOSE--> Closing --3 x PTO--> Closed
//      Established --idle timeout--> Closing --immediately--> Closed
//      Handshaking --failure / peer CLOSE / timeout--> Closed
//      any --protocol error--> Closed
//
// The connection never touches the network. on_datagram() consumes one UDP
// payload; drain_egress() services every timer and produces the datagrams to
// send. Both are non-blocking and never throw once the connection exists.

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <cstdio>
#include <algorithm>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "quic_types.hpp"
#include "quic_crypto.hpp"
#include "quic_packet.hpp"
#include "quic_frame.hpp"
#include "ack_tracker.hpp"
#include "loss_detector.hpp"
#include "flow_controller.hpp"
#include "quic_stream.hpp"
#include "handshake.hpp"
#include "../engine_config.hpp"
#include "../stack/stack_types.hpp"
#include "../pipeline/pipeline_config.hpp"

namespace afterburner::quic {

enum class StreamStatus : uint8_t {
    Ok = 0,
    WouldBlock,        // No flow-control credit; retry after MAX_DATA / MAX_STREAM_DATA
    NoData,            // Nothing readable
    InvalidStream,     // Id not usable by this endpoint
    NotEstablished,
    StreamClosed,      // FIN already queued
};

inline const char* stream_status_name(StreamStatus s) {
    switch (s) {
        case StreamStatus::Ok:             return "ok";
        case StreamStatus::WouldBlock:     return "would_block";
        case StreamStatus::NoData:         return "no_data";
        case StreamStatus::InvalidStream:  return "invalid_stream";
        case StreamStatus::NotEstablished: return "not_established";
        case StreamStatus::StreamClosed:   return "stream_closed";
    }
    return "?";
}

// One UDP payload and where it goes
struct Datagram {
    uint8_t bytes[MAX_DATAGRAM_SIZE];
    size_t len = 0;
    stack::Endpoint peer;
};

constexpr size_t MAX_STREAM_EVENTS = 16;

struct StreamEvents {
    uint64_t readable[MAX_STREAM_EVENTS];
    size_t readable_count = 0;
    bool handshake_completed = false;
    bool connection_closed = false;     // Entered Closing or Closed

    void add_readable(uint64_t id) {
        for (size_t i = 0; i < readable_count; i++) {
            if (readable[i] == id) return;
        }
        if (readable_count < MAX_STREAM_EVENTS) {
            readable[readable_count++] = id;
        }
    }
};

struct ConnectionConfig {
    std::string alpn;
    uint64_t ack_delay_us;
    uint64_t max_data;
    uint64_t max_stream_data;
    uint64_t max_streams_bidi;
    uint64_t idle_timeout_ms;
    uint64_t handshake_timeout_ms;
    // Shared by every connection of one endpoint; null builds a private
    // context with a fresh self-issued certificate
    std::shared_ptr<TlsContext> tls;

    ConnectionConfig()
        : alpn("solana-tpu")
        , ack_delay_us(0)
        , max_data(100000000)
        , max_stream_data(10000000)
        , max_streams_bidi(1000)
        , idle_timeout_ms(30000)
        , handshake_timeout_ms(2000)
    {}

    static ConnectionConfig from(const EngineConfig& engine) {
        ConnectionConfig c;
        c.alpn = engine.alpn;
        c.ack_delay_us = engine.ack_delay_us;
        c.max_data = engine.max_data;
        c.max_stream_data = engine.max_stream_data;
        c.max_streams_bidi = engine.max_streams_bidi;
        c.idle_timeout_ms = engine.idle_timeout_ms;
        c.handshake_timeout_ms = engine.handshake_timeout_ms;
        return c;
    }
};

struct ConnectionStats {
    uint64_t packets_sent = 0;
    uint64_t packets_received = 0;
    uint64_t bytes_sent = 0;
    uint64_t bytes_received = 0;
    uint64_t undecodable = 0;          // Header did not parse
    uint64_t decrypt_failures = 0;
    uint64_t no_keys = 0;              // Space keys not (or no longer) available
    uint64_t unknown_cid = 0;
    uint64_t duplicates = 0;
    uint64_t dropped_closed = 0;       // Arrived while Closing/Closed
    uint64_t oversize = 0;             // Datagram larger than MAX_DATAGRAM_SIZE
    uint64_t acks_sent = 0;
    uint64_t probes = 0;
    uint64_t keepalives = 0;           // PINGs sent to hold an idle connection open
    uint64_t frames_requeued = 0;
    uint64_t stream_bytes_sent = 0;
    uint64_t stream_bytes_received = 0;
    uint64_t write_blocked = 0;
    uint64_t peer_blocked = 0;         // DATA_BLOCKED / STREAM_DATA_BLOCKED received
    uint64_t seal_failures = 0;
};

class QuicConnection {
public:
    QuicConnection(Role role, const ConnectionConfig& config, const stack::Endpoint& peer, uint64_t now)
        : role_(role)
        , config_(config)
        , peer_(peer)
        , hs_(role, config.tls ? config.tls : make_tls(role, config), make_local_params(config))
        , conn_window_(config.max_data)
        , created_at_(now)
        , last_activity_(now)
        , last_eliciting_sent_(now)
    {
        for (size_t s = 0; s < PACKET_SPACE_COUNT; s++) {
            next_pn_[s] = 0;
            ping_pending_[s] = false;
            ack_[s].set_ack_delay(config_.ack_delay_us * 1000);
        }
    }

    QuicConnection(const QuicConnection&) = delete;
    QuicConnection& operator=(const QuicConnection&) = delete;

    /**
     * Client: start the handshake
     * @return false if key material could not be generated (connection Closed)
     */
    bool connect(uint64_t now) {
        if (role_ != Role::Client || state_ != ConnectionState::Initial) {
            return false;
        }
        if (!random_connection_id(&local_cid_) || !random_connection_id(&original_dcid_)) {
            enter_closed(CloseReason::HandshakeFailed, error::INTERNAL_ERROR, true);
            return false;
        }
        peer_cid_ = original_dcid_;

        PacketKeys client_keys, server_keys;
        if (!derive_initial_keys(original_dcid_, &client_keys, &server_keys)) {
            enter_closed(CloseReason::HandshakeFailed, error::INTERNAL_ERROR, true);
            return false;
        }
        initial_send_.install(client_keys, true);
        initial_recv_.install(server_keys, false);

        if (!hs_.start(&crypto_send_buf_)) {
            enter_closed(CloseReason::HandshakeFailed, error::CRYPTO_ERROR_BASE + hs_.alert(), true);
            return false;
        }
        state_ = ConnectionState::Handshaking;
        handshake_start_ = now;
        last_activity_ = now;
        return true;
    }

    // ========================================================================
    // Ingress
    // ========================================================================

    /**
     * Process one received UDP payload (possibly several coalesced packets)
     *
     * Oversize datagrams and undecryptable, duplicate or misaddressed
     * packets are dropped and counted. Protocol violations close the
     * connection.
     */
    StreamEvents on_datagram(const uint8_t* data, size_t len, uint64_t now) {
        StreamEvents ev;
        if (state_ == ConnectionState::Closing || state_ == ConnectionState::Closed) {
            stats_.dropped_closed++;
            return ev;
        }
        if (len > MAX_DATAGRAM_SIZE) {
            stats_.oversize++;
            AB_DEBUG_LOG("[QUIC] Drop: %zu byte datagram\n", len);
            return ev;
        }

        size_t pos = 0;
        while (pos < len) {
            PacketHeader hdr;
            if (!parse_packet_header(data + pos, len - pos, &hdr)) {
                stats_.undecodable++;
                break;
            }
            const uint8_t* pkt = data + pos;
            pos += hdr.packet_len;
            process_packet(pkt, hdr, len, now, ev);
            if (state_ == ConnectionState::Closing || state_ == ConnectionState::Closed) {
                break;
            }
        }
        return ev;
    }

    // ========================================================================
    // Egress
    // ========================================================================

    /**
     * Service timers and produce up to max datagrams
     *
     * Called every loop iteration, with or without ingress.
     * @return Datagrams written to out
     */
    size_t drain_egress(uint64_t now, Datagram* out, size_t max) {
        size_t count = 0;
        if (max == 0) {
            return 0;
        }

        if (has_pending_close_) {
            copy_datagram(pending_close_, out[count++]);
            has_pending_close_ = false;
        }

        switch (state_) {
            case ConnectionState::Initial:
            case ConnectionState::Closed:
                return count;
            case ConnectionState::Closing:
                if (now >= drain_deadline_) {
                    state_ = ConnectionState::Closed;
                }
                return count;
            default:
                break;
        }

        uint64_t idle = idle_timeout_ns();
        if (idle != 0 && now >= last_activity_ + idle) {
            // Silent close: nothing is sent and the drain period is empty
            if (state_ == ConnectionState::Established) {
                state_ = ConnectionState::Closing;
                drain_deadline_ = now;
                close_info_ = {CloseReason::IdleTimeout, error::NO_ERROR, true};
            } else {
                enter_closed(CloseReason::IdleTimeout, error::NO_ERROR, true);
            }
            return count;
        }
        if (state_ == ConnectionState::Handshaking &&
            now >= handshake_start_ + config_.handshake_timeout_ms * 1000000ULL) {
            enter_closed(CloseReason::HandshakeTimeout, error::NO_ERROR, true);
            return count;
        }

        // Keep-alive: an ack-eliciting packet at least every half idle period
        if (state_ == ConnectionState::Established && idle != 0 &&
            now >= last_eliciting_sent_ + idle / 2 && !ping_pending_[1]) {
            ping_pending_[1] = true;
            stats_.keepalives++;
        }

        uint64_t deadline = loss_.next_timeout(app_ready());
        if (deadline != 0 && now >= deadline) {
            PacketSpace probe_space = PacketSpace::Initial;
            TimerAction action = loss_.on_timeout(now, app_ready(), &lost_scratch_, &probe_space);
            requeue_lost();
            if (action == TimerAction::Probe) {
                ping_pending_[space_index(probe_space)] = true;
                stats_.probes++;
            }
        }

        while (count < max) {
            if (discard_initial_after_ack_ && !ack_[0].ack_due(now)) {
                discard_initial();
            }
            if (initial_sendable() && has_work(PacketSpace::Initial, now)) {
                if (!build_packet(PacketSpace::Initial, now, out[count])) break;
                count++;
            } else if (app_ready() && has_work(PacketSpace::Application, now)) {
                if (!build_packet(PacketSpace::Application, now, out[count])) break;
                count++;
            } else {
                break;
            }
        }
        return count;
    }

    // ========================================================================
    // Streams
    // ========================================================================

    StreamStatus open_stream(uint64_t id) {
        if (state_ != ConnectionState::Established) {
            return StreamStatus::NotEstablished;
        }
        return find_or_open(id, false) ? StreamStatus::Ok : StreamStatus::InvalidStream;
    }

    /**
     * Queue bytes on a stream
     *
     * accepted = min(len, stream credit, connection credit). Zero credit
     * yields WouldBlock and schedules a BLOCKED frame.
     */
    StreamStatus write_stream(uint64_t id, const uint8_t* data, size_t len, size_t* accepted) {
        *accepted = 0;
        if (state_ != ConnectionState::Established) {
            return StreamStatus::NotEstablished;
        }
        QuicStream* st = find_or_open(id, false);
        if (!st) {
            return StreamStatus::InvalidStream;
        }
        if (st->fin_queued()) {
            return StreamStatus::StreamClosed;
        }
        if (len == 0) {
            return StreamStatus::Ok;
        }

        uint64_t credit = std::min(st->credit().available(), conn_credit_.available());
        size_t n = (len < credit) ? len : static_cast<size_t>(credit);
        if (n == 0) {
            if (st->credit().should_signal_blocked()) {
                st->blocked_pending = true;
                st->credit().mark_blocked_signalled();
            }
            if (conn_credit_.should_signal_blocked()) {
                data_blocked_pending_ = true;
                conn_credit_.mark_blocked_signalled();
            }
            stats_.write_blocked++;
            return StreamStatus::WouldBlock;
        }

        st->queue_send(data, n);
        st->credit().consume(n);
        conn_credit_.consume(n);
        *accepted = n;
        return StreamStatus::Ok;
    }

    // Bytes write_stream() would accept right now on id
    size_t send_capacity(uint64_t id) {
        if (state_ != ConnectionState::Established) return 0;
        QuicStream* st = find_or_open(id, false);
        if (!st || st->fin_queued()) return 0;
        return static_cast<size_t>(std::min(st->credit().available(), conn_credit_.available()));
    }

    StreamStatus finish_stream(uint64_t id) {
        if (state_ != ConnectionState::Established) {
            return StreamStatus::NotEstablished;
        }
        QuicStream* st = find_or_open(id, false);
        if (!st) {
            return StreamStatus::InvalidStream;
        }
        st->finish();
        return StreamStatus::Ok;
    }

    StreamStatus read_stream(uint64_t id, uint8_t* buf, size_t cap, size_t* n) {
        *n = 0;
        if (!is_bidirectional(id)) {
            return StreamStatus::InvalidStream;
        }
        auto it = streams_.find(id);
        if (it == streams_.end()) {
            return StreamStatus::NoData;
        }
        QuicStream& st = it->second;
        size_t got = st.read(buf, cap);
        if (got == 0) {
            return StreamStatus::NoData;
        }
        *n = got;
        conn_window_.on_consumed(got);
        if (st.window().should_update()) {
            st.window().advance();
            st.max_stream_data_pending = true;
        }
        if (conn_window_.should_update()) {
            conn_window_.advance();
            max_data_pending_ = true;
        }
        return StreamStatus::Ok;
    }

    // ========================================================================
    // Close
    // ========================================================================

    // Application close: CONNECTION_CLOSE then drain for 3 x PTO
    void close(uint64_t now, uint64_t error_code = error::NO_ERROR) {
        if (state_ == ConnectionState::Closing || state_ == ConnectionState::Closed) {
            return;
        }
        if (state_ == ConnectionState::Initial) {
            state_ = ConnectionState::Closed;
            close_info_ = {CloseReason::LocalClose, error_code, false};
            return;
        }
        build_close_packet(error_code, 0);
        state_ = ConnectionState::Closing;
        drain_deadline_ = now + 3 * loss_.pto_duration(PacketSpace::Application);
        close_info_ = {CloseReason::LocalClose, error_code, false};
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    ConnectionState state() const { return state_; }
    bool is_established() const { return state_ == ConnectionState::Established; }
    Role role() const { return role_; }
    const CloseInfo& close_info() const { return close_info_; }
    const stack::Endpoint& peer() const { return peer_; }
    const ConnectionId& local_cid() const { return local_cid_; }
    const ConnectionId& peer_cid() const { return peer_cid_; }
    const ConnectionStats& stats() const { return stats_; }
    const LossStats& loss_stats() const { return loss_.stats(); }
    const RttEstimator& rtt() const { return loss_.rtt(); }
    bool initial_discarded() const { return initial_discarded_; }
    const Handshake& handshake() const { return hs_; }
    size_t stream_count() const { return streams_.size(); }
    uint64_t created_at() const { return created_at_; }

    const QuicStream* stream(uint64_t id) const {
        auto it = streams_.find(id);
        return it == streams_.end() ? nullptr : &it->second;
    }

    const SendCredit& connection_credit() const { return conn_credit_; }
    const ReceiveWindow& connection_window() const { return conn_window_; }

private:
    static std::shared_ptr<TlsContext> make_tls(Role role, const ConnectionConfig& c) {
        TlsOptions options;
        options.alpn = c.alpn;
        return TlsContext::create(role, options);
    }

    static TransportParams make_local_params(const ConnectionConfig& c) {
        TransportParams p;
        p.max_idle_timeout_ms = c.idle_timeout_ms;
        p.max_udp_payload_size = MAX_DATAGRAM_SIZE;
        p.initial_max_data = c.max_data;
        p.initial_max_stream_data_bidi_local = c.max_stream_data;
        p.initial_max_stream_data_bidi_remote = c.max_stream_data;
        p.initial_max_streams_bidi = c.max_streams_bidi;
        p.ack_delay_exponent = 0;
        p.max_ack_delay_ms = c.ack_delay_us / 1000;
        return p;
    }

    static void copy_datagram(const Datagram& from, Datagram& to) {
        memcpy(to.bytes, from.bytes, from.len);
        to.len = from.len;
        to.peer = from.peer;
    }

    // ------------------------------------------------------------------------
    // Packet processing
    // ------------------------------------------------------------------------

    void process_packet(const uint8_t* pkt, const PacketHeader& hdr, size_t datagram_len,
                        uint64_t now, StreamEvents& ev) {
        PacketSpace space = hdr.space();
        size_t s = space_index(space);

        if (hdr.is_long && hdr.version != QUIC_VERSION) {
            stats_.undecodable++;
            return;
        }

        bool accepting = false;
        if (role_ == Role::Server && state_ == ConnectionState::Initial) {
            // Only a padded client Initial may create server state
            if (!hdr.is_long || datagram_len < MIN_INITIAL_DATAGRAM || hdr.dcid.len < CID_LEN) {
                stats_.undecodable++;
                return;
            }
            if (!accept(hdr)) {
                return;
            }
            accepting = true;
        }

        AeadKey& key = (space == PacketSpace::Initial) ? initial_recv_ : app_recv_;
        if ((space == PacketSpace::Initial && initial_discarded_) || !key.installed()) {
            stats_.no_keys++;
            AB_DEBUG_LOG("[QUIC] Drop: no %s keys\n", hdr.is_long ? "Initial" : "1-RTT");
            return;
        }

        bool cid_ok = (hdr.dcid == local_cid_) ||
                      (role_ == Role::Server && hdr.is_long && hdr.dcid == original_dcid_);
        if (!cid_ok) {
            stats_.unknown_cid++;
            return;
        }

        uint64_t pn = decode_packet_number(ack_[s].largest(), hdr.packet_number);
        size_t plain_len = 0;
        if (!open_packet(pkt, hdr, pn, key, rx_plain_, sizeof(rx_plain_), &plain_len)) {
            stats_.decrypt_failures++;
            AB_DEBUG_LOG("[QUIC] Drop: decrypt failure pn=%lu\n", pn);
            if (accepting) {
                reset_to_listening();
            }
            return;
        }
        if (ack_[s].is_duplicate(pn)) {
            stats_.duplicates++;
            return;
        }

        if (role_ == Role::Client && hdr.is_long && !peer_cid_learned_) {
            peer_cid_ = hdr.scid;
            peer_cid_learned_ = true;
        }

        stats_.packets_received++;
        stats_.bytes_received += hdr.packet_len;
        last_activity_ = now;

        bool ack_eliciting = false;
        if (!process_frames(space, rx_plain_, plain_len, now, ev, &ack_eliciting)) {
            return;
        }
        // Closing packets are not acknowledged
        if (state_ == ConnectionState::Closing || state_ == ConnectionState::Closed) {
            return;
        }
        if (!(space == PacketSpace::Initial && initial_discarded_)) {
            ack_[s].on_packet_received(pn, ack_eliciting, now);
        }

        // The server only sends 1-RTT packets once it has our Finished
        if (role_ == Role::Client && space == PacketSpace::Application && !initial_discarded_) {
            discard_initial();
        }
    }

    // Server: adopt the client's first Initial
    bool accept(const PacketHeader& hdr) {
        original_dcid_ = hdr.dcid;
        peer_cid_ = hdr.scid;
        peer_cid_learned_ = true;
        if (!random_connection_id(&local_cid_)) {
            return false;
        }
        PacketKeys client_keys, server_keys;
        if (!derive_initial_keys(original_dcid_, &client_keys, &server_keys)) {
            return false;
        }
        initial_send_.install(server_keys, true);
        initial_recv_.install(client_keys, false);
        state_ = ConnectionState::Handshaking;
        handshake_start_ = last_activity_;
        return true;
    }

    void reset_to_listening() {
        initial_send_.reset();
        initial_recv_.reset();
        state_ = ConnectionState::Initial;
        peer_cid_learned_ = false;
        peer_cid_ = ConnectionId();
        original_dcid_ = ConnectionId();
    }

    static bool allowed_in_initial(uint64_t type) {
        return type == frame_type::PADDING || type == frame_type::PING ||
               type == frame_type::ACK || type == frame_type::ACK_ECN ||
               type == frame_type::CRYPTO || type == frame_type::CONNECTION_CLOSE;
    }

    // @return false once the connection left the open states
    bool process_frames(PacketSpace space, const uint8_t* buf, size_t len, uint64_t now,
                        StreamEvents& ev, bool* ack_eliciting) {
        if (len == 0) {
            close_with_error(error::PROTOCOL_VIOLATION, 0, CloseReason::ProtocolError, ev);
            return false;
        }

        BufferReader r(buf, len);
        while (!r.empty()) {
            Frame& f = frame_scratch_;
            if (!parse_frame(r, &f)) {
                close_with_error(error::FRAME_ENCODING_ERROR, f.type, CloseReason::ProtocolError, ev);
                return false;
            }
            if (f.ack_eliciting()) {
                *ack_eliciting = true;
            }
            if (space == PacketSpace::Initial && !allowed_in_initial(f.type)) {
                close_with_error(error::PROTOCOL_VIOLATION, f.type, CloseReason::ProtocolError, ev);
                return false;
            }

            if (f.is_stream()) {
                on_stream_frame(f, ev);
            } else {
                switch (f.type) {
                    case frame_type::PADDING:
                    case frame_type::PING:
                        break;
                    case frame_type::ACK:
                    case frame_type::ACK_ECN:
                        on_ack_frame(space, f, now, ev);
                        break;
                    case frame_type::CRYPTO:
                        on_crypto_frame(f.crypto, ev);
                        break;
                    case frame_type::MAX_DATA:
                        conn_credit_.update_limit(f.value);
                        break;
                    case frame_type::MAX_STREAM_DATA:
                        on_max_stream_data(f, ev);
                        break;
                    case frame_type::DATA_BLOCKED:
                    case frame_type::STREAM_DATA_BLOCKED:
                        stats_.peer_blocked++;
                        break;
                    case frame_type::CONNECTION_CLOSE:
                    case frame_type::CONNECTION_CLOSE_APP:
                        if (state_ == ConnectionState::Handshaking) {
                            // Peer rejected the handshake
                            enter_closed(CloseReason::PeerClosed, f.close.error_code, true);
                        } else {
                            enter_draining(f.close.error_code, now);
                        }
                        ev.connection_closed = true;
                        break;
                    case frame_type::HANDSHAKE_DONE:
                        if (role_ == Role::Server) {
                            close_with_error(error::PROTOCOL_VIOLATION, f.type,
                                             CloseReason::ProtocolError, ev);
                        } else if (!initial_discarded_) {
                            discard_initial();
                        }
                        break;
                    default:
                        close_with_error(error::FRAME_ENCODING_ERROR, f.type,
                                         CloseReason::ProtocolError, ev);
                        break;
                }
            }

            if (state_ == ConnectionState::Closing || state_ == ConnectionState::Closed) {
                return false;
            }
        }
        return true;
    }

    void on_ack_frame(PacketSpace space, const Frame& f, uint64_t now, StreamEvents& ev) {
        size_t s = space_index(space);
        if (f.ack.range_count == 0 || f.ack.largest() >= next_pn_[s]) {
            close_with_error(error::PROTOCOL_VIOLATION, f.type, CloseReason::ProtocolError, ev);
            return;
        }
        loss_.on_ack_received(space, f.ack, now, handshake_confirmed(), &lost_scratch_);
        requeue_lost();
    }

    void on_crypto_frame(const CryptoFrame& c, StreamEvents& ev) {
        uint64_t end = c.offset + c.len;
        if (end <= crypto_recv_next_) {
            return;
        }
        if (end - crypto_recv_next_ > MAX_CRYPTO_BUFFER) {
            close_with_error(error::PROTOCOL_VIOLATION, frame_type::CRYPTO,
                             CloseReason::ProtocolError, ev);
            return;
        }
        if (c.offset > crypto_recv_next_) {
            std::vector<uint8_t>& slot = crypto_ooo_[c.offset];
            if (slot.size() < c.len) {
                slot.assign(c.data, c.data + c.len);
            }
            return;
        }

        size_t skip = static_cast<size_t>(crypto_recv_next_ - c.offset);
        crypto_recv_next_ = end;
        if (!feed_handshake(c.data + skip, c.len - skip, ev)) {
            return;
        }

        auto it = crypto_ooo_.begin();
        while (it != crypto_ooo_.end() && it->first <= crypto_recv_next_) {
            uint64_t seg_end = it->first + it->second.size();
            if (seg_end > crypto_recv_next_) {
                size_t off = static_cast<size_t>(crypto_recv_next_ - it->first);
                std::vector<uint8_t> seg = std::move(it->second);
                it = crypto_ooo_.erase(it);
                crypto_recv_next_ = seg_end;
                if (!feed_handshake(seg.data() + off, seg.size() - off, ev)) {
                    return;
                }
                it = crypto_ooo_.begin();
            } else {
                it = crypto_ooo_.erase(it);
            }
        }
    }

    bool feed_handshake(const uint8_t* data, size_t len, StreamEvents& ev) {
        HandshakeStatus st = hs_.on_crypto_data(data, len, &crypto_send_buf_);

        switch (st) {
            case HandshakeStatus::Failed:
                fprintf(stderr, "[QUIC] TLS handshake failed (alert %lu): %s\n",
                        static_cast<unsigned long>(hs_.alert()), hs_.error().c_str());
                close_with_error(error::CRYPTO_ERROR_BASE + hs_.alert(), frame_type::CRYPTO,
                                 CloseReason::HandshakeFailed, ev);
                return false;
            case HandshakeStatus::KeysReady:
                if (!app_send_.installed()) {
                    install_app_keys();
                    if (role_ == Role::Client) {
                        state_ = ConnectionState::Established;
                        ev.handshake_completed = true;
                    }
                }
                return true;
            case HandshakeStatus::Complete:
                if (!app_send_.installed()) {
                    install_app_keys();
                }
                if (state_ != ConnectionState::Established) {
                    state_ = ConnectionState::Established;
                    ev.handshake_completed = true;
                    handshake_done_pending_ = true;
                    discard_initial_after_ack_ = true;
                }
                return true;
            case HandshakeStatus::InProgress:
                return true;
        }
        return true;
    }

    void install_app_keys() {
        app_send_.install(hs_.send_keys(), true);
        app_recv_.install(hs_.recv_keys(), false);

        const TransportParams& peer = hs_.peer_params();
        conn_credit_.update_limit(peer.initial_max_data);
        peer_max_streams_ = peer.initial_max_streams_bidi;
        loss_.rtt().set_max_ack_delay(peer.max_ack_delay_ms * 1000000ULL);
    }

    void on_stream_frame(const Frame& f, StreamEvents& ev) {
        const StreamFrame& sf = f.stream;
        QuicStream* st = nullptr;
        auto it = streams_.find(sf.stream_id);
        if (it != streams_.end()) {
            st = &it->second;
        } else {
            if (!is_bidirectional(sf.stream_id) || locally_initiated(sf.stream_id)) {
                close_with_error(error::STREAM_STATE_ERROR, f.type, CloseReason::ProtocolError, ev);
                return;
            }
            st = find_or_open(sf.stream_id, true);
            if (!st) {
                close_with_error(error::STREAM_LIMIT_ERROR, f.type, CloseReason::ProtocolError, ev);
                return;
            }
        }

        uint64_t delta = 0;
        bool readable = false;
        StreamFrameResult res = st->on_frame(sf.offset, sf.data, sf.len, sf.fin, &delta, &readable);
        if (res == StreamFrameResult::FlowControlError) {
            close_with_error(error::FLOW_CONTROL_ERROR, f.type, CloseReason::ProtocolError, ev);
            return;
        }
        if (res == StreamFrameResult::FinalSizeError) {
            close_with_error(error::FINAL_SIZE_ERROR, f.type, CloseReason::ProtocolError, ev);
            return;
        }
        if (!conn_window_.on_received_delta(delta)) {
            close_with_error(error::FLOW_CONTROL_ERROR, f.type, CloseReason::ProtocolError, ev);
            return;
        }
        stats_.stream_bytes_received += sf.len;
        if (readable) {
            ev.add_readable(sf.stream_id);
        }
    }

    void on_max_stream_data(const Frame& f, StreamEvents& ev) {
        auto it = streams_.find(f.stream_id);
        if (it != streams_.end()) {
            it->second.credit().update_limit(f.value);
            return;
        }
        QuicStream* st = locally_initiated(f.stream_id) ? nullptr : find_or_open(f.stream_id, true);
        if (!st) {
            close_with_error(error::STREAM_STATE_ERROR, f.type, CloseReason::ProtocolError, ev);
            return;
        }
        st->credit().update_limit(f.value);
    }

    // ------------------------------------------------------------------------
    // Streams
    // ------------------------------------------------------------------------

    bool locally_initiated(uint64_t id) const {
        return is_client_initiated(id) == (role_ == Role::Client);
    }

    QuicStream* find_or_open(uint64_t id, bool by_peer) {
        auto it = streams_.find(id);
        if (it != streams_.end()) {
            return &it->second;
        }
        if (!is_bidirectional(id)) {
            return nullptr;
        }
        bool local = locally_initiated(id);
        if (local == by_peer) {
            return nullptr;
        }
        uint64_t index = stream_index(id);
        if (local && index >= peer_max_streams_) {
            return nullptr;
        }
        if (!local && index >= config_.max_streams_bidi) {
            return nullptr;
        }
        const TransportParams& peer = hs_.peer_params();
        uint64_t send_limit = local ? peer.initial_max_stream_data_bidi_remote
                                    : peer.initial_max_stream_data_bidi_local;
        auto res = streams_.emplace(std::piecewise_construct, std::forward_as_tuple(id),
                                    std::forward_as_tuple(id, send_limit, config_.max_stream_data));
        return &res.first->second;
    }

    // ------------------------------------------------------------------------
    // State transitions
    // ------------------------------------------------------------------------

    bool handshake_confirmed() const {
        return role_ == Role::Client ? initial_discarded_ : state_ == ConnectionState::Established;
    }

    // 1-RTT packets may be sent
    bool app_ready() const {
        return app_send_.installed() &&
               (role_ == Role::Client || state_ == ConnectionState::Established);
    }

    bool initial_sendable() const {
        return !initial_discarded_ && initial_send_.installed();
    }

    uint64_t idle_timeout_ns() const {
        uint64_t local = config_.idle_timeout_ms;
        uint64_t peer = hs_.keys_ready() ? hs_.peer_params().max_idle_timeout_ms : 0;
        uint64_t ms = local;
        if (peer != 0 && (ms == 0 || peer < ms)) {
            ms = peer;
        }
        return ms * 1000000ULL;
    }

    void enter_closed(CloseReason reason, uint64_t code, bool retryable) {
        state_ = ConnectionState::Closed;
        close_info_ = {reason, code, retryable};
    }

    void enter_draining(uint64_t code, uint64_t now) {
        state_ = ConnectionState::Closing;
        drain_deadline_ = now + 3 * loss_.pto_duration(PacketSpace::Application);
        close_info_ = {CloseReason::PeerClosed, code, true};
    }

    // Fatal error: tell the peer, then Closed at once
    void close_with_error(uint64_t code, uint64_t frame, CloseReason reason, StreamEvents& ev) {
        build_close_packet(code, frame);
        enter_closed(reason, code, true);
        ev.connection_closed = true;
    }

    void build_close_packet(uint64_t code, uint64_t frame) {
        PacketSpace space;
        if (app_ready()) {
            space = PacketSpace::Application;
        } else if (initial_sendable()) {
            space = PacketSpace::Initial;
        } else {
            return;
        }

        PacketHeader hdr;
        hdr.is_long = (space == PacketSpace::Initial);
        hdr.dcid = peer_cid_;
        hdr.scid = local_cid_;
        hdr.packet_number = next_pn_[space_index(space)];
        size_t header_len = hdr.is_long ? long_header_len(peer_cid_, local_cid_) : short_header_len();

        BufferWriter w(tx_plain_, max_plaintext(header_len));
        if (!write_connection_close(w, code, frame, "", 0)) {
            return;
        }
        pad_client_initial(space, header_len, w);

        AeadKey& key = (space == PacketSpace::Initial) ? initial_send_ : app_send_;
        size_t n = seal_packet(hdr, tx_plain_, w.position(), key, pending_close_.bytes,
                               sizeof(pending_close_.bytes));
        if (n == 0) {
            stats_.seal_failures++;
            return;
        }
        next_pn_[space_index(space)]++;
        pending_close_.len = n;
        pending_close_.peer = peer_;
        has_pending_close_ = true;
    }

    void discard_initial() {
        initial_discarded_ = true;
        discard_initial_after_ack_ = false;
        initial_send_.reset();
        initial_recv_.reset();
        loss_.discard_space(PacketSpace::Initial);
        retransmit_[0].clear();
        ping_pending_[0] = false;
        ack_[0].reset();
        crypto_ooo_.clear();
    }

    // ------------------------------------------------------------------------
    // Packet building
    // ------------------------------------------------------------------------

    bool control_pending() const {
        if (handshake_done_pending_ || max_data_pending_ || data_blocked_pending_) {
            return true;
        }
        for (const auto& kv : streams_) {
            if (kv.second.max_stream_data_pending || kv.second.blocked_pending) return true;
        }
        return false;
    }

    bool stream_data_pending() const {
        for (const auto& kv : streams_) {
            if (kv.second.has_pending_send()) return true;
        }
        return false;
    }

    bool has_work(PacketSpace space, uint64_t now) const {
        size_t s = space_index(space);
        if (ack_[s].ack_due(now) || !retransmit_[s].empty() || ping_pending_[s]) {
            return true;
        }
        if (space == PacketSpace::Initial) {
            return crypto_send_next_ < crypto_send_buf_.size();
        }
        return control_pending() || stream_data_pending();
    }

    void pad_client_initial(PacketSpace space, size_t header_len, BufferWriter& w) {
        if (space != PacketSpace::Initial || role_ != Role::Client) {
            return;
        }
        size_t target = MIN_INITIAL_DATAGRAM - header_len - AEAD_TAG_LEN;
        if (w.position() < target) {
            write_padding(w, target - w.position());
        }
    }

    static size_t sent_frame_size(const SentFrame& f) {
        if (f.kind == SentFrameKind::Crypto) {
            return crypto_frame_overhead(f.offset, f.data.size()) + f.data.size();
        }
        return stream_frame_overhead(f.stream_id, f.offset, f.data.size()) + f.data.size();
    }

    static bool write_sent_frame(BufferWriter& w, const SentFrame& f) {
        if (f.kind == SentFrameKind::Crypto) {
            return write_crypto(w, f.offset, f.data.data(), f.data.size());
        }
        return quic::write_stream(w, f.stream_id, f.offset, f.data.data(), f.data.size(), f.fin);
    }

    // Room for the largest fixed-size control frame
    static constexpr size_t CONTROL_FRAME_MAX = 1 + 8 + 8;

    bool build_packet(PacketSpace space, uint64_t now, Datagram& dg) {
        size_t s = space_index(space);
        PacketHeader hdr;
        hdr.is_long = (space == PacketSpace::Initial);
        hdr.dcid = peer_cid_;
        hdr.scid = local_cid_;
        hdr.packet_number = next_pn_[s];
        size_t header_len = hdr.is_long ? long_header_len(peer_cid_, local_cid_) : short_header_len();

        BufferWriter w(tx_plain_, max_plaintext(header_len));
        SentPacket sp;
        bool eliciting = false;

        // ACK first, piggybacked whenever anything is unacknowledged
        if (ack_[s].ack_deadline() != 0 && ack_[s].has_ranges()) {
            ack_[s].build(&ack_scratch_, now);
            if (write_ack(w, ack_scratch_)) {
                ack_[s].on_ack_sent();
                stats_.acks_sent++;
            }
        }

        if (space == PacketSpace::Application) {
            write_control_frames(w, sp, eliciting);
        }

        // Lost frames before new data
        auto& rq = retransmit_[s];
        while (!rq.empty()) {
            SentFrame& f = rq.front();
            if (sent_frame_size(f) > w.remaining()) {
                if (w.position() == 0) {
                    rq.pop_front();   // Cannot fit any packet; never happens for frames we built
                    continue;
                }
                break;
            }
            write_sent_frame(w, f);
            sp.frames.push_back(std::move(f));
            rq.pop_front();
            eliciting = true;
        }

        if (space == PacketSpace::Initial) {
            while (crypto_send_next_ < crypto_send_buf_.size()) {
                size_t pending = crypto_send_buf_.size() - crypto_send_next_;
                size_t overhead = crypto_frame_overhead(crypto_send_next_, MAX_DATAGRAM_SIZE);
                if (w.remaining() <= overhead) break;
                size_t n = std::min(pending, w.remaining() - overhead);
                const uint8_t* d = crypto_send_buf_.data() + crypto_send_next_;
                write_crypto(w, crypto_send_next_, d, n);
                SentFrame f;
                f.kind = SentFrameKind::Crypto;
                f.offset = crypto_send_next_;
                f.data.assign(d, d + n);
                sp.frames.push_back(std::move(f));
                crypto_send_next_ += n;
                eliciting = true;
            }
        } else {
            pack_stream_data(w, sp, eliciting);
        }

        if (ping_pending_[s]) {
            if (!eliciting && write_ping(w)) {
                SentFrame f;
                f.kind = SentFrameKind::Ping;
                sp.frames.push_back(std::move(f));
                eliciting = true;
            }
            ping_pending_[s] = false;
        }

        if (w.position() == 0) {
            return false;
        }
        pad_client_initial(space, header_len, w);

        AeadKey& key = (space == PacketSpace::Initial) ? initial_send_ : app_send_;
        size_t n = seal_packet(hdr, tx_plain_, w.position(), key, dg.bytes, sizeof(dg.bytes));
        if (n == 0) {
            stats_.seal_failures++;
            lost_scratch_.insert(lost_scratch_.end(), std::make_move_iterator(sp.frames.begin()),
                                 std::make_move_iterator(sp.frames.end()));
            requeue_lost();
            return false;
        }
        dg.len = n;
        dg.peer = peer_;

        stats_.packets_sent++;
        stats_.bytes_sent += n;
        if (eliciting) {
            last_eliciting_sent_ = now;
            sp.packet_number = next_pn_[s];
            sp.time_sent = now;
            sp.bytes = n;
            loss_.on_packet_sent(space, std::move(sp));
        }
        next_pn_[s]++;
        return true;
    }

    void write_control_frames(BufferWriter& w, SentPacket& sp, bool& eliciting) {
        if (handshake_done_pending_ && w.remaining() > CONTROL_FRAME_MAX && write_handshake_done(w)) {
            handshake_done_pending_ = false;
            push_control(sp, SentFrameKind::HandshakeDone, 0);
            eliciting = true;
        }
        if (max_data_pending_ && w.remaining() > CONTROL_FRAME_MAX &&
            write_max_data(w, conn_window_.limit())) {
            max_data_pending_ = false;
            push_control(sp, SentFrameKind::MaxData, 0);
            eliciting = true;
        }
        if (data_blocked_pending_ && w.remaining() > CONTROL_FRAME_MAX &&
            write_data_blocked(w, conn_credit_.limit())) {
            data_blocked_pending_ = false;
            push_control(sp, SentFrameKind::DataBlocked, 0);
            eliciting = true;
        }
        for (auto& kv : streams_) {
            QuicStream& st = kv.second;
            if (w.remaining() <= 2 * CONTROL_FRAME_MAX) break;
            if (st.max_stream_data_pending && write_max_stream_data(w, st.id(), st.window().limit())) {
                st.max_stream_data_pending = false;
                push_control(sp, SentFrameKind::MaxStreamData, st.id());
                eliciting = true;
            }
            if (st.blocked_pending && write_stream_data_blocked(w, st.id(), st.credit().limit())) {
                st.blocked_pending = false;
                push_control(sp, SentFrameKind::StreamDataBlocked, st.id());
                eliciting = true;
            }
        }
    }

    static void push_control(SentPacket& sp, SentFrameKind kind, uint64_t stream_id) {
        SentFrame f;
        f.kind = kind;
        f.stream_id = stream_id;
        sp.frames.push_back(std::move(f));
    }

    // Round-robin over streams with unsent data, starting after the last served
    void pack_stream_data(BufferWriter& w, SentPacket& sp, bool& eliciting) {
        if (streams_.empty()) {
            return;
        }
        auto it = streams_.upper_bound(last_stream_served_);
        for (size_t visited = 0; visited < streams_.size(); visited++) {
            if (it == streams_.end()) {
                it = streams_.begin();
            }
            QuicStream& st = it->second;
            ++it;
            if (!st.has_pending_send()) {
                continue;
            }
            // 2-byte length varint covers any chunk that fits a datagram
            size_t overhead = 1 + varint_size(st.id()) +
                              (st.send_offset() ? varint_size(st.send_offset()) : 0) + 2;
            if (w.remaining() <= overhead) {
                break;
            }
            uint64_t offset;
            const uint8_t* data;
            bool fin;
            size_t n = st.peek_send(w.remaining() - overhead, &offset, &data, &fin);
            if (n == 0 && !fin) {
                continue;
            }
            quic::write_stream(w, st.id(), offset, data, n, fin);

            SentFrame f;
            f.kind = SentFrameKind::Stream;
            f.stream_id = st.id();
            f.offset = offset;
            f.fin = fin;
            f.data.assign(data, data + n);
            sp.frames.push_back(std::move(f));

            st.mark_sent(n, fin);
            stats_.stream_bytes_sent += n;
            last_stream_served_ = st.id();
            eliciting = true;
        }
    }

    void requeue_lost() {
        for (SentFrame& f : lost_scratch_) {
            stats_.frames_requeued++;
            switch (f.kind) {
                case SentFrameKind::Crypto:
                    if (!initial_discarded_) {
                        retransmit_[0].push_back(std::move(f));
                    }
                    break;
                case SentFrameKind::Stream:
                    retransmit_[1].push_back(std::move(f));
                    break;
                case SentFrameKind::MaxData:
                    max_data_pending_ = true;
                    break;
                case SentFrameKind::MaxStreamData: {
                    auto it = streams_.find(f.stream_id);
                    if (it != streams_.end()) it->second.max_stream_data_pending = true;
                    break;
                }
                case SentFrameKind::DataBlocked:
                    if (conn_credit_.available() == 0) data_blocked_pending_ = true;
                    break;
                case SentFrameKind::StreamDataBlocked: {
                    auto it = streams_.find(f.stream_id);
                    if (it != streams_.end() && it->second.credit().available() == 0) {
                        it->second.blocked_pending = true;
                    }
                    break;
                }
                case SentFrameKind::HandshakeDone:
                    handshake_done_pending_ = true;
                    break;
                case SentFrameKind::Ping:
                    break;
            }
        }
        lost_scratch_.clear();
    }

    Role role_;
    ConnectionConfig config_;
    stack::Endpoint peer_;
    ConnectionState state_ = ConnectionState::Initial;
    CloseInfo close_info_;

    ConnectionId local_cid_;
    ConnectionId peer_cid_;
    ConnectionId original_dcid_;
    bool peer_cid_learned_ = false;

    AeadKey initial_send_;
    AeadKey initial_recv_;
    AeadKey app_send_;
    AeadKey app_recv_;
    bool initial_discarded_ = false;
    bool discard_initial_after_ack_ = false;

    Handshake hs_;
    std::vector<uint8_t> crypto_send_buf_;      // Whole outbound CRYPTO stream
    size_t crypto_send_next_ = 0;
    uint64_t crypto_recv_next_ = 0;
    std::map<uint64_t, std::vector<uint8_t>> crypto_ooo_;

    uint64_t next_pn_[PACKET_SPACE_COUNT];
    AckTracker ack_[PACKET_SPACE_COUNT];
    LossDetector loss_;
    std::deque<SentFrame> retransmit_[PACKET_SPACE_COUNT];
    bool ping_pending_[PACKET_SPACE_COUNT];
    std::vector<SentFrame> lost_scratch_;

    std::map<uint64_t, QuicStream> streams_;
    uint64_t last_stream_served_ = UINT64_MAX;
    uint64_t peer_max_streams_ = 0;

    SendCredit conn_credit_;
    ReceiveWindow conn_window_;
    bool max_data_pending_ = false;
    bool data_blocked_pending_ = false;
    bool handshake_done_pending_ = false;

    uint64_t created_at_;
    uint64_t handshake_start_ = 0;
    uint64_t last_activity_;
    uint64_t last_eliciting_sent_;
    uint64_t drain_deadline_ = 0;

    Datagram pending_close_;
    bool has_pending_close_ = false;

    Frame frame_scratch_;
    AckFrame ack_scratch_;
    uint8_t rx_plain_[MAX_DATAGRAM_SIZE];
    uint8_t tx_plain_[MAX_DATAGRAM_SIZE];

    ConnectionStats stats_;
};

} // namespace afterburner::quic
