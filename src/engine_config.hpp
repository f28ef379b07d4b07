// src/engine_config.hpp
// EngineConfig - every runtime knob of the data plane in one place
//
// Defaults come from the constructor; apply_env() overrides a subset from
// AB_* environment variables; validate() rejects inconsistent geometry
// before anything is mapped or attached.

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <string>
#include <stdexcept>

#include "pipeline/pipeline_config.hpp"
#include "stack/stack_types.hpp"

namespace afterburner {

struct EngineConfig {
    // Socket / NIC
    std::string interface;            // Network interface (e.g., "eth0")
    uint32_t queue_id;                // RX/TX queue the socket binds to
    bool zero_copy;                   // XDP_ZEROCOPY, falls back to XDP_COPY
    uint32_t busy_poll_usec;          // SO_BUSY_POLL
    uint32_t busy_poll_budget;        // SO_BUSY_POLL_BUDGET
    std::string bpf_object;           // Path to service_filter.bpf.o

    // Arena and rings
    uint32_t frame_size;
    size_t arena_size;
    uint32_t ring_capacity;           // All four rings
    uint32_t fill_target;             // Frames kept posted for RX
    uint32_t rx_batch;

    // Addressing
    uint16_t service_port;            // UDP port the classifier redirects
    stack::Endpoint local;
    stack::Endpoint peer;             // Client: server address. Server: learned.

    // Transport
    std::string alpn;
    uint32_t ack_delay_us;
    uint64_t max_data;                // Connection flow-control window
    uint64_t max_stream_data;         // Per-stream window
    uint64_t max_streams_bidi;
    uint32_t idle_timeout_ms;
    uint32_t handshake_timeout_ms;

    // Identity (TLS 1.3)
    std::string cert_file;            // Server PEM chain; empty = self-issued at startup
    std::string key_file;             // Server PEM private key
    std::string peer_cert_sha256;     // Client pin, lowercase hex; empty = accept any

    // Event loop
    uint32_t max_pending_egress;
    uint64_t flood_interval_ns;
    uint32_t max_payload;
    uint64_t probe_deadline_ns;
    uint64_t report_interval_ns;
    uint32_t max_exhausted_iterations;
    uint32_t max_echo_pending;        // Replies buffered per stream while flow-blocked

    // Client reconnection (bounded exponential backoff)
    uint32_t reconnect_base_ms;
    uint32_t reconnect_max_ms;
    uint32_t reconnect_max_attempts;  // 0 = unbounded

    int cpu_core;                     // -1 = do not pin

    EngineConfig()
        : interface("eth0")
        , queue_id(0)
        , zero_copy(true)
        , busy_poll_usec(50)
        , busy_poll_budget(64)
        , bpf_object("service_filter.bpf.o")
        , frame_size(pipeline::DEFAULT_FRAME_SIZE)
        , arena_size(pipeline::DEFAULT_ARENA_SIZE)
        , ring_capacity(pipeline::DEFAULT_RING_CAPACITY)
        , fill_target(pipeline::DEFAULT_FILL_TARGET)
        , rx_batch(pipeline::DEFAULT_RX_BATCH)
        , service_port(8003)
        , local()
        , peer()
        , alpn("solana-tpu")
        , ack_delay_us(0)                     // ACK every ack-eliciting packet at once
        , max_data(100000000)                 // ~100 MB, no stalls under burst
        , max_stream_data(10000000)           // 10 MB
        , max_streams_bidi(1000)
        , idle_timeout_ms(30000)
        , handshake_timeout_ms(2000)
        , max_pending_egress(256)
        , flood_interval_ns(10000)            // 10 us
        , max_payload(256)
        , probe_deadline_ns(1000000000ULL)    // 1 s
        , report_interval_ns(1000000000ULL)   // 1 s
        , max_exhausted_iterations(100000)
        , max_echo_pending(1024)
        , reconnect_base_ms(10)
        , reconnect_max_ms(1000)
        , reconnect_max_attempts(10)
        , cpu_core(-1)
    {
        local.port = service_port;
    }

    uint32_t frame_count() const {
        return frame_size ? static_cast<uint32_t>(arena_size / frame_size) : 0;
    }

    /**
     * Reject inconsistent values
     * @throws std::runtime_error describing the first problem found
     */
    void validate() const {
        if (!pipeline::is_power_of_two(frame_size) || frame_size < 2048) {
            fail("frame_size must be a power of 2 >= 2048");
        }
        if (arena_size == 0 || arena_size % frame_size != 0) {
            fail("arena_size must be a non-zero multiple of frame_size");
        }
        if (!pipeline::is_power_of_two(ring_capacity)) {
            fail("ring_capacity must be a power of 2");
        }
        if (pipeline::FRAME_HEADROOM + pipeline::L2_L4_HEADER_LEN + max_payload > frame_size) {
            fail("max_payload does not fit in a frame");
        }
        if (max_payload < 19) {
            fail("max_payload must hold at least the 19-byte probe header");
        }
        if (fill_target == 0 || fill_target > ring_capacity || fill_target >= frame_count()) {
            fail("fill_target must be in [1, ring_capacity] and leave frames for TX");
        }
        if (rx_batch == 0 || rx_batch > ring_capacity) {
            fail("rx_batch must be in [1, ring_capacity]");
        }
        if (service_port == 0) {
            fail("service_port must be non-zero");
        }
        if (local.port != service_port) {
            fail("local port must equal service_port (the classifier only redirects that port)");
        }
        if (alpn.empty() || alpn.size() > 255) {
            fail("alpn must be 1..255 bytes");
        }
        if (max_stream_data == 0 || max_data < max_stream_data) {
            fail("max_data must be >= max_stream_data > 0");
        }
        if (max_streams_bidi < 4) {
            fail("max_streams_bidi must allow streams 0, 4, 8 and 12");
        }
        if (cert_file.empty() != key_file.empty()) {
            fail("cert_file and key_file must be set together");
        }
        if (!peer_cert_sha256.empty()) {
            bool hex = peer_cert_sha256.size() == 64;
            for (char c : peer_cert_sha256) {
                hex = hex && ((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
            }
            if (!hex) {
                fail("peer_cert_sha256 must be 64 lowercase hex digits");
            }
        }
        if (max_pending_egress == 0) {
            fail("max_pending_egress must be non-zero");
        }
        if (max_echo_pending == 0) {
            fail("max_echo_pending must be non-zero");
        }
        if (reconnect_base_ms == 0 || reconnect_max_ms < reconnect_base_ms) {
            fail("reconnect backoff must satisfy 0 < base <= max");
        }
    }

    /**
     * Override selected fields from the environment
     *
     *   AB_INTERFACE      interface name
     *   AB_SERVICE_PORT   classifier / local UDP port
     *   AB_CPU_CORE       core to pin the loop thread to
     *   AB_BPF_OBJECT     path to the classifier object
     *   AB_LOCAL_IP, AB_LOCAL_MAC, AB_PEER_IP, AB_PEER_MAC, AB_PEER_PORT
     *   AB_CERT_FILE, AB_KEY_FILE   server certificate and key (PEM)
     *   AB_PEER_CERT_SHA256         client certificate pin
     *
     * @throws std::runtime_error on unparsable values
     */
    void apply_env() {
        if (const char* v = std::getenv("AB_INTERFACE")) {
            interface = v;
        }
        if (const char* v = std::getenv("AB_SERVICE_PORT")) {
            service_port = static_cast<uint16_t>(parse_uint(v, "AB_SERVICE_PORT", 65535));
            local.port = service_port;
        }
        if (const char* v = std::getenv("AB_CPU_CORE")) {
            cpu_core = static_cast<int>(parse_uint(v, "AB_CPU_CORE", 4095));
        }
        if (const char* v = std::getenv("AB_BPF_OBJECT")) {
            bpf_object = v;
        }
        if (const char* v = std::getenv("AB_LOCAL_IP")) {
            if (!stack::parse_ipv4(v, &local.ip)) fail(std::string("bad AB_LOCAL_IP: ") + v);
        }
        if (const char* v = std::getenv("AB_LOCAL_MAC")) {
            if (!stack::parse_mac(v, local.mac)) fail(std::string("bad AB_LOCAL_MAC: ") + v);
        }
        if (const char* v = std::getenv("AB_PEER_IP")) {
            if (!stack::parse_ipv4(v, &peer.ip)) fail(std::string("bad AB_PEER_IP: ") + v);
        }
        if (const char* v = std::getenv("AB_PEER_MAC")) {
            if (!stack::parse_mac(v, peer.mac)) fail(std::string("bad AB_PEER_MAC: ") + v);
        }
        if (const char* v = std::getenv("AB_PEER_PORT")) {
            peer.port = static_cast<uint16_t>(parse_uint(v, "AB_PEER_PORT", 65535));
        }
        if (const char* v = std::getenv("AB_CERT_FILE")) {
            cert_file = v;
        }
        if (const char* v = std::getenv("AB_KEY_FILE")) {
            key_file = v;
        }
        if (const char* v = std::getenv("AB_PEER_CERT_SHA256")) {
            peer_cert_sha256 = v;
            for (char& c : peer_cert_sha256) {
                if (c >= 'A' && c <= 'F') c = static_cast<char>(c - 'A' + 'a');
            }
        }
    }

    void print() const {
        char lip[32], pip[32];
        printf("[CONFIG] interface=%s queue=%u zero_copy=%d busy_poll=%uus/%u\n",
               interface.c_str(), queue_id, zero_copy ? 1 : 0, busy_poll_usec, busy_poll_budget);
        printf("[CONFIG] arena=%zu frame=%u frames=%u ring=%u fill_target=%u\n",
               arena_size, frame_size, frame_count(), ring_capacity, fill_target);
        printf("[CONFIG] local=%s:%u peer=%s:%u service_port=%u alpn=%s\n",
               stack::format_ipv4(local.ip, lip, sizeof(lip)), local.port,
               stack::format_ipv4(peer.ip, pip, sizeof(pip)), peer.port,
               service_port, alpn.c_str());
        printf("[CONFIG] ack_delay=%uus max_data=%lu max_stream_data=%lu max_streams=%lu idle=%ums\n",
               ack_delay_us, max_data, max_stream_data, max_streams_bidi, idle_timeout_ms);
        printf("[CONFIG] certificate=%s pin=%s\n",
               cert_file.empty() ? "self-issued" : cert_file.c_str(),
               peer_cert_sha256.empty() ? "none" : peer_cert_sha256.c_str());
    }

private:
    [[noreturn]] static void fail(const std::string& what) {
        throw std::runtime_error("EngineConfig: " + what);
    }

    static unsigned long parse_uint(const char* text, const char* name, unsigned long max) {
        errno = 0;
        char* end = nullptr;
        unsigned long v = std::strtoul(text, &end, 10);
        if (errno != 0 || end == text || *end != '\0' || v > max) {
            fail(std::string("bad ") + name + ": " + text);
        }
        return v;
    }
};

} // namespace afterburner
