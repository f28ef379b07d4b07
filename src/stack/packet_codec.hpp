// src/stack/packet_codec.hpp
// Ethernet / IPv4 / UDP codec around opaque transport payloads
//
// Entry point for the header layers. Decode validates lengths and checksums
// and hands back a payload view into the frame; encode writes all three
// headers in front of the payload in one pass.
//
// Layout of an encoded frame:
//   [Ethernet 14][IPv4 20][UDP 8][payload]

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>

#include "stack_types.hpp"
#include "mac/ethernet.hpp"
#include "ip/ip_layer.hpp"
#include "udp/udp_layer.hpp"

namespace afterburner::stack {

constexpr size_t HEADERS_LEN = ETH_HEADER_LEN + IP_HEADER_LEN + UDP_HEADER_LEN;  // 42

// Decoded view into a received frame. payload points into the frame and is
// valid only until the frame is recycled.
struct DecodedPacket {
    Endpoint peer;            // Sender MAC/IP/port
    uint32_t dst_ip;          // Host byte order
    uint16_t dst_port;        // Host byte order
    const uint8_t* payload;
    size_t payload_len;
};

class PacketCodec {
public:
    PacketCodec() = default;

    explicit PacketCodec(const Endpoint& local) : local_(local) {}

    void set_local(const Endpoint& local) { local_ = local; }
    const Endpoint& local() const { return local_; }

    /**
     * Decode one received frame
     *
     * @param frame Frame bytes starting at the Ethernet header
     * @param len   Frame length from the RX descriptor
     * @param out   Filled on DecodeStatus::Ok
     * @return Ok, or the reason the frame must be dropped
     */
    DecodeStatus decode(const uint8_t* frame, size_t len, DecodedPacket* out) const {
        if (frame == nullptr || len < HEADERS_LEN) {
            return DecodeStatus::TooShort;
        }

        uint16_t ethertype = 0;
        if (!MACLayer::parse_header(frame, len, &ethertype, out->peer.mac)) {
            return DecodeStatus::TooShort;
        }
        if (ethertype != ETH_TYPE_IP) {
            return DecodeStatus::NotIPv4;
        }

        IPv4Info ip;
        DecodeStatus status = IPLayer::parse_header(frame + ETH_HEADER_LEN, len - ETH_HEADER_LEN, &ip);
        if (status != DecodeStatus::Ok) {
            return status;
        }
        if (ip.protocol != IP_PROTO_UDP) {
            return DecodeStatus::NotUdp;
        }

        UDPInfo udp;
        status = UDPLayer::parse_header(frame + ETH_HEADER_LEN + ip.header_len, ip.payload_len,
                                        ip.src_ip, ip.dst_ip, &udp);
        if (status != DecodeStatus::Ok) {
            return status;
        }

        if ((local_.ip != 0 && ip.dst_ip != local_.ip) || udp.dst_port != local_.port) {
            return DecodeStatus::NotForUs;
        }

        out->peer.ip = ip.src_ip;
        out->peer.port = udp.src_port;
        out->dst_ip = ip.dst_ip;
        out->dst_port = udp.dst_port;
        out->payload = udp.payload;
        out->payload_len = udp.payload_len;
        return DecodeStatus::Ok;
    }

    /**
     * Encode payload into out as a full Ethernet frame addressed to peer
     *
     * payload may already live at out + HEADERS_LEN (in-place encode), in
     * which case no copy happens.
     *
     * @return Total frame length, or 0 if the frame does not fit
     */
    size_t encode(const uint8_t* payload, size_t payload_len, const Endpoint& peer,
                  uint8_t* out, size_t capacity) {
        if (out == nullptr || HEADERS_LEN + payload_len > capacity ||
            IP_HEADER_LEN + UDP_HEADER_LEN + payload_len > 0xFFFF) {
            return 0;
        }

        uint8_t* body = out + HEADERS_LEN;
        if (payload_len > 0 && payload != body) {
            std::memmove(body, payload, payload_len);
        }

        MACLayer::build_header(out, peer.mac, local_.mac, ETH_TYPE_IP);
        // UDP checksum covers the payload, so UDP goes before IP
        UDPLayer::build_header(out + ETH_HEADER_LEN + IP_HEADER_LEN, local_.ip, peer.ip,
                               local_.port, peer.port, payload_len);
        IPLayer::build_header(out + ETH_HEADER_LEN, local_.ip, peer.ip, IP_PROTO_UDP,
                              UDP_HEADER_LEN + payload_len, ip_id_++);
        return HEADERS_LEN + payload_len;
    }

private:
    Endpoint local_;
    uint16_t ip_id_ = 0;
};

} // namespace afterburner::stack
