// src/stack/udp/udp_layer.hpp
// UDP Header Building and Parsing (Internal)
//
// INTERNAL: Use PacketCodec (packet_codec.hpp) as the entry point.

#pragma once

#include <cstdint>
#include <cstddef>
#include <arpa/inet.h>

#include "../ip/checksum.hpp"
#include "../stack_types.hpp"

namespace afterburner::stack {

constexpr size_t UDP_HEADER_LEN = 8;

struct __attribute__((packed)) UDPHeader {
    uint16_t src_port;   // Network byte order
    uint16_t dst_port;   // Network byte order
    uint16_t len;        // Header + payload
    uint16_t check;      // 0 = not computed
};

static_assert(sizeof(UDPHeader) == UDP_HEADER_LEN, "UDPHeader must be 8 bytes");

struct UDPInfo {
    uint16_t src_port;   // Host byte order
    uint16_t dst_port;   // Host byte order
    const uint8_t* payload;
    size_t payload_len;
};

struct UDPLayer {
    // Write UDP header at out; payload must already follow it at out + 8
    static void build_header(uint8_t* out, uint32_t src_ip, uint32_t dst_ip,
                             uint16_t src_port, uint16_t dst_port, size_t payload_len) {
        UDPHeader* udp = reinterpret_cast<UDPHeader*>(out);
        size_t udp_len = UDP_HEADER_LEN + payload_len;
        udp->src_port = htons(src_port);
        udp->dst_port = htons(dst_port);
        udp->len = htons(static_cast<uint16_t>(udp_len));
        udp->check = 0;
        udp->check = htons(udp_checksum(src_ip, dst_ip, out, udp_len));
    }

    // Validate the UDP datagram at segment; ip_payload_len comes from the IP header
    static DecodeStatus parse_header(const uint8_t* segment, size_t ip_payload_len,
                                     uint32_t src_ip, uint32_t dst_ip, UDPInfo* info) {
        if (ip_payload_len < UDP_HEADER_LEN) {
            return DecodeStatus::TooShort;
        }

        const UDPHeader* udp = reinterpret_cast<const UDPHeader*>(segment);
        size_t udp_len = ntohs(udp->len);
        if (udp_len < UDP_HEADER_LEN || udp_len > ip_payload_len) {
            return DecodeStatus::BadUdpLength;
        }

        // Zero checksum means the sender did not compute one
        if (udp->check != 0 && verify_udp_checksum(src_ip, dst_ip, segment, udp_len) != 0) {
            return DecodeStatus::BadUdpChecksum;
        }

        info->src_port = ntohs(udp->src_port);
        info->dst_port = ntohs(udp->dst_port);
        info->payload = segment + UDP_HEADER_LEN;
        info->payload_len = udp_len - UDP_HEADER_LEN;
        return DecodeStatus::Ok;
    }
};

} // namespace afterburner::stack
