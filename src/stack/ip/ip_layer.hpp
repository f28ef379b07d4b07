// src/stack/ip/ip_layer.hpp
// IPv4 Header Building and Parsing (Internal)
//
// INTERNAL: Use PacketCodec (packet_codec.hpp) as the entry point.
//
// Provides:
//   - IPv4Header struct (20-byte IP header)
//   - IPLayer::build_header() - Write IP header with checksum
//   - IPLayer::parse_header() - Validate IP header of a received packet
//   - IP protocol constants (IP_PROTO_UDP, etc.)
//
// TX never emits options. RX tolerates options (IHL 6..15) and skips them.

#pragma once

#include <cstring>
#include <cstdint>
#include <arpa/inet.h>

#include "checksum.hpp"
#include "../stack_types.hpp"

namespace afterburner::stack {

// IP constants
constexpr uint8_t IP_PROTO_UDP = 17;
constexpr size_t IP_HEADER_LEN = 20;  // No options
constexpr uint8_t IP_VERSION = 4;
constexpr uint8_t IP_DEFAULT_TTL = 64;
constexpr uint16_t IP_FLAG_DF = 0x4000;
constexpr uint16_t IP_FRAG_MASK = 0x3FFF;  // MF flag + fragment offset

// IPv4 header structure (20 bytes, no options)
struct __attribute__((packed)) IPv4Header {
    uint8_t  version_ihl;    // 4 bits version + 4 bits IHL (header length)
    uint8_t  tos;            // Type of service
    uint16_t tot_len;        // Total length (header + data)
    uint16_t id;             // Identification
    uint16_t frag_off;       // Flags (3 bits) + Fragment offset (13 bits)
    uint8_t  ttl;            // Time to live
    uint8_t  protocol;       // Protocol (17=UDP)
    uint16_t check;          // Header checksum
    uint32_t saddr;          // Source address
    uint32_t daddr;          // Destination address
};

static_assert(sizeof(IPv4Header) == IP_HEADER_LEN, "IPv4Header must be 20 bytes");

// Parsed view of a validated IPv4 header
struct IPv4Info {
    uint32_t src_ip;        // Host byte order
    uint32_t dst_ip;        // Host byte order
    uint8_t protocol;
    size_t header_len;      // IHL * 4
    size_t payload_len;     // tot_len - header_len
};

struct IPLayer {
    // Write a 20-byte IPv4 header at out and fill in its checksum
    // src_ip, dst_ip: Host byte order
    static void build_header(uint8_t* out, uint32_t src_ip, uint32_t dst_ip, uint8_t protocol,
                             size_t payload_len, uint16_t id) {
        IPv4Header* hdr = reinterpret_cast<IPv4Header*>(out);
        hdr->version_ihl = 0x45;           // Version 4, IHL 5 (20 bytes)
        hdr->tos = 0;
        hdr->tot_len = htons(static_cast<uint16_t>(IP_HEADER_LEN + payload_len));
        hdr->id = htons(id);
        hdr->frag_off = htons(IP_FLAG_DF);
        hdr->ttl = IP_DEFAULT_TTL;
        hdr->protocol = protocol;
        hdr->check = 0;
        hdr->saddr = htonl(src_ip);
        hdr->daddr = htonl(dst_ip);
        hdr->check = htons(ip_checksum(hdr));
    }

    // Validate the IPv4 header at packet (len bytes available after Ethernet)
    // Checks version, IHL, total length against the frame, header checksum
    // and fragmentation. Trailing Ethernet padding beyond tot_len is allowed.
    static DecodeStatus parse_header(const uint8_t* packet, size_t len, IPv4Info* info) {
        if (len < IP_HEADER_LEN) {
            return DecodeStatus::TooShort;
        }

        const IPv4Header* hdr = reinterpret_cast<const IPv4Header*>(packet);
        uint8_t ihl = hdr->version_ihl & 0x0F;
        if ((hdr->version_ihl >> 4) != IP_VERSION || ihl < 5) {
            return DecodeStatus::BadIpHeader;
        }

        size_t header_len = static_cast<size_t>(ihl) * 4;
        size_t tot_len = ntohs(hdr->tot_len);
        if (header_len > len || tot_len < header_len || tot_len > len) {
            return DecodeStatus::BadTotalLength;
        }

        if (verify_ip_checksum(hdr, header_len) != 0) {
            return DecodeStatus::BadIpChecksum;
        }

        // No reassembly
        if ((ntohs(hdr->frag_off) & IP_FRAG_MASK) != 0) {
            return DecodeStatus::Fragmented;
        }

        info->src_ip = ntohl(hdr->saddr);
        info->dst_ip = ntohl(hdr->daddr);
        info->protocol = hdr->protocol;
        info->header_len = header_len;
        info->payload_len = tot_len - header_len;
        return DecodeStatus::Ok;
    }
};

} // namespace afterburner::stack
