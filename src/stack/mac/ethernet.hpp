// src/stack/mac/ethernet.hpp
// Ethernet Header Building and Parsing (Internal)
//
// INTERNAL: Use PacketCodec (packet_codec.hpp) as the entry point.
//
// Provides:
//   - EthernetHeader struct (14-byte Ethernet header)
//   - MACLayer::build_header() - Write Ethernet header into buffer
//   - MACLayer::parse_header() - Parse Ethernet header
//   - Ethertype constants (ETH_TYPE_IP, ETH_TYPE_ARP)

#pragma once

#include <cstring>
#include <cstdint>
#include <arpa/inet.h>

#include "../stack_types.hpp"

namespace afterburner::stack {

// Ethernet frame constants
constexpr uint16_t ETH_TYPE_IP = 0x0800;
constexpr size_t ETH_HEADER_LEN = 14;

// Ethernet header structure
struct __attribute__((packed)) EthernetHeader {
    uint8_t dst_mac[MAC_ADDR_LEN];
    uint8_t src_mac[MAC_ADDR_LEN];
    uint16_t ethertype;  // Network byte order
};

static_assert(sizeof(EthernetHeader) == ETH_HEADER_LEN, "EthernetHeader must be 14 bytes");

struct MACLayer {
    // Write Ethernet header at out (caller guarantees ETH_HEADER_LEN bytes)
    static void build_header(uint8_t* out, const uint8_t* dst_mac, const uint8_t* src_mac,
                             uint16_t ethertype) {
        EthernetHeader* eth = reinterpret_cast<EthernetHeader*>(out);
        std::memcpy(eth->dst_mac, dst_mac, MAC_ADDR_LEN);
        std::memcpy(eth->src_mac, src_mac, MAC_ADDR_LEN);
        eth->ethertype = htons(ethertype);
    }

    // Parse Ethernet header
    // ethertype: Output ethertype (host order)
    // src_mac: Optional output source MAC address
    // Returns: false if frame is shorter than an Ethernet header
    static bool parse_header(const uint8_t* frame, size_t len, uint16_t* ethertype,
                             uint8_t* src_mac = nullptr) {
        if (len < ETH_HEADER_LEN) {
            return false;
        }

        const EthernetHeader* eth = reinterpret_cast<const EthernetHeader*>(frame);
        *ethertype = ntohs(eth->ethertype);

        if (src_mac) {
            std::memcpy(src_mac, eth->src_mac, MAC_ADDR_LEN);
        }
        return true;
    }
};

} // namespace afterburner::stack
