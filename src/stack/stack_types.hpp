// src/stack/stack_types.hpp
// Addressing and decode-result types shared by the header layers
//
// Provides:
//   - Endpoint        - MAC + IPv4 + UDP port of one side of a flow
//   - DecodeStatus    - Reason a received frame was rejected
//   - parse_mac() / parse_ipv4() - text helpers for configuration

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <arpa/inet.h>

namespace afterburner::stack {

constexpr size_t MAC_ADDR_LEN = 6;

// One end of a UDP flow
// ip and port are in HOST byte order
struct Endpoint {
    uint8_t mac[MAC_ADDR_LEN] = {};
    uint32_t ip = 0;
    uint16_t port = 0;

    bool same_address(const Endpoint& other) const {
        return ip == other.ip && port == other.port;
    }
};

// Decode outcome. Every value except Ok is a drop reason counted by the caller.
enum class DecodeStatus : uint8_t {
    Ok = 0,
    TooShort,          // Frame shorter than Ethernet + IPv4 + UDP headers
    NotIPv4,           // EtherType is not 0x0800
    BadIpHeader,       // Version != 4 or IHL outside 5..15
    BadTotalLength,    // IP total length disagrees with the frame
    BadIpChecksum,
    Fragmented,        // MF set or non-zero fragment offset
    NotUdp,
    BadUdpLength,
    BadUdpChecksum,
    NotForUs,          // Destination IP/port is not the local endpoint
};

constexpr size_t DECODE_STATUS_COUNT = 11;

inline const char* decode_status_name(DecodeStatus s) {
    switch (s) {
        case DecodeStatus::Ok:             return "ok";
        case DecodeStatus::TooShort:       return "too_short";
        case DecodeStatus::NotIPv4:        return "not_ipv4";
        case DecodeStatus::BadIpHeader:    return "bad_ip_header";
        case DecodeStatus::BadTotalLength: return "bad_total_length";
        case DecodeStatus::BadIpChecksum:  return "bad_ip_checksum";
        case DecodeStatus::Fragmented:     return "fragmented";
        case DecodeStatus::NotUdp:         return "not_udp";
        case DecodeStatus::BadUdpLength:   return "bad_udp_length";
        case DecodeStatus::BadUdpChecksum: return "bad_udp_checksum";
        case DecodeStatus::NotForUs:       return "not_for_us";
    }
    return "unknown";
}

// Parse "aa:bb:cc:dd:ee:ff" into out. Returns false on bad input.
inline bool parse_mac(const char* text, uint8_t* out) {
    unsigned int b[MAC_ADDR_LEN];
    if (!text || sscanf(text, "%x:%x:%x:%x:%x:%x", &b[0], &b[1], &b[2], &b[3], &b[4], &b[5]) != 6) {
        return false;
    }
    for (size_t i = 0; i < MAC_ADDR_LEN; i++) {
        if (b[i] > 0xFF) return false;
        out[i] = static_cast<uint8_t>(b[i]);
    }
    return true;
}

// Parse dotted quad into a host-order address. Returns false on bad input.
inline bool parse_ipv4(const char* text, uint32_t* out) {
    struct in_addr addr;
    if (!text || inet_pton(AF_INET, text, &addr) != 1) {
        return false;
    }
    *out = ntohl(addr.s_addr);
    return true;
}

// Format a host-order address into buf (at least INET_ADDRSTRLEN bytes)
inline const char* format_ipv4(uint32_t ip, char* buf, size_t len) {
    struct in_addr addr;
    addr.s_addr = htonl(ip);
    if (!inet_ntop(AF_INET, &addr, buf, static_cast<socklen_t>(len))) {
        snprintf(buf, len, "?");
    }
    return buf;
}

} // namespace afterburner::stack
