// src/stack/ip/checksum.hpp
// IP and UDP Checksum Calculation (Internal)
//
// INTERNAL: Used by ip_layer.hpp, udp_layer.hpp and packet_codec.hpp.
//
// Implements RFC 1071 - Computing the Internet Checksum
//
// Provides:
//   - ip_checksum()         - Calculate IP header checksum
//   - verify_ip_checksum()  - Verify IP header checksum
//   - udp_checksum()        - Calculate UDP checksum (with pseudo-header)
//   - verify_udp_checksum() - Verify UDP checksum

#pragma once

#include <cstdint>
#include <cstddef>
#include <arpa/inet.h>

namespace afterburner::stack {

// Add 16-bit big-endian words of buf into a running 32-bit sum
inline uint32_t checksum_accumulate(uint32_t sum, const void* data, size_t len) {
    const uint8_t* buf = static_cast<const uint8_t*>(data);

    while (len > 1) {
        sum += (static_cast<uint16_t>(buf[0]) << 8) | buf[1];
        buf += 2;
        len -= 2;
    }

    // Leftover byte is the high half of a zero-padded word
    if (len == 1) {
        sum += static_cast<uint16_t>(buf[0]) << 8;
    }
    return sum;
}

inline uint16_t checksum_fold(uint32_t sum) {
    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }
    return static_cast<uint16_t>(~sum);
}

// Compute Internet checksum (RFC 1071)
inline uint16_t internet_checksum(const void* data, size_t len) {
    return checksum_fold(checksum_accumulate(0, data, len));
}

// Compute IP header checksum over header_len bytes (20 without options)
inline uint16_t ip_checksum(const void* ip_header, size_t header_len = 20) {
    return internet_checksum(ip_header, header_len);
}

// Verify IP header checksum
// Returns 0 if valid, non-zero if invalid
inline int verify_ip_checksum(const void* ip_header, size_t header_len = 20) {
    return internet_checksum(ip_header, header_len);
}

// Sum of the UDP pseudo-header: src, dst, zero+protocol, UDP length
// src_ip, dst_ip: In HOST byte order
inline uint32_t udp_pseudo_header_sum(uint32_t src_ip, uint32_t dst_ip, uint16_t udp_len) {
    uint32_t sum = 0;
    sum += (src_ip >> 16) & 0xFFFF;
    sum += src_ip & 0xFFFF;
    sum += (dst_ip >> 16) & 0xFFFF;
    sum += dst_ip & 0xFFFF;
    sum += 17;  // UDP protocol
    sum += udp_len;
    return sum;
}

// Compute UDP checksum over header + payload (checksum field must be zero)
// A computed value of 0 is transmitted as 0xFFFF (RFC 768)
inline uint16_t udp_checksum(uint32_t src_ip, uint32_t dst_ip,
                             const void* udp_segment, size_t udp_len) {
    uint32_t sum = udp_pseudo_header_sum(src_ip, dst_ip, static_cast<uint16_t>(udp_len));
    sum = checksum_accumulate(sum, udp_segment, udp_len);
    uint16_t result = checksum_fold(sum);
    return result == 0 ? 0xFFFF : result;
}

// Verify UDP checksum with the checksum field in place
// Returns 0 if valid, non-zero if invalid
inline int verify_udp_checksum(uint32_t src_ip, uint32_t dst_ip,
                               const void* udp_segment, size_t udp_len) {
    uint32_t sum = udp_pseudo_header_sum(src_ip, dst_ip, static_cast<uint16_t>(udp_len));
    sum = checksum_accumulate(sum, udp_segment, udp_len);
    return checksum_fold(sum);
}

} // namespace afterburner::stack
