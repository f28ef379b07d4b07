// test/unittest/test_quic_crypto.cpp
// Unit tests for key derivation, AEAD packet protection and packet headers
// All primitives come from OpenSSL libcrypto.

#include "../../src/quic/quic_crypto.hpp"
#include "../../src/quic/quic_packet.hpp"
#include <iostream>
#include <cstring>
#include <vector>
#include <initializer_list>
#include <stdexcept>

using namespace afterburner::quic;

int tests_passed = 0;
int tests_failed = 0;

#define TEST(name) \
    std::cout << "Testing " << name << "... "; \
    try {

#define END_TEST \
        std::cout << "✅ PASS" << std::endl; \
        tests_passed++; \
    } catch (const std::exception& e) { \
        std::cout << "❌ FAIL: " << e.what() << std::endl; \
        tests_failed++; \
    }

#define ASSERT(condition, msg) \
    if (!(condition)) throw std::runtime_error(msg);

ConnectionId make_cid(std::initializer_list<uint8_t> bytes) {
    std::vector<uint8_t> v(bytes);
    ConnectionId cid;
    cid.assign(v.data(), v.size());
    return cid;
}

// Pair of keys (sealing side, opening side) from one secret set
struct KeyPair {
    AeadKey seal;
    AeadKey open;

    explicit KeyPair(const PacketKeys& k) {
        seal.install(k, true);
        open.install(k, false);
    }
};

PacketKeys fixed_keys() {
    PacketKeys k;
    for (size_t i = 0; i < AEAD_KEY_LEN; i++) k.key[i] = static_cast<uint8_t>(i);
    for (size_t i = 0; i < AEAD_IV_LEN; i++) k.iv[i] = static_cast<uint8_t>(0xA0 + i);
    return k;
}

// RFC 9001 appendix A.1
void test_initial_keys_vector() {
    TEST("Initial keys match the RFC 9001 sample")
        ConnectionId dcid = make_cid({0x83, 0x94, 0xc8, 0xf0, 0x3e, 0x51, 0x57, 0x08});
        PacketKeys client, server;
        ASSERT(derive_initial_keys(dcid, &client, &server), "Derivation failed");

        const uint8_t client_key[] = {0x1f, 0x36, 0x96, 0x13, 0xdd, 0x76, 0xd5, 0x46,
                                      0x77, 0x30, 0xef, 0xcb, 0xe3, 0xb1, 0xa2, 0x2d};
        const uint8_t client_iv[] = {0xfa, 0x04, 0x4b, 0x2f, 0x42, 0xa3, 0xfd, 0x3b,
                                     0x46, 0xfb, 0x25, 0x5c};
        const uint8_t server_key[] = {0xcf, 0x3a, 0x53, 0x31, 0x65, 0x3c, 0x36, 0x4c,
                                      0x88, 0xf0, 0xf3, 0x79, 0xb6, 0x06, 0x7e, 0x37};
        const uint8_t server_iv[] = {0x0a, 0xc1, 0x49, 0x3c, 0xa1, 0x90, 0x58, 0x53,
                                     0xb0, 0xbb, 0xa0, 0x3e};

        ASSERT(std::memcmp(client.key, client_key, 16) == 0, "Client key");
        ASSERT(std::memcmp(client.iv, client_iv, 12) == 0, "Client IV");
        ASSERT(std::memcmp(server.key, server_key, 16) == 0, "Server key");
        ASSERT(std::memcmp(server.iv, server_iv, 12) == 0, "Server IV");
    END_TEST
}

void test_seal_open() {
    TEST("AEAD seal then open with the same packet number")
        KeyPair keys(fixed_keys());
        const uint8_t aad[] = {0x43, 1, 2, 3, 4};
        const char* msg = "frames for packet 7";
        size_t len = std::strlen(msg);

        std::vector<uint8_t> sealed(len + AEAD_TAG_LEN);
        ASSERT(keys.seal.seal(7, aad, sizeof(aad), reinterpret_cast<const uint8_t*>(msg), len, sealed.data()),
               "Seal failed");
        ASSERT(std::memcmp(sealed.data(), msg, len) != 0, "Ciphertext differs from plaintext");

        std::vector<uint8_t> plain(len);
        ASSERT(keys.open.open(7, aad, sizeof(aad), sealed.data(), sealed.size(), plain.data()),
               "Open failed");
        ASSERT(std::memcmp(plain.data(), msg, len) == 0, "Plaintext recovered");
    END_TEST
}

void test_open_rejects_tampering() {
    TEST("AEAD open rejects tampered data, AAD or packet number")
        KeyPair keys(fixed_keys());
        const uint8_t aad[] = {0x43, 9, 9};
        const uint8_t msg[32] = {1, 2, 3};
        std::vector<uint8_t> sealed(sizeof(msg) + AEAD_TAG_LEN);
        ASSERT(keys.seal.seal(1, aad, sizeof(aad), msg, sizeof(msg), sealed.data()), "Seal");

        uint8_t plain[32];
        std::vector<uint8_t> bad = sealed;
        bad[5] ^= 0x01;
        ASSERT(!keys.open.open(1, aad, sizeof(aad), bad.data(), bad.size(), plain), "Ciphertext flip");

        uint8_t bad_aad[] = {0x43, 9, 8};
        ASSERT(!keys.open.open(1, bad_aad, sizeof(bad_aad), sealed.data(), sealed.size(), plain), "AAD flip");
        ASSERT(!keys.open.open(2, aad, sizeof(aad), sealed.data(), sealed.size(), plain), "Wrong PN");
        ASSERT(keys.open.open(1, aad, sizeof(aad), sealed.data(), sealed.size(), plain), "Original still opens");
    END_TEST
}

void test_key_direction() {
    TEST("Sealing and opening keys are not interchangeable")
        KeyPair keys(fixed_keys());
        uint8_t buf[64] = {};
        uint8_t out[64];
        ASSERT(!keys.open.seal(0, nullptr, 0, buf, 8, out), "Opening key cannot seal");
        ASSERT(!keys.seal.open(0, nullptr, 0, buf, 24, out), "Sealing key cannot open");

        AeadKey empty;
        ASSERT(!empty.installed(), "Not installed");
        ASSERT(!empty.seal(0, nullptr, 0, buf, 8, out), "Uninstalled key cannot seal");
    END_TEST
}

void test_random_cid() {
    TEST("Random connection ids are 8 bytes and distinct")
        ConnectionId a, b;
        ASSERT(random_connection_id(&a) && random_connection_id(&b), "RAND_bytes");
        ASSERT(a.len == CID_LEN && b.len == CID_LEN, "Length");
        ASSERT(a != b, "Distinct");
    END_TEST
}

void test_long_header_packet() {
    TEST("Initial packet seal, parse and open")
        ConnectionId dcid = make_cid({1, 2, 3, 4, 5, 6, 7, 8});
        ConnectionId scid = make_cid({9, 10, 11, 12, 13, 14, 15, 16});
        PacketKeys client, server;
        ASSERT(derive_initial_keys(dcid, &client, &server), "Initial keys");
        KeyPair keys(client);

        PacketHeader hdr;
        hdr.is_long = true;
        hdr.dcid = dcid;
        hdr.scid = scid;
        hdr.packet_number = 0;

        uint8_t frames[40];
        std::memset(frames, 0, sizeof(frames));
        frames[0] = 0x01;   // PING, rest padding

        uint8_t pkt[MAX_DATAGRAM_SIZE];
        size_t n = seal_packet(hdr, frames, sizeof(frames), keys.seal, pkt, sizeof(pkt));
        ASSERT(n == long_header_len(dcid, scid) + sizeof(frames) + AEAD_TAG_LEN, "Packet length");
        ASSERT(pkt[0] == LONG_HEADER_INITIAL, "First byte");

        PacketHeader parsed;
        ASSERT(parse_packet_header(pkt, n, &parsed), "Parse header");
        ASSERT(parsed.is_long && parsed.version == QUIC_VERSION, "Long header, our version");
        ASSERT(parsed.dcid == dcid && parsed.scid == scid, "CIDs");
        ASSERT(parsed.packet_len == n, "Length field bounds the packet");
        ASSERT(parsed.space() == PacketSpace::Initial, "Initial space");

        uint8_t plain[MAX_DATAGRAM_SIZE];
        size_t plain_len = 0;
        ASSERT(open_packet(pkt, parsed, 0, keys.open, plain, sizeof(plain), &plain_len), "Open");
        ASSERT(plain_len == sizeof(frames) && plain[0] == 0x01, "Frames recovered");

        // Header bytes are authenticated
        pkt[6] ^= 0xFF;
        PacketHeader tampered;
        ASSERT(parse_packet_header(pkt, n, &tampered), "Still parses");
        ASSERT(!open_packet(pkt, tampered, 0, keys.open, plain, sizeof(plain), &plain_len), "Tampered header rejected");
    END_TEST
}

void test_short_header_packet() {
    TEST("1-RTT packet seal, parse and open")
        KeyPair keys(fixed_keys());
        PacketHeader hdr;
        hdr.is_long = false;
        hdr.dcid = make_cid({8, 7, 6, 5, 4, 3, 2, 1});
        hdr.packet_number = 0x1234;

        const uint8_t frames[] = {0x01};
        uint8_t pkt[128];
        size_t n = seal_packet(hdr, frames, sizeof(frames), keys.seal, pkt, sizeof(pkt));
        ASSERT(n == short_header_len() + 1 + AEAD_TAG_LEN, "Packet length");
        ASSERT(pkt[0] == SHORT_HEADER, "First byte");

        PacketHeader parsed;
        ASSERT(parse_packet_header(pkt, n, &parsed), "Parse");
        ASSERT(!parsed.is_long && parsed.dcid == hdr.dcid, "Short header CID");
        ASSERT(parsed.packet_number == 0x1234, "Truncated PN");
        uint8_t plain[64];
        size_t plain_len = 0;
        ASSERT(open_packet(pkt, parsed, decode_packet_number(0x1200, parsed.packet_number),
                           keys.open, plain, sizeof(plain), &plain_len), "Open");
        ASSERT(plain_len == 1 && plain[0] == 0x01, "Frames recovered");
    END_TEST
}

void test_open_respects_capacity() {
    TEST("Open rejects plaintext longer than the output buffer")
        KeyPair keys(fixed_keys());
        PacketHeader hdr;
        hdr.is_long = false;
        hdr.dcid = make_cid({8, 7, 6, 5, 4, 3, 2, 1});
        hdr.packet_number = 7;

        uint8_t frames[200];
        std::memset(frames, 0x01, sizeof(frames));
        uint8_t pkt[512];
        size_t n = seal_packet(hdr, frames, sizeof(frames), keys.seal, pkt, sizeof(pkt));
        ASSERT(n > 0, "Seal");

        PacketHeader parsed;
        ASSERT(parse_packet_header(pkt, n, &parsed), "Parse");
        uint8_t small[64];
        std::memset(small, 0xEE, sizeof(small));
        size_t plain_len = 0;
        ASSERT(!open_packet(pkt, parsed, 7, keys.open, small, sizeof(small), &plain_len),
               "Rejected before decrypting");
        ASSERT(plain_len == 0, "No length reported");
        ASSERT(small[0] == 0xEE && small[63] == 0xEE, "Output untouched");

        uint8_t exact[200];
        ASSERT(open_packet(pkt, parsed, 7, keys.open, exact, sizeof(exact), &plain_len),
               "Exact capacity accepted");
        ASSERT(plain_len == sizeof(frames), "Full plaintext");
    END_TEST
}

void test_malformed_headers() {
    TEST("Malformed headers are rejected")
        uint8_t pkt[64] = {};
        PacketHeader hdr;
        pkt[0] = 0x03;   // Fixed bit clear
        ASSERT(!parse_packet_header(pkt, sizeof(pkt), &hdr), "Fixed bit required");
        pkt[0] = 0x41;   // 2-byte packet number
        ASSERT(!parse_packet_header(pkt, sizeof(pkt), &hdr), "Only 4-byte packet numbers");
        pkt[0] = 0xE3;   // Long header, 0-RTT type
        ASSERT(!parse_packet_header(pkt, sizeof(pkt), &hdr), "Only Initial long headers");
        pkt[0] = SHORT_HEADER;
        ASSERT(!parse_packet_header(pkt, 1 + CID_LEN + PN_LEN + 4, &hdr), "Shorter than a tag");
    END_TEST
}

void test_packet_number_decoding() {
    TEST("Packet number recovery around the window")
        // RFC 9000 appendix A.3 example with a 16-bit encoding
        ASSERT(decode_packet_number(0xa82f30ea, 0x9b32, 16) == 0xa82f9b32, "RFC example");
        ASSERT(decode_packet_number(UINT64_MAX, 0) == 0, "First packet");
        ASSERT(decode_packet_number(5, 6) == 6, "Next packet");
        ASSERT(decode_packet_number(0xFFFFFFF0ULL, 0x00000002) == 0x100000002ULL, "Wraps forward");
        ASSERT(decode_packet_number(0x100000002ULL, 0xFFFFFFF0) == 0xFFFFFFF0ULL, "Late packet before wrap");
    END_TEST
}

int main() {
    std::cout << "╔════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║   Afterburner: QUIC Crypto Unit Tests          ║" << std::endl;
    std::cout << "╚════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;

    test_initial_keys_vector();
    test_seal_open();
    test_open_rejects_tampering();
    test_key_direction();
    test_random_cid();
    test_long_header_packet();
    test_short_header_packet();
    test_open_respects_capacity();
    test_malformed_headers();
    test_packet_number_decoding();

    std::cout << std::endl;
    std::cout << "════════════════════════════════════════════════" << std::endl;
    std::cout << "Tests passed: " << tests_passed << std::endl;
    std::cout << "Tests failed: " << tests_failed << std::endl;
    std::cout << "════════════════════════════════════════════════" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
