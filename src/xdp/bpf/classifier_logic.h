/* classifier_logic.h
 * Service-port classifier shared by the XDP program and userspace.
 *
 * service_filter.bpf.c compiles this with clang -target bpf; SimKernel and
 * the unit tests include the very same function from C++. It is a bounded,
 * loop-free parse of Ethernet -> IPv4 -> UDP with no writes to the packet.
 */
#ifndef AFTERBURNER_CLASSIFIER_LOGIC_H
#define AFTERBURNER_CLASSIFIER_LOGIC_H

#include <linux/types.h>
#include <linux/if_ether.h>
#include <linux/ip.h>
#include <linux/udp.h>
#include <linux/in.h>

#ifndef __always_inline
#define __always_inline inline __attribute__((always_inline))
#endif

/* Host <-> network order for 16-bit constants, usable in both compilers */
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
#define AB_HTONS(x) ((__u16)__builtin_bswap16((__u16)(x)))
#else
#define AB_HTONS(x) ((__u16)(x))
#endif

#define AB_IP_FRAG_MASK 0x3FFF /* MF flag + fragment offset */

enum ab_verdict {
    AB_VERDICT_PASS = 0,     /* continue through the kernel stack */
    AB_VERDICT_REDIRECT = 1, /* hand to the AF_XDP socket of this queue */
    AB_VERDICT_DROP = 2,     /* redirect target had no socket or no frame */
};

/* Diagnostic counter slots (per-CPU array map "stats_map") */
enum ab_stat {
    AB_STAT_TOTAL = 0,
    AB_STAT_REDIRECTED = 1,
    AB_STAT_PASSED = 2,
    AB_STAT_PARSE_ERRORS = 3,
    AB_STAT_MAX = 4,
};

/*
 * Classify one packet.
 *
 * port_be:     service UDP port in network byte order
 * parse_error: set to 1 when headers are truncated or not parseable
 *              (the packet is still PASSed), 0 otherwise
 *
 * Returns AB_VERDICT_REDIRECT for IPv4 UDP whose destination port equals
 * port_be, AB_VERDICT_PASS for everything else. Fragments are PASSed.
 */
static __always_inline enum ab_verdict ab_classify(const void *data, const void *data_end,
                                                   __u16 port_be, int *parse_error)
{
    const struct ethhdr *eth = (const struct ethhdr *)data;
    const struct iphdr *iph;
    const struct udphdr *udph;
    __u32 ihl_bytes;

    *parse_error = 0;

    if ((const void *)(eth + 1) > data_end) {
        *parse_error = 1;
        return AB_VERDICT_PASS;
    }
    if (eth->h_proto != AB_HTONS(ETH_P_IP))
        return AB_VERDICT_PASS;

    iph = (const struct iphdr *)(eth + 1);
    if ((const void *)(iph + 1) > data_end) {
        *parse_error = 1;
        return AB_VERDICT_PASS;
    }
    if (iph->version != 4 || iph->ihl < 5) {
        *parse_error = 1;
        return AB_VERDICT_PASS;
    }
    if (iph->protocol != IPPROTO_UDP)
        return AB_VERDICT_PASS;
    if (iph->frag_off & AB_HTONS(AB_IP_FRAG_MASK))
        return AB_VERDICT_PASS;

    ihl_bytes = (__u32)iph->ihl * 4;
    udph = (const struct udphdr *)((const __u8 *)iph + ihl_bytes);
    if ((const void *)(udph + 1) > data_end) {
        *parse_error = 1;
        return AB_VERDICT_PASS;
    }

    if (udph->dest == port_be)
        return AB_VERDICT_REDIRECT;
    return AB_VERDICT_PASS;
}

#endif /* AFTERBURNER_CLASSIFIER_LOGIC_H */
