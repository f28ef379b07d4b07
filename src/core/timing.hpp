// core/timing.hpp
// Clock and CPU placement for the busy-poll loop
// Monotonic nanoseconds drive every deadline: probe timeouts, PTO, idle and
// handshake timers, reconnect backoff and the stats reporter.
#pragma once

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <cstring>

#ifdef __linux__
#include <sched.h>
#include <pthread.h>
#endif

// Current CLOCK_MONOTONIC timestamp in nanoseconds
static inline uint64_t get_monotonic_timestamp_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (uint64_t)ts.tv_sec * 1000000000ULL + ts.tv_nsec;
}

// Pin the calling thread to one logical core
// cpu_core < 0 leaves the scheduler's choice untouched
// Returns true on success (or when pinning was not requested)
static inline bool pin_to_core(int cpu_core) {
    if (cpu_core < 0) return true;
#ifdef __linux__
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(cpu_core, &cpuset);
    int ret = pthread_setaffinity_np(pthread_self(), sizeof(cpuset), &cpuset);
    if (ret != 0) {
        fprintf(stderr, "[LOOP] Failed to pin to core %d: %s\n", cpu_core, strerror(ret));
        return false;
    }
    printf("[LOOP] Pinned to core %d\n", cpu_core);
    return true;
#else
    (void)cpu_core;
    return false;
#endif
}
